//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_protocol_amf0.hpp>

#include <string.h>

#include <utility>
#include <vector>
#include <sstream>
using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_buffer.hpp>
#include <rk_kernel_utility.hpp>

using namespace _rk_internal;

// The max length of AMF0 UTF-8, which length is U16.
#define RK_AMF0_UTF8_MAX 0xFFFF

// Consume the 1 byte marker, which must be the expect one.
static rk_error_t rk_amf0_read_marker(RkBuffer* stream, char expect, const char* name)
{
    if (!stream->require(1)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "%s requires 1 only %d bytes", name, stream->left());
    }

    char marker = stream->read_1bytes();
    if (marker != expect) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "%s invalid marker=%#x", name, (uint8_t)marker);
    }

    return rk_success;
}

static rk_error_t rk_amf0_write_marker(RkBuffer* stream, char marker, const char* name)
{
    if (!stream->require(1)) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "%s requires 1 only %d bytes", name, stream->left());
    }

    stream->write_1bytes(marker);

    return rk_success;
}

// For complex value, check the depth before consuming the marker.
static rk_error_t rk_amf0_read_complex_marker(RkBuffer* stream, char expect, const char* name, int depth)
{
    if (depth >= RK_AMF0_MAX_DEPTH) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "%s depth=%d exceed max %d", name, depth, RK_AMF0_MAX_DEPTH);
    }

    return rk_amf0_read_marker(stream, expect, name);
}

// Consume the object-end 0x00 0x00 0x09 if it's at the head of stream.
static bool rk_amf0_skip_object_end(RkBuffer* stream)
{
    if (!stream->require(3)) {
        return false;
    }

    if (stream->read_3bytes() == RTMP_AMF0_ObjectEnd) {
        return true;
    }

    stream->skip(-3);
    return false;
}

RkAmf0Any::RkAmf0Any()
{
    marker = RTMP_AMF0_Invalid;
}

RkAmf0Any::~RkAmf0Any()
{
}

bool RkAmf0Any::is_string()
{
    return marker == RTMP_AMF0_String;
}

bool RkAmf0Any::is_boolean()
{
    return marker == RTMP_AMF0_Boolean;
}

bool RkAmf0Any::is_number()
{
    return marker == RTMP_AMF0_Number;
}

bool RkAmf0Any::is_null()
{
    return marker == RTMP_AMF0_Null;
}

bool RkAmf0Any::is_undefined()
{
    return marker == RTMP_AMF0_Undefined;
}

bool RkAmf0Any::is_object()
{
    return marker == RTMP_AMF0_Object;
}

bool RkAmf0Any::is_ecma_array()
{
    return marker == RTMP_AMF0_EcmaArray;
}

bool RkAmf0Any::is_strict_array()
{
    return marker == RTMP_AMF0_StrictArray;
}

bool RkAmf0Any::is_date()
{
    return marker == RTMP_AMF0_Date;
}

bool RkAmf0Any::is_complex_object()
{
    return is_object() || is_ecma_array() || is_strict_array();
}

string RkAmf0Any::to_str()
{
    RkAmf0String* p = dynamic_cast<RkAmf0String*>(this);
    rk_assert(p != NULL);
    return p->value;
}

bool RkAmf0Any::to_boolean()
{
    RkAmf0Boolean* p = dynamic_cast<RkAmf0Boolean*>(this);
    rk_assert(p != NULL);
    return p->value;
}

double RkAmf0Any::to_number()
{
    RkAmf0Number* p = dynamic_cast<RkAmf0Number*>(this);
    rk_assert(p != NULL);
    return p->value;
}

int64_t RkAmf0Any::to_date()
{
    RkAmf0Date* p = dynamic_cast<RkAmf0Date*>(this);
    rk_assert(p != NULL);
    return p->value;
}

int16_t RkAmf0Any::to_date_time_zone()
{
    RkAmf0Date* p = dynamic_cast<RkAmf0Date*>(this);
    rk_assert(p != NULL);
    return p->time_zone;
}

RkAmf0Object* RkAmf0Any::to_object()
{
    RkAmf0Object* p = dynamic_cast<RkAmf0Object*>(this);
    rk_assert(p != NULL);
    return p;
}

RkAmf0EcmaArray* RkAmf0Any::to_ecma_array()
{
    RkAmf0EcmaArray* p = dynamic_cast<RkAmf0EcmaArray*>(this);
    rk_assert(p != NULL);
    return p;
}

RkAmf0StrictArray* RkAmf0Any::to_strict_array()
{
    RkAmf0StrictArray* p = dynamic_cast<RkAmf0StrictArray*>(this);
    rk_assert(p != NULL);
    return p;
}

RkAmf0Map* RkAmf0Any::to_map()
{
    RkAmf0Map* p = dynamic_cast<RkAmf0Map*>(this);
    rk_assert(p != NULL);
    return p;
}

rk_error_t RkAmf0Any::read_nested(RkBuffer* stream, int /*depth*/)
{
    return read(stream);
}

static void rk_amf0_do_print(RkAmf0Any* any, stringstream& ss, int level);

// Print an elem of the object or array in a new line, the complex elem is indented.
static void rk_amf0_do_print_elem(const string& prefix, RkAmf0Any* value, stringstream& ss, int level)
{
    ss << string((level + 1) * 4, ' ') << prefix;
    rk_amf0_do_print(value, ss, value->is_complex_object()? level + 1 : 0);
}

static void rk_amf0_do_print(RkAmf0Any* any, stringstream& ss, int level)
{
    std::ios_base::fmtflags oflags = ss.flags();

    if (any->is_boolean()) {
        ss << "Boolean " << (any->to_boolean()? "true":"false") << endl;
    } else if (any->is_number()) {
        ss << "Number " << std::fixed << any->to_number() << endl;
    } else if (any->is_string()) {
        ss << "String " << any->to_str() << endl;
    } else if (any->is_date()) {
        ss << "Date " << std::hex << any->to_date() << "/" << any->to_date_time_zone() << endl;
    } else if (any->is_null()) {
        ss << "Null" << endl;
    } else if (any->is_undefined()) {
        ss << "Undefined" << endl;
    } else if (any->is_strict_array()) {
        RkAmf0StrictArray* arr = any->to_strict_array();
        ss << "StrictArray (" << arr->count() << " items)" << endl;
        for (int i = 0; i < arr->count(); i++) {
            rk_amf0_do_print_elem("Elem ", arr->at(i), ss, level);
        }
    } else if (any->is_object() || any->is_ecma_array()) {
        RkAmf0Map* props = any->to_map();
        ss << (any->is_object()? "Object" : "EcmaArray") << " (" << props->count() << " items)" << endl;

        const char* label = any->is_object()? "Property '" : "Elem '";
        for (int i = 0; i < props->count(); i++) {
            rk_amf0_do_print_elem(label + props->key_at(i) + "' ", props->value_at(i), ss, level);
        }
    } else {
        ss << "Unknown" << endl;
    }

    ss.flags(oflags);
}

string RkAmf0Any::dumps()
{
    stringstream ss;
    ss.precision(1);

    rk_amf0_do_print(this, ss, 0);

    return ss.str();
}

RkAmf0Any* RkAmf0Any::str(const char* value)
{
    return new RkAmf0String(value);
}

RkAmf0Any* RkAmf0Any::boolean(bool value)
{
    return new RkAmf0Boolean(value);
}

RkAmf0Any* RkAmf0Any::number(double value)
{
    return new RkAmf0Number(value);
}

RkAmf0Any* RkAmf0Any::date(int64_t value)
{
    return new RkAmf0Date(value);
}

RkAmf0Any* RkAmf0Any::null()
{
    return new RkAmf0Marker(RTMP_AMF0_Null);
}

RkAmf0Any* RkAmf0Any::undefined()
{
    return new RkAmf0Marker(RTMP_AMF0_Undefined);
}

RkAmf0Object* RkAmf0Any::object()
{
    return new RkAmf0Object();
}

RkAmf0EcmaArray* RkAmf0Any::ecma_array()
{
    return new RkAmf0EcmaArray();
}

RkAmf0StrictArray* RkAmf0Any::strict_array()
{
    return new RkAmf0StrictArray();
}

rk_error_t RkAmf0Any::discovery(RkBuffer* stream, RkAmf0Any** ppvalue)
{
    if (!stream->require(1)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "marker requires 1 only %d bytes", stream->left());
    }

    // Peek the marker, the value reads it again.
    char marker = *stream->head();

    switch (marker) {
        case RTMP_AMF0_String: *ppvalue = RkAmf0Any::str(); break;
        case RTMP_AMF0_Boolean: *ppvalue = RkAmf0Any::boolean(); break;
        case RTMP_AMF0_Number: *ppvalue = RkAmf0Any::number(); break;
        case RTMP_AMF0_Null: *ppvalue = RkAmf0Any::null(); break;
        case RTMP_AMF0_Undefined: *ppvalue = RkAmf0Any::undefined(); break;
        case RTMP_AMF0_Object: *ppvalue = RkAmf0Any::object(); break;
        case RTMP_AMF0_EcmaArray: *ppvalue = RkAmf0Any::ecma_array(); break;
        case RTMP_AMF0_StrictArray: *ppvalue = RkAmf0Any::strict_array(); break;
        case RTMP_AMF0_Date: *ppvalue = RkAmf0Any::date(); break;
        default:
            return rk_error_new(ERROR_RTMP_AMF0_INVALID, "unsupported amf0 marker=%#x", (uint8_t)marker);
    }

    return rk_success;
}

RkAmf0Map::RkAmf0Map()
{
}

RkAmf0Map::~RkAmf0Map()
{
    clear();
}

void RkAmf0Map::clear()
{
    for (int i = 0; i < (int)properties.size(); i++) {
        RkAmf0Any* value = properties[i].second;
        rk_freep(value);
    }
    properties.clear();
}

int RkAmf0Map::count()
{
    return (int)properties.size();
}

string RkAmf0Map::key_at(int index)
{
    rk_assert(index < count());
    return properties[index].first;
}

RkAmf0Any* RkAmf0Map::value_at(int index)
{
    rk_assert(index < count());
    return properties[index].second;
}

void RkAmf0Map::set(string key, RkAmf0Any* value)
{
    std::vector<RkAmf0Property>::iterator it = properties.begin();
    while (it != properties.end()) {
        if (it->first != key) {
            ++it;
            continue;
        }

        rk_freep(it->second);
        it = properties.erase(it);
    }

    if (value) {
        properties.push_back(std::make_pair(key, value));
    }
}

rk_error_t RkAmf0Map::read_properties(RkBuffer* stream, int depth)
{
    rk_error_t err = rk_success;

    while (!stream->empty()) {
        if (rk_amf0_skip_object_end(stream)) {
            return err;
        }

        string key;
        if ((err = rk_amf0_read_utf8(stream, key)) != rk_success) {
            return rk_error_wrap(err, "property key");
        }

        RkAmf0Any* value = NULL;
        if ((err = rk_amf0_read_nested(stream, &value, depth + 1)) != rk_success) {
            return rk_error_wrap(err, "property %s", key.c_str());
        }

        set(key, value);
    }

    // Some encoders never write the object-end of the last object, tolerate it.
    rk_info("amf0 properties without object-end, count=%d", count());

    return err;
}

rk_error_t RkAmf0Map::write_properties(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    for (int i = 0; i < (int)properties.size(); i++) {
        const string& key = properties[i].first;

        if ((err = rk_amf0_write_utf8(stream, key)) != rk_success) {
            return rk_error_wrap(err, "property key %s", key.c_str());
        }

        if ((err = properties[i].second->write(stream)) != rk_success) {
            return rk_error_wrap(err, "property %s", key.c_str());
        }
    }

    if (!stream->require(RkAmf0Size::object_eof())) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "object-end requires 3 only %d bytes", stream->left());
    }
    stream->write_3bytes(RTMP_AMF0_ObjectEnd);

    return err;
}

int RkAmf0Map::properties_size()
{
    int size = RkAmf0Size::object_eof();

    for (int i = 0; i < (int)properties.size(); i++) {
        size += RkAmf0Size::utf8(properties[i].first) + RkAmf0Size::any(properties[i].second);
    }

    return size;
}

void RkAmf0Map::copy_properties(RkAmf0Map* dst)
{
    for (int i = 0; i < (int)properties.size(); i++) {
        dst->set(properties[i].first, properties[i].second->copy());
    }
}

RkAmf0Object::RkAmf0Object()
{
    marker = RTMP_AMF0_Object;
}

RkAmf0Object::~RkAmf0Object()
{
}

int RkAmf0Object::total_size()
{
    return 1 + properties_size();
}

rk_error_t RkAmf0Object::read(RkBuffer* stream)
{
    return read_nested(stream, 0);
}

rk_error_t RkAmf0Object::read_nested(RkBuffer* stream, int depth)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_complex_marker(stream, RTMP_AMF0_Object, "Object", depth)) != rk_success) {
        return err;
    }

    if ((err = read_properties(stream, depth)) != rk_success) {
        return rk_error_wrap(err, "Object");
    }

    return err;
}

rk_error_t RkAmf0Object::write(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_write_marker(stream, RTMP_AMF0_Object, "Object")) != rk_success) {
        return err;
    }

    if ((err = write_properties(stream)) != rk_success) {
        return rk_error_wrap(err, "Object");
    }

    return err;
}

RkAmf0Any* RkAmf0Object::copy()
{
    RkAmf0Object* cp = new RkAmf0Object();
    copy_properties(cp);
    return cp;
}

RkAmf0EcmaArray::RkAmf0EcmaArray()
{
    marker = RTMP_AMF0_EcmaArray;
}

RkAmf0EcmaArray::~RkAmf0EcmaArray()
{
}

int RkAmf0EcmaArray::total_size()
{
    return 1 + 4 + properties_size();
}

rk_error_t RkAmf0EcmaArray::read(RkBuffer* stream)
{
    return read_nested(stream, 0);
}

rk_error_t RkAmf0EcmaArray::read_nested(RkBuffer* stream, int depth)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_complex_marker(stream, RTMP_AMF0_EcmaArray, "EcmaArray", depth)) != rk_success) {
        return err;
    }

    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "EcmaArray count requires 4 only %d bytes", stream->left());
    }

    // The associative-count is only a hint, read until the object-end.
    stream->skip(4);

    if ((err = read_properties(stream, depth)) != rk_success) {
        return rk_error_wrap(err, "EcmaArray");
    }

    return err;
}

rk_error_t RkAmf0EcmaArray::write(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if (!stream->require(1 + 4)) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "EcmaArray requires 5 only %d bytes", stream->left());
    }

    stream->write_1bytes(RTMP_AMF0_EcmaArray);
    stream->write_4bytes(count());

    if ((err = write_properties(stream)) != rk_success) {
        return rk_error_wrap(err, "EcmaArray");
    }

    return err;
}

RkAmf0Any* RkAmf0EcmaArray::copy()
{
    RkAmf0EcmaArray* cp = new RkAmf0EcmaArray();
    copy_properties(cp);
    return cp;
}

RkAmf0StrictArray::RkAmf0StrictArray()
{
    marker = RTMP_AMF0_StrictArray;
}

RkAmf0StrictArray::~RkAmf0StrictArray()
{
    clear();
}

int RkAmf0StrictArray::total_size()
{
    int size = 1 + 4;

    for (int i = 0; i < (int)elems.size(); i++) {
        size += RkAmf0Size::any(elems[i]);
    }

    return size;
}

rk_error_t RkAmf0StrictArray::read(RkBuffer* stream)
{
    return read_nested(stream, 0);
}

rk_error_t RkAmf0StrictArray::read_nested(RkBuffer* stream, int depth)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_complex_marker(stream, RTMP_AMF0_StrictArray, "StrictArray", depth)) != rk_success) {
        return err;
    }

    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "StrictArray count requires 4 only %d bytes", stream->left());
    }
    uint32_t nb_elems = (uint32_t)stream->read_4bytes();

    // Each elem is at least the 1 byte marker, so never trust a larger count.
    if (nb_elems > (uint32_t)stream->left()) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "StrictArray count=%u only %d bytes", nb_elems, stream->left());
    }

    for (uint32_t i = 0; i < nb_elems; i++) {
        RkAmf0Any* elem = NULL;
        if ((err = rk_amf0_read_nested(stream, &elem, depth + 1)) != rk_success) {
            return rk_error_wrap(err, "StrictArray elem %u/%u", i, nb_elems);
        }

        append(elem);
    }

    return err;
}

rk_error_t RkAmf0StrictArray::write(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if (!stream->require(1 + 4)) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "StrictArray requires 5 only %d bytes", stream->left());
    }

    stream->write_1bytes(RTMP_AMF0_StrictArray);
    stream->write_4bytes((int32_t)elems.size());

    for (int i = 0; i < (int)elems.size(); i++) {
        if ((err = elems[i]->write(stream)) != rk_success) {
            return rk_error_wrap(err, "StrictArray elem %d", i);
        }
    }

    return err;
}

RkAmf0Any* RkAmf0StrictArray::copy()
{
    RkAmf0StrictArray* cp = new RkAmf0StrictArray();

    for (int i = 0; i < (int)elems.size(); i++) {
        cp->append(elems[i]->copy());
    }

    return cp;
}

void RkAmf0StrictArray::clear()
{
    for (int i = 0; i < (int)elems.size(); i++) {
        RkAmf0Any* elem = elems[i];
        rk_freep(elem);
    }
    elems.clear();
}

int RkAmf0StrictArray::count()
{
    return (int)elems.size();
}

RkAmf0Any* RkAmf0StrictArray::at(int index)
{
    rk_assert(index < count());
    return elems[index];
}

void RkAmf0StrictArray::append(RkAmf0Any* elem)
{
    elems.push_back(elem);
}

int RkAmf0Size::utf8(string value)
{
    return 2 + (int)value.length();
}

int RkAmf0Size::str(string value)
{
    return 1 + utf8(value);
}

int RkAmf0Size::number()
{
    return 1 + 8;
}

int RkAmf0Size::date()
{
    return 1 + 8 + 2;
}

int RkAmf0Size::null()
{
    return 1;
}

int RkAmf0Size::undefined()
{
    return 1;
}

int RkAmf0Size::boolean()
{
    return 1 + 1;
}

int RkAmf0Size::object(RkAmf0Object* obj)
{
    return any(obj);
}

int RkAmf0Size::object_eof()
{
    return 2 + 1;
}

int RkAmf0Size::ecma_array(RkAmf0EcmaArray* arr)
{
    return any(arr);
}

int RkAmf0Size::strict_array(RkAmf0StrictArray* arr)
{
    return any(arr);
}

int RkAmf0Size::any(RkAmf0Any* o)
{
    return o? o->total_size() : 0;
}

RkAmf0String::RkAmf0String(const char* v)
{
    marker = RTMP_AMF0_String;
    value = v? v : "";
}

RkAmf0String::~RkAmf0String()
{
}

int RkAmf0String::total_size()
{
    return RkAmf0Size::str(value);
}

rk_error_t RkAmf0String::read(RkBuffer* stream)
{
    return rk_amf0_read_string(stream, value);
}

rk_error_t RkAmf0String::write(RkBuffer* stream)
{
    return rk_amf0_write_string(stream, value);
}

RkAmf0Any* RkAmf0String::copy()
{
    return new RkAmf0String(value.c_str());
}

RkAmf0Boolean::RkAmf0Boolean(bool v)
{
    marker = RTMP_AMF0_Boolean;
    value = v;
}

RkAmf0Boolean::~RkAmf0Boolean()
{
}

int RkAmf0Boolean::total_size()
{
    return RkAmf0Size::boolean();
}

rk_error_t RkAmf0Boolean::read(RkBuffer* stream)
{
    return rk_amf0_read_boolean(stream, value);
}

rk_error_t RkAmf0Boolean::write(RkBuffer* stream)
{
    return rk_amf0_write_boolean(stream, value);
}

RkAmf0Any* RkAmf0Boolean::copy()
{
    return new RkAmf0Boolean(value);
}

RkAmf0Number::RkAmf0Number(double v)
{
    marker = RTMP_AMF0_Number;
    value = v;
}

RkAmf0Number::~RkAmf0Number()
{
}

int RkAmf0Number::total_size()
{
    return RkAmf0Size::number();
}

rk_error_t RkAmf0Number::read(RkBuffer* stream)
{
    return rk_amf0_read_number(stream, value);
}

rk_error_t RkAmf0Number::write(RkBuffer* stream)
{
    return rk_amf0_write_number(stream, value);
}

RkAmf0Any* RkAmf0Number::copy()
{
    return new RkAmf0Number(value);
}

RkAmf0Date::RkAmf0Date(int64_t v)
{
    marker = RTMP_AMF0_Date;
    value = v;
    time_zone = 0;
}

RkAmf0Date::~RkAmf0Date()
{
}

int RkAmf0Date::total_size()
{
    return RkAmf0Size::date();
}

rk_error_t RkAmf0Date::read(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_marker(stream, RTMP_AMF0_Date, "Date")) != rk_success) {
        return err;
    }

    if (!stream->require(8 + 2)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "Date requires 10 only %d bytes", stream->left());
    }

    value = stream->read_8bytes();
    time_zone = stream->read_2bytes();

    return err;
}

rk_error_t RkAmf0Date::write(RkBuffer* stream)
{
    if (!stream->require(RkAmf0Size::date())) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "Date requires %d only %d bytes", RkAmf0Size::date(), stream->left());
    }

    stream->write_1bytes(RTMP_AMF0_Date);
    stream->write_8bytes(value);
    stream->write_2bytes(time_zone);

    return rk_success;
}

RkAmf0Any* RkAmf0Date::copy()
{
    RkAmf0Date* cp = new RkAmf0Date(value);
    cp->time_zone = time_zone;
    return cp;
}

RkAmf0Marker::RkAmf0Marker(char m)
{
    marker = m;
}

RkAmf0Marker::~RkAmf0Marker()
{
}

int RkAmf0Marker::total_size()
{
    return 1;
}

rk_error_t RkAmf0Marker::read(RkBuffer* stream)
{
    return rk_amf0_read_marker(stream, marker, is_null()? "Null" : "Undefined");
}

rk_error_t RkAmf0Marker::write(RkBuffer* stream)
{
    return rk_amf0_write_marker(stream, marker, is_null()? "Null" : "Undefined");
}

RkAmf0Any* RkAmf0Marker::copy()
{
    return new RkAmf0Marker(marker);
}

rk_error_t rk_amf0_read_any(RkBuffer* stream, RkAmf0Any** ppvalue)
{
    return rk_amf0_read_nested(stream, ppvalue, 0);
}

rk_error_t rk_amf0_read_string(RkBuffer* stream, string& value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_marker(stream, RTMP_AMF0_String, "String")) != rk_success) {
        return err;
    }

    return rk_amf0_read_utf8(stream, value);
}

rk_error_t rk_amf0_write_string(RkBuffer* stream, string value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_write_marker(stream, RTMP_AMF0_String, "String")) != rk_success) {
        return err;
    }

    return rk_amf0_write_utf8(stream, value);
}

rk_error_t rk_amf0_read_boolean(RkBuffer* stream, bool& value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_marker(stream, RTMP_AMF0_Boolean, "Boolean")) != rk_success) {
        return err;
    }

    if (!stream->require(1)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "Boolean requires 1 only %d bytes", stream->left());
    }

    value = (stream->read_1bytes() != 0);

    return err;
}

rk_error_t rk_amf0_write_boolean(RkBuffer* stream, bool value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_write_marker(stream, RTMP_AMF0_Boolean, "Boolean")) != rk_success) {
        return err;
    }

    if (!stream->require(1)) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "Boolean requires 1 only %d bytes", stream->left());
    }

    stream->write_1bytes(value? 0x01 : 0x00);

    return err;
}

rk_error_t rk_amf0_read_number(RkBuffer* stream, double& value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_marker(stream, RTMP_AMF0_Number, "Number")) != rk_success) {
        return err;
    }

    if (!stream->require(8)) {
        return rk_error_new(ERROR_RTMP_AMF0_DECODE, "Number requires 8 only %d bytes", stream->left());
    }

    // The IEEE-754 double in network byte order.
    int64_t bits = stream->read_8bytes();
    memcpy(&value, &bits, 8);

    return err;
}

rk_error_t rk_amf0_write_number(RkBuffer* stream, double value)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_write_marker(stream, RTMP_AMF0_Number, "Number")) != rk_success) {
        return err;
    }

    if (!stream->require(8)) {
        return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "Number requires 8 only %d bytes", stream->left());
    }

    int64_t bits = 0;
    memcpy(&bits, &value, 8);
    stream->write_8bytes(bits);

    return err;
}

rk_error_t rk_amf0_read_null(RkBuffer* stream)
{
    return rk_amf0_read_marker(stream, RTMP_AMF0_Null, "Null");
}

rk_error_t rk_amf0_write_null(RkBuffer* stream)
{
    return rk_amf0_write_marker(stream, RTMP_AMF0_Null, "Null");
}

rk_error_t rk_amf0_read_undefined(RkBuffer* stream)
{
    return rk_amf0_read_marker(stream, RTMP_AMF0_Undefined, "Undefined");
}

rk_error_t rk_amf0_write_undefined(RkBuffer* stream)
{
    return rk_amf0_write_marker(stream, RTMP_AMF0_Undefined, "Undefined");
}

namespace _rk_internal
{
    rk_error_t rk_amf0_read_utf8(RkBuffer* stream, string& value)
    {
        if (!stream->require(2)) {
            return rk_error_new(ERROR_RTMP_AMF0_DECODE, "utf8 length requires 2 only %d bytes", stream->left());
        }

        // The length is U16, so 32768 to 65535 is ok.
        int len = (uint16_t)stream->read_2bytes();
        if (!stream->require(len)) {
            return rk_error_new(ERROR_RTMP_AMF0_DECODE, "utf8 requires %d only %d bytes", len, stream->left());
        }

        value = len? stream->read_string(len) : "";

        return rk_success;
    }

    rk_error_t rk_amf0_write_utf8(RkBuffer* stream, string value)
    {
        int len = (int)value.length();
        if (len > RK_AMF0_UTF8_MAX) {
            return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "utf8 length=%d exceed %d", len, RK_AMF0_UTF8_MAX);
        }

        if (!stream->require(2 + len)) {
            return rk_error_new(ERROR_RTMP_AMF0_ENCODE, "utf8 requires %d only %d bytes", 2 + len, stream->left());
        }

        stream->write_2bytes((int16_t)len);
        stream->write_string(value);

        return rk_success;
    }

    rk_error_t rk_amf0_read_nested(RkBuffer* stream, RkAmf0Any** ppvalue, int depth)
    {
        rk_error_t err = rk_success;

        RkAmf0Any* value = NULL;
        if ((err = RkAmf0Any::discovery(stream, &value)) != rk_success) {
            return rk_error_wrap(err, "discovery");
        }

        if ((err = value->read_nested(stream, depth)) != rk_success) {
            rk_freep(value);
            return rk_error_wrap(err, "read value depth=%d", depth);
        }

        *ppvalue = value;

        return err;
    }
}
