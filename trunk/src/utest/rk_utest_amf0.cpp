//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//
#include <rk_utest.hpp>

#include <string.h>
#include <string>
using namespace std;

#include <rk_core_autofree.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_buffer.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_protocol_amf0.hpp>

using namespace _rk_internal;

VOID TEST(ProtocolAMF0Test, ScenarioMain)
{
    rk_error_t err;

    // coded amf0 object
    int nb_bytes = 0;
    char* bytes = NULL;

    // coding data to binaries by amf0
    // for example, the metadata of stream and its encoder info.
    if (true) {
        RkAmf0Object* meta = RkAmf0Any::object();
        RkAutoFree(RkAmf0Object, meta);
        meta->set("width", RkAmf0Any::number(1280));
        meta->set("height", RkAmf0Any::number(720));
        meta->set("stereo", RkAmf0Any::boolean(true));

        RkAmf0EcmaArray* info = RkAmf0Any::ecma_array();
        RkAutoFree(RkAmf0EcmaArray, info);
        info->set("encoder", RkAmf0Any::str("Lavf59.27.100"));

        RkAmf0StrictArray* tracks = RkAmf0Any::strict_array();
        info->set("tracks", tracks);
        tracks->append(RkAmf0Any::str("video"));
        tracks->append(RkAmf0Any::str("audio"));

        nb_bytes = meta->total_size() + info->total_size();
        ASSERT_GT(nb_bytes, 0);
        bytes = new char[nb_bytes];

        RkBuffer s(bytes, nb_bytes);
        HELPER_EXPECT_SUCCESS(meta->write(&s));
        HELPER_EXPECT_SUCCESS(info->write(&s));
        EXPECT_TRUE(s.empty());

        EXPECT_EQ(0x03, bytes[0]);
        EXPECT_EQ(0x09, bytes[nb_bytes - 1]);
    }
    RkAutoFreeA(char, bytes);

    // decoding when user know the schema.
    if (true) {
        RkBuffer s(bytes, nb_bytes);

        RkAmf0Object* meta = RkAmf0Any::object();
        RkAutoFree(RkAmf0Object, meta);
        HELPER_EXPECT_SUCCESS(meta->read(&s));

        RkAmf0EcmaArray* info = RkAmf0Any::ecma_array();
        RkAutoFree(RkAmf0EcmaArray, info);
        HELPER_EXPECT_SUCCESS(info->read(&s));
        EXPECT_TRUE(s.empty());

        RkAmf0Any* prop = NULL;
        ASSERT_TRUE(NULL != (prop = rk_utest_find_property(meta, "width")));
        EXPECT_EQ(1280, prop->to_number());

        ASSERT_TRUE(NULL != (prop = rk_utest_find_property(meta, "stereo")));
        EXPECT_TRUE(prop->is_boolean());
        EXPECT_TRUE(prop->to_boolean());

        ASSERT_TRUE(NULL != (prop = rk_utest_find_property(info, "encoder")));
        EXPECT_STREQ("Lavf59.27.100", prop->to_str().c_str());

        ASSERT_TRUE(NULL != (prop = rk_utest_find_property(info, "tracks")));
        ASSERT_TRUE(prop->is_strict_array());
        RkAmf0StrictArray* tracks = prop->to_strict_array();
        ASSERT_EQ(2, tracks->count());
        EXPECT_STREQ("audio", tracks->at(1)->to_str().c_str());
    }

    // decoding when user donot know the schema.
    if (true) {
        RkBuffer s(bytes, nb_bytes);

        RkAmf0Any* any = NULL;
        HELPER_ASSERT_SUCCESS(rk_amf0_read_any(&s, &any));
        RkAutoFree(RkAmf0Any, any);

        ASSERT_TRUE(any->is_object());
        RkAmf0Object* obj = any->to_object();
        ASSERT_EQ(3, obj->count());
        EXPECT_STREQ("width", obj->key_at(0).c_str());
        EXPECT_STREQ("height", obj->key_at(1).c_str());
        EXPECT_TRUE(obj->value_at(2)->is_boolean());
    }
}

VOID TEST(ProtocolAMF0Test, ApiSize)
{
    EXPECT_EQ(2, RkAmf0Size::utf8(""));
    EXPECT_EQ(2 + 4, RkAmf0Size::utf8("live"));
    EXPECT_EQ(1 + 2 + 4, RkAmf0Size::str("live"));
    EXPECT_EQ(1 + 8, RkAmf0Size::number());
    EXPECT_EQ(1 + 8 + 2, RkAmf0Size::date());
    EXPECT_EQ(1, RkAmf0Size::null());
    EXPECT_EQ(1, RkAmf0Size::undefined());
    EXPECT_EQ(1 + 1, RkAmf0Size::boolean());
    EXPECT_EQ(2 + 1, RkAmf0Size::object_eof());
    EXPECT_EQ(0, RkAmf0Size::any(NULL));

    if (true) {
        RkAmf0Object* o = RkAmf0Any::object();
        RkAutoFree(RkAmf0Object, o);
        EXPECT_EQ(1 + 3, RkAmf0Size::object(o));

        o->set("width", RkAmf0Any::number(1280));
        EXPECT_EQ(1 + (2 + 5) + (1 + 8) + 3, RkAmf0Size::object(o));
        EXPECT_EQ(RkAmf0Size::object(o), RkAmf0Size::any(o));
    }

    if (true) {
        RkAmf0EcmaArray* o = RkAmf0Any::ecma_array();
        RkAutoFree(RkAmf0EcmaArray, o);
        EXPECT_EQ(1 + 4 + 3, RkAmf0Size::ecma_array(o));

        o->set("stereo", RkAmf0Any::boolean(true));
        EXPECT_EQ(1 + 4 + (2 + 6) + 2 + 3, RkAmf0Size::ecma_array(o));
    }

    if (true) {
        RkAmf0StrictArray* o = RkAmf0Any::strict_array();
        RkAutoFree(RkAmf0StrictArray, o);
        EXPECT_EQ(1 + 4, RkAmf0Size::strict_array(o));

        o->append(RkAmf0Any::null());
        EXPECT_EQ(1 + 4 + 1, RkAmf0Size::strict_array(o));
    }
}

VOID TEST(ProtocolAMF0Test, WireNumber)
{
    rk_error_t err;

    char buf[9];
    RkBuffer s(buf, sizeof(buf));

    HELPER_EXPECT_SUCCESS(rk_amf0_write_number(&s, 1.0));
    EXPECT_STREQ("00 3f f0 00 00 00 00 00 00", rk_string_dumps_hex(buf, sizeof(buf)).c_str());

    s.skip(-9);
    double v = 0;
    HELPER_EXPECT_SUCCESS(rk_amf0_read_number(&s, v));
    EXPECT_EQ(1.0, v);

    // No space to write.
    s.skip(-1);
    HELPER_EXPECT_FAILED_CODE(rk_amf0_write_number(&s, 1.0), ERROR_RTMP_AMF0_ENCODE);

    // Truncated to read.
    RkBuffer t(buf, 8);
    HELPER_EXPECT_FAILED_CODE(rk_amf0_read_number(&t, v), ERROR_RTMP_AMF0_DECODE);
}

VOID TEST(ProtocolAMF0Test, WireString)
{
    rk_error_t err;

    char buf[16];
    RkBuffer s(buf, sizeof(buf));

    HELPER_EXPECT_SUCCESS(rk_amf0_write_string(&s, "live"));
    EXPECT_EQ(7, s.pos());
    EXPECT_STREQ("02 00 04 6c 69 76 65", rk_string_dumps_hex(buf, 7).c_str());

    s.skip(-7);
    string v;
    HELPER_EXPECT_SUCCESS(rk_amf0_read_string(&s, v));
    EXPECT_STREQ("live", v.c_str());

    // Empty string.
    if (true) {
        RkBuffer b(buf, sizeof(buf));
        HELPER_EXPECT_SUCCESS(rk_amf0_write_string(&b, ""));
        EXPECT_EQ(3, b.pos());

        b.skip(-3);
        v = "x";
        HELPER_EXPECT_SUCCESS(rk_amf0_read_string(&b, v));
        EXPECT_TRUE(v.empty());
    }

    // Invalid marker.
    if (true) {
        char data[] = {0x00, 0x00, 0x01, 0x61};
        RkBuffer b(data, sizeof(data));
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_string(&b, v), ERROR_RTMP_AMF0_DECODE);
    }

    // Truncated data.
    if (true) {
        char data[] = {0x02, 0x00, 0x04, 0x6c, 0x69};
        RkBuffer b(data, sizeof(data));
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_string(&b, v), ERROR_RTMP_AMF0_DECODE);
    }
}

VOID TEST(ProtocolAMF0Test, WireStringLength)
{
    rk_error_t err;

    // The length is unsigned 16 bits, larger than 32767 is ok.
    if (true) {
        string v(40000, 'x');
        int size = RkAmf0Size::str(v);
        char* buf = new char[size];
        RkAutoFreeA(char, buf);

        RkBuffer s(buf, size);
        HELPER_EXPECT_SUCCESS(rk_amf0_write_string(&s, v));
        EXPECT_TRUE(s.empty());

        s.skip(-size);
        string r;
        HELPER_EXPECT_SUCCESS(rk_amf0_read_string(&s, r));
        EXPECT_EQ(40000, (int)r.length());
    }

    // Exceed the 16 bits length.
    if (true) {
        string v(0x10000, 'x');
        int size = RkAmf0Size::str(v);
        char* buf = new char[size];
        RkAutoFreeA(char, buf);

        RkBuffer s(buf, size);
        HELPER_EXPECT_FAILED_CODE(rk_amf0_write_string(&s, v), ERROR_RTMP_AMF0_ENCODE);
    }
}

VOID TEST(ProtocolAMF0Test, WireBooleanNullUndefined)
{
    rk_error_t err;

    char buf[4];
    RkBuffer s(buf, sizeof(buf));

    HELPER_EXPECT_SUCCESS(rk_amf0_write_boolean(&s, true));
    HELPER_EXPECT_SUCCESS(rk_amf0_write_null(&s));
    HELPER_EXPECT_SUCCESS(rk_amf0_write_undefined(&s));
    EXPECT_STREQ("01 01 05 06", rk_string_dumps_hex(buf, 4).c_str());

    s.skip(-4);
    bool v = false;
    HELPER_EXPECT_SUCCESS(rk_amf0_read_boolean(&s, v));
    EXPECT_TRUE(v);
    HELPER_EXPECT_SUCCESS(rk_amf0_read_null(&s));
    HELPER_EXPECT_SUCCESS(rk_amf0_read_undefined(&s));

    // The null is not undefined.
    s.skip(-2);
    HELPER_EXPECT_FAILED_CODE(rk_amf0_read_undefined(&s), ERROR_RTMP_AMF0_DECODE);

    // Truncated boolean.
    RkBuffer t(buf, 1);
    HELPER_EXPECT_FAILED_CODE(rk_amf0_read_boolean(&t, v), ERROR_RTMP_AMF0_DECODE);
}

VOID TEST(ProtocolAMF0Test, WireDate)
{
    rk_error_t err;

    RkAmf0Any* d = RkAmf0Any::date(1700000000000LL);
    RkAutoFree(RkAmf0Any, d);
    EXPECT_TRUE(d->is_date());
    EXPECT_EQ(1700000000000LL, d->to_date());
    EXPECT_EQ(0, d->to_date_time_zone());

    char buf[11];
    RkBuffer s(buf, sizeof(buf));
    HELPER_EXPECT_SUCCESS(d->write(&s));
    EXPECT_EQ(0x0b, buf[0]);

    s.skip(-11);
    RkAmf0Any* r = NULL;
    HELPER_ASSERT_SUCCESS(rk_amf0_read_any(&s, &r));
    RkAutoFree(RkAmf0Any, r);
    ASSERT_TRUE(r->is_date());
    EXPECT_EQ(1700000000000LL, r->to_date());
}

VOID TEST(ProtocolAMF0Test, Discovery)
{
    rk_error_t err;

    // Empty buffer.
    if (true) {
        char data = 0;
        RkBuffer b(&data, 0);
        RkAmf0Any* any = NULL;
        HELPER_EXPECT_FAILED_CODE(RkAmf0Any::discovery(&b, &any), ERROR_RTMP_AMF0_DECODE);
    }

    // Invalid marker.
    if (true) {
        char data = 0x3f;
        RkBuffer b(&data, 1);
        RkAmf0Any* any = NULL;
        HELPER_EXPECT_FAILED_CODE(RkAmf0Any::discovery(&b, &any), ERROR_RTMP_AMF0_INVALID);
    }

    // Unsupported marker, for example, the long string.
    if (true) {
        char data[] = {0x0c, 0x00, 0x00, 0x00, 0x00};
        RkBuffer b(data, sizeof(data));
        RkAmf0Any* any = NULL;
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_any(&b, &any), ERROR_RTMP_AMF0_INVALID);
        EXPECT_TRUE(any == NULL);
    }

    // Peek the marker, never consume it.
    if (true) {
        char data[] = {0x05};
        RkBuffer b(data, sizeof(data));
        RkAmf0Any* any = NULL;
        HELPER_ASSERT_SUCCESS(RkAmf0Any::discovery(&b, &any));
        RkAutoFree(RkAmf0Any, any);
        EXPECT_TRUE(any->is_null());
        EXPECT_EQ(0, b.pos());
    }

    // The object-end is never a value.
    if (true) {
        char data[] = {0x09};
        RkBuffer b(data, sizeof(data));
        RkAmf0Any* any = NULL;
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_any(&b, &any), ERROR_RTMP_AMF0_INVALID);
        EXPECT_TRUE(any == NULL);
    }
}

VOID TEST(ProtocolAMF0Test, ApiObjectProps)
{
    RkAmf0Object* o = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, o);

    o->set("name", RkAmf0Any::number(3.0));
    o->set("name", RkAmf0Any::str("rtmpkit"));
    EXPECT_EQ(1, o->count());

    ASSERT_TRUE(o->value_at(0)->is_string());
    EXPECT_STREQ("rtmpkit", o->value_at(0)->to_str().c_str());
    EXPECT_TRUE(rk_utest_find_property(o, "id") == NULL);

    // Set NULL remove the property.
    o->set("name", NULL);
    EXPECT_EQ(0, o->count());

    // The replaced key moves to the end.
    o->set("width", RkAmf0Any::number(1280));
    o->set("height", RkAmf0Any::number(720));
    o->set("width", RkAmf0Any::number(1920));
    ASSERT_EQ(2, o->count());
    EXPECT_STREQ("height", o->key_at(0).c_str());
    EXPECT_STREQ("width", o->key_at(1).c_str());
    EXPECT_EQ(1920, o->value_at(1)->to_number());

    o->clear();
    EXPECT_EQ(0, o->count());
}

VOID TEST(ProtocolAMF0Test, ApiEcmaArrayProps)
{
    rk_error_t err;

    RkAmf0EcmaArray* o = RkAmf0Any::ecma_array();
    RkAutoFree(RkAmf0EcmaArray, o);

    o->set("width", RkAmf0Any::number(1280));
    o->set("stereo", RkAmf0Any::boolean(false));
    EXPECT_EQ(2, o->count());

    RkAmf0Any* prop = rk_utest_find_property(o, "width");
    ASSERT_TRUE(prop && prop->is_number());
    EXPECT_EQ(1280, prop->to_number());

    // The count on the wire is the actual number of properties.
    int size = o->total_size();
    char* buf = new char[size];
    RkAutoFreeA(char, buf);

    RkBuffer s(buf, size);
    HELPER_EXPECT_SUCCESS(o->write(&s));
    EXPECT_TRUE(s.empty());
    EXPECT_STREQ("08 00 00 00 02", rk_string_dumps_hex(buf, 5).c_str());
}

VOID TEST(ProtocolAMF0Test, ApiStrictArray)
{
    rk_error_t err;

    RkAmf0StrictArray* o = RkAmf0Any::strict_array();
    RkAutoFree(RkAmf0StrictArray, o);

    o->append(RkAmf0Any::number(1));
    o->append(RkAmf0Any::str("two"));
    o->append(RkAmf0Any::boolean(true));
    ASSERT_EQ(3, o->count());
    EXPECT_TRUE(o->at(0)->is_number());
    EXPECT_TRUE(o->at(1)->is_string());
    EXPECT_TRUE(o->at(2)->is_boolean());

    int size = o->total_size();
    char* buf = new char[size];
    RkAutoFreeA(char, buf);

    RkBuffer s(buf, size);
    HELPER_EXPECT_SUCCESS(o->write(&s));
    EXPECT_TRUE(s.empty());

    s.skip(-size);
    RkAmf0Any* any = NULL;
    HELPER_ASSERT_SUCCESS(rk_amf0_read_any(&s, &any));
    RkAutoFree(RkAmf0Any, any);
    ASSERT_TRUE(any->is_strict_array());
    EXPECT_EQ(3, any->to_strict_array()->count());

    // The count is larger than the bytes left.
    if (true) {
        uint8_t data[] = {0x0a, 0x7f, 0xff, 0xff, 0xff, 0x05};
        RkBuffer b((char*)data, sizeof(data));
        RkAmf0Any* a = NULL;
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_any(&b, &a), ERROR_RTMP_AMF0_DECODE);
    }
}

VOID TEST(ProtocolAMF0Test, ObjectWithoutEOF)
{
    rk_error_t err;

    // Some encoders never write the EOF of the last object.
    uint8_t data[] = {
        0x03,
        0x00, 0x05, 'w', 'i', 'd', 't', 'h',
        0x00, 0x40, 0x94, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    RkBuffer s((char*)data, sizeof(data));

    RkAmf0Any* any = NULL;
    HELPER_ASSERT_SUCCESS(rk_amf0_read_any(&s, &any));
    RkAutoFree(RkAmf0Any, any);

    ASSERT_TRUE(any->is_object());
    RkAmf0Any* prop = rk_utest_find_property(any->to_object(), "width");
    ASSERT_TRUE(prop && prop->is_number());
    EXPECT_EQ(1280, prop->to_number());
}

VOID TEST(ProtocolAMF0Test, ObjectTruncatedValue)
{
    rk_error_t err;

    uint8_t data[] = {
        0x03,
        0x00, 0x05, 'w', 'i', 'd', 't', 'h',
        0x00, 0x40, 0x94,
    };
    RkBuffer s((char*)data, sizeof(data));

    RkAmf0Any* any = NULL;
    HELPER_EXPECT_FAILED_CODE(rk_amf0_read_any(&s, &any), ERROR_RTMP_AMF0_DECODE);
    EXPECT_TRUE(any == NULL);
}

VOID TEST(ProtocolAMF0Test, CopyNested)
{
    RkAmf0Object* src = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, src);

    RkAmf0EcmaArray* arr = RkAmf0Any::ecma_array();
    src->set("info", arr);
    arr->set("encoder", RkAmf0Any::str("obs"));
    src->set("width", RkAmf0Any::number(1920));
    src->set("date", RkAmf0Any::date(100));
    src->set("none", RkAmf0Any::undefined());

    RkAmf0Any* cp = src->copy();
    RkAutoFree(RkAmf0Any, cp);

    // Change the source never affect the copy.
    src->clear();

    ASSERT_TRUE(cp->is_object());
    RkAmf0Object* o = cp->to_object();
    ASSERT_EQ(4, o->count());

    RkAmf0Any* info = rk_utest_find_property(o, "info");
    ASSERT_TRUE(info && info->is_ecma_array());
    RkAmf0Any* encoder = rk_utest_find_property(info->to_map(), "encoder");
    ASSERT_TRUE(encoder && encoder->is_string());
    EXPECT_STREQ("obs", encoder->to_str().c_str());

    EXPECT_EQ(1920, rk_utest_find_property(o, "width")->to_number());
    EXPECT_EQ(100, rk_utest_find_property(o, "date")->to_date());
    EXPECT_TRUE(rk_utest_find_property(o, "none")->is_undefined());
}

// Build nb_levels nested values of marker, each nested in the previous one,
// for example, the object is 03 then (00 01 'k' 03) for each nested level.
static string mock_amf0_nested(char marker, int nb_levels)
{
    string s;
    for (int i = 0; i < nb_levels; i++) {
        if (i > 0 && marker != RTMP_AMF0_StrictArray) {
            s.append("\x00\x01k", 3);
        }

        s.append(1, marker);
        if (marker == RTMP_AMF0_EcmaArray) {
            s.append("\x00\x00\x00\x01", 4);
        } else if (marker == RTMP_AMF0_StrictArray) {
            s.append(i < nb_levels - 1? "\x00\x00\x00\x01" : "\x00\x00\x00\x00", 4);
        }
    }
    return s;
}

VOID TEST(ProtocolAMF0Test, NestedDepth)
{
    rk_error_t err;

    char markers[] = {RTMP_AMF0_Object, RTMP_AMF0_EcmaArray, RTMP_AMF0_StrictArray};
    for (int i = 0; i < (int)sizeof(markers); i++) {
        // The max depth is ok, the object-end of each level is absent.
        if (true) {
            string data = mock_amf0_nested(markers[i], RK_AMF0_MAX_DEPTH);
            RkBuffer b((char*)data.data(), (int)data.length());

            RkAmf0Any* any = NULL;
            HELPER_ASSERT_SUCCESS(rk_amf0_read_any(&b, &any));
            RkAutoFree(RkAmf0Any, any);
            EXPECT_EQ(markers[i], any->marker);
            EXPECT_TRUE(b.empty());
        }

        // One more level fails.
        if (true) {
            string data = mock_amf0_nested(markers[i], RK_AMF0_MAX_DEPTH + 1);
            RkBuffer b((char*)data.data(), (int)data.length());

            RkAmf0Any* any = NULL;
            err = rk_amf0_read_any(&b, &any);
            EXPECT_TRUE(rk_is_deserialization_error(err));
            EXPECT_EQ(ERROR_RTMP_AMF0_DECODE, rk_error_code(err));
            EXPECT_TRUE(any == NULL);
            rk_freep(err);
        }
    }

    // The very deep value must fail, rather than overflow the stack.
    if (true) {
        string data = mock_amf0_nested(RTMP_AMF0_Object, 200000);
        RkBuffer b((char*)data.data(), (int)data.length());

        RkAmf0Any* any = NULL;
        HELPER_EXPECT_FAILED_CODE(rk_amf0_read_any(&b, &any), ERROR_RTMP_AMF0_DECODE);
        EXPECT_TRUE(any == NULL);
    }

    // The depth starts from the value which reads itself.
    if (true) {
        string data = mock_amf0_nested(RTMP_AMF0_Object, RK_AMF0_MAX_DEPTH + 1);
        RkBuffer b((char*)data.data(), (int)data.length());

        RkAmf0Object* obj = RkAmf0Any::object();
        RkAutoFree(RkAmf0Object, obj);
        HELPER_EXPECT_FAILED_CODE(obj->read(&b), ERROR_RTMP_AMF0_DECODE);
    }
}

VOID TEST(ProtocolAMF0Test, Dumps)
{
    RkAmf0Object* o = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, o);

    o->set("encoder", RkAmf0Any::str("obs"));
    o->set("stereo", RkAmf0Any::boolean(true));

    RkAmf0StrictArray* arr = RkAmf0Any::strict_array();
    o->set("tracks", arr);
    arr->append(RkAmf0Any::null());

    string s = o->dumps();
    EXPECT_TRUE(s.find("Object (3 items)") != string::npos);
    EXPECT_TRUE(s.find("Property 'encoder' String obs") != string::npos);
    EXPECT_TRUE(s.find("Property 'stereo' Boolean true") != string::npos);
    EXPECT_TRUE(s.find("StrictArray (1 items)") != string::npos);
    EXPECT_TRUE(s.find("Elem Null") != string::npos);
}
