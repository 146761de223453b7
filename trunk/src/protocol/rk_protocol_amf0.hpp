//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_PROTOCOL_AMF0_HPP
#define RK_PROTOCOL_AMF0_HPP

#include <rk_core.hpp>

#include <string>
#include <vector>

class RkBuffer;
class RkAmf0Map;
class RkAmf0Object;
class RkAmf0EcmaArray;
class RkAmf0StrictArray;

// AMF0 marker, 2.1 Types Overview
#define RTMP_AMF0_Number                    0x00
#define RTMP_AMF0_Boolean                   0x01
#define RTMP_AMF0_String                    0x02
#define RTMP_AMF0_Object                    0x03
#define RTMP_AMF0_Null                      0x05
#define RTMP_AMF0_Undefined                 0x06
#define RTMP_AMF0_EcmaArray                 0x08
#define RTMP_AMF0_ObjectEnd                 0x09
#define RTMP_AMF0_StrictArray               0x0A
#define RTMP_AMF0_Date                      0x0B
#define RTMP_AMF0_LongString                0x0C
// User defined
#define RTMP_AMF0_Invalid                   0x3F

// The max levels of nested object, ECMA array and strict array when decoding,
// the peer controls the payload so the recursion must be bounded.
#define RK_AMF0_MAX_DEPTH 64

/*
 * Usages:
 *
 * 1. Read a value of unknown kind, for example, the metadata of data message:
 *      RkBuffer stream(payload, size);
 *      RkAmf0Any* any = NULL;
 *      if ((err = rk_amf0_read_any(&stream, &any)) != rk_success) {
 *          return err;
 *      }
 *      RkAutoFree(RkAmf0Any, any);
 *
 * 2. Check the kind then convert:
 *      if (any->is_object() || any->is_ecma_array()) {
 *          RkAmf0Map* props = any->to_map();
 *          for (int i = 0; i < props->count(); i++) {
 *              props->key_at(i); props->value_at(i);
 *          }
 *      }
 *
 * 3. Build and write an object:
 *      RkAmf0Object* obj = RkAmf0Any::object();
 *      obj->set("width", RkAmf0Any::number(1280));
 *      RkBuffer stream(bytes, obj->total_size());
 *      err = obj->write(&stream);
 */

/**
 * any amf0 value.
 * 2.1 Types Overview
 * value-type = number-type | boolean-type | string-type | object-type
 *         | null-marker | undefined-marker | reference-type | ecma-array-type
 *         | strict-array-type | date-type | long-string-type | xml-document-type
 *         | typed-object-type
 */
class RkAmf0Any
{
public:
    char marker;
public:
    RkAmf0Any();
    virtual ~RkAmf0Any();
public:
    virtual bool is_string();
    virtual bool is_boolean();
    virtual bool is_number();
    virtual bool is_null();
    virtual bool is_undefined();
    virtual bool is_object();
    virtual bool is_ecma_array();
    virtual bool is_strict_array();
    virtual bool is_date();
    // Whether an object, ECMA array or strict array, which holds other values.
    virtual bool is_complex_object();
// The conversions, user must check the kind first, or assert failed.
public:
    virtual std::string to_str();
    virtual bool to_boolean();
    virtual double to_number();
    virtual int64_t to_date();
    virtual int16_t to_date_time_zone();
    virtual RkAmf0Object* to_object();
    virtual RkAmf0EcmaArray* to_ecma_array();
    virtual RkAmf0StrictArray* to_strict_array();
    // Get the ordered properties of an object or ECMA array.
    virtual RkAmf0Map* to_map();
public:
    // The bytes when serialized, including the marker.
    virtual int total_size() = 0;
    virtual rk_error_t read(RkBuffer* stream) = 0;
    virtual rk_error_t write(RkBuffer* stream) = 0;
    // Deep copy, the user must free it.
    virtual RkAmf0Any* copy() = 0;
    // Read the value which is nested at depth, only the complex values care about the depth.
    virtual rk_error_t read_nested(RkBuffer* stream, int depth);
    // Human readable print, for example, in the decode tool.
    virtual std::string dumps();
public:
    static RkAmf0Any* str(const char* value = NULL);
    static RkAmf0Any* boolean(bool value = false);
    static RkAmf0Any* number(double value = 0.0);
    static RkAmf0Any* date(int64_t value = 0);
    static RkAmf0Any* null();
    static RkAmf0Any* undefined();
    static RkAmf0Object* object();
    static RkAmf0EcmaArray* ecma_array();
    static RkAmf0StrictArray* strict_array();
public:
    // Create an empty value by the marker at the head of stream, the marker is not consumed,
    // so user should read the value by (*ppvalue)->read(stream).
    // @remark The long string, reference and other legacy markers are ERROR_RTMP_AMF0_INVALID.
    static rk_error_t discovery(RkBuffer* stream, RkAmf0Any** ppvalue);
};

// The properties in insert order, shared by the object and the ECMA array.
// object-property = (UTF-8 value-type) | (UTF-8-empty object-end-marker)
class RkAmf0Map : public RkAmf0Any
{
private:
    typedef std::pair<std::string, RkAmf0Any*> RkAmf0Property;
    std::vector<RkAmf0Property> properties;
public:
    RkAmf0Map();
    virtual ~RkAmf0Map();
public:
    virtual void clear();
    virtual int count();
    virtual std::string key_at(int index);
    virtual RkAmf0Any* value_at(int index);
    // Set the value of key, the previous one with the same key is freed.
    // @remark The map owns the value, and a NULL value removes the key.
    virtual void set(std::string key, RkAmf0Any* value);
protected:
    // Read properties until the object-end, which is optional at the end of stream.
    virtual rk_error_t read_properties(RkBuffer* stream, int depth);
    // Write properties and the object-end.
    virtual rk_error_t write_properties(RkBuffer* stream);
    virtual int properties_size();
    virtual void copy_properties(RkAmf0Map* dst);
};

/**
 * 2.5 Object Type
 * anonymous-object-type = object-marker *(object-property)
 */
class RkAmf0Object : public RkAmf0Map
{
private:
    friend class RkAmf0Any;
    RkAmf0Object();
public:
    virtual ~RkAmf0Object();
public:
    virtual int total_size();
    virtual rk_error_t read(RkBuffer* stream);
    virtual rk_error_t read_nested(RkBuffer* stream, int depth);
    virtual rk_error_t write(RkBuffer* stream);
    virtual RkAmf0Any* copy();
};

/**
 * 2.10 ECMA Array Type
 * ecma-array-type = associative-count *(object-property)
 * associative-count = U32
 */
class RkAmf0EcmaArray : public RkAmf0Map
{
private:
    friend class RkAmf0Any;
    RkAmf0EcmaArray();
public:
    virtual ~RkAmf0EcmaArray();
public:
    virtual int total_size();
    virtual rk_error_t read(RkBuffer* stream);
    virtual rk_error_t read_nested(RkBuffer* stream, int depth);
    // @remark The associative-count written is always the number of properties.
    virtual rk_error_t write(RkBuffer* stream);
    virtual RkAmf0Any* copy();
};

/**
 * 2.12 Strict Array Type
 * array-count = U32
 * strict-array-type = array-count *(value-type)
 */
class RkAmf0StrictArray : public RkAmf0Any
{
private:
    std::vector<RkAmf0Any*> elems;
private:
    friend class RkAmf0Any;
    RkAmf0StrictArray();
public:
    virtual ~RkAmf0StrictArray();
public:
    virtual int total_size();
    virtual rk_error_t read(RkBuffer* stream);
    virtual rk_error_t read_nested(RkBuffer* stream, int depth);
    virtual rk_error_t write(RkBuffer* stream);
    virtual RkAmf0Any* copy();
public:
    virtual void clear();
    virtual int count();
    virtual RkAmf0Any* at(int index);
    // @remark The array owns the elem.
    virtual void append(RkAmf0Any* elem);
};

// The bytes of AMF0 values when serialized.
class RkAmf0Size
{
public:
    static int utf8(std::string value);
    static int str(std::string value);
    static int number();
    static int date();
    static int null();
    static int undefined();
    static int boolean();
    static int object(RkAmf0Object* obj);
    static int object_eof();
    static int ecma_array(RkAmf0EcmaArray* arr);
    static int strict_array(RkAmf0StrictArray* arr);
    static int any(RkAmf0Any* o);
};

// Read a value of any supported kind.
// @param ppvalue The value read, which user must free. NULL when error.
extern rk_error_t rk_amf0_read_any(RkBuffer* stream, RkAmf0Any** ppvalue);

// 2.4 String Type
// string-type = string-marker UTF-8
extern rk_error_t rk_amf0_read_string(RkBuffer* stream, std::string& value);
extern rk_error_t rk_amf0_write_string(RkBuffer* stream, std::string value);

// 2.3 Boolean Type
// boolean-type = boolean-marker U8, 0 is false, <> 0 is true
extern rk_error_t rk_amf0_read_boolean(RkBuffer* stream, bool& value);
extern rk_error_t rk_amf0_write_boolean(RkBuffer* stream, bool value);

// 2.2 Number Type
// number-type = number-marker DOUBLE
extern rk_error_t rk_amf0_read_number(RkBuffer* stream, double& value);
extern rk_error_t rk_amf0_write_number(RkBuffer* stream, double value);

// 2.7 null Type and 2.8 undefined Type, only the marker.
extern rk_error_t rk_amf0_read_null(RkBuffer* stream);
extern rk_error_t rk_amf0_write_null(RkBuffer* stream);
extern rk_error_t rk_amf0_read_undefined(RkBuffer* stream);
extern rk_error_t rk_amf0_write_undefined(RkBuffer* stream);

// internal objects, user should never use it.
namespace _rk_internal
{
    class RkAmf0String : public RkAmf0Any
    {
    public:
        std::string value;
    private:
        friend class ::RkAmf0Any;
        RkAmf0String(const char* v);
    public:
        virtual ~RkAmf0String();
    public:
        virtual int total_size();
        virtual rk_error_t read(RkBuffer* stream);
        virtual rk_error_t write(RkBuffer* stream);
        virtual RkAmf0Any* copy();
    };

    class RkAmf0Boolean : public RkAmf0Any
    {
    public:
        bool value;
    private:
        friend class ::RkAmf0Any;
        RkAmf0Boolean(bool v);
    public:
        virtual ~RkAmf0Boolean();
    public:
        virtual int total_size();
        virtual rk_error_t read(RkBuffer* stream);
        virtual rk_error_t write(RkBuffer* stream);
        virtual RkAmf0Any* copy();
    };

    class RkAmf0Number : public RkAmf0Any
    {
    public:
        double value;
    private:
        friend class ::RkAmf0Any;
        RkAmf0Number(double v);
    public:
        virtual ~RkAmf0Number();
    public:
        virtual int total_size();
        virtual rk_error_t read(RkBuffer* stream);
        virtual rk_error_t write(RkBuffer* stream);
        virtual RkAmf0Any* copy();
    };

    // 2.13 Date Type
    // date-type = date-marker DOUBLE time-zone
    // time-zone = S16, reserved and should be 0x0000
    class RkAmf0Date : public RkAmf0Any
    {
    public:
        // The milliseconds since the epoch in UTC.
        int64_t value;
        int16_t time_zone;
    private:
        friend class ::RkAmf0Any;
        RkAmf0Date(int64_t v);
    public:
        virtual ~RkAmf0Date();
    public:
        virtual int total_size();
        virtual rk_error_t read(RkBuffer* stream);
        virtual rk_error_t write(RkBuffer* stream);
        virtual RkAmf0Any* copy();
    };

    // The value which is only a marker, the null or undefined.
    class RkAmf0Marker : public RkAmf0Any
    {
    private:
        friend class ::RkAmf0Any;
        RkAmf0Marker(char m);
    public:
        virtual ~RkAmf0Marker();
    public:
        virtual int total_size();
        virtual rk_error_t read(RkBuffer* stream);
        virtual rk_error_t write(RkBuffer* stream);
        virtual RkAmf0Any* copy();
    };

    // 1.3.1 Strings and UTF-8
    // UTF-8 = U16 *(UTF8-char)
    extern rk_error_t rk_amf0_read_utf8(RkBuffer* stream, std::string& value);
    extern rk_error_t rk_amf0_write_utf8(RkBuffer* stream, std::string value);

    // Read a value of any kind, which is nested at depth.
    extern rk_error_t rk_amf0_read_nested(RkBuffer* stream, RkAmf0Any** ppvalue, int depth);
}

#endif

