//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_ERROR_HPP
#define RK_KERNEL_ERROR_HPP

#include <rk_core.hpp>

#include <stdarg.h>
#include <string>

/**************************************************/
/* The system error. */
#define RK_ERRNO_MAP_SYSTEM(XX) \
    XX(ERROR_SYSTEM_PACKET_INVALID         , 1019, "RtmpInvalidPacket", "Got invalid RTMP packet to codec") \
    XX(ERROR_SYSTEM_CONFIG_INVALID         , 1023, "ConfigInvalid", "Configuration is invalid") \
    XX(ERROR_SYSTEM_FILE_OPENE             , 1042, "FileOpen", "Failed to open file") \
    XX(ERROR_SYSTEM_FILE_READ              , 1044, "FileRead", "Failed to read data from file")

/**************************************************/
/* RTMP protocol error. */
#define RK_ERRNO_MAP_RTMP(XX) \
    XX(ERROR_RTMP_AMF0_DECODE              , 2003, "Amf0Decode", "Decode AMF0 message failed") \
    XX(ERROR_RTMP_AMF0_INVALID             , 2004, "Amf0Invalid", "Invalid AMF0 message type") \
    XX(ERROR_RTMP_MESSAGE_DECODE           , 2007, "RtmpDecode", "Failed to decode RTMP packet") \
    XX(ERROR_RTMP_MESSAGE_ENCODE           , 2008, "RtmpEncode", "Failed to encode RTMP packet") \
    XX(ERROR_RTMP_AMF0_ENCODE              , 2009, "Amf0Encode", "Encode AMF0 message failed") \
    XX(ERROR_RTMP_CHUNK_SIZE               , 2010, "RtmpChunkSize", "Invalid RTMP chunk size") \
    XX(ERROR_RTMP_NO_REQUEST               , 2017, "RtmpNoRequest", "Invalid RTMP response for no request found") \
    XX(ERROR_RTMP_MESSAGE_TYPE             , 2051, "RtmpMessageType", "Unsupported RTMP message type to codec") \
    XX(ERROR_RTMP_TRANSACTION_EXISTS       , 2052, "RtmpTransactionExists", "RTMP transaction id is already pending") \
    XX(ERROR_RTMP_PUBLISH_TYPE             , 2053, "RtmpPublishType", "Invalid RTMP publish type")

// For human readable error generation. Generate integer error code.
#define RK_ERRNO_GEN(n, v, m, s) n = v,
enum RkErrorCode {
    ERROR_SUCCESS = 0,
    RK_ERRNO_MAP_SYSTEM(RK_ERRNO_GEN)
    RK_ERRNO_MAP_RTMP(RK_ERRNO_GEN)
};
#undef RK_ERRNO_GEN

// Whether the error is a failure to write a message to bytes.
extern bool rk_is_serialization_error(rk_error_t err);
// Whether the error is a failure to parse a message from bytes,
// for truncated input or invalid marker or discriminant.
extern bool rk_is_deserialization_error(rk_error_t err);
// Whether the peer replied to a transaction we never asked, or replied twice.
extern bool rk_is_unknown_transaction(rk_error_t err);

// The complex error carries code, message, and where it is created or wrapped,
// the wrapped errors form a chain, see https://github.com/ossrs/srs/issues/913
class RkCplxError
{
private:
    int code;
    RkCplxError* wrapped;
    std::string msg;

    std::string func;
    std::string file;
    int line;

    RkContextId cid;
    int rerrno;

    std::string desc;
    std::string _summary;
private:
    RkCplxError();
public:
    virtual ~RkCplxError();
private:
    virtual std::string description();
    virtual std::string summary();
    // The "code=2007(RtmpDecode)" and messages of the chain.
    void write_messages(std::string& s, bool long_code);
    static RkCplxError* build(const char* func, const char* file, int line, int code, RkCplxError* wrapped, const char* fmt, va_list ap);
public:
    static RkCplxError* create(const char* func, const char* file, int line, int code, const char* fmt, ...);
    static RkCplxError* wrap(const char* func, const char* file, int line, RkCplxError* err, const char* fmt, ...);
    static std::string description(RkCplxError* err);
    static std::string summary(RkCplxError* err);
    static int error_code(RkCplxError* err);
    static std::string error_code_str(RkCplxError* err);
    static std::string error_code_longstr(RkCplxError* err);
};

// Error helpers, should use these functions to new or wrap an error.
#define rk_success 0
#define rk_error_new(ret, fmt, ...) RkCplxError::create(__FUNCTION__, __FILE__, __LINE__, ret, fmt, ##__VA_ARGS__)
#define rk_error_wrap(err, fmt, ...) RkCplxError::wrap(__FUNCTION__, __FILE__, __LINE__, err, fmt, ##__VA_ARGS__)
#define rk_error_desc(err) RkCplxError::description(err)
#define rk_error_summary(err) RkCplxError::summary(err)
#define rk_error_code(err) RkCplxError::error_code(err)
#define rk_error_code_str(err) RkCplxError::error_code_str(err)
#define rk_error_code_longstr(err) RkCplxError::error_code_longstr(err)

#endif
