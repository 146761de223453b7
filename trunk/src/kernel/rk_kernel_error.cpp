//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_kernel_error.hpp>

#include <rk_kernel_log.hpp>
#include <rk_kernel_utility.hpp>

#include <errno.h>
#include <stdio.h>
#include <unistd.h>
#include <sstream>
using namespace std;

// The max size of error message, the message is truncated if exceed.
#define RK_ERROR_MSG_MAX 4096

bool rk_is_serialization_error(rk_error_t err)
{
    switch (rk_error_code(err)) {
        case ERROR_RTMP_MESSAGE_ENCODE:
        case ERROR_RTMP_AMF0_ENCODE:
            return true;
        default:
            return false;
    }
}

bool rk_is_deserialization_error(rk_error_t err)
{
    switch (rk_error_code(err)) {
        case ERROR_RTMP_MESSAGE_DECODE:
        case ERROR_RTMP_AMF0_DECODE:
        case ERROR_RTMP_AMF0_INVALID:
            return true;
        default:
            return false;
    }
}

bool rk_is_unknown_transaction(rk_error_t err)
{
    return rk_error_code(err) == ERROR_RTMP_NO_REQUEST;
}

RkCplxError::RkCplxError()
{
    code = ERROR_SUCCESS;
    wrapped = NULL;
    line = 0;
    rerrno = 0;
}

RkCplxError::~RkCplxError()
{
    rk_freep(wrapped);
}

void RkCplxError::write_messages(string& s, bool long_code)
{
    stringstream ss;
    ss << "code=" << code;

    string name = error_code_str(this);
    if (!name.empty()) {
        ss << "(" << name << ")";
    }

    string longstr = long_code ? error_code_longstr(this) : "";
    if (!longstr.empty()) {
        ss << "(" << longstr << ")";
    }

    for (RkCplxError* p = this; p; p = p->wrapped) {
        ss << " : " << p->msg;
    }

    s = ss.str();
}

string RkCplxError::description()
{
    if (!desc.empty()) {
        return desc;
    }

    stringstream ss;

    string messages;
    write_messages(messages, true);
    ss << messages;

    // The stack of wrapping, the outermost first.
    for (RkCplxError* p = this; p; p = p->wrapped) {
        ss << endl << "thread [" << getpid() << "][" << p->cid.c_str() << "]: "
            << p->func << "() [" << p->file << ":" << p->line << "]"
            << "[errno=" << p->rerrno << "]";
    }

    desc = ss.str();
    return desc;
}

string RkCplxError::summary()
{
    if (_summary.empty()) {
        write_messages(_summary, false);
    }
    return _summary;
}

RkCplxError* RkCplxError::build(const char* func, const char* file, int line, int code, RkCplxError* wrapped, const char* fmt, va_list ap)
{
    // Keep the errno before formatting.
    int rerrno = (int)errno;

    char buf[RK_ERROR_MSG_MAX];
    int nn = vsnprintf(buf, sizeof(buf), fmt, ap);

    RkCplxError* err = new RkCplxError();

    err->func = func;
    err->file = file;
    err->line = line;
    err->code = code;
    err->rerrno = rerrno;
    err->wrapped = wrapped;
    if (nn > 0) {
        err->msg = string(buf, rk_min(nn, (int)sizeof(buf) - 1));
    }
    if (_rk_context) {
        err->cid = _rk_context->get_id();
    }

    return err;
}

RkCplxError* RkCplxError::create(const char* func, const char* file, int line, int code, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    RkCplxError* err = build(func, file, line, code, NULL, fmt, ap);
    va_end(ap);

    return err;
}

RkCplxError* RkCplxError::wrap(const char* func, const char* file, int line, RkCplxError* v, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    RkCplxError* err = build(func, file, line, error_code(v), v, fmt, ap);
    va_end(ap);

    return err;
}

string RkCplxError::description(RkCplxError* err)
{
    return err ? err->description() : "Success";
}

string RkCplxError::summary(RkCplxError* err)
{
    return err ? err->summary() : "Success";
}

int RkCplxError::error_code(RkCplxError* err)
{
    return err ? err->code : ERROR_SUCCESS;
}

struct RkErrorCodeInfo
{
    int code;
    const char* name;
    const char* description;
};

#define RK_ERRNO_INFO_GEN(n, v, m, s) {v, m, s},
static const RkErrorCodeInfo _rk_error_codes[] = {
    {ERROR_SUCCESS, "Success", "Success"},
    RK_ERRNO_MAP_SYSTEM(RK_ERRNO_INFO_GEN)
    RK_ERRNO_MAP_RTMP(RK_ERRNO_INFO_GEN)
};
#undef RK_ERRNO_INFO_GEN

// Find the info of code, NULL if unknown.
static const RkErrorCodeInfo* rk_error_code_info(int code)
{
    int nn = (int)(sizeof(_rk_error_codes) / sizeof(_rk_error_codes[0]));
    for (int i = 0; i < nn; i++) {
        if (_rk_error_codes[i].code == code) {
            return &_rk_error_codes[i];
        }
    }
    return NULL;
}

string RkCplxError::error_code_str(RkCplxError* err)
{
    const RkErrorCodeInfo* info = rk_error_code_info(error_code(err));
    return info ? info->name : "";
}

string RkCplxError::error_code_longstr(RkCplxError* err)
{
    const RkErrorCodeInfo* info = rk_error_code_info(error_code(err));
    return info ? info->description : "";
}
