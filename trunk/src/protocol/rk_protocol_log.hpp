//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_PROTOCOL_LOG_HPP
#define RK_PROTOCOL_LOG_HPP

#include <rk_core.hpp>

#include <pthread.h>

#include <map>
#include <string>

#include <rk_kernel_log.hpp>

// The thread context, get_id will get the id of current OS thread,
// which identify the session driving the protocol core.
class RkThreadContext : public IRkContext
{
private:
    pthread_mutex_t lock;
    std::map<pthread_t, RkContextId> cache;
public:
    RkThreadContext();
    virtual ~RkThreadContext();
public:
    virtual RkContextId generate_id();
    virtual const RkContextId& get_id();
    virtual const RkContextId& set_id(const RkContextId& v);
};

// The context restore stores the context and restore it when done.
// Usage:
//      RkContextRestore(_rk_context->get_id());
#define RkContextRestore(cid) impl_RkContextRestore _context_restore_instance(cid)
class impl_RkContextRestore
{
private:
    RkContextId cid_;
public:
    impl_RkContextRestore(RkContextId cid);
    virtual ~impl_RkContextRestore();
};

// The basic console log, which write log to console.
class RkConsoleLog : public IRkLog
{
private:
    RkLogLevel level_;
    bool utc;
private:
    char* buffer;
public:
    RkConsoleLog(RkLogLevel l, bool u);
    virtual ~RkConsoleLog();
public:
    // Change the level, for example, by the log_level of config.
    virtual void set_level(RkLogLevel l);
    // Whether use utc time in log header.
    virtual void set_utc(bool u);
// Interface IRkLog
public:
    virtual rk_error_t initialize();
    virtual void log(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, va_list args);
};

// Generate the log header.
// @param dangerous Whether log is warning or error, log the errno if true.
// @param utc Whether use UTC time format in the log header.
// @param psize Output the actual header size.
// @remark It's a internal API.
bool rk_log_header(char* buffer, int size, bool utc, bool dangerous, const char* tag, RkContextId cid, const char* level, int* psize);

#endif
