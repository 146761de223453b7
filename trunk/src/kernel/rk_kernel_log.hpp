//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_LOG_HPP
#define RK_KERNEL_LOG_HPP

#include <rk_core.hpp>

#include <stdio.h>

#include <errno.h>
#include <string.h>
#include <string>
#include <stdarg.h>

// The log level, see https://github.com/apache/logging-log4j2/blob/release-2.x/log4j-api/src/main/java/org/apache/logging/log4j/Level.java
// Please note that the enum name might not be the string, to keep compatible with previous definition.
enum RkLogLevel
{
    RkLogLevelForbidden = 0x00,

    // Only used for very verbose debug, generally,
    // we compile without this level for high performance.
    RkLogLevelVerbose = 0x01,
    RkLogLevelInfo = 0x02,
    RkLogLevelTrace = 0x04,
    RkLogLevelWarn = 0x08,
    RkLogLevelError = 0x10,

    RkLogLevelDisabled = 0x20,
};

// Get the level in string.
extern const char* rk_log_level_strings[];

// Parse the level in string, for example, "trace" or "warn", default to trace.
extern RkLogLevel rk_get_log_level(std::string level);

// The log interface provides method to write log.
// but we provides some macro, which enable us to disable the log when compile.
class IRkLog
{
public:
    IRkLog();
    virtual ~IRkLog();
public:
    // Initialize log utilities.
    virtual rk_error_t initialize() = 0;
public:
    // Write a application level log. All parameters are required except the tag.
    virtual void log(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, va_list args) = 0;
};

// The logic context, for example, a RTMP connection.
// We can grep the context id to identify the logic unit, for debugging.
// For example:
//      RkContextId cid = _rk_context->get_id(); // Get current context id.
//      RkContextId new_cid = _rk_context->generate_id(); // Generate a new context id.
//      RkContextId old_cid = _rk_context->set_id(new_cid); // Change the context id.
class IRkContext
{
public:
    IRkContext();
    virtual ~IRkContext();
public:
    // Generate a new context id.
    // @remark We do not set to current thread, user should do this.
    virtual RkContextId generate_id() = 0;
    // Get the context id of current thread.
    virtual const RkContextId& get_id() = 0;
    // Set the context id of current thread.
    // @return the current context id.
    virtual const RkContextId& set_id(const RkContextId& v) = 0;
};

// @global User must implements the LogContext and define a global instance.
extern IRkContext* _rk_context;

// @global User must provides a log object
extern IRkLog* _rk_log;

// Global log function implementation. Please use helper macros, for example, rk_trace or rk_error.
extern void rk_logger_impl(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, ...);

// The context id when no context is installed, for example, in a library without main.
extern const RkContextId& rk_get_context_id();

// Log style.
// Use __FUNCTION__ to print c method
// Use __PRETTY_FUNCTION__ to print c++ class:method
#define rk_verbose(msg, ...) rk_logger_impl(RkLogLevelVerbose, NULL, rk_get_context_id(), msg, ##__VA_ARGS__)
#define rk_info(msg, ...) rk_logger_impl(RkLogLevelInfo, NULL, rk_get_context_id(), msg, ##__VA_ARGS__)
#define rk_trace(msg, ...) rk_logger_impl(RkLogLevelTrace, NULL, rk_get_context_id(), msg, ##__VA_ARGS__)
#define rk_warn(msg, ...) rk_logger_impl(RkLogLevelWarn, NULL, rk_get_context_id(), msg, ##__VA_ARGS__)
#define rk_error(msg, ...) rk_logger_impl(RkLogLevelError, NULL, rk_get_context_id(), msg, ##__VA_ARGS__)

#ifndef RK_VERBOSE
    #undef rk_verbose
    #define rk_verbose(msg, ...) (void)0
#endif
#ifndef RK_INFO
    #undef rk_info
    #define rk_info(msg, ...) (void)0
#endif
#ifndef RK_TRACE
    #undef rk_trace
    #define rk_trace(msg, ...) (void)0
#endif

#endif
