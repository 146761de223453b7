//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_kernel_log.hpp>

#include <stdarg.h>

using namespace std;

// Go log level: Info, Warning, Error, Fatal, see https://github.com/golang/glog/blob/master/glog.go#L17
// Java log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, see https://stackoverflow.com/a/2031209/17679565
//      or https://github.com/apache/logging-log4j2/blob/release-2.x/log4j-api/src/main/java/org/apache/logging/log4j/Level.java#L29
const char* rk_log_level_strings[] = {
#ifdef RK_LOG_LEVEL_V2
        // The v2 log level specs by log4j.
        "FORB",     "TRACE",     "DEBUG",    NULL,   "INFO",    NULL, NULL, NULL,
        "WARN",     NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        "ERROR",    NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        NULL,       NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        "OFF",
#else
        "Forb",     "Verb",     "Debug",    NULL,   "Trace",    NULL, NULL, NULL,
        "Warn",     NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        "Error",    NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        NULL,       NULL,       NULL,       NULL,   NULL,       NULL, NULL, NULL,
        "Off",
#endif
};

RkLogLevel rk_get_log_level(string level)
{
    if ("verbose" == level) {
        return RkLogLevelVerbose;
    } else if ("info" == level) {
        return RkLogLevelInfo;
    } else if ("trace" == level) {
        return RkLogLevelTrace;
    } else if ("warn" == level) {
        return RkLogLevelWarn;
    } else if ("error" == level) {
        return RkLogLevelError;
    } else if ("off" == level) {
        return RkLogLevelDisabled;
    } else {
        return RkLogLevelTrace;
    }
}

IRkLog::IRkLog()
{
}

IRkLog::~IRkLog()
{
}

IRkContext::IRkContext()
{
}

IRkContext::~IRkContext()
{
}

static RkContextId _rk_context_none;

const RkContextId& rk_get_context_id()
{
    if (!_rk_context) {
        return _rk_context_none;
    }
    return _rk_context->get_id();
}

void rk_logger_impl(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, ...)
{
    if (!_rk_log) return;

    va_list args;
    va_start(args, fmt);
    _rk_log->log(level, tag, context_id, fmt, args);
    va_end(args);
}
