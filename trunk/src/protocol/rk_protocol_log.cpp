//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_protocol_log.hpp>

#include <stdarg.h>
#include <sys/time.h>
#include <unistd.h>
#include <sstream>
using namespace std;

#include <rk_kernel_error.hpp>
#include <rk_kernel_utility.hpp>

#define RK_BASIC_LOG_SIZE 8192

RkThreadContext::RkThreadContext()
{
    pthread_mutex_init(&lock, NULL);
}

RkThreadContext::~RkThreadContext()
{
    pthread_mutex_destroy(&lock);
}

RkContextId RkThreadContext::generate_id()
{
    RkContextId cid;
    return cid.set_value(rk_random_str(8));
}

const RkContextId& RkThreadContext::get_id()
{
    pthread_mutex_lock(&lock);
    // The std::map never invalidate the reference of element when insert.
    RkContextId& cid = cache[pthread_self()];
    pthread_mutex_unlock(&lock);

    return cid;
}

const RkContextId& RkThreadContext::set_id(const RkContextId& v)
{
    pthread_mutex_lock(&lock);
    RkContextId& cid = cache[pthread_self()];
    cid = v;
    pthread_mutex_unlock(&lock);

    return v;
}

impl_RkContextRestore::impl_RkContextRestore(RkContextId cid)
{
    cid_ = cid;
}

impl_RkContextRestore::~impl_RkContextRestore()
{
    _rk_context->set_id(cid_);
}

RkConsoleLog::RkConsoleLog(RkLogLevel l, bool u)
{
    level_ = l;
    utc = u;

    buffer = new char[RK_BASIC_LOG_SIZE];
}

RkConsoleLog::~RkConsoleLog()
{
    rk_freepa(buffer);
}

void RkConsoleLog::set_level(RkLogLevel l)
{
    level_ = l;
}

void RkConsoleLog::set_utc(bool u)
{
    utc = u;
}

rk_error_t RkConsoleLog::initialize()
{
    return rk_success;
}

void RkConsoleLog::log(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, va_list args)
{
    if (level < level_ || level >= RkLogLevelDisabled) {
        return;
    }

    int size = 0;
    if (!rk_log_header(buffer, RK_BASIC_LOG_SIZE, utc, level >= RkLogLevelWarn, tag, context_id, rk_log_level_strings[level], &size)) {
        return;
    }

    // Something not expected, drop the log.
    int r0 = vsnprintf(buffer + size, RK_BASIC_LOG_SIZE - size, fmt, args);
    if (r0 <= 0 || r0 >= RK_BASIC_LOG_SIZE - size) {
        return;
    }
    size += r0;

    // Add errno and strerror() if error.
    if (level == RkLogLevelError && errno != 0) {
        r0 = snprintf(buffer + size, RK_BASIC_LOG_SIZE - size, "(%s)", strerror(errno));

        // Something not expected, drop the log.
        if (r0 <= 0 || r0 >= RK_BASIC_LOG_SIZE - size) {
            return;
        }
        size += r0;
    }

    if (level >= RkLogLevelWarn) {
        fprintf(stderr, "%s\n", buffer);
    } else {
        fprintf(stdout, "%s\n", buffer);
    }
}

bool rk_log_header(char* buffer, int size, bool utc, bool dangerous, const char* tag, RkContextId cid, const char* level, int* psize)
{
    int eno = errno;

    // clock time
    timeval tv;
    if (gettimeofday(&tv, NULL) == -1) {
        return false;
    }

    // to calendar time
    struct tm now;
    // Each of these functions returns NULL in case an error was detected. @see https://linux.die.net/man/3/localtime_r
    if (utc) {
        if (gmtime_r(&tv.tv_sec, &now) == NULL) {
            return false;
        }
    } else {
        if (localtime_r(&tv.tv_sec, &now) == NULL) {
            return false;
        }
    }

    // The tag and errno are optional, only errno for warn and error.
    stringstream ss;
    if (dangerous) {
        ss << "[" << eno << "]";
    }
    if (tag) {
        ss << "[" << tag << "]";
    }
    string extra = ss.str();

    int written = snprintf(buffer, size,
        "[%d-%02d-%02d %02d:%02d:%02d.%03d][%s][%d][%s]%s ",
        1900 + now.tm_year, 1 + now.tm_mon, now.tm_mday, now.tm_hour, now.tm_min, now.tm_sec, (int)(tv.tv_usec / 1000),
        level, getpid(), cid.c_str(), extra.c_str());

    // Exceed the size, ignore this log.
    if (written <= 0 || written >= size) {
        return false;
    }

    // write the header size.
    *psize = written;

    return true;
}
