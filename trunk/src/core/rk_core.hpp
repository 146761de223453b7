//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_CORE_HPP
#define RK_CORE_HPP

// The version config.
#define VERSION_MAJOR       1
#define VERSION_MINOR       0
#define VERSION_REVISION    0

// The project informations.
#define RTMP_SIG_RK_KEY "rtmpkit"
#define RTMP_SIG_RK_CODE "Abort"
#define RTMP_SIG_RK_URL "https://github.com/rtmpkit/rtmpkit"
#define RTMP_SIG_RK_VERSION RK_XSTR(VERSION_MAJOR) "." RK_XSTR(VERSION_MINOR) "." RK_XSTR(VERSION_REVISION)
#define RTMP_SIG_RK_SERVER RTMP_SIG_RK_KEY "/" RTMP_SIG_RK_VERSION "(" RTMP_SIG_RK_CODE ")"

// To convert macro values to string.
// @see https://gcc.gnu.org/onlinedocs/cpp/Stringification.html#Stringification
#define RK_XSTR(v) RK_INTERNAL_STR(v)
#define RK_INTERNAL_STR(v) #v

// For int64_t print using PRId64 format.
#ifndef __STDC_FORMAT_MACROS
    #define __STDC_FORMAT_MACROS
#endif

#include <inttypes.h>

#include <assert.h>
#define rk_assert(expression) assert(expression)

#include <stddef.h>
#include <sys/types.h>

#include <string>

// To free the p and set to NULL.
// @remark The p must be a pointer T*.
#define rk_freep(p) \
    delete p; \
    p = NULL; \
    (void)0
// Please use the freepa(T[]) to free an array, otherwise the behavior is undefined.
#define rk_freepa(pa) \
    delete[] pa; \
    pa = NULL; \
    (void)0

// Error predefined for all modules.
class RkCplxError;
typedef RkCplxError* rk_error_t;

// The context ID, it default to a string object, we can also use other objects.
// @remark The contxt id MUST be a normal C++ object, which support copy/assign,
//      and must be compare to another context id.
class RkContextId
{
private:
    std::string v_;
public:
    RkContextId();
    RkContextId(const RkContextId& cp);
    RkContextId& operator=(const RkContextId& cp);
    virtual ~RkContextId();
public:
    const char* c_str() const;
    bool empty() const;
    // Compare the two context id. @see http://www.cplusplus.com/reference/string/string/compare/
    //      0	They compare equal.
    //      <0	Either the value of the first character that does not match is lower in the compared string, or all compared characters match but the compared string is shorter.
    //      >0	Either the value of the first character that does not match is greater in the compared string, or all compared characters match but the compared string is longer.
    int compare(const RkContextId& to) const;
    // Set the value of context id.
    RkContextId& set_value(const std::string& v);
};

#endif
