//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_UTEST_PUBLIC_SHARED_HPP
#define RK_UTEST_PUBLIC_SHARED_HPP

// Before define the private/protected, we must include some system header files.
// Or it may fail with:
//      redeclared with different access struct __xfer_bufptrs
// @see https://stackoverflow.com/questions/47839718/sstream-redeclared-with-public-access-compiler-error
#include "gtest/gtest.h"

#include <map>
#include <vector>
#include <string>
#include <sstream>
#include <pthread.h>

// Public all private and protected members.
#define private public
#define protected public

/*
#include <rk_utest.hpp>
*/
#include <rk_core.hpp>

#include <string>
using namespace std;

#include <rk_kernel_error.hpp>
#include <rk_kernel_log.hpp>
#include <rk_protocol_log.hpp>

// we add an empty macro for upp to show the smart tips.
#define VOID

// Temporary disk config.
extern std::string _rk_tmp_file_prefix;

// For errors.
// @remark we directly delete the err, because we allow user to append message if fail.
#define HELPER_EXPECT_SUCCESS(x) \
    if ((err = x) != rk_success) fprintf(stderr, "err %s", rk_error_desc(err).c_str()); \
    if (err != rk_success) delete err; \
    EXPECT_TRUE(rk_success == err)
#define HELPER_EXPECT_FAILED(x) \
    if ((err = x) != rk_success) delete err; \
    EXPECT_TRUE(rk_success != err)

// For errors, assert.
// @remark we directly delete the err, because we allow user to append message if fail.
#define HELPER_ASSERT_SUCCESS(x) \
    if ((err = x) != rk_success) fprintf(stderr, "err %s", rk_error_desc(err).c_str()); \
    if (err != rk_success) delete err; \
    ASSERT_TRUE(rk_success == err)

// For errors with code, the err is freed after checking.
#define HELPER_EXPECT_FAILED_CODE(x, c) \
    err = x; \
    EXPECT_TRUE(rk_success != err); \
    EXPECT_EQ((int)(c), rk_error_code(err)); \
    rk_freep(err)

class RkAmf0Any;
class RkAmf0Map;
// Find the property of AMF0 object or ECMA array, NULL if not found.
RkAmf0Any* rk_utest_find_property(RkAmf0Map* props, std::string key);

// The log to drop all messages.
class MockEmptyLog : public RkConsoleLog
{
public:
    MockEmptyLog(RkLogLevel l);
    virtual ~MockEmptyLog();
public:
    virtual void log(RkLogLevel level, const char* tag, const RkContextId& context_id, const char* fmt, va_list args);
};

#endif
