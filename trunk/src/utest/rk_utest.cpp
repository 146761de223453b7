//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_utest.hpp>

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>
#include <rk_protocol_log.hpp>
#include <rk_protocol_amf0.hpp>

#include <string>
using namespace std;

// Temporary disk config.
std::string _rk_tmp_file_prefix = "/tmp/rtmpkit-utest-";

// kernel module.
IRkLog* _rk_log = NULL;
IRkContext* _rk_context = NULL;

// Initialize global settings.
rk_error_t prepare_main() {
    rk_error_t err = rk_success;

    rk_freep(_rk_log);
    _rk_log = new MockEmptyLog(RkLogLevelDisabled);

    rk_freep(_rk_context);
    _rk_context = new RkThreadContext();

    return err;
}

// We could do something in the main of utest.
// Copy from gtest-1.6.0/src/gtest_main.cc
GTEST_API_ int main(int argc, char **argv) {
    rk_error_t err = rk_success;

    if ((err = prepare_main()) != rk_success) {
        fprintf(stderr, "Failed, %s\n", rk_error_desc(err).c_str());

        int ret = rk_error_code(err);
        rk_freep(err);
        return ret;
    }

    testing::InitGoogleTest(&argc, argv);
    int r0 = RUN_ALL_TESTS();

    rk_freep(_rk_log);
    rk_freep(_rk_context);

    return r0;
}

MockEmptyLog::MockEmptyLog(RkLogLevel l) : RkConsoleLog(l, false)
{
}

MockEmptyLog::~MockEmptyLog()
{
}

void MockEmptyLog::log(RkLogLevel /*level*/, const char* /*tag*/, const RkContextId& /*context_id*/, const char* /*fmt*/, va_list /*args*/)
{
}

RkAmf0Any* rk_utest_find_property(RkAmf0Map* props, std::string key)
{
    for (int i = 0; props && i < props->count(); i++) {
        if (props->key_at(i) == key) {
            return props->value_at(i);
        }
    }
    return NULL;
}

// basic test and samples.
VOID TEST(SampleTest, FastSampleInt64Test)
{
    EXPECT_EQ(1, (int)sizeof(int8_t));
    EXPECT_EQ(2, (int)sizeof(int16_t));
    EXPECT_EQ(4, (int)sizeof(int32_t));
    EXPECT_EQ(8, (int)sizeof(int64_t));
}

VOID TEST(SampleTest, ContextIdTest)
{
    RkContextId cid = _rk_context->generate_id();
    EXPECT_FALSE(cid.empty());

    RkContextId cid2 = _rk_context->generate_id();
    EXPECT_TRUE(cid.compare(cid2) != 0);

    if (true) {
        RkContextRestore(_rk_context->get_id());
        _rk_context->set_id(cid);
        EXPECT_TRUE(_rk_context->get_id().compare(cid) == 0);
    }
}
