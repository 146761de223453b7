//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//
#include <rk_utest.hpp>

using namespace std;

#include <rk_kernel_error.hpp>
#include <rk_kernel_buffer.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_kernel_file.hpp>

#include <math.h>
#include <float.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>

// The code not defined by rtmpkit.
#define ERROR_USER_DEFINED 9000

VOID TEST(KernelBufferTest, DefaultObject)
{
    char buf[16];
    RkBuffer b(buf, sizeof(buf));

    EXPECT_EQ(16, b.size());
    EXPECT_EQ(0, b.pos());
    EXPECT_EQ(16, b.left());
    EXPECT_FALSE(b.empty());
    EXPECT_TRUE(b.require(16));
    EXPECT_FALSE(b.require(17));
    EXPECT_FALSE(b.require(-1));

    b.skip(16);
    EXPECT_TRUE(b.empty());
    EXPECT_TRUE(b.require(0));
    EXPECT_FALSE(b.require(1));

    b.skip(-16);
    EXPECT_EQ(0, b.pos());
}

VOID TEST(KernelBufferTest, ReadBigEndian)
{
    uint8_t data[] = {
        0x01,
        0x01, 0x02,
        0x01, 0x02, 0x03,
        0x01, 0x02, 0x03, 0x04,
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
    };
    RkBuffer b((char*)data, sizeof(data));

    EXPECT_EQ(0x01, b.read_1bytes());
    EXPECT_EQ(0x0102, b.read_2bytes());
    EXPECT_EQ(0x010203, b.read_3bytes());
    EXPECT_EQ(0x01020304, b.read_4bytes());
    EXPECT_EQ(0x0102030405060708LL, b.read_8bytes());
    EXPECT_TRUE(b.empty());
}

VOID TEST(KernelBufferTest, WriteBigEndian)
{
    char data[18];
    RkBuffer b(data, sizeof(data));

    b.write_1bytes(0x01);
    b.write_2bytes(0x0102);
    b.write_3bytes(0x010203);
    b.write_4bytes(0x01020304);
    b.write_8bytes(0x0102030405060708LL);
    EXPECT_TRUE(b.empty());

    EXPECT_STREQ("01 01 02 01 02 03 01 02 03 04 01 02 03 04 05 06 07 08", rk_string_dumps_hex(data, sizeof(data)).c_str());
}

VOID TEST(KernelBufferTest, ReadWriteHighBits)
{
    char data[4];
    RkBuffer b(data, sizeof(data));

    b.write_4bytes((int32_t)0xfffffffe);
    EXPECT_STREQ("ff ff ff fe", rk_string_dumps_hex(data, 4).c_str());

    b.skip(-4);
    EXPECT_EQ(0xfffffffe, (uint32_t)b.read_4bytes());
}

VOID TEST(KernelBufferTest, ReadWriteString)
{
    char data[8];
    RkBuffer b(data, sizeof(data));

    b.write_string("rtmp");
    b.write_string("");
    EXPECT_EQ(4, b.pos());
    b.write_string("kit!");
    EXPECT_TRUE(b.empty());

    b.skip(-8);
    EXPECT_STREQ("rtmp", b.read_string(4).c_str());
    EXPECT_STREQ("", b.read_string(0).c_str());
    EXPECT_STREQ("kit!", b.read_string(4).c_str());
}

VOID TEST(KernelBufferTest, HeadAndLeft)
{
    char data[] = {0x02, 0x00, 0x03};
    RkBuffer b(data, sizeof(data));

    // Peek without moving.
    EXPECT_EQ(0x02, *b.head());
    EXPECT_EQ(0, b.pos());

    b.skip(1);
    EXPECT_EQ(data + 1, b.head());
    EXPECT_EQ(2, b.left());
    EXPECT_EQ(3, b.read_2bytes());
    EXPECT_EQ(0, b.left());

    // No bytes.
    RkBuffer empty(NULL, 0);
    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(empty.require(1));
}

VOID TEST(KernelErrorTest, WrapKeepCode)
{
    rk_error_t err = rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "abort requires 4 bytes");
    err = rk_error_wrap(err, "decode");

    EXPECT_EQ(ERROR_RTMP_MESSAGE_DECODE, rk_error_code(err));
    EXPECT_TRUE(rk_is_deserialization_error(err));
    EXPECT_FALSE(rk_is_serialization_error(err));
    EXPECT_FALSE(rk_is_unknown_transaction(err));

    string desc = rk_error_desc(err);
    EXPECT_TRUE(desc.find("abort requires 4 bytes") != string::npos);
    EXPECT_TRUE(desc.find("decode") != string::npos);

    EXPECT_STREQ("RtmpDecode", rk_error_code_str(err).c_str());
    EXPECT_STREQ("Failed to decode RTMP packet", rk_error_code_longstr(err).c_str());
    EXPECT_STREQ("code=2007(RtmpDecode) : decode : abort requires 4 bytes", rk_error_summary(err).c_str());

    rk_freep(err);
}

VOID TEST(KernelErrorTest, Classifiers)
{
    rk_error_t err = rk_success;

    EXPECT_EQ(ERROR_SUCCESS, rk_error_code(err));
    EXPECT_STREQ("Success", rk_error_summary(err).c_str());
    EXPECT_FALSE(rk_is_deserialization_error(err));

    err = rk_error_new(ERROR_RTMP_AMF0_ENCODE, "string too long");
    EXPECT_TRUE(rk_is_serialization_error(err));
    rk_freep(err);

    err = rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "no space");
    EXPECT_TRUE(rk_is_serialization_error(err));
    rk_freep(err);

    err = rk_error_new(ERROR_RTMP_AMF0_INVALID, "marker");
    EXPECT_TRUE(rk_is_deserialization_error(err));
    rk_freep(err);

    err = rk_error_new(ERROR_RTMP_AMF0_DECODE, "number");
    EXPECT_TRUE(rk_is_deserialization_error(err));
    rk_freep(err);

    err = rk_error_new(ERROR_RTMP_NO_REQUEST, "tid=7");
    EXPECT_TRUE(rk_is_unknown_transaction(err));
    rk_freep(err);
}

VOID TEST(KernelErrorTest, DescriptionStack)
{
    rk_error_t err = rk_error_new(ERROR_RTMP_NO_REQUEST, "tid=%d", 7);
    err = rk_error_wrap(err, "take");

    // One line of messages, then one line for each wrapping.
    string desc = rk_error_desc(err);
    EXPECT_EQ(0, (int)desc.find("code=2017(RtmpNoRequest)(Invalid RTMP response for no request found) : take : tid=7\n"));
    EXPECT_EQ(2, (int)std::count(desc.begin(), desc.end(), '\n'));
    EXPECT_TRUE(desc.find("rk_utest_kernel.cpp:") != string::npos);

    rk_freep(err);

    // The unknown code has no name.
    err = rk_error_new(ERROR_USER_DEFINED, "user");
    EXPECT_STREQ("", rk_error_code_str(err).c_str());
    EXPECT_STREQ("code=9000 : user", rk_error_summary(err).c_str());
    rk_freep(err);

    // The message is truncated if too long.
    string msg(8192, 'x');
    err = rk_error_new(ERROR_RTMP_AMF0_DECODE, "%s", msg.c_str());
    EXPECT_EQ(4095 + (int)strlen("code=2003(Amf0Decode) : "), (int)rk_error_summary(err).length());
    rk_freep(err);

    EXPECT_STREQ("Success", rk_error_desc(rk_success).c_str());
}

VOID TEST(KernelUtilityTest, StringUtilities)
{
    EXPECT_STREQ("rtmp_chunk_size", rk_string_replace("rtmp.chunk.size", ".", "_").c_str());
    EXPECT_STREQ("abc", rk_string_replace("abc", "", "x").c_str());

    EXPECT_STREQ("0000020b", rk_string_remove("00 00 02 0b", " ").c_str());

    EXPECT_TRUE(rk_string_starts_with("@setDataFrame", "@"));
    EXPECT_FALSE(rk_string_starts_with("onMetaData", "@"));

    EXPECT_STREQ("RTMP.CHUNK_SIZE", rk_string_to_upper("rtmp.chunk_size").c_str());

    EXPECT_STREQ("29.97", rk_float2str(29.97).c_str());
}

VOID TEST(KernelUtilityTest, RandomString)
{
    string s = rk_random_str(8);
    EXPECT_EQ(8, (int)s.length());
    for (int i = 0; i < (int)s.length(); i++) {
        char ch = s.at(i);
        EXPECT_TRUE((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z'));
    }
}

VOID TEST(KernelUtilityTest, GetEnv)
{
    setenv("RK_RTMP_UTEST_KEY", "60000", 1);
    EXPECT_STREQ("60000", rk_getenv("rtmp.utest_key").c_str());
    EXPECT_STREQ("60000", rk_getenv("$RK_RTMP_UTEST_KEY").c_str());
    unsetenv("RK_RTMP_UTEST_KEY");

    EXPECT_TRUE(rk_getenv("rtmp.utest_key").empty());
    EXPECT_TRUE(rk_getenv("$").empty());
}

VOID TEST(KernelUtilityTest, HexToData)
{
    uint8_t data[8];

    EXPECT_EQ(4, rk_hex_to_data(data, "0000020B", 8));
    EXPECT_EQ(0x00, data[0]);
    EXPECT_EQ(0x02, data[2]);
    EXPECT_EQ(0x0b, data[3]);

    EXPECT_EQ(2, rk_hex_to_data(data, "fFaA", 4));
    EXPECT_EQ(0xff, data[0]);
    EXPECT_EQ(0xaa, data[1]);

    EXPECT_EQ(-1, rk_hex_to_data(data, NULL, 8));
    EXPECT_EQ(-1, rk_hex_to_data(data, "000", 3));
    EXPECT_EQ(-1, rk_hex_to_data(data, "0g", 2));
}

VOID TEST(KernelUtilityTest, DumpsHex)
{
    char data[] = {0x00, 0x00, 0x02, 0x0b};
    EXPECT_STREQ("00 00 02 0b", rk_string_dumps_hex(data, 4).c_str());
    EXPECT_STREQ("", rk_string_dumps_hex(data, 0).c_str());
    EXPECT_STREQ("", rk_string_dumps_hex(NULL, 4).c_str());
}

VOID TEST(KernelUtilityTest, NumberToUint32)
{
    EXPECT_EQ(0u, rk_number_to_uint32(NAN));
    EXPECT_EQ(0u, rk_number_to_uint32(-1));
    EXPECT_EQ(0u, rk_number_to_uint32(-0.5));
    EXPECT_EQ(0u, rk_number_to_uint32(0));
    EXPECT_EQ(1280u, rk_number_to_uint32(1280));
    EXPECT_EQ(1280u, rk_number_to_uint32(1280.9));
    EXPECT_EQ(UINT32_MAX, rk_number_to_uint32(4294967295.0));
    EXPECT_EQ(UINT32_MAX, rk_number_to_uint32(1e20));
    EXPECT_EQ(UINT32_MAX, rk_number_to_uint32(INFINITY));
}

VOID TEST(KernelUtilityTest, NumberToFloat)
{
    EXPECT_FLOAT_EQ(29.97f, rk_number_to_float(29.97));
    EXPECT_FLOAT_EQ(0.0f, rk_number_to_float(0));
    EXPECT_TRUE(isinf(rk_number_to_float(1e300)));
    EXPECT_TRUE(rk_number_to_float(1e300) > 0);
    EXPECT_TRUE(isinf(rk_number_to_float(-1e300)));
    EXPECT_TRUE(rk_number_to_float(-1e300) < 0);
    EXPECT_TRUE(isnan(rk_number_to_float(NAN)));
}

VOID TEST(KernelFileTest, ReadFile)
{
    rk_error_t err = rk_success;

    string path = _rk_tmp_file_prefix + "kernel-file.txt";
    FILE* fp = fopen(path.c_str(), "wb");
    ASSERT_TRUE(fp != NULL);
    fwrite("rtmpkit", 1, 7, fp);
    fclose(fp);

    if (true) {
        RkFileReader r;
        EXPECT_FALSE(r.is_open());

        string content;
        HELPER_EXPECT_FAILED_CODE(r.read_fully(content), ERROR_SYSTEM_FILE_READ);

        HELPER_EXPECT_SUCCESS(r.open(path));
        EXPECT_TRUE(r.is_open());

        // Open twice is an error.
        HELPER_EXPECT_FAILED_CODE(r.open(path), ERROR_SYSTEM_FILE_OPENE);

        HELPER_EXPECT_SUCCESS(r.read_fully(content));
        EXPECT_STREQ("rtmpkit", content.c_str());

        // At EOF, nothing appended.
        HELPER_EXPECT_SUCCESS(r.read_fully(content));
        EXPECT_EQ(7, (int)content.size());

        r.close();
        EXPECT_FALSE(r.is_open());

        // Reopen after closed.
        content = "";
        HELPER_EXPECT_SUCCESS(r.open(path));
        HELPER_EXPECT_SUCCESS(r.read_fully(content));
        EXPECT_STREQ("rtmpkit", content.c_str());
    }

    ::unlink(path.c_str());

    if (true) {
        RkFileReader r;
        HELPER_EXPECT_FAILED_CODE(r.open(path), ERROR_SYSTEM_FILE_OPENE);
    }
}
