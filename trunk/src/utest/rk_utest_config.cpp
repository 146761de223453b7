//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//
#include <rk_utest_config.hpp>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <vector>
using namespace std;

#include <rk_core_autofree.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_consts.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_rtmp_stack.hpp>
#include <rk_rtmp_transaction.hpp>

using namespace rk_internal;

MockRkConfig::MockRkConfig()
{
}

MockRkConfig::~MockRkConfig()
{
}

rk_error_t MockRkConfig::parse(string buf)
{
    rk_error_t err = rk_success;

    RkConfigBuffer buffer(buf);

    if ((err = parse_buffer(&buffer)) != rk_success) {
        return rk_error_wrap(err, "parse buffer");
    }

    if ((err = check_config()) != rk_success) {
        return rk_error_wrap(err, "check config");
    }

    return err;
}

rk_error_t MockRkConfig::mock_include(const string file_name, const string content)
{
    rk_error_t err = rk_success;

    included_files[file_name] = content;

    return err;
}

rk_error_t MockRkConfig::build_buffer(std::string src, RkConfigBuffer** pbuffer)
{
    rk_error_t err = rk_success;

    // No file, error.
    if (included_files.find(src) == included_files.end()) {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "file %s: no found", src.c_str());
    }

    string content = included_files[src];

    // Empty file, ok.
    *pbuffer = new RkConfigBuffer(content);

    return err;
}

static string rk_utest_env_key(const std::string& key)
{
    if (rk_string_starts_with(key, "$")) {
        return key.substr(1);
    }
    return "RK_" + rk_string_to_upper(rk_string_replace(key, ".", "_"));
}

int IRkSetEnvConfig::rk_setenv(const std::string& key, const std::string& value, bool overwrite)
{
    string ekey = rk_utest_env_key(key);
    if (ekey.empty()) {
        return -1;
    }

    return ::setenv(ekey.c_str(), value.c_str(), overwrite);
}

int IRkSetEnvConfig::rk_unsetenv(const std::string& key)
{
    string ekey = rk_utest_env_key(key);
    if (ekey.empty()) {
        return -1;
    }

    return ::unsetenv(ekey.c_str());
}

VOID TEST(ConfigDirectiveTest, ParseEmpty)
{
    rk_error_t err;

    RkConfigBuffer buf("");
    RkConfDirective conf;
    HELPER_ASSERT_SUCCESS(conf.parse(&buf));
    EXPECT_EQ(0, (int)conf.name.length());
    EXPECT_EQ(0, (int)conf.args.size());
    EXPECT_EQ(0, (int)conf.directives.size());
}

VOID TEST(ConfigDirectiveTest, ParseNameArgs)
{
    rk_error_t err;

    RkConfigBuffer buf("rtmp arg0 arg1 arg2;");
    RkConfDirective conf;
    HELPER_ASSERT_SUCCESS(conf.parse(&buf));
    ASSERT_EQ(1, (int)conf.directives.size());

    RkConfDirective& dir = *conf.at(0);
    EXPECT_STREQ("rtmp", dir.name.c_str());
    EXPECT_EQ(3, (int)dir.args.size());
    EXPECT_STREQ("arg0", dir.arg0().c_str());
    EXPECT_STREQ("arg1", dir.args.at(1).c_str());
    EXPECT_STREQ("arg2", dir.args.at(2).c_str());
    EXPECT_EQ(0, (int)dir.directives.size());
    EXPECT_EQ(1, dir.conf_line);
}

VOID TEST(ConfigDirectiveTest, ParseBlock)
{
    rk_error_t err;

    RkConfigBuffer buf("log_level info;\nrtmp {\n    chunk_size 4096;\n    transaction_collision reject;\n}\n");
    RkConfDirective conf;
    HELPER_ASSERT_SUCCESS(conf.parse(&buf));
    ASSERT_EQ(2, (int)conf.directives.size());

    RkConfDirective* rtmp = conf.get("rtmp");
    ASSERT_TRUE(rtmp != NULL);
    EXPECT_EQ(2, rtmp->conf_line);
    EXPECT_EQ(0, (int)rtmp->args.size());
    ASSERT_EQ(2, (int)rtmp->directives.size());

    RkConfDirective* chunk_size = rtmp->get("chunk_size");
    ASSERT_TRUE(chunk_size != NULL);
    EXPECT_STREQ("4096", chunk_size->arg0().c_str());
    EXPECT_EQ(3, chunk_size->conf_line);

    ASSERT_TRUE(rtmp->get("transaction_collision") != NULL);
    EXPECT_STREQ("reject", rtmp->get("transaction_collision")->arg0().c_str());
    EXPECT_TRUE(rtmp->get("peer_bandwidth") == NULL);
}

VOID TEST(ConfigDirectiveTest, ParseEmptyBlock)
{
    rk_error_t err;

    RkConfigBuffer buf("rtmp {}");
    RkConfDirective conf;
    HELPER_ASSERT_SUCCESS(conf.parse(&buf));
    ASSERT_EQ(1, (int)conf.directives.size());
    EXPECT_EQ(0, (int)conf.at(0)->directives.size());
}

VOID TEST(ConfigDirectiveTest, ParseCommentsAndQuotes)
{
    rk_error_t err;

    RkConfigBuffer buf("# The config of rtmpkit.\n"
        "log_level trace; # The level.\n"
        "name \"obs studio\" 'x y';\n");
    RkConfDirective conf;
    HELPER_ASSERT_SUCCESS(conf.parse(&buf));
    ASSERT_EQ(2, (int)conf.directives.size());

    EXPECT_STREQ("trace", conf.at(0)->arg0().c_str());
    EXPECT_EQ(2, conf.at(0)->conf_line);

    RkConfDirective* dir = conf.at(1);
    EXPECT_STREQ("name", dir->name.c_str());
    ASSERT_EQ(2, (int)dir->args.size());
    EXPECT_STREQ("obs studio", dir->arg0().c_str());
    EXPECT_STREQ("x y", dir->args.at(1).c_str());
    EXPECT_EQ(3, dir->conf_line);
}

VOID TEST(ConfigDirectiveTest, ParseInvalid)
{
    rk_error_t err;

    if (true) {
        RkConfigBuffer buf("rtmp");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("rtmp {");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("}");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf(";");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("{rtmp;}");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("name \"obs\"x;");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }
}

VOID TEST(ConfigDirectiveTest, ParseErrorLine)
{
    rk_error_t err;

    RkConfigBuffer buf("log_level trace;\nrtmp {\n    chunk_size 4096;\n    }}\n");
    RkConfDirective conf;
    err = conf.parse(&buf);
    ASSERT_TRUE(err != rk_success);
    EXPECT_TRUE(rk_error_desc(err).find("line 4") != string::npos);
    rk_freep(err);
}

VOID TEST(ConfigDirectiveTest, ReadTokens)
{
    rk_error_t err;

    RkConfigBuffer buf("# comment\nrtmp{chunk_size 4096;}\n'a\nb' c");
    RkConfToken token;

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenWord, token.type);
    EXPECT_STREQ("rtmp", token.word.c_str());
    EXPECT_EQ(2, token.line);

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenBlockStart, token.type);

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_STREQ("chunk_size", token.word.c_str());
    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_STREQ("4096", token.word.c_str());

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenEntire, token.type);
    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenBlockEnd, token.type);

    // The quoted word spans lines.
    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenWord, token.type);
    EXPECT_STREQ("a\nb", token.word.c_str());
    EXPECT_EQ(3, token.line);

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_STREQ("c", token.word.c_str());
    EXPECT_EQ(4, token.line);

    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenEOF, token.type);
    EXPECT_TRUE(buf.empty());

    // Always EOF at the end.
    HELPER_ASSERT_SUCCESS(buf.read_token(token));
    EXPECT_EQ(RkConfTokenEOF, token.type);
}

VOID TEST(ConfigDirectiveTest, ParseQuotesAndInclude)
{
    rk_error_t err;

    if (true) {
        RkConfigBuffer buf("name \"obs;");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("name 'obs'");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        RkConfigBuffer buf("rtmp { chunk_size 4096 }");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    // The include requires the config to build buffer.
    if (true) {
        RkConfigBuffer buf("include rtmp.conf;");
        RkConfDirective conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse(&buf), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_ASSERT_SUCCESS(conf.mock_include("rtmp.conf", "chunk_size 8192;"));
        HELPER_EXPECT_FAILED_CODE(conf.parse("include rtmp.conf {}"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    // The quoted word is terminated by space, ";" or "}".
    if (true) {
        RkConfigBuffer buf("rtmp { transaction_collision 'reject';}");
        RkConfDirective conf;
        HELPER_ASSERT_SUCCESS(conf.parse(&buf));
        ASSERT_EQ(1, (int)conf.directives.size());
        EXPECT_STREQ("reject", conf.at(0)->get("transaction_collision")->arg0().c_str());
    }
}

VOID TEST(ConfigMainTest, ParseEmpty)
{
    rk_error_t err;

    MockRkConfig conf;
    HELPER_ASSERT_SUCCESS(conf.parse(""));

    EXPECT_STREQ("trace", conf.get_log_level().c_str());
    EXPECT_FALSE(conf.get_utc_time());
    EXPECT_EQ(RK_CONSTS_RTMP_RK_CHUNK_SIZE, conf.get_chunk_size());
    EXPECT_EQ(RK_CONSTS_RTMP_WINDOW_ACK_SIZE, (int)conf.get_window_ack_size());
    EXPECT_EQ(RK_CONSTS_RTMP_PEER_BANDWIDTH, (int)conf.get_peer_bandwidth());
    EXPECT_STREQ("overwrite", conf.get_transaction_collision().c_str());

    RkTransactionCollisionPolicy policy = RkTransactionCollisionReject;
    HELPER_EXPECT_SUCCESS(conf.get_transaction_collision_policy(policy));
    EXPECT_EQ(RkTransactionCollisionOverwrite, policy);
}

VOID TEST(ConfigMainTest, ParseFullConf)
{
    rk_error_t err;

    MockRkConfig conf;
    HELPER_ASSERT_SUCCESS(conf.parse("log_level warn; utc_time on; rtmp { chunk_size 4096; window_ack_size 5000000; "
        "peer_bandwidth 1000000; transaction_collision reject; }"));

    EXPECT_STREQ("warn", conf.get_log_level().c_str());
    EXPECT_TRUE(conf.get_utc_time());
    EXPECT_EQ(4096, conf.get_chunk_size());
    EXPECT_EQ(5000000, (int)conf.get_window_ack_size());
    EXPECT_EQ(1000000, (int)conf.get_peer_bandwidth());

    RkTransactionCollisionPolicy policy = RkTransactionCollisionOverwrite;
    HELPER_EXPECT_SUCCESS(conf.get_transaction_collision_policy(policy));
    EXPECT_EQ(RkTransactionCollisionReject, policy);
}

VOID TEST(ConfigMainTest, ParseMultipleTimes)
{
    rk_error_t err;

    MockRkConfig conf;
    HELPER_ASSERT_SUCCESS(conf.parse("rtmp { chunk_size 4096; }"));
    EXPECT_EQ(4096, conf.get_chunk_size());

    // A new root for each parsing.
    HELPER_ASSERT_SUCCESS(conf.parse("log_level info;"));
    EXPECT_EQ(RK_CONSTS_RTMP_RK_CHUNK_SIZE, conf.get_chunk_size());
    EXPECT_STREQ("info", conf.get_log_level().c_str());
}

VOID TEST(ConfigMainTest, ParseIllegalDirective)
{
    rk_error_t err;

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("listen 1935;"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { chunk_sizes 4096; }"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("log_level debug;"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { window_ack_size 0; }"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { transaction_collision ignore; }"), ERROR_SYSTEM_CONFIG_INVALID);
    }
}

VOID TEST(ConfigMainTest, CheckChunkSize)
{
    rk_error_t err;

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_SUCCESS(conf.parse("rtmp { chunk_size 128; }"));
        HELPER_EXPECT_SUCCESS(conf.parse("rtmp { chunk_size 65536; }"));
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { chunk_size 127; }"), ERROR_RTMP_CHUNK_SIZE);
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { chunk_size 65537; }"), ERROR_RTMP_CHUNK_SIZE);
        HELPER_EXPECT_FAILED_CODE(conf.parse("rtmp { chunk_size abc; }"), ERROR_RTMP_CHUNK_SIZE);
    }
}

VOID TEST(ConfigMainTest, Include)
{
    rk_error_t err;

    if (true) {
        MockRkConfig conf;
        HELPER_ASSERT_SUCCESS(conf.mock_include("rtmp.conf", "chunk_size 8192;"));
        HELPER_ASSERT_SUCCESS(conf.parse("log_level info; rtmp { include rtmp.conf; }"));
        EXPECT_EQ(8192, conf.get_chunk_size());
        EXPECT_STREQ("info", conf.get_log_level().c_str());
    }

    if (true) {
        MockRkConfig conf;
        HELPER_ASSERT_SUCCESS(conf.mock_include("log.conf", "log_level warn;"));
        HELPER_ASSERT_SUCCESS(conf.mock_include("empty.conf", ""));
        HELPER_ASSERT_SUCCESS(conf.parse("include log.conf empty.conf;"));
        EXPECT_STREQ("warn", conf.get_log_level().c_str());
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("include;"), ERROR_SYSTEM_CONFIG_INVALID);
    }

    if (true) {
        MockRkConfig conf;
        HELPER_EXPECT_FAILED_CODE(conf.parse("include none.conf;"), ERROR_SYSTEM_CONFIG_INVALID);
    }
}

VOID TEST(ConfigEnvTest, OverwriteByEnv)
{
    rk_error_t err;

    if (true) {
        MockRkConfig conf;
        RkSetEnvConfig(chunk_size, "rtmp.chunk_size", "4096");
        HELPER_ASSERT_SUCCESS(conf.parse("rtmp { chunk_size 8192; }"));
        EXPECT_EQ(4096, conf.get_chunk_size());
    }

    if (true) {
        MockRkConfig conf;
        RkSetEnvConfig(log_level, "log_level", "error");
        RkSetEnvConfig(utc_time, "$RK_UTC_TIME", "on");
        HELPER_ASSERT_SUCCESS(conf.parse(""));
        EXPECT_STREQ("error", conf.get_log_level().c_str());
        EXPECT_TRUE(conf.get_utc_time());
    }

    if (true) {
        MockRkConfig conf;
        RkSetEnvConfig(window_ack_size, "rtmp.window_ack_size", "1000");
        RkSetEnvConfig(peer_bandwidth, "rtmp.peer_bandwidth", "2000");
        RkSetEnvConfig(transaction_collision, "rtmp.transaction_collision", "reject");
        HELPER_ASSERT_SUCCESS(conf.parse(""));
        EXPECT_EQ(1000, (int)conf.get_window_ack_size());
        EXPECT_EQ(2000, (int)conf.get_peer_bandwidth());
        EXPECT_STREQ("reject", conf.get_transaction_collision().c_str());
    }

    // The env is checked as the config.
    if (true) {
        MockRkConfig conf;
        RkSetEnvConfig(chunk_size, "rtmp.chunk_size", "100");
        HELPER_EXPECT_FAILED_CODE(conf.parse(""), ERROR_RTMP_CHUNK_SIZE);
    }

    // Unset when leaving the scope.
    if (true) {
        MockRkConfig conf;
        HELPER_ASSERT_SUCCESS(conf.parse(""));
        EXPECT_EQ(RK_CONSTS_RTMP_RK_CHUNK_SIZE, conf.get_chunk_size());
        EXPECT_FALSE(conf.get_utc_time());
    }
}

VOID TEST(ConfigMainTest, ControlMessages)
{
    rk_error_t err;

    MockRkConfig conf;
    HELPER_ASSERT_SUCCESS(conf.parse("rtmp { chunk_size 4096; window_ack_size 5000000; peer_bandwidth 6000000; }"));

    vector<RkPacket*> msgs;
    conf.create_control_messages(msgs);
    ASSERT_EQ(3, (int)msgs.size());

    RkSetWindowAckSizePacket* ack = dynamic_cast<RkSetWindowAckSizePacket*>(msgs.at(0));
    RkSetPeerBandwidthPacket* bw = dynamic_cast<RkSetPeerBandwidthPacket*>(msgs.at(1));
    RkSetChunkSizePacket* cs = dynamic_cast<RkSetChunkSizePacket*>(msgs.at(2));

    EXPECT_TRUE(ack && ack->ackowledgement_window_size == 5000000);
    EXPECT_TRUE(bw && bw->bandwidth == 6000000 && bw->type == RkPeerBandwidthDynamic);
    EXPECT_TRUE(cs && cs->chunk_size == 4096);

    // All are encoded to the protocol control chunk.
    for (int i = 0; i < (int)msgs.size(); i++) {
        RkPacket* packet = msgs.at(i);
        EXPECT_EQ(RTMP_CID_ProtocolControl, packet->get_prefer_cid());

        int size = 0;
        char* payload = NULL;
        HELPER_EXPECT_SUCCESS(packet->encode(size, payload));
        rk_freepa(payload);

        rk_freep(packet);
    }
}

VOID TEST(ConfigMainTest, ParseFile)
{
    rk_error_t err;

    string filepath = _rk_tmp_file_prefix + "config.conf";

    if (true) {
        FILE* f = fopen(filepath.c_str(), "w");
        ASSERT_TRUE(f != NULL);
        fputs("# utest\nrtmp {\n    chunk_size 1024;\n}\n", f);
        fclose(f);
    }

    RkConfig conf;
    err = conf.parse_file(filepath.c_str());
    ::unlink(filepath.c_str());
    HELPER_ASSERT_SUCCESS(err);
    HELPER_ASSERT_SUCCESS(conf.check_config());

    EXPECT_EQ(1024, conf.get_chunk_size());
    EXPECT_STREQ("trace", conf.get_log_level().c_str());
}

VOID TEST(ConfigMainTest, ParseFileNotExists)
{
    rk_error_t err;

    RkConfig conf;
    HELPER_EXPECT_FAILED_CODE(conf.parse_file("/tmp/rtmpkit-utest-not-exists.conf"), ERROR_SYSTEM_FILE_OPENE);
    HELPER_EXPECT_FAILED_CODE(conf.parse_file(""), ERROR_SYSTEM_CONFIG_INVALID);
}
