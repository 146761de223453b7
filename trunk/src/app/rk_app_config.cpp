//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_app_config.hpp>

#include <stdlib.h>
#include <algorithm>
using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_file.hpp>
#include <rk_kernel_consts.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_rtmp_stack.hpp>
#include <rk_core_autofree.hpp>

using namespace rk_internal;

#define RK_LF (char)0x0a
#define RK_CR (char)0x0d

// Overwrite the config by env.
#define RK_OVERWRITE_BY_ENV_STRING(key) if (!rk_getenv(key).empty()) return rk_getenv(key)
#define RK_OVERWRITE_BY_ENV_BOOL(key) if (!rk_getenv(key).empty()) return RK_CONF_PREFER_FALSE(rk_getenv(key))
#define RK_OVERWRITE_BY_ENV_INT(key) if (!rk_getenv(key).empty()) return ::atoi(rk_getenv(key).c_str())
#define RK_OVERWRITE_BY_ENV_UINT32(key) if (!rk_getenv(key).empty()) return (uint32_t)::strtoul(rk_getenv(key).c_str(), NULL, 10)

// default value is false, only "on" is true.
#define RK_CONF_PREFER_FALSE(conf_arg) conf_arg == "on"

static bool rk_conf_is_space(char ch)
{
    return ch == ' ' || ch == '\t' || ch == RK_CR || ch == RK_LF;
}

// The word is terminated by space, or any of ";{}".
static bool rk_conf_is_word_end(char ch)
{
    return rk_conf_is_space(ch) || ch == ';' || ch == '{' || ch == '}';
}

namespace rk_internal
{
    RkConfigBuffer::RkConfigBuffer()
    {
        pos = 0;
        line = 1;
    }

    RkConfigBuffer::RkConfigBuffer(const string& c)
    {
        content = c;
        pos = 0;
        line = 1;
    }

    RkConfigBuffer::~RkConfigBuffer()
    {
    }

    rk_error_t RkConfigBuffer::fullfill(const char* filename)
    {
        rk_error_t err = rk_success;

        RkFileReader reader;
        if ((err = reader.open(filename)) != rk_success) {
            return rk_error_wrap(err, "open file=%s", filename);
        }

        string data;
        if ((err = reader.read_fully(data)) != rk_success) {
            return rk_error_wrap(err, "read file=%s", filename);
        }

        content.swap(data);
        pos = 0;
        line = 1;

        return err;
    }

    bool RkConfigBuffer::empty()
    {
        return pos >= content.size();
    }

    void RkConfigBuffer::skip_spaces()
    {
        while (!empty()) {
            char ch = content.at(pos);

            // The comment is ended by LF, which is consumed as space.
            if (ch == '#') {
                size_t lf = content.find(RK_LF, pos);
                pos = (lf == string::npos) ? content.size() : lf;
                continue;
            }

            if (!rk_conf_is_space(ch)) {
                return;
            }

            if (ch == RK_LF) {
                line++;
            }
            pos++;
        }
    }

    rk_error_t RkConfigBuffer::read_token(RkConfToken& token)
    {
        skip_spaces();

        token.word = "";
        token.line = line;

        if (empty()) {
            token.type = RkConfTokenEOF;
            return rk_success;
        }

        char ch = content.at(pos);
        if (ch == ';' || ch == '{' || ch == '}') {
            pos++;
            if (ch == ';') {
                token.type = RkConfTokenEntire;
            } else if (ch == '{') {
                token.type = RkConfTokenBlockStart;
            } else {
                token.type = RkConfTokenBlockEnd;
            }
            return rk_success;
        }

        token.type = RkConfTokenWord;

        // Normal word, without quotes.
        if (ch != '"' && ch != '\'') {
            size_t start = pos;
            while (!empty() && !rk_conf_is_word_end(content.at(pos))) {
                pos++;
            }
            token.word = content.substr(start, pos - start);
            return rk_success;
        }

        // Quoted word, which may contain spaces and LF.
        size_t quote = content.find(ch, pos + 1);
        if (quote == string::npos) {
            return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected end of file, expecting %c", line, ch);
        }

        token.word = content.substr(pos + 1, quote - pos - 1);
        line += (int)std::count(token.word.begin(), token.word.end(), RK_LF);
        pos = quote + 1;

        if (!empty() && !rk_conf_is_word_end(content.at(pos))) {
            return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected '%c'", line, content.at(pos));
        }

        return rk_success;
    }
};

RkConfDirective::RkConfDirective()
{
    conf_line = 0;
}

RkConfDirective::~RkConfDirective()
{
    std::vector<RkConfDirective*>::iterator it;
    for (it = directives.begin(); it != directives.end(); ++it) {
        RkConfDirective* directive = *it;
        rk_freep(directive);
    }
    directives.clear();
}

string RkConfDirective::arg0()
{
    return args.empty() ? "" : args.at(0);
}

RkConfDirective* RkConfDirective::at(int index)
{
    rk_assert(index < (int)directives.size());
    return directives.at(index);
}

RkConfDirective* RkConfDirective::get(string _name)
{
    for (int i = 0; i < (int)directives.size(); i++) {
        RkConfDirective* directive = directives.at(i);
        if (directive->name == _name) {
            return directive;
        }
    }

    return NULL;
}

rk_error_t RkConfDirective::parse(RkConfigBuffer* buffer, RkConfig* conf)
{
    return parse_conf(buffer, false, conf);
}

rk_error_t RkConfDirective::parse_conf(RkConfigBuffer* buffer, bool in_block, RkConfig* conf)
{
    rk_error_t err = rk_success;

    // The name and args of current directive.
    vector<string> words;
    int line_start = 0;

    while (true) {
        RkConfToken token;
        if ((err = buffer->read_token(token)) != rk_success) {
            return rk_error_wrap(err, "read token, words=%d", (int)words.size());
        }

        if (token.type == RkConfTokenWord) {
            if (words.empty()) {
                line_start = token.line;
            }
            if (!token.word.empty()) {
                words.push_back(token.word);
            }
            continue;
        }

        if (token.type == RkConfTokenEOF) {
            if (!words.empty()) {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected end of file, expecting ; or \"}\"", token.line);
            }
            if (in_block) {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected end of file, expecting \"}\"", conf_line);
            }
            rk_info("config parse complete, line=%d", token.line);
            return err;
        }

        if (token.type == RkConfTokenBlockEnd) {
            if (!words.empty()) {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected '}'", token.line);
            }
            if (!in_block) {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected \"}\"", token.line);
            }
            return err;
        }

        // The ';' or '{' ends the directive.
        bool block = token.type == RkConfTokenBlockStart;
        if (words.empty()) {
            return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: unexpected '%c'", token.line, block ? '{' : ';');
        }

        if (words.at(0) == "include") {
            if (block) {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: include has no block", line_start);
            }

            vector<string> files(words.begin() + 1, words.end());
            if ((err = parse_include(files, line_start, conf)) != rk_success) {
                return rk_error_wrap(err, "line %d: include", line_start);
            }
        } else {
            RkConfDirective* directive = new RkConfDirective();
            directives.push_back(directive);

            directive->conf_line = line_start;
            directive->name = words.at(0);
            directive->args.assign(words.begin() + 1, words.end());

            if (block && (err = directive->parse_conf(buffer, true, conf)) != rk_success) {
                return rk_error_wrap(err, "parse %s", directive->name.c_str());
            }
        }

        words.clear();
    }

    return err;
}

rk_error_t RkConfDirective::parse_include(const vector<string>& files, int line, RkConfig* conf)
{
    rk_error_t err = rk_success;

    if (files.empty()) {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: include is empty directive", line);
    }
    if (!conf) {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: no config", line);
    }

    for (int i = 0; i < (int)files.size(); i++) {
        const string& file = files.at(i);
        rk_trace("config parse include %s", file.c_str());

        RkConfigBuffer* buffer = NULL;
        RkAutoFree(RkConfigBuffer, buffer);
        if ((err = conf->build_buffer(file, &buffer)) != rk_success) {
            return rk_error_wrap(err, "buffer fullfill %s", file.c_str());
        }

        // The included directives are children of current directive.
        if ((err = parse_conf(buffer, false, conf)) != rk_success) {
            return rk_error_wrap(err, "parse include %s", file.c_str());
        }
    }

    return err;
}

RkConfig::RkConfig()
{
    root = new RkConfDirective();
    root->conf_line = 0;
    root->name = "root";
}

RkConfig::~RkConfig()
{
    rk_freep(root);
}

rk_error_t RkConfig::parse_file(const char* filename)
{
    rk_error_t err = rk_success;

    if (!filename || !filename[0]) {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "empty config");
    }

    RkConfigBuffer* buffer = NULL;
    RkAutoFree(RkConfigBuffer, buffer);
    if ((err = build_buffer(filename, &buffer)) != rk_success) {
        return rk_error_wrap(err, "buffer fullfill %s", filename);
    }

    if ((err = parse_buffer(buffer)) != rk_success) {
        return rk_error_wrap(err, "parse buffer %s", filename);
    }

    return err;
}

rk_error_t RkConfig::check_config()
{
    rk_error_t err = rk_success;

    ////////////////////////////////////////////////////////////////////////
    // check root directives.
    ////////////////////////////////////////////////////////////////////////
    for (int i = 0; i < (int)root->directives.size(); i++) {
        RkConfDirective* conf = root->at(i);
        std::string n = conf->name;
        if (n != "log_level" && n != "utc_time" && n != "rtmp") {
            return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: illegal directive %s", conf->conf_line, n.c_str());
        }
    }
    if (true) {
        RkConfDirective* conf = root->get("rtmp");
        for (int i = 0; conf && i < (int)conf->directives.size(); i++) {
            RkConfDirective* obj = conf->at(i);
            string n = obj->name;
            if (n != "chunk_size" && n != "window_ack_size" && n != "peer_bandwidth" && n != "transaction_collision") {
                return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "line %d: illegal rtmp.%s", obj->conf_line, n.c_str());
            }
        }
    }

    ////////////////////////////////////////////////////////////////////////
    // check values, which maybe overwritten by env.
    ////////////////////////////////////////////////////////////////////////
    if (true) {
        string level = get_log_level();
        if (level != "verbose" && level != "info" && level != "trace" && level != "warn"
            && level != "error" && level != "off") {
            return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "illegal log_level %s", level.c_str());
        }
    }

    if (true) {
        int chunk_size = get_chunk_size();
        if (chunk_size < RK_CONSTS_RTMP_MIN_CHUNK_SIZE || chunk_size > RK_CONSTS_RTMP_MAX_CHUNK_SIZE) {
            return rk_error_new(ERROR_RTMP_CHUNK_SIZE, "chunk_size=%d should be in [%d, %d]",
                chunk_size, RK_CONSTS_RTMP_MIN_CHUNK_SIZE, RK_CONSTS_RTMP_MAX_CHUNK_SIZE);
        }
    }

    if (get_window_ack_size() == 0) {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "window_ack_size should not be zero");
    }

    if (true) {
        RkTransactionCollisionPolicy policy;
        if ((err = get_transaction_collision_policy(policy)) != rk_success) {
            return rk_error_wrap(err, "check transaction_collision");
        }
    }

    return err;
}

rk_error_t RkConfig::parse_buffer(RkConfigBuffer* buffer)
{
    rk_error_t err = rk_success;

    // We use a new root to parse buffer, to allow parse multiple times.
    rk_freep(root);
    root = new RkConfDirective();

    // Parse root tree from buffer.
    if ((err = root->parse(buffer, this)) != rk_success) {
        return rk_error_wrap(err, "root parse");
    }

    return err;
}

rk_error_t RkConfig::build_buffer(string src, RkConfigBuffer** pbuffer)
{
    rk_error_t err = rk_success;

    RkConfigBuffer* buffer = new RkConfigBuffer();

    if ((err = buffer->fullfill(src.c_str())) != rk_success) {
        rk_freep(buffer);
        return rk_error_wrap(err, "read from src %s", src.c_str());
    }

    *pbuffer = buffer;
    return err;
}

string RkConfig::get_log_level()
{
    RK_OVERWRITE_BY_ENV_STRING("log_level"); // RK_LOG_LEVEL

    static string DEFAULT = "trace";

    RkConfDirective* conf = root->get("log_level");
    if (!conf || conf->arg0().empty()) {
        return DEFAULT;
    }

    return conf->arg0();
}

bool RkConfig::get_utc_time()
{
    RK_OVERWRITE_BY_ENV_BOOL("utc_time"); // RK_UTC_TIME

    static bool DEFAULT = false;

    RkConfDirective* conf = root->get("utc_time");
    if (!conf || conf->arg0().empty()) {
        return DEFAULT;
    }

    return RK_CONF_PREFER_FALSE(conf->arg0());
}

RkConfDirective* RkConfig::get_rtmp(string name)
{
    RkConfDirective* conf = root->get("rtmp");
    if (!conf) {
        return NULL;
    }

    conf = conf->get(name);
    if (!conf || conf->arg0().empty()) {
        return NULL;
    }

    return conf;
}

int RkConfig::get_chunk_size()
{
    RK_OVERWRITE_BY_ENV_INT("rtmp.chunk_size"); // RK_RTMP_CHUNK_SIZE

    RkConfDirective* conf = get_rtmp("chunk_size");
    if (!conf) {
        return RK_CONSTS_RTMP_RK_CHUNK_SIZE;
    }

    return ::atoi(conf->arg0().c_str());
}

uint32_t RkConfig::get_window_ack_size()
{
    RK_OVERWRITE_BY_ENV_UINT32("rtmp.window_ack_size"); // RK_RTMP_WINDOW_ACK_SIZE

    RkConfDirective* conf = get_rtmp("window_ack_size");
    if (!conf) {
        return RK_CONSTS_RTMP_WINDOW_ACK_SIZE;
    }

    return (uint32_t)::strtoul(conf->arg0().c_str(), NULL, 10);
}

uint32_t RkConfig::get_peer_bandwidth()
{
    RK_OVERWRITE_BY_ENV_UINT32("rtmp.peer_bandwidth"); // RK_RTMP_PEER_BANDWIDTH

    RkConfDirective* conf = get_rtmp("peer_bandwidth");
    if (!conf) {
        return RK_CONSTS_RTMP_PEER_BANDWIDTH;
    }

    return (uint32_t)::strtoul(conf->arg0().c_str(), NULL, 10);
}

string RkConfig::get_transaction_collision()
{
    RK_OVERWRITE_BY_ENV_STRING("rtmp.transaction_collision"); // RK_RTMP_TRANSACTION_COLLISION

    static string DEFAULT = "overwrite";

    RkConfDirective* conf = get_rtmp("transaction_collision");
    if (!conf) {
        return DEFAULT;
    }

    return conf->arg0();
}

rk_error_t RkConfig::get_transaction_collision_policy(RkTransactionCollisionPolicy& policy)
{
    rk_error_t err = rk_success;

    string v = get_transaction_collision();
    if ((err = rk_transaction_collision_parse(v, policy)) != rk_success) {
        return rk_error_wrap(err, "parse transaction_collision");
    }

    return err;
}

void RkConfig::create_control_messages(vector<RkPacket*>& msgs)
{
    msgs.push_back(create_window_ack_size());
    msgs.push_back(create_set_peer_bandwidth());
    msgs.push_back(create_set_chunk_size());
}

RkSetWindowAckSizePacket* RkConfig::create_window_ack_size()
{
    RkSetWindowAckSizePacket* pkt = new RkSetWindowAckSizePacket();
    pkt->ackowledgement_window_size = get_window_ack_size();
    return pkt;
}

RkSetPeerBandwidthPacket* RkConfig::create_set_peer_bandwidth()
{
    RkSetPeerBandwidthPacket* pkt = new RkSetPeerBandwidthPacket();
    pkt->bandwidth = get_peer_bandwidth();
    pkt->type = RkPeerBandwidthDynamic;
    return pkt;
}

RkSetChunkSizePacket* RkConfig::create_set_chunk_size()
{
    RkSetChunkSizePacket* pkt = new RkSetChunkSizePacket();
    pkt->chunk_size = (uint32_t)get_chunk_size();
    return pkt;
}
