//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_APP_CONFIG_HPP
#define RK_APP_CONFIG_HPP

#include <rk_core.hpp>

#include <string>
#include <vector>

#include <rk_rtmp_transaction.hpp>

class RkConfig;
class RkPacket;
class RkSetChunkSizePacket;
class RkSetWindowAckSizePacket;
class RkSetPeerBandwidthPacket;

namespace rk_internal
{
    enum RkConfTokenType {
        // A name or arg, maybe quoted.
        RkConfTokenWord,
        // The ';' ends a directive.
        RkConfTokenEntire,
        // The '{' starts the child-directives.
        RkConfTokenBlockStart,
        // The '}' ends the child-directives.
        RkConfTokenBlockEnd,
        RkConfTokenEOF,
    };

    struct RkConfToken {
        RkConfTokenType type;
        std::string word;
        // The line where token starts.
        int line;
    };

    // The content of config, which is split into tokens.
    class RkConfigBuffer
    {
    private:
        std::string content;
        size_t pos;
    public:
        // Current parsed line.
        int line;
    public:
        RkConfigBuffer();
        RkConfigBuffer(const std::string& c);
        virtual ~RkConfigBuffer();
    public:
        // Fullfill the buffer with content of file specified by filename.
        virtual rk_error_t fullfill(const char* filename);
        // Whether all content is consumed.
        virtual bool empty();
        // Read a token, skip the spaces and comments started by '#'.
        virtual rk_error_t read_token(RkConfToken& token);
    private:
        void skip_spaces();
    };
};

// The config directive.
// The config file is a group of directives,
// all directive has name, args and child-directives.
// For example, the following config text:
//      rtmp {
//          chunk_size      60000;
//          transaction_collision overwrite;
//      }
// will be parsed to:
//      RkConfDirective: name="rtmp", args=[], child-directives=[
//          RkConfDirective: name="chunk_size", arg0="60000", child-directives=[]
//          RkConfDirective: name="transaction_collision", arg0="overwrite", child-directives=[]
//      ]
// @remark, allow empty directive, for example: "dir0 {}"
// @remark, don't allow empty name, for example: ";" or "{dir0 arg0;}
class RkConfDirective
{
public:
    // The line of config file in which the directive from
    int conf_line;
    // The name of directive, for example, "chunk_size".
    std::string name;
    // The args of directive, for example, ["60000"].
    std::vector<std::string> args;
    // The child directives.
    std::vector<RkConfDirective*> directives;
public:
    RkConfDirective();
    virtual ~RkConfDirective();
public:
    // Get the args0, directly use the args.at(index) for more args.
    virtual std::string arg0();
    // Get the directive by index.
    // @remark, assert the index<directives.size().
    virtual RkConfDirective* at(int index);
    // Get the directive by name, return the first match.
    virtual RkConfDirective* get(std::string _name);
// Parse utilities
public:
    // Parse config directive from file buffer.
    virtual rk_error_t parse(rk_internal::RkConfigBuffer* buffer, RkConfig* conf = NULL);
private:
    // Parse the directives until EOF, or the '}' if in_block.
    // The directive "include" is replaced by directives of the files.
    virtual rk_error_t parse_conf(rk_internal::RkConfigBuffer* buffer, bool in_block, RkConfig* conf);
    virtual rk_error_t parse_include(const std::vector<std::string>& files, int line, RkConfig* conf);
};

// The config service provider.
// All getters return the default value when directive is absent,
// and are overwritten by the env, for example, RK_RTMP_CHUNK_SIZE.
class RkConfig
{
    friend class RkConfDirective;
protected:
    // The directive root.
    RkConfDirective* root;
public:
    RkConfig();
    virtual ~RkConfig();
public:
    // Parse the config file, which is specified by cli.
    virtual rk_error_t parse_file(const char* filename);
    // Check the parsed config, the directive names and values.
    virtual rk_error_t check_config();
protected:
    // Parse config from the buffer.
    // @param buffer, the config buffer, user must delete it.
    // @remark, use protected for the utest to override with mock.
    virtual rk_error_t parse_buffer(rk_internal::RkConfigBuffer* buffer);
    // Build a buffer from a src, which is string content or filename.
    virtual rk_error_t build_buffer(std::string src, rk_internal::RkConfigBuffer** pbuffer);
// global section
public:
    // Get the log level, for example, "trace".
    virtual std::string get_log_level();
    // Whether use utc time in log header.
    virtual bool get_utc_time();
// rtmp section
public:
    // Get the chunk size, the size of each chunk we send to peer.
    virtual int get_chunk_size();
    // Get the size of window, the peer should send ack when received this size.
    virtual uint32_t get_window_ack_size();
    // Get the bandwidth to limit the output of peer.
    virtual uint32_t get_peer_bandwidth();
    // Get the policy name of transaction id collision, "overwrite" or "reject".
    virtual std::string get_transaction_collision();
    // Parse the policy of transaction id collision.
    virtual rk_error_t get_transaction_collision_policy(RkTransactionCollisionPolicy& policy);
private:
    virtual RkConfDirective* get_rtmp(std::string name);
// The control messages to send after handshake.
public:
    // Create the control messages by config, the order is window ack size,
    // set peer bandwidth and set chunk size, user must free them.
    virtual void create_control_messages(std::vector<RkPacket*>& msgs);
    virtual RkSetWindowAckSizePacket* create_window_ack_size();
    virtual RkSetPeerBandwidthPacket* create_set_peer_bandwidth();
    virtual RkSetChunkSizePacket* create_set_chunk_size();
};

#endif
