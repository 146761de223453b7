//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_core.hpp>

#include <rk_kernel_error.hpp>
#include <rk_kernel_log.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_protocol_log.hpp>
#include <rk_protocol_amf0.hpp>
#include <rk_rtmp_stack.hpp>
#include <rk_rtmp_metadata.hpp>
#include <rk_core_autofree.hpp>
#include <rk_app_config.hpp>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>
using namespace std;

// @global log and context.
RkConsoleLog* _rk_console_log = new RkConsoleLog(RkLogLevelTrace, false);
IRkLog* _rk_log = _rk_console_log;
IRkContext* _rk_context = new RkThreadContext();

// @global config object.
RkConfig* _rk_config = new RkConfig();

void show_help(const char* binary)
{
    printf("Usage: %s [-c <config>] <message_type> <hex_payload>\n"
           "       %s [-c <config>] -m\n"
           "        -c config The config file, optional.\n"
           "        -m Encode and show the control messages to send after handshake.\n"
           "        message_type The RTMP message type, for example, 2 for abort.\n"
           "        hex_payload The payload in hex, for example, 0000020b.\n"
           "For example:\n"
           "        %s 2 0000020b\n"
           "        %s -c conf/rtmpkit.conf -m\n",
           binary, binary, binary, binary);
}

void dump_metadata(RkOnMetaDataPacket* pkt)
{
    RkStreamMetadata meta;
    meta.from_properties(pkt->metadata);

    printf("name: %s\n", pkt->name.c_str());
    printf("properties:\n%s", pkt->metadata->dumps().c_str());

    if (meta.video_width.has_value() && meta.video_height.has_value()) {
        printf("video: %ux%u", meta.video_width.value(), meta.video_height.value());
        if (meta.video_frame_rate.has_value()) {
            printf(", %.2ffps", meta.video_frame_rate.value());
        }
        if (meta.video_bitrate_kbps.has_value()) {
            printf(", %ukbps", meta.video_bitrate_kbps.value());
        }
        if (meta.video_codec.has_value()) {
            printf(", codec=%s", rk_float2str(meta.video_codec.value()).c_str());
        }
        printf("\n");
    }
    if (meta.audio_sample_rate.has_value()) {
        printf("audio: %uHZ", meta.audio_sample_rate.value());
        if (meta.audio_channels.has_value()) {
            printf(", %u channels", meta.audio_channels.value());
        }
        if (meta.audio_is_stereo.has_value()) {
            printf(", %s", meta.audio_is_stereo.value() ? "stereo" : "mono");
        }
        if (meta.audio_bitrate_kbps.has_value()) {
            printf(", %ukbps", meta.audio_bitrate_kbps.value());
        }
        if (meta.audio_codec.has_value()) {
            printf(", codec=%s", rk_float2str(meta.audio_codec.value()).c_str());
        }
        printf("\n");
    }
    if (meta.encoder.has_value()) {
        printf("encoder: %s\n", meta.encoder.value().c_str());
    }
    printf("fields: %d\n", meta.count());
}

void dump_packet(RkPacket* packet)
{
    switch (packet->kind()) {
        case RkRtmpMessageSetChunkSize: {
            RkSetChunkSizePacket* pkt = dynamic_cast<RkSetChunkSizePacket*>(packet);
            printf("SetChunkSize chunk_size=%u\n", pkt->chunk_size);
            break;
        }
        case RkRtmpMessageAbort: {
            RkAbortMessagePacket* pkt = dynamic_cast<RkAbortMessagePacket*>(packet);
            printf("Abort stream_id=%u\n", pkt->stream_id);
            break;
        }
        case RkRtmpMessageAcknowledgement: {
            RkAcknowledgementPacket* pkt = dynamic_cast<RkAcknowledgementPacket*>(packet);
            printf("Acknowledgement sequence_number=%u\n", pkt->sequence_number);
            break;
        }
        case RkRtmpMessageWindowAckSize: {
            RkSetWindowAckSizePacket* pkt = dynamic_cast<RkSetWindowAckSizePacket*>(packet);
            printf("WindowAckSize size=%u\n", pkt->ackowledgement_window_size);
            break;
        }
        case RkRtmpMessageSetPeerBandwidth: {
            RkSetPeerBandwidthPacket* pkt = dynamic_cast<RkSetPeerBandwidthPacket*>(packet);
            printf("SetPeerBandwidth bandwidth=%u, type=%s\n", pkt->bandwidth, rk_peer_bandwidth_type_str(pkt->type).c_str());
            break;
        }
        case RkRtmpMessageOnMetaData: {
            RkOnMetaDataPacket* pkt = dynamic_cast<RkOnMetaDataPacket*>(packet);
            printf("OnMetaData\n");
            dump_metadata(pkt);
            break;
        }
    }
}

rk_error_t decode(int message_type, string hex)
{
    rk_error_t err = rk_success;

    hex = rk_string_remove(hex, " ");
    if (hex.length() % 2) {
        return rk_error_new(ERROR_SYSTEM_PACKET_INVALID, "hex length %d is odd", (int)hex.length());
    }

    int size = (int)hex.length() / 2;
    char* payload = new char[rk_max(size, 1)];
    RkAutoFreeA(char, payload);

    if (size > 0 && rk_hex_to_data((uint8_t*)payload, hex.data(), (int)hex.length()) < 0) {
        return rk_error_new(ERROR_SYSTEM_PACKET_INVALID, "invalid hex %s", hex.c_str());
    }

    RkPacket* packet = NULL;
    if ((err = rk_rtmp_decode_message(message_type, payload, size, &packet)) != rk_success) {
        return rk_error_wrap(err, "decode type=%d, size=%d", message_type, size);
    }
    RkAutoFree(RkPacket, packet);

    dump_packet(packet);

    return err;
}

rk_error_t encode_control_messages()
{
    rk_error_t err = rk_success;

    vector<RkPacket*> msgs;
    _rk_config->create_control_messages(msgs);

    for (int i = 0; i < (int)msgs.size(); i++) {
        RkPacket* packet = msgs.at(i);

        int size = 0;
        char* payload = NULL;
        if ((err = packet->encode(size, payload)) != rk_success) {
            err = rk_error_wrap(err, "encode type=%d", packet->get_message_type());
            break;
        }
        RkAutoFreeA(char, payload);

        printf("type=%d, cid=%d, payload=%s\n", packet->get_message_type(), packet->get_prefer_cid(),
            rk_string_dumps_hex(payload, size).c_str());
        dump_packet(packet);
    }

    for (int i = 0; i < (int)msgs.size(); i++) {
        RkPacket* packet = msgs.at(i);
        rk_freep(packet);
    }

    return err;
}

rk_error_t do_main(int argc, char** argv)
{
    rk_error_t err = rk_success;

    _rk_context->set_id(_rk_context->generate_id());

    string conf;
    bool control_messages = false;
    vector<string> args;
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "-c" && i + 1 < argc) {
            conf = argv[++i];
        } else if (arg == "-m") {
            control_messages = true;
        } else if (arg == "-h" || arg == "--help") {
            show_help(argv[0]);
            exit(0);
        } else {
            args.push_back(arg);
        }
    }

    if (!control_messages && args.size() != 2) {
        show_help(argv[0]);
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "invalid options");
    }

    if (!conf.empty() && (err = _rk_config->parse_file(conf.c_str())) != rk_success) {
        return rk_error_wrap(err, "parse config %s", conf.c_str());
    }

    if ((err = _rk_config->check_config()) != rk_success) {
        return rk_error_wrap(err, "check config");
    }

    _rk_console_log->set_level(rk_get_log_level(_rk_config->get_log_level()));
    _rk_console_log->set_utc(_rk_config->get_utc_time());

    if ((err = _rk_log->initialize()) != rk_success) {
        return rk_error_wrap(err, "log initialize");
    }

    rk_trace("%s, conf=%s, level=%s", RTMP_SIG_RK_SERVER, conf.c_str(), _rk_config->get_log_level().c_str());

    if (control_messages) {
        if ((err = encode_control_messages()) != rk_success) {
            return rk_error_wrap(err, "control messages");
        }
        return err;
    }

    int message_type = ::atoi(args.at(0).c_str());
    if ((err = decode(message_type, args.at(1))) != rk_success) {
        return rk_error_wrap(err, "decode");
    }

    return err;
}

int main(int argc, char** argv)
{
    rk_error_t err = do_main(argc, argv);

    if (err != rk_success) {
        rk_error("Failed, %s", rk_error_desc(err).c_str());
    }

    int ret = rk_error_code(err);
    rk_freep(err);
    return ret;
}
