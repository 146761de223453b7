//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_rtmp_stack.hpp>

using namespace std;

#include <rk_core_autofree.hpp>
#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_buffer.hpp>
#include <rk_kernel_consts.hpp>
#include <rk_protocol_amf0.hpp>

// The bit 31 of set chunk size must be zero.
#define RK_RTMP_CHUNK_SIZE_RESERVED_BIT 0x80000000

RkPacket::RkPacket()
{
}

RkPacket::~RkPacket()
{
}

rk_error_t RkPacket::encode(int& psize, char*& ppayload)
{
    rk_error_t err = rk_success;

    int size = get_size();
    char* payload = NULL;

    if (size > 0) {
        payload = new char[size];

        RkBuffer* stream = new RkBuffer(payload, size);
        RkAutoFree(RkBuffer, stream);

        if ((err = encode_packet(stream)) != rk_success) {
            rk_freepa(payload);
            return rk_error_wrap(err, "encode packet");
        }
    }

    psize = size;
    ppayload = payload;

    return err;
}

rk_error_t RkPacket::decode(RkBuffer* stream)
{
    return rk_error_new(ERROR_SYSTEM_PACKET_INVALID, "decode");
}

int RkPacket::get_prefer_cid()
{
    return 0;
}

int RkPacket::get_message_type()
{
    return 0;
}

int RkPacket::get_size()
{
    return 0;
}

rk_error_t RkPacket::encode_packet(RkBuffer* stream)
{
    return rk_error_new(ERROR_SYSTEM_PACKET_INVALID, "encode");
}

RkSetChunkSizePacket::RkSetChunkSizePacket()
{
    chunk_size = RK_CONSTS_RTMP_PROTOCOL_CHUNK_SIZE;
}

RkSetChunkSizePacket::~RkSetChunkSizePacket()
{
}

rk_error_t RkSetChunkSizePacket::decode(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "requires 4 only %d bytes", stream->left());
    }

    chunk_size = (uint32_t)stream->read_4bytes();

    if ((chunk_size & RK_RTMP_CHUNK_SIZE_RESERVED_BIT) != 0) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "invalid chunk size %#x, bit 31 set", chunk_size);
    }

    return rk_success;
}

RkRtmpMessageKind RkSetChunkSizePacket::kind()
{
    return RkRtmpMessageSetChunkSize;
}

int RkSetChunkSizePacket::get_prefer_cid()
{
    return RTMP_CID_ProtocolControl;
}

int RkSetChunkSizePacket::get_message_type()
{
    return RTMP_MSG_SetChunkSize;
}

int RkSetChunkSizePacket::get_size()
{
    return 4;
}

rk_error_t RkSetChunkSizePacket::encode_packet(RkBuffer* stream)
{
    if ((chunk_size & RK_RTMP_CHUNK_SIZE_RESERVED_BIT) != 0) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "invalid chunk size %#x, bit 31 set", chunk_size);
    }

    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "requires 4 only %d bytes", stream->left());
    }

    stream->write_4bytes(chunk_size);

    return rk_success;
}

RkAbortMessagePacket::RkAbortMessagePacket()
{
    stream_id = 0;
}

RkAbortMessagePacket::~RkAbortMessagePacket()
{
}

rk_error_t RkAbortMessagePacket::decode(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "abort requires 4 only %d bytes", stream->left());
    }

    stream_id = (uint32_t)stream->read_4bytes();

    return rk_success;
}

RkRtmpMessageKind RkAbortMessagePacket::kind()
{
    return RkRtmpMessageAbort;
}

int RkAbortMessagePacket::get_prefer_cid()
{
    return RTMP_CID_ProtocolControl;
}

int RkAbortMessagePacket::get_message_type()
{
    return RTMP_MSG_AbortMessage;
}

int RkAbortMessagePacket::get_size()
{
    return 4;
}

rk_error_t RkAbortMessagePacket::encode_packet(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "abort requires 4 only %d bytes", stream->left());
    }

    stream->write_4bytes(stream_id);

    return rk_success;
}

RkAcknowledgementPacket::RkAcknowledgementPacket()
{
    sequence_number = 0;
}

RkAcknowledgementPacket::~RkAcknowledgementPacket()
{
}

rk_error_t RkAcknowledgementPacket::decode(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "requires 4 only %d bytes", stream->left());
    }

    sequence_number = (uint32_t)stream->read_4bytes();

    return rk_success;
}

RkRtmpMessageKind RkAcknowledgementPacket::kind()
{
    return RkRtmpMessageAcknowledgement;
}

int RkAcknowledgementPacket::get_prefer_cid()
{
    return RTMP_CID_ProtocolControl;
}

int RkAcknowledgementPacket::get_message_type()
{
    return RTMP_MSG_Acknowledgement;
}

int RkAcknowledgementPacket::get_size()
{
    return 4;
}

rk_error_t RkAcknowledgementPacket::encode_packet(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "requires 4 only %d bytes", stream->left());
    }

    stream->write_4bytes(sequence_number);

    return rk_success;
}

RkSetWindowAckSizePacket::RkSetWindowAckSizePacket()
{
    ackowledgement_window_size = 0;
}

RkSetWindowAckSizePacket::~RkSetWindowAckSizePacket()
{
}

rk_error_t RkSetWindowAckSizePacket::decode(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "requires 4 only %d bytes", stream->left());
    }

    ackowledgement_window_size = (uint32_t)stream->read_4bytes();

    return rk_success;
}

RkRtmpMessageKind RkSetWindowAckSizePacket::kind()
{
    return RkRtmpMessageWindowAckSize;
}

int RkSetWindowAckSizePacket::get_prefer_cid()
{
    return RTMP_CID_ProtocolControl;
}

int RkSetWindowAckSizePacket::get_message_type()
{
    return RTMP_MSG_WindowAcknowledgementSize;
}

int RkSetWindowAckSizePacket::get_size()
{
    return 4;
}

rk_error_t RkSetWindowAckSizePacket::encode_packet(RkBuffer* stream)
{
    if (!stream->require(4)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "requires 4 only %d bytes", stream->left());
    }

    stream->write_4bytes(ackowledgement_window_size);

    return rk_success;
}

string rk_peer_bandwidth_type_str(RkPeerBandwidthType type)
{
    switch (type) {
        case RkPeerBandwidthHard: return "hard";
        case RkPeerBandwidthSoft: return "soft";
        case RkPeerBandwidthDynamic: return "dynamic";
    }
    return "unknown";
}

RkSetPeerBandwidthPacket::RkSetPeerBandwidthPacket()
{
    bandwidth = 0;
    type = RkPeerBandwidthDynamic;
}

RkSetPeerBandwidthPacket::~RkSetPeerBandwidthPacket()
{
}

rk_error_t RkSetPeerBandwidthPacket::decode(RkBuffer* stream)
{
    if (!stream->require(5)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "requires 5 only %d bytes", stream->left());
    }

    bandwidth = (uint32_t)stream->read_4bytes();

    uint8_t limit_type = (uint8_t)stream->read_1bytes();
    if (limit_type > RkPeerBandwidthDynamic) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "invalid limit type %d", limit_type);
    }
    type = (RkPeerBandwidthType)limit_type;

    return rk_success;
}

RkRtmpMessageKind RkSetPeerBandwidthPacket::kind()
{
    return RkRtmpMessageSetPeerBandwidth;
}

int RkSetPeerBandwidthPacket::get_prefer_cid()
{
    return RTMP_CID_ProtocolControl;
}

int RkSetPeerBandwidthPacket::get_message_type()
{
    return RTMP_MSG_SetPeerBandwidth;
}

int RkSetPeerBandwidthPacket::get_size()
{
    return 5;
}

rk_error_t RkSetPeerBandwidthPacket::encode_packet(RkBuffer* stream)
{
    if (!stream->require(5)) {
        return rk_error_new(ERROR_RTMP_MESSAGE_ENCODE, "requires 5 only %d bytes", stream->left());
    }

    stream->write_4bytes(bandwidth);
    stream->write_1bytes((int8_t)type);

    return rk_success;
}

RkOnMetaDataPacket::RkOnMetaDataPacket()
{
    name = RK_CONSTS_RTMP_ON_METADATA;
    metadata = RkAmf0Any::object();
}

RkOnMetaDataPacket::~RkOnMetaDataPacket()
{
    rk_freep(metadata);
}

rk_error_t RkOnMetaDataPacket::decode(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if ((err = rk_rtmp_read_data_command(stream, name)) != rk_success) {
        return rk_error_wrap(err, "name");
    }

    // The metadata maybe object or ecma array.
    RkAmf0Any* any = NULL;
    if ((err = rk_amf0_read_any(stream, &any)) != rk_success) {
        return rk_error_wrap(err, "metadata");
    }
    RkAutoFree(RkAmf0Any, any);

    if (any->is_object()) {
        rk_freep(metadata);
        metadata = any->to_object();
        any = NULL;
        return err;
    }

    if (!any->is_ecma_array()) {
        return rk_error_new(ERROR_RTMP_MESSAGE_DECODE, "metadata marker=%#x not object or ecma array", (uint8_t)any->marker);
    }

    RkAmf0Map* arr = any->to_map();
    metadata->clear();
    for (int i = 0; i < arr->count(); i++) {
        metadata->set(arr->key_at(i), arr->value_at(i)->copy());
    }

    return err;
}

RkRtmpMessageKind RkOnMetaDataPacket::kind()
{
    return RkRtmpMessageOnMetaData;
}

int RkOnMetaDataPacket::get_prefer_cid()
{
    return RTMP_CID_OverConnection2;
}

int RkOnMetaDataPacket::get_message_type()
{
    return RTMP_MSG_AMF0DataMessage;
}

int RkOnMetaDataPacket::get_size()
{
    return RkAmf0Size::str(name) + RkAmf0Size::object(metadata);
}

rk_error_t RkOnMetaDataPacket::encode_packet(RkBuffer* stream)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_write_string(stream, name)) != rk_success) {
        return rk_error_wrap(err, "name");
    }

    if ((err = metadata->write(stream)) != rk_success) {
        return rk_error_wrap(err, "metadata");
    }

    return err;
}

rk_error_t rk_rtmp_read_data_command(RkBuffer* stream, std::string& command)
{
    rk_error_t err = rk_success;

    if ((err = rk_amf0_read_string(stream, command)) != rk_success) {
        return rk_error_wrap(err, "command");
    }

    // The @setDataFrame wraps the real command, for example, the onMetaData from encoder.
    if (command == RK_CONSTS_RTMP_SET_DATAFRAME && (err = rk_amf0_read_string(stream, command)) != rk_success) {
        return rk_error_wrap(err, "command in %s", RK_CONSTS_RTMP_SET_DATAFRAME);
    }

    return err;
}

rk_error_t rk_rtmp_decode_message(int message_type, char* payload, int size, RkPacket** ppacket)
{
    rk_error_t err = rk_success;

    // Identify the data message by its command, only the onMetaData is supported.
    if (message_type == RTMP_MSG_AMF0DataMessage) {
        RkBuffer stream(payload, size);

        std::string command;
        if ((err = rk_rtmp_read_data_command(&stream, command)) != rk_success) {
            return rk_error_wrap(err, "decode message type=%d, size=%d", message_type, size);
        }

        if (command != RK_CONSTS_RTMP_ON_METADATA) {
            rk_warn("drop data message command=%s, size=%d", command.c_str(), size);
            return rk_error_new(ERROR_RTMP_MESSAGE_TYPE, "unsupported data command=%s", command.c_str());
        }
    }

    RkPacket* packet = NULL;
    switch (message_type) {
        case RTMP_MSG_SetChunkSize: packet = new RkSetChunkSizePacket(); break;
        case RTMP_MSG_AbortMessage: packet = new RkAbortMessagePacket(); break;
        case RTMP_MSG_Acknowledgement: packet = new RkAcknowledgementPacket(); break;
        case RTMP_MSG_WindowAcknowledgementSize: packet = new RkSetWindowAckSizePacket(); break;
        case RTMP_MSG_SetPeerBandwidth: packet = new RkSetPeerBandwidthPacket(); break;
        case RTMP_MSG_AMF0DataMessage: packet = new RkOnMetaDataPacket(); break;
        default:
            rk_warn("drop message type=%d, size=%d", message_type, size);
            return rk_error_new(ERROR_RTMP_MESSAGE_TYPE, "unsupported message type=%d", message_type);
    }

    RkBuffer stream(payload, size);
    if ((err = packet->decode(&stream)) != rk_success) {
        rk_freep(packet);
        return rk_error_wrap(err, "decode message type=%d, size=%d", message_type, size);
    }

    *ppacket = packet;

    return err;
}
