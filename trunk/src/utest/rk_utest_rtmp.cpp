//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//
#include <rk_utest.hpp>

#include <string>
using namespace std;

#include <rk_core_autofree.hpp>
#include <rk_kernel_error.hpp>
#include <rk_kernel_buffer.hpp>
#include <rk_kernel_consts.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_protocol_amf0.hpp>
#include <rk_rtmp_stack.hpp>
#include <rk_rtmp_metadata.hpp>

VOID TEST(ProtocolStackTest, AbortEncode)
{
    rk_error_t err;

    RkAbortMessagePacket pkt;
    pkt.stream_id = 523;

    EXPECT_EQ(RkRtmpMessageAbort, pkt.kind());
    EXPECT_EQ(RTMP_MSG_AbortMessage, pkt.get_message_type());
    EXPECT_EQ(RTMP_CID_ProtocolControl, pkt.get_prefer_cid());
    EXPECT_EQ(4, pkt.get_size());

    int size = 0;
    char* payload = NULL;
    HELPER_ASSERT_SUCCESS(pkt.encode(size, payload));
    RkAutoFreeA(char, payload);

    EXPECT_EQ(4, size);
    EXPECT_STREQ("00 00 02 0b", rk_string_dumps_hex(payload, size).c_str());
}

VOID TEST(ProtocolStackTest, AbortDecode)
{
    rk_error_t err;

    uint8_t data[] = {0x00, 0x00, 0x02, 0x0b};
    RkBuffer s((char*)data, sizeof(data));

    RkAbortMessagePacket pkt;
    HELPER_EXPECT_SUCCESS(pkt.decode(&s));
    EXPECT_EQ(523, (int)pkt.stream_id);
    EXPECT_TRUE(s.empty());
}

VOID TEST(ProtocolStackTest, AbortBoundary)
{
    rk_error_t err;

    uint32_t ids[] = {0, 1, 3, 0x7fffffff, 0x80000000, 0xffffffff};
    for (int i = 0; i < (int)(sizeof(ids) / sizeof(uint32_t)); i++) {
        RkAbortMessagePacket pkt;
        pkt.stream_id = ids[i];

        int size = 0;
        char* payload = NULL;
        HELPER_ASSERT_SUCCESS(pkt.encode(size, payload));
        RkAutoFreeA(char, payload);

        RkPacket* packet = NULL;
        HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_AbortMessage, payload, size, &packet));
        RkAutoFree(RkPacket, packet);

        ASSERT_EQ(RkRtmpMessageAbort, packet->kind());
        EXPECT_EQ(ids[i], dynamic_cast<RkAbortMessagePacket*>(packet)->stream_id);
    }
}

VOID TEST(ProtocolStackTest, AbortTruncated)
{
    rk_error_t err;

    char data[4] = {0};
    for (int i = 0; i < 4; i++) {
        RkBuffer s(data, i);

        RkAbortMessagePacket pkt;
        err = pkt.decode(&s);
        EXPECT_TRUE(rk_success != err);
        EXPECT_TRUE(rk_is_deserialization_error(err));
        EXPECT_FALSE(rk_is_serialization_error(err));
        EXPECT_EQ(ERROR_RTMP_MESSAGE_DECODE, rk_error_code(err));
        rk_freep(err);
    }

    // Decode by message type, the code is kept by the wrapper.
    for (int i = 0; i < 4; i++) {
        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AbortMessage, data, i, &packet);
        EXPECT_TRUE(rk_is_deserialization_error(err));
        EXPECT_TRUE(packet == NULL);
        rk_freep(err);
    }
}

VOID TEST(ProtocolStackTest, EncodeToSmallStream)
{
    rk_error_t err;

    char data[4];

    if (true) {
        RkAbortMessagePacket pkt;
        RkBuffer s(data, 3);
        err = pkt.encode_packet(&s);
        EXPECT_TRUE(rk_is_serialization_error(err));
        rk_freep(err);
    }

    if (true) {
        RkSetPeerBandwidthPacket pkt;
        RkBuffer s(data, 4);
        HELPER_EXPECT_FAILED_CODE(pkt.encode_packet(&s), ERROR_RTMP_MESSAGE_ENCODE);
    }

    if (true) {
        RkOnMetaDataPacket pkt;
        pkt.metadata->set("width", RkAmf0Any::number(1280));
        RkBuffer s(data, 4);
        err = pkt.encode_packet(&s);
        EXPECT_TRUE(rk_is_serialization_error(err));
        rk_freep(err);
    }
}

VOID TEST(ProtocolStackTest, SetChunkSize)
{
    rk_error_t err;

    RkSetChunkSizePacket pkt;
    EXPECT_EQ(RK_CONSTS_RTMP_PROTOCOL_CHUNK_SIZE, (int)pkt.chunk_size);

    pkt.chunk_size = 60000;
    int size = 0;
    char* payload = NULL;
    HELPER_ASSERT_SUCCESS(pkt.encode(size, payload));
    RkAutoFreeA(char, payload);
    EXPECT_STREQ("00 00 ea 60", rk_string_dumps_hex(payload, size).c_str());

    RkPacket* packet = NULL;
    HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_SetChunkSize, payload, size, &packet));
    RkAutoFree(RkPacket, packet);
    ASSERT_EQ(RkRtmpMessageSetChunkSize, packet->kind());
    EXPECT_EQ(60000, (int)dynamic_cast<RkSetChunkSizePacket*>(packet)->chunk_size);
}

VOID TEST(ProtocolStackTest, SetChunkSizeReservedBit)
{
    rk_error_t err;

    if (true) {
        uint8_t data[] = {0x80, 0x00, 0x10, 0x00};
        RkBuffer s((char*)data, sizeof(data));

        RkSetChunkSizePacket pkt;
        HELPER_EXPECT_FAILED_CODE(pkt.decode(&s), ERROR_RTMP_MESSAGE_DECODE);
    }

    if (true) {
        char data[4];
        RkBuffer s(data, sizeof(data));

        RkSetChunkSizePacket pkt;
        pkt.chunk_size = 0x80001000;
        HELPER_EXPECT_FAILED_CODE(pkt.encode_packet(&s), ERROR_RTMP_MESSAGE_ENCODE);
    }
}

VOID TEST(ProtocolStackTest, Acknowledgement)
{
    rk_error_t err;

    RkAcknowledgementPacket pkt;
    pkt.sequence_number = 0x01020304;
    EXPECT_EQ(RTMP_MSG_Acknowledgement, pkt.get_message_type());

    int size = 0;
    char* payload = NULL;
    HELPER_ASSERT_SUCCESS(pkt.encode(size, payload));
    RkAutoFreeA(char, payload);
    EXPECT_STREQ("01 02 03 04", rk_string_dumps_hex(payload, size).c_str());

    RkPacket* packet = NULL;
    HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_Acknowledgement, payload, size, &packet));
    RkAutoFree(RkPacket, packet);
    ASSERT_EQ(RkRtmpMessageAcknowledgement, packet->kind());
    EXPECT_EQ(0x01020304, (int)dynamic_cast<RkAcknowledgementPacket*>(packet)->sequence_number);
}

VOID TEST(ProtocolStackTest, WindowAckSize)
{
    rk_error_t err;

    RkSetWindowAckSizePacket pkt;
    pkt.ackowledgement_window_size = 2500000;
    EXPECT_EQ(RTMP_MSG_WindowAcknowledgementSize, pkt.get_message_type());
    EXPECT_EQ(RTMP_CID_ProtocolControl, pkt.get_prefer_cid());

    int size = 0;
    char* payload = NULL;
    HELPER_ASSERT_SUCCESS(pkt.encode(size, payload));
    RkAutoFreeA(char, payload);
    EXPECT_STREQ("00 26 25 a0", rk_string_dumps_hex(payload, size).c_str());

    RkPacket* packet = NULL;
    HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_WindowAcknowledgementSize, payload, size, &packet));
    RkAutoFree(RkPacket, packet);
    ASSERT_EQ(RkRtmpMessageWindowAckSize, packet->kind());
    EXPECT_EQ(2500000, (int)dynamic_cast<RkSetWindowAckSizePacket*>(packet)->ackowledgement_window_size);
}

VOID TEST(ProtocolStackTest, SetPeerBandwidth)
{
    rk_error_t err;

    EXPECT_STREQ("hard", rk_peer_bandwidth_type_str(RkPeerBandwidthHard).c_str());
    EXPECT_STREQ("soft", rk_peer_bandwidth_type_str(RkPeerBandwidthSoft).c_str());
    EXPECT_STREQ("dynamic", rk_peer_bandwidth_type_str(RkPeerBandwidthDynamic).c_str());

    // All limit types.
    for (int i = 0; i <= 2; i++) {
        uint8_t data[] = {0x00, 0x26, 0x25, 0xa0, (uint8_t)i};
        RkBuffer s((char*)data, sizeof(data));

        RkSetPeerBandwidthPacket pkt;
        HELPER_EXPECT_SUCCESS(pkt.decode(&s));
        EXPECT_EQ(2500000, (int)pkt.bandwidth);
        EXPECT_EQ(i, (int)pkt.type);
    }

    // Invalid limit type.
    if (true) {
        uint8_t data[] = {0x00, 0x26, 0x25, 0xa0, 0x03};
        RkBuffer s((char*)data, sizeof(data));

        RkSetPeerBandwidthPacket pkt;
        HELPER_EXPECT_FAILED_CODE(pkt.decode(&s), ERROR_RTMP_MESSAGE_DECODE);
    }

    // Truncated.
    if (true) {
        uint8_t data[] = {0x00, 0x26, 0x25, 0xa0};
        RkBuffer s((char*)data, sizeof(data));

        RkSetPeerBandwidthPacket pkt;
        HELPER_EXPECT_FAILED_CODE(pkt.decode(&s), ERROR_RTMP_MESSAGE_DECODE);
    }
}

VOID TEST(ProtocolStackTest, DecodeUnknownType)
{
    rk_error_t err;

    char data[4] = {0};
    int types[] = {0, 4, 7, 8, 9, 15, 17, 20, 22, 255};
    for (int i = 0; i < (int)(sizeof(types) / sizeof(int)); i++) {
        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(types[i], data, sizeof(data), &packet);
        EXPECT_EQ(ERROR_RTMP_MESSAGE_TYPE, rk_error_code(err));
        EXPECT_FALSE(rk_is_deserialization_error(err));
        EXPECT_TRUE(packet == NULL);
        rk_freep(err);
    }
}

VOID TEST(ProtocolStackTest, OnMetaDataObject)
{
    rk_error_t err;

    RkOnMetaDataPacket src;
    EXPECT_STREQ(RK_CONSTS_RTMP_ON_METADATA, src.name.c_str());
    EXPECT_EQ(RTMP_MSG_AMF0DataMessage, src.get_message_type());
    EXPECT_EQ(RTMP_CID_OverConnection2, src.get_prefer_cid());

    src.metadata->set("width", RkAmf0Any::number(1280));
    src.metadata->set("height", RkAmf0Any::number(720));
    src.metadata->set("encoder", RkAmf0Any::str("obs-output module"));

    int size = 0;
    char* payload = NULL;
    HELPER_ASSERT_SUCCESS(src.encode(size, payload));
    RkAutoFreeA(char, payload);
    EXPECT_EQ(src.get_size(), size);

    RkPacket* packet = NULL;
    HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, size, &packet));
    RkAutoFree(RkPacket, packet);
    ASSERT_EQ(RkRtmpMessageOnMetaData, packet->kind());

    RkOnMetaDataPacket* pkt = dynamic_cast<RkOnMetaDataPacket*>(packet);
    EXPECT_STREQ(RK_CONSTS_RTMP_ON_METADATA, pkt->name.c_str());
    ASSERT_EQ(3, pkt->metadata->count());

    RkAmf0Any* prop = rk_utest_find_property(pkt->metadata, "height");
    ASSERT_TRUE(prop && prop->is_number());
    EXPECT_EQ(720, prop->to_number());
}

VOID TEST(ProtocolStackTest, OnMetaDataSetDataFrame)
{
    rk_error_t err;

    // FMLE and OBS send the @setDataFrame with an ECMA array.
    RkAmf0EcmaArray* arr = RkAmf0Any::ecma_array();
    RkAutoFree(RkAmf0EcmaArray, arr);
    arr->set("width", RkAmf0Any::number(1920));
    arr->set("height", RkAmf0Any::number(1080));
    arr->set("framerate", RkAmf0Any::number(30));
    arr->set("stereo", RkAmf0Any::boolean(true));

    int size = RkAmf0Size::str(RK_CONSTS_RTMP_SET_DATAFRAME) + RkAmf0Size::str(RK_CONSTS_RTMP_ON_METADATA) + arr->total_size();
    char* payload = new char[size];
    RkAutoFreeA(char, payload);

    if (true) {
        RkBuffer s(payload, size);
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_SET_DATAFRAME));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_ON_METADATA));
        HELPER_ASSERT_SUCCESS(arr->write(&s));
        ASSERT_TRUE(s.empty());
    }

    RkPacket* packet = NULL;
    HELPER_ASSERT_SUCCESS(rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, size, &packet));
    RkAutoFree(RkPacket, packet);

    RkOnMetaDataPacket* pkt = dynamic_cast<RkOnMetaDataPacket*>(packet);
    ASSERT_TRUE(pkt != NULL);
    EXPECT_STREQ(RK_CONSTS_RTMP_ON_METADATA, pkt->name.c_str());
    ASSERT_EQ(4, pkt->metadata->count());

    // The same fields as a plain object.
    RkAmf0Object* obj = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, obj);
    obj->set("width", RkAmf0Any::number(1920));
    obj->set("height", RkAmf0Any::number(1080));
    obj->set("framerate", RkAmf0Any::number(30));
    obj->set("stereo", RkAmf0Any::boolean(true));

    RkStreamMetadata a, b;
    a.from_properties(pkt->metadata);
    b.from_properties(obj);
    EXPECT_EQ(4, a.count());
    EXPECT_TRUE(a == b);
}

VOID TEST(ProtocolStackTest, OnMetaDataInvalid)
{
    rk_error_t err;

    // The metadata is neither object nor ECMA array.
    if (true) {
        char payload[32];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_ON_METADATA));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_number(&s, 1.0));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_EQ(ERROR_RTMP_MESSAGE_DECODE, rk_error_code(err));
        EXPECT_TRUE(packet == NULL);
        rk_freep(err);
    }

    // Without the metadata.
    if (true) {
        char payload[32];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_ON_METADATA));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_TRUE(rk_is_deserialization_error(err));
        rk_freep(err);
    }

    // Empty payload.
    if (true) {
        char payload[1];
        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, 0, &packet);
        EXPECT_TRUE(rk_is_deserialization_error(err));
        rk_freep(err);
    }
}

VOID TEST(ProtocolStackTest, OnMetaDataDeepNesting)
{
    rk_error_t err;

    // The onMetaData then an object, each level nests an object with key k.
    string payload("\x02\x00\x0a" "onMetaData" "\x03", 14);
    for (int i = 0; i < 100000; i++) {
        payload.append("\x00\x01k\x03", 4);
    }

    RkPacket* packet = NULL;
    err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, (char*)payload.data(), (int)payload.length(), &packet);
    EXPECT_TRUE(rk_is_deserialization_error(err));
    EXPECT_TRUE(packet == NULL);
    rk_freep(err);
}

VOID TEST(ProtocolStackTest, DataMessageCommands)
{
    rk_error_t err;

    // The onCuePoint is not metadata.
    if (true) {
        RkAmf0Object* obj = RkAmf0Any::object();
        RkAutoFree(RkAmf0Object, obj);

        char payload[64];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, "onCuePoint"));
        HELPER_ASSERT_SUCCESS(obj->write(&s));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_EQ(ERROR_RTMP_MESSAGE_TYPE, rk_error_code(err));
        EXPECT_FALSE(rk_is_deserialization_error(err));
        EXPECT_TRUE(packet == NULL);
        rk_freep(err);
    }

    // The |RtmpSampleAccess with two booleans is well-formed, but unsupported.
    if (true) {
        char payload[64];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, "|RtmpSampleAccess"));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_boolean(&s, true));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_boolean(&s, true));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_EQ(ERROR_RTMP_MESSAGE_TYPE, rk_error_code(err));
        EXPECT_TRUE(packet == NULL);
        rk_freep(err);
    }

    // The command wrapped by @setDataFrame is checked too.
    if (true) {
        char payload[64];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_SET_DATAFRAME));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, "onCuePoint"));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_null(&s));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_EQ(ERROR_RTMP_MESSAGE_TYPE, rk_error_code(err));
        rk_freep(err);
    }

    // The @setDataFrame without the command is malformed.
    if (true) {
        char payload[64];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_SET_DATAFRAME));

        RkPacket* packet = NULL;
        err = rk_rtmp_decode_message(RTMP_MSG_AMF0DataMessage, payload, s.pos(), &packet);
        EXPECT_TRUE(rk_is_deserialization_error(err));
        rk_freep(err);
    }

    // Read the command wrapped by @setDataFrame.
    if (true) {
        char payload[64];
        RkBuffer s(payload, sizeof(payload));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_SET_DATAFRAME));
        HELPER_ASSERT_SUCCESS(rk_amf0_write_string(&s, RK_CONSTS_RTMP_ON_METADATA));

        s.skip(-s.pos());
        string command;
        HELPER_EXPECT_SUCCESS(rk_rtmp_read_data_command(&s, command));
        EXPECT_STREQ(RK_CONSTS_RTMP_ON_METADATA, command.c_str());
        EXPECT_EQ(RkAmf0Size::str(RK_CONSTS_RTMP_SET_DATAFRAME) + RkAmf0Size::str(RK_CONSTS_RTMP_ON_METADATA), s.pos());
    }
}
