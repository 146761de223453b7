//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_CONSTS_HPP
#define RK_KERNEL_CONSTS_HPP

#include <rk_core.hpp>

///////////////////////////////////////////////////////////
// RTMP consts values
///////////////////////////////////////////////////////////
// 6. Chunking, RTMP protocol default chunk size.
#define RK_CONSTS_RTMP_PROTOCOL_CHUNK_SIZE 128
// The default chunk size for system.
#define RK_CONSTS_RTMP_RK_CHUNK_SIZE 60000

/**
 * 6. Chunking
 * The chunk size is configurable. It can be set using a control
 * message(Set Chunk Size) as described in section 7.1. The maximum
 * chunk size can be 65536 bytes and minimum 128 bytes. Larger values
 * reduce CPU usage, but also commit to larger writes that can delay
 * other content on lower bandwidth connections. Smaller chunks are not
 * good for high-bit rate streaming. Chunk size is maintained
 * independently for each direction.
 */
#define RK_CONSTS_RTMP_MIN_CHUNK_SIZE 128
#define RK_CONSTS_RTMP_MAX_CHUNK_SIZE 65536

// The default window acknowledgement size and peer bandwidth, in bytes.
#define RK_CONSTS_RTMP_WINDOW_ACK_SIZE 2500000
#define RK_CONSTS_RTMP_PEER_BANDWIDTH 2500000

// The data message name of metadata, and its wrapper sent by publisher.
#define RK_CONSTS_RTMP_ON_METADATA "onMetaData"
#define RK_CONSTS_RTMP_SET_DATAFRAME "@setDataFrame"

///////////////////////////////////////////////////////////
// The RTMP message types.
///////////////////////////////////////////////////////////
/**
 * 5. Protocol Control Messages
 * RTMP reserves message type IDs 1-7 for protocol control messages.
 * These messages contain information needed by the RTM Chunk Stream
 * protocol or RTMP itself. Protocol messages with IDs 1 & 2 are
 * reserved for usage with RTM Chunk Stream protocol. Protocol messages
 * with IDs 3-6 are reserved for usage of RTMP. Protocol message with ID
 * 7 is used between edge server and origin server.
 */
#define RTMP_MSG_SetChunkSize                   0x01
#define RTMP_MSG_AbortMessage                   0x02
#define RTMP_MSG_Acknowledgement                0x03
#define RTMP_MSG_UserControlMessage             0x04
#define RTMP_MSG_WindowAcknowledgementSize      0x05
#define RTMP_MSG_SetPeerBandwidth               0x06
#define RTMP_MSG_EdgeAndOriginServerCommand     0x07
/**
 * 3.1. Command message
 * Command messages carry the AMF-encoded commands between the client
 * and the server. These messages have been assigned message type value
 * of 20 for AMF0 encoding and message type value of 17 for AMF3
 * encoding.
 */
#define RTMP_MSG_AMF3CommandMessage             17 // 0x11
#define RTMP_MSG_AMF0CommandMessage             20 // 0x14
/**
 * 3.2. Data message
 * The client or the server sends this message to send Metadata or any
 * user data to the peer. Metadata includes details about the
 * data(audio, video etc.) like creation time, duration, theme and so
 * on. These messages have been assigned message type value of 18 for
 * AMF0 and message type value of 15 for AMF3.
 */
#define RTMP_MSG_AMF0DataMessage                18 // 0x12
#define RTMP_MSG_AMF3DataMessage                15 // 0x0F

///////////////////////////////////////////////////////////
// The chunk stream ids.
///////////////////////////////////////////////////////////
/**
 * the chunk stream id used for some under-layer message,
 * for example, the PC(protocol control) message.
 */
#define RTMP_CID_ProtocolControl                0x02
/**
 * the AMF0/AMF3 command message, invoke method and return the result, over NetConnection.
 * generally use 0x03.
 */
#define RTMP_CID_OverConnection                 0x03
/**
 * the AMF0/AMF3 command message, invoke method and return the result, over NetConnection,
 * the midst state(we guess).
 * rarely used, e.g. onStatus(NetStream.Play.Reset).
 */
#define RTMP_CID_OverConnection2                0x04

#endif
