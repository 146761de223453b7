//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_RTMP_STACK_HPP
#define RK_RTMP_STACK_HPP

#include <rk_core.hpp>

#include <string>

class RkBuffer;
class RkAmf0Object;

// The kind of RTMP message the codec supports, one for each packet class.
// @remark Consumers switch on the kind without a default, so a new kind is
//      flagged by the compiler at every consumer.
enum RkRtmpMessageKind
{
    RkRtmpMessageSetChunkSize = 0,
    RkRtmpMessageAbort,
    RkRtmpMessageAcknowledgement,
    RkRtmpMessageWindowAckSize,
    RkRtmpMessageSetPeerBandwidth,
    RkRtmpMessageOnMetaData,
};

// The decoded message from bytes, or the message to encode to bytes.
class RkPacket
{
public:
    RkPacket();
    virtual ~RkPacket();
public:
    // Encode the packet to a new payload of get_size() bytes by encode_packet.
    // @remark The payload is allocated by new[], user must free it by rk_freepa.
    virtual rk_error_t encode(int& size, char*& payload);
// Decode functions for concrete packet to override.
public:
    // The subpacket must override to decode packet from stream.
    // @remark never invoke the super.decode, it always failed.
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    // The kind of packet, to identify the concrete packet class.
    virtual RkRtmpMessageKind kind() = 0;
    // The preferred chunk stream id to send the message over, for example,
    // the protocol control messages prefer RTMP_CID_ProtocolControl.
    virtual int get_prefer_cid();
    // The subpacket must override to provide the right message type.
    // The message type set the RTMP message type in header.
    virtual int get_message_type();
public:
    // The subpacket can override to calc the packet size.
    virtual int get_size();
    // The subpacket can override to encode the payload to stream,
    // which fails when the stream is too small for the packet.
    // @remark never invoke the super.encode_packet, it always failed.
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

/**
 * 5.1. Set Chunk Size
 * Protocol control message 1, Set Chunk Size, is used to notify the
 * peer about the new maximum chunk size.
 */
class RkSetChunkSizePacket : public RkPacket
{
public:
    // The maximum chunk size can be 65536 bytes. The chunk size is
    // maintained independently for each direction.
    // @remark The bit 31 must be zero.
    uint32_t chunk_size;
public:
    RkSetChunkSizePacket();
    virtual ~RkSetChunkSizePacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

/**
 * 5.2. Abort Message (2)
 * Protocol control message 2, Abort Message, is used to notify the peer
 * if it is waiting for chunks to complete a message, then to discard
 * the partially received message over a chunk stream and abort
 * processing of that message.
 */
class RkAbortMessagePacket : public RkPacket
{
public:
    // The chunk stream id of the message to discard.
    uint32_t stream_id;
public:
    RkAbortMessagePacket();
    virtual ~RkAbortMessagePacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

/**
 * 5.3. Acknowledgement (3)
 * The client or the server sends the acknowledgment to the peer after
 * receiving bytes equal to the window size.
 */
class RkAcknowledgementPacket : public RkPacket
{
public:
    uint32_t sequence_number;
public:
    RkAcknowledgementPacket();
    virtual ~RkAcknowledgementPacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

/**
 * 5.5. Window Acknowledgement Size (5)
 * The client or the server sends this message to inform the peer which
 * window size to use when sending acknowledgment.
 */
class RkSetWindowAckSizePacket : public RkPacket
{
public:
    uint32_t ackowledgement_window_size;
public:
    RkSetWindowAckSizePacket();
    virtual ~RkSetWindowAckSizePacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

// 5.6. Set Peer Bandwidth (6)
enum RkPeerBandwidthType
{
    // The sender can mark this message hard (0), soft (1), or dynamic (2)
    // using the Limit type field.
    RkPeerBandwidthHard = 0,
    RkPeerBandwidthSoft = 1,
    RkPeerBandwidthDynamic = 2,
};

// Get the name of limit type, for example, "hard".
extern std::string rk_peer_bandwidth_type_str(RkPeerBandwidthType type);

/**
 * 5.6. Set Peer Bandwidth (6)
 * The client or the server sends this message to update the output
 * bandwidth of the peer.
 */
class RkSetPeerBandwidthPacket : public RkPacket
{
public:
    uint32_t bandwidth;
    RkPeerBandwidthType type;
public:
    RkSetPeerBandwidthPacket();
    virtual ~RkSetPeerBandwidthPacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

/**
 * The stream metadata.
 * FMLE: @setDataFrame
 * others: onMetaData
 */
class RkOnMetaDataPacket : public RkPacket
{
public:
    // Name of metadata. Set to "onMetaData"
    std::string name;
    // Metadata of stream.
    // @remark, never be NULL, an AMF0 object instance.
    RkAmf0Object* metadata;
public:
    RkOnMetaDataPacket();
    virtual ~RkOnMetaDataPacket();
// Decode functions for concrete packet to override.
public:
    virtual rk_error_t decode(RkBuffer* stream);
// Encode functions for concrete packet to override.
public:
    virtual RkRtmpMessageKind kind();
    virtual int get_prefer_cid();
    virtual int get_message_type();
public:
    virtual int get_size();
    virtual rk_error_t encode_packet(RkBuffer* stream);
};

// Read the command name of AMF0 data message, the @setDataFrame before it is skipped.
extern rk_error_t rk_rtmp_read_data_command(RkBuffer* stream, std::string& command);

// Decode the message payload to packet, by the message type from the de-chunking layer.
// @param ppacket Output the decoded packet, user must free it.
// @remark Return ERROR_RTMP_MESSAGE_TYPE for message type not supported, and for
//      data message whose command is not onMetaData, for example, the onCuePoint.
extern rk_error_t rk_rtmp_decode_message(int message_type, char* payload, int size, RkPacket** ppacket);

#endif
