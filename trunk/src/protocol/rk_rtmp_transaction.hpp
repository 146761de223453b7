//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_RTMP_TRANSACTION_HPP
#define RK_RTMP_TRANSACTION_HPP

#include <rk_core.hpp>

#include <map>
#include <string>

// The type of publish, which is the argument of the publish command.
enum RkPublishRequestType
{
    // Live data is published without recording it in a file.
    RkPublishRequestLive = 0,
    // The stream is published and the data is recorded to a new file.
    RkPublishRequestRecord,
    // The stream is published and the data is appended to a file.
    RkPublishRequestAppend,
};

// Get the publish type in string, for example, "live".
extern std::string rk_publish_request_type_str(RkPublishRequestType type);
// Parse the publish type from string, "live", "record" or "append".
// @remark Return ERROR_RTMP_PUBLISH_TYPE for other values.
extern rk_error_t rk_publish_request_type_parse(const std::string& str, RkPublishRequestType& type);

enum RkTransactionPurposeType
{
    RkTransactionPurposePlay = 0,
    RkTransactionPurposePublish,
};

// Why we request to create a stream, to play or to publish it.
// @remark The purpose is immutable once created.
class RkTransactionPurpose
{
private:
    RkTransactionPurposeType type_;
    std::string stream_key_;
    // Only for publish.
    RkPublishRequestType request_type_;
private:
    RkTransactionPurpose(RkTransactionPurposeType type, const std::string& stream_key, RkPublishRequestType request_type);
public:
    static RkTransactionPurpose play(const std::string& stream_key);
    static RkTransactionPurpose publish(const std::string& stream_key, RkPublishRequestType request_type);
public:
    RkTransactionPurposeType type() const;
    const std::string& stream_key() const;
    // @remark assert the type is publish.
    RkPublishRequestType request_type() const;
    // For log, for example, "publish(live) key=livestream".
    std::string describe() const;
};

enum RkOutstandingTransactionType
{
    RkTransactionConnectionRequested = 0,
    RkTransactionCreateStream,
};

// The request sent out which waits for the response from peer,
// to know how to handle the response of the same transaction id.
class RkOutstandingTransaction
{
public:
    RkOutstandingTransaction();
    virtual ~RkOutstandingTransaction();
public:
    virtual RkOutstandingTransactionType type() const = 0;
    // For log, for example, "connect app=live".
    virtual std::string describe() const = 0;
};

// We request to connect to the app.
class RkConnectionRequestedTransaction : public RkOutstandingTransaction
{
public:
    std::string app_name;
public:
    RkConnectionRequestedTransaction(const std::string& app);
    virtual ~RkConnectionRequestedTransaction();
public:
    virtual RkOutstandingTransactionType type() const;
    virtual std::string describe() const;
};

// We request to create stream, to play or publish after the stream is created.
class RkCreateStreamTransaction : public RkOutstandingTransaction
{
private:
    RkTransactionPurpose purpose_;
public:
    RkCreateStreamTransaction(const RkTransactionPurpose& purpose);
    virtual ~RkCreateStreamTransaction();
public:
    virtual RkOutstandingTransactionType type() const;
    virtual std::string describe() const;
public:
    const RkTransactionPurpose& purpose() const;
};

// How to handle a transaction id which is already pending.
enum RkTransactionCollisionPolicy
{
    // Free the previous one, and keep the new one.
    RkTransactionCollisionOverwrite = 0,
    // Keep the previous one, and fail the new one.
    RkTransactionCollisionReject,
};

// Parse the policy from string, "overwrite" or "reject".
// @remark Return ERROR_SYSTEM_CONFIG_INVALID for other values.
extern rk_error_t rk_transaction_collision_parse(const std::string& str, RkTransactionCollisionPolicy& policy);
extern std::string rk_transaction_collision_str(RkTransactionCollisionPolicy policy);

// The requests sent out, used to handle the response, one ledger for each connection.
// @remark Not thread safe, the connection owns and drives it.
class RkTransactionLedger
{
private:
    // key: transactionId
    // value: the request to handle the response.
    std::map<uint32_t, RkOutstandingTransaction*> transactions;
    RkTransactionCollisionPolicy policy_;
public:
    RkTransactionLedger(RkTransactionCollisionPolicy policy = RkTransactionCollisionOverwrite);
    virtual ~RkTransactionLedger();
public:
    virtual void set_collision_policy(RkTransactionCollisionPolicy policy);
    virtual RkTransactionCollisionPolicy collision_policy();
public:
    // Register the request t of transaction id tid.
    // @remark The ledger always owns the t, even if error, user should never free it.
    // @remark Return ERROR_RTMP_TRANSACTION_EXISTS when tid exists and the policy is reject.
    virtual rk_error_t add(uint32_t tid, RkOutstandingTransaction* t);
    // Remove and return the request of transaction id tid, which is consumed only once.
    // @param pt Output the request, user must free it.
    // @remark Return ERROR_RTMP_NO_REQUEST when tid not found.
    virtual rk_error_t take(uint32_t tid, RkOutstandingTransaction** pt);
    // The number of pending requests.
    virtual int size();
    // Free all pending requests, for example, when connection closed.
    virtual void clear();
};

#endif
