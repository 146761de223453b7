//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_rtmp_transaction.hpp>

using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>

string rk_publish_request_type_str(RkPublishRequestType type)
{
    switch (type) {
        case RkPublishRequestLive: return "live";
        case RkPublishRequestRecord: return "record";
        case RkPublishRequestAppend: return "append";
    }
    return "unknown";
}

rk_error_t rk_publish_request_type_parse(const string& str, RkPublishRequestType& type)
{
    if (str == "live") {
        type = RkPublishRequestLive;
    } else if (str == "record") {
        type = RkPublishRequestRecord;
    } else if (str == "append") {
        type = RkPublishRequestAppend;
    } else {
        return rk_error_new(ERROR_RTMP_PUBLISH_TYPE, "invalid publish type %s", str.c_str());
    }

    return rk_success;
}

RkTransactionPurpose::RkTransactionPurpose(RkTransactionPurposeType type, const string& stream_key, RkPublishRequestType request_type)
{
    type_ = type;
    stream_key_ = stream_key;
    request_type_ = request_type;
}

RkTransactionPurpose RkTransactionPurpose::play(const string& stream_key)
{
    return RkTransactionPurpose(RkTransactionPurposePlay, stream_key, RkPublishRequestLive);
}

RkTransactionPurpose RkTransactionPurpose::publish(const string& stream_key, RkPublishRequestType request_type)
{
    return RkTransactionPurpose(RkTransactionPurposePublish, stream_key, request_type);
}

RkTransactionPurposeType RkTransactionPurpose::type() const
{
    return type_;
}

const string& RkTransactionPurpose::stream_key() const
{
    return stream_key_;
}

RkPublishRequestType RkTransactionPurpose::request_type() const
{
    rk_assert(type_ == RkTransactionPurposePublish);
    return request_type_;
}

string RkTransactionPurpose::describe() const
{
    switch (type_) {
        case RkTransactionPurposePlay:
            return "play key=" + stream_key_;
        case RkTransactionPurposePublish:
            return "publish(" + rk_publish_request_type_str(request_type_) + ") key=" + stream_key_;
    }
    return "unknown";
}

RkOutstandingTransaction::RkOutstandingTransaction()
{
}

RkOutstandingTransaction::~RkOutstandingTransaction()
{
}

RkConnectionRequestedTransaction::RkConnectionRequestedTransaction(const string& app)
{
    app_name = app;
}

RkConnectionRequestedTransaction::~RkConnectionRequestedTransaction()
{
}

RkOutstandingTransactionType RkConnectionRequestedTransaction::type() const
{
    return RkTransactionConnectionRequested;
}

string RkConnectionRequestedTransaction::describe() const
{
    return "connect app=" + app_name;
}

RkCreateStreamTransaction::RkCreateStreamTransaction(const RkTransactionPurpose& purpose) : purpose_(purpose)
{
}

RkCreateStreamTransaction::~RkCreateStreamTransaction()
{
}

RkOutstandingTransactionType RkCreateStreamTransaction::type() const
{
    return RkTransactionCreateStream;
}

string RkCreateStreamTransaction::describe() const
{
    return "createStream for " + purpose_.describe();
}

const RkTransactionPurpose& RkCreateStreamTransaction::purpose() const
{
    return purpose_;
}

rk_error_t rk_transaction_collision_parse(const string& str, RkTransactionCollisionPolicy& policy)
{
    if (str == "overwrite") {
        policy = RkTransactionCollisionOverwrite;
    } else if (str == "reject") {
        policy = RkTransactionCollisionReject;
    } else {
        return rk_error_new(ERROR_SYSTEM_CONFIG_INVALID, "invalid transaction collision %s", str.c_str());
    }

    return rk_success;
}

string rk_transaction_collision_str(RkTransactionCollisionPolicy policy)
{
    switch (policy) {
        case RkTransactionCollisionOverwrite: return "overwrite";
        case RkTransactionCollisionReject: return "reject";
    }
    return "unknown";
}

RkTransactionLedger::RkTransactionLedger(RkTransactionCollisionPolicy policy)
{
    policy_ = policy;
}

RkTransactionLedger::~RkTransactionLedger()
{
    clear();
}

void RkTransactionLedger::set_collision_policy(RkTransactionCollisionPolicy policy)
{
    policy_ = policy;
}

RkTransactionCollisionPolicy RkTransactionLedger::collision_policy()
{
    return policy_;
}

rk_error_t RkTransactionLedger::add(uint32_t tid, RkOutstandingTransaction* t)
{
    rk_assert(t);

    std::map<uint32_t, RkOutstandingTransaction*>::iterator it = transactions.find(tid);
    if (it == transactions.end()) {
        transactions[tid] = t;
        rk_info("transaction add tid=%u, %s, pending=%d", tid, t->describe().c_str(), (int)transactions.size());
        return rk_success;
    }

    RkOutstandingTransaction* prev = it->second;

    if (policy_ == RkTransactionCollisionReject) {
        rk_warn("transaction reject tid=%u, %s, pending %s", tid, t->describe().c_str(), prev->describe().c_str());
        rk_freep(t);
        return rk_error_new(ERROR_RTMP_TRANSACTION_EXISTS, "transaction tid=%u exists", tid);
    }

    rk_warn("transaction overwrite tid=%u, %s, drop %s", tid, t->describe().c_str(), prev->describe().c_str());
    rk_freep(prev);
    it->second = t;

    return rk_success;
}

rk_error_t RkTransactionLedger::take(uint32_t tid, RkOutstandingTransaction** pt)
{
    std::map<uint32_t, RkOutstandingTransaction*>::iterator it = transactions.find(tid);
    if (it == transactions.end()) {
        return rk_error_new(ERROR_RTMP_NO_REQUEST, "no request for tid=%u, pending=%d", tid, (int)transactions.size());
    }

    *pt = it->second;
    transactions.erase(it);

    return rk_success;
}

int RkTransactionLedger::size()
{
    return (int)transactions.size();
}

void RkTransactionLedger::clear()
{
    std::map<uint32_t, RkOutstandingTransaction*>::iterator it;
    for (it = transactions.begin(); it != transactions.end(); ++it) {
        RkOutstandingTransaction* t = it->second;
        rk_freep(t);
    }
    transactions.clear();
}
