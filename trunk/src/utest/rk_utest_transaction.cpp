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
#include <rk_rtmp_transaction.hpp>

// The transaction to count how many instances are freed.
class MockOutstandingTransaction : public RkOutstandingTransaction
{
public:
    int* nn_freed;
    string name;
public:
    MockOutstandingTransaction(int* n, string v) {
        nn_freed = n;
        name = v;
    }
    virtual ~MockOutstandingTransaction() {
        (*nn_freed)++;
    }
public:
    virtual RkOutstandingTransactionType type() const {
        return RkTransactionConnectionRequested;
    }
    virtual std::string describe() const {
        return "mock " + name;
    }
};

VOID TEST(ProtocolTransactionTest, PublishRequestType)
{
    rk_error_t err;

    EXPECT_STREQ("live", rk_publish_request_type_str(RkPublishRequestLive).c_str());
    EXPECT_STREQ("record", rk_publish_request_type_str(RkPublishRequestRecord).c_str());
    EXPECT_STREQ("append", rk_publish_request_type_str(RkPublishRequestAppend).c_str());

    RkPublishRequestType type = RkPublishRequestLive;
    HELPER_EXPECT_SUCCESS(rk_publish_request_type_parse("record", type));
    EXPECT_EQ(RkPublishRequestRecord, type);
    HELPER_EXPECT_SUCCESS(rk_publish_request_type_parse("append", type));
    EXPECT_EQ(RkPublishRequestAppend, type);
    HELPER_EXPECT_SUCCESS(rk_publish_request_type_parse("live", type));
    EXPECT_EQ(RkPublishRequestLive, type);

    // Case sensitive and never changes the type when failed.
    HELPER_EXPECT_FAILED_CODE(rk_publish_request_type_parse("Live", type), ERROR_RTMP_PUBLISH_TYPE);
    HELPER_EXPECT_FAILED_CODE(rk_publish_request_type_parse("", type), ERROR_RTMP_PUBLISH_TYPE);
    EXPECT_EQ(RkPublishRequestLive, type);
}

VOID TEST(ProtocolTransactionTest, Purpose)
{
    RkTransactionPurpose play = RkTransactionPurpose::play("livestream");
    EXPECT_EQ(RkTransactionPurposePlay, play.type());
    EXPECT_STREQ("livestream", play.stream_key().c_str());
    EXPECT_STREQ("play key=livestream", play.describe().c_str());

    RkTransactionPurpose publish = RkTransactionPurpose::publish("cam1", RkPublishRequestAppend);
    EXPECT_EQ(RkTransactionPurposePublish, publish.type());
    EXPECT_STREQ("cam1", publish.stream_key().c_str());
    EXPECT_EQ(RkPublishRequestAppend, publish.request_type());
    EXPECT_STREQ("publish(append) key=cam1", publish.describe().c_str());

    // The copy is the same purpose.
    RkTransactionPurpose cp = publish;
    EXPECT_EQ(RkTransactionPurposePublish, cp.type());
    EXPECT_STREQ("cam1", cp.stream_key().c_str());
}

VOID TEST(ProtocolTransactionTest, Transactions)
{
    if (true) {
        RkConnectionRequestedTransaction t("live");
        EXPECT_EQ(RkTransactionConnectionRequested, t.type());
        EXPECT_STREQ("live", t.app_name.c_str());
        EXPECT_STREQ("connect app=live", t.describe().c_str());
    }

    if (true) {
        RkCreateStreamTransaction t(RkTransactionPurpose::publish("livestream", RkPublishRequestLive));
        EXPECT_EQ(RkTransactionCreateStream, t.type());
        EXPECT_EQ(RkTransactionPurposePublish, t.purpose().type());
        EXPECT_STREQ("livestream", t.purpose().stream_key().c_str());
        EXPECT_STREQ("createStream for publish(live) key=livestream", t.describe().c_str());
    }

    // Inspected through a const handle, as a lookup result would be.
    if (true) {
        RkCreateStreamTransaction t(RkTransactionPurpose::play("livestream"));
        const RkOutstandingTransaction& ct = t;
        EXPECT_EQ(RkTransactionCreateStream, ct.type());
        EXPECT_STREQ("createStream for play key=livestream", ct.describe().c_str());

        const RkCreateStreamTransaction& cs = t;
        EXPECT_EQ(RkTransactionPurposePlay, cs.purpose().type());
    }
}

VOID TEST(ProtocolTransactionTest, AddAndTake)
{
    rk_error_t err;

    RkTransactionLedger ledger;
    EXPECT_EQ(0, ledger.size());
    EXPECT_EQ(RkTransactionCollisionOverwrite, ledger.collision_policy());

    HELPER_EXPECT_SUCCESS(ledger.add(7, new RkConnectionRequestedTransaction("live")));
    HELPER_EXPECT_SUCCESS(ledger.add(8, new RkCreateStreamTransaction(RkTransactionPurpose::play("livestream"))));
    EXPECT_EQ(2, ledger.size());

    if (true) {
        RkOutstandingTransaction* t = NULL;
        HELPER_ASSERT_SUCCESS(ledger.take(7, &t));
        RkAutoFree(RkOutstandingTransaction, t);

        ASSERT_EQ(RkTransactionConnectionRequested, t->type());
        EXPECT_STREQ("live", dynamic_cast<RkConnectionRequestedTransaction*>(t)->app_name.c_str());
        EXPECT_EQ(1, ledger.size());
    }

    // Consumed only once.
    if (true) {
        RkOutstandingTransaction* t = NULL;
        err = ledger.take(7, &t);
        EXPECT_TRUE(rk_is_unknown_transaction(err));
        EXPECT_EQ(ERROR_RTMP_NO_REQUEST, rk_error_code(err));
        EXPECT_TRUE(t == NULL);
        rk_freep(err);
    }

    if (true) {
        RkOutstandingTransaction* t = NULL;
        HELPER_ASSERT_SUCCESS(ledger.take(8, &t));
        RkAutoFree(RkOutstandingTransaction, t);

        ASSERT_EQ(RkTransactionCreateStream, t->type());
        RkCreateStreamTransaction* cs = dynamic_cast<RkCreateStreamTransaction*>(t);
        EXPECT_EQ(RkTransactionPurposePlay, cs->purpose().type());
        EXPECT_STREQ("livestream", cs->purpose().stream_key().c_str());
    }

    EXPECT_EQ(0, ledger.size());
}

VOID TEST(ProtocolTransactionTest, TakeUnknown)
{
    rk_error_t err;

    RkTransactionLedger ledger;

    // Unknown tid is a recoverable error.
    RkOutstandingTransaction* t = NULL;
    HELPER_EXPECT_FAILED_CODE(ledger.take(0, &t), ERROR_RTMP_NO_REQUEST);
    HELPER_EXPECT_FAILED_CODE(ledger.take(0xffffffff, &t), ERROR_RTMP_NO_REQUEST);
    EXPECT_TRUE(t == NULL);
}

VOID TEST(ProtocolTransactionTest, CollisionOverwrite)
{
    rk_error_t err;

    int nn_freed = 0;

    RkTransactionLedger ledger;
    HELPER_EXPECT_SUCCESS(ledger.add(1, new MockOutstandingTransaction(&nn_freed, "first")));
    HELPER_EXPECT_SUCCESS(ledger.add(1, new MockOutstandingTransaction(&nn_freed, "second")));

    // The previous one is freed.
    EXPECT_EQ(1, nn_freed);
    EXPECT_EQ(1, ledger.size());

    RkOutstandingTransaction* t = NULL;
    HELPER_ASSERT_SUCCESS(ledger.take(1, &t));
    EXPECT_STREQ("mock second", t->describe().c_str());
    rk_freep(t);
    EXPECT_EQ(2, nn_freed);
}

VOID TEST(ProtocolTransactionTest, CollisionReject)
{
    rk_error_t err;

    int nn_freed = 0;

    RkTransactionLedger ledger(RkTransactionCollisionReject);
    EXPECT_EQ(RkTransactionCollisionReject, ledger.collision_policy());

    HELPER_EXPECT_SUCCESS(ledger.add(1, new MockOutstandingTransaction(&nn_freed, "first")));

    // The ledger frees the rejected one.
    HELPER_EXPECT_FAILED_CODE(ledger.add(1, new MockOutstandingTransaction(&nn_freed, "second")), ERROR_RTMP_TRANSACTION_EXISTS);
    EXPECT_EQ(1, nn_freed);
    EXPECT_EQ(1, ledger.size());

    RkOutstandingTransaction* t = NULL;
    HELPER_ASSERT_SUCCESS(ledger.take(1, &t));
    RkAutoFree(RkOutstandingTransaction, t);
    EXPECT_STREQ("mock first", t->describe().c_str());

    // Switch the policy at runtime.
    ledger.set_collision_policy(RkTransactionCollisionOverwrite);
    HELPER_EXPECT_SUCCESS(ledger.add(2, new MockOutstandingTransaction(&nn_freed, "third")));
    HELPER_EXPECT_SUCCESS(ledger.add(2, new MockOutstandingTransaction(&nn_freed, "fourth")));
    EXPECT_EQ(2, nn_freed);
}

VOID TEST(ProtocolTransactionTest, ClearAndDestroy)
{
    rk_error_t err;

    int nn_freed = 0;

    if (true) {
        RkTransactionLedger ledger;
        for (uint32_t i = 0; i < 5; i++) {
            HELPER_EXPECT_SUCCESS(ledger.add(i, new MockOutstandingTransaction(&nn_freed, "x")));
        }
        EXPECT_EQ(5, ledger.size());

        ledger.clear();
        EXPECT_EQ(0, ledger.size());
        EXPECT_EQ(5, nn_freed);

        HELPER_EXPECT_SUCCESS(ledger.add(1, new MockOutstandingTransaction(&nn_freed, "y")));
        HELPER_EXPECT_SUCCESS(ledger.add(2, new MockOutstandingTransaction(&nn_freed, "z")));
    }

    // The pending ones are freed with the ledger.
    EXPECT_EQ(7, nn_freed);
}

VOID TEST(ProtocolTransactionTest, CollisionPolicy)
{
    rk_error_t err;

    EXPECT_STREQ("overwrite", rk_transaction_collision_str(RkTransactionCollisionOverwrite).c_str());
    EXPECT_STREQ("reject", rk_transaction_collision_str(RkTransactionCollisionReject).c_str());

    RkTransactionCollisionPolicy policy = RkTransactionCollisionOverwrite;
    HELPER_EXPECT_SUCCESS(rk_transaction_collision_parse("reject", policy));
    EXPECT_EQ(RkTransactionCollisionReject, policy);
    HELPER_EXPECT_SUCCESS(rk_transaction_collision_parse("overwrite", policy));
    EXPECT_EQ(RkTransactionCollisionOverwrite, policy);

    HELPER_EXPECT_FAILED_CODE(rk_transaction_collision_parse("ignore", policy), ERROR_SYSTEM_CONFIG_INVALID);
    EXPECT_EQ(RkTransactionCollisionOverwrite, policy);
}
