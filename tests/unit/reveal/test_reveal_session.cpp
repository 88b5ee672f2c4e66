/**
 * @file test_reveal_session.cpp
 * @brief Unit tests for the reveal session and the re-encryption gateway
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include "ledger_test_support.h"

using namespace trustledger;
using namespace trustledger::reveal;
using trustledger::testing::LedgerTest;
using trustledger::testing::kStartTime;

// ============================================================================
// Test Fixtures
// ============================================================================

class RevealSessionTest : public LedgerTest {
protected:
    RevealSessionTest()
        : carol_(Wallet::from_seed(ByteVec(32, 0xC0))),
          dave_(Wallet::from_seed(ByteVec(32, 0xD0))),
          gateway_(executor_, clock_),
          session_(directory_, gateway_) {}

    void SetUp() override {
        record(carol_.principal(), 6);
        record(carol_.principal(), 9);
        record(dave_.principal(), 2);
    }

    /** Advance the session to RequestingRemoteReencryption */
    void authorize_carol(const CiphertextHandle& h, Timestamp start = kStartTime) {
        const UserDecryptAuthorization& auth = session_.begin(h, system_, carol_.principal(), start);
        session_.authorize(carol_.public_key(), carol_.sign(auth.signing_digest()));
    }

    Wallet carol_;
    Wallet dave_;
    KmsGateway gateway_;
    RevealSession session_;
};

// ============================================================================
// Happy path
// ============================================================================

TEST_F(RevealSessionTest, RunRevealsAggregates) {
    const Principal carol = carol_.principal();
    EXPECT_EQ(session_.run(tracker_.get_total(carol), system_, carol_, kStartTime), 15u);
    session_.cancel();
    EXPECT_EQ(session_.run(tracker_.get_average(carol), system_, carol_, kStartTime), 7u);
    session_.cancel();
    EXPECT_EQ(session_.run(tracker_.get_by_index(carol, 1), system_, carol_, kStartTime), 9u);
    EXPECT_EQ(gateway_.requests_served(), 3u);
}

TEST_F(RevealSessionTest, StateSequence) {
    CiphertextHandle h = tracker_.get_total(carol_.principal());
    EXPECT_EQ(session_.state(), RevealState::Idle);

    const UserDecryptAuthorization& auth = session_.begin(h, system_, carol_.principal(), kStartTime);
    EXPECT_EQ(session_.state(), RevealState::AwaitingAuthorizationSignature);
    EXPECT_EQ(session_.handle(), h);
    EXPECT_TRUE(auth.covers(system_));

    session_.authorize(carol_.public_key(), carol_.sign(auth.signing_digest()));
    EXPECT_EQ(session_.state(), RevealState::RequestingRemoteReencryption);

    session_.request_reencryption();
    EXPECT_EQ(session_.state(), RevealState::OpeningLocally);

    EXPECT_EQ(session_.open(), 15u);
    EXPECT_EQ(session_.state(), RevealState::Completed);
    EXPECT_EQ(session_.value(), 15u);
    EXPECT_STREQ(reveal_state_name(session_.state()), "completed");
}

TEST_F(RevealSessionTest, CancelReturnsToIdle) {
    session_.begin(tracker_.get_total(carol_.principal()), system_, carol_.principal(), kStartTime);
    session_.cancel();
    EXPECT_EQ(session_.state(), RevealState::Idle);
    EXPECT_TRUE(session_.handle().is_empty());
    EXPECT_THROW(session_.value(), std::logic_error);
}

// ============================================================================
// Step ordering
// ============================================================================

TEST_F(RevealSessionTest, OutOfOrderStepsRejected) {
    EXPECT_THROW(session_.authorize(carol_.public_key(), ByteVec(64, 0)), std::logic_error);
    EXPECT_THROW(session_.request_reencryption(), std::logic_error);
    EXPECT_THROW(session_.open(), std::logic_error);

    session_.begin(tracker_.get_total(carol_.principal()), system_, carol_.principal(), kStartTime);
    EXPECT_THROW(session_.begin(tracker_.get_total(carol_.principal()), system_,
                                carol_.principal(), kStartTime),
                 std::logic_error);
    EXPECT_THROW(session_.open(), std::logic_error);
}

TEST_F(RevealSessionTest, ShortSignatureRejected) {
    session_.begin(tracker_.get_total(carol_.principal()), system_, carol_.principal(), kStartTime);
    EXPECT_THROW(session_.authorize(carol_.public_key(), ByteVec(10, 0)), std::invalid_argument);
    EXPECT_EQ(session_.state(), RevealState::AwaitingAuthorizationSignature);
}

// ============================================================================
// Denials
// ============================================================================

TEST_F(RevealSessionTest, BeginWithoutGrantDenied) {
    CiphertextHandle daves = tracker_.get_total(dave_.principal());
    EXPECT_LEDGER_ERROR(session_.begin(daves, system_, carol_.principal(), kStartTime),
                        TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
    EXPECT_EQ(session_.state(), RevealState::Idle);
}

TEST_F(RevealSessionTest, OfflineServiceResetsSession) {
    gateway_.set_online(false);
    authorize_carol(tracker_.get_total(carol_.principal()));
    EXPECT_LEDGER_ERROR(session_.request_reencryption(), TRUSTLEDGER_ERROR_REMOTE_SERVICE_UNAVAILABLE);
    EXPECT_EQ(session_.state(), RevealState::Idle);

    gateway_.set_online(true);
    EXPECT_EQ(session_.run(tracker_.get_total(carol_.principal()), system_, carol_, kStartTime), 15u);
}

TEST_F(RevealSessionTest, ForgedSignatureDenied) {
    const UserDecryptAuthorization& auth =
        session_.begin(tracker_.get_total(carol_.principal()), system_, carol_.principal(), kStartTime);
    session_.authorize(carol_.public_key(), dave_.sign(auth.signing_digest()));
    EXPECT_LEDGER_ERROR(session_.request_reencryption(), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
    EXPECT_EQ(session_.state(), RevealState::Idle);
}

TEST_F(RevealSessionTest, ExpiredAuthorizationDenied) {
    authorize_carol(tracker_.get_total(carol_.principal()), kStartTime - 2 * SECONDS_PER_DAY);
    EXPECT_LEDGER_ERROR(session_.request_reencryption(), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
}

TEST_F(RevealSessionTest, HolderKeyMismatchDenied) {
    const UserDecryptAuthorization& auth =
        session_.begin(tracker_.get_total(carol_.principal()), system_, carol_.principal(), kStartTime);
    session_.authorize(dave_.public_key(), dave_.sign(auth.signing_digest()));
    EXPECT_LEDGER_ERROR(session_.request_reencryption(), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
}

TEST_F(RevealSessionTest, GatewayDeniesUngrantedHolder) {
    // A well-formed request from dave for carol's total
    SessionKeyPair keys = SessionKeyPair::generate();
    DecryptionRequest req;
    req.handle = tracker_.get_total(carol_.principal());
    req.system = system_;
    req.holder = dave_.principal();
    req.holder_public_key = dave_.public_key();
    req.authorization.session_public_key = keys.public_key();
    req.authorization.systems = {system_};
    req.authorization.start_timestamp = kStartTime;
    req.signature = dave_.sign(req.authorization.signing_digest());

    EXPECT_LEDGER_ERROR(gateway_.reencrypt(req), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);

    req.handle = tracker_.get_total(dave_.principal());
    EXPECT_EQ(open_sealed(gateway_.reencrypt(req), req.handle, keys), 2u);
}

TEST_F(RevealSessionTest, GatewayRejectsOtherSystem) {
    SessionKeyPair keys = SessionKeyPair::generate();
    DecryptionRequest req;
    req.handle = tracker_.get_total(carol_.principal());
    req.system = bob_;
    req.holder = carol_.principal();
    req.holder_public_key = carol_.public_key();
    req.authorization.session_public_key = keys.public_key();
    req.authorization.systems = {bob_};
    req.authorization.start_timestamp = kStartTime;
    req.signature = carol_.sign(req.authorization.signing_digest());
    EXPECT_LEDGER_ERROR(gateway_.reencrypt(req), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
}
