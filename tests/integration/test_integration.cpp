/**
 * @file test_integration.cpp
 * @brief End-to-end flow: encrypted submission, aggregation, batch checks and reveal
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include "ledger_test_support.h"

using namespace trustledger;
using trustledger::testing::kStartTime;
using trustledger::testing::principal_of;
using trustledger::testing::shared_toy_keys;

class IntegrationTest : public ::testing::Test {
protected:
    IntegrationTest()
        : system_(principal_of(0x5A)),
          clock_(kStartTime),
          executor_(system_, shared_toy_keys(), directory_),
          tracker_(executor_, clock_),
          encryptor_(tracker_.public_key()),
          gateway_(executor_, clock_),
          alice_(reveal::Wallet::from_seed(ByteVec(32, 0xA1))),
          bob_(reveal::Wallet::from_seed(ByteVec(32, 0xB0))) {
        tracker_.add_listener(&log_);
    }

    size_t submit(const reveal::Wallet& user, uint32_t score) {
        client::EncryptedInput in =
            encryptor_.encrypt_uint32(score, tracker_.identity(), user.principal());
        return tracker_.record_event(user.principal(), in.handle, in.proof);
    }

    uint32_t reveal_as(const reveal::Wallet& user, const CiphertextHandle& h) {
        reveal::RevealSession session(directory_, gateway_);
        return session.run(h, tracker_.identity(), user, clock_.now());
    }

    Principal system_;
    host::ManualClock clock_;
    acl::CapabilityDirectory directory_;
    fhe::FheExecutor executor_;
    ledger::TrustScoreTracker tracker_;
    client::InputEncryptor encryptor_;
    reveal::KmsGateway gateway_;
    reveal::Wallet alice_;
    reveal::Wallet bob_;
    ledger::EventLog log_;
};

TEST_F(IntegrationTest, TwoUsersEndToEnd) {
    for (uint32_t s : {7u, 9u, 4u}) {
        submit(alice_, s);
        clock_.advance(60);
    }
    submit(bob_, 10);

    const Principal alice = alice_.principal();
    const Principal bob = bob_.principal();

    // Owners reveal their own aggregates
    EXPECT_EQ(reveal_as(alice_, tracker_.get_total(alice)), 20u);
    EXPECT_EQ(reveal_as(alice_, tracker_.get_average(alice)), 6u);
    EXPECT_EQ(reveal_as(bob_, tracker_.get_total(bob)), 10u);

    std::vector<CiphertextHandle> history = tracker_.get_range(alice, 0, 3);
    std::vector<uint32_t> opened;
    for (const auto& h : history) {
        opened.push_back(reveal_as(alice_, h));
    }
    EXPECT_EQ(opened, std::vector<uint32_t>({7, 9, 4}));

    // Nobody reads another user's values
    EXPECT_LEDGER_ERROR(reveal_as(bob_, tracker_.get_total(alice)), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);

    // Statistics
    ledger::Statistics live = tracker_.get_live_statistics(alice);
    EXPECT_EQ(live.event_count, 3u);
    EXPECT_EQ(live.last_activity, kStartTime + 120);
    EXPECT_EQ(tracker_.get_cached_statistics(alice), live);

    uint8_t word[TRUSTLEDGER_STATS_WORD_SIZE];
    trustledger_stats_t c_stats = {live.event_count, static_cast<uint32_t>(live.last_activity), 1};
    ASSERT_EQ(trustledger_stats_pack(&c_stats, word, sizeof(word)), TRUSTLEDGER_SUCCESS);
    EXPECT_EQ(tracker_.query().cached_word(alice).to_hex(),
              ledger::PackedStatistics::from_bytes(word, sizeof(word)).to_hex());

    // 4 records x 2 events + 1 statistics view
    EXPECT_EQ(log_.size(), 9u);
    EXPECT_EQ(gateway_.requests_served(), 6u);
}

TEST_F(IntegrationTest, BatchValidationAlongsideLedger) {
    std::vector<CiphertextHandle> handles;
    std::vector<ByteVec> proofs;
    for (uint32_t s : {1u, 10u, 0u, 11u}) {
        client::EncryptedInput in =
            encryptor_.encrypt_uint32(s, tracker_.identity(), bob_.principal());
        handles.push_back(in.handle);
        proofs.push_back(in.proof);
    }
    EXPECT_EQ(tracker_.validate_batch(bob_.principal(), handles, proofs),
              std::vector<bool>({true, true, false, false}));

    // The same inputs can still be recorded
    EXPECT_EQ(tracker_.record_event(bob_.principal(), handles[1], proofs[1]), 0u);
    EXPECT_EQ(reveal_as(bob_, tracker_.get_total(bob_.principal())), 10u);
}

TEST_F(IntegrationTest, OutageThenRecovery) {
    submit(alice_, 5);
    gateway_.set_online(false);
    EXPECT_LEDGER_ERROR(reveal_as(alice_, tracker_.get_total(alice_.principal())),
                        TRUSTLEDGER_ERROR_REMOTE_SERVICE_UNAVAILABLE);
    gateway_.set_online(true);
    EXPECT_EQ(reveal_as(alice_, tracker_.get_total(alice_.principal())), 5u);
}
