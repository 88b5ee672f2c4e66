/**
 * @file test_ledger_store.cpp
 * @brief Unit tests for the encrypted ledger store and accumulator
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include "ledger_test_support.h"

using namespace trustledger;
using trustledger::testing::LedgerTest;
using trustledger::testing::kStartTime;

// ============================================================================
// Test Fixtures
// ============================================================================

class LedgerStoreTest : public LedgerTest {
protected:
    LedgerStoreTest() : verifier_(executor_.public_key(), system_) {}

    /** Verified input, imported with grants to {system, user} */
    CiphertextHandle imported(uint32_t value, const Principal& user) {
        client::EncryptedInput in = encrypt(value, user);
        return executor_.import_input(verifier_.verify(in.handle, in.proof, user), {system_, user});
    }

    proof::ProofVerifier verifier_;
};

// ============================================================================
// Accumulator
// ============================================================================

TEST_F(LedgerStoreTest, FoldFromEmptyState) {
    ledger::Accumulator acc(executor_);
    ledger::AggregateState next = acc.fold(ledger::AggregateState(), imported(7, alice_), {system_, alice_});
    EXPECT_EQ(next.event_count, 1u);
    EXPECT_EQ(open(next.total, alice_), 7u);
    EXPECT_EQ(open(next.average, alice_), 7u);
}

TEST_F(LedgerStoreTest, FoldAccumulatesAndAverages) {
    ledger::Accumulator acc(executor_);
    ledger::AggregateState s;
    for (uint32_t v : {5u, 8u, 10u}) {
        s = acc.fold(s, imported(v, alice_), {system_, alice_});
    }
    EXPECT_EQ(s.event_count, 3u);
    EXPECT_EQ(open(s.total, alice_), 23u);
    EXPECT_EQ(open(s.average, alice_), 7u);  // floor(23 / 3)
}

// ============================================================================
// Append
// ============================================================================

TEST_F(LedgerStoreTest, AppendUpdatesWholeRecord) {
    ledger::EncryptedLedgerStore store(executor_, ledger::LedgerConfig());
    CiphertextHandle v = imported(4, alice_);
    EXPECT_EQ(store.append(alice_, v, kStartTime), 0u);

    const ledger::UserRecord* rec = store.find(alice_);
    ASSERT_NE(rec, nullptr);
    ASSERT_EQ(rec->history.size(), 1u);
    EXPECT_EQ(rec->history[0], v);
    EXPECT_EQ(rec->aggregate.event_count, 1u);
    EXPECT_EQ(rec->aggregate.last_activity, kStartTime);
    EXPECT_EQ(rec->cached.unpack(), rec->live_statistics());
    EXPECT_EQ(store.find(bob_), nullptr);
}

TEST_F(LedgerStoreTest, AggregatesAreGrantedToSystemAndUser) {
    ledger::EncryptedLedgerStore store(executor_, ledger::LedgerConfig());
    store.append(alice_, imported(4, alice_), kStartTime);
    const ledger::UserRecord* rec = store.find(alice_);
    ASSERT_NE(rec, nullptr);

    for (const CiphertextHandle& h : {rec->aggregate.total, rec->aggregate.average, rec->history[0]}) {
        EXPECT_TRUE(directory_.may_decrypt(h, system_));
        EXPECT_TRUE(directory_.may_decrypt(h, alice_));
        EXPECT_FALSE(directory_.may_decrypt(h, bob_));
    }
}

TEST_F(LedgerStoreTest, ZeroAddressRejected) {
    ledger::EncryptedLedgerStore store(executor_, ledger::LedgerConfig());
    EXPECT_LEDGER_ERROR(store.append(Principal::zero(), imported(4, alice_), kStartTime),
                        TRUSTLEDGER_ERROR_INVALID_ADDRESS);
    EXPECT_EQ(store.user_count(), 0u);
}

TEST_F(LedgerStoreTest, UngrantedValueRejectedWithoutPartialState) {
    ledger::EncryptedLedgerStore store(executor_, ledger::LedgerConfig());
    CiphertextHandle bobs = imported(4, bob_);
    EXPECT_LEDGER_ERROR(store.append(alice_, bobs, kStartTime), TRUSTLEDGER_ERROR_CAPABILITY_DENIED);
    EXPECT_EQ(store.find(alice_), nullptr);
}

TEST_F(LedgerStoreTest, CapacityIsAllOrNothing) {
    ledger::LedgerConfig cfg;
    cfg.max_events = 3;
    ledger::EncryptedLedgerStore store(executor_, cfg);
    CiphertextHandle v = imported(2, alice_);
    for (int i = 0; i < 3; ++i) {
        store.append(alice_, v, kStartTime + i);
    }

    const ledger::UserRecord* rec = store.find(alice_);
    ASSERT_NE(rec, nullptr);
    const CiphertextHandle total_before = rec->aggregate.total;

    EXPECT_LEDGER_ERROR(store.append(alice_, v, kStartTime + 10), TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED);
    EXPECT_EQ(rec->history.size(), 3u);
    EXPECT_EQ(rec->aggregate.event_count, 3u);
    EXPECT_EQ(rec->aggregate.total, total_before);
    EXPECT_EQ(rec->aggregate.last_activity, kStartTime + 2);
}
