/**
 * @file ledger_test_support.h
 * @brief Shared fixtures for trustledger tests
 *
 * Key generation dominates test time, so every suite reuses one TOY_512
 * key pair. Each test still gets its own directory, executor and tracker.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_TESTS_LEDGER_TEST_SUPPORT_H
#define TRUSTLEDGER_TESTS_LEDGER_TEST_SUPPORT_H

#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "trustledger/trustledger.h"

namespace trustledger {
namespace testing {

/** 2024-01-01T00:00:00Z, well inside the 32-bit cached timestamp range */
constexpr Timestamp kStartTime = 1704067200;

inline const fhe::PaillierKeyPair& shared_toy_keys() {
    static const fhe::PaillierKeyPair keys =
        fhe::PaillierKeyPair::generate(fhe::PaillierParams::TOY_512());
    return keys;
}

/** Deterministic principal whose bytes are all `fill` */
inline Principal principal_of(uint8_t fill) {
    Principal::Bytes b;
    b.fill(fill);
    return Principal(b);
}

/**
 * @brief Fresh ledger over the shared key
 */
class LedgerTest : public ::testing::Test {
protected:
    LedgerTest()
        : system_(principal_of(0x5A)),
          alice_(principal_of(0xA1)),
          bob_(principal_of(0xB0)),
          clock_(kStartTime),
          executor_(system_, shared_toy_keys(), directory_),
          tracker_(executor_, clock_),
          encryptor_(executor_.public_key()) {}

    client::EncryptedInput encrypt(uint32_t value, const Principal& submitter) const {
        return encryptor_.encrypt_uint32(value, system_, submitter);
    }

    size_t record(const Principal& user, uint32_t value) {
        client::EncryptedInput in = encrypt(value, user);
        return tracker_.record_event(user, in.handle, in.proof);
    }

    uint32_t open(const CiphertextHandle& handle, const Principal& who) const {
        return executor_.decrypt_authorized(handle, who);
    }

    Principal system_;
    Principal alice_;
    Principal bob_;
    host::ManualClock clock_;
    acl::CapabilityDirectory directory_;
    fhe::FheExecutor executor_;
    ledger::TrustScoreTracker tracker_;
    client::InputEncryptor encryptor_;
};

} // namespace testing
} // namespace trustledger

/**
 * @brief Expect `stmt` to throw LedgerError with the given code
 */
#define EXPECT_LEDGER_ERROR(stmt, expected_code)                                   \
    do {                                                                           \
        try {                                                                      \
            stmt;                                                                  \
            ADD_FAILURE() << "Expected LedgerError " #expected_code;               \
        } catch (const ::trustledger::LedgerError& e) {                            \
            EXPECT_EQ(e.code(), expected_code) << e.what();                        \
        }                                                                          \
    } while (0)

#endif // TRUSTLEDGER_TESTS_LEDGER_TEST_SUPPORT_H
