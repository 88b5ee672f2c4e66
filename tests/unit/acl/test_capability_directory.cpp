/**
 * @file test_capability_directory.cpp
 * @brief Unit tests for the capability directory
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

#include "ledger_test_support.h"

using namespace trustledger;
using trustledger::testing::principal_of;

namespace {

CiphertextHandle handle_of(uint8_t fill) {
    uint8_t digest[32];
    std::fill(digest, digest + 32, fill);
    return CiphertextHandle::make(digest, ValueType::Uint32);
}

}  // namespace

TEST(CapabilityDirectoryTest, GrantAndCheck) {
    acl::CapabilityDirectory dir;
    CiphertextHandle h = handle_of(1);
    EXPECT_FALSE(dir.may_decrypt(h, principal_of(0xA1)));

    dir.grant(h, principal_of(0xA1));
    EXPECT_TRUE(dir.may_decrypt(h, principal_of(0xA1)));
    EXPECT_FALSE(dir.may_decrypt(h, principal_of(0xB0)));
    EXPECT_FALSE(dir.may_decrypt(handle_of(2), principal_of(0xA1)));
}

TEST(CapabilityDirectoryTest, GrantsAreIdempotentAndSorted) {
    acl::CapabilityDirectory dir;
    CiphertextHandle h = handle_of(1);
    dir.grant_all(h, {principal_of(0xB0), principal_of(0xA1), principal_of(0xB0)});

    std::vector<Principal> grantees = dir.grants_of(h);
    ASSERT_EQ(grantees.size(), 2u);
    EXPECT_EQ(grantees[0], principal_of(0xA1));
    EXPECT_EQ(grantees[1], principal_of(0xB0));
    EXPECT_EQ(dir.size(), 1u);
    EXPECT_TRUE(dir.grants_of(handle_of(9)).empty());
}

TEST(CapabilityDirectoryTest, RejectsSentinels) {
    acl::CapabilityDirectory dir;
    EXPECT_THROW(dir.grant(CiphertextHandle::empty(), principal_of(0xA1)), std::invalid_argument);
    EXPECT_THROW(dir.grant(handle_of(1), Principal::zero()), std::invalid_argument);
    EXPECT_EQ(dir.size(), 0u);
}
