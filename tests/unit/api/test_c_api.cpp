/**
 * @file test_c_api.cpp
 * @brief Unit tests for the C API
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <string>

#include "trustledger/trustledger_api.h"

TEST(CApiTest, VersionAndPlatform) {
    const std::string version = trustledger_version();
    EXPECT_FALSE(version.empty());
    EXPECT_EQ(std::count(version.begin(), version.end(), '.'), 2);
    EXPECT_NE(trustledger_platform(), nullptr);
}

TEST(CApiTest, ErrorStrings) {
    EXPECT_STREQ(trustledger_error_string(TRUSTLEDGER_SUCCESS), "Success");
    EXPECT_STREQ(trustledger_error_string(TRUSTLEDGER_ERROR_INVALID_ADDRESS), "Invalid user address");
    EXPECT_STREQ(trustledger_error_string(TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED),
                 "Maximum trust events reached");
    EXPECT_STREQ(trustledger_error_string(static_cast<trustledger_error_t>(-99)), "Unknown error");
}

TEST(CApiTest, PackUnpack) {
    trustledger_stats_t in = {7, 1704067200u, 1};
    uint8_t word[TRUSTLEDGER_STATS_WORD_SIZE];
    ASSERT_EQ(trustledger_stats_pack(&in, word, sizeof(word)), TRUSTLEDGER_SUCCESS);
    EXPECT_EQ(word[31], 7);
    EXPECT_EQ(word[23], 1);

    trustledger_stats_t out;
    std::memset(&out, 0xFF, sizeof(out));
    ASSERT_EQ(trustledger_stats_unpack(word, sizeof(word), &out), TRUSTLEDGER_SUCCESS);
    EXPECT_EQ(out.event_count, 7u);
    EXPECT_EQ(out.last_activity, 1704067200u);
    EXPECT_EQ(out.has_data, 1);
}

TEST(CApiTest, PackBufferTooSmall) {
    trustledger_stats_t in = {1, 1, 1};
    uint8_t word[TRUSTLEDGER_STATS_WORD_SIZE - 1];
    EXPECT_EQ(trustledger_stats_pack(&in, word, sizeof(word)), TRUSTLEDGER_ERROR_BUFFER_TOO_SMALL);
}

TEST(CApiTest, UnpackRejectsReservedBits) {
    uint8_t word[TRUSTLEDGER_STATS_WORD_SIZE] = {0};
    word[0] = 0x01;
    trustledger_stats_t out;
    EXPECT_EQ(trustledger_stats_unpack(word, sizeof(word), &out), TRUSTLEDGER_ERROR_INVALID_PARAM);
    EXPECT_EQ(trustledger_stats_unpack(word, sizeof(word) - 1, &out), TRUSTLEDGER_ERROR_INVALID_PARAM);
}

TEST(CApiTest, NullPointers) {
    uint8_t word[TRUSTLEDGER_STATS_WORD_SIZE] = {0};
    trustledger_stats_t stats = {0, 0, 0};
    EXPECT_EQ(trustledger_stats_pack(nullptr, word, sizeof(word)), TRUSTLEDGER_ERROR_INVALID_PARAM);
    EXPECT_EQ(trustledger_stats_pack(&stats, nullptr, sizeof(word)), TRUSTLEDGER_ERROR_INVALID_PARAM);
    EXPECT_EQ(trustledger_stats_unpack(nullptr, sizeof(word), &stats), TRUSTLEDGER_ERROR_INVALID_PARAM);
    EXPECT_EQ(trustledger_stats_unpack(word, sizeof(word), nullptr), TRUSTLEDGER_ERROR_INVALID_PARAM);
}
