/**
 * @file test_cli_utils.cpp
 * @brief Unit tests for command-line argument helpers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "cli_utils.h"

using namespace trustledger::cli;

TEST(CliUtilsTest, ParseScores) {
    EXPECT_EQ(parse_scores("7,9,4"), std::vector<uint32_t>({7, 9, 4}));
    EXPECT_EQ(parse_scores("4294967295"), std::vector<uint32_t>({0xFFFFFFFFu}));
    EXPECT_TRUE(parse_scores("").empty());
    EXPECT_THROW(parse_scores("1,,2"), std::invalid_argument);
    EXPECT_THROW(parse_scores("1,x"), std::invalid_argument);
    EXPECT_THROW(parse_scores("4294967296"), std::invalid_argument);
}

TEST(CliUtilsTest, RequiredScoresRejectEmptyList) {
    EXPECT_EQ(parse_required_scores("--scores", "5"), std::vector<uint32_t>({5}));
    try {
        parse_required_scores("--scores", "");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "--scores must list at least one score");
    }
}

TEST(CliUtilsTest, ParseLong) {
    EXPECT_EQ(parse_long("--users", "3"), 3);
    EXPECT_THROW(parse_long("--users", "-1"), std::invalid_argument);
    EXPECT_THROW(parse_long("--users", "2x"), std::invalid_argument);
}

TEST(CliUtilsTest, ShortHex) {
    EXPECT_EQ(short_hex("0x1234"), "0x1234");
    const std::string h = "0x" + std::string(40, 'a');
    EXPECT_EQ(short_hex(h, 4), "0xaaaa...aaaa");
}
