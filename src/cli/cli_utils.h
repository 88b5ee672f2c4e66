/**
 * @file cli_utils.h
 * @brief Common utility functions for trustledger CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CLI_UTILS_H
#define TRUSTLEDGER_CLI_UTILS_H

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace trustledger {
namespace cli {

/**
 * @brief Parse a comma-separated list of unsigned 32-bit scores
 */
inline std::vector<uint32_t> parse_scores(const std::string& list) {
    std::vector<uint32_t> scores;
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (item.empty()) {
            throw std::invalid_argument("Empty score in list: " + list);
        }
        size_t pos = 0;
        unsigned long v = std::stoul(item, &pos);
        if (pos != item.size() || v > 0xFFFFFFFFUL) {
            throw std::invalid_argument("Invalid score: " + item);
        }
        scores.push_back(static_cast<uint32_t>(v));
    }
    return scores;
}

/**
 * @brief Parse a score list that must hold at least one score
 */
inline std::vector<uint32_t> parse_required_scores(const std::string& option, const std::string& list) {
    std::vector<uint32_t> scores = parse_scores(list);
    if (scores.empty()) {
        throw std::invalid_argument(option + " must list at least one score");
    }
    return scores;
}

/**
 * @brief Parse a non-negative integer option value
 */
inline long parse_long(const std::string& option, const std::string& value) {
    size_t pos = 0;
    long v = std::stol(value, &pos);
    if (pos != value.size() || v < 0) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return v;
}

/**
 * @brief Shorten a 0x-prefixed hex string for display
 */
inline std::string short_hex(const std::string& hex, size_t keep = 10) {
    if (hex.size() <= 2 * keep + 2) {
        return hex;
    }
    return hex.substr(0, keep + 2) + "..." + hex.substr(hex.size() - keep);
}

} // namespace cli
} // namespace trustledger

#endif // TRUSTLEDGER_CLI_UTILS_H
