/**
 * @file encoding.h
 * @brief Hex and fixed-width integer encoding helpers
 *
 * Handles, principals and statistics words are rendered as lowercase hex
 * with a "0x" prefix; integers inside proofs and authorization messages use
 * big-endian fixed-width encoding.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_UTILS_ENCODING_H
#define TRUSTLEDGER_UTILS_ENCODING_H

#include "trustledger/core/common.h"

#include <cstdint>
#include <string>
#include <vector>

namespace trustledger {
namespace encoding {

int hex_char_value(char c);

/**
 * @brief Encode bytes as lowercase hex
 * @param prefix Prepend "0x"
 */
std::string to_hex(const uint8_t* data, size_t len, bool prefix = true);
std::string to_hex(const std::vector<uint8_t>& data, bool prefix = true);

/**
 * @brief Decode hex, accepting an optional "0x" prefix
 * @throws std::invalid_argument on odd length or non-hex characters
 */
std::vector<uint8_t> from_hex(const std::string& hex);

void append_u16_be(std::vector<uint8_t>& out, uint16_t v);
void append_u32_be(std::vector<uint8_t>& out, uint32_t v);
void append_u64_be(std::vector<uint8_t>& out, uint64_t v);

void store_u32_be(uint8_t* p, uint32_t v);

uint16_t load_u16_be(const uint8_t* p);
uint32_t load_u32_be(const uint8_t* p);
uint64_t load_u64_be(const uint8_t* p);

} // namespace encoding
} // namespace trustledger

#endif // TRUSTLEDGER_UTILS_ENCODING_H
