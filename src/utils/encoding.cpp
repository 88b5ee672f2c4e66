/**
 * @file encoding.cpp
 * @brief Hex and fixed-width integer encoding implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/utils/encoding.h"

#include <stdexcept>

namespace trustledger {
namespace encoding {

static const char HEX_LOWER[] = "0123456789abcdef";

int hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_hex(const uint8_t* data, size_t len, bool prefix) {
    std::string out;
    out.reserve(len * 2 + 2);
    if (prefix) {
        out += "0x";
    }
    for (size_t i = 0; i < len; i++) {
        out.push_back(HEX_LOWER[data[i] >> 4]);
        out.push_back(HEX_LOWER[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data, bool prefix) {
    return to_hex(data.data(), data.size(), prefix);
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    size_t hex_len = hex.size() - offset;
    if (hex_len % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }

    std::vector<uint8_t> out(hex_len / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_char_value(hex[offset + i * 2]);
        int lo = hex_char_value(hex[offset + i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

void append_u16_be(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void append_u32_be(std::vector<uint8_t>& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void append_u64_be(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void store_u32_be(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

uint16_t load_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t load_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t load_u64_be(const uint8_t* p) {
    return (static_cast<uint64_t>(load_u32_be(p)) << 32) | load_u32_be(p + 4);
}

} // namespace encoding
} // namespace trustledger
