/**
 * @file statistics.cpp
 * @brief Packed statistics word
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/statistics.h"
#include "trustledger/utils/encoding.h"

#include <cstring>
#include <stdexcept>

namespace trustledger {
namespace ledger {

namespace {

// Byte offsets of the fields within the big-endian word
constexpr size_t kCountOffset = 28;
constexpr size_t kTimestampOffset = 24;
constexpr size_t kFlagOffset = 23;

} // namespace

PackedStatistics PackedStatistics::pack(const Statistics& stats) {
    PackedStatistics packed;
    encoding::store_u32_be(packed.word_.data() + kCountOffset, stats.event_count);
    encoding::store_u32_be(packed.word_.data() + kTimestampOffset, static_cast<uint32_t>(stats.last_activity));
    packed.word_[kFlagOffset] = stats.has_data ? 0x01 : 0x00;
    return packed;
}

PackedStatistics PackedStatistics::from_bytes(const uint8_t* data, size_t len) {
    if (data == nullptr || len != TRUSTLEDGER_STATS_WORD_SIZE) {
        throw std::invalid_argument("Statistics word must be 32 bytes");
    }
    PackedStatistics packed;
    std::memcpy(packed.word_.data(), data, TRUSTLEDGER_STATS_WORD_SIZE);
    return packed;
}

PackedStatistics PackedStatistics::from_hex(const std::string& hex) {
    ByteVec bytes = encoding::from_hex(hex);
    return from_bytes(bytes.data(), bytes.size());
}

Statistics PackedStatistics::unpack() const {
    Statistics stats;
    stats.event_count = encoding::load_u32_be(word_.data() + kCountOffset);
    stats.last_activity = encoding::load_u32_be(word_.data() + kTimestampOffset);
    stats.has_data = (word_[kFlagOffset] & 0x01) != 0;
    return stats;
}

bool PackedStatistics::has_reserved_bits() const {
    for (size_t i = 0; i < kFlagOffset; ++i) {
        if (word_[i] != 0) {
            return true;
        }
    }
    return (word_[kFlagOffset] & 0xFE) != 0;
}

std::string PackedStatistics::to_hex() const {
    return encoding::to_hex(word_.data(), word_.size());
}

} // namespace ledger
} // namespace trustledger
