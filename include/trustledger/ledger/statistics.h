/**
 * @file statistics.h
 * @brief Per-user statistics and the packed cache word
 *
 * Packed layout (unsigned 256-bit word, serialized big-endian, 32 bytes):
 * @code
 *   bits [0, 32)   event count
 *   bits [32, 64)  last-activity timestamp (low 32 bits)
 *   bit  64        has-data flag
 *   bits [65, 256) reserved, zero
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_STATISTICS_H
#define TRUSTLEDGER_LEDGER_STATISTICS_H

#include "trustledger/core/common.h"
#include "trustledger/core/types.h"

#include <array>
#include <cstdint>
#include <string>

namespace trustledger {
namespace ledger {

struct Statistics {
    uint32_t event_count = 0;
    Timestamp last_activity = 0;
    bool has_data = false;

    bool operator==(const Statistics& other) const {
        return event_count == other.event_count && last_activity == other.last_activity &&
               has_data == other.has_data;
    }
    bool operator!=(const Statistics& other) const { return !(*this == other); }
};

class PackedStatistics {
public:
    using Word = std::array<uint8_t, TRUSTLEDGER_STATS_WORD_SIZE>;

    PackedStatistics() : word_{} {}

    /** Timestamps are truncated to their low 32 bits */
    static PackedStatistics pack(const Statistics& stats);

    /**
     * @throws std::invalid_argument if len != TRUSTLEDGER_STATS_WORD_SIZE
     */
    static PackedStatistics from_bytes(const uint8_t* data, size_t len);
    static PackedStatistics from_hex(const std::string& hex);

    /** Decode; reserved bits are ignored */
    Statistics unpack() const;

    /** True if any reserved bit is set */
    bool has_reserved_bits() const;

    const Word& bytes() const { return word_; }
    std::string to_hex() const;

    bool operator==(const PackedStatistics& other) const { return word_ == other.word_; }

private:
    Word word_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_STATISTICS_H
