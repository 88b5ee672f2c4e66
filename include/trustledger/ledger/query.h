/**
 * @file query.h
 * @brief Read-only access to the encrypted ledger
 *
 * Address policy:
 * - Index and range lookups and live statistics reject the zero principal
 *   with InvalidAddress.
 * - Aggregate lookups (total, average, count, history length, last activity,
 *   cached statistics) return the empty sentinel or zero for any principal
 *   without data, the zero principal included.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_QUERY_H
#define TRUSTLEDGER_LEDGER_QUERY_H

#include "trustledger/core/types.h"
#include "trustledger/ledger/ledger_store.h"
#include "trustledger/ledger/statistics.h"

#include <vector>

namespace trustledger {
namespace ledger {

class QueryLayer {
public:
    explicit QueryLayer(const EncryptedLedgerStore& store) : store_(store) {}

    CiphertextHandle total(const Principal& user) const;
    CiphertextHandle average(const Principal& user) const;
    uint32_t event_count(const Principal& user) const;
    size_t history_length(const Principal& user) const;
    Timestamp last_activity(const Principal& user) const;

    /**
     * @throws LedgerError(INVALID_ADDRESS) for the zero principal
     * @throws LedgerError(INDEX_OUT_OF_BOUNDS) if index >= history length
     */
    CiphertextHandle by_index(const Principal& user, size_t index) const;

    /**
     * @brief history[start, end)
     * @throws LedgerError(INVALID_ADDRESS) for the zero principal
     * @throws LedgerError(INVALID_RANGE) if start >= end
     * @throws LedgerError(RANGE_OUT_OF_BOUNDS) if end > history length
     */
    std::vector<CiphertextHandle> range(const Principal& user, size_t start, size_t end) const;

    /**
     * @brief Statistics computed from the live record
     * @throws LedgerError(INVALID_ADDRESS) for the zero principal
     */
    Statistics live_statistics(const Principal& user) const;

    /** Decoded cached word; may be stale */
    Statistics cached_statistics(const Principal& user) const;
    PackedStatistics cached_word(const Principal& user) const;

private:
    const EncryptedLedgerStore& store_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_QUERY_H
