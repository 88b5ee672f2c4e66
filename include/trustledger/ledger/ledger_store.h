/**
 * @file ledger_store.h
 * @brief Per-user append-only encrypted history and aggregates
 *
 * One UserRecord per principal holds the history, the aggregate state and
 * the cached statistics word, so an append replaces the whole record state
 * in one step.
 *
 * Precondition: the host serializes all mutating calls. The store does no
 * locking of its own.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_LEDGER_STORE_H
#define TRUSTLEDGER_LEDGER_LEDGER_STORE_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/executor.h"
#include "trustledger/ledger/accumulator.h"
#include "trustledger/ledger/config.h"
#include "trustledger/ledger/statistics.h"

#include <unordered_map>
#include <vector>

namespace trustledger {
namespace ledger {

struct UserRecord {
    std::vector<CiphertextHandle> history;
    AggregateState aggregate;
    PackedStatistics cached;

    Statistics live_statistics() const;
};

class EncryptedLedgerStore {
public:
    EncryptedLedgerStore(fhe::FheExecutor& executor, const LedgerConfig& config);

    /**
     * @brief Append value to user's history and fold it into the aggregates
     *
     * All-or-nothing: on any failure the record is left as it was. The new
     * total and average are granted to {system, user} before returning.
     *
     * @param value Imported ciphertext, already granted to system and user
     * @param now   Stored as its low 32 bits
     * @return Index of the new event
     * @throws LedgerError(INVALID_ADDRESS) for the zero principal
     * @throws LedgerError(CAPACITY_EXCEEDED) when the history is full
     * @throws LedgerError(CAPABILITY_DENIED) if user holds no grant on value
     */
    size_t append(const Principal& user, const CiphertextHandle& value, Timestamp now);

    /** Record for user, or nullptr if user never appended */
    const UserRecord* find(const Principal& user) const;

    /** Rewrite the cached statistics word from live state; no-op for unknown users */
    void refresh_cache(const Principal& user);

    const LedgerConfig& config() const { return config_; }
    const fhe::FheExecutor& executor() const { return executor_; }
    size_t user_count() const { return records_.size(); }

private:
    fhe::FheExecutor& executor_;
    Accumulator accumulator_;
    LedgerConfig config_;
    std::unordered_map<Principal, UserRecord, PrincipalHash> records_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_LEDGER_STORE_H
