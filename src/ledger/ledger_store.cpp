/**
 * @file ledger_store.cpp
 * @brief Encrypted ledger store
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/ledger_store.h"
#include "trustledger/core/error.h"

namespace trustledger {
namespace ledger {

Statistics UserRecord::live_statistics() const {
    Statistics stats;
    stats.event_count = aggregate.event_count;
    stats.last_activity = aggregate.last_activity;
    stats.has_data = aggregate.event_count > 0;
    return stats;
}

EncryptedLedgerStore::EncryptedLedgerStore(fhe::FheExecutor& executor, const LedgerConfig& config)
    : executor_(executor), accumulator_(executor), config_(config) {}

size_t EncryptedLedgerStore::append(const Principal& user, const CiphertextHandle& value,
                                    Timestamp now) {
    if (user.is_zero()) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_ADDRESS, "Invalid user address");
    }

    auto it = records_.find(user);
    const bool existed = it != records_.end();
    const size_t length = existed ? it->second.history.size() : 0;
    if (length >= config_.max_events) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED, "Maximum trust events reached");
    }
    if (!executor_.directory().may_decrypt(value, user)) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPABILITY_DENIED, "User holds no grant on event");
    }

    // Stage: everything that can fail happens before the record is touched.
    const fhe::GrantSet grants = {executor_.system(), user};
    AggregateState next =
        accumulator_.fold(existed ? it->second.aggregate : AggregateState(), value, grants);
    // The cached word holds 32 bits of timestamp; live reads must match it.
    next.last_activity = now & 0xFFFFFFFFu;

    if (!existed) {
        it = records_.emplace(user, UserRecord()).first;
    }
    UserRecord& rec = it->second;
    try {
        rec.history.reserve(length + 1);
    } catch (...) {
        if (!existed) {
            records_.erase(it);
        }
        throw;
    }

    // Commit: none of these throw.
    rec.history.push_back(value);
    rec.aggregate = next;
    rec.cached = PackedStatistics::pack(rec.live_statistics());
    return length;
}

const UserRecord* EncryptedLedgerStore::find(const Principal& user) const {
    auto it = records_.find(user);
    return it == records_.end() ? nullptr : &it->second;
}

void EncryptedLedgerStore::refresh_cache(const Principal& user) {
    auto it = records_.find(user);
    if (it != records_.end()) {
        it->second.cached = PackedStatistics::pack(it->second.live_statistics());
    }
}

} // namespace ledger
} // namespace trustledger
