/**
 * @file trust_score_tracker.cpp
 * @brief Trust score ledger entry points
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/trust_score_tracker.h"
#include "trustledger/core/error.h"

#include <algorithm>
#include <stdexcept>

namespace trustledger {
namespace ledger {

TrustScoreTracker::TrustScoreTracker(fhe::FheExecutor& executor, const host::HostClock& clock,
                                     const LedgerConfig& config)
    : executor_(executor),
      clock_(clock),
      verifier_(executor.public_key(), executor.system()),
      store_(executor, config),
      query_(store_),
      batch_(verifier_, executor, config) {}

void TrustScoreTracker::add_listener(LedgerEventListener* listener) {
    if (listener == nullptr) {
        throw std::invalid_argument("Listener must not be null");
    }
    listeners_.push_back(listener);
}

void TrustScoreTracker::remove_listener(LedgerEventListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

size_t TrustScoreTracker::record_event(const Principal& caller, const CiphertextHandle& handle,
                                       const ByteVec& proof) {
    if (proof.empty()) {
        throw LedgerError(TRUSTLEDGER_ERROR_EMPTY_PROOF, "Proof must not be empty");
    }
    if (caller.is_zero()) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_ADDRESS, "Invalid user address");
    }
    if (query_.history_length(caller) >= store_.config().max_events) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED, "Maximum trust events reached");
    }

    fhe::ExternalInput input = verifier_.verify(handle, proof, caller, ValueType::Uint32);
    CiphertextHandle value = executor_.import_input(input, {executor_.system(), caller});
    size_t index = store_.append(caller, value, clock_.now());

    const uint32_t count = query_.event_count(caller);
    for (auto* l : listeners_) {
        l->on_trust_event_recorded(caller, count);
    }
    for (auto* l : listeners_) {
        l->on_score_queried(caller, QueryKind::Record);
    }
    return index;
}

std::vector<bool> TrustScoreTracker::validate_batch(const Principal& caller,
                                                    const std::vector<CiphertextHandle>& handles,
                                                    const std::vector<ByteVec>& proofs) {
    return batch_.validate(caller, handles, proofs);
}

Statistics TrustScoreTracker::get_live_statistics(const Principal& user) {
    Statistics stats = query_.live_statistics(user);
    store_.refresh_cache(user);
    for (auto* l : listeners_) {
        l->on_statistics_viewed(user, stats.event_count, stats.last_activity);
    }
    return stats;
}

} // namespace ledger
} // namespace trustledger
