/**
 * @file trust_score_tracker.h
 * @brief Entry points of the confidential trust score ledger
 *
 * Usage Example:
 * @code
 *   acl::CapabilityDirectory directory;
 *   fhe::FheExecutor executor(system, fhe::PaillierKeyPair::generate(params), directory);
 *   host::SystemClock clock;
 *   ledger::TrustScoreTracker tracker(executor, clock);
 *
 *   client::InputEncryptor enc(tracker.public_key());
 *   auto in = enc.encrypt_uint32(7, tracker.identity(), alice);
 *   tracker.record_event(alice, in.handle, in.proof);
 *   CiphertextHandle total = tracker.get_total(alice);
 * @endcode
 *
 * The host must serialize mutating calls (record_event, validate_batch,
 * get_live_statistics). Reads never mutate ledger state.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_TRUST_SCORE_TRACKER_H
#define TRUSTLEDGER_LEDGER_TRUST_SCORE_TRACKER_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/executor.h"
#include "trustledger/host/clock.h"
#include "trustledger/ledger/batch_validator.h"
#include "trustledger/ledger/config.h"
#include "trustledger/ledger/events.h"
#include "trustledger/ledger/ledger_store.h"
#include "trustledger/ledger/query.h"
#include "trustledger/ledger/statistics.h"
#include "trustledger/proof/input_proof.h"

#include <vector>

namespace trustledger {
namespace ledger {

class TrustScoreTracker {
public:
    TrustScoreTracker(fhe::FheExecutor& executor, const host::HostClock& clock,
                      const LedgerConfig& config = LedgerConfig::defaults());

    TrustScoreTracker(const TrustScoreTracker&) = delete;
    TrustScoreTracker& operator=(const TrustScoreTracker&) = delete;

    /** System identity proofs must be bound to */
    const Principal& identity() const { return executor_.system(); }
    const fhe::PaillierPublicKey& public_key() const { return executor_.public_key(); }
    const LedgerConfig& config() const { return store_.config(); }

    /** Listeners are not owned and must outlive the tracker */
    void add_listener(LedgerEventListener* listener);
    void remove_listener(LedgerEventListener* listener);

    // ------------------------------------------------------------------
    // Mutating
    // ------------------------------------------------------------------

    /**
     * @brief Append an encrypted score to caller's history
     *
     * Emits TrustEventRecorded(caller, count) and ScoreQueried(caller, RECORD).
     *
     * @return Index of the new event
     * @throws LedgerError EMPTY_PROOF, INVALID_PROOF, INVALID_ADDRESS,
     *         CAPACITY_EXCEEDED
     */
    size_t record_event(const Principal& caller, const CiphertextHandle& handle,
                        const ByteVec& proof);

    /**
     * @brief One boolean per input: score within [min_score, max_score]
     * @throws LedgerError BATCH_SIZE_INVALID, EMPTY_PROOF, INVALID_PROOF
     */
    std::vector<bool> validate_batch(const Principal& caller,
                                     const std::vector<CiphertextHandle>& handles,
                                     const std::vector<ByteVec>& proofs);

    /**
     * @brief Live statistics; refreshes the cache and emits StatisticsViewed
     * @throws LedgerError(INVALID_ADDRESS) for the zero principal
     */
    Statistics get_live_statistics(const Principal& user);

    // ------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------

    CiphertextHandle get_total(const Principal& user) const { return query_.total(user); }
    CiphertextHandle get_average(const Principal& user) const { return query_.average(user); }
    uint32_t get_event_count(const Principal& user) const { return query_.event_count(user); }
    size_t get_history_length(const Principal& user) const { return query_.history_length(user); }
    Timestamp get_last_activity(const Principal& user) const { return query_.last_activity(user); }

    CiphertextHandle get_by_index(const Principal& user, size_t index) const {
        return query_.by_index(user, index);
    }

    std::vector<CiphertextHandle> get_range(const Principal& user, size_t start, size_t end) const {
        return query_.range(user, start, end);
    }

    Statistics get_cached_statistics(const Principal& user) const {
        return query_.cached_statistics(user);
    }

    const QueryLayer& query() const { return query_; }
    const EncryptedLedgerStore& store() const { return store_; }

private:
    fhe::FheExecutor& executor_;
    const host::HostClock& clock_;
    proof::ProofVerifier verifier_;
    EncryptedLedgerStore store_;
    QueryLayer query_;
    BatchValidator batch_;
    std::vector<LedgerEventListener*> listeners_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_TRUST_SCORE_TRACKER_H
