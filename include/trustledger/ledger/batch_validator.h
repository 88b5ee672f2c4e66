/**
 * @file batch_validator.h
 * @brief Homomorphic range check over a batch of submitted scores
 *
 * For each input: verify the proof, import it, compute
 * ebool(x >= min_score) AND ebool(x <= max_score) and reveal only that bit.
 *
 * Size checks, in order:
 *   1. handles and proofs differ in length   -> "Array length mismatch"
 *   2. size above the absolute cap           -> "Maximum batch size exceeded"
 *   3. size outside [min, max] batch bounds  -> "Batch size must be 1-10"
 * All raise BatchSizeInvalid.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_BATCH_VALIDATOR_H
#define TRUSTLEDGER_LEDGER_BATCH_VALIDATOR_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/executor.h"
#include "trustledger/ledger/config.h"
#include "trustledger/proof/input_proof.h"

#include <vector>

namespace trustledger {
namespace ledger {

class BatchValidator {
public:
    BatchValidator(const proof::ProofVerifier& verifier, fhe::FheExecutor& executor,
                   const LedgerConfig& config)
        : verifier_(verifier), executor_(executor), config_(config) {}

    /**
     * @param caller Submitter every proof must be bound to
     * @throws LedgerError(BATCH_SIZE_INVALID) on size violations
     * @throws LedgerError(EMPTY_PROOF / INVALID_PROOF) if any proof fails
     */
    std::vector<bool> validate(const Principal& caller, const std::vector<CiphertextHandle>& handles,
                               const std::vector<ByteVec>& proofs) const;

    /** Size checks only */
    void check_size(size_t handle_count, size_t proof_count) const;

private:
    const proof::ProofVerifier& verifier_;
    fhe::FheExecutor& executor_;
    LedgerConfig config_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_BATCH_VALIDATOR_H
