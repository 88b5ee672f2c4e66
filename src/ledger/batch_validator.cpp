/**
 * @file batch_validator.cpp
 * @brief Batch range validation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/batch_validator.h"
#include "trustledger/core/error.h"

namespace trustledger {
namespace ledger {

void BatchValidator::check_size(size_t handle_count, size_t proof_count) const {
    if (handle_count != proof_count) {
        throw LedgerError(TRUSTLEDGER_ERROR_BATCH_SIZE_INVALID, "Array length mismatch");
    }
    if (handle_count > config_.absolute_batch_cap) {
        throw LedgerError(TRUSTLEDGER_ERROR_BATCH_SIZE_INVALID, "Maximum batch size exceeded");
    }
    if (handle_count < config_.min_batch_size || handle_count > config_.max_batch_size) {
        throw LedgerError(TRUSTLEDGER_ERROR_BATCH_SIZE_INVALID,
                          "Batch size must be " + std::to_string(config_.min_batch_size) + "-" +
                              std::to_string(config_.max_batch_size));
    }
}

std::vector<bool> BatchValidator::validate(const Principal& caller,
                                           const std::vector<CiphertextHandle>& handles,
                                           const std::vector<ByteVec>& proofs) const {
    check_size(handles.size(), proofs.size());

    // Verify everything up front so a bad proof late in the batch leaves no
    // imported ciphertexts behind.
    std::vector<fhe::ExternalInput> inputs;
    inputs.reserve(handles.size());
    for (size_t i = 0; i < handles.size(); ++i) {
        inputs.push_back(verifier_.verify(handles[i], proofs[i], caller, ValueType::Uint32));
    }

    const fhe::GrantSet grants = {executor_.system()};
    std::vector<bool> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        CiphertextHandle x = executor_.import_input(input, grants);
        CiphertextHandle lower = executor_.ge(x, config_.min_score, grants);
        CiphertextHandle upper = executor_.le(x, config_.max_score, grants);
        CiphertextHandle ok = executor_.and_bool(lower, upper, grants);
        results.push_back(executor_.reveal_bool(ok));
    }
    return results;
}

} // namespace ledger
} // namespace trustledger
