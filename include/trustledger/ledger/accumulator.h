/**
 * @file accumulator.h
 * @brief Homomorphic fold of a new event into the running aggregates
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_ACCUMULATOR_H
#define TRUSTLEDGER_LEDGER_ACCUMULATOR_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/executor.h"

#include <cstdint>

namespace trustledger {
namespace ledger {

struct AggregateState {
    CiphertextHandle total;        ///< empty until the first append
    CiphertextHandle average;      ///< empty until the first append
    uint32_t event_count = 0;
    Timestamp last_activity = 0;
};

/**
 * @brief next = fold(current, x)
 *
 *   total'   = total + x          (trivial 0 when no total exists yet)
 *   count'   = count + 1
 *   average' = total' / count'    (plaintext divisor)
 *
 * Only homomorphic add and divide-by-plaintext are used. last_activity is
 * carried over unchanged; the store stamps it on commit.
 */
class Accumulator {
public:
    explicit Accumulator(fhe::FheExecutor& executor) : executor_(executor) {}

    AggregateState fold(const AggregateState& current, const CiphertextHandle& value,
                        const fhe::GrantSet& grants) const;

private:
    fhe::FheExecutor& executor_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_ACCUMULATOR_H
