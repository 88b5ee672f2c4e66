/**
 * @file accumulator.cpp
 * @brief Aggregate fold
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/accumulator.h"

namespace trustledger {
namespace ledger {

AggregateState Accumulator::fold(const AggregateState& current, const CiphertextHandle& value,
                                 const fhe::GrantSet& grants) const {
    CiphertextHandle base = current.total;
    if (base.is_empty()) {
        base = executor_.trivial_encrypt(0, ValueType::Uint32, grants);
    }

    AggregateState next = current;
    next.total = executor_.add(base, value, grants);
    next.event_count = current.event_count + 1;
    next.average = executor_.div_scalar(next.total, next.event_count, grants);
    return next;
}

} // namespace ledger
} // namespace trustledger
