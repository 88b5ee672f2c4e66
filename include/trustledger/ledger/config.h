/**
 * @file config.h
 * @brief Ledger limits
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_CONFIG_H
#define TRUSTLEDGER_LEDGER_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace trustledger {
namespace ledger {

struct LedgerConfig {
    /** Hard cap on history length per user */
    size_t max_events = 1000;

    /** Business-rule batch bounds for validate_batch */
    size_t min_batch_size = 1;
    size_t max_batch_size = 10;

    /** Absolute batch cap, checked before the business rule */
    size_t absolute_batch_cap = 50;

    /** Inclusive range a valid score must lie in */
    uint32_t min_score = 1;
    uint32_t max_score = 10;

    static LedgerConfig defaults() { return LedgerConfig(); }
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_CONFIG_H
