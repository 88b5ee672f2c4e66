/**
 * @file error.h
 * @brief C++ exception type carrying a trustledger error code
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CORE_ERROR_H
#define TRUSTLEDGER_CORE_ERROR_H

#include "trustledger/core/common.h"

#include <stdexcept>
#include <string>

namespace trustledger {

/**
 * @brief Named validation or protocol failure
 *
 * Every failure in the error taxonomy surfaces as a LedgerError whose code()
 * identifies the failure and whose what() carries the specific message.
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(trustledger_error_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    explicit LedgerError(trustledger_error_t code)
        : std::runtime_error(trustledger_error_string(code)), code_(code) {}

    trustledger_error_t code() const noexcept { return code_; }

private:
    trustledger_error_t code_;
};

} // namespace trustledger

#endif // TRUSTLEDGER_CORE_ERROR_H
