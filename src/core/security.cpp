/**
 * @file security.cpp
 * @brief CSPRNG and buffer wiping on top of OpenSSL
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/core/security.h"
#include "trustledger/core/error.h"

#include <climits>

#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace trustledger {

std::vector<uint8_t> random_bytes(size_t len) {
    std::vector<uint8_t> out(len);
    if (len == 0) {
        return out;
    }
    if (len > static_cast<size_t>(INT_MAX) || RAND_bytes(out.data(), static_cast<int>(len)) != 1) {
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "CSPRNG failure");
    }
    return out;
}

void wipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) {
        OPENSSL_cleanse(buf.data(), buf.size());
    }
    buf.clear();
}

} // namespace trustledger
