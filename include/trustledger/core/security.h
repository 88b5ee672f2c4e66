/**
 * @file security.h
 * @brief CSPRNG and secret wiping
 *
 * Ciphertext randomness, proof masks, nonces and key seeds come from
 * random_bytes(); temporary key material is released through wipe().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CORE_SECURITY_H
#define TRUSTLEDGER_CORE_SECURITY_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace trustledger {

/**
 * @brief Random bytes from the OpenSSL CSPRNG
 * @throws LedgerError(INTERNAL) if the CSPRNG fails
 */
std::vector<uint8_t> random_bytes(size_t len);

/**
 * @brief Cleanse and clear a byte vector
 */
void wipe(std::vector<uint8_t>& buf);

} // namespace trustledger

#endif // TRUSTLEDGER_CORE_SECURITY_H
