/**
 * @file digest.h
 * @brief SHA-256 and HKDF-SHA256 (OpenSSL EVP backend)
 *
 * Used for handle derivation, Fiat-Shamir challenges, principal derivation,
 * authorization digests and session key derivation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CRYPTO_DIGEST_H
#define TRUSTLEDGER_CRYPTO_DIGEST_H

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trustledger {
namespace crypto {

constexpr size_t SHA256_DIGEST_SIZE = 32;

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_SIZE>;

/**
 * @brief Incremental SHA-256
 *
 * @code
 *   Sha256 h;
 *   h.update("domain");
 *   h.update(bytes.data(), bytes.size());
 *   Sha256Digest d = h.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }
    Sha256& update(const std::string& label);

    /** Length-prefixed (u32 big-endian) update, for variable-size fields */
    Sha256& update_framed(const std::vector<uint8_t>& data);

    Sha256Digest finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

Sha256Digest sha256(const uint8_t* data, size_t len);
Sha256Digest sha256(const std::vector<uint8_t>& data);

/**
 * @brief HKDF-SHA256 (RFC 5869)
 * @throws LedgerError(INTERNAL) on backend failure
 */
std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& ikm,
                                 const std::vector<uint8_t>& salt,
                                 const std::vector<uint8_t>& info,
                                 size_t out_len);

} // namespace crypto
} // namespace trustledger

#endif // TRUSTLEDGER_CRYPTO_DIGEST_H
