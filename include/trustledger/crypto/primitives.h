/**
 * @file primitives.h
 * @brief X25519, Ed25519 and ChaCha20-Poly1305 wrappers (OpenSSL EVP backend)
 *
 * Key material is held in EVP_PKEY objects owned by std::unique_ptr with the
 * matching OpenSSL free function. All failures raise LedgerError(INTERNAL)
 * except signature/tag verification, which reports through the return value.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CRYPTO_PRIMITIVES_H
#define TRUSTLEDGER_CRYPTO_PRIMITIVES_H

#include <cstdint>
#include <memory>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace trustledger {
namespace crypto {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const;
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

// ============================================================================
// X25519
// ============================================================================

PkeyPtr x25519_generate();
std::vector<uint8_t> x25519_public_key(const EVP_PKEY* key);

/**
 * @brief Diffie-Hellman with a raw 32-byte peer public key
 * @throws LedgerError(INVALID_PARAM) if the peer key is malformed
 */
std::vector<uint8_t> x25519_derive(EVP_PKEY* own, const std::vector<uint8_t>& peer_public);

// ============================================================================
// Ed25519
// ============================================================================

PkeyPtr ed25519_generate();
PkeyPtr ed25519_from_seed(const std::vector<uint8_t>& seed);
std::vector<uint8_t> ed25519_public_key(const EVP_PKEY* key);
std::vector<uint8_t> ed25519_sign(EVP_PKEY* key, const std::vector<uint8_t>& message);

/**
 * @return true iff the signature verifies; malformed keys return false
 */
bool ed25519_verify(const std::vector<uint8_t>& public_key,
                    const std::vector<uint8_t>& message,
                    const std::vector<uint8_t>& signature);

// ============================================================================
// ChaCha20-Poly1305
// ============================================================================

void chacha20_poly1305_seal(const std::vector<uint8_t>& key,
                            const std::vector<uint8_t>& nonce,
                            const std::vector<uint8_t>& aad,
                            const std::vector<uint8_t>& plaintext,
                            std::vector<uint8_t>& ciphertext,
                            std::vector<uint8_t>& tag);

/**
 * @return true iff the tag authenticates; plaintext is left empty otherwise
 */
bool chacha20_poly1305_open(const std::vector<uint8_t>& key,
                            const std::vector<uint8_t>& nonce,
                            const std::vector<uint8_t>& aad,
                            const std::vector<uint8_t>& ciphertext,
                            const std::vector<uint8_t>& tag,
                            std::vector<uint8_t>& plaintext);

} // namespace crypto
} // namespace trustledger

#endif // TRUSTLEDGER_CRYPTO_PRIMITIVES_H
