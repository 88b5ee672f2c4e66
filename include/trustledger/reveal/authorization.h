/**
 * @file authorization.h
 * @brief Reveal protocol messages
 *
 * - UserDecryptAuthorization: what the holder signs. Binds the session
 *   public key to a set of systems for a validity window.
 * - DecryptionRequest: handle + authorization + holder signature, sent to
 *   the re-encryption service.
 * - SealedValue: the service's reply, readable only with the session key.
 *
 * Sealing: shared = X25519(ephemeral, session_pub),
 * key = HKDF-SHA256(shared, salt = ephemeral_pub, info = label || handle),
 * ChaCha20-Poly1305 over the 4-byte big-endian value with AAD = handle.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_REVEAL_AUTHORIZATION_H
#define TRUSTLEDGER_REVEAL_AUTHORIZATION_H

#include "trustledger/core/types.h"
#include "trustledger/reveal/session_keys.h"

#include <cstdint>
#include <vector>

namespace trustledger {
namespace reveal {

constexpr uint32_t MIN_AUTHORIZATION_DAYS = 1;
constexpr uint32_t MAX_AUTHORIZATION_DAYS = 365;
constexpr Timestamp SECONDS_PER_DAY = 86400;

struct UserDecryptAuthorization {
    ByteVec session_public_key;
    std::vector<Principal> systems;
    Timestamp start_timestamp = 0;
    uint32_t duration_days = MIN_AUTHORIZATION_DAYS;

    /** SHA-256 over the domain-separated canonical encoding */
    ByteVec signing_digest() const;

    bool covers(const Principal& system) const;

    /** start <= now < start + duration_days days, with duration in range */
    bool valid_at(Timestamp now) const;
};

struct DecryptionRequest {
    CiphertextHandle handle;
    Principal system;
    Principal holder;
    ByteVec holder_public_key;
    UserDecryptAuthorization authorization;
    ByteVec signature;
};

struct SealedValue {
    ByteVec ephemeral_public_key;
    ByteVec nonce;
    ByteVec ciphertext;
    ByteVec tag;
};

/** Seal value for the holder of recipient_public, bound to handle */
SealedValue seal_value(uint32_t value, const CiphertextHandle& handle,
                       const ByteVec& recipient_public);

/**
 * @brief Open a sealed value with the session key pair
 * @throws LedgerError(INVALID_PARAM) if it fails to authenticate
 */
uint32_t open_sealed(const SealedValue& sealed, const CiphertextHandle& handle,
                     const SessionKeyPair& keys);

} // namespace reveal
} // namespace trustledger

#endif // TRUSTLEDGER_REVEAL_AUTHORIZATION_H
