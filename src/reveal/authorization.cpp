/**
 * @file authorization.cpp
 * @brief Reveal protocol messages and sealing
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/reveal/authorization.h"
#include "trustledger/core/error.h"
#include "trustledger/core/security.h"
#include "trustledger/crypto/digest.h"
#include "trustledger/crypto/primitives.h"
#include "trustledger/utils/encoding.h"

#include <algorithm>

namespace trustledger {
namespace reveal {

namespace {

const char kAuthorizationDomain[] = "trustledger.user-decrypt.v1";
const char kSealLabel[] = "trustledger.reveal.v1";

ByteVec seal_key(const ByteVec& shared, const ByteVec& ephemeral_public,
                 const CiphertextHandle& handle) {
    ByteVec info(kSealLabel, kSealLabel + sizeof(kSealLabel) - 1);
    info.insert(info.end(), handle.bytes().begin(), handle.bytes().end());
    return crypto::hkdf_sha256(shared, ephemeral_public, info, 32);
}

ByteVec handle_aad(const CiphertextHandle& handle) {
    return ByteVec(handle.bytes().begin(), handle.bytes().end());
}

} // namespace

// ============================================================================
// UserDecryptAuthorization
// ============================================================================

ByteVec UserDecryptAuthorization::signing_digest() const {
    ByteVec body;
    encoding::append_u32_be(body, static_cast<uint32_t>(systems.size()));
    for (const auto& s : systems) {
        body.insert(body.end(), s.bytes().begin(), s.bytes().end());
    }
    encoding::append_u64_be(body, start_timestamp);
    encoding::append_u32_be(body, duration_days);

    crypto::Sha256 h;
    h.update(kAuthorizationDomain);
    h.update_framed(session_public_key);
    h.update(body);
    crypto::Sha256Digest d = h.finalize();
    return ByteVec(d.begin(), d.end());
}

bool UserDecryptAuthorization::covers(const Principal& system) const {
    return std::find(systems.begin(), systems.end(), system) != systems.end();
}

bool UserDecryptAuthorization::valid_at(Timestamp now) const {
    if (duration_days < MIN_AUTHORIZATION_DAYS || duration_days > MAX_AUTHORIZATION_DAYS) {
        return false;
    }
    return now >= start_timestamp && now - start_timestamp < duration_days * SECONDS_PER_DAY;
}

// ============================================================================
// Sealing
// ============================================================================

SealedValue seal_value(uint32_t value, const CiphertextHandle& handle,
                       const ByteVec& recipient_public) {
    crypto::PkeyPtr ephemeral = crypto::x25519_generate();

    SealedValue sealed;
    sealed.ephemeral_public_key = crypto::x25519_public_key(ephemeral.get());
    sealed.nonce = random_bytes(TRUSTLEDGER_SEAL_NONCE_SIZE);

    ByteVec shared = crypto::x25519_derive(ephemeral.get(), recipient_public);
    ByteVec key = seal_key(shared, sealed.ephemeral_public_key, handle);
    wipe(shared);

    ByteVec plaintext;
    encoding::append_u32_be(plaintext, value);
    crypto::chacha20_poly1305_seal(key, sealed.nonce, handle_aad(handle), plaintext,
                                   sealed.ciphertext, sealed.tag);
    wipe(key);
    wipe(plaintext);
    return sealed;
}

uint32_t open_sealed(const SealedValue& sealed, const CiphertextHandle& handle,
                     const SessionKeyPair& keys) {
    if (sealed.nonce.size() != TRUSTLEDGER_SEAL_NONCE_SIZE ||
        sealed.tag.size() != TRUSTLEDGER_SEAL_TAG_SIZE || sealed.ciphertext.size() != 4) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "Malformed sealed value");
    }

    ByteVec shared = keys.shared_secret(sealed.ephemeral_public_key);
    ByteVec key = seal_key(shared, sealed.ephemeral_public_key, handle);
    wipe(shared);

    ByteVec plaintext;
    bool ok = crypto::chacha20_poly1305_open(key, sealed.nonce, handle_aad(handle),
                                             sealed.ciphertext, sealed.tag, plaintext);
    wipe(key);
    if (!ok || plaintext.size() != 4) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "Sealed value failed authentication");
    }
    uint32_t value = encoding::load_u32_be(plaintext.data());
    wipe(plaintext);
    return value;
}

} // namespace reveal
} // namespace trustledger
