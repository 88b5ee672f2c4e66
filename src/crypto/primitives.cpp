/**
 * @file primitives.cpp
 * @brief X25519 / Ed25519 / ChaCha20-Poly1305 over OpenSSL EVP
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/crypto/primitives.h"
#include "trustledger/core/common.h"
#include "trustledger/core/error.h"

#include <openssl/evp.h>

namespace trustledger {
namespace crypto {

namespace {

constexpr size_t RAW_KEY_SIZE = 32;

[[noreturn]] void backend_failure(const char* what) {
    throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, what);
}

PkeyPtr generate(int type) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(type, nullptr);
    if (ctx == nullptr) {
        backend_failure("Key context allocation failed");
    }
    EVP_PKEY* key = nullptr;
    bool ok = EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &key) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok || key == nullptr) {
        backend_failure("Key generation failed");
    }
    return PkeyPtr(key);
}

std::vector<uint8_t> raw_public(const EVP_PKEY* key) {
    std::vector<uint8_t> out(RAW_KEY_SIZE);
    size_t len = out.size();
    if (key == nullptr || EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 ||
        len != RAW_KEY_SIZE) {
        backend_failure("Public key export failed");
    }
    return out;
}

struct CipherCtx {
    EVP_CIPHER_CTX* ctx;
    CipherCtx() : ctx(EVP_CIPHER_CTX_new()) {
        if (ctx == nullptr) {
            backend_failure("Cipher context allocation failed");
        }
    }
    ~CipherCtx() { EVP_CIPHER_CTX_free(ctx); }
};

void check_aead_sizes(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce) {
    if (key.size() != 32 || nonce.size() != TRUSTLEDGER_SEAL_NONCE_SIZE) {
        throw std::invalid_argument("ChaCha20-Poly1305 requires 32-byte key and 12-byte nonce");
    }
}

} // namespace

void PkeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

// ============================================================================
// X25519
// ============================================================================

PkeyPtr x25519_generate() {
    return generate(EVP_PKEY_X25519);
}

std::vector<uint8_t> x25519_public_key(const EVP_PKEY* key) {
    return raw_public(key);
}

std::vector<uint8_t> x25519_derive(EVP_PKEY* own, const std::vector<uint8_t>& peer_public) {
    if (own == nullptr) {
        throw std::invalid_argument("X25519 private key missing");
    }
    if (peer_public.size() != TRUSTLEDGER_X25519_KEY_SIZE) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "X25519 peer key must be 32 bytes");
    }
    PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                             peer_public.data(), peer_public.size()));
    if (!peer) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "Malformed X25519 peer key");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(own, nullptr);
    if (ctx == nullptr) {
        backend_failure("X25519 context allocation failed");
    }
    std::vector<uint8_t> secret(RAW_KEY_SIZE);
    size_t len = secret.size();
    bool ok = EVP_PKEY_derive_init(ctx) == 1 &&
              EVP_PKEY_derive_set_peer(ctx, peer.get()) == 1 &&
              EVP_PKEY_derive(ctx, secret.data(), &len) == 1 && len == RAW_KEY_SIZE;
    EVP_PKEY_CTX_free(ctx);
    if (!ok) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "X25519 key agreement failed");
    }
    return secret;
}

// ============================================================================
// Ed25519
// ============================================================================

PkeyPtr ed25519_generate() {
    return generate(EVP_PKEY_ED25519);
}

PkeyPtr ed25519_from_seed(const std::vector<uint8_t>& seed) {
    if (seed.size() != RAW_KEY_SIZE) {
        throw std::invalid_argument("Ed25519 seed must be 32 bytes");
    }
    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                 seed.data(), seed.size());
    if (key == nullptr) {
        backend_failure("Ed25519 key import failed");
    }
    return PkeyPtr(key);
}

std::vector<uint8_t> ed25519_public_key(const EVP_PKEY* key) {
    return raw_public(key);
}

std::vector<uint8_t> ed25519_sign(EVP_PKEY* key, const std::vector<uint8_t>& message) {
    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    if (md_ctx == nullptr) {
        backend_failure("Signature context allocation failed");
    }
    std::vector<uint8_t> sig(TRUSTLEDGER_ED25519_SIG_SIZE);
    size_t sig_len = sig.size();
    bool ok = EVP_DigestSignInit(md_ctx, nullptr, nullptr, nullptr, key) == 1 &&
              EVP_DigestSign(md_ctx, sig.data(), &sig_len, message.data(), message.size()) == 1;
    EVP_MD_CTX_free(md_ctx);
    if (!ok || sig_len != TRUSTLEDGER_ED25519_SIG_SIZE) {
        backend_failure("Ed25519 signing failed");
    }
    return sig;
}

bool ed25519_verify(const std::vector<uint8_t>& public_key,
                    const std::vector<uint8_t>& message,
                    const std::vector<uint8_t>& signature) {
    if (public_key.size() != TRUSTLEDGER_ED25519_PUBKEY_SIZE ||
        signature.size() != TRUSTLEDGER_ED25519_SIG_SIZE) {
        return false;
    }
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                            public_key.data(), public_key.size()));
    if (!key) {
        return false;
    }
    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    if (md_ctx == nullptr) {
        backend_failure("Signature context allocation failed");
    }
    bool ok = EVP_DigestVerifyInit(md_ctx, nullptr, nullptr, nullptr, key.get()) == 1 &&
              EVP_DigestVerify(md_ctx, signature.data(), signature.size(),
                               message.data(), message.size()) == 1;
    EVP_MD_CTX_free(md_ctx);
    return ok;
}

// ============================================================================
// ChaCha20-Poly1305
// ============================================================================

void chacha20_poly1305_seal(const std::vector<uint8_t>& key,
                            const std::vector<uint8_t>& nonce,
                            const std::vector<uint8_t>& aad,
                            const std::vector<uint8_t>& plaintext,
                            std::vector<uint8_t>& ciphertext,
                            std::vector<uint8_t>& tag) {
    check_aead_sizes(key, nonce);
    CipherCtx c;
    ciphertext.assign(plaintext.size(), 0);
    tag.assign(TRUSTLEDGER_SEAL_TAG_SIZE, 0);
    int len = 0;

    if (EVP_EncryptInit_ex(c.ctx, EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data()) != 1) {
        backend_failure("ChaCha20-Poly1305 init failed");
    }
    if (!aad.empty() &&
        EVP_EncryptUpdate(c.ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        backend_failure("ChaCha20-Poly1305 AAD failed");
    }
    if (EVP_EncryptUpdate(c.ctx, ciphertext.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1 ||
        EVP_EncryptFinal_ex(c.ctx, ciphertext.data() + len, &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_AEAD_GET_TAG, TRUSTLEDGER_SEAL_TAG_SIZE,
                            tag.data()) != 1) {
        backend_failure("ChaCha20-Poly1305 encryption failed");
    }
}

bool chacha20_poly1305_open(const std::vector<uint8_t>& key,
                            const std::vector<uint8_t>& nonce,
                            const std::vector<uint8_t>& aad,
                            const std::vector<uint8_t>& ciphertext,
                            const std::vector<uint8_t>& tag,
                            std::vector<uint8_t>& plaintext) {
    check_aead_sizes(key, nonce);
    if (tag.size() != TRUSTLEDGER_SEAL_TAG_SIZE) {
        return false;
    }
    CipherCtx c;
    std::vector<uint8_t> out(ciphertext.size());
    std::vector<uint8_t> tag_copy(tag);
    int len = 0;

    if (EVP_DecryptInit_ex(c.ctx, EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data()) != 1) {
        backend_failure("ChaCha20-Poly1305 init failed");
    }
    if (!aad.empty() &&
        EVP_DecryptUpdate(c.ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return false;
    }
    if (EVP_DecryptUpdate(c.ctx, out.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
        return false;
    }
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_AEAD_SET_TAG, TRUSTLEDGER_SEAL_TAG_SIZE,
                            tag_copy.data()) != 1) {
        return false;
    }
    if (EVP_DecryptFinal_ex(c.ctx, out.data() + len, &len) != 1) {
        plaintext.clear();
        return false;
    }
    plaintext.swap(out);
    return true;
}

} // namespace crypto
} // namespace trustledger
