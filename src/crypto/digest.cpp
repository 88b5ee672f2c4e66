/**
 * @file digest.cpp
 * @brief SHA-256 and HKDF-SHA256 over OpenSSL EVP
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/crypto/digest.h"
#include "trustledger/core/error.h"
#include "trustledger/utils/encoding.h"

#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace trustledger {
namespace crypto {

struct Sha256::Impl {
    EVP_MD_CTX* ctx = nullptr;
    bool finalized = false;
};

Sha256::Sha256() : impl_(new Impl) {
    impl_->ctx = EVP_MD_CTX_new();
    if (impl_->ctx == nullptr || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(impl_->ctx);
        impl_->ctx = nullptr;
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "SHA-256 init failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(impl_->ctx);
}

Sha256& Sha256::update(const uint8_t* data, size_t len) {
    if (impl_->finalized) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "SHA-256 update failed");
    }
    return *this;
}

Sha256& Sha256::update(const std::string& label) {
    return update(reinterpret_cast<const uint8_t*>(label.data()), label.size());
}

Sha256& Sha256::update_framed(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> len;
    encoding::append_u32_be(len, static_cast<uint32_t>(data.size()));
    update(len);
    return update(data);
}

Sha256Digest Sha256::finalize() {
    if (impl_->finalized) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    Sha256Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out.data(), &out_len) != 1 ||
        out_len != SHA256_DIGEST_SIZE) {
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "SHA-256 final failed");
    }
    impl_->finalized = true;
    return out;
}

Sha256Digest sha256(const uint8_t* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.finalize();
}

Sha256Digest sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& ikm,
                                 const std::vector<uint8_t>& salt,
                                 const std::vector<uint8_t>& info,
                                 size_t out_len) {
    if (ikm.empty() || out_len == 0) {
        throw std::invalid_argument("HKDF requires key material and output length");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (ctx == nullptr) {
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "HKDF context allocation failed");
    }

    std::vector<uint8_t> out(out_len);
    size_t len = out_len;
    bool ok = EVP_PKEY_derive_init(ctx) == 1 &&
              EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) == 1 &&
              (salt.empty() ||
               EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt.data(), static_cast<int>(salt.size())) == 1) &&
              EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm.data(), static_cast<int>(ikm.size())) == 1 &&
              (info.empty() ||
               EVP_PKEY_CTX_add1_hkdf_info(ctx, info.data(), static_cast<int>(info.size())) == 1) &&
              EVP_PKEY_derive(ctx, out.data(), &len) == 1 && len == out_len;
    EVP_PKEY_CTX_free(ctx);

    if (!ok) {
        throw LedgerError(TRUSTLEDGER_ERROR_INTERNAL, "HKDF derivation failed");
    }
    return out;
}

} // namespace crypto
} // namespace trustledger
