/**
 * @file kms_gateway.cpp
 * @brief In-process re-encryption gateway
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/reveal/reencryption_service.h"
#include "trustledger/core/error.h"
#include "trustledger/crypto/primitives.h"
#include "trustledger/reveal/wallet.h"

namespace trustledger {
namespace reveal {

namespace {

[[noreturn]] void deny(const std::string& reason) {
    throw LedgerError(TRUSTLEDGER_ERROR_CAPABILITY_DENIED, reason);
}

} // namespace

SealedValue KmsGateway::reencrypt(const DecryptionRequest& request) {
    if (!online_) {
        throw LedgerError(TRUSTLEDGER_ERROR_REMOTE_SERVICE_UNAVAILABLE,
                          "Re-encryption service unavailable");
    }

    const Principal& system = executor_.system();
    const UserDecryptAuthorization& auth = request.authorization;

    if (request.system != system) {
        deny("Request targets another system");
    }
    if (request.holder_public_key.size() != TRUSTLEDGER_ED25519_PUBKEY_SIZE ||
        Wallet::principal_of(request.holder_public_key) != request.holder) {
        deny("Holder key does not match holder");
    }
    if (!crypto::ed25519_verify(request.holder_public_key, auth.signing_digest(),
                                request.signature)) {
        deny("Invalid authorization signature");
    }
    if (!auth.valid_at(clock_.now())) {
        deny("Authorization outside its validity window");
    }
    if (!auth.covers(system)) {
        deny("Authorization does not cover this system");
    }
    const acl::CapabilityDirectory& directory = executor_.directory();
    if (!directory.may_decrypt(request.handle, request.holder) ||
        !directory.may_decrypt(request.handle, system)) {
        deny("Holder is not authorized for this handle");
    }

    uint32_t value = executor_.decrypt_authorized(request.handle, request.holder);
    SealedValue sealed = seal_value(value, request.handle, auth.session_public_key);
    ++served_;
    return sealed;
}

} // namespace reveal
} // namespace trustledger
