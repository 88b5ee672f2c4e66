/**
 * @file wallet.cpp
 * @brief Ed25519 holder identity
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/reveal/wallet.h"
#include "trustledger/core/error.h"
#include "trustledger/crypto/digest.h"

#include <utility>

namespace trustledger {
namespace reveal {

Wallet::Wallet(crypto::PkeyPtr key)
    : key_(std::move(key)),
      public_key_(crypto::ed25519_public_key(key_.get())),
      principal_(principal_of(public_key_)) {}

Wallet Wallet::generate() {
    return Wallet(crypto::ed25519_generate());
}

Wallet Wallet::from_seed(const ByteVec& seed) {
    if (seed.size() != 32) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PARAM, "Wallet seed must be 32 bytes");
    }
    return Wallet(crypto::ed25519_from_seed(seed));
}

Principal Wallet::principal_of(const ByteVec& public_key) {
    crypto::Sha256Digest d = crypto::sha256(public_key);
    return Principal::from_bytes(d.data() + d.size() - TRUSTLEDGER_PRINCIPAL_SIZE,
                                 TRUSTLEDGER_PRINCIPAL_SIZE);
}

ByteVec Wallet::sign(const ByteVec& message) const {
    return crypto::ed25519_sign(key_.get(), message);
}

} // namespace reveal
} // namespace trustledger
