/**
 * @file session_keys.cpp
 * @brief Ephemeral session keys
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/reveal/session_keys.h"

#include <stdexcept>

namespace trustledger {
namespace reveal {

SessionKeyPair SessionKeyPair::generate() {
    SessionKeyPair pair;
    pair.key_ = crypto::x25519_generate();
    pair.public_key_ = crypto::x25519_public_key(pair.key_.get());
    return pair;
}

ByteVec SessionKeyPair::shared_secret(const ByteVec& peer_public) const {
    if (!key_) {
        throw std::logic_error("Session key pair has been wiped");
    }
    return crypto::x25519_derive(key_.get(), peer_public);
}

void SessionKeyPair::wipe() {
    key_.reset();  // EVP_PKEY_free cleanses the private key
    public_key_.clear();
}

} // namespace reveal
} // namespace trustledger
