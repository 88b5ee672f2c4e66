/**
 * @file session_keys.h
 * @brief Ephemeral X25519 key pair for one reveal
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_REVEAL_SESSION_KEYS_H
#define TRUSTLEDGER_REVEAL_SESSION_KEYS_H

#include "trustledger/core/types.h"
#include "trustledger/crypto/primitives.h"

namespace trustledger {
namespace reveal {

class SessionKeyPair {
public:
    SessionKeyPair() = default;

    static SessionKeyPair generate();

    bool valid() const { return static_cast<bool>(key_); }
    const ByteVec& public_key() const { return public_key_; }

    /**
     * @brief X25519 shared secret with peer_public
     * @throws std::logic_error if the pair was wiped
     */
    ByteVec shared_secret(const ByteVec& peer_public) const;

    /** Release the private key; the pair becomes invalid */
    void wipe();

private:
    crypto::PkeyPtr key_;
    ByteVec public_key_;
};

} // namespace reveal
} // namespace trustledger

#endif // TRUSTLEDGER_REVEAL_SESSION_KEYS_H
