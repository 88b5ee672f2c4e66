/**
 * @file wallet.h
 * @brief Ed25519 holder identity
 *
 * principal = last 20 bytes of SHA-256(public key)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_REVEAL_WALLET_H
#define TRUSTLEDGER_REVEAL_WALLET_H

#include "trustledger/core/types.h"
#include "trustledger/crypto/primitives.h"

namespace trustledger {
namespace reveal {

class Wallet {
public:
    static Wallet generate();

    /** @throws LedgerError(INVALID_PARAM) unless seed is 32 bytes */
    static Wallet from_seed(const ByteVec& seed);

    static Principal principal_of(const ByteVec& public_key);

    const ByteVec& public_key() const { return public_key_; }
    const Principal& principal() const { return principal_; }

    ByteVec sign(const ByteVec& message) const;

private:
    explicit Wallet(crypto::PkeyPtr key);

    crypto::PkeyPtr key_;
    ByteVec public_key_;
    Principal principal_;
};

} // namespace reveal
} // namespace trustledger

#endif // TRUSTLEDGER_REVEAL_WALLET_H
