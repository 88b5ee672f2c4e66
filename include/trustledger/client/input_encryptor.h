/**
 * @file input_encryptor.h
 * @brief Client-side encoder: plaintext -> (handle, proof)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CLIENT_INPUT_ENCRYPTOR_H
#define TRUSTLEDGER_CLIENT_INPUT_ENCRYPTOR_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/paillier.h"

#include <cstdint>

namespace trustledger {
namespace client {

struct EncryptedInput {
    CiphertextHandle handle;
    ByteVec proof;
};

/**
 * @brief Encrypts scores for one target system under its public key
 *
 * The result is only accepted by the system named here, and only when
 * submitted by the named submitter.
 */
class InputEncryptor {
public:
    explicit InputEncryptor(const fhe::PaillierPublicKey& pk) : pk_(pk) {}

    EncryptedInput encrypt_uint32(uint32_t value, const Principal& system,
                                  const Principal& submitter) const;

    EncryptedInput encrypt_bool(bool value, const Principal& system,
                                const Principal& submitter) const;

private:
    EncryptedInput encrypt(const ZZ& m, ValueType type, const Principal& system,
                           const Principal& submitter) const;

    fhe::PaillierPublicKey pk_;
};

} // namespace client
} // namespace trustledger

#endif // TRUSTLEDGER_CLIENT_INPUT_ENCRYPTOR_H
