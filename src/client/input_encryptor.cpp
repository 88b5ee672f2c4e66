/**
 * @file input_encryptor.cpp
 * @brief Client-side input encryption and proof generation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/client/input_encryptor.h"
#include "trustledger/proof/input_proof.h"

using namespace NTL;

namespace trustledger {
namespace client {

EncryptedInput InputEncryptor::encrypt_uint32(uint32_t value, const Principal& system,
                                              const Principal& submitter) const {
    ZZ m;
    conv(m, static_cast<unsigned long>(value));
    return encrypt(m, ValueType::Uint32, system, submitter);
}

EncryptedInput InputEncryptor::encrypt_bool(bool value, const Principal& system,
                                            const Principal& submitter) const {
    return encrypt(ZZ(value ? 1 : 0), ValueType::Bool, system, submitter);
}

EncryptedInput InputEncryptor::encrypt(const ZZ& m, ValueType type, const Principal& system,
                                       const Principal& submitter) const {
    const ZZ& n = pk_.n();

    ZZ r = pk_.random_unit();
    ZZ u = pk_.random_unit();
    ZZ s = fhe::random_bits(proof::COMMITMENT_MASK_BITS);

    proof::InputProof p;
    p.type = type;
    p.system = system;
    p.submitter = submitter;
    p.ciphertext = pk_.encrypt(m, r);
    p.commitment = pk_.encrypt(s, u);

    ZZ e = proof::input_challenge(pk_, system, submitter, type, p.ciphertext, p.commitment);
    p.z1 = s + e * m;
    p.z2 = MulMod(u, PowerMod(r, e, n), n);

    EncryptedInput out;
    out.handle = proof::input_handle(pk_, p.ciphertext, system, submitter, type);
    out.proof = p.encode();
    return out;
}

} // namespace client
} // namespace trustledger
