/**
 * @file input_proof.h
 * @brief Proof of plaintext knowledge bound to a system and a submitter
 *
 * Non-interactive Sigma protocol (Fiat-Shamir) for a Paillier ciphertext
 * ct = (1 + n)^m * r^n mod n^2:
 *
 *   Prover:   s <- [0, 2^223), u <- Z*_n
 *             a  = (1 + s*n) * u^n mod n^2
 *             e  = H(domain, pk, system, submitter, type, ct, a)  (128 bits)
 *             z1 = s + e*m
 *             z2 = u * r^e mod n
 *   Verifier: z1 < 2^224, (1 + z1*n) * z2^n == a * ct^e (mod n^2)
 *
 * Wire layout:
 * @code
 *   "TLIP" | version(1) | type(1) | system(20) | submitter(20)
 *   | len(2, BE) ct | len(2, BE) a | len(2, BE) z1 | len(2, BE) z2
 * @endcode
 * Integers are little-endian.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_PROOF_INPUT_PROOF_H
#define TRUSTLEDGER_PROOF_INPUT_PROOF_H

#include "trustledger/core/types.h"
#include "trustledger/fhe/executor.h"
#include "trustledger/fhe/paillier.h"

#include <cstdint>
#include <vector>

namespace trustledger {
namespace proof {

constexpr uint8_t INPUT_PROOF_VERSION = 0x01;
constexpr long CHALLENGE_BITS = 128;
constexpr long COMMITMENT_MASK_BITS = 223;
constexpr long RESPONSE_BOUND_BITS = 224;

struct InputProof {
    ValueType type = ValueType::Uint32;
    Principal system;
    Principal submitter;
    ZZ ciphertext;
    ZZ commitment;
    ZZ z1;
    ZZ z2;

    ByteVec encode() const;

    /**
     * @brief Parse the wire form
     * @throws LedgerError(EMPTY_PROOF) for zero-length input
     * @throws LedgerError(INVALID_PROOF) for any malformed input
     */
    static InputProof decode(const uint8_t* data, size_t len);
    static InputProof decode(const ByteVec& bytes) { return decode(bytes.data(), bytes.size()); }
};

/** Fiat-Shamir challenge e in [0, 2^128) */
ZZ input_challenge(const fhe::PaillierPublicKey& pk, const Principal& system,
                   const Principal& submitter, ValueType type,
                   const ZZ& ciphertext, const ZZ& commitment);

/** Handle the submitter presents for a ciphertext */
CiphertextHandle input_handle(const fhe::PaillierPublicKey& pk, const ZZ& ciphertext,
                              const Principal& system, const Principal& submitter,
                              ValueType type);

/**
 * @brief Validates externally supplied ciphertexts before any state changes
 *
 * @code
 *   ProofVerifier verifier(executor.public_key(), executor.system());
 *   fhe::ExternalInput in = verifier.verify(handle, proof_bytes, caller);
 *   CiphertextHandle h = executor.import_input(in, {executor.system(), caller});
 * @endcode
 */
class ProofVerifier {
public:
    ProofVerifier(const fhe::PaillierPublicKey& pk, const Principal& system);

    /**
     * @brief Verify proof material for handle, submitted by submitter
     * @param expected Value type the caller accepts
     * @throws LedgerError(EMPTY_PROOF) if proof is empty
     * @throws LedgerError(INVALID_PROOF) if it is malformed, bound to another
     *         system or submitter, carries another value type, does not match
     *         handle, or fails verification
     */
    fhe::ExternalInput verify(const CiphertextHandle& handle, const ByteVec& proof,
                              const Principal& submitter,
                              ValueType expected = ValueType::Uint32) const;

private:
    fhe::PaillierPublicKey pk_;
    Principal system_;
};

} // namespace proof
} // namespace trustledger

#endif // TRUSTLEDGER_PROOF_INPUT_PROOF_H
