/**
 * @file input_proof.cpp
 * @brief Input proof encoding and verification
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/proof/input_proof.h"
#include "trustledger/core/error.h"
#include "trustledger/crypto/digest.h"
#include "trustledger/utils/encoding.h"

#include <cstring>

using namespace NTL;

namespace trustledger {
namespace proof {

namespace {

const uint8_t kMagic[4] = {'T', 'L', 'I', 'P'};
const size_t kHeaderSize = 4 + 1 + 1 + 2 * TRUSTLEDGER_PRINCIPAL_SIZE;

[[noreturn]] void reject(const std::string& reason) {
    throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PROOF, reason);
}

void append_integer(ByteVec& out, const ZZ& value) {
    ByteVec bytes = fhe::zz_to_bytes(value);
    if (bytes.size() > 0xFFFF) {
        throw std::invalid_argument("Proof integer too large to encode");
    }
    encoding::append_u16_be(out, static_cast<uint16_t>(bytes.size()));
    out.insert(out.end(), bytes.begin(), bytes.end());
}

ZZ read_integer(const uint8_t* data, size_t len, size_t& offset) {
    if (len - offset < 2) {
        reject("Truncated proof");
    }
    size_t n = encoding::load_u16_be(data + offset);
    offset += 2;
    if (n == 0 || len - offset < n) {
        reject("Truncated proof");
    }
    ZZ value = fhe::zz_from_bytes(data + offset, n);
    offset += n;
    return value;
}

bool is_known_type(uint8_t byte) {
    return byte == static_cast<uint8_t>(ValueType::Bool) ||
           byte == static_cast<uint8_t>(ValueType::Uint32);
}

} // namespace

// ============================================================================
// Wire form
// ============================================================================

ByteVec InputProof::encode() const {
    ByteVec out(kMagic, kMagic + sizeof(kMagic));
    out.push_back(INPUT_PROOF_VERSION);
    out.push_back(static_cast<uint8_t>(type));
    out.insert(out.end(), system.bytes().begin(), system.bytes().end());
    out.insert(out.end(), submitter.bytes().begin(), submitter.bytes().end());
    append_integer(out, ciphertext);
    append_integer(out, commitment);
    append_integer(out, z1);
    append_integer(out, z2);
    return out;
}

InputProof InputProof::decode(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        throw LedgerError(TRUSTLEDGER_ERROR_EMPTY_PROOF, "Proof must not be empty");
    }
    if (len < kHeaderSize || std::memcmp(data, kMagic, sizeof(kMagic)) != 0) {
        reject("Malformed proof header");
    }
    if (data[4] != INPUT_PROOF_VERSION) {
        reject("Unsupported proof version");
    }
    if (!is_known_type(data[5])) {
        reject("Unknown value type in proof");
    }

    InputProof p;
    p.type = static_cast<ValueType>(data[5]);
    size_t offset = 6;
    p.system = Principal::from_bytes(data + offset, TRUSTLEDGER_PRINCIPAL_SIZE);
    offset += TRUSTLEDGER_PRINCIPAL_SIZE;
    p.submitter = Principal::from_bytes(data + offset, TRUSTLEDGER_PRINCIPAL_SIZE);
    offset += TRUSTLEDGER_PRINCIPAL_SIZE;

    p.ciphertext = read_integer(data, len, offset);
    p.commitment = read_integer(data, len, offset);
    p.z1 = read_integer(data, len, offset);
    p.z2 = read_integer(data, len, offset);
    if (offset != len) {
        reject("Trailing bytes after proof");
    }
    return p;
}

// ============================================================================
// Transcript
// ============================================================================

ZZ input_challenge(const fhe::PaillierPublicKey& pk, const Principal& system,
                   const Principal& submitter, ValueType type,
                   const ZZ& ciphertext, const ZZ& commitment) {
    crypto::Sha256 h;
    h.update("trustledger.input.v1");
    h.update_framed(pk.serialize());
    h.update(system.data(), TRUSTLEDGER_PRINCIPAL_SIZE);
    h.update(submitter.data(), TRUSTLEDGER_PRINCIPAL_SIZE);
    uint8_t type_byte = static_cast<uint8_t>(type);
    h.update(&type_byte, 1);
    h.update_framed(pk.encode_ciphertext(ciphertext));
    h.update_framed(pk.encode_ciphertext(commitment));
    crypto::Sha256Digest d = h.finalize();
    return fhe::zz_from_bytes(d.data(), CHALLENGE_BITS / 8);
}

CiphertextHandle input_handle(const fhe::PaillierPublicKey& pk, const ZZ& ciphertext,
                              const Principal& system, const Principal& submitter,
                              ValueType type) {
    crypto::Sha256 h;
    h.update("trustledger.input");
    h.update(pk.encode_ciphertext(ciphertext));
    h.update(system.data(), TRUSTLEDGER_PRINCIPAL_SIZE);
    h.update(submitter.data(), TRUSTLEDGER_PRINCIPAL_SIZE);
    crypto::Sha256Digest d = h.finalize();
    return CiphertextHandle::make(d.data(), type);
}

// ============================================================================
// ProofVerifier
// ============================================================================

ProofVerifier::ProofVerifier(const fhe::PaillierPublicKey& pk, const Principal& system)
    : pk_(pk), system_(system) {}

fhe::ExternalInput ProofVerifier::verify(const CiphertextHandle& handle, const ByteVec& proof,
                                         const Principal& submitter,
                                         ValueType expected) const {
    InputProof p = InputProof::decode(proof);

    if (p.system != system_) {
        reject("Proof is bound to another system");
    }
    if (p.submitter != submitter) {
        reject("Proof is bound to another submitter");
    }
    if (p.type != expected) {
        reject("Unexpected input value type");
    }
    if (p.type != handle.type()) {
        reject("Handle type does not match proof");
    }

    const ZZ& n = pk_.n();
    const ZZ& n2 = pk_.n_squared();
    if (!pk_.is_valid_ciphertext(p.ciphertext) || !pk_.is_valid_ciphertext(p.commitment)) {
        reject("Proof ciphertext outside the ciphertext space");
    }
    if (p.z2 <= 0 || p.z2 >= n || GCD(p.z2, n) != 1 || NumBits(p.z1) > RESPONSE_BOUND_BITS) {
        reject("Proof response out of range");
    }
    if (input_handle(pk_, p.ciphertext, p.system, p.submitter, p.type) != handle) {
        reject("Handle does not match proof");
    }

    ZZ e = input_challenge(pk_, p.system, p.submitter, p.type, p.ciphertext, p.commitment);
    ZZ lhs = MulMod((1 + p.z1 * n) % n2, PowerMod(p.z2, n, n2), n2);
    ZZ rhs = MulMod(p.commitment, PowerMod(p.ciphertext, e, n2), n2);
    if (lhs != rhs) {
        reject("Proof verification failed");
    }

    fhe::ExternalInput input;
    input.handle = handle;
    input.ciphertext = p.ciphertext;
    input.type = p.type;
    return input;
}

} // namespace proof
} // namespace trustledger
