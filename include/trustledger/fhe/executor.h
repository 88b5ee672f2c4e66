/**
 * @file executor.h
 * @brief Ciphertext arena and homomorphic operation executor
 *
 * The executor owns every ciphertext produced for one system identity and
 * hands out 32-byte opaque handles. It is also the key custodian: the
 * Paillier private key never leaves it, and it only ever reveals
 *   - the sign of a blinded difference (for ge/le/and), as a fresh ebool;
 *   - a plaintext to a principal holding a grant on the handle.
 *
 * Encrypted integer semantics (euint32):
 *   open(x) = ((x mod 2^32) div d), where d is the accumulated plaintext
 *   divisor of the record (1 for ordinary values). Sums wrap silently.
 *
 * Every producing operation takes the GrantSet for its result. The set must
 * contain the system principal; grants are recorded before the handle is
 * returned, so no handle can exist without them.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_FHE_EXECUTOR_H
#define TRUSTLEDGER_FHE_EXECUTOR_H

#include "trustledger/acl/capability_directory.h"
#include "trustledger/core/types.h"
#include "trustledger/fhe/paillier.h"

#include <cstdint>
#include <unordered_map>

namespace trustledger {
namespace fhe {

using acl::GrantSet;

/**
 * @brief A ciphertext whose proof has been verified, ready to be imported
 */
struct ExternalInput {
    CiphertextHandle handle;   ///< handle chosen by the submitter's encoder
    ZZ ciphertext;
    ValueType type = ValueType::Uint32;
};

struct CiphertextRecord {
    ZZ value;
    ValueType type = ValueType::Uint32;
    uint64_t divisor = 1;      ///< pending plaintext divisor, at most 2^32
};

class FheExecutor {
public:
    /**
     * @param system    Identity of the hosting system (grantee of every result)
     * @param keys      Key pair held by this executor
     * @param directory Capability directory shared with the ledger
     */
    FheExecutor(const Principal& system, PaillierKeyPair keys, acl::CapabilityDirectory& directory);

    FheExecutor(const FheExecutor&) = delete;
    FheExecutor& operator=(const FheExecutor&) = delete;

    const Principal& system() const { return system_; }
    const PaillierPublicKey& public_key() const { return keys_.public_key; }
    const acl::CapabilityDirectory& directory() const { return directory_; }

    // ------------------------------------------------------------------
    // Producing operations
    // ------------------------------------------------------------------

    /** Bring a verified external ciphertext into the arena */
    CiphertextHandle import_input(const ExternalInput& input, const GrantSet& grants);

    /** Deterministic encryption of a public constant */
    CiphertextHandle trivial_encrypt(uint32_t value, ValueType type, const GrantSet& grants);

    /** euint32 + euint32 (wrapping) */
    CiphertextHandle add(const CiphertextHandle& a, const CiphertextHandle& b, const GrantSet& grants);

    /**
     * @brief euint32 / plaintext (floor)
     * @throws std::invalid_argument if divisor == 0
     */
    CiphertextHandle div_scalar(const CiphertextHandle& a, uint32_t divisor, const GrantSet& grants);

    /** ebool(a >= k) */
    CiphertextHandle ge(const CiphertextHandle& a, uint32_t k, const GrantSet& grants);

    /** ebool(a <= k) */
    CiphertextHandle le(const CiphertextHandle& a, uint32_t k, const GrantSet& grants);

    /** ebool(a && b) */
    CiphertextHandle and_bool(const CiphertextHandle& a, const CiphertextHandle& b, const GrantSet& grants);

    // ------------------------------------------------------------------
    // Decryption
    // ------------------------------------------------------------------

    /**
     * @brief Open a value for a principal holding a grant on it
     * @return euint32 value, or 0/1 for ebool
     * @throws LedgerError(CAPABILITY_DENIED) without a grant
     */
    uint32_t decrypt_authorized(const CiphertextHandle& handle, const Principal& requester) const;

    /**
     * @brief Publicly reveal an ebool produced for the system
     * @throws LedgerError(CAPABILITY_DENIED) if the system holds no grant
     */
    bool reveal_bool(const CiphertextHandle& handle) const;

    // ------------------------------------------------------------------
    // Arena inspection
    // ------------------------------------------------------------------

    bool contains(const CiphertextHandle& handle) const;
    size_t size() const { return arena_.size(); }

    /** @throws std::out_of_range for unknown handles */
    const CiphertextRecord& record(const CiphertextHandle& handle) const;

private:
    enum class Op : uint8_t {
        Import = 1,
        Trivial = 2,
        Add = 3,
        Div = 4,
        Ge = 5,
        Le = 6,
        And = 7
    };

    const CiphertextRecord& operand(const CiphertextHandle& handle, ValueType expected) const;
    CiphertextHandle derive_handle(Op op, const CiphertextHandle& a, const CiphertextHandle& b,
                                   uint64_t scalar, ValueType type);
    CiphertextHandle store(CiphertextRecord rec, Op op, const CiphertextHandle& a,
                           const CiphertextHandle& b, uint64_t scalar, const GrantSet& grants);
    void check_grants(const GrantSet& grants) const;

    /** Encrypted ebool of (plaintext of c) >= 0, learning only the sign */
    CiphertextRecord sign_test(const ZZ& c) const;

    uint32_t open(const CiphertextRecord& rec) const;

    Principal system_;
    PaillierKeyPair keys_;
    acl::CapabilityDirectory& directory_;
    std::unordered_map<CiphertextHandle, CiphertextRecord, HandleHash> arena_;
    uint64_t counter_ = 0;
};

} // namespace fhe
} // namespace trustledger

#endif // TRUSTLEDGER_FHE_EXECUTOR_H
