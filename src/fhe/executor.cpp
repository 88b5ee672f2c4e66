/**
 * @file executor.cpp
 * @brief Ciphertext arena and homomorphic operation executor
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/fhe/executor.h"
#include "trustledger/core/error.h"
#include "trustledger/crypto/digest.h"
#include "trustledger/utils/encoding.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace NTL;

namespace trustledger {
namespace fhe {

namespace {

const uint64_t kMaxDivisor = uint64_t(1) << 32;

const ZZ& two_pow_32() {
    static const ZZ value = power2_ZZ(32);
    return value;
}

// r is drawn from [1, 2^64); keeps |r*(x-k)+s| far below n/2 for any
// value reachable from a 32-bit ledger.
const ZZ& blind_bound() {
    static const ZZ value = power2_ZZ(64) - 1;
    return value;
}

ZZ to_zz(uint64_t v) {
    ZZ z;
    conv(z, static_cast<unsigned long>(v));
    return z;
}

} // namespace

FheExecutor::FheExecutor(const Principal& system, PaillierKeyPair keys,
                         acl::CapabilityDirectory& directory)
    : system_(system), keys_(std::move(keys)), directory_(directory) {
    if (system_.is_zero()) {
        throw std::invalid_argument("System identity must not be the zero principal");
    }
}

// ============================================================================
// Internal helpers
// ============================================================================

void FheExecutor::check_grants(const GrantSet& grants) const {
    if (std::find(grants.begin(), grants.end(), system_) == grants.end()) {
        throw std::invalid_argument("Grant set must include the system principal");
    }
}

const CiphertextRecord& FheExecutor::operand(const CiphertextHandle& handle,
                                             ValueType expected) const {
    if (!directory_.may_decrypt(handle, system_)) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPABILITY_DENIED,
                          "System holds no grant on operand " + handle.to_hex());
    }
    const CiphertextRecord& rec = record(handle);
    if (rec.type != expected) {
        throw std::invalid_argument(std::string("Operand type mismatch: expected ") +
                                    value_type_name(expected) + ", got " +
                                    value_type_name(rec.type));
    }
    return rec;
}

CiphertextHandle FheExecutor::derive_handle(Op op, const CiphertextHandle& a,
                                            const CiphertextHandle& b, uint64_t scalar,
                                            ValueType type) {
    std::vector<uint8_t> tail;
    tail.push_back(static_cast<uint8_t>(op));
    encoding::append_u64_be(tail, scalar);
    encoding::append_u64_be(tail, counter_++);
    tail.push_back(static_cast<uint8_t>(type));

    crypto::Sha256 h;
    h.update("trustledger.handle")
        .update(system_.data(), TRUSTLEDGER_PRINCIPAL_SIZE)
        .update(a.data(), TRUSTLEDGER_HANDLE_SIZE)
        .update(b.data(), TRUSTLEDGER_HANDLE_SIZE)
        .update(tail);
    crypto::Sha256Digest digest = h.finalize();
    return CiphertextHandle::make(digest.data(), type);
}

CiphertextHandle FheExecutor::store(CiphertextRecord rec, Op op, const CiphertextHandle& a,
                                    const CiphertextHandle& b, uint64_t scalar,
                                    const GrantSet& grants) {
    CiphertextHandle handle = derive_handle(op, a, b, scalar, rec.type);
    arena_[handle] = std::move(rec);
    directory_.grant_all(handle, grants);
    return handle;
}

CiphertextRecord FheExecutor::sign_test(const ZZ& c) const {
    const PaillierPublicKey& pk = keys_.public_key;
    ZZ r = random_below(blind_bound()) + 1;
    ZZ s = random_below(r);
    ZZ blinded = pk.add_plain(pk.mul_plain(c, r), s);

    bool non_negative = sign(keys_.private_key.decrypt_signed(blinded)) >= 0;

    CiphertextRecord out;
    out.value = pk.encrypt(ZZ(non_negative ? 1 : 0));
    out.type = ValueType::Bool;
    return out;
}

uint32_t FheExecutor::open(const CiphertextRecord& rec) const {
    ZZ m = keys_.private_key.decrypt_signed(rec.value);
    if (rec.type == ValueType::Bool) {
        return IsZero(m) ? 0 : 1;
    }
    ZZ wrapped;
    rem(wrapped, m, two_pow_32());
    unsigned long v = 0;
    conv(v, wrapped);
    return static_cast<uint32_t>(v / rec.divisor);
}

// ============================================================================
// Producing operations
// ============================================================================

CiphertextHandle FheExecutor::import_input(const ExternalInput& input, const GrantSet& grants) {
    check_grants(grants);
    if (!keys_.public_key.is_valid_ciphertext(input.ciphertext)) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_PROOF, "Ciphertext outside the ciphertext space");
    }
    CiphertextRecord rec;
    rec.value = input.ciphertext;
    rec.type = input.type;
    return store(std::move(rec), Op::Import, input.handle, CiphertextHandle::empty(), 0, grants);
}

CiphertextHandle FheExecutor::trivial_encrypt(uint32_t value, ValueType type, const GrantSet& grants) {
    check_grants(grants);
    if (type == ValueType::Bool) {
        value = value != 0 ? 1 : 0;
    }
    CiphertextRecord rec;
    rec.value = keys_.public_key.encrypt(ZZ(value), ZZ(1));
    rec.type = type;
    return store(std::move(rec), Op::Trivial, CiphertextHandle::empty(),
                 CiphertextHandle::empty(), value, grants);
}

CiphertextHandle FheExecutor::add(const CiphertextHandle& a, const CiphertextHandle& b,
                                  const GrantSet& grants) {
    check_grants(grants);
    const CiphertextRecord& ra = operand(a, ValueType::Uint32);
    const CiphertextRecord& rb = operand(b, ValueType::Uint32);
    if (ra.divisor != 1 || rb.divisor != 1) {
        throw std::invalid_argument("Cannot add a pending quotient");
    }
    CiphertextRecord rec;
    rec.value = keys_.public_key.add(ra.value, rb.value);
    return store(std::move(rec), Op::Add, a, b, 0, grants);
}

CiphertextHandle FheExecutor::div_scalar(const CiphertextHandle& a, uint32_t divisor,
                                         const GrantSet& grants) {
    if (divisor == 0) {
        throw std::invalid_argument("Division by zero");
    }
    check_grants(grants);
    const CiphertextRecord& ra = operand(a, ValueType::Uint32);

    // floor(floor(x / d1) / d2) == floor(x / (d1 * d2)); any divisor of at
    // least 2^32 yields zero for a 32-bit value.
    CiphertextRecord rec;
    rec.value = ra.value;
    rec.divisor = std::min(ra.divisor * divisor, kMaxDivisor);
    return store(std::move(rec), Op::Div, a, CiphertextHandle::empty(), divisor, grants);
}

CiphertextHandle FheExecutor::ge(const CiphertextHandle& a, uint32_t k, const GrantSet& grants) {
    check_grants(grants);
    const CiphertextRecord& ra = operand(a, ValueType::Uint32);
    const PaillierPublicKey& pk = keys_.public_key;

    // floor(x / d) >= k  <=>  x - k*d >= 0
    ZZ threshold = ZZ(k) * to_zz(ra.divisor);
    CiphertextRecord rec = sign_test(pk.add_plain(ra.value, -threshold));
    return store(std::move(rec), Op::Ge, a, CiphertextHandle::empty(), k, grants);
}

CiphertextHandle FheExecutor::le(const CiphertextHandle& a, uint32_t k, const GrantSet& grants) {
    check_grants(grants);
    const CiphertextRecord& ra = operand(a, ValueType::Uint32);
    const PaillierPublicKey& pk = keys_.public_key;

    // floor(x / d) <= k  <=>  (k*d + d - 1) - x >= 0
    ZZ threshold = ZZ(k) * to_zz(ra.divisor) + to_zz(ra.divisor) - 1;
    CiphertextRecord rec = sign_test(pk.add_plain(pk.negate(ra.value), threshold));
    return store(std::move(rec), Op::Le, a, CiphertextHandle::empty(), k, grants);
}

CiphertextHandle FheExecutor::and_bool(const CiphertextHandle& a, const CiphertextHandle& b,
                                       const GrantSet& grants) {
    check_grants(grants);
    const CiphertextRecord& ra = operand(a, ValueType::Bool);
    const CiphertextRecord& rb = operand(b, ValueType::Bool);
    const PaillierPublicKey& pk = keys_.public_key;

    // a + b - 2 >= 0 only when both are 1
    CiphertextRecord rec = sign_test(pk.add_plain(pk.add(ra.value, rb.value), ZZ(-2)));
    return store(std::move(rec), Op::And, a, b, 0, grants);
}

// ============================================================================
// Decryption
// ============================================================================

uint32_t FheExecutor::decrypt_authorized(const CiphertextHandle& handle,
                                         const Principal& requester) const {
    if (!directory_.may_decrypt(handle, requester)) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPABILITY_DENIED,
                          "Principal " + requester.to_hex() + " holds no grant on " + handle.to_hex());
    }
    return open(record(handle));
}

bool FheExecutor::reveal_bool(const CiphertextHandle& handle) const {
    return open(operand(handle, ValueType::Bool)) != 0;
}

bool FheExecutor::contains(const CiphertextHandle& handle) const {
    return arena_.find(handle) != arena_.end();
}

const CiphertextRecord& FheExecutor::record(const CiphertextHandle& handle) const {
    auto it = arena_.find(handle);
    if (it == arena_.end()) {
        throw std::out_of_range("Unknown ciphertext handle " + handle.to_hex());
    }
    return it->second;
}

} // namespace fhe
} // namespace trustledger
