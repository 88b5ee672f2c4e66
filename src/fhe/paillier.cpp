/**
 * @file paillier.cpp
 * @brief Paillier cryptosystem implementation using NTL backend
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/fhe/paillier.h"
#include "trustledger/core/security.h"

#include <stdexcept>

using namespace NTL;

namespace trustledger {
namespace fhe {

namespace {

// NTL's PRG (used by GenPrime) starts from a fixed seed; reseed it once per
// thread from the OS CSPRNG before any key generation.
void seed_ntl_prg() {
    thread_local bool seeded = false;
    if (seeded) {
        return;
    }
    std::vector<uint8_t> seed = trustledger::random_bytes(32);
    SetSeed(seed.data(), static_cast<long>(seed.size()));
    wipe(seed);
    seeded = true;
}

ZZ reduce(const ZZ& value, const ZZ& modulus) {
    ZZ r;
    rem(r, value, modulus);  // sign follows modulus, so r is in [0, modulus)
    return r;
}

} // namespace

// ============================================================================
// Randomness / encoding helpers
// ============================================================================

ZZ random_below(const ZZ& bound) {
    if (bound <= 0) {
        throw std::invalid_argument("random_below requires a positive bound");
    }
    std::vector<uint8_t> buf = trustledger::random_bytes(static_cast<size_t>(NumBytes(bound)) + 8);
    ZZ x = zz_from_bytes(buf.data(), buf.size());
    wipe(buf);
    return reduce(x, bound);
}

ZZ random_bits(long bits) {
    if (bits <= 0) {
        return ZZ(0);
    }
    std::vector<uint8_t> buf = trustledger::random_bytes(static_cast<size_t>((bits + 7) / 8));
    ZZ x = zz_from_bytes(buf.data(), buf.size());
    wipe(buf);
    trunc(x, x, bits);
    return x;
}

std::vector<uint8_t> zz_to_bytes(const ZZ& value, long width) {
    if (sign(value) < 0) {
        throw std::invalid_argument("Cannot encode a negative integer");
    }
    if (NumBytes(value) > width) {
        throw std::invalid_argument("Integer does not fit the encoding width");
    }
    std::vector<uint8_t> out(static_cast<size_t>(width));
    BytesFromZZ(out.data(), value, width);
    return out;
}

std::vector<uint8_t> zz_to_bytes(const ZZ& value) {
    long width = NumBytes(value);
    return zz_to_bytes(value, width > 0 ? width : 1);
}

ZZ zz_from_bytes(const uint8_t* data, size_t len) {
    ZZ x;
    ZZFromBytes(x, data, static_cast<long>(len));
    return x;
}

// ============================================================================
// PaillierParams
// ============================================================================

PaillierParams PaillierParams::from_bits(long bits) {
    switch (bits) {
        case 512:
            return TOY_512();
        case 2048:
            return STANDARD_2048();
        case 3072:
            return HIGH_3072();
        default:
            throw std::invalid_argument("Unsupported Paillier modulus size: " + std::to_string(bits));
    }
}

// ============================================================================
// PaillierPublicKey
// ============================================================================

PaillierPublicKey::PaillierPublicKey(const ZZ& n) : n_(n) {
    if (n_ <= 1) {
        throw std::invalid_argument("Paillier modulus must be greater than 1");
    }
    n_squared_ = n_ * n_;
}

ZZ PaillierPublicKey::encrypt(const ZZ& m) const {
    return encrypt(m, random_unit());
}

ZZ PaillierPublicKey::encrypt(const ZZ& m, const ZZ& r) const {
    // (1 + n)^m = 1 + m*n (mod n^2)
    ZZ gm = (1 + reduce(m, n_) * n_) % n_squared_;
    ZZ rn = PowerMod(reduce(r, n_squared_), n_, n_squared_);
    return MulMod(gm, rn, n_squared_);
}

ZZ PaillierPublicKey::add(const ZZ& c1, const ZZ& c2) const {
    return MulMod(c1, c2, n_squared_);
}

ZZ PaillierPublicKey::add_plain(const ZZ& c, const ZZ& k) const {
    ZZ gk = (1 + reduce(k, n_) * n_) % n_squared_;
    return MulMod(c, gk, n_squared_);
}

ZZ PaillierPublicKey::mul_plain(const ZZ& c, const ZZ& k) const {
    return PowerMod(c, reduce(k, n_), n_squared_);
}

ZZ PaillierPublicKey::negate(const ZZ& c) const {
    return InvMod(c, n_squared_);
}

ZZ PaillierPublicKey::random_unit() const {
    ZZ r;
    do {
        r = random_below(n_);
    } while (IsZero(r) || GCD(r, n_) != 1);
    return r;
}

bool PaillierPublicKey::is_valid_ciphertext(const ZZ& c) const {
    return c > 0 && c < n_squared_ && GCD(c, n_) == 1;
}

std::vector<uint8_t> PaillierPublicKey::encode_ciphertext(const ZZ& c) const {
    return zz_to_bytes(c, ciphertext_bytes());
}

ZZ PaillierPublicKey::decode_ciphertext(const uint8_t* data, size_t len) const {
    if (data == nullptr || static_cast<long>(len) != ciphertext_bytes()) {
        throw std::invalid_argument("Ciphertext has wrong width");
    }
    return zz_from_bytes(data, len);
}

std::vector<uint8_t> PaillierPublicKey::serialize() const {
    return zz_to_bytes(n_);
}

PaillierPublicKey PaillierPublicKey::deserialize(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw std::invalid_argument("Empty Paillier public key");
    }
    return PaillierPublicKey(zz_from_bytes(bytes.data(), bytes.size()));
}

// ============================================================================
// PaillierPrivateKey
// ============================================================================

PaillierPrivateKey::PaillierPrivateKey(const PaillierPublicKey& pk, const ZZ& p, const ZZ& q)
    : pk_(pk) {
    if (p * q != pk.n()) {
        throw std::invalid_argument("Prime factors do not match the public modulus");
    }
    ZZ p1 = p - 1;
    ZZ q1 = q - 1;
    lambda_ = (p1 * q1) / GCD(p1, q1);
    mu_ = InvMod(lambda_ % pk.n(), pk.n());
}

ZZ PaillierPrivateKey::decrypt(const ZZ& c) const {
    const ZZ& n = pk_.n();
    ZZ u = PowerMod(c, lambda_, pk_.n_squared());
    ZZ l = (u - 1) / n;
    return MulMod(l % n, mu_, n);
}

ZZ PaillierPrivateKey::decrypt_signed(const ZZ& c) const {
    ZZ m = decrypt(c);
    if (2 * m > pk_.n()) {
        m -= pk_.n();
    }
    return m;
}

// ============================================================================
// Key generation
// ============================================================================

PaillierKeyPair PaillierKeyPair::generate(const PaillierParams& params) {
    if (params.modulus_bits < 512) {
        throw std::invalid_argument("Paillier modulus must be at least 512 bits");
    }
    seed_ntl_prg();

    const long prime_bits = params.modulus_bits / 2;
    ZZ p, q, n;
    do {
        GenPrime(p, prime_bits);
        GenPrime(q, prime_bits);
        n = p * q;
    } while (p == q || NumBits(n) != params.modulus_bits || GCD(n, (p - 1) * (q - 1)) != 1);

    PaillierKeyPair keys;
    keys.public_key = PaillierPublicKey(n);
    keys.private_key = PaillierPrivateKey(keys.public_key, p, q);
    return keys;
}

} // namespace fhe
} // namespace trustledger
