/**
 * @file paillier.h
 * @brief Paillier additively homomorphic encryption (NTL backend)
 *
 * Ciphertext space Z*_{n^2}, plaintext space Z_n, generator g = n + 1.
 *
 * Homomorphic operations available to any holder of the public key:
 * - add(c1, c2)          Enc(m1 + m2)
 * - add_plain(c, k)      Enc(m + k)
 * - mul_plain(c, k)      Enc(k * m)
 *
 * Plaintexts are interpreted as signed residues in (-n/2, n/2] by
 * decrypt_signed(), which the executor relies on for sign tests.
 *
 * Usage Example:
 * @code
 *   auto keys = PaillierKeyPair::generate(PaillierParams::TOY_512());
 *   NTL::ZZ c = keys.public_key.encrypt(NTL::ZZ(7));
 *   NTL::ZZ d = keys.public_key.add_plain(c, NTL::ZZ(3));
 *   NTL::ZZ m = keys.private_key.decrypt(d);   // 10
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_FHE_PAILLIER_H
#define TRUSTLEDGER_FHE_PAILLIER_H

#include <cstdint>
#include <string>
#include <vector>
#include <NTL/ZZ.h>

using NTL::ZZ;

namespace trustledger {
namespace fhe {

// ============================================================================
// Parameters
// ============================================================================

/**
 * @brief Key size presets
 */
struct PaillierParams {
    long modulus_bits;
    const char* name;

    /**
     * @brief 512-bit modulus
     * @warning NOT cryptographically secure! For tests and demos only.
     */
    static PaillierParams TOY_512() { return {512, "toy-512"}; }

    /** 2048-bit modulus (~112-bit security) */
    static PaillierParams STANDARD_2048() { return {2048, "standard-2048"}; }

    /** 3072-bit modulus (~128-bit security) */
    static PaillierParams HIGH_3072() { return {3072, "high-3072"}; }

    /**
     * @brief Preset by modulus size
     * @throws std::invalid_argument for sizes other than 512/2048/3072
     */
    static PaillierParams from_bits(long bits);
};

// ============================================================================
// Public key
// ============================================================================

class PaillierPublicKey {
public:
    PaillierPublicKey() = default;
    explicit PaillierPublicKey(const ZZ& n);

    const ZZ& n() const { return n_; }
    const ZZ& n_squared() const { return n_squared_; }
    long modulus_bits() const { return NTL::NumBits(n_); }

    /** Fixed ciphertext width in bytes (size of n^2) */
    long ciphertext_bytes() const { return NTL::NumBytes(n_squared_); }

    /** Encrypt with fresh randomness; negative m is encoded as n - |m| */
    ZZ encrypt(const ZZ& m) const;

    /** Encrypt with caller-supplied randomness r in Z*_n */
    ZZ encrypt(const ZZ& m, const ZZ& r) const;

    ZZ add(const ZZ& c1, const ZZ& c2) const;
    ZZ add_plain(const ZZ& c, const ZZ& k) const;
    ZZ mul_plain(const ZZ& c, const ZZ& k) const;
    ZZ negate(const ZZ& c) const;

    /** Uniform element of Z*_n from the CSPRNG */
    ZZ random_unit() const;

    /** c in [1, n^2) and gcd(c, n) == 1 */
    bool is_valid_ciphertext(const ZZ& c) const;

    std::vector<uint8_t> encode_ciphertext(const ZZ& c) const;
    ZZ decode_ciphertext(const uint8_t* data, size_t len) const;

    /** Modulus bytes, used as the key fingerprint in transcripts */
    std::vector<uint8_t> serialize() const;
    static PaillierPublicKey deserialize(const std::vector<uint8_t>& bytes);

    bool operator==(const PaillierPublicKey& other) const { return n_ == other.n_; }

private:
    ZZ n_;
    ZZ n_squared_;
};

// ============================================================================
// Private key
// ============================================================================

class PaillierPrivateKey {
public:
    PaillierPrivateKey() = default;
    PaillierPrivateKey(const PaillierPublicKey& pk, const ZZ& p, const ZZ& q);

    const PaillierPublicKey& public_key() const { return pk_; }

    /** Plaintext in [0, n) */
    ZZ decrypt(const ZZ& c) const;

    /** Plaintext as a signed residue in (-n/2, n/2] */
    ZZ decrypt_signed(const ZZ& c) const;

private:
    PaillierPublicKey pk_;
    ZZ lambda_;
    ZZ mu_;
};

struct PaillierKeyPair {
    PaillierPublicKey public_key;
    PaillierPrivateKey private_key;

    /**
     * @brief Generate a fresh key pair
     * @throws std::invalid_argument if modulus_bits < 512
     */
    static PaillierKeyPair generate(const PaillierParams& params);
};

// ============================================================================
// Randomness helpers (CSPRNG-backed)
// ============================================================================

/** Uniform in [0, bound), bias below 2^-64 */
ZZ random_below(const ZZ& bound);

/** Uniform in [0, 2^bits) */
ZZ random_bits(long bits);

/** Little-endian fixed-width encoding used for all integers on the wire */
std::vector<uint8_t> zz_to_bytes(const ZZ& value, long width);
std::vector<uint8_t> zz_to_bytes(const ZZ& value);
ZZ zz_from_bytes(const uint8_t* data, size_t len);

} // namespace fhe
} // namespace trustledger

#endif // TRUSTLEDGER_FHE_PAILLIER_H
