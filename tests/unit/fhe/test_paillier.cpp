/**
 * @file test_paillier.cpp
 * @brief Unit tests for the Paillier backend (TOY_512)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "ledger_test_support.h"

using namespace trustledger;
using namespace trustledger::fhe;
using NTL::ZZ;

// ============================================================================
// Test Fixtures
// ============================================================================

class PaillierTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { keys_ = &trustledger::testing::shared_toy_keys(); }

    const PaillierPublicKey& pk() const { return keys_->public_key; }
    const PaillierPrivateKey& sk() const { return keys_->private_key; }

    static inline const PaillierKeyPair* keys_ = nullptr;
};

// ============================================================================
// Parameters / key generation
// ============================================================================

TEST(PaillierParamsTest, Presets) {
    EXPECT_EQ(PaillierParams::TOY_512().modulus_bits, 512);
    EXPECT_EQ(PaillierParams::from_bits(2048).modulus_bits, 2048);
    EXPECT_EQ(PaillierParams::from_bits(3072).modulus_bits, 3072);
    EXPECT_THROW(PaillierParams::from_bits(1024), std::invalid_argument);
}

TEST(PaillierParamsTest, RejectsUndersizedModulus) {
    PaillierParams weak{256, "weak"};
    EXPECT_THROW(PaillierKeyPair::generate(weak), std::invalid_argument);
}

TEST_F(PaillierTest, ModulusHasRequestedSize) {
    EXPECT_EQ(pk().modulus_bits(), 512);
    EXPECT_EQ(pk().ciphertext_bytes(), 128);
}

// ============================================================================
// Encryption / homomorphism
// ============================================================================

TEST_F(PaillierTest, EncryptDecrypt) {
    for (long m : {0L, 1L, 7L, 4294967295L}) {
        ZZ c = pk().encrypt(ZZ(m));
        EXPECT_TRUE(pk().is_valid_ciphertext(c));
        EXPECT_EQ(sk().decrypt(c), ZZ(m));
    }
}

TEST_F(PaillierTest, EncryptionIsRandomized) {
    EXPECT_NE(pk().encrypt(ZZ(5)), pk().encrypt(ZZ(5)));
}

TEST_F(PaillierTest, HomomorphicAddition) {
    ZZ c = pk().add(pk().encrypt(ZZ(20)), pk().encrypt(ZZ(22)));
    EXPECT_EQ(sk().decrypt(c), ZZ(42));
    EXPECT_EQ(sk().decrypt(pk().add_plain(c, ZZ(8))), ZZ(50));
}

TEST_F(PaillierTest, PlaintextMultiplication) {
    ZZ c = pk().mul_plain(pk().encrypt(ZZ(6)), ZZ(7));
    EXPECT_EQ(sk().decrypt(c), ZZ(42));
}

TEST_F(PaillierTest, SignedDecoding) {
    ZZ c = pk().add_plain(pk().encrypt(ZZ(3)), ZZ(-10));
    EXPECT_EQ(sk().decrypt_signed(c), ZZ(-7));
    EXPECT_EQ(sk().decrypt(c), pk().n() - 7);

    ZZ neg = pk().negate(pk().encrypt(ZZ(12)));
    EXPECT_EQ(sk().decrypt_signed(neg), ZZ(-12));
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(PaillierTest, CiphertextEncodingIsFixedWidth) {
    ZZ c = pk().encrypt(ZZ(1));
    std::vector<uint8_t> bytes = pk().encode_ciphertext(c);
    ASSERT_EQ(static_cast<long>(bytes.size()), pk().ciphertext_bytes());
    EXPECT_EQ(pk().decode_ciphertext(bytes.data(), bytes.size()), c);
    EXPECT_THROW(pk().decode_ciphertext(bytes.data(), bytes.size() - 1), std::invalid_argument);
}

TEST_F(PaillierTest, PublicKeySerialization) {
    PaillierPublicKey copy = PaillierPublicKey::deserialize(pk().serialize());
    EXPECT_TRUE(copy == pk());
}

TEST(PaillierHelpersTest, IntegerEncoding) {
    EXPECT_THROW(zz_to_bytes(ZZ(70000), 2), std::invalid_argument);
    EXPECT_THROW(zz_to_bytes(ZZ(-1)), std::invalid_argument);
    std::vector<uint8_t> b = zz_to_bytes(ZZ(0x0102), 4);
    ASSERT_EQ(b.size(), 4u);
    EXPECT_EQ(b[0], 0x02);  // little-endian
    EXPECT_EQ(zz_from_bytes(b.data(), b.size()), ZZ(0x0102));
}

TEST(PaillierHelpersTest, RandomRanges) {
    ZZ bound(1000);
    for (int i = 0; i < 50; ++i) {
        ZZ r = random_below(bound);
        EXPECT_GE(r, 0);
        EXPECT_LT(r, bound);
        EXPECT_LE(NTL::NumBits(random_bits(10)), 10);
    }
    EXPECT_THROW(random_below(ZZ(0)), std::invalid_argument);
}
