/**
 * @file test_input_proof.cpp
 * @brief Unit tests for input proofs and the proof verifier
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include "ledger_test_support.h"

using namespace trustledger;
using trustledger::testing::principal_of;
using trustledger::testing::shared_toy_keys;

// ============================================================================
// Test Fixtures
// ============================================================================

class InputProofTest : public ::testing::Test {
protected:
    InputProofTest()
        : system_(principal_of(0x5A)),
          alice_(principal_of(0xA1)),
          bob_(principal_of(0xB0)),
          encryptor_(shared_toy_keys().public_key),
          verifier_(shared_toy_keys().public_key, system_) {}

    Principal system_;
    Principal alice_;
    Principal bob_;
    client::InputEncryptor encryptor_;
    proof::ProofVerifier verifier_;
};

// ============================================================================
// Valid proofs
// ============================================================================

TEST_F(InputProofTest, HonestProofVerifies) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    EXPECT_EQ(in.handle.type(), ValueType::Uint32);

    fhe::ExternalInput ext = verifier_.verify(in.handle, in.proof, alice_);
    EXPECT_EQ(ext.handle, in.handle);
    EXPECT_EQ(ext.type, ValueType::Uint32);
    EXPECT_EQ(shared_toy_keys().private_key.decrypt(ext.ciphertext), NTL::ZZ(7));
}

TEST_F(InputProofTest, BooleanProofVerifies) {
    client::EncryptedInput in = encryptor_.encrypt_bool(true, system_, alice_);
    EXPECT_EQ(in.handle.type(), ValueType::Bool);
    EXPECT_NO_THROW(verifier_.verify(in.handle, in.proof, alice_, ValueType::Bool));
}

TEST_F(InputProofTest, UnexpectedValueTypeRejected) {
    client::EncryptedInput b = encryptor_.encrypt_bool(true, system_, alice_);
    EXPECT_LEDGER_ERROR(verifier_.verify(b.handle, b.proof, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);

    client::EncryptedInput u = encryptor_.encrypt_uint32(1, system_, alice_);
    EXPECT_LEDGER_ERROR(verifier_.verify(u.handle, u.proof, alice_, ValueType::Bool),
                        TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, WireFormatPreservesFields) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(0xFFFFFFFFu, system_, alice_);
    proof::InputProof p = proof::InputProof::decode(in.proof);
    EXPECT_EQ(p.system, system_);
    EXPECT_EQ(p.submitter, alice_);
    EXPECT_EQ(p.type, ValueType::Uint32);
    EXPECT_EQ(p.encode(), in.proof);
    EXPECT_EQ(in.proof[0], 'T');
    EXPECT_EQ(in.proof[4], proof::INPUT_PROOF_VERSION);
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(InputProofTest, EmptyProofRejected) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, ByteVec(), alice_), TRUSTLEDGER_ERROR_EMPTY_PROOF);
}

TEST_F(InputProofTest, ReplayByAnotherSubmitterRejected) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, in.proof, bob_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, ReplayToAnotherSystemRejected) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    proof::ProofVerifier other(shared_toy_keys().public_key, principal_of(0x77));
    EXPECT_LEDGER_ERROR(other.verify(in.handle, in.proof, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, MismatchedHandleRejected) {
    client::EncryptedInput a = encryptor_.encrypt_uint32(7, system_, alice_);
    client::EncryptedInput b = encryptor_.encrypt_uint32(8, system_, alice_);
    EXPECT_LEDGER_ERROR(verifier_.verify(b.handle, a.proof, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, RewrittenBindingRejected) {
    // Re-binding the proof to bob changes the challenge, so the responses fail.
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    proof::InputProof p = proof::InputProof::decode(in.proof);
    p.submitter = bob_;
    CiphertextHandle h = proof::input_handle(shared_toy_keys().public_key, p.ciphertext, system_,
                                             bob_, ValueType::Uint32);
    EXPECT_LEDGER_ERROR(verifier_.verify(h, p.encode(), bob_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, TamperedResponseRejected) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);
    proof::InputProof p = proof::InputProof::decode(in.proof);
    p.z1 += 1;
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, p.encode(), alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}

TEST_F(InputProofTest, MalformedBytesRejected) {
    client::EncryptedInput in = encryptor_.encrypt_uint32(7, system_, alice_);

    ByteVec truncated(in.proof.begin(), in.proof.end() - 3);
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, truncated, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);

    ByteVec bad_magic = in.proof;
    bad_magic[0] = 'X';
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, bad_magic, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);

    ByteVec trailing = in.proof;
    trailing.push_back(0);
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, trailing, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);

    ByteVec junk(3, 0x01);
    EXPECT_LEDGER_ERROR(verifier_.verify(in.handle, junk, alice_), TRUSTLEDGER_ERROR_INVALID_PROOF);
}
