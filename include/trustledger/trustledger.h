/**
 * @file trustledger.h
 * @brief trustledger - Confidential Trust Score Ledger
 *
 * Unified header for all trustledger modules.
 *
 * Modules:
 * - Core: Principal, CiphertextHandle, LedgerError, security helpers
 * - FHE: Paillier backend, FheExecutor (ciphertext arena, key custodian)
 * - ACL: CapabilityDirectory
 * - Proof: InputProof, ProofVerifier
 * - Client: InputEncryptor
 * - Ledger: EncryptedLedgerStore, Accumulator, QueryLayer, BatchValidator,
 *   TrustScoreTracker
 * - Reveal: SessionKeyPair, Wallet, KmsGateway, RevealSession
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_H
#define TRUSTLEDGER_H

#include "trustledger/version.h"
#include "trustledger/trustledger_api.h"

// ============================================================================
// Core
// ============================================================================

#include "trustledger/core/common.h"
#include "trustledger/core/error.h"
#include "trustledger/core/security.h"
#include "trustledger/core/types.h"

// ============================================================================
// Confidential computation
// ============================================================================

#include "trustledger/fhe/paillier.h"
#include "trustledger/fhe/executor.h"
#include "trustledger/acl/capability_directory.h"
#include "trustledger/proof/input_proof.h"
#include "trustledger/client/input_encryptor.h"

// ============================================================================
// Ledger
// ============================================================================

#include "trustledger/host/clock.h"
#include "trustledger/ledger/config.h"
#include "trustledger/ledger/events.h"
#include "trustledger/ledger/statistics.h"
#include "trustledger/ledger/trust_score_tracker.h"

// ============================================================================
// Reveal protocol
// ============================================================================

#include "trustledger/reveal/reveal_session.h"

#endif // TRUSTLEDGER_H
