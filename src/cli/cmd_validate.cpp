/**
 * @file cmd_validate.cpp
 * @brief Validate subcommand: homomorphic batch range check
 *
 * Usage:
 *   trustledger validate --scores 5,8,0,11 [--key-bits 512|2048|3072]
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <string>
#include <vector>

#include "trustledger/trustledger.h"

#include "cli_utils.h"

using namespace trustledger;
using trustledger::cli::parse_long;
using trustledger::cli::parse_scores;

namespace {

void print_validate_help() {
    std::cout << "\nUsage: trustledger validate --scores <list> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --scores <list>     Comma-separated scores to check (required)\n";
    std::cout << "  --key-bits <bits>   Paillier modulus: 512, 2048, 3072 (default 2048)\n";
    std::cout << "  --help              Show this help message\n\n";
    std::cout << "Only the in-range bit of each score is revealed.\n\n";
}

} // namespace

int cmd_validate(int argc, char* argv[]) {
    long key_bits = 2048;
    std::string score_list;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--scores" && i + 1 < argc) {
                score_list = argv[++i];
            } else if (arg == "--key-bits" && i + 1 < argc) {
                key_bits = parse_long(arg, argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_validate_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_validate_help();
                return 1;
            }
        }

        std::vector<uint32_t> scores;
        if (!score_list.empty()) {
            scores = parse_scores(score_list);
        }

        Principal system = Principal::from_bytes(random_bytes(TRUSTLEDGER_PRINCIPAL_SIZE).data(),
                                                 TRUSTLEDGER_PRINCIPAL_SIZE);
        acl::CapabilityDirectory directory;
        fhe::FheExecutor executor(system,
                                  fhe::PaillierKeyPair::generate(fhe::PaillierParams::from_bits(key_bits)),
                                  directory);
        host::SystemClock clock;
        ledger::TrustScoreTracker tracker(executor, clock);
        client::InputEncryptor encryptor(tracker.public_key());
        reveal::Wallet caller = reveal::Wallet::generate();

        std::vector<CiphertextHandle> handles;
        std::vector<ByteVec> proofs;
        for (uint32_t score : scores) {
            client::EncryptedInput in = encryptor.encrypt_uint32(score, system, caller.principal());
            handles.push_back(in.handle);
            proofs.push_back(in.proof);
        }

        std::vector<bool> results = tracker.validate_batch(caller.principal(), handles, proofs);
        const ledger::LedgerConfig& cfg = tracker.config();
        std::cout << "\nRange [" << cfg.min_score << ", " << cfg.max_score << "]\n";
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "  " << scores[i] << "\t" << (results[i] ? "valid" : "invalid") << "\n";
        }
        std::cout << "\n";
    } catch (const LedgerError& e) {
        std::cerr << "Error [" << trustledger_error_string(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
