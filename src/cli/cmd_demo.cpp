/**
 * @file cmd_demo.cpp
 * @brief Demo subcommand: end-to-end record and reveal
 *
 * Usage:
 *   trustledger demo [--users N] [--scores a,b,c] [--key-bits 512|2048|3072]
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
using trustledger::cli::parse_required_scores;
using trustledger::cli::short_hex;

namespace {

void print_demo_help() {
    std::cout << "\nUsage: trustledger demo [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --users <n>         Number of simulated users (default 2)\n";
    std::cout << "  --scores <list>     Comma-separated scores per user (default 7,9,4)\n";
    std::cout << "  --key-bits <bits>   Paillier modulus: 512, 2048, 3072 (default 2048)\n";
    std::cout << "  --help              Show this help message\n\n";
}

/** Prints every notification as it is delivered */
class ConsoleListener : public ledger::LedgerEventListener {
public:
    void on_trust_event_recorded(const Principal& user, uint32_t count) override {
        std::cout << "    event  TrustEventRecorded(" << short_hex(user.to_hex()) << ", " << count << ")\n";
    }
    void on_score_queried(const Principal& user, ledger::QueryKind kind) override {
        std::cout << "    event  ScoreQueried(" << short_hex(user.to_hex()) << ", "
                  << ledger::query_kind_name(kind) << ")\n";
    }
    void on_statistics_viewed(const Principal& user, uint32_t count, Timestamp last) override {
        std::cout << "    event  StatisticsViewed(" << short_hex(user.to_hex()) << ", " << count
                  << ", " << last << ")\n";
    }
};

uint32_t reveal_value(const CiphertextHandle& handle, const fhe::FheExecutor& executor,
                reveal::ReencryptionService& service, const reveal::Wallet& wallet,
                Timestamp now) {
    reveal::RevealSession session(executor.directory(), service);
    return session.run(handle, executor.system(), wallet, now);
}

} // namespace

int cmd_demo(int argc, char* argv[]) {
    long users = 2;
    long key_bits = 2048;
    std::string score_list = "7,9,4";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--users" && i + 1 < argc) {
                users = parse_long(arg, argv[++i]);
            } else if (arg == "--scores" && i + 1 < argc) {
                score_list = argv[++i];
            } else if (arg == "--key-bits" && i + 1 < argc) {
                key_bits = parse_long(arg, argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_demo_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_demo_help();
                return 1;
            }
        }
        if (users < 1) {
            std::cerr << "Error: --users must be at least 1\n";
            return 1;
        }

        std::vector<uint32_t> scores = parse_required_scores("--scores", score_list);
        fhe::PaillierParams params = fhe::PaillierParams::from_bits(key_bits);

        std::cout << "\n[setup] generating " << params.name << " key pair...\n";
        Principal system = Principal::from_bytes(random_bytes(TRUSTLEDGER_PRINCIPAL_SIZE).data(),
                                                 TRUSTLEDGER_PRINCIPAL_SIZE);
        acl::CapabilityDirectory directory;
        fhe::FheExecutor executor(system, fhe::PaillierKeyPair::generate(params), directory);
        host::SystemClock clock;
        ledger::TrustScoreTracker tracker(executor, clock);
        reveal::KmsGateway gateway(executor, clock);
        client::InputEncryptor encryptor(tracker.public_key());

        ConsoleListener console;
        tracker.add_listener(&console);
        std::cout << "[setup] system " << system.to_hex() << "\n";

        std::vector<reveal::Wallet> wallets;
        for (long u = 0; u < users; ++u) {
            wallets.push_back(reveal::Wallet::generate());
        }

        for (const auto& wallet : wallets) {
            const Principal& user = wallet.principal();
            std::cout << "\n[user] " << user.to_hex() << "\n";
            for (uint32_t score : scores) {
                client::EncryptedInput in = encryptor.encrypt_uint32(score, tracker.identity(), user);
                size_t index = tracker.record_event(user, in.handle, in.proof);
                std::cout << "  record #" << index << "  handle " << short_hex(in.handle.to_hex())
                          << "  proof " << in.proof.size() << " bytes\n";
            }

            ledger::Statistics live = tracker.get_live_statistics(user);
            ledger::Statistics cached = tracker.get_cached_statistics(user);
            std::cout << "  statistics  count=" << live.event_count
                      << " last_activity=" << live.last_activity
                      << " has_data=" << (live.has_data ? "true" : "false") << "\n";
            std::cout << "  cached word " << tracker.query().cached_word(user).to_hex()
                      << (cached == live ? "  (in sync)" : "  (stale)") << "\n";

            std::cout << "  reveal total    = "
                      << reveal_value(tracker.get_total(user), executor, gateway, wallet, clock.now()) << "\n";
            std::cout << "  reveal average  = "
                      << reveal_value(tracker.get_average(user), executor, gateway, wallet, clock.now()) << "\n";
            std::vector<CiphertextHandle> history =
                tracker.get_range(user, 0, tracker.get_history_length(user));
            std::cout << "  reveal history  =";
            for (const auto& h : history) {
                std::cout << " " << reveal_value(h, executor, gateway, wallet, clock.now());
            }
            std::cout << "\n";
        }

        std::cout << "\n[done] " << executor.size() << " ciphertexts, " << directory.size()
                  << " granted handles, " << gateway.requests_served() << " reveals\n\n";
    } catch (const LedgerError& e) {
        std::cerr << "Error [" << trustledger_error_string(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
