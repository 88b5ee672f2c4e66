/**
 * @file trustledger_main.cpp
 * @brief trustledger Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   trustledger <command> [options]
 *
 * Commands:
 *   demo          Record scores for simulated users and reveal them
 *   validate      Homomorphic batch range check of scores
 *   stats-decode  Decode a packed statistics word
 *   version       Display version information
 *   help          Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <iostream>
#include <string>

#include "trustledger/trustledger.h"

// Subcommand handlers (forward declarations)
int cmd_demo(int argc, char* argv[]);
int cmd_validate(int argc, char* argv[]);
int cmd_stats_decode(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: trustledger <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  demo           Record encrypted scores and reveal aggregates\n";
    std::cout << "  validate       Check scores against the [1, 10] range homomorphically\n";
    std::cout << "  stats-decode   Decode a 32-byte cached statistics word\n";
    std::cout << "  version        Display version and build information\n";
    std::cout << "  help           Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  trustledger demo --users 2 --scores 7,9,4\n";
    std::cout << "  trustledger validate --scores 5,8,0,11 --key-bits 512\n";
    std::cout << "  trustledger stats-decode 0x...\n\n";
    std::cout << "For command-specific help, use: trustledger <command> --help\n\n";
}

void cmd_version() {
    std::cout << "\n";
    std::cout << TRUSTLEDGER_LIBRARY_NAME << " - " << TRUSTLEDGER_DESCRIPTION << "\n\n";
    std::cout << "Version:      " << trustledger_version() << "\n";
    std::cout << "Release Date: " << TRUSTLEDGER_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << TRUSTLEDGER_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << trustledger_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Schemes:\n";
    std::cout << "  - Paillier (euint32 / ebool) with blinded sign tests\n";
    std::cout << "  - Sigma proof of plaintext knowledge (Fiat-Shamir, SHA-256)\n";
    std::cout << "  - X25519 + HKDF-SHA256 + ChaCha20-Poly1305 sealed reveal\n";
    std::cout << "  - Ed25519 reveal authorization\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - NTL (Number Theory Library) over GMP\n";
    std::cout << "  - OpenSSL 3 (libcrypto)\n";
    std::cout << "\n";
}

void cmd_help() {
    print_usage();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(), ::tolower);

    if (command == "demo") {
        return cmd_demo(argc - 1, argv + 1);
    }
    else if (command == "validate") {
        return cmd_validate(argc - 1, argv + 1);
    }
    else if (command == "stats-decode" || command == "stats") {
        return cmd_stats_decode(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }

    std::cerr << "\nError: Unknown command '" << command << "'\n";
    print_usage();
    return 1;
}
