/**
 * @file cmd_stats.cpp
 * @brief stats-decode subcommand
 *
 * Usage:
 *   trustledger stats-decode <hex word>
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <string>

#include "trustledger/trustledger.h"

namespace {

void print_stats_help() {
    std::cout << "\nUsage: trustledger stats-decode <hex>\n\n";
    std::cout << "Decodes a 32-byte (64 hex digit) big-endian cached statistics word:\n";
    std::cout << "  bits [0, 32)   event count\n";
    std::cout << "  bits [32, 64)  last activity\n";
    std::cout << "  bit  64        has data\n\n";
}

} // namespace

int cmd_stats_decode(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Error: Missing statistics word\n";
        print_stats_help();
        return 1;
    }
    std::string arg(argv[1]);
    if (arg == "--help" || arg == "-h") {
        print_stats_help();
        return 0;
    }

    try {
        auto packed = trustledger::ledger::PackedStatistics::from_hex(arg);
        trustledger::ledger::Statistics s = packed.unpack();
        std::cout << "event_count:   " << s.event_count << "\n";
        std::cout << "last_activity: " << s.last_activity << "\n";
        std::cout << "has_data:      " << (s.has_data ? "true" : "false") << "\n";
        if (packed.has_reserved_bits()) {
            std::cerr << "Warning: reserved bits are set\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
