#pragma once

/**
 * CLI utilities for the escrow tools
 */

#include "string_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace p2p {
namespace util {

struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string config_path;  // Empty = built-in defaults
    std::string save_config;  // Write the effective config here and exit
    Amount trade_amount = 0;  // Base units for the confirmed trade; 0 = demo default
};

inline void print_help() {
    std::cout << R"(
P2P Escrow Demo
===============

Usage: escrow_demo [options]

Runs a seller and a buyer through the three escrow endings (confirmed,
cancelled, disputed) against an in-memory settlement ledger.

Options:
  -c, --config FILE      Engine config (JSON)
  -a, --amount UNITS     Size of the confirmed trade in base units
                         (1 token = 10^18; default 1000 tokens)
  --save-config FILE     Write the effective config to FILE and exit
  -v, --verbose          Engine logs to stderr (debug level)
  -h, --help             Show this help

Examples:
  escrow_demo
  escrow_demo -c config/engine.json -v
  escrow_demo -a 250000000000000000000
)";
}

/**
 * Parse command-line arguments into CLIArgs.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--save-config" && i + 1 < argc) {
            args.save_config = argv[++i];
        }
        else if ((arg == "--amount" || arg == "-a") && i + 1 < argc) {
            try {
                args.trade_amount = parse_u128(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Invalid amount: " << e.what() << "\n";
                return false;
            }
            if (args.trade_amount == 0) {
                std::cerr << "Invalid amount: must be positive\n";
                return false;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace p2p
