#pragma once

/**
 * CLI utilities for the economy tools
 *
 * Provides command-line argument parsing for economy_sim.
 */

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace econ {
namespace util {

/**
 * Command-line arguments for the economy simulator.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    int players = 100;
    int days = 30;
    uint64_t seed = 42;
    std::string catalog = "examples/catalog.json";
    std::string save_path;  // empty = don't save
    std::string load_path;  // empty = fresh economy
};

/**
 * Print help message for the economy simulator.
 */
inline void print_help() {
    std::cout << R"(
Game Economy Simulator
======================

Usage: economy_sim [options]

Options:
  -c, --catalog FILE     Catalog JSON (default: examples/catalog.json)
  -p, --players N        Simulated players (default: 100)
  -d, --days N           Simulated days (default: 30)
  -s, --seed N           RNG seed for player behaviour and rate drift (default: 42)
  --save FILE            Write a snapshot when the run ends
  --load FILE            Resume from a snapshot before simulating
  -v, --verbose          Debug logging
  -h, --help             Show this help

Examples:
  economy_sim                                  # 100 players, 30 days
  economy_sim -p 1000 -d 90 --save econ.json   # Larger run, keep the result
  economy_sim --load econ.json -d 7            # Continue a saved economy
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
            }
            else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            }
            else if ((arg == "--catalog" || arg == "-c") && i + 1 < argc) {
                args.catalog = argv[++i];
            }
            else if ((arg == "--players" || arg == "-p") && i + 1 < argc) {
                args.players = std::stoi(argv[++i]);
            }
            else if ((arg == "--days" || arg == "-d") && i + 1 < argc) {
                args.days = std::stoi(argv[++i]);
            }
            else if ((arg == "--seed" || arg == "-s") && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
            }
            else if (arg == "--save" && i + 1 < argc) {
                args.save_path = argv[++i];
            }
            else if (arg == "--load" && i + 1 < argc) {
                args.load_path = argv[++i];
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return false;
    }

    if (args.players <= 0 || args.days <= 0) {
        std::cerr << "--players and --days must be positive\n";
        return false;
    }
    return true;
}

}  // namespace util
}  // namespace econ
