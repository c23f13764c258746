/**
 * @file mpcint_main.cpp
 * @brief mpcint Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   mpcint <command> [options]
 *
 * Commands:
 *   eval         Run one operation through the local reference backend
 *   offboard     Show durable and recipient ciphertexts of a value
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <algorithm>
#include <iostream>
#include <string>

#include "mpcint/mpcint.h"

// Subcommand handlers (forward declarations)
int cmd_eval(int argc, char* argv[]);
int cmd_offboard(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: mpcint <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  eval         Evaluate one operation on secret or public operands\n";
    std::cout << "  offboard     Offboard a value to the network key and to a recipient\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  mpcint eval -type int64 -op add -a -8000000000 -b 3000000000\n";
    std::cout << "  mpcint eval -type uint256 -op mul -a 0x100000000000000000000000000000000 -b 0x100000000000000000000000000000000\n";
    std::cout << "  mpcint offboard -type int128 -value -42\n\n";
    std::cout << "For command-specific help, use: mpcint <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << MPCINT_LIBRARY_NAME << " - " << MPCINT_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << mpcint_version() << "\n";
    std::cout << "Platform:     " << mpcint_platform() << "\n";
    std::cout << "Build Type:   " << MPCINT_BUILD_TYPE << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Widths:       8, 16, 32, 64, 128, 256 (signed and unsigned)\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP " << gmp_version << " (plaintext integers)\n";
    std::cout << "  - OpenSSL 3 (reference backend ciphertexts and proofs)\n";
    std::cout << "  - spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH << "\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(), ::tolower);

    if (command == "eval") {
        return cmd_eval(argc - 1, argv + 1);
    }
    else if (command == "offboard") {
        return cmd_offboard(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
