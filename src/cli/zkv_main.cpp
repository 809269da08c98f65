/**
 * @file zkv_main.cpp
 * @brief zkv Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   zkv <command> [options]
 *
 * Commands:
 *   verify       Verify a Groth16 proof against a verification key
 *   selftest     Run pairing sanity checks
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "zkv/version.h"
#include "zkv/core/common.h"

#include <gmp.h>

// Subcommand handlers
int cmd_verify(int argc, char* argv[]);
int cmd_selftest(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: zkv <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  verify       Verify a Groth16 proof (BN254)\n";
    std::cout << "  selftest     Run pairing sanity checks on the curve generators\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  zkv verify -vk circuit.vk -proof proof.bin -inputs public.txt\n";
    std::cout << "  zkv verify -vk circuit.vk.hex -proof proof.hex -hex\n";
    std::cout << "  zkv selftest\n\n";
    std::cout << "For command-specific help, use: zkv <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << ZKV_LIBRARY_NAME << " - " << ZKV_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << ZKV_VERSION_STRING << "\n";
    std::cout << "Release Date: " << ZKV_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << ZKV_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << ZKV_PLATFORM_NAME << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Curve:        BN254 (alt_bn128), optimal ate pairing\n";
    std::cout << "Proof system: Groth16 verification\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP " << gmp_version << " (GNU Multiple Precision Arithmetic)\n";
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
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "verify") {
        return cmd_verify(argc - 1, argv + 1);
    }
    else if (command == "selftest" || command == "self-test") {
        return cmd_selftest(argc - 1, argv + 1);
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
