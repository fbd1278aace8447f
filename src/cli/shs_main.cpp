/**
 * @file shs_main.cpp
 * @brief shs Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   shs <command> [options]
 *
 * Commands:
 *   hash         SHA-256 digest of a file, string, hex bytes or stdin
 *   ctbench      Statistical constant-time tests of the SHA-256 code
 *   version      Display version information
 *   help         Show help message
 *
 * @author shs Development Team
 * @date 2026-10-18
 * @version 1.2.0
 * @copyright Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "shs/shs.h"

// Subcommand handlers (forward declarations)
int cmd_hash(int argc, char* argv[]);
int cmd_ctbench(int argc, char* argv[]);
void cmd_version();
void cmd_help();

constexpr const char* SHS_BUILD_DATE = SHS_RELEASE_DATE;

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: shs <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  hash         Compute SHA-256 digests (file, string, hex, stdin)\n";
    std::cout << "  ctbench      Run constant-time (timing leak) tests\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  shs hash -in file.txt\n";
    std::cout << "  shs hash -string abc\n";
    std::cout << "  shs ctbench -samples 50000 -markdown report.md\n\n";
    std::cout << "For command-specific help, use: shs <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << SHS_LIBRARY_NAME << " - " << SHS_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << shs_version() << "\n";
    std::cout << "Build Date:   " << SHS_BUILD_DATE << "\n";
    std::cout << "Build Type:   " << SHS_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << shs_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Algorithms:\n";
    std::cout << "  - SHA-256 (FIPS 180-4), incremental and one-shot\n";
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
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "hash" || command == "sha256") {
        return cmd_hash(argc - 1, argv + 1);
    }
    else if (command == "ctbench" || command == "ct") {
        return cmd_ctbench(argc - 1, argv + 1);
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
