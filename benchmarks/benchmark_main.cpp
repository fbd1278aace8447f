/**
 * @file benchmark_main.cpp
 * @brief shs vs OpenSSL Performance Benchmark Suite
 *
 * Usage:
 *   shs_benchmark [mode]
 *
 * Modes:
 *   all      - One-shot and incremental SHA-256 (default)
 *   oneshot  - One-shot SHA-256 only
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include <openssl/opensslv.h>

#include "shs/shs.h"

void benchmark_hash_functions(bool include_incremental);

/**
 * @brief Print usage help
 */
void print_usage(const char* program_name) {
    std::cout << "\nUsage: " << program_name << " [mode]\n\n";
    std::cout << "Modes:\n";
    std::cout << "  all      - One-shot and incremental SHA-256 (default)\n";
    std::cout << "  oneshot  - One-shot SHA-256 only\n";
}

int main(int argc, char* argv[]) {
    std::string mode = "all";
    if (argc > 1) {
        mode = argv[1];
        std::transform(mode.begin(), mode.end(), mode.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    if (mode == "help" || mode == "-h" || mode == "--help") {
        print_usage(argv[0]);
        return 0;
    }
    if (mode != "all" && mode != "oneshot") {
        std::cerr << "Error: Unknown mode '" << mode << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "shs " << shs_version() << " (" << shs_platform() << ", "
              << SHS_BUILD_TYPE << ")\n";
    std::cout << "Reference: " << OPENSSL_VERSION_TEXT << "\n";

    benchmark_hash_functions(mode == "all");
    return 0;
}
