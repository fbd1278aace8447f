/**
 * @file reference_sha256_ct_bench.cpp
 * @brief Constant-time baseline: the core scenarios against OpenSSL SHA-256
 *
 * Running the same scenarios on a production implementation shows what
 * the detector reports for code that is believed to be constant time on
 * the current machine and compiler.
 *
 * Usage:
 *   reference_sha256_ct_bench [-samples N] [-seed N] [-markdown FILE]
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

#include "shs/ct/ct_bench.h"
#include "shs/ct/sha256_scenarios.h"

#include "cli_utils.h"

namespace {

void openssl_sha256(const uint8_t* data, size_t len, uint8_t* digest) {
    unsigned int digest_len = 0;
    if (EVP_Digest(data, len, digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    shs::ct::CtConfig config;
    std::string markdown_file;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "-samples" && i + 1 < argc) {
                config.iterations = shs::cli::parse_count(arg, argv[++i]);
            } else if (arg == "-seed" && i + 1 < argc) {
                config.seed = shs::cli::parse_u64(arg, argv[++i]);
            } else if (arg == "-markdown" && i + 1 < argc) {
                markdown_file = argv[++i];
            } else {
                std::cerr << "Usage: " << argv[0] << " [-samples N] [-seed N] [-markdown FILE]\n";
                return 2;
            }
        }

        auto reports = shs::ct::run_benches(shs::ct::core_hash_benches(openssl_sha256),
                                            config, &std::cout);
        std::cout << "\n" << shs::ct::format_text(reports);

        if (!markdown_file.empty()) {
            shs::cli::write_text_file(markdown_file,
                                     shs::ct::format_markdown(reports, config, "OpenSSL SHA-256 constant-time baseline"));
        }

        return shs::ct::all_passed(reports) ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
