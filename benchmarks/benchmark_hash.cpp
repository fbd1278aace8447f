/**
 * @file benchmark_hash.cpp
 * @brief SHA-256 Performance Benchmark: shs vs OpenSSL
 *
 * Input sizes: empty, 13 bytes ("Hello, world!"), 1 KB, 1000 bytes (not a
 * multiple of the block size), 1 MB.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// OpenSSL headers
#include <openssl/evp.h>

#include "shs/crypto/sha256.h"
#include "shs/version.h"
#include "benchmark_common.hpp"

using shs_bench::BenchmarkResult;

namespace {

struct InputCase {
    std::string label;
    std::vector<uint8_t> data;
};

std::vector<InputCase> make_inputs() {
    const char* small = "Hello, world!";
    return {
        {"empty", {}},
        {"small (13 B)", std::vector<uint8_t>(small, small + std::strlen(small))},
        {"1 KB", std::vector<uint8_t>(1024, 0)},
        {"1000 B", std::vector<uint8_t>(1000, 0)},
        {"1 MB", std::vector<uint8_t>(1024 * 1024, 0)},
    };
}

size_t batch_for(size_t size) {
    return size >= 64 * 1024 ? 1 : 1000;
}

BenchmarkResult bench_openssl(const std::vector<uint8_t>& data) {
    uint8_t digest[EVP_MAX_MD_SIZE];
    return shs_bench::run_benchmark_ex(data.size(), batch_for(data.size()), [&]() {
        unsigned int digest_len = 0;
        return EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) == 1;
    });
}

BenchmarkResult bench_shs_oneshot(const std::vector<uint8_t>& data) {
    uint8_t digest[SHS_SHA256_DIGEST_SIZE];
    return shs_bench::run_benchmark_ex(data.size(), batch_for(data.size()), [&]() {
        return shs_sha256(data.data(), data.size(), digest) == SHS_SUCCESS;
    });
}

BenchmarkResult bench_shs_incremental(const std::vector<uint8_t>& data) {
    uint8_t digest[SHS_SHA256_DIGEST_SIZE];
    return shs_bench::run_benchmark_ex(data.size(), batch_for(data.size()), [&]() {
        shs_sha256_ctx_t ctx;
        return shs_sha256_init(&ctx) == SHS_SUCCESS &&
               shs_sha256_update(&ctx, data.data(), data.size()) == SHS_SUCCESS &&
               shs_sha256_final(&ctx, digest) == SHS_SUCCESS;
    });
}

} // anonymous namespace

// ============================================================================
// Main Benchmark Function
// ============================================================================

void benchmark_hash_functions(bool include_incremental) {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << "  shs " << SHS_VERSION_STRING << " SHA-256 Benchmark vs OpenSSL" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    for (const auto& input : make_inputs()) {
        std::cout << "\n--- Input: " << input.label << " ---" << std::endl;
        std::cout << std::left << std::setw(25) << "Algorithm"
                  << std::setw(15) << "Implementation"
                  << std::right << std::setw(15) << "Throughput"
                  << std::setw(15) << "Avg Time"
                  << std::setw(17) << "Rate"
                  << std::endl;
        std::cout << std::string(87, '-') << std::endl;

        BenchmarkResult ssl = bench_openssl(input.data);
        shs_bench::print_result("SHA-256", "OpenSSL", ssl);

        BenchmarkResult one = bench_shs_oneshot(input.data);
        shs_bench::print_result("SHA-256", "shs", one);
        shs_bench::print_ratio(one, ssl);

        if (include_incremental) {
            BenchmarkResult inc = bench_shs_incremental(input.data);
            shs_bench::print_result("SHA-256 (init/upd/fin)", "shs", inc);
            shs_bench::print_ratio(inc, ssl);
        }
    }

    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << "Iterations per test: " << shs_bench::BENCHMARK_ITERATIONS
              << " (x1000 operations below 64 KB)" << std::endl;
    std::cout << "Warmup iterations: " << shs_bench::WARMUP_ITERATIONS << std::endl;
    std::cout << "  - Ratio > 1.0x means shs is faster than OpenSSL" << std::endl;
}
