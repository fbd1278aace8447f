/**
 * @file benchmark_common.hpp
 * @brief Common utilities for shs benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Performance metrics (avg, min, throughput)
 * - OpenSSL vs shs ratio comparison
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHS_BENCHMARK_COMMON_HPP
#define SHS_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace shs_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time per operation in milliseconds
    double min_ms;          ///< Minimum time per operation in milliseconds
    double throughput;      ///< MB/s (0 for empty input)
    double ops_per_sec;     ///< Operations per second
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), ops_per_sec(0), valid(false) {}
};

/**
 * @brief Calculate throughput in MB/s
 */
inline double calculate_throughput(size_t bytes, double ms) {
    if (ms <= 0.0) {
        return 0.0;
    }
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

/**
 * @brief Format size string ("13 B", "1000 B", "1 KB", "1 MB")
 */
inline std::string format_size(size_t bytes) {
    if (bytes >= 1024 * 1024 && bytes % (1024 * 1024) == 0) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024 && bytes % 1024 == 0) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

/**
 * @brief Run benchmark and return per-operation statistics
 *
 * @param data_size Bytes hashed per operation
 * @param batch Operations per timed sample (small inputs are below timer resolution)
 * @param op One operation; returns false on failure
 */
inline BenchmarkResult run_benchmark_ex(size_t data_size, size_t batch,
                                        const std::function<bool()>& op) {
    std::vector<double> times;
    times.reserve(BENCHMARK_ITERATIONS);

    for (size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
        if (!op()) return BenchmarkResult();
    }

    for (size_t i = 0; i < BENCHMARK_ITERATIONS; ++i) {
        auto start = Clock::now();
        for (size_t j = 0; j < batch; ++j) {
            if (!op()) return BenchmarkResult();
        }
        auto end = Clock::now();
        times.push_back(Duration(end - start).count() / static_cast<double>(batch));
    }

    BenchmarkResult r;
    r.avg_ms = std::accumulate(times.begin(), times.end(), 0.0) / static_cast<double>(times.size());
    r.min_ms = *std::min_element(times.begin(), times.end());
    r.throughput = calculate_throughput(data_size, r.avg_ms);
    r.ops_per_sec = r.avg_ms > 0.0 ? 1000.0 / r.avg_ms : 0.0;
    r.valid = true;
    return r;
}

/**
 * @brief Print benchmark result line
 */
inline void print_result(const std::string& name, const std::string& impl,
                         const BenchmarkResult& result) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(15) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(15) << impl
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << result.throughput << " MB/s"
              << std::setprecision(5)
              << std::setw(12) << result.avg_ms << " ms"
              << std::setprecision(0)
              << std::setw(12) << result.ops_per_sec << " op/s"
              << std::endl;
}

/**
 * @brief Print ratio comparison between shs and OpenSSL
 *
 * ratio = openssl_time / shs_time; ratio > 1.0 means shs is FASTER
 */
inline void print_ratio(const BenchmarkResult& shs_result, const BenchmarkResult& openssl_result) {
    if (!shs_result.valid || !openssl_result.valid ||
        shs_result.avg_ms <= 0 || openssl_result.avg_ms <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(15) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = openssl_result.avg_ms / shs_result.avg_ms;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(15) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x"
              << "    (" << symbol << std::setprecision(1) << diff_percent << "% " << status << ")"
              << std::endl;
}

} // namespace shs_bench

#endif // SHS_BENCHMARK_COMMON_HPP
