/**
 * @file ct_runner.cpp
 * @brief Timing collection and Welch t-test evaluation for constant-time tests
 *
 * Tests evaluated by CtRunner::summarize():
 * - index 0: all samples
 * - index 1..P: samples below the i-th percentile cutoff, with cutoffs at
 *   1 - 0.5^(10 * i / P) of the pooled latency distribution
 * - index P+1: second order, centred squares of all samples
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/ct/ct_bench.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

#if defined(__x86_64__) || defined(_M_X64)
#ifdef _MSC_VER
#include <intrin.h>
#else
#include <x86intrin.h>
#endif
#define SHS_HAS_RDTSC 1
#endif

namespace shs::ct {

namespace {

inline size_t index_of(Class cls) noexcept {
    return cls == Class::Left ? 0 : 1;
}

std::vector<double> percentile_cutoffs(const std::vector<uint64_t>& ticks, size_t count) {
    std::vector<uint64_t> sorted(ticks);
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> cutoffs(count);
    for (size_t i = 0; i < count; i++) {
        double p = 1.0 - std::pow(0.5, 10.0 * static_cast<double>(i + 1) / static_cast<double>(count));
        size_t pos = static_cast<size_t>(p * static_cast<double>(sorted.size() - 1));
        cutoffs[i] = static_cast<double>(sorted[pos]);
    }
    return cutoffs;
}

} // anonymous namespace

const char* verdict_name(Verdict v) noexcept {
    switch (v) {
        case Verdict::NoLeakDetected:   return "no leak detected";
        case Verdict::PossibleLeak:     return "possible leak";
        case Verdict::Leak:             return "LEAK";
        case Verdict::NotEnoughSamples: return "not enough samples";
        default:                        return "unknown";
    }
}

// ============================================================================
// OnlineTTest
// ============================================================================

void OnlineTTest::push(Class cls, double x) noexcept {
    size_t c = index_of(cls);
    n_[c]++;
    double delta = x - mean_[c];
    mean_[c] += delta / static_cast<double>(n_[c]);
    m2_[c] += delta * (x - mean_[c]);
}

double OnlineTTest::t_value() const noexcept {
    if (n_[0] < 2 || n_[1] < 2) {
        return 0.0;
    }
    double num = mean_[0] - mean_[1];
    double den = std::sqrt(variance(Class::Left) / static_cast<double>(n_[0]) +
                           variance(Class::Right) / static_cast<double>(n_[1]));
    if (den == 0.0) {
        // Zero-variance classes: equal means are indistinguishable, anything else is not
        if (num == 0.0) {
            return 0.0;
        }
        return num > 0.0 ? std::numeric_limits<double>::infinity()
                         : -std::numeric_limits<double>::infinity();
    }
    return num / den;
}

size_t OnlineTTest::count(Class cls) const noexcept {
    return n_[index_of(cls)];
}

double OnlineTTest::mean(Class cls) const noexcept {
    return mean_[index_of(cls)];
}

double OnlineTTest::variance(Class cls) const noexcept {
    size_t c = index_of(cls);
    return n_[c] > 1 ? m2_[c] / static_cast<double>(n_[c] - 1) : 0.0;
}

// ============================================================================
// CtRunner
// ============================================================================

uint64_t CtRunner::cycles() noexcept {
#ifdef SHS_HAS_RDTSC
    return static_cast<uint64_t>(__rdtsc());
#else
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
#endif
}

void CtRunner::record(Class cls, uint64_t ticks) {
    ticks_.push_back(ticks);
    classes_.push_back(cls);
    counts_[index_of(cls)]++;
}

size_t CtRunner::samples(Class cls) const noexcept {
    return counts_[index_of(cls)];
}

void CtRunner::clear() noexcept {
    ticks_.clear();
    classes_.clear();
    counts_[0] = 0;
    counts_[1] = 0;
}

CtSummary CtRunner::summarize(const CtConfig& config) const {
    CtSummary summary;
    summary.left_samples = counts_[0];
    summary.right_samples = counts_[1];
    if (ticks_.empty()) {
        return summary;
    }

    const size_t crops = config.percentiles;
    std::vector<double> cutoffs = percentile_cutoffs(ticks_, crops);
    std::vector<OnlineTTest> tests(crops + 2);

    for (size_t i = 0; i < ticks_.size(); i++) {
        double x = static_cast<double>(ticks_[i]);
        tests[0].push(classes_[i], x);
        for (size_t p = 0; p < crops; p++) {
            if (x < cutoffs[p]) {
                tests[p + 1].push(classes_[i], x);
            }
        }
    }

    summary.left_mean = tests[0].mean(Class::Left);
    summary.right_mean = tests[0].mean(Class::Right);

    // Second order: centred squares against each class mean
    OnlineTTest& second = tests[crops + 1];
    for (size_t i = 0; i < ticks_.size(); i++) {
        double centred = static_cast<double>(ticks_[i]) - tests[0].mean(classes_[i]);
        second.push(classes_[i], centred * centred);
    }

    bool any = false;
    for (size_t i = 0; i < tests.size(); i++) {
        size_t nl = tests[i].count(Class::Left);
        size_t nr = tests[i].count(Class::Right);
        if (nl < config.min_samples || nr < config.min_samples) {
            continue;
        }
        double t = std::fabs(tests[i].t_value());
        if (!any || t > summary.max_t) {
            summary.max_t = t;
            summary.max_tau = t / std::sqrt(static_cast<double>(nl + nr));
            summary.max_test = i;
            any = true;
        }
    }

    if (!any) {
        summary.verdict = Verdict::NotEnoughSamples;
    } else if (summary.max_t > config.leak_threshold) {
        summary.verdict = Verdict::Leak;
    } else if (summary.max_t > config.possible_threshold) {
        summary.verdict = Verdict::PossibleLeak;
    } else {
        summary.verdict = Verdict::NoLeakDetected;
    }
    return summary;
}

// ============================================================================
// Input helpers
// ============================================================================

ByteVec rand_vec(size_t len, BenchRng& rng) {
    ByteVec out(len);
    size_t i = 0;
    while (i < len) {
        uint64_t word = rng();
        for (size_t j = 0; j < 8 && i < len; j++, i++) {
            out[i] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
    return out;
}

void run_pair(CtRunner& runner, BenchRng& rng,
              const std::function<void()>& left, const std::function<void()>& right) {
    if (rng() & 1) {
        runner.run_one(Class::Left, left);
        runner.run_one(Class::Right, right);
    } else {
        runner.run_one(Class::Right, right);
        runner.run_one(Class::Left, left);
    }
}

} // namespace shs::ct
