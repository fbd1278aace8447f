/**
 * @file ct_report.cpp
 * @brief Scenario driver and text/Markdown rendering of constant-time results
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/ct/ct_bench.h"
#include "shs/core/security.h"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace shs::ct {

namespace {

using Clock = std::chrono::high_resolution_clock;

uint64_t resolve_seed(uint64_t configured) {
    if (configured != 0) {
        return configured;
    }
    uint8_t buf[8];
    shs_error_t err = shs_random_bytes(buf, sizeof(buf));
    if (err != SHS_SUCCESS) {
        throw std::runtime_error(std::string("ct: cannot seed from OS RNG: ") + shs_error_string(err));
    }
    uint64_t seed = 0;
    for (size_t i = 0; i < sizeof(buf); i++) {
        seed = (seed << 8) | buf[i];
    }
    return seed;
}

std::string hex_seed(uint64_t seed) {
    std::ostringstream oss;
    oss << "0x" << std::hex << seed;
    return oss.str();
}

std::string signed_fixed(double v, int precision) {
    std::ostringstream oss;
    oss << std::showpos << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

// Measurements needed for |t| to reach 5 at the observed effect size
std::string needed_samples(double tau) {
    if (tau <= 0.0 || !std::isfinite(tau)) {
        return "-";
    }
    double n = (5.0 / tau) * (5.0 / tau);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << n;
    return oss.str();
}

} // anonymous namespace

std::vector<CtReport> run_benches(const std::vector<CtBench>& benches,
                                  const CtConfig& config,
                                  std::ostream* progress) {
    std::vector<CtReport> reports;
    reports.reserve(benches.size());

    for (const auto& bench : benches) {
        if (!bench.fn) {
            throw std::invalid_argument("ct: scenario '" + bench.name + "' has no body");
        }

        CtReport report;
        report.name = bench.name;
        report.informational = bench.informational;
        report.seed = resolve_seed(config.seed);

        BenchRng rng(report.seed);
        CtRunner runner;

        auto start = Clock::now();
        bench.fn(runner, rng, config.iterations);
        auto end = Clock::now();

        report.seconds = std::chrono::duration<double>(end - start).count();
        report.summary = runner.summarize(config);

        if (progress) {
            const CtSummary& s = report.summary;
            double n = static_cast<double>(s.left_samples + s.right_samples) / 1e6;
            *progress << "bench " << report.name << " seeded with " << hex_seed(report.seed)
                      << " ... : n == " << signed_fixed(n, 3) << "M"
                      << ", max t = " << signed_fixed(s.max_t, 5)
                      << ", max tau = " << signed_fixed(s.max_tau, 5)
                      << ", (5/tau)^2 = " << needed_samples(s.max_tau)
                      << "  [" << verdict_name(s.verdict)
                      << (report.informational ? ", length-dependent" : "") << "]" << std::endl;
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

bool all_passed(const std::vector<CtReport>& reports) noexcept {
    for (const auto& r : reports) {
        if (r.informational) {
            continue;
        }
        // An unevaluated scenario proves nothing either way
        if (r.summary.verdict == Verdict::Leak ||
            r.summary.verdict == Verdict::NotEnoughSamples) {
            return false;
        }
    }
    return true;
}

std::string format_text(const std::vector<CtReport>& reports) {
    std::ostringstream oss;
    oss << std::left << std::setw(40) << "Scenario"
        << std::right << std::setw(18) << "Samples (L/R)"
        << std::setw(12) << "max |t|"
        << std::setw(12) << "max tau"
        << std::setw(10) << "Time (s)"
        << "  Verdict" << "\n";
    oss << std::string(104, '-') << "\n";

    for (const auto& r : reports) {
        const CtSummary& s = r.summary;
        std::string counts = std::to_string(s.left_samples) + "/" + std::to_string(s.right_samples);
        oss << std::left << std::setw(40) << r.name
            << std::right << std::setw(18) << counts
            << std::fixed << std::setprecision(3)
            << std::setw(12) << s.max_t
            << std::setprecision(5)
            << std::setw(12) << s.max_tau
            << std::setprecision(2)
            << std::setw(10) << r.seconds
            << "  " << verdict_name(s.verdict)
            << (r.informational ? " (length-dependent)" : "") << "\n";
    }
    return oss.str();
}

std::string format_markdown(const std::vector<CtReport>& reports,
                            const CtConfig& config,
                            const std::string& title) {
    std::ostringstream oss;
    oss << "# " << title << "\n\n";
    oss << "- Iterations per scenario: " << config.iterations << "\n";
    oss << "- Leak threshold: |t| > " << config.leak_threshold
        << " (possible leak above " << config.possible_threshold << ")\n";
    oss << "- Percentile crops: " << config.percentiles << "\n";
    oss << "- Seed: " << (config.seed == 0 ? std::string("OS random") : hex_seed(config.seed)) << "\n\n";

    oss << "| Scenario | Samples (L/R) | max \\|t\\| | max tau | (5/tau)^2 | Time (s) | Verdict |\n";
    oss << "|---|---:|---:|---:|---:|---:|---|\n";
    for (const auto& r : reports) {
        const CtSummary& s = r.summary;
        oss << "| " << r.name
            << " | " << s.left_samples << "/" << s.right_samples
            << std::fixed
            << " | " << std::setprecision(3) << s.max_t
            << " | " << std::setprecision(5) << s.max_tau
            << " | " << needed_samples(s.max_tau)
            << " | " << std::setprecision(2) << r.seconds
            << " | " << verdict_name(s.verdict)
            << (r.informational ? " (length-dependent)" : "") << " |\n";
    }
    oss << "\nScenarios marked length-dependent compare inputs of different public lengths "
           "and do not affect the result.\n";

    oss << "\n" << (all_passed(reports) ? "Result: PASS" : "Result: FAIL") << "\n";
    return oss.str();
}

} // namespace shs::ct
