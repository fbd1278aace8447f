/**
 * @file test_ct_harness.cpp
 * @brief Timing-leak detector tests: statistics, verdicts, reports, scenarios
 *
 * Verdict tests feed synthetic tick counts through CtRunner::record() so the
 * outcome does not depend on the machine. Only the early-exit comparison
 * test measures real time, with a difference of thousands of cycles.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include "shs/ct/ct_bench.h"
#include "shs/ct/sha256_scenarios.h"
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using shs::ct::Class;
using shs::ct::CtConfig;
using shs::ct::CtReport;
using shs::ct::CtRunner;
using shs::ct::Verdict;

namespace {

void record_noisy(CtRunner& runner, Class cls, uint64_t base, size_t count, std::mt19937_64& rng) {
    for (size_t i = 0; i < count; i++) {
        runner.record(cls, base + rng() % 50);
    }
}

CtReport make_report(const std::string& name, Verdict verdict, bool informational) {
    CtReport r;
    r.name = name;
    r.informational = informational;
    r.seed = 0xdeadbeef;
    r.summary.verdict = verdict;
    return r;
}

// Byte-at-a-time comparison that stops at the first difference
bool early_exit_equal(const volatile uint8_t* a, const volatile uint8_t* b, size_t len) {
    for (size_t i = 0; i < len; i++) {
        if (a[i] != b[i]) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Welch t-test
// ============================================================================

TEST(OnlineTTestTest, MeanVarianceAndT) {
    shs::ct::OnlineTTest t;
    for (double x : {1.0, 2.0, 3.0, 4.0}) {
        t.push(Class::Left, x);
    }
    for (double x : {2.0, 4.0, 6.0, 8.0}) {
        t.push(Class::Right, x);
    }

    EXPECT_EQ(t.count(Class::Left), 4u);
    EXPECT_EQ(t.count(Class::Right), 4u);
    EXPECT_DOUBLE_EQ(t.mean(Class::Left), 2.5);
    EXPECT_DOUBLE_EQ(t.mean(Class::Right), 5.0);
    EXPECT_NEAR(t.variance(Class::Left), 5.0 / 3.0, 1e-12);
    EXPECT_NEAR(t.variance(Class::Right), 20.0 / 3.0, 1e-12);
    // (2.5 - 5) / sqrt((5/3)/4 + (20/3)/4) = -sqrt(3)
    EXPECT_NEAR(t.t_value(), -std::sqrt(3.0), 1e-9);
}

TEST(OnlineTTestTest, TooFewSamplesGiveZero) {
    shs::ct::OnlineTTest t;
    t.push(Class::Left, 1.0);
    t.push(Class::Right, 100.0);
    EXPECT_EQ(t.t_value(), 0.0);
}

TEST(OnlineTTestTest, ZeroVariance) {
    shs::ct::OnlineTTest same;
    shs::ct::OnlineTTest apart;
    for (int i = 0; i < 10; i++) {
        same.push(Class::Left, 7.0);
        same.push(Class::Right, 7.0);
        apart.push(Class::Left, 9.0);
        apart.push(Class::Right, 7.0);
    }
    EXPECT_EQ(same.t_value(), 0.0);
    EXPECT_EQ(apart.t_value(), std::numeric_limits<double>::infinity());
}

// ============================================================================
// Verdicts on synthetic timings
// ============================================================================

TEST(CtRunnerTest, SeparatedClassesAreLeak) {
    std::mt19937_64 rng(1);
    CtRunner runner;
    record_noisy(runner, Class::Left, 1000, 5000, rng);
    record_noisy(runner, Class::Right, 1100, 5000, rng);

    shs::ct::CtSummary s = runner.summarize(CtConfig());
    EXPECT_EQ(s.verdict, Verdict::Leak);
    EXPECT_GT(s.max_t, 10.0);
    EXPECT_EQ(s.left_samples, 5000u);
    EXPECT_EQ(s.right_samples, 5000u);
    EXPECT_NEAR(s.left_mean, 1024.5, 5.0);
    EXPECT_NEAR(s.right_mean, 1124.5, 5.0);
}

TEST(CtRunnerTest, IdenticalDistributionsAreNotLeak) {
    std::mt19937_64 rng(2);
    CtRunner runner;
    for (int i = 0; i < 5000; i++) {
        runner.record(Class::Left, 1000 + rng() % 50);
        runner.record(Class::Right, 1000 + rng() % 50);
    }

    shs::ct::CtSummary s = runner.summarize(CtConfig());
    EXPECT_NE(s.verdict, Verdict::Leak);
    EXPECT_NE(s.verdict, Verdict::NotEnoughSamples);
    EXPECT_LT(s.max_t, 10.0);
}

TEST(CtRunnerTest, VarianceOnlyDifferenceCaughtBySecondOrder) {
    CtRunner runner;
    // Same mean, Left constant, Right alternates widely
    for (int i = 0; i < 5000; i++) {
        runner.record(Class::Left, 1000);
        runner.record(Class::Right, (i % 2 == 0) ? 500 : 1500);
    }

    CtConfig config;
    config.percentiles = 0;
    shs::ct::CtSummary s = runner.summarize(config);
    EXPECT_EQ(s.verdict, Verdict::Leak);
    EXPECT_EQ(s.max_test, 1u);  // no crops: index 1 is the second-order test
}

TEST(CtRunnerTest, TooFewSamples) {
    std::mt19937_64 rng(3);
    CtRunner runner;
    record_noisy(runner, Class::Left, 1000, 100, rng);
    record_noisy(runner, Class::Right, 5000, 100, rng);

    shs::ct::CtSummary s = runner.summarize(CtConfig());
    EXPECT_EQ(s.verdict, Verdict::NotEnoughSamples);

    CtRunner empty;
    EXPECT_EQ(empty.summarize(CtConfig()).verdict, Verdict::NotEnoughSamples);
}

TEST(CtRunnerTest, PossibleLeakBetweenThresholds) {
    CtRunner runner;
    for (int i = 0; i < 1000; i++) {
        runner.record(Class::Left, 1000 + i % 2);
        runner.record(Class::Right, 1000 + i % 2);
    }

    // Equal classes give t = 0, which only a negative threshold flags
    CtConfig config;
    config.percentiles = 0;
    config.leak_threshold = 1e9;
    config.possible_threshold = -1.0;
    EXPECT_EQ(runner.summarize(config).verdict, Verdict::PossibleLeak);
}

TEST(CtRunnerTest, ClearAndRunPair) {
    CtRunner runner;
    shs::ct::BenchRng rng(4);
    int left_calls = 0;
    int right_calls = 0;
    for (int i = 0; i < 10; i++) {
        shs::ct::run_pair(runner, rng, [&] { left_calls++; }, [&] { right_calls++; });
    }
    EXPECT_EQ(left_calls, 10);
    EXPECT_EQ(right_calls, 10);
    EXPECT_EQ(runner.samples(Class::Left), 10u);
    EXPECT_EQ(runner.samples(Class::Right), 10u);

    runner.clear();
    EXPECT_EQ(runner.samples(Class::Left), 0u);
    EXPECT_EQ(runner.samples(Class::Right), 0u);
}

TEST(CtRunnerTest, RandVecIsSeeded) {
    shs::ct::BenchRng a(99);
    shs::ct::BenchRng b(99);
    shs::ByteVec va = shs::ct::rand_vec(37, a);
    shs::ByteVec vb = shs::ct::rand_vec(37, b);
    EXPECT_EQ(va.size(), 37u);
    EXPECT_EQ(va, vb);
    EXPECT_TRUE(shs::ct::rand_vec(0, a).empty());
}

// ============================================================================
// Real timing
// ============================================================================

TEST(CtRunnerTest, EarlyExitCompareIsLeak) {
    const size_t len = 4096;
    shs::ByteVec secret(len, 0x42);
    shs::ByteVec mismatch_first(len, 0x42);
    mismatch_first[0] = 0x00;
    shs::ByteVec identical(len, 0x42);

    CtRunner runner;
    shs::ct::BenchRng rng(5);
    bool result = false;
    for (int i = 0; i < 3000; i++) {
        shs::ct::run_pair(runner, rng,
            [&] { result = early_exit_equal(secret.data(), mismatch_first.data(), len); },
            [&] { result = early_exit_equal(secret.data(), identical.data(), len); });
        shs::ct::black_box(result);
    }

    shs::ct::CtSummary s = runner.summarize(CtConfig());
    EXPECT_EQ(s.verdict, Verdict::Leak) << "max t = " << s.max_t;
    EXPECT_LT(s.left_mean, s.right_mean);
}

// ============================================================================
// Driver and reports
// ============================================================================

TEST(CtReportTest, RunBenchesUsesConfiguredSeed) {
    shs::ct::CtBench bench;
    bench.name = "synthetic_gap";
    bench.fn = [](CtRunner& r, shs::ct::BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            r.record(Class::Left, 100 + rng() % 5);
            r.record(Class::Right, 200 + rng() % 5);
        }
    };

    CtConfig config;
    config.iterations = 1000;
    config.seed = 0x1234;
    std::ostringstream progress;
    auto reports = shs::ct::run_benches({bench}, config, &progress);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].name, "synthetic_gap");
    EXPECT_EQ(reports[0].seed, 0x1234u);
    EXPECT_EQ(reports[0].summary.left_samples, 1000u);
    EXPECT_EQ(reports[0].summary.verdict, Verdict::Leak);
    EXPECT_FALSE(shs::ct::all_passed(reports));

    std::string line = progress.str();
    EXPECT_NE(line.find("bench synthetic_gap seeded with 0x1234"), std::string::npos);
    EXPECT_NE(line.find("max t = "), std::string::npos);
}

TEST(CtReportTest, ZeroSeedDrawsFromOs) {
    shs::ct::CtBench bench;
    bench.name = "noop";
    bench.fn = [](CtRunner&, shs::ct::BenchRng&, size_t) {};

    CtConfig config;
    config.seed = 0;
    auto reports = shs::ct::run_benches({bench}, config);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].summary.verdict, Verdict::NotEnoughSamples);
}

TEST(CtReportTest, MissingBodyThrows) {
    shs::ct::CtBench bench;
    bench.name = "empty";
    EXPECT_THROW(shs::ct::run_benches({bench}, CtConfig()), std::invalid_argument);
}

TEST(CtReportTest, AllPassedIgnoresInformational) {
    std::vector<CtReport> reports = {
        make_report("a", Verdict::NoLeakDetected, false),
        make_report("b", Verdict::PossibleLeak, false),
        make_report("c", Verdict::Leak, true),
    };
    EXPECT_TRUE(shs::ct::all_passed(reports));

    reports.push_back(make_report("e", Verdict::NotEnoughSamples, true));
    EXPECT_TRUE(shs::ct::all_passed(reports));

    reports.push_back(make_report("d", Verdict::Leak, false));
    EXPECT_FALSE(shs::ct::all_passed(reports));
    EXPECT_TRUE(shs::ct::all_passed({}));
}

TEST(CtReportTest, UnevaluatedScenarioFailsRun) {
    std::vector<CtReport> reports = {
        make_report("single_bit_difference", Verdict::NotEnoughSamples, false),
    };
    EXPECT_FALSE(shs::ct::all_passed(reports));

    // Identical classes, but far fewer samples than min_samples
    shs::ct::CtBench bench;
    bench.name = "short_run";
    bench.fn = [](CtRunner& r, shs::ct::BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            r.record(Class::Left, 100 + rng() % 5);
            r.record(Class::Right, 100 + rng() % 5);
        }
    };
    CtConfig config;
    config.iterations = 100;
    auto run = shs::ct::run_benches({bench}, config);
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0].summary.left_samples, 100u);
    EXPECT_EQ(run[0].summary.verdict, Verdict::NotEnoughSamples);
    EXPECT_FALSE(shs::ct::all_passed(run));
    EXPECT_NE(shs::ct::format_markdown(run, config, "t").find("Result: FAIL"), std::string::npos);
}

TEST(CtReportTest, Formatting) {
    std::vector<CtReport> reports = {
        make_report("single_bit_difference", Verdict::NoLeakDetected, false),
        make_report("block_boundary", Verdict::Leak, true),
    };

    std::string text = shs::ct::format_text(reports);
    EXPECT_NE(text.find("single_bit_difference"), std::string::npos);
    EXPECT_NE(text.find("(length-dependent)"), std::string::npos);
    EXPECT_NE(text.find("no leak detected"), std::string::npos);

    CtConfig config;
    std::string md = shs::ct::format_markdown(reports, config, "SHA-256 constant-time");
    EXPECT_EQ(md.rfind("# SHA-256 constant-time", 0), 0u);
    EXPECT_NE(md.find("| block_boundary |"), std::string::npos);
    EXPECT_NE(md.find("0xdeadbeef"), std::string::npos);
    EXPECT_NE(md.find("Result: PASS"), std::string::npos);

    reports.push_back(make_report("multiple_blocks", Verdict::Leak, false));
    md = shs::ct::format_markdown(reports, config, "t");
    EXPECT_NE(md.find("Result: FAIL"), std::string::npos);
}

TEST(CtReportTest, VerdictNames) {
    EXPECT_STREQ(shs::ct::verdict_name(Verdict::Leak), "LEAK");
    EXPECT_STREQ(shs::ct::verdict_name(Verdict::NoLeakDetected), "no leak detected");
    EXPECT_STREQ(shs::ct::verdict_name(Verdict::PossibleLeak), "possible leak");
    EXPECT_STREQ(shs::ct::verdict_name(Verdict::NotEnoughSamples), "not enough samples");
}

// ============================================================================
// SHA-256 scenarios
// ============================================================================

TEST(Sha256ScenarioTest, SuiteContents) {
    auto benches = shs::ct::sha256_benches();
    std::set<std::string> names;
    for (const auto& b : benches) {
        EXPECT_TRUE(static_cast<bool>(b.fn)) << b.name;
        EXPECT_TRUE(names.insert(b.name).second) << "duplicate " << b.name;
    }

    for (const char* expected : {"block_boundary", "padding_extremes", "length_extremes",
                                 "single_bit_difference", "multiple_blocks", "padding_behavior",
                                 "special_values_all_zeros", "intermediate_state_dependency",
                                 "compression_function_test",
                                 "compression_function_special_patterns"}) {
        EXPECT_EQ(names.count(expected), 1u) << expected;
    }

    for (const auto& b : benches) {
        if (b.name == "block_boundary" || b.name == "length_extremes") {
            EXPECT_TRUE(b.informational) << b.name;
        }
        if (b.name == "single_bit_difference" || b.name == "multiple_blocks" ||
            b.name.rfind("special_values_", 0) == 0 ||
            b.name.rfind("compression_function_", 0) == 0) {
            EXPECT_FALSE(b.informational) << b.name;
        }
    }
}

TEST(Sha256ScenarioTest, ShortRunCollectsBothClasses) {
    CtConfig config;
    config.iterations = 20;
    config.min_samples = 1000000;

    auto reports = shs::ct::run_benches(shs::ct::sha256_benches(), config);
    for (const auto& r : reports) {
        EXPECT_GT(r.summary.left_samples, 0u) << r.name;
        EXPECT_EQ(r.summary.left_samples, r.summary.right_samples) << r.name;
        EXPECT_EQ(r.summary.verdict, Verdict::NotEnoughSamples) << r.name;
    }
    // Nothing was evaluated, so the run cannot pass
    EXPECT_FALSE(shs::ct::all_passed(reports));
}

TEST(Sha256ScenarioTest, CoreBenchesAcceptAnyHash) {
    int calls = 0;
    shs::ct::HashFn fake = [&calls](const uint8_t*, size_t, uint8_t* out) {
        calls++;
        out[0] = 0;
    };
    auto benches = shs::ct::core_hash_benches(fake);
    EXPECT_EQ(benches.size(), 5u);

    CtConfig config;
    config.iterations = 4;
    auto reports = shs::ct::run_benches(benches, config);
    EXPECT_EQ(reports.size(), 5u);
    EXPECT_EQ(calls, 5 * 4 * 2);
}

TEST(Sha256ScenarioTest, DISABLED_FullSuite) {
    auto reports = shs::ct::run_benches(shs::ct::sha256_benches(), CtConfig(), &std::cout);
    std::cout << shs::ct::format_text(reports);
    EXPECT_TRUE(shs::ct::all_passed(reports));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
