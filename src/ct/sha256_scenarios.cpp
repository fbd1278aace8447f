/**
 * @file sha256_scenarios.cpp
 * @brief Constant-time scenarios for SHA-256
 *
 * Every scenario draws fresh Left/Right inputs per iteration, outside the
 * timed region, and times one hash of each class in random order.
 * Scenarios whose classes differ in length are flagged informational: the
 * length of a message is public and legitimately changes the block count.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/ct/sha256_scenarios.h"
#include "shs/crypto/sha256.h"
#include <array>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace shs::ct {

namespace {

using Digest = std::array<uint8_t, SHS_SHA256_DIGEST_SIZE>;

void shs_one_shot(const uint8_t* data, size_t len, uint8_t* digest) {
    if (shs_sha256(data, len, digest) != SHS_SUCCESS) {
        throw std::runtime_error("ct: shs_sha256 failed");
    }
}

void time_pair(CtRunner& runner, BenchRng& rng, const HashFn& hash,
               const ByteVec& left, const ByteVec& right) {
    Digest dl{};
    Digest dr{};
    run_pair(runner, rng,
             [&] { hash(left.data(), left.size(), dl.data()); black_box(dl); },
             [&] { hash(right.data(), right.size(), dr.data()); black_box(dr); });
}

void run_scenario(CtRunner& runner, BenchRng& rng, const HashFn& hash,
                  size_t iterations, size_t len_left, size_t len_right) {
    for (size_t i = 0; i < iterations; i++) {
        ByteVec left = rand_vec(len_left, rng);
        ByteVec right = rand_vec(len_right, rng);
        time_pair(runner, rng, hash, left, right);
    }
}

CtBench lengths_bench(const char* name, const HashFn& hash, size_t len_left, size_t len_right) {
    CtBench b;
    b.name = name;
    b.informational = (len_left != len_right);
    b.fn = [hash, len_left, len_right](CtRunner& r, BenchRng& rng, size_t iters) {
        run_scenario(r, rng, hash, iters, len_left, len_right);
    };
    return b;
}

// A fixed 64-byte pattern against fresh random blocks
CtBench special_value_bench(const char* name, ByteVec special) {
    CtBench b;
    b.name = name;
    b.fn = [special = std::move(special)](CtRunner& r, BenchRng& rng, size_t iters) {
        HashFn hash = shs_one_shot;
        for (size_t i = 0; i < iters; i++) {
            ByteVec random = rand_vec(special.size(), rng);
            time_pair(r, rng, hash, special, random);
        }
    };
    return b;
}

void compress_pair(CtRunner& runner, BenchRng& rng,
                   const std::vector<ByteVec>& left, const std::vector<ByteVec>& right) {
    uint32_t sl[SHS_SHA256_STATE_WORDS];
    uint32_t sr[SHS_SHA256_STATE_WORDS];
    const SHA256State& iv = sha256_initial_state();
    std::memcpy(sl, iv.data(), sizeof(sl));
    std::memcpy(sr, iv.data(), sizeof(sr));

    run_pair(runner, rng,
             [&] {
                 for (const auto& block : left) {
                     shs_sha256_compress(sl, block.data());
                 }
                 black_box(sl);
             },
             [&] {
                 for (const auto& block : right) {
                     shs_sha256_compress(sr, block.data());
                 }
                 black_box(sr);
             });
}

} // anonymous namespace

std::vector<CtBench> core_hash_benches(const HashFn& hash) {
    std::vector<CtBench> benches;
    benches.push_back(lengths_bench("block_boundary", hash, 63, 65));
    benches.push_back(lengths_bench("padding_extremes", hash, 55, 56));
    benches.push_back(lengths_bench("length_extremes", hash, 1, 1000));

    CtBench single_bit;
    single_bit.name = "single_bit_difference";
    single_bit.fn = [hash](CtRunner& r, BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            ByteVec left = rand_vec(64, rng);
            ByteVec right = left;
            size_t byte = static_cast<size_t>(rng() % right.size());
            unsigned bit = static_cast<unsigned>(rng() % 8);
            right[byte] ^= static_cast<uint8_t>(1u << bit);
            time_pair(r, rng, hash, left, right);
        }
    };
    benches.push_back(std::move(single_bit));

    benches.push_back(lengths_bench("multiple_blocks", hash, 128, 128));
    return benches;
}

std::vector<CtBench> sha256_benches() {
    const HashFn hash = shs_one_shot;
    std::vector<CtBench> benches = core_hash_benches(hash);

    // ------------------------------------------------------------------------
    // Padding and block-count behaviour
    // ------------------------------------------------------------------------

    CtBench padding;
    padding.name = "padding_behavior";
    padding.informational = true;
    padding.fn = [hash](CtRunner& r, BenchRng& rng, size_t iters) {
        run_scenario(r, rng, hash, iters, 55, 56);
        run_scenario(r, rng, hash, iters, 63, 64);
        run_scenario(r, rng, hash, iters, 119, 120);
    };
    benches.push_back(std::move(padding));

    CtBench blocks;
    blocks.name = "block_processing_consistency";
    blocks.informational = true;
    blocks.fn = [hash](CtRunner& r, BenchRng& rng, size_t iters) {
        run_scenario(r, rng, hash, iters, 63, 65);
        run_scenario(r, rng, hash, iters, 64, 128);
    };
    benches.push_back(std::move(blocks));

    // ------------------------------------------------------------------------
    // Special input values against random data of the same length
    // ------------------------------------------------------------------------

    benches.push_back(special_value_bench("special_values_all_zeros", ByteVec(64, 0x00)));
    benches.push_back(special_value_bench("special_values_all_ones", ByteVec(64, 0xFF)));
    benches.push_back(special_value_bench("special_values_alternating_bits", ByteVec(64, 0xAA)));

    ByteVec single_one(64, 0x00);
    single_one[63] = 0x01;
    benches.push_back(special_value_bench("special_values_single_one", std::move(single_one)));

    ByteVec high_low(64);
    for (size_t i = 0; i < high_low.size(); i++) {
        high_low[i] = (i % 2 == 0) ? 0x00 : 0xFF;
    }
    benches.push_back(special_value_bench("special_values_high_low_bytes", std::move(high_low)));

    ByteVec ascending(64);
    for (size_t i = 0; i < ascending.size(); i++) {
        ascending[i] = static_cast<uint8_t>(i);
    }
    benches.push_back(special_value_bench("special_values_ascending", std::move(ascending)));

    // ------------------------------------------------------------------------
    // Length sweep and chaining
    // ------------------------------------------------------------------------

    CtBench sweep;
    sweep.name = "length_dependent_timing";
    sweep.informational = true;
    sweep.fn = [hash](CtRunner& r, BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            ByteVec left = rand_vec(1 + i % 64, rng);
            ByteVec right = rand_vec(64, rng);
            time_pair(r, rng, hash, left, right);
        }
    };
    benches.push_back(std::move(sweep));

    CtBench chaining;
    chaining.name = "intermediate_state_dependency";
    chaining.fn = [hash](CtRunner& r, BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            ByteVec left = rand_vec(128, rng);
            ByteVec right = left;
            ByteVec second = rand_vec(64, rng);
            std::memcpy(right.data() + 64, second.data(), 64);
            time_pair(r, rng, hash, left, right);
        }
    };
    benches.push_back(std::move(chaining));

    // ------------------------------------------------------------------------
    // Bare compression function from the initial state
    // ------------------------------------------------------------------------

    CtBench compress_one;
    compress_one.name = "compression_function_test";
    compress_one.fn = [](CtRunner& r, BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            std::vector<ByteVec> left = {rand_vec(64, rng)};
            std::vector<ByteVec> right = {rand_vec(64, rng)};
            compress_pair(r, rng, left, right);
        }
    };
    benches.push_back(std::move(compress_one));

    CtBench compress_two;
    compress_two.name = "compression_function_multiple_blocks";
    compress_two.fn = [](CtRunner& r, BenchRng& rng, size_t iters) {
        for (size_t i = 0; i < iters; i++) {
            std::vector<ByteVec> left = {rand_vec(64, rng), rand_vec(64, rng)};
            std::vector<ByteVec> right = {rand_vec(64, rng), rand_vec(64, rng)};
            compress_pair(r, rng, left, right);
        }
    };
    benches.push_back(std::move(compress_two));

    CtBench compress_patterns;
    compress_patterns.name = "compression_function_special_patterns";
    compress_patterns.fn = [](CtRunner& r, BenchRng& rng, size_t iters) {
        const uint8_t patterns[] = {0x00, 0xFF, 0xAA};
        for (size_t i = 0; i < iters; i++) {
            std::vector<ByteVec> random = {rand_vec(64, rng)};
            for (uint8_t pattern : patterns) {
                std::vector<ByteVec> special = {ByteVec(64, pattern)};
                compress_pair(r, rng, special, random);
            }
        }
    };
    benches.push_back(std::move(compress_patterns));

    return benches;
}

} // namespace shs::ct
