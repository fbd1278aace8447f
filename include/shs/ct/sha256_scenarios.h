/**
 * @file sha256_scenarios.h
 * @brief Constant-time scenarios for SHA-256 implementations
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHS_CT_SHA256_SCENARIOS_H
#define SHS_CT_SHA256_SCENARIOS_H

#include "shs/ct/ct_bench.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace shs::ct {

/**
 * @brief One-shot hash under test: (data, len, digest[32])
 */
using HashFn = std::function<void(const uint8_t*, size_t, uint8_t*)>;

/**
 * @brief Scenarios that only need a one-shot hash
 *
 * block_boundary, padding_extremes, length_extremes, single_bit_difference,
 * multiple_blocks.
 */
std::vector<CtBench> core_hash_benches(const HashFn& hash);

/**
 * @brief Full SHA-256 suite for this library
 *
 * Adds padding behaviour, special input values, length-dependent timing,
 * intermediate state dependency and the bare compression function.
 */
std::vector<CtBench> sha256_benches();

} // namespace shs::ct

#endif // SHS_CT_SHA256_SCENARIOS_H
