/**
 * @file types.h
 * @brief Type definitions for shs library
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 */

#ifndef SHS_CORE_TYPES_H
#define SHS_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

// C++ types
#ifdef __cplusplus

#include <vector>
#include <string>
#include <array>

namespace shs {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Hash digest
using SHA256Digest = ByteArray<32>;

// One 512-bit message block
using SHA256Block = ByteArray<64>;

// Running state / message schedule words
using SHA256State = std::array<uint32_t, 8>;
using SHA256Schedule = std::array<uint32_t, 64>;

} // namespace shs

#endif // __cplusplus

#endif // SHS_CORE_TYPES_H
