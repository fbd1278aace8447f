/**
 * @file sha256_impl.h
 * @brief SHA-256 internal building blocks shared by the hashing front-ends
 *
 * Not part of the public API. Both the incremental context and the one-shot
 * path go through SHA256Compressor::transform() and pad_final_blocks().
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHS_INTERNAL_SHA256_IMPL_H
#define SHS_INTERNAL_SHA256_IMPL_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace shs::internal {

/**
 * @brief SHA-256 round constants (cube roots of first 64 primes)
 */
alignas(16) inline constexpr std::array<uint32_t, 64> K256 = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

/**
 * @brief SHA-256 initial hash values (square roots of first 8 primes)
 */
inline constexpr std::array<uint32_t, 8> H256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

inline uint32_t load32_be(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void store32_be(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void store64_be(uint8_t* p, uint64_t v) noexcept {
    store32_be(p, static_cast<uint32_t>(v >> 32));
    store32_be(p + 4, static_cast<uint32_t>(v));
}

/**
 * @brief SHA-256 compression function (FIPS 180-4 6.2.2)
 *
 * Every step is a fixed sequence of 32-bit rotates, shifts, bitwise ops and
 * wrapping additions: no branch or memory index depends on message or state
 * words.
 */
class SHA256Compressor {
public:
    /**
     * @brief Message schedule expansion, W[0..63] from one block
     */
    static void expand(const uint8_t block[64], uint32_t W[64]) noexcept;

    /**
     * @brief 64 rounds plus Davies-Meyer feed-forward into state
     */
    static void rounds(uint32_t state[8], const uint32_t W[64]) noexcept;

    /**
     * @brief expand() + rounds(); the schedule is wiped before returning
     */
    static void transform(uint32_t state[8], const uint8_t block[64]) noexcept;
};

/**
 * @brief Build the final one or two padded blocks of a message
 *
 * @param tail Trailing bytes of the message not yet compressed (< 64)
 * @param tail_len Number of trailing bytes
 * @param total_len Total message length in bytes (must be <= SHS_SHA256_MAX_MESSAGE_BYTES)
 * @param out Receives the padded block(s)
 * @return Number of bytes written to out: 64, or 128 when tail_len >= 56
 */
size_t pad_final_blocks(const uint8_t* tail, size_t tail_len, uint64_t total_len,
                        uint8_t out[128]) noexcept;

/**
 * @brief True when current + add bytes still fit the 64-bit bit-length field
 */
bool length_fits(uint64_t current, uint64_t add) noexcept;

} // namespace shs::internal

#endif // SHS_INTERNAL_SHA256_IMPL_H
