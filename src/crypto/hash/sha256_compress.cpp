/**
 * @file sha256_compress.cpp
 * @brief SHA-256 message schedule and compression function
 *
 * Reference:
 * - [FIPS 180-4] https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf
 *   4.1.2 (functions), 4.2.2 (constants), 6.2.2 (hash computation)
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/internal/sha256_impl.h"
#include "shs/crypto/sha256.h"
#include "shs/core/security.h"
#include <cstring>

// FIPS 180-4 4.1.2 functions. All arithmetic is on uint32_t, so additions
// wrap modulo 2^32.
#define ROR(x, n) SHS_ROTR32(x, n)
#define CH(x, y, z)  (((x) & (y)) ^ (~(x) & (z)))
#define MAJ(x, y, z) (((x) & (y)) ^ ((x) & (z)) ^ ((y) & (z)))
#define EP0(x) (ROR(x, 2) ^ ROR(x, 13) ^ ROR(x, 22))
#define EP1(x) (ROR(x, 6) ^ ROR(x, 11) ^ ROR(x, 25))
#define SIG0(x) (ROR(x, 7) ^ ROR(x, 18) ^ ((x) >> 3))
#define SIG1(x) (ROR(x, 17) ^ ROR(x, 19) ^ ((x) >> 10))

namespace shs::internal {

void SHA256Compressor::expand(const uint8_t block[64], uint32_t W[64]) noexcept {
    for (size_t i = 0; i < 16; i++) {
        W[i] = load32_be(block + i * 4);
    }
    for (size_t i = 16; i < 64; i++) {
        W[i] = SIG1(W[i - 2]) + W[i - 7] + SIG0(W[i - 15]) + W[i - 16];
    }
}

void SHA256Compressor::rounds(uint32_t state[8], const uint32_t W[64]) noexcept {
    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (size_t t = 0; t < 64; t++) {
        uint32_t t1 = h + EP1(e) + CH(e, f, g) + K256[t] + W[t];
        uint32_t t2 = EP0(a) + MAJ(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    // Davies-Meyer feed-forward
    state[0] += a; state[1] += b;
    state[2] += c; state[3] += d;
    state[4] += e; state[5] += f;
    state[6] += g; state[7] += h;
}

void SHA256Compressor::transform(uint32_t state[8], const uint8_t block[64]) noexcept {
    uint32_t W[64];
    expand(block, W);
    rounds(state, W);
    shs_secure_zero(W, sizeof(W));
}

} // namespace shs::internal

#undef ROR
#undef CH
#undef MAJ
#undef EP0
#undef EP1
#undef SIG0
#undef SIG1

// ============================================================================
// Public C API
// ============================================================================

extern "C" {

void shs_sha256_schedule(const uint8_t block[SHS_SHA256_BLOCK_SIZE],
                         uint32_t w[SHS_SHA256_SCHEDULE_WORDS]) {
    if (!block || !w) {
        return;
    }
    shs::internal::SHA256Compressor::expand(block, w);
}

void shs_sha256_compress(uint32_t state[SHS_SHA256_STATE_WORDS],
                         const uint8_t block[SHS_SHA256_BLOCK_SIZE]) {
    if (!state || !block) {
        return;
    }
    shs::internal::SHA256Compressor::transform(state, block);
}

} // extern "C"

// ============================================================================
// C++ Namespace API
// ============================================================================

namespace shs {

SHA256Schedule sha256_schedule(const SHA256Block& block) {
    SHA256Schedule w;
    internal::SHA256Compressor::expand(block.data(), w.data());
    return w;
}

SHA256State sha256_compress(const SHA256State& state, const SHA256Block& block) {
    SHA256State next = state;
    internal::SHA256Compressor::transform(next.data(), block.data());
    return next;
}

SHA256State sha256_compress(const SHA256State& state, const SHA256Schedule& schedule) {
    SHA256State next = state;
    internal::SHA256Compressor::rounds(next.data(), schedule.data());
    return next;
}

const SHA256State& sha256_initial_state() noexcept {
    return internal::H256_INIT;
}

const std::array<uint32_t, 64>& sha256_round_constants() noexcept {
    return internal::K256;
}

SHA256Digest sha256_state_to_digest(const SHA256State& state) noexcept {
    SHA256Digest digest;
    for (size_t i = 0; i < state.size(); i++) {
        internal::store32_be(digest.data() + i * 4, state[i]);
    }
    return digest;
}

} // namespace shs
