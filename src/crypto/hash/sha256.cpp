/**
 * @file sha256.cpp
 * @brief SHA-256 Digest Pipeline - C++ Core + C ABI Export
 *
 * FIPS 180-4 compliant SHA-256.
 * Architecture: C++ internal implementation + extern "C" API export.
 *
 * Features:
 * - Incremental hashing API (init/update/final) with misuse detection
 * - One-shot API compressing full blocks straight from the caller's buffer
 * - Secure memory clearing on finalization
 *
 * Reference:
 * - [FIPS 180-4] https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/crypto/sha256.h"
#include "shs/internal/sha256_impl.h"
#include "shs/core/security.h"
#include "shs/utils/encoding.h"
#include <cstring>
#include <stdexcept>

using shs::internal::SHA256Compressor;

namespace {

void emit_digest(const uint32_t state[8], uint8_t digest[SHS_SHA256_DIGEST_SIZE]) noexcept {
    for (size_t i = 0; i < 8; i++) {
        shs::internal::store32_be(digest + i * 4, state[i]);
    }
}

} // anonymous namespace

// ============================================================================
// Public C API
// ============================================================================

extern "C" {

shs_error_t shs_sha256_init(shs_sha256_ctx_t* ctx) {
    if (!ctx) {
        return SHS_ERROR_INVALID_PARAM;
    }
    std::memcpy(ctx->state, shs::internal::H256_INIT.data(), sizeof(ctx->state));
    std::memset(ctx->buffer, 0, sizeof(ctx->buffer));
    ctx->count = 0;
    ctx->buflen = 0;
    ctx->finalized = 0;
    return SHS_SUCCESS;
}

shs_error_t shs_sha256_update(shs_sha256_ctx_t* ctx, const uint8_t* data, size_t len) {
    if (!ctx || (!data && len > 0)) {
        return SHS_ERROR_INVALID_PARAM;
    }
    if (ctx->finalized) {
        return SHS_ERROR_MISUSE;
    }
    if (!shs::internal::length_fits(ctx->count, static_cast<uint64_t>(len))) {
        return SHS_ERROR_LENGTH_OVERFLOW;
    }
    if (len == 0) {
        return SHS_SUCCESS;
    }

    ctx->count += len;

    size_t buffer_space = SHS_SHA256_BLOCK_SIZE - ctx->buflen;

    // Not enough to complete the pending block
    if (buffer_space > len) {
        std::memcpy(ctx->buffer + ctx->buflen, data, len);
        ctx->buflen += len;
        return SHS_SUCCESS;
    }

    if (ctx->buflen > 0) {
        std::memcpy(ctx->buffer + ctx->buflen, data, buffer_space);
        SHA256Compressor::transform(ctx->state, ctx->buffer);
        data += buffer_space;
        len -= buffer_space;
        ctx->buflen = 0;
    }

    while (len >= SHS_SHA256_BLOCK_SIZE) {
        SHA256Compressor::transform(ctx->state, data);
        data += SHS_SHA256_BLOCK_SIZE;
        len -= SHS_SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(ctx->buffer, data, len);
        ctx->buflen = len;
    }
    return SHS_SUCCESS;
}

shs_error_t shs_sha256_final(shs_sha256_ctx_t* ctx, uint8_t digest[SHS_SHA256_DIGEST_SIZE]) {
    if (!ctx || !digest) {
        return SHS_ERROR_INVALID_PARAM;
    }
    if (ctx->finalized) {
        return SHS_ERROR_MISUSE;
    }

    uint8_t final_blocks[2 * SHS_SHA256_BLOCK_SIZE];
    size_t n = shs::internal::pad_final_blocks(ctx->buffer, ctx->buflen, ctx->count, final_blocks);
    for (size_t off = 0; off < n; off += SHS_SHA256_BLOCK_SIZE) {
        SHA256Compressor::transform(ctx->state, final_blocks + off);
    }

    emit_digest(ctx->state, digest);

    shs_secure_zero(final_blocks, sizeof(final_blocks));
    shs_sha256_clear(ctx);
    return SHS_SUCCESS;
}

shs_error_t shs_sha256(const uint8_t* data, size_t len, uint8_t digest[SHS_SHA256_DIGEST_SIZE]) {
    if (!digest || (!data && len > 0)) {
        return SHS_ERROR_INVALID_PARAM;
    }
    if (!shs::internal::length_fits(0, static_cast<uint64_t>(len))) {
        return SHS_ERROR_LENGTH_OVERFLOW;
    }

    uint32_t state[8];
    std::memcpy(state, shs::internal::H256_INIT.data(), sizeof(state));

    size_t full = len - (len % SHS_SHA256_BLOCK_SIZE);
    for (size_t off = 0; off < full; off += SHS_SHA256_BLOCK_SIZE) {
        SHA256Compressor::transform(state, data + off);
    }

    uint8_t final_blocks[2 * SHS_SHA256_BLOCK_SIZE];
    size_t n = shs::internal::pad_final_blocks(data + full, len - full,
                                               static_cast<uint64_t>(len), final_blocks);
    for (size_t off = 0; off < n; off += SHS_SHA256_BLOCK_SIZE) {
        SHA256Compressor::transform(state, final_blocks + off);
    }

    emit_digest(state, digest);

    shs_secure_zero(final_blocks, sizeof(final_blocks));
    shs_secure_zero(state, sizeof(state));
    return SHS_SUCCESS;
}

void shs_sha256_clear(shs_sha256_ctx_t* ctx) {
    if (ctx) {
        shs_secure_zero(ctx, sizeof(*ctx));
        ctx->finalized = 1;
    }
}

} // extern "C"

// ============================================================================
// C++ Wrapper
// ============================================================================

namespace shs {

namespace {

void check(shs_error_t err) {
    switch (err) {
        case SHS_SUCCESS:
            return;
        case SHS_ERROR_MISUSE:
            throw std::logic_error("SHA-256: context used after finalize()");
        case SHS_ERROR_LENGTH_OVERFLOW:
            throw std::overflow_error("SHA-256: message length exceeds 2^64 - 1 bits");
        case SHS_ERROR_INVALID_PARAM:
            throw std::invalid_argument("SHA-256: invalid parameter");
        default:
            throw std::runtime_error(shs_error_string(err));
    }
}

} // anonymous namespace

SHA256::SHA256() {
    check(shs_sha256_init(&ctx_));
}

SHA256::~SHA256() {
    shs_sha256_clear(&ctx_);
}

void SHA256::update(const ByteVec& data) {
    check(shs_sha256_update(&ctx_, data.data(), data.size()));
}

void SHA256::update(const uint8_t* data, size_t len) {
    check(shs_sha256_update(&ctx_, data, len));
}

void SHA256::update(const std::string& str) {
    check(shs_sha256_update(&ctx_, reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

SHA256Digest SHA256::finalize() {
    SHA256Digest digest;
    check(shs_sha256_final(&ctx_, digest.data()));
    return digest;
}

void SHA256::reset() {
    check(shs_sha256_init(&ctx_));
}

SHA256Digest SHA256::hash(const uint8_t* data, size_t len) {
    SHA256Digest digest;
    check(shs_sha256(data, len, digest.data()));
    return digest;
}

SHA256Digest SHA256::hash(const ByteVec& data) {
    return hash(data.data(), data.size());
}

SHA256Digest SHA256::hash(const std::string& str) {
    return hash(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::string SHA256::hashHex(const ByteVec& data) {
    return encoding::hexEncode(hash(data));
}

std::string SHA256::hashHex(const std::string& str) {
    return encoding::hexEncode(hash(str));
}

bool SHA256::verify(const ByteVec& data, const SHA256Digest& expected) {
    SHA256Digest actual = hash(data);
    return secure_compare(actual, expected);
}

} // namespace shs
