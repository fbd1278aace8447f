/**
 * @file sha256_padding.cpp
 * @brief SHA-256 message padding (FIPS 180-4 5.1.1)
 *
 * The message is followed by a single 1 bit (0x80), k zero bits with
 * l + 1 + k = 448 mod 512, and the 64-bit big-endian bit length l.
 * Messages whose length mod 64 lies in [56, 63] spill into one extra block.
 *
 * Only the (public) message length decides the shape of the padding; the
 * message bytes are copied, never inspected.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#include "shs/internal/sha256_impl.h"
#include "shs/crypto/sha256.h"
#include <cstring>
#include <stdexcept>

namespace shs::internal {

bool length_fits(uint64_t current, uint64_t add) noexcept {
    return current <= SHS_SHA256_MAX_MESSAGE_BYTES &&
           add <= SHS_SHA256_MAX_MESSAGE_BYTES - current;
}

size_t pad_final_blocks(const uint8_t* tail, size_t tail_len, uint64_t total_len,
                        uint8_t out[128]) noexcept {
    size_t out_len = (tail_len < 56) ? SHS_SHA256_BLOCK_SIZE : 2 * SHS_SHA256_BLOCK_SIZE;

    if (tail_len > 0) {
        std::memcpy(out, tail, tail_len);
    }
    out[tail_len] = 0x80;
    std::memset(out + tail_len + 1, 0, out_len - 8 - tail_len - 1);
    store64_be(out + out_len - 8, total_len * 8);

    return out_len;
}

} // namespace shs::internal

extern "C" {

shs_error_t shs_sha256_padded_size(uint64_t msg_len, uint64_t* padded_len) {
    if (!padded_len) {
        return SHS_ERROR_INVALID_PARAM;
    }
    if (!shs::internal::length_fits(0, msg_len)) {
        return SHS_ERROR_LENGTH_OVERFLOW;
    }
    *padded_len = ((msg_len + 8) / SHS_SHA256_BLOCK_SIZE + 1) * SHS_SHA256_BLOCK_SIZE;
    return SHS_SUCCESS;
}

shs_error_t shs_sha256_pad(const uint8_t* msg, size_t len,
                           uint8_t* out, size_t out_size, size_t* out_len) {
    if (!out || !out_len || (!msg && len > 0)) {
        return SHS_ERROR_INVALID_PARAM;
    }

    uint64_t padded = 0;
    shs_error_t err = shs_sha256_padded_size(static_cast<uint64_t>(len), &padded);
    if (err != SHS_SUCCESS) {
        return err;
    }
    if (out_size < padded) {
        return SHS_ERROR_BUFFER_TOO_SMALL;
    }

    size_t full = len - (len % SHS_SHA256_BLOCK_SIZE);
    if (full > 0) {
        std::memcpy(out, msg, full);
    }

    uint8_t final_blocks[2 * SHS_SHA256_BLOCK_SIZE];
    size_t n = shs::internal::pad_final_blocks(msg + full, len - full,
                                               static_cast<uint64_t>(len), final_blocks);
    std::memcpy(out + full, final_blocks, n);

    *out_len = full + n;
    return SHS_SUCCESS;
}

} // extern "C"

namespace shs {

ByteVec sha256_pad(const ByteVec& message) {
    uint64_t padded = 0;
    shs_error_t err = shs_sha256_padded_size(message.size(), &padded);
    if (err == SHS_ERROR_LENGTH_OVERFLOW) {
        throw std::overflow_error("SHA-256: message length exceeds 2^64 - 1 bits");
    }
    if (err != SHS_SUCCESS) {
        throw std::runtime_error(shs_error_string(err));
    }

    ByteVec out(static_cast<size_t>(padded));
    size_t out_len = 0;
    err = shs_sha256_pad(message.data(), message.size(), out.data(), out.size(), &out_len);
    if (err != SHS_SUCCESS) {
        throw std::runtime_error(shs_error_string(err));
    }
    return out;
}

} // namespace shs
