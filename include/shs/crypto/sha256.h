/**
 * @file sha256.h
 * @brief SHA-256 Hash Algorithm - Public C API and C++ wrapper
 *
 * FIPS 180-4 compliant SHA-256 implementation.
 * Features:
 * - Incremental hashing API (init/update/final) with misuse detection
 * - One-shot API for convenience
 * - Standalone padding, message schedule and compression primitives
 * - Branch-free compression (no secret-dependent branches or table lookups)
 *
 * @author shs Development Team
 * @version 1.2.0
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHS_CRYPTO_SHA256_H
#define SHS_CRYPTO_SHA256_H

#include "shs/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Constants
// ============================================================================

/** SHA-256 digest size in bytes */
#define SHS_SHA256_DIGEST_SIZE 32

/** SHA-256 block size in bytes */
#define SHS_SHA256_BLOCK_SIZE 64

/** Number of 32-bit words in the running state */
#define SHS_SHA256_STATE_WORDS 8

/** Number of 32-bit words in the message schedule */
#define SHS_SHA256_SCHEDULE_WORDS 64

/** Largest message length in bytes whose bit length fits the 64-bit length field */
#define SHS_SHA256_MAX_MESSAGE_BYTES ((((uint64_t)1) << 61) - 1)

// ============================================================================
// Types
// ============================================================================

/**
 * @brief SHA-256 context structure
 */
typedef struct shs_sha256_ctx_s {
    uint32_t state[8];          /**< Running state H0..H7 */
    uint64_t count;             /**< Total bytes processed */
    uint8_t buffer[64];         /**< Pending-input buffer */
    size_t buflen;              /**< Bytes held in buffer */
    int finalized;              /**< Non-zero once final/clear has run */
} shs_sha256_ctx_t;

// ============================================================================
// C API Functions
// ============================================================================

/**
 * @brief Initialize SHA-256 context
 * @param ctx Context to initialize
 * @return SHS_SUCCESS or SHS_ERROR_INVALID_PARAM
 */
SHS_API shs_error_t shs_sha256_init(shs_sha256_ctx_t* ctx);

/**
 * @brief Update SHA-256 context with data
 *
 * Complete 64-byte blocks are compressed immediately; a partial block is
 * kept in the context until more data arrives or the hash is finalized.
 *
 * @param ctx Initialized context
 * @param data Input data (may be null when len is 0)
 * @param len Input length in bytes
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM, SHS_ERROR_MISUSE when the
 *         context was already finalized, or SHS_ERROR_LENGTH_OVERFLOW when the
 *         total message would exceed SHS_SHA256_MAX_MESSAGE_BYTES (the context
 *         is left unchanged in that case)
 */
SHS_API shs_error_t shs_sha256_update(shs_sha256_ctx_t* ctx,
                                      const uint8_t* data, size_t len);

/**
 * @brief Finalize SHA-256 and produce digest
 *
 * The context is wiped and marked finalized afterwards; it must be
 * re-initialized with shs_sha256_init() before reuse.
 *
 * @param ctx Context
 * @param digest Output buffer (32 bytes)
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM or SHS_ERROR_MISUSE
 */
SHS_API shs_error_t shs_sha256_final(shs_sha256_ctx_t* ctx,
                                     uint8_t digest[SHS_SHA256_DIGEST_SIZE]);

/**
 * @brief Compute SHA-256 hash in one call
 * @param data Input data (may be null when len is 0)
 * @param len Input length in bytes
 * @param digest Output buffer (32 bytes)
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM or SHS_ERROR_LENGTH_OVERFLOW
 */
SHS_API shs_error_t shs_sha256(const uint8_t* data, size_t len,
                               uint8_t digest[SHS_SHA256_DIGEST_SIZE]);

/**
 * @brief Securely clear SHA-256 context
 *
 * Leaves the context in the finalized state.
 *
 * @param ctx Context to clear
 */
SHS_API void shs_sha256_clear(shs_sha256_ctx_t* ctx);

/**
 * @brief Length of the padded message for a message of msg_len bytes
 * @param msg_len Message length in bytes
 * @param padded_len Receives the padded length (multiple of 64)
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM or SHS_ERROR_LENGTH_OVERFLOW
 */
SHS_API shs_error_t shs_sha256_padded_size(uint64_t msg_len, uint64_t* padded_len);

/**
 * @brief Apply FIPS 180-4 5.1.1 padding to a message
 *
 * Writes the message, a 0x80 byte, zero bytes up to 56 mod 64 and the
 * 64-bit big-endian bit length. The input is not modified.
 *
 * @param msg Message (may be null when len is 0)
 * @param len Message length in bytes
 * @param out Output buffer
 * @param out_size Size of output buffer
 * @param out_len Receives the padded length
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM, SHS_ERROR_BUFFER_TOO_SMALL
 *         or SHS_ERROR_LENGTH_OVERFLOW
 */
SHS_API shs_error_t shs_sha256_pad(const uint8_t* msg, size_t len,
                                   uint8_t* out, size_t out_size, size_t* out_len);

/**
 * @brief Expand one 64-byte block into the 64-word message schedule
 */
SHS_API void shs_sha256_schedule(const uint8_t block[SHS_SHA256_BLOCK_SIZE],
                                 uint32_t w[SHS_SHA256_SCHEDULE_WORDS]);

/**
 * @brief Compress one 64-byte block into the running state (in place)
 */
SHS_API void shs_sha256_compress(uint32_t state[SHS_SHA256_STATE_WORDS],
                                 const uint8_t block[SHS_SHA256_BLOCK_SIZE]);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "shs/core/types.h"
#include <string>

namespace shs {

/**
 * @brief SHA-256 hash computation
 *
 * Incremental use: update() any number of times, then finalize() once.
 * update() or finalize() after finalize() throws std::logic_error until
 * reset() is called. Messages of 2^61 bytes or more throw
 * std::overflow_error.
 */
class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = SHS_SHA256_DIGEST_SIZE;
    static constexpr size_t BLOCK_SIZE = SHS_SHA256_BLOCK_SIZE;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = default;
    SHA256& operator=(const SHA256&) = default;

    void update(const ByteVec& data);
    void update(const uint8_t* data, size_t len);
    void update(const std::string& str);

    SHA256Digest finalize();
    void reset();

    bool finalized() const noexcept { return ctx_.finalized != 0; }
    uint64_t total_bytes() const noexcept { return ctx_.count; }

    // One-shot hashing
    static SHA256Digest hash(const uint8_t* data, size_t len);
    static SHA256Digest hash(const ByteVec& data);
    static SHA256Digest hash(const std::string& str);
    static std::string hashHex(const ByteVec& data);
    static std::string hashHex(const std::string& str);

    /**
     * @brief Hash data and compare against an expected digest in constant time
     */
    static bool verify(const ByteVec& data, const SHA256Digest& expected);

private:
    shs_sha256_ctx_t ctx_;
};

/**
 * @brief Padded copy of a message (length is a multiple of 64)
 * @throws std::overflow_error if the bit length does not fit 64 bits
 */
ByteVec sha256_pad(const ByteVec& message);

/**
 * @brief Message schedule W0..W63 of one block
 */
SHA256Schedule sha256_schedule(const SHA256Block& block);

/**
 * @brief Next running state after compressing one block
 */
SHA256State sha256_compress(const SHA256State& state, const SHA256Block& block);

/**
 * @brief Next running state from an already expanded schedule
 */
SHA256State sha256_compress(const SHA256State& state, const SHA256Schedule& schedule);

/**
 * @brief Initial hash value H(0) (FIPS 180-4 5.3.3)
 */
const SHA256State& sha256_initial_state() noexcept;

/**
 * @brief Round constants K0..K63 (FIPS 180-4 4.2.2)
 */
const std::array<uint32_t, 64>& sha256_round_constants() noexcept;

/**
 * @brief Serialize a running state as a big-endian digest
 */
SHA256Digest sha256_state_to_digest(const SHA256State& state) noexcept;

} // namespace shs

#endif // __cplusplus

#endif // SHS_CRYPTO_SHA256_H
