/**
 * @file encoding.h
 * @brief Hexadecimal encoding utilities for digests and test vectors
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SHS_UTILS_ENCODING_H
#define SHS_UTILS_ENCODING_H

#include "shs/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
SHS_API size_t shs_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string (may contain 0x prefix, either case)
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
SHS_API size_t shs_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

/**
 * @brief Check if a character is valid hexadecimal
 */
SHS_API int shs_is_hex_char(char c);

/**
 * @brief Get hex character value (0-15), returns -1 for invalid
 */
SHS_API int shs_hex_char_value(char c);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "shs/core/types.h"
#include <string>
#include <stdexcept>

namespace shs {
namespace encoding {

/**
 * @brief Encoding exception for invalid input
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Encode bytes to lowercase hex string
 */
std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

template<size_t N>
std::string hexEncode(const ByteArray<N>& data) {
    return hexEncode(data.data(), N);
}

/**
 * @brief Decode hex string to bytes
 * @throws EncodingError on odd length or non-hex characters
 */
ByteVec hexDecode(const std::string& hex);

/**
 * @brief Check that a string is an even-length hex string (optional 0x)
 */
bool isValidHex(const std::string& str) noexcept;

} // namespace encoding

using encoding::hexEncode;
using encoding::hexDecode;

} // namespace shs

#endif // __cplusplus

#endif // SHS_UTILS_ENCODING_H
