/**
 * @file security.h
 * @brief Security primitives for shs - Side-channel resistant operations
 *
 * This header provides security-critical functions including:
 * - Constant-time comparison and selection
 * - Secure memory zeroing
 * - Cryptographically secure random number generation
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SHS_CORE_SECURITY_H
#define SHS_CORE_SECURITY_H

#include "shs/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * The execution time does not depend on the content of the memory regions.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different or if either pointer is null
 */
SHS_API int shs_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Constant-time conditional select
 *
 * Returns a if condition is 0, b otherwise, without branching.
 */
SHS_API uint32_t shs_ct_select_u32(uint32_t condition, uint32_t a, uint32_t b);

/**
 * @brief Constant-time equality test
 * @return 1 if a == b, 0 otherwise
 */
SHS_API uint32_t shs_ct_eq_u32(uint32_t a, uint32_t b);

/**
 * @brief Secure memory zeroing
 *
 * Guaranteed not to be optimized away by the compiler.
 *
 * @param ptr Pointer to memory to zero (null is ignored)
 * @param len Number of bytes to zero
 */
SHS_API void shs_secure_zero(void* ptr, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * Uses the platform CSPRNG:
 * - Linux: getrandom() syscall, falling back to /dev/urandom
 * - Other POSIX: /dev/urandom
 *
 * @return SHS_SUCCESS, SHS_ERROR_INVALID_PARAM or SHS_ERROR_RANDOM_FAILED
 */
SHS_API shs_error_t shs_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace shs {

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return shs_secure_compare(a.data(), b.data(),
                              a.size() * sizeof(typename Container::value_type)) == 1;
}

} // namespace shs

#endif // __cplusplus

#endif // SHS_CORE_SECURITY_H
