/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Implementation of security-critical operations with:
 * - Constant-time execution paths
 * - Platform-specific CSPRNG
 * - Secure memory operations
 *
 * C++ Core + C ABI Architecture
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache-2.0
 */

#include "shs/core/security.h"
#include "shs/core/common.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#ifndef STATUS_SUCCESS
constexpr NTSTATUS SHS_STATUS_SUCCESS = 0x00000000L;
#define STATUS_SUCCESS SHS_STATUS_SUCCESS
#endif
#else
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#if defined(__linux__)
// sys/random.h requires glibc 2.25+, go through the raw syscall instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define SHS_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t shs_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#endif
#endif

namespace shs {
namespace internal {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// Constant-Time Operations
// ============================================================================

uint32_t ct_eq(uint32_t a, uint32_t b) {
    uint32_t x = a ^ b;
    // (x | -x) has its top bit set iff x != 0
    return 1u ^ ((x | (0u - x)) >> 31);
}

uint32_t ct_select(uint32_t condition, uint32_t a, uint32_t b) {
    // All 0s if condition is 0, all 1s otherwise
    uint32_t nz = (condition | (0u - condition)) >> 31;
    uint32_t mask = 0u - nz;
    return (b & mask) | (a & ~mask);
}

// ============================================================================
// CSPRNG Implementation
// ============================================================================

#ifdef _WIN32

shs_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return SHS_ERROR_INVALID_PARAM;
    if (len == 0) return SHS_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    while (len > 0) {
        // BCryptGenRandom takes a ULONG length
        ULONG n = static_cast<ULONG>(len > 0x7FFFFFFFu ? 0x7FFFFFFFu : len);
        NTSTATUS status = BCryptGenRandom(
            nullptr,
            static_cast<PUCHAR>(p),
            n,
            BCRYPT_USE_SYSTEM_PREFERRED_RNG
        );
        if (status != STATUS_SUCCESS) return SHS_ERROR_RANDOM_FAILED;
        p += n;
        len -= n;
    }
    return SHS_SUCCESS;
}

#else

shs_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return SHS_ERROR_INVALID_PARAM;
    if (len == 0) return SHS_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef SHS_HAS_GETRANDOM_SYSCALL
    // Try getrandom syscall first (works on kernel 3.17+)
    while (remaining > 0) {
        ssize_t ret = shs_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            // ENOSYS or anything else: fall through to /dev/urandom
            break;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return SHS_SUCCESS;

    // Reset for fallback
    p = static_cast<unsigned char*>(buf);
    remaining = len;
#endif

    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return SHS_ERROR_RANDOM_FAILED;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return SHS_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return SHS_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return SHS_SUCCESS;
}

#endif  // _WIN32

}  // namespace internal
}  // namespace shs

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void shs_secure_zero(void* ptr, size_t len) {
    shs::internal::secure_zero(ptr, len);
}

int shs_secure_compare(const void* a, const void* b, size_t len) {
    return shs::internal::secure_compare(a, b, len) ? 1 : 0;
}

uint32_t shs_ct_select_u32(uint32_t condition, uint32_t a, uint32_t b) {
    return shs::internal::ct_select(condition, a, b);
}

uint32_t shs_ct_eq_u32(uint32_t a, uint32_t b) {
    return shs::internal::ct_eq(a, b);
}

shs_error_t shs_random_bytes(void* buf, size_t len) {
    return shs::internal::random_bytes(buf, len);
}

}  // extern "C"
