/**
 * @file common.h
 * @brief Common definitions and utility macros for shs library
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 */

#ifndef SHS_CORE_COMMON_H
#define SHS_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define SHS_PLATFORM_WINDOWS 1
    #define SHS_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define SHS_PLATFORM_LINUX 1
    #define SHS_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define SHS_PLATFORM_MACOS 1
    #define SHS_PLATFORM_NAME "macOS"
#else
    #define SHS_PLATFORM_UNKNOWN 1
    #define SHS_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef SHS_PLATFORM_WINDOWS
    #ifdef SHS_SHARED_LIBRARY
        #ifdef SHS_BUILDING
            #define SHS_API __declspec(dllexport)
        #else
            #define SHS_API __declspec(dllimport)
        #endif
    #else
        #define SHS_API
    #endif
#else
    #ifdef SHS_SHARED_LIBRARY
        #define SHS_API __attribute__((visibility("default")))
    #else
        #define SHS_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    SHS_SUCCESS = 0,
    SHS_ERROR_INVALID_PARAM = -1,
    SHS_ERROR_BUFFER_TOO_SMALL = -2,
    SHS_ERROR_LENGTH_OVERFLOW = -3,     // Message bit length exceeds 2^64 - 1
    SHS_ERROR_MISUSE = -4,              // Context used after finalization
    SHS_ERROR_RANDOM_FAILED = -5        // CSPRNG failure
} shs_error_t;

// Rotate operations
#define SHS_ROTR32(x, n) ((uint32_t)(((x) >> (n)) | ((x) << (32 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
SHS_API const char* shs_error_string(shs_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
SHS_API const char* shs_version(void);

/**
 * @brief Name of the platform the library was built for
 */
SHS_API const char* shs_platform(void);

#ifdef __cplusplus
}
#endif

#endif // SHS_CORE_COMMON_H
