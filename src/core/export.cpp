/**
 * @file export.cpp
 * @brief Library export functions (version, platform, error strings)
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 */

#include "shs/core/common.h"
#include "shs/version.h"

extern "C" {

const char* shs_version(void) {
    return SHS_VERSION_STRING;
}

const char* shs_platform(void) {
    return SHS_PLATFORM_NAME;
}

const char* shs_error_string(shs_error_t error) {
    switch (error) {
        case SHS_SUCCESS:
            return "Success";
        case SHS_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case SHS_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case SHS_ERROR_LENGTH_OVERFLOW:
            return "Message length exceeds 2^64 - 1 bits";
        case SHS_ERROR_MISUSE:
            return "Hash context used after finalization";
        case SHS_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        default:
            return "Unknown error";
    }
}

} // extern "C"
