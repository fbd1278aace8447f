/**
 * @file version.h
 * @brief Unified Version Information for shs Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHS_VERSION_H
#define SHS_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define SHS_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define SHS_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define SHS_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define SHS_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define SHS_VERSION_NUMBER ((SHS_VERSION_MAJOR * 10000) + \
                            (SHS_VERSION_MINOR * 100) + \
                            SHS_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define SHS_RELEASE_DATE "2026-10-18"

/** Library name */
#define SHS_LIBRARY_NAME "shs"

/** Full library description */
#define SHS_DESCRIPTION "Secure Hash Standard (FIPS 180-4) SHA-256 with constant-time verification"

/** Build type identifier */
#ifdef NDEBUG
#define SHS_BUILD_TYPE "Release"
#else
#define SHS_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define SHS_VERSION_AT_LEAST(major, minor, patch) \
    (SHS_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* SHS_VERSION_H */
