/**
 * @file shs.h
 * @brief shs - SHA-256 (FIPS 180-4) with constant-time verification
 *
 * Unified header for the library.
 *
 * Modules:
 * - Core: error codes, security primitives (secure zero/compare, CSPRNG)
 * - SHA-256: one-shot and incremental hashing, padding, schedule, compression
 * - Encoding: hex helpers for digests and test vectors
 * - CT: dudect-style timing-leak detector (link shs_ct)
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SHS_H
#define SHS_H

#include "shs/version.h"

// ============================================================================
// Core Modules
// ============================================================================

#include "shs/core/common.h"
#include "shs/core/types.h"
#include "shs/core/security.h"

// ============================================================================
// Hash Modules
// ============================================================================

#include "shs/crypto/sha256.h"

// ============================================================================
// Utilities
// ============================================================================

#include "shs/utils/encoding.h"

#endif // SHS_H
