/**
 * @file version.h
 * @brief Unified Version Information for accelbn Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_VERSION_H
#define ACCELBN_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define ACCELBN_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define ACCELBN_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define ACCELBN_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define ACCELBN_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define ACCELBN_VERSION_NUMBER ((ACCELBN_VERSION_MAJOR * 10000) + \
                                (ACCELBN_VERSION_MINOR * 100) + \
                                ACCELBN_VERSION_PATCH)

/** Library name */
#define ACCELBN_LIBRARY_NAME "accelbn"

/** Full library description */
#define ACCELBN_DESCRIPTION "Accelerated modular arithmetic with native backend fallback"

/**
 * @brief Native ABI level that enables constant-time modpow, modinverse
 *        and negative operand support
 */
#define ACCELBN_NATIVE_ABI_VERSIONED 3

/** ABI level assumed for a backend that cannot report its version */
#define ACCELBN_NATIVE_ABI_LEGACY 2

/** @} */

#endif /* ACCELBN_VERSION_H */
