/**
 * @file accelbn_api.h
 * @brief C interface of the accelbn library
 *
 * Exposes version information and the state of native acceleration to
 * callers that cannot use the C++ API.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_API_H
#define ACCELBN_API_H

#include "accelbn/core/common.h"
#include "accelbn/version.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Get the library version string
 * @return Version string "major.minor.patch"
 */
ACCELBN_API const char* accelbn_version(void);

/**
 * @brief Get the build platform name
 * @return Platform string ("Windows", "Linux", "macOS", ...)
 */
ACCELBN_API const char* accelbn_platform(void);

/**
 * @brief Resolve the native acceleration library
 * @return ACCELBN_SUCCESS, also when no native library is available
 * @note Thread-safe; resolution happens once per process
 */
ACCELBN_API accelbn_error_t accelbn_init(void);

/**
 * @brief Whether a native acceleration library is in use
 * @return 1 if accelerated, 0 otherwise
 */
ACCELBN_API int accelbn_is_accelerated(void);

/**
 * @brief ABI version of the loaded native library
 * @return 3 or 2, or 0 if nothing is loaded
 */
ACCELBN_API int accelbn_backend_version(void);

#ifdef __cplusplus
}
#endif

#endif // ACCELBN_API_H
