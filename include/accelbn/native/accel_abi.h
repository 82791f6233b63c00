/**
 * @file accel_abi.h
 * @brief C ABI exported by prebuilt acceleration libraries
 *
 * @details All integers cross the boundary as big-endian two's complement
 * byte buffers (the canonical encoding of AcceleratedBigInteger). Results
 * are written into a caller buffer; `out_cap` of `modulus_len + 1` bytes is
 * always sufficient because every result lies in [0, modulus).
 *
 * Versions:
 * - Legacy (2): only accelbn_native_modpow. Operands must be non-negative
 *   and the modulus positive; other inputs have undefined results.
 * - 3: every entry point below. Negative operands are handled and invalid
 *   input is reported with ACCELBN_NATIVE_DOMAIN_ERROR.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_NATIVE_ACCEL_ABI_H
#define ACCELBN_NATIVE_ACCEL_ABI_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Status codes
// ============================================================================

#define ACCELBN_NATIVE_OK               0
#define ACCELBN_NATIVE_DOMAIN_ERROR    (-1)  ///< modulus <= 0 or value not invertible
#define ACCELBN_NATIVE_BUFFER_TOO_SMALL (-2)
#define ACCELBN_NATIVE_INTERNAL_ERROR  (-3)

// ============================================================================
// Entry point names
// ============================================================================

#define ACCELBN_NATIVE_SYM_MODPOW        "accelbn_native_modpow"
#define ACCELBN_NATIVE_SYM_MODPOW_CT     "accelbn_native_modpow_ct"
#define ACCELBN_NATIVE_SYM_MODINVERSE    "accelbn_native_modinverse"
#define ACCELBN_NATIVE_SYM_VERSION       "accelbn_native_version"
#define ACCELBN_NATIVE_SYM_GMP_MAJOR     "accelbn_native_gmp_version_major"
#define ACCELBN_NATIVE_SYM_GMP_MINOR     "accelbn_native_gmp_version_minor"
#define ACCELBN_NATIVE_SYM_GMP_PATCH     "accelbn_native_gmp_version_patch"

// ============================================================================
// Entry point signatures
// ============================================================================

/**
 * @brief (base ^ exponent) mod modulus
 * @param out Result buffer
 * @param out_cap Capacity of out
 * @param out_len Receives the number of bytes written
 * @return ACCELBN_NATIVE_OK or an error status
 */
typedef int (*accelbn_native_modpow_fn)(const uint8_t* base, size_t base_len,
                                        const uint8_t* exponent, size_t exponent_len,
                                        const uint8_t* modulus, size_t modulus_len,
                                        uint8_t* out, size_t out_cap, size_t* out_len);

/** Same contract as accelbn_native_modpow, executed in constant time (version 3) */
typedef accelbn_native_modpow_fn accelbn_native_modpow_ct_fn;

/**
 * @brief value^-1 mod modulus (version 3)
 */
typedef int (*accelbn_native_modinverse_fn)(const uint8_t* value, size_t value_len,
                                            const uint8_t* modulus, size_t modulus_len,
                                            uint8_t* out, size_t out_cap, size_t* out_len);

/** ABI version of the library (absent before version 3) */
typedef int (*accelbn_native_version_fn)(void);

/** Version component of the arithmetic library the backend was built with */
typedef int (*accelbn_native_gmp_version_fn)(void);

#ifdef __cplusplus
}
#endif

#endif // ACCELBN_NATIVE_ACCEL_ABI_H
