/**
 * @file twos_complement.h
 * @brief Canonical big-endian two's complement encoding of GMP integers
 *
 * The encoding is the minimal one that keeps the sign bit correct:
 * 255 encodes as {0x00, 0xFF}, -1 as {0xFF}, 0 as {0x00}. This is the
 * format exchanged with native acceleration libraries.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_UTILS_TWOS_COMPLEMENT_H
#define ACCELBN_UTILS_TWOS_COMPLEMENT_H

#include "accelbn/core/types.h"

#include <gmpxx.h>
#include <cstddef>
#include <cstdint>

namespace accelbn {
namespace utils {

/**
 * @brief Minimal big-endian two's complement bytes of a value
 */
ByteVec to_twos_complement(const mpz_class& value);

/**
 * @brief Decode big-endian two's complement bytes (empty input is zero)
 */
mpz_class from_twos_complement(const uint8_t* data, size_t len);

inline mpz_class from_twos_complement(const ByteVec& bytes) {
    return from_twos_complement(bytes.data(), bytes.size());
}

/**
 * @brief Decode an unsigned big-endian magnitude and apply a sign
 * @param signum -1, 0 or 1
 * @throws std::invalid_argument for an invalid signum, or signum 0 with a
 *         non-zero magnitude
 */
mpz_class from_sign_magnitude(int signum, const uint8_t* magnitude, size_t len);

/**
 * @brief Sign of an encoded value without decoding it
 * @return -1, 0 or 1
 */
int twos_complement_signum(const uint8_t* data, size_t len);

inline int twos_complement_signum(const ByteVec& bytes) {
    return twos_complement_signum(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace accelbn

#endif // ACCELBN_UTILS_TWOS_COMPLEMENT_H
