/**
 * @file errors.h
 * @brief Exception types raised by the accelbn C++ API
 *
 * Only ArithmeticError escapes to callers of the numeric operations.
 * The other types are raised and absorbed inside library resolution.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_CORE_ERRORS_H
#define ACCELBN_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace accelbn {

/**
 * @brief Invalid mathematical input (non-positive modulus, non-invertible pair)
 *
 * Raised with the same message whichever backend executed the operation.
 */
class ArithmeticError : public std::domain_error {
public:
    explicit ArithmeticError(const std::string& what) : std::domain_error(what) {}
};

/**
 * @brief A foreign entry point is missing or reported an unexpected status
 */
class ForeignCallError : public std::runtime_error {
public:
    explicit ForeignCallError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The CPU classifier could not determine a tier
 */
class UnknownCpuError : public std::runtime_error {
public:
    explicit UnknownCpuError(const std::string& what) : std::runtime_error(what) {}
};

namespace errors {

/// Message used by every backend for a modulus <= 0
constexpr const char* kModulusNotPositive = "modulus not positive";

/// Message used by every backend for gcd(value, modulus) != 1
constexpr const char* kNotInvertible = "value not invertible for modulus";

} // namespace errors

} // namespace accelbn

#endif // ACCELBN_CORE_ERRORS_H
