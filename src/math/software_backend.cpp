/**
 * @file software_backend.cpp
 * @brief GMP implementation of the modular operations
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/math/backend.h"
#include "accelbn/core/errors.h"
#include "accelbn/math/accel_bigint.h"

#include <utility>

namespace accelbn {
namespace math {

namespace {

void require_positive(const mpz_class& modulus) {
    if (modulus <= 0) {
        throw ArithmeticError(errors::kModulusNotPositive);
    }
}

mpz_class invert(const mpz_class& value, const mpz_class& modulus) {
    mpz_class inverse;
    if (mpz_invert(inverse.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t()) == 0) {
        throw ArithmeticError(errors::kNotInvertible);
    }
    return inverse;
}

} // anonymous namespace

AcceleratedBigInteger SoftwareBackend::mod_pow(const AcceleratedBigInteger& base,
                                               const AcceleratedBigInteger& exponent,
                                               const AcceleratedBigInteger& modulus) const {
    const mpz_class& m = modulus.value();
    require_positive(m);
    if (m == 1) {
        return AcceleratedBigInteger();
    }

    const mpz_class& e = exponent.value();
    mpz_class result;
    if (e < 0) {
        // b^-e = (b^-1)^e
        mpz_class inverse = invert(base.value(), m);
        mpz_class abs_e = -e;
        mpz_powm(result.get_mpz_t(), inverse.get_mpz_t(), abs_e.get_mpz_t(), m.get_mpz_t());
    } else {
        mpz_powm(result.get_mpz_t(), base.value().get_mpz_t(), e.get_mpz_t(), m.get_mpz_t());
    }
    return AcceleratedBigInteger(std::move(result));
}

AcceleratedBigInteger SoftwareBackend::mod_pow_ct(const AcceleratedBigInteger& base,
                                                  const AcceleratedBigInteger& exponent,
                                                  const AcceleratedBigInteger& modulus) const {
    const mpz_class& m = modulus.value();
    const mpz_class& e = exponent.value();
    // mpz_powm_sec requires an odd modulus and a positive exponent
    if (m > 1 && mpz_odd_p(m.get_mpz_t()) && e > 0) {
        mpz_class reduced;
        mpz_mod(reduced.get_mpz_t(), base.value().get_mpz_t(), m.get_mpz_t());
        mpz_class result;
        mpz_powm_sec(result.get_mpz_t(), reduced.get_mpz_t(), e.get_mpz_t(), m.get_mpz_t());
        return AcceleratedBigInteger(std::move(result));
    }
    return mod_pow(base, exponent, modulus);
}

AcceleratedBigInteger SoftwareBackend::mod_inverse(const AcceleratedBigInteger& value,
                                                   const AcceleratedBigInteger& modulus) const {
    const mpz_class& m = modulus.value();
    require_positive(m);
    if (m == 1) {
        return AcceleratedBigInteger();
    }
    return AcceleratedBigInteger(invert(value.value(), m));
}

} // namespace math
} // namespace accelbn
