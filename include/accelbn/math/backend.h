/**
 * @file backend.h
 * @brief Arithmetic backends: GMP software and native acceleration library
 *
 * Both backends raise ArithmeticError with identical messages for a
 * non-positive modulus and for a non-invertible value, so callers cannot
 * tell which one ran except by speed.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_MATH_BACKEND_H
#define ACCELBN_MATH_BACKEND_H

#include "accelbn/loader/native_api.h"

#include <memory>

namespace accelbn {

class AcceleratedBigInteger;

namespace math {

class ArithmeticBackend {
public:
    virtual ~ArithmeticBackend() = default;

    virtual const char* name() const = 0;

    /**
     * @brief (base ^ exponent) mod modulus, in [0, modulus)
     * @throws ArithmeticError if modulus <= 0, or exponent < 0 and base is
     *         not invertible
     */
    virtual AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& base,
                                          const AcceleratedBigInteger& exponent,
                                          const AcceleratedBigInteger& modulus) const = 0;

    /**
     * @brief mod_pow whose timing does not depend on the exponent
     */
    virtual AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& base,
                                             const AcceleratedBigInteger& exponent,
                                             const AcceleratedBigInteger& modulus) const = 0;

    /**
     * @brief value^-1 mod modulus
     * @throws ArithmeticError if modulus <= 0 or gcd(value, modulus) != 1
     */
    virtual AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& value,
                                              const AcceleratedBigInteger& modulus) const = 0;
};

/**
 * @brief Portable GMP implementation
 */
class SoftwareBackend final : public ArithmeticBackend {
public:
    const char* name() const override { return "software"; }

    AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& base,
                                  const AcceleratedBigInteger& exponent,
                                  const AcceleratedBigInteger& modulus) const override;
    AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& base,
                                     const AcceleratedBigInteger& exponent,
                                     const AcceleratedBigInteger& modulus) const override;
    AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& value,
                                      const AcceleratedBigInteger& modulus) const override;
};

/**
 * @brief Operations forwarded through the foreign-call bridge
 *
 * Operands cross as their memoized byte encodings.
 */
class NativeBackend final : public ArithmeticBackend {
public:
    explicit NativeBackend(std::shared_ptr<const loader::NativeApi> api);

    const char* name() const override { return "native"; }

    AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& base,
                                  const AcceleratedBigInteger& exponent,
                                  const AcceleratedBigInteger& modulus) const override;
    AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& base,
                                     const AcceleratedBigInteger& exponent,
                                     const AcceleratedBigInteger& modulus) const override;
    AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& value,
                                      const AcceleratedBigInteger& modulus) const override;

    const loader::NativeApi& api() const { return *api_; }

private:
    std::shared_ptr<const loader::NativeApi> api_;
};

} // namespace math
} // namespace accelbn

#endif // ACCELBN_MATH_BACKEND_H
