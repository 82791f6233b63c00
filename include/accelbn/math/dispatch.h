/**
 * @file dispatch.h
 * @brief Per-call choice between the native and software backends
 *
 * @details The choice is a pure function of the backend capabilities and
 * the operand signs:
 * - A version 3 backend handles every input, including negative operands
 *   and invalid moduli (which it reports as domain errors).
 * - A legacy backend misbehaves on negative or zero inputs, so it only
 *   receives base >= 0, exponent >= 0, modulus > 0 for mod_pow and never
 *   receives mod_inverse.
 * - Everything else goes to the software backend.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_MATH_DISPATCH_H
#define ACCELBN_MATH_DISPATCH_H

#include "accelbn/loader/capability_probe.h"
#include "accelbn/math/backend.h"

#include <memory>

namespace accelbn {
namespace math {

enum class BackendKind {
    Native,
    Software
};

enum class Operation {
    ModPow,
    ModPowCT,
    ModInverse
};

const char* backend_kind_name(BackendKind kind);

/**
 * @brief Backend for one call
 * @param base_sign Sign of the base (the value for ModInverse)
 * @param exponent_sign Sign of the exponent (ignored for ModInverse)
 * @param modulus_sign Sign of the modulus
 */
BackendKind select_backend(Operation op,
                           const loader::LibraryCapabilities& caps,
                           int base_sign, int exponent_sign, int modulus_sign);

class Dispatcher {
public:
    /**
     * @param caps Capabilities of native; forced to "not loaded" if native is null
     * @param native Native backend, may be null
     * @param software Software backend; a SoftwareBackend is created if null
     */
    Dispatcher(loader::LibraryCapabilities caps,
               std::shared_ptr<const ArithmeticBackend> native,
               std::shared_ptr<const ArithmeticBackend> software = nullptr);

    /// Dispatcher that always uses GMP
    static Dispatcher software_only();

    AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& base,
                                  const AcceleratedBigInteger& exponent,
                                  const AcceleratedBigInteger& modulus) const;
    AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& base,
                                     const AcceleratedBigInteger& exponent,
                                     const AcceleratedBigInteger& modulus) const;
    AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& value,
                                      const AcceleratedBigInteger& modulus) const;

    const loader::LibraryCapabilities& capabilities() const { return caps_; }
    const ArithmeticBackend& backend(BackendKind kind) const;

private:
    loader::LibraryCapabilities caps_;
    std::shared_ptr<const ArithmeticBackend> native_;
    std::shared_ptr<const ArithmeticBackend> software_;
};

} // namespace math
} // namespace accelbn

#endif // ACCELBN_MATH_DISPATCH_H
