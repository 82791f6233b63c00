/**
 * @file dispatch.cpp
 * @brief Backend selection
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/math/dispatch.h"
#include "accelbn/math/accel_bigint.h"

#include <utility>

namespace accelbn {
namespace math {

const char* backend_kind_name(BackendKind kind) {
    return kind == BackendKind::Native ? "native" : "software";
}

BackendKind select_backend(Operation op,
                           const loader::LibraryCapabilities& caps,
                           int base_sign, int exponent_sign, int modulus_sign) {
    if (!caps.loaded) {
        return BackendKind::Software;
    }
    switch (op) {
        case Operation::ModPow:
        case Operation::ModPowCT:
            if (caps.supports_negative_operands) {
                return BackendKind::Native;
            }
            // Legacy backends misbehave on negative or zero inputs
            if (base_sign >= 0 && exponent_sign >= 0 && modulus_sign > 0) {
                return BackendKind::Native;
            }
            return BackendKind::Software;
        case Operation::ModInverse:
            return caps.supports_mod_inverse ? BackendKind::Native : BackendKind::Software;
    }
    return BackendKind::Software;
}

// ============================================================================
// Dispatcher
// ============================================================================

Dispatcher::Dispatcher(loader::LibraryCapabilities caps,
                       std::shared_ptr<const ArithmeticBackend> native,
                       std::shared_ptr<const ArithmeticBackend> software)
    : caps_(std::move(caps)), native_(std::move(native)), software_(std::move(software)) {
    if (!native_) {
        caps_ = loader::LibraryCapabilities::not_loaded();
    }
    if (!software_) {
        software_ = std::make_shared<SoftwareBackend>();
    }
}

Dispatcher Dispatcher::software_only() {
    return Dispatcher(loader::LibraryCapabilities::not_loaded(), nullptr);
}

const ArithmeticBackend& Dispatcher::backend(BackendKind kind) const {
    return kind == BackendKind::Native ? *native_ : *software_;
}

AcceleratedBigInteger Dispatcher::mod_pow(const AcceleratedBigInteger& base,
                                          const AcceleratedBigInteger& exponent,
                                          const AcceleratedBigInteger& modulus) const {
    BackendKind kind = select_backend(Operation::ModPow, caps_, base.signum(),
                                      exponent.signum(), modulus.signum());
    return backend(kind).mod_pow(base, exponent, modulus);
}

AcceleratedBigInteger Dispatcher::mod_pow_ct(const AcceleratedBigInteger& base,
                                             const AcceleratedBigInteger& exponent,
                                             const AcceleratedBigInteger& modulus) const {
    BackendKind kind = select_backend(Operation::ModPowCT, caps_, base.signum(),
                                      exponent.signum(), modulus.signum());
    if (kind == BackendKind::Native && !caps_.supports_constant_time) {
        // Legacy native backend has no constant-time entry point
        return native_->mod_pow(base, exponent, modulus);
    }
    return backend(kind).mod_pow_ct(base, exponent, modulus);
}

AcceleratedBigInteger Dispatcher::mod_inverse(const AcceleratedBigInteger& value,
                                              const AcceleratedBigInteger& modulus) const {
    BackendKind kind = select_backend(Operation::ModInverse, caps_, value.signum(), 0,
                                      modulus.signum());
    return backend(kind).mod_inverse(value, modulus);
}

} // namespace math
} // namespace accelbn
