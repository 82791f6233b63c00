/**
 * @file native_backend.cpp
 * @brief Modular operations forwarded to the acceleration library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/math/backend.h"
#include "accelbn/math/accel_bigint.h"

#include <stdexcept>
#include <utility>

namespace accelbn {
namespace math {

NativeBackend::NativeBackend(std::shared_ptr<const loader::NativeApi> api)
    : api_(std::move(api)) {
    if (!api_) {
        throw std::invalid_argument("NativeBackend requires a loaded library");
    }
}

AcceleratedBigInteger NativeBackend::mod_pow(const AcceleratedBigInteger& base,
                                             const AcceleratedBigInteger& exponent,
                                             const AcceleratedBigInteger& modulus) const {
    return AcceleratedBigInteger::from_bytes(
        api_->mod_pow(base.to_byte_array(), exponent.to_byte_array(), modulus.to_byte_array()));
}

AcceleratedBigInteger NativeBackend::mod_pow_ct(const AcceleratedBigInteger& base,
                                                const AcceleratedBigInteger& exponent,
                                                const AcceleratedBigInteger& modulus) const {
    return AcceleratedBigInteger::from_bytes(
        api_->mod_pow_ct(base.to_byte_array(), exponent.to_byte_array(), modulus.to_byte_array()));
}

AcceleratedBigInteger NativeBackend::mod_inverse(const AcceleratedBigInteger& value,
                                                 const AcceleratedBigInteger& modulus) const {
    return AcceleratedBigInteger::from_bytes(
        api_->mod_inverse(value.to_byte_array(), modulus.to_byte_array()));
}

} // namespace math
} // namespace accelbn
