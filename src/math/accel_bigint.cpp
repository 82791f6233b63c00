/**
 * @file accel_bigint.cpp
 * @brief AcceleratedBigInteger implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/math/accel_bigint.h"
#include "accelbn/math/dispatch.h"
#include "accelbn/runtime.h"
#include "accelbn/utils/twos_complement.h"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace accelbn {

AcceleratedBigInteger::AcceleratedBigInteger() : value_(0) {}

AcceleratedBigInteger::AcceleratedBigInteger(long value) : value_(value) {}

AcceleratedBigInteger::AcceleratedBigInteger(const mpz_class& value) : value_(value) {}

AcceleratedBigInteger::AcceleratedBigInteger(mpz_class&& value) : value_(std::move(value)) {}

AcceleratedBigInteger AcceleratedBigInteger::from_bytes(const ByteVec& bytes) {
    if (bytes.empty()) {
        throw std::invalid_argument("zero-length byte encoding");
    }
    return AcceleratedBigInteger(utils::from_twos_complement(bytes));
}

AcceleratedBigInteger AcceleratedBigInteger::from_sign_magnitude(int signum,
                                                                 const ByteVec& magnitude) {
    return AcceleratedBigInteger(
        utils::from_sign_magnitude(signum, magnitude.data(), magnitude.size()));
}

AcceleratedBigInteger AcceleratedBigInteger::from_string(const std::string& text, int radix) {
    if (radix < 2 || radix > 62) {
        throw std::invalid_argument("radix out of range: " + std::to_string(radix));
    }
    mpz_class value;
    if (text.empty() || value.set_str(text, radix) != 0) {
        throw std::invalid_argument("malformed integer: \"" + text + "\"");
    }
    return AcceleratedBigInteger(std::move(value));
}

// The encoding cache is never shared between objects
AcceleratedBigInteger::AcceleratedBigInteger(const AcceleratedBigInteger& other)
    : value_(other.value_) {}

AcceleratedBigInteger::AcceleratedBigInteger(AcceleratedBigInteger&& other) noexcept
    : value_(std::move(other.value_)),
      encoded_(other.encoded_.exchange(nullptr, std::memory_order_acq_rel)) {}

AcceleratedBigInteger::~AcceleratedBigInteger() {
    delete encoded_.load(std::memory_order_acquire);
}

int AcceleratedBigInteger::signum() const {
    return sgn(value_);
}

std::string AcceleratedBigInteger::to_string(int radix) const {
    return value_.get_str(radix);
}

const ByteVec& AcceleratedBigInteger::to_byte_array() const {
    const ByteVec* cached = encoded_.load(std::memory_order_acquire);
    if (cached != nullptr) {
        return *cached;
    }

    const ByteVec* computed = new ByteVec(utils::to_twos_complement(value_));
    const ByteVec* expected = nullptr;
    if (encoded_.compare_exchange_strong(expected, computed,
                                         std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
        return *computed;
    }
    // Another thread published first; both encodings are identical
    delete computed;
    return *expected;
}

// ============================================================================
// Modular operations
// ============================================================================

AcceleratedBigInteger AcceleratedBigInteger::mod_pow(const AcceleratedBigInteger& exponent,
                                                     const AcceleratedBigInteger& modulus) const {
    return mod_pow(exponent, modulus, runtime().dispatcher());
}

AcceleratedBigInteger AcceleratedBigInteger::mod_pow(const AcceleratedBigInteger& exponent,
                                                     const AcceleratedBigInteger& modulus,
                                                     const math::Dispatcher& dispatcher) const {
    return dispatcher.mod_pow(*this, exponent, modulus);
}

AcceleratedBigInteger AcceleratedBigInteger::mod_pow_ct(const AcceleratedBigInteger& exponent,
                                                        const AcceleratedBigInteger& modulus) const {
    return mod_pow_ct(exponent, modulus, runtime().dispatcher());
}

AcceleratedBigInteger AcceleratedBigInteger::mod_pow_ct(const AcceleratedBigInteger& exponent,
                                                        const AcceleratedBigInteger& modulus,
                                                        const math::Dispatcher& dispatcher) const {
    return dispatcher.mod_pow_ct(*this, exponent, modulus);
}

AcceleratedBigInteger AcceleratedBigInteger::mod_inverse(const AcceleratedBigInteger& modulus) const {
    return mod_inverse(modulus, runtime().dispatcher());
}

AcceleratedBigInteger AcceleratedBigInteger::mod_inverse(const AcceleratedBigInteger& modulus,
                                                         const math::Dispatcher& dispatcher) const {
    return dispatcher.mod_inverse(*this, modulus);
}

size_t AcceleratedBigInteger::hash() const {
    // FNV-1a over the canonical encoding
    size_t h = static_cast<size_t>(14695981039346656037ULL);
    for (uint8_t b : to_byte_array()) {
        h ^= b;
        h *= static_cast<size_t>(1099511628211ULL);
    }
    return h;
}

std::ostream& operator<<(std::ostream& os, const AcceleratedBigInteger& n) {
    return os << n.to_string();
}

} // namespace accelbn
