/**
 * @file accel_bigint.h
 * @brief Arbitrary-precision integer whose modular operations use the
 *        native acceleration library when one is loaded
 *
 * @details Values are immutable and may be shared across threads without
 * locking. The canonical byte encoding (big-endian two's complement) is
 * computed on first use and cached; concurrent first calls may compute it
 * twice, one result is kept.
 *
 * Example:
 * @code
 * accelbn::AcceleratedBigInteger base(4), exp(13), mod(497);
 * auto r = base.mod_pow(exp, mod);   // 445
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_MATH_ACCEL_BIGINT_H
#define ACCELBN_MATH_ACCEL_BIGINT_H

#include "accelbn/core/types.h"

#include <gmpxx.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

namespace accelbn {

namespace math {
class Dispatcher;
}

class AcceleratedBigInteger {
public:
    /// Zero
    AcceleratedBigInteger();
    explicit AcceleratedBigInteger(long value);
    explicit AcceleratedBigInteger(const mpz_class& value);
    explicit AcceleratedBigInteger(mpz_class&& value);

    /**
     * @brief Decode big-endian two's complement bytes
     * @throws std::invalid_argument if bytes is empty
     */
    static AcceleratedBigInteger from_bytes(const ByteVec& bytes);

    /**
     * @brief Sign and unsigned big-endian magnitude
     * @throws std::invalid_argument for an invalid signum or mismatch
     */
    static AcceleratedBigInteger from_sign_magnitude(int signum, const ByteVec& magnitude);

    /**
     * @brief Parse digits in a radix (2..62), optional leading '-'
     * @throws std::invalid_argument on malformed text
     */
    static AcceleratedBigInteger from_string(const std::string& text, int radix = 10);

    AcceleratedBigInteger(const AcceleratedBigInteger& other);
    AcceleratedBigInteger(AcceleratedBigInteger&& other) noexcept;
    // Immutable once constructed
    AcceleratedBigInteger& operator=(const AcceleratedBigInteger&) = delete;
    AcceleratedBigInteger& operator=(AcceleratedBigInteger&&) = delete;
    ~AcceleratedBigInteger();

    const mpz_class& value() const { return value_; }

    /// -1, 0 or 1
    int signum() const;

    std::string to_string(int radix = 10) const;

    /**
     * @brief Canonical big-endian two's complement bytes, e.g. 255 -> {0x00, 0xFF}
     *
     * The reference stays valid for the lifetime of this object, or of
     * the object it is moved into.
     */
    const ByteVec& to_byte_array() const;

    /**
     * @brief (this ^ exponent) mod modulus
     * @throws ArithmeticError if modulus <= 0, or exponent < 0 and this is
     *         not invertible modulo modulus
     */
    AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& exponent,
                                  const AcceleratedBigInteger& modulus) const;
    AcceleratedBigInteger mod_pow(const AcceleratedBigInteger& exponent,
                                  const AcceleratedBigInteger& modulus,
                                  const math::Dispatcher& dispatcher) const;

    /**
     * @brief Constant-time mod_pow when the native backend supports it,
     *        otherwise the same as mod_pow
     */
    AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& exponent,
                                     const AcceleratedBigInteger& modulus) const;
    AcceleratedBigInteger mod_pow_ct(const AcceleratedBigInteger& exponent,
                                     const AcceleratedBigInteger& modulus,
                                     const math::Dispatcher& dispatcher) const;

    /**
     * @brief this^-1 mod modulus
     * @throws ArithmeticError if modulus <= 0 or not coprime
     */
    AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& modulus) const;
    AcceleratedBigInteger mod_inverse(const AcceleratedBigInteger& modulus,
                                      const math::Dispatcher& dispatcher) const;

    size_t hash() const;

    friend bool operator==(const AcceleratedBigInteger& a, const AcceleratedBigInteger& b) {
        return a.value_ == b.value_;
    }
    friend bool operator!=(const AcceleratedBigInteger& a, const AcceleratedBigInteger& b) {
        return !(a == b);
    }

private:
    mpz_class value_;
    mutable std::atomic<const ByteVec*> encoded_{nullptr};
};

std::ostream& operator<<(std::ostream& os, const AcceleratedBigInteger& n);

} // namespace accelbn

namespace std {
template <>
struct hash<accelbn::AcceleratedBigInteger> {
    size_t operator()(const accelbn::AcceleratedBigInteger& n) const { return n.hash(); }
};
} // namespace std

#endif // ACCELBN_MATH_ACCEL_BIGINT_H
