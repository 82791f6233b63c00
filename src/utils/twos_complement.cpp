/**
 * @file twos_complement.cpp
 * @brief Two's complement conversion between GMP integers and byte arrays
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/utils/twos_complement.h"

#include <stdexcept>

namespace accelbn {
namespace utils {

namespace {

/// Bit length excluding the sign bit, as in two's complement notation
size_t signed_bit_length(const mpz_class& value) {
    if (value >= 0) {
        return value == 0 ? 0 : mpz_sizeinbase(value.get_mpz_t(), 2);
    }
    mpz_class m = -value - 1;
    return m == 0 ? 0 : mpz_sizeinbase(m.get_mpz_t(), 2);
}

mpz_class import_unsigned(const uint8_t* data, size_t len) {
    mpz_class result;
    if (len > 0) {
        mpz_import(result.get_mpz_t(), len, 1, 1, 1, 0, data);
    }
    return result;
}

} // anonymous namespace

ByteVec to_twos_complement(const mpz_class& value) {
    const size_t len = signed_bit_length(value) / 8 + 1;

    mpz_class unsigned_form = value;
    if (value < 0) {
        mpz_class wrap;
        mpz_ui_pow_ui(wrap.get_mpz_t(), 2, static_cast<unsigned long>(8 * len));
        unsigned_form += wrap;
    }

    ByteVec out(len, 0);
    if (unsigned_form != 0) {
        size_t count = (mpz_sizeinbase(unsigned_form.get_mpz_t(), 2) + 7) / 8;
        // Right-align the magnitude; leading bytes stay zero
        mpz_export(out.data() + (len - count), &count, 1, 1, 1, 0, unsigned_form.get_mpz_t());
    }
    return out;
}

mpz_class from_twos_complement(const uint8_t* data, size_t len) {
    mpz_class result = import_unsigned(data, len);
    if (len > 0 && (data[0] & 0x80) != 0) {
        mpz_class wrap;
        mpz_ui_pow_ui(wrap.get_mpz_t(), 2, static_cast<unsigned long>(8 * len));
        result -= wrap;
    }
    return result;
}

mpz_class from_sign_magnitude(int signum, const uint8_t* magnitude, size_t len) {
    if (signum < -1 || signum > 1) {
        throw std::invalid_argument("Invalid signum value");
    }
    mpz_class result = import_unsigned(magnitude, len);
    if (signum == 0) {
        if (result != 0) {
            throw std::invalid_argument("signum-magnitude mismatch");
        }
        return result;
    }
    return signum < 0 ? mpz_class(-result) : result;
}

int twos_complement_signum(const uint8_t* data, size_t len) {
    if (len == 0) {
        return 0;
    }
    if ((data[0] & 0x80) != 0) {
        return -1;
    }
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != 0) {
            return 1;
        }
    }
    return 0;
}

} // namespace utils
} // namespace accelbn
