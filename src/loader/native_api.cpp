/**
 * @file native_api.cpp
 * @brief Foreign-call bridge implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/native_api.h"
#include "accelbn/core/errors.h"
#include "accelbn/utils/twos_complement.h"

#include <utility>

namespace accelbn {
namespace loader {

namespace {

template <typename Fn>
Fn lookup(const NativeLibrary& library, const char* name) {
    return reinterpret_cast<Fn>(library.symbol(name));
}

[[noreturn]] void throw_missing(const char* symbol) {
    throw ForeignCallError(std::string("entry point not exported: ") + symbol);
}

/**
 * @brief Map a native status to the exception the software backend raises
 */
[[noreturn]] void throw_status(int status, const char* symbol, const ByteVec& modulus) {
    if (status == ACCELBN_NATIVE_DOMAIN_ERROR) {
        if (utils::twos_complement_signum(modulus) <= 0) {
            throw ArithmeticError(errors::kModulusNotPositive);
        }
        throw ArithmeticError(errors::kNotInvertible);
    }
    throw ForeignCallError(std::string(symbol) + " failed with status " + std::to_string(status));
}

} // anonymous namespace

NativeApi::NativeApi(std::shared_ptr<NativeLibrary> library)
    : library_(std::move(library)) {}

std::shared_ptr<const NativeApi> NativeApi::bind(std::shared_ptr<NativeLibrary> library) {
    if (!library) {
        return nullptr;
    }
    std::shared_ptr<NativeApi> api(new NativeApi(std::move(library)));
    const NativeLibrary& lib = *api->library_;
    api->modpow_ = lookup<accelbn_native_modpow_fn>(lib, ACCELBN_NATIVE_SYM_MODPOW);
    if (!api->modpow_) {
        return nullptr;
    }
    api->modpow_ct_ = lookup<accelbn_native_modpow_ct_fn>(lib, ACCELBN_NATIVE_SYM_MODPOW_CT);
    api->modinverse_ = lookup<accelbn_native_modinverse_fn>(lib, ACCELBN_NATIVE_SYM_MODINVERSE);
    api->version_ = lookup<accelbn_native_version_fn>(lib, ACCELBN_NATIVE_SYM_VERSION);
    api->gmp_major_ = lookup<accelbn_native_gmp_version_fn>(lib, ACCELBN_NATIVE_SYM_GMP_MAJOR);
    api->gmp_minor_ = lookup<accelbn_native_gmp_version_fn>(lib, ACCELBN_NATIVE_SYM_GMP_MINOR);
    api->gmp_patch_ = lookup<accelbn_native_gmp_version_fn>(lib, ACCELBN_NATIVE_SYM_GMP_PATCH);
    return api;
}

bool NativeApi::has_versioned_operations() const {
    return modpow_ct_ != nullptr && modinverse_ != nullptr;
}

int NativeApi::call_int(accelbn_native_version_fn fn, const char* symbol) {
    if (!fn) {
        throw_missing(symbol);
    }
    return fn();
}

int NativeApi::version() const {
    return call_int(version_, ACCELBN_NATIVE_SYM_VERSION);
}

int NativeApi::gmp_version_major() const {
    return call_int(gmp_major_, ACCELBN_NATIVE_SYM_GMP_MAJOR);
}

int NativeApi::gmp_version_minor() const {
    return call_int(gmp_minor_, ACCELBN_NATIVE_SYM_GMP_MINOR);
}

int NativeApi::gmp_version_patch() const {
    return call_int(gmp_patch_, ACCELBN_NATIVE_SYM_GMP_PATCH);
}

ByteVec NativeApi::call_modpow(accelbn_native_modpow_fn fn, const char* symbol,
                               const ByteVec& base, const ByteVec& exponent,
                               const ByteVec& modulus) const {
    if (!fn) {
        throw_missing(symbol);
    }
    // Results lie in [0, modulus): one extra byte covers the sign bit
    ByteVec out(modulus.size() + 1);
    size_t out_len = 0;
    int status = fn(base.data(), base.size(), exponent.data(), exponent.size(),
                    modulus.data(), modulus.size(), out.data(), out.size(), &out_len);
    if (status != ACCELBN_NATIVE_OK) {
        throw_status(status, symbol, modulus);
    }
    if (out_len == 0 || out_len > out.size()) {
        throw ForeignCallError(std::string(symbol) + " returned an invalid length");
    }
    out.resize(out_len);
    return out;
}

ByteVec NativeApi::mod_pow(const ByteVec& base, const ByteVec& exponent,
                           const ByteVec& modulus) const {
    return call_modpow(modpow_, ACCELBN_NATIVE_SYM_MODPOW, base, exponent, modulus);
}

ByteVec NativeApi::mod_pow_ct(const ByteVec& base, const ByteVec& exponent,
                              const ByteVec& modulus) const {
    return call_modpow(modpow_ct_, ACCELBN_NATIVE_SYM_MODPOW_CT, base, exponent, modulus);
}

ByteVec NativeApi::mod_inverse(const ByteVec& value, const ByteVec& modulus) const {
    if (!modinverse_) {
        throw_missing(ACCELBN_NATIVE_SYM_MODINVERSE);
    }
    ByteVec out(modulus.size() + 1);
    size_t out_len = 0;
    int status = modinverse_(value.data(), value.size(), modulus.data(), modulus.size(),
                             out.data(), out.size(), &out_len);
    if (status != ACCELBN_NATIVE_OK) {
        throw_status(status, ACCELBN_NATIVE_SYM_MODINVERSE, modulus);
    }
    if (out_len == 0 || out_len > out.size()) {
        throw ForeignCallError(std::string(ACCELBN_NATIVE_SYM_MODINVERSE) +
                               " returned an invalid length");
    }
    out.resize(out_len);
    return out;
}

} // namespace loader
} // namespace accelbn
