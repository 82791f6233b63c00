/**
 * @file native_api.h
 * @brief Typed foreign-call bridge to a loaded acceleration library
 *
 * Byte buffers in, byte buffers out. Missing entry points surface as
 * ForeignCallError when called; domain errors as ArithmeticError with the
 * same messages the software backend uses.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_NATIVE_API_H
#define ACCELBN_LOADER_NATIVE_API_H

#include "accelbn/core/types.h"
#include "accelbn/loader/native_library.h"
#include "accelbn/native/accel_abi.h"

#include <memory>
#include <string>

namespace accelbn {
namespace loader {

class NativeApi {
public:
    /**
     * @brief Resolve the entry points of a loaded library
     * @return The bridge, or null if the mandatory modpow entry point is
     *         missing (the library is not an acceleration library)
     */
    static std::shared_ptr<const NativeApi> bind(std::shared_ptr<NativeLibrary> library);

    const std::string& library_name() const { return library_->name(); }

    /// True when all version-3 operation entry points are exported
    bool has_versioned_operations() const;

    /**
     * @brief ABI version reported by the library
     * @throws ForeignCallError if the library predates version reporting
     */
    int version() const;

    /**
     * @brief Version of the arithmetic library the backend links
     * @throws ForeignCallError if not exported
     */
    int gmp_version_major() const;
    int gmp_version_minor() const;
    int gmp_version_patch() const;

    ByteVec mod_pow(const ByteVec& base, const ByteVec& exponent, const ByteVec& modulus) const;
    ByteVec mod_pow_ct(const ByteVec& base, const ByteVec& exponent, const ByteVec& modulus) const;
    ByteVec mod_inverse(const ByteVec& value, const ByteVec& modulus) const;

private:
    explicit NativeApi(std::shared_ptr<NativeLibrary> library);

    ByteVec call_modpow(accelbn_native_modpow_fn fn, const char* symbol,
                        const ByteVec& base, const ByteVec& exponent,
                        const ByteVec& modulus) const;
    static int call_int(accelbn_native_version_fn fn, const char* symbol);

    std::shared_ptr<NativeLibrary> library_;
    accelbn_native_modpow_fn modpow_ = nullptr;
    accelbn_native_modpow_ct_fn modpow_ct_ = nullptr;
    accelbn_native_modinverse_fn modinverse_ = nullptr;
    accelbn_native_version_fn version_ = nullptr;
    accelbn_native_gmp_version_fn gmp_major_ = nullptr;
    accelbn_native_gmp_version_fn gmp_minor_ = nullptr;
    accelbn_native_gmp_version_fn gmp_patch_ = nullptr;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_NATIVE_API_H
