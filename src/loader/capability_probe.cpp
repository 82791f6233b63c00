/**
 * @file capability_probe.cpp
 * @brief Version and feature probing of the native backend
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/capability_probe.h"
#include "accelbn/core/errors.h"
#include "accelbn/version.h"

namespace accelbn {
namespace loader {

LibraryCapabilities LibraryCapabilities::not_loaded() {
    return LibraryCapabilities();
}

LibraryCapabilities LibraryCapabilities::for_version(int version) {
    LibraryCapabilities caps;
    caps.loaded = true;
    caps.version_major = version;
    caps.set_versioned_operations(version >= ACCELBN_NATIVE_ABI_VERSIONED);
    return caps;
}

void LibraryCapabilities::set_versioned_operations(bool available) {
    supports_constant_time = available;
    supports_mod_inverse = available;
    supports_negative_operands = available;
}

CapabilityProbe::CapabilityProbe(StatusReporter& reporter) : reporter_(reporter) {}

int CapabilityProbe::query_version(const NativeApi& api) const {
    try {
        return api.version();
    } catch (const ForeignCallError& e) {
        reporter_.debug(std::string("version query failed, assuming legacy backend: ") + e.what());
        return ACCELBN_NATIVE_ABI_LEGACY;
    }
}

LibraryCapabilities CapabilityProbe::probe(const NativeApi& api) const {
    LibraryCapabilities caps = LibraryCapabilities::for_version(query_version(api));

    if (caps.version_major >= ACCELBN_NATIVE_ABI_VERSIONED) {
        try {
            int major = api.gmp_version_major();
            int minor = api.gmp_version_minor();
            int patch = api.gmp_version_patch();
            caps.backend_library_version = std::to_string(major) + "." +
                                           std::to_string(minor) + "." +
                                           std::to_string(patch);
        } catch (const ForeignCallError& e) {
            reporter_.warn("native backend version " + std::to_string(caps.version_major) +
                           " but arithmetic library version not available: " + e.what());
        }
        if (!api.has_versioned_operations()) {
            // Treated as legacy: only modpow is called, with non-negative operands
            reporter_.warn("native backend version " + std::to_string(caps.version_major) +
                           " is missing constant-time or inverse entry points");
            caps.set_versioned_operations(false);
        }
    }

    reporter_.info("native backend version: " + std::to_string(caps.version_major) +
                   "; arithmetic library version: " + caps.backend_library_version);
    return caps;
}

} // namespace loader
} // namespace accelbn
