/**
 * @file capability_probe.h
 * @brief Version negotiation with a loaded acceleration library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_CAPABILITY_PROBE_H
#define ACCELBN_LOADER_CAPABILITY_PROBE_H

#include "accelbn/core/report.h"
#include "accelbn/loader/native_api.h"

#include <string>

namespace accelbn {
namespace loader {

/// Reported when the backend's arithmetic library version is not known
constexpr const char* kUnknownLibraryVersion = "unknown";

/**
 * @brief Features available from the native backend
 *
 * loaded reflects the load result; the feature flags derive from
 * version_major and the entry points the library actually exports.
 */
struct LibraryCapabilities {
    bool loaded = false;
    int version_major = 0;                  ///< 0 if unknown or nothing is loaded
    bool supports_constant_time = false;
    bool supports_mod_inverse = false;
    bool supports_negative_operands = false;
    std::string backend_library_version = kUnknownLibraryVersion;

    /// True for a version 3 or later backend
    bool versioned() const { return loaded && supports_constant_time; }

    /// Nothing loaded; every operation runs in software
    static LibraryCapabilities not_loaded();

    /**
     * @brief Capabilities of a loaded library reporting an ABI version
     */
    static LibraryCapabilities for_version(int version);

    /// Set or clear the constant-time, inverse and negative-operand flags
    void set_versioned_operations(bool available);
};

/**
 * @brief Derives capabilities from a loaded library
 */
class CapabilityProbe {
public:
    explicit CapabilityProbe(StatusReporter& reporter);

    /**
     * @brief Query version information
     *
     * A version query that fails is a pre-versioning (legacy) backend.
     * A versioned backend missing modpow_ct or modinverse is treated as
     * legacy. A failed arithmetic-library version query leaves "unknown".
     */
    LibraryCapabilities probe(const NativeApi& api) const;

    /**
     * @brief ABI version, or the legacy version when it cannot be queried
     */
    int query_version(const NativeApi& api) const;

private:
    StatusReporter& reporter_;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_CAPABILITY_PROBE_H
