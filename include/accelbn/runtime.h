/**
 * @file runtime.h
 * @brief Process-wide acceleration state
 *
 * @details The first call to runtime() detects the platform and CPU,
 * resolves the acceleration library, probes its capabilities, and fixes
 * the dispatcher used by every AcceleratedBigInteger operation that does
 * not name one explicitly. Resolution runs exactly once per process, even
 * under concurrent first use; the result never changes afterwards.
 *
 * Tests and embedders that need a specific configuration build their own
 * Runtime with Runtime::initialize() and pass its dispatcher explicitly.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_RUNTIME_H
#define ACCELBN_RUNTIME_H

#include "accelbn/core/config.h"
#include "accelbn/core/cpu_features.h"
#include "accelbn/core/platform.h"
#include "accelbn/core/report.h"
#include "accelbn/loader/capability_probe.h"
#include "accelbn/loader/library_loader.h"
#include "accelbn/loader/resource_provider.h"
#include "accelbn/math/dispatch.h"

#include <memory>
#include <optional>
#include <string>

namespace accelbn {

/**
 * @brief Inputs for one resolution; empty members take host defaults
 */
struct RuntimeOptions {
    Config config;
    std::shared_ptr<const loader::ResourceProvider> resources;   ///< Default: config.resource_dir
    std::shared_ptr<const cpu::CpuClassifier> classifier;        ///< Default: CPUID
    std::shared_ptr<ReportSink> sink;                            ///< Default: console per config
    std::optional<PlatformProfile> profile;                      ///< Default: host
    std::optional<int> arm_revision;                             ///< Default: /proc/cpuinfo
};

class Runtime {
public:
    /**
     * @brief Resolve and probe; never throws for a missing library
     */
    static std::shared_ptr<const Runtime> initialize(RuntimeOptions options);

    const PlatformProfile& profile() const { return profile_; }

    /// Detected tier, empty when the processor is not recognized
    const std::optional<cpu::Tier>& tier() const { return tier_; }

    const std::string& cpu_model() const { return cpu_model_; }
    const loader::LoadResult& load_result() const { return load_result_; }
    const loader::LibraryCapabilities& capabilities() const { return dispatcher_.capabilities(); }

    /// Most recent info or warning message from resolution
    const std::string& status_message() const { return status_message_; }

    const math::Dispatcher& dispatcher() const { return dispatcher_; }

private:
    Runtime(PlatformProfile profile, std::optional<cpu::Tier> tier, std::string cpu_model,
            loader::LoadResult load_result, math::Dispatcher dispatcher,
            std::string status_message);

    PlatformProfile profile_;
    std::optional<cpu::Tier> tier_;
    std::string cpu_model_;
    loader::LoadResult load_result_;
    math::Dispatcher dispatcher_;
    std::string status_message_;
};

/**
 * @brief Process-wide runtime, configured from the environment on first use
 */
const Runtime& runtime();

// ============================================================================
// Introspection
// ============================================================================

/// True if a native acceleration library is in use
bool is_accelerated();

/// ABI version of the loaded library, 0 if none
int backend_version();

/// Arithmetic library version reported by the native library, or "unknown"
std::string backend_library_version();

/// Bundled candidate that was loaded; empty for system-path loads or none
std::optional<std::string> loaded_candidate_name();

std::string last_status_message();

/// Tier name, or "unrecognized"
std::string cpu_type();

std::string cpu_model();

} // namespace accelbn

#endif // ACCELBN_RUNTIME_H
