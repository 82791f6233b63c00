/**
 * @file cpu_features.h
 * @brief CPU Feature Detection and Microarchitecture Tier Classification
 * 
 * Maps the host CPU onto one of the optimization tiers that prebuilt
 * acceleration libraries are compiled for.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_CORE_CPU_FEATURES_H
#define ACCELBN_CORE_CPU_FEATURES_H

#include "accelbn/core/platform.h"
#include <cstdint>
#include <optional>
#include <string>

namespace accelbn {
namespace cpu {

/**
 * @brief Optimization targets of the prebuilt acceleration libraries
 */
enum class Tier {
    K6,
    K62,
    K63,
    Athlon,
    Athlon64,
    Pentium,
    PentiumMMX,
    Pentium2,
    Pentium3,
    Pentium4,
    ViaC3,
    ViaC32,
    Atom,
    Core2,
    CoreI,
    Geode,
    Nano,
    PentiumM,
    Arm,
    Ppc
};

/**
 * @brief Tier tag as it appears in library names, e.g. "athlon64"
 */
const char* tier_name(Tier tier);

/**
 * @brief CPU identification detected at runtime
 */
struct CPUFeatures {
    // x86 vendor
    bool is_intel = false;
    bool is_amd   = false;
    bool is_via   = false;

    // Display family/model (extended fields folded in)
    uint32_t family = 0;
    uint32_t model  = 0;

    bool has_mmx       = false;  ///< MMX
    bool has_sse       = false;  ///< SSE
    bool has_sse2      = false;  ///< SSE2
    bool has_ssse3     = false;  ///< SSSE3 (Core 2 and later)
    bool has_sse41     = false;  ///< SSE4.1
    bool has_sse42     = false;  ///< SSE4.2 (Nehalem and later)
    bool has_long_mode = false;  ///< AMD64 / Intel 64

    std::string vendor;          ///< CPUID vendor string
    std::string brand;           ///< Processor brand string, may be empty

    /**
     * @brief Detect CPU identification using CPUID
     * @return Populated CPUFeatures struct (all false off x86)
     */
    static CPUFeatures detect() noexcept;

    /**
     * @brief Get human-readable feature string
     * @return Space-separated feature names
     */
    std::string to_string() const;
};

/**
 * @brief Source of the microarchitecture tier
 */
class CpuClassifier {
public:
    virtual ~CpuClassifier() = default;

    /**
     * @brief Classify the CPU
     * @throws UnknownCpuError if the CPU cannot be mapped to a tier
     */
    virtual Tier classify() const = 0;

    /**
     * @brief Free-form model description for status output
     */
    virtual std::string model_string() const = 0;
};

/**
 * @brief Default classifier based on CPUID family/model/feature bits
 */
class CpuidClassifier : public CpuClassifier {
public:
    CpuidClassifier();
    explicit CpuidClassifier(const CPUFeatures& features);

    Tier classify() const override;
    std::string model_string() const override;

    /// Pure mapping from detected features to a tier
    static Tier classify(const CPUFeatures& features);

private:
    CPUFeatures features_;
};

/// Placeholder used when no model description is available
constexpr const char* kUnrecognizedCpu = "unrecognized";

/**
 * @brief Model description, or kUnrecognizedCpu if the classifier fails
 */
std::string describe_model(const CpuClassifier& classifier);

/**
 * @brief Tier for a platform, or empty when unknown
 *
 * x86 asks the classifier (any classification failure yields empty);
 * ARM always maps to Tier::Arm; PowerPC maps to Tier::Ppc except on
 * macOS, whose PowerPC libraries are universal binaries.
 */
std::optional<Tier> resolve_tier(const CpuClassifier& classifier,
                                 const PlatformProfile& profile);

} // namespace cpu
} // namespace accelbn

#endif // ACCELBN_CORE_CPU_FEATURES_H
