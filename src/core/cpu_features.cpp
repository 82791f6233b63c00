/**
 * @file cpu_features.cpp
 * @brief CPU Identification and Tier Classification
 * 
 * Reads vendor, family/model and feature bits with the CPUID instruction
 * and maps them onto the acceleration library optimization tiers.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/core/cpu_features.h"
#include "accelbn/core/errors.h"
#include <cstdint>
#include <cstring>
#include <exception>

#if defined(_MSC_VER)
    #include <intrin.h>
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(__x86_64__) || defined(__i386__)
        #include <cpuid.h>
    #endif
#endif

namespace accelbn {
namespace cpu {

namespace {

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#define ACCELBN_HAS_CPUID 1

/**
 * @brief x86 CPUID wrapper
 * @param leaf CPUID function (EAX input)
 * @param subleaf CPUID sub-function (ECX input)
 * @param regs Output: [EAX, EBX, ECX, EDX]
 */
static inline void cpuid(uint32_t leaf, uint32_t subleaf, uint32_t regs[4]) {
#if defined(_MSC_VER)
    __cpuidex(reinterpret_cast<int*>(regs), static_cast<int>(leaf), static_cast<int>(subleaf));
#elif defined(__GNUC__) || defined(__clang__)
    __cpuid_count(leaf, subleaf, regs[0], regs[1], regs[2], regs[3]);
#else
    std::memset(regs, 0, 4 * sizeof(uint32_t));
#endif
}
#endif

bool is_atom_model(uint32_t model) {
    switch (model) {
        case 0x1C: case 0x26: case 0x27: case 0x35: case 0x36:
        case 0x37: case 0x4A: case 0x4D: case 0x5A: case 0x5D:
            return true;
        default:
            return false;
    }
}

Tier classify_intel(const CPUFeatures& f) {
    if (f.family == 5) {
        return f.has_mmx ? Tier::PentiumMMX : Tier::Pentium;
    }
    if (f.family == 15) {
        return Tier::Pentium4;
    }
    if (f.family >= 6) {
        if (is_atom_model(f.model)) return Tier::Atom;
        if (f.has_sse42) return Tier::CoreI;
        if (f.has_ssse3) return Tier::Core2;
        if (f.model == 9 || f.model == 13) return Tier::PentiumM;
        if (f.has_sse) return Tier::Pentium3;
        if (f.has_mmx) return Tier::Pentium2;
        return Tier::Pentium;
    }
    throw UnknownCpuError("unsupported Intel family " + std::to_string(f.family));
}

Tier classify_amd(const CPUFeatures& f) {
    if (f.has_long_mode) {
        return Tier::Athlon64;
    }
    if (f.family >= 6) {
        return Tier::Athlon;
    }
    if (f.family == 5) {
        switch (f.model) {
            case 10:          return Tier::Geode;
            case 9: case 13:  return Tier::K63;
            case 8:           return Tier::K62;
            case 6: case 7:   return Tier::K6;
            default:          break;
        }
    }
    throw UnknownCpuError("unsupported AMD family " + std::to_string(f.family) +
                          " model " + std::to_string(f.model));
}

Tier classify_via(const CPUFeatures& f) {
    if (f.family == 6 && f.model >= 15) {
        return Tier::Nano;
    }
    if (f.family == 6 && f.has_sse) {
        return Tier::ViaC32;
    }
    if (f.family == 6) {
        return Tier::ViaC3;
    }
    throw UnknownCpuError("unsupported VIA family " + std::to_string(f.family));
}

} // anonymous namespace

const char* tier_name(Tier tier) {
    switch (tier) {
        case Tier::K6:         return "k6";
        case Tier::K62:        return "k62";
        case Tier::K63:        return "k63";
        case Tier::Athlon:     return "athlon";
        case Tier::Athlon64:   return "athlon64";
        case Tier::Pentium:    return "pentium";
        case Tier::PentiumMMX: return "pentiummmx";
        case Tier::Pentium2:   return "pentium2";
        case Tier::Pentium3:   return "pentium3";
        case Tier::Pentium4:   return "pentium4";
        case Tier::ViaC3:      return "viac3";
        case Tier::ViaC32:     return "viac32";
        case Tier::Atom:       return "atom";
        case Tier::Core2:      return "core2";
        case Tier::CoreI:      return "corei";
        case Tier::Geode:      return "geode";
        case Tier::Nano:       return "nano";
        case Tier::PentiumM:   return "pentiumm";
        case Tier::Arm:        return "arm";
        case Tier::Ppc:        return "ppc";
    }
    return "none";
}

/**
 * @brief Detect CPU identification using CPUID
 */
CPUFeatures CPUFeatures::detect() noexcept {
    CPUFeatures features{};

#if defined(ACCELBN_HAS_CPUID)
    uint32_t regs[4];

    // Vendor and highest basic leaf (Leaf 0)
    cpuid(0, 0, regs);
    const uint32_t max_leaf = regs[0];
    char vendor[13] = {0};
    std::memcpy(vendor, &regs[1], 4);     // EBX
    std::memcpy(vendor + 4, &regs[3], 4); // EDX
    std::memcpy(vendor + 8, &regs[2], 4); // ECX
    features.vendor = vendor;

    if (std::strcmp(vendor, "GenuineIntel") == 0) {
        features.is_intel = true;
    } else if (std::strcmp(vendor, "AuthenticAMD") == 0) {
        features.is_amd = true;
    } else if (std::strcmp(vendor, "CentaurHauls") == 0) {
        features.is_via = true;
    }

    if (max_leaf >= 1) {
        // Signature and basic features (Leaf 1)
        cpuid(1, 0, regs);
        const uint32_t base_family = (regs[0] >> 8) & 0xF;
        const uint32_t base_model  = (regs[0] >> 4) & 0xF;
        const uint32_t ext_family  = (regs[0] >> 20) & 0xFF;
        const uint32_t ext_model   = (regs[0] >> 16) & 0xF;
        features.family = base_family == 15 ? base_family + ext_family : base_family;
        features.model  = (base_family == 6 || base_family == 15)
                              ? (ext_model << 4) | base_model
                              : base_model;

        features.has_mmx   = (regs[3] & (1u << 23)) != 0;  // EDX bit 23
        features.has_sse   = (regs[3] & (1u << 25)) != 0;  // EDX bit 25
        features.has_sse2  = (regs[3] & (1u << 26)) != 0;  // EDX bit 26
        features.has_ssse3 = (regs[2] & (1u << 9))  != 0;  // ECX bit 9
        features.has_sse41 = (regs[2] & (1u << 19)) != 0;  // ECX bit 19
        features.has_sse42 = (regs[2] & (1u << 20)) != 0;  // ECX bit 20
    }

    // Extended leaves: long mode and brand string
    cpuid(0x80000000u, 0, regs);
    const uint32_t max_ext = regs[0];
    if (max_ext >= 0x80000001u) {
        cpuid(0x80000001u, 0, regs);
        features.has_long_mode = (regs[3] & (1u << 29)) != 0;  // EDX bit 29
    }
    if (max_ext >= 0x80000004u) {
        char brand[49] = {0};
        for (uint32_t i = 0; i < 3; ++i) {
            cpuid(0x80000002u + i, 0, regs);
            std::memcpy(brand + i * 16, regs, 16);
        }
        std::string s(brand);
        size_t first = s.find_first_not_of(' ');
        features.brand = first == std::string::npos ? std::string() : s.substr(first);
    }
#endif

    return features;
}

/**
 * @brief Get human-readable feature string
 */
std::string CPUFeatures::to_string() const {
    std::string result;

    if (is_intel) result += "Intel ";
    if (is_amd) result += "AMD ";
    if (is_via) result += "VIA ";
    if (family != 0) {
        result += "family " + std::to_string(family) + " model " + std::to_string(model) + " ";
    }

    if (has_mmx) result += "MMX ";
    if (has_sse) result += "SSE ";
    if (has_sse2) result += "SSE2 ";
    if (has_ssse3) result += "SSSE3 ";
    if (has_sse41) result += "SSE4.1 ";
    if (has_sse42) result += "SSE4.2 ";
    if (has_long_mode) result += "LM ";

    if (result.empty()) {
        return "Generic CPU";
    }

    // Remove trailing space
    result.pop_back();
    return result;
}

// ============================================================================
// CpuidClassifier
// ============================================================================

CpuidClassifier::CpuidClassifier() : features_(CPUFeatures::detect()) {}

CpuidClassifier::CpuidClassifier(const CPUFeatures& features) : features_(features) {}

Tier CpuidClassifier::classify() const {
    return classify(features_);
}

std::string CpuidClassifier::model_string() const {
    if (!features_.brand.empty()) {
        return features_.brand;
    }
    return features_.to_string();
}

Tier CpuidClassifier::classify(const CPUFeatures& features) {
    if (features.is_intel) return classify_intel(features);
    if (features.is_amd) return classify_amd(features);
    if (features.is_via) return classify_via(features);
    if (features.vendor.empty()) {
        throw UnknownCpuError("CPUID not available");
    }
    throw UnknownCpuError("unknown CPU vendor " + features.vendor);
}

std::string describe_model(const CpuClassifier& classifier) {
    try {
        return classifier.model_string();
    } catch (const std::exception&) {
        return kUnrecognizedCpu;
    }
}

std::optional<Tier> resolve_tier(const CpuClassifier& classifier,
                                 const PlatformProfile& profile) {
    switch (profile.arch_family()) {
        case ArchFamily::X86:
            try {
                return classifier.classify();
            } catch (const std::exception&) {
                return std::nullopt;
            }
        case ArchFamily::Arm:
            return Tier::Arm;
        case ArchFamily::Ppc:
            if (profile.os_family() == OsFamily::MacOS) {
                return std::nullopt;
            }
            return Tier::Ppc;
        case ArchFamily::Other:
            break;
    }
    return std::nullopt;
}

} // namespace cpu
} // namespace accelbn
