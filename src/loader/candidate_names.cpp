/**
 * @file candidate_names.cpp
 * @brief Candidate library name generation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/candidate_names.h"

#include <algorithm>
#include <utility>

namespace accelbn {
namespace loader {

namespace {

using cpu::Tier;

void append_unique(std::vector<std::string>& list, std::string name) {
    if (std::find(list.begin(), list.end(), name) == list.end()) {
        list.push_back(std::move(name));
    }
}

bool contains(const std::vector<OsFamily>& list, OsFamily os) {
    return std::find(list.begin(), list.end(), os) != list.end();
}

} // anonymous namespace

bool PlatformMatch::matches(const PlatformProfile& profile) const {
    if (!only_os.empty() && !contains(only_os, profile.os_family())) {
        return false;
    }
    if (contains(except_os, profile.os_family())) {
        return false;
    }
    if (arch && *arch != profile.arch_family()) {
        return false;
    }
    return true;
}

const std::vector<EquivalenceRule>& default_equivalence_rules() {
    static const std::vector<EquivalenceRule> rules = {
        // k62 and k63 builds are identical except on Windows
        {RuleKind::Substitute, Tier::K63, Tier::K62, {{}, {OsFamily::Windows}, std::nullopt}},
        // pentium2 and pentium3 builds are identical on x86 Solaris
        {RuleKind::Substitute, Tier::Pentium2, Tier::Pentium3, {{OsFamily::Solaris}, {}, ArchFamily::X86}},
        // every viac32 build is identical to pentium3
        {RuleKind::Substitute, Tier::ViaC32, Tier::Pentium3, {}},
        {RuleKind::Fallback, Tier::CoreI, Tier::Core2, {}},
        {RuleKind::Fallback, Tier::Atom, Tier::Pentium3, {}},
        {RuleKind::Fallback, Tier::PentiumM, Tier::Pentium3, {}},
        // GMP configures geode like a k6-3; pentium3 is the better backup
        {RuleKind::Fallback, Tier::Geode, Tier::Pentium3, {}},
    };
    return rules;
}

// ============================================================================
// CandidateNameGenerator
// ============================================================================

CandidateNameGenerator::CandidateNameGenerator(std::string stem)
    : CandidateNameGenerator(std::move(stem), default_equivalence_rules()) {}

CandidateNameGenerator::CandidateNameGenerator(std::string stem, std::vector<EquivalenceRule> rules)
    : stem_(std::move(stem)), rules_(std::move(rules)) {}

std::string CandidateNameGenerator::candidate_name(const PlatformProfile& profile,
                                                   const std::string& tag) const {
    return profile.library_prefix() + stem_ + "-" + profile.os_tag() + "-" + tag +
           profile.library_suffix();
}

std::optional<Tier> CandidateNameGenerator::effective_tier(const PlatformProfile& profile,
                                                           std::optional<Tier> tier) const {
    if (!tier) {
        return tier;
    }
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::Substitute && rule.from == *tier && rule.when.matches(profile)) {
            return rule.to;
        }
    }
    return tier;
}

std::vector<std::string> CandidateNameGenerator::generate(const PlatformProfile& profile,
                                                          std::optional<Tier> tier,
                                                          int arm_revision) const {
    std::vector<std::string> list;
    if (profile.os_family() == OsFamily::Android) {
        return list;
    }

    const bool is64 = profile.is_64bit();
    const std::string universal64 = cpu::tier_name(Tier::Athlon64);
    auto add = [&](const std::string& tag) { append_unique(list, candidate_name(profile, tag)); };

    const std::optional<Tier> primary = effective_tier(profile, tier);
    if (primary) {
        const std::string name = cpu::tier_name(*primary);
        if (is64) {
            if (*primary != Tier::Athlon64) {
                add(name + k64BitTagSuffix);
            }
            add(universal64 + k64BitTagSuffix);
        }

        if (profile.arch_family() == ArchFamily::Arm) {
            for (int v = arm_revision; v >= kMinArmRevision; --v) {
                add(name + "v" + std::to_string(v));
            }
        }

        add(name);

        for (const auto& rule : rules_) {
            if (rule.kind == RuleKind::Fallback && rule.from == *primary &&
                rule.when.matches(profile)) {
                add(cpu::tier_name(rule.to));
            }
        }

        if (is64) {
            add(universal64);
            add(cpu::tier_name(Tier::Athlon));
        }
    } else if (is64) {
        add(universal64 + k64BitTagSuffix);
        add(universal64);
    }

    if (is64) {
        add(std::string(kNoOptimizationTag) + k64BitTagSuffix);
    }
    // The macOS "none" build is a universal binary; ARM and PowerPC have none
    if (profile.arch_family() != ArchFamily::Arm && profile.arch_family() != ArchFamily::Ppc &&
        profile.os_family() != OsFamily::MacOS) {
        add(kNoOptimizationTag);
    }
    return list;
}

} // namespace loader
} // namespace accelbn
