/**
 * @file candidate_names.h
 * @brief Ordered fallback list of bundled acceleration library names
 *
 * Bundled names follow "<prefix><stem>-<os>-<tier><suffix>", for example
 * "libaccelbn_native-linux-corei_64.so". The list is ordered most specific
 * first and is the load order: the loader stops at the first success.
 *
 * Load order (Linux naming, 64-bit, tier "xxx"):
 *   - xxx_64
 *   - athlon64_64
 *   - xxxv7 ... xxxv3 (ARM only, from the detected revision down)
 *   - xxx
 *   - equivalence fallbacks of xxx (e.g. core2 for corei)
 *   - athlon64
 *   - athlon
 *   - none_64
 *   - none (not on ARM, PowerPC or macOS)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_CANDIDATE_NAMES_H
#define ACCELBN_LOADER_CANDIDATE_NAMES_H

#include "accelbn/core/config.h"
#include "accelbn/core/cpu_features.h"
#include "accelbn/core/platform.h"

#include <optional>
#include <string>
#include <vector>

namespace accelbn {
namespace loader {

/// Lowest ARM revision probed with a "v<N>" name
constexpr int kMinArmRevision = 3;

/// Tier tag of the unoptimized build
constexpr const char* kNoOptimizationTag = "none";

/// Tag suffix of 64-bit builds
constexpr const char* k64BitTagSuffix = "_64";

/**
 * @brief Platforms a rule applies to
 *
 * Empty lists and an unset arch mean "any".
 */
struct PlatformMatch {
    std::vector<OsFamily> only_os;
    std::vector<OsFamily> except_os;
    std::optional<ArchFamily> arch;

    bool matches(const PlatformProfile& profile) const;
};

enum class RuleKind {
    Substitute,  ///< Use `to` instead of `from` (the libraries are identical)
    Fallback     ///< Try `to` right after `from`
};

/**
 * @brief Binary equivalence between two tiers on some platforms
 *
 * These encode facts about one set of prebuilt libraries; supply a
 * different table when packaging a different set.
 */
struct EquivalenceRule {
    RuleKind kind;
    cpu::Tier from;
    cpu::Tier to;
    PlatformMatch when;
};

/**
 * @brief Equivalences of the stock prebuilt library set
 */
const std::vector<EquivalenceRule>& default_equivalence_rules();

class CandidateNameGenerator {
public:
    explicit CandidateNameGenerator(std::string stem = kDefaultLibraryStem);
    CandidateNameGenerator(std::string stem, std::vector<EquivalenceRule> rules);

    /**
     * @brief Generate the ordered, duplicate-free candidate list
     * @param profile Target platform
     * @param tier Detected tier, empty if unknown
     * @param arm_revision Architecture revision (ARM only, 0 if unknown)
     */
    std::vector<std::string> generate(const PlatformProfile& profile,
                                      std::optional<cpu::Tier> tier,
                                      int arm_revision = 0) const;

    /**
     * @brief Tier after substitution rules are applied
     */
    std::optional<cpu::Tier> effective_tier(const PlatformProfile& profile,
                                            std::optional<cpu::Tier> tier) const;

    /**
     * @brief Full candidate name for a tag such as "corei_64"
     */
    std::string candidate_name(const PlatformProfile& profile, const std::string& tag) const;

    const std::string& stem() const { return stem_; }

private:
    std::string stem_;
    std::vector<EquivalenceRule> rules_;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_CANDIDATE_NAMES_H
