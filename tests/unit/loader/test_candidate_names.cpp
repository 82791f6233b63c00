/**
 * @file test_candidate_names.cpp
 * @brief Candidate library name generation tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "accelbn/loader/candidate_names.h"
#include "accelbn/loader/library_loader.h"

using accelbn::ArchFamily;
using accelbn::OsFamily;
using accelbn::PlatformProfile;
using accelbn::cpu::Tier;
using accelbn::loader::CandidateNameGenerator;

namespace {

/// Expands tags into full Linux names for the default stem
std::vector<std::string> linux_names(const std::vector<std::string>& tags) {
    std::vector<std::string> names;
    for (const auto& tag : tags) {
        names.push_back("libaccelbn_native-linux-" + tag + ".so");
    }
    return names;
}

} // anonymous namespace

class CandidateNamesTest : public ::testing::Test {
protected:
    CandidateNameGenerator names_{"accelbn_native"};
    PlatformProfile linux64_ = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::X86);
    PlatformProfile linux32_ = PlatformProfile::make(OsFamily::Linux, false, ArchFamily::X86);
};

TEST_F(CandidateNamesTest, CoreI64Bit) {
    EXPECT_EQ(names_.generate(linux64_, Tier::CoreI),
              linux_names({"corei_64", "athlon64_64", "corei", "core2", "athlon64", "athlon",
                           "none_64", "none"}));
}

TEST_F(CandidateNamesTest, CoreI32Bit) {
    EXPECT_EQ(names_.generate(linux32_, Tier::CoreI), linux_names({"corei", "core2", "none"}));
}

TEST_F(CandidateNamesTest, Athlon64IsNotRepeated) {
    EXPECT_EQ(names_.generate(linux64_, Tier::Athlon64),
              linux_names({"athlon64_64", "athlon64", "athlon", "none_64", "none"}));
}

TEST_F(CandidateNamesTest, UnknownTier) {
    EXPECT_EQ(names_.generate(linux64_, std::nullopt),
              linux_names({"athlon64_64", "athlon64", "none_64", "none"}));
    EXPECT_EQ(names_.generate(linux32_, std::nullopt), linux_names({"none"}));
}

TEST_F(CandidateNamesTest, SubstitutionRules) {
    EXPECT_EQ(names_.generate(linux32_, Tier::K63), linux_names({"k62", "none"}));
    EXPECT_EQ(names_.generate(linux32_, Tier::ViaC32), linux_names({"pentium3", "none"}));
    EXPECT_EQ(names_.generate(linux32_, Tier::Pentium2), linux_names({"pentium2", "none"}));

    auto windows = PlatformProfile::make(OsFamily::Windows, false, ArchFamily::X86);
    EXPECT_EQ(names_.generate(windows, Tier::K63),
              (std::vector<std::string>{"accelbn_native-windows-k63.dll",
                                        "accelbn_native-windows-none.dll"}));

    auto solaris = PlatformProfile::make(OsFamily::Solaris, false, ArchFamily::X86);
    EXPECT_EQ(names_.generate(solaris, Tier::Pentium2),
              (std::vector<std::string>{"libaccelbn_native-solaris-pentium3.so",
                                        "libaccelbn_native-solaris-none.so"}));
}

TEST_F(CandidateNamesTest, FallbackRules) {
    EXPECT_EQ(names_.generate(linux32_, Tier::Atom), linux_names({"atom", "pentium3", "none"}));
    EXPECT_EQ(names_.generate(linux32_, Tier::PentiumM),
              linux_names({"pentiumm", "pentium3", "none"}));
    EXPECT_EQ(names_.generate(linux32_, Tier::Geode), linux_names({"geode", "pentium3", "none"}));
    EXPECT_EQ(names_.generate(linux32_, Tier::Core2), linux_names({"core2", "none"}));
}

TEST_F(CandidateNamesTest, ArmRevisions) {
    auto arm = PlatformProfile::make(OsFamily::Linux, false, ArchFamily::Arm);
    EXPECT_EQ(names_.generate(arm, Tier::Arm, 7),
              linux_names({"armv7", "armv6", "armv5", "armv4", "armv3", "arm"}));
    EXPECT_EQ(names_.generate(arm, Tier::Arm, 0), linux_names({"arm"}));
}

TEST_F(CandidateNamesTest, PpcHasNoGenericBuild) {
    auto ppc = PlatformProfile::make(OsFamily::Linux, false, ArchFamily::Ppc);
    EXPECT_EQ(names_.generate(ppc, Tier::Ppc), linux_names({"ppc"}));
}

TEST_F(CandidateNamesTest, MacOSUniversalBinary) {
    auto mac = PlatformProfile::make(OsFamily::MacOS, true, ArchFamily::X86);
    std::vector<std::string> expected;
    for (const char* tag : {"core2_64", "athlon64_64", "core2", "athlon64", "athlon", "none_64"}) {
        expected.push_back(std::string("libaccelbn_native-osx-") + tag + ".dylib");
    }
    EXPECT_EQ(names_.generate(mac, Tier::Core2), expected);
}

TEST_F(CandidateNamesTest, AndroidHasNoCandidates) {
    auto android = PlatformProfile::make(OsFamily::Android, false, ArchFamily::Arm);
    EXPECT_TRUE(names_.generate(android, Tier::Arm, 7).empty());
}

TEST_F(CandidateNamesTest, CustomRuleTable) {
    CandidateNameGenerator plain("accelbn_native", {});
    EXPECT_EQ(plain.generate(linux32_, Tier::CoreI), linux_names({"corei", "none"}));
    EXPECT_EQ(plain.generate(linux32_, Tier::K63), linux_names({"k63", "none"}));
}

TEST_F(CandidateNamesTest, NamesAreUnique) {
    for (int t = static_cast<int>(Tier::K6); t <= static_cast<int>(Tier::PentiumM); ++t) {
        auto list = names_.generate(linux64_, static_cast<Tier>(t));
        std::vector<std::string> sorted = list;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_EQ(std::unique(sorted.begin(), sorted.end()), sorted.end())
            << accelbn::cpu::tier_name(static_cast<Tier>(t));
        EXPECT_EQ(list.back(), "libaccelbn_native-linux-none.so");
    }
}

TEST(ResourceListTest, PreferredResourceComesFirst) {
    accelbn::Config config;
    config.preferred_resource = "libaccelbn_native-linux-core2.so";
    accelbn::loader::LibraryLoader loader(
        config, PlatformProfile::make(OsFamily::Linux, false, ArchFamily::X86), nullptr);
    EXPECT_EQ(loader.resource_list(Tier::CoreI, 0),
              linux_names({"core2", "corei", "none"}));
}
