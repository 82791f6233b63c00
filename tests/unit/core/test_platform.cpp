/**
 * @file test_platform.cpp
 * @brief Platform profile, cpuinfo parsing and CPU tier classification tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "accelbn/core/cpu_features.h"
#include "accelbn/core/errors.h"
#include "accelbn/core/platform.h"

using accelbn::ArchFamily;
using accelbn::OsFamily;
using accelbn::PlatformProfile;
using accelbn::cpu::CPUFeatures;
using accelbn::cpu::CpuidClassifier;
using accelbn::cpu::Tier;

// ============================================================================
// PlatformProfile
// ============================================================================

TEST(PlatformProfileTest, NamingConventions) {
    auto linux64 = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::X86);
    EXPECT_EQ(linux64.library_prefix(), "lib");
    EXPECT_EQ(linux64.library_suffix(), ".so");
    EXPECT_STREQ(linux64.os_tag(), "linux");
    EXPECT_EQ(linux64.library_file_name("accelbn_native"), "libaccelbn_native.so");

    auto windows = PlatformProfile::make(OsFamily::Windows, false, ArchFamily::X86);
    EXPECT_EQ(windows.library_prefix(), "");
    EXPECT_EQ(windows.library_suffix(), ".dll");
    EXPECT_STREQ(windows.os_tag(), "windows");

    auto os2 = PlatformProfile::make(OsFamily::OS2, false, ArchFamily::X86);
    EXPECT_EQ(os2.library_prefix(), "");
    EXPECT_EQ(os2.library_suffix(), ".dll");

    auto mac = PlatformProfile::make(OsFamily::MacOS, true, ArchFamily::X86);
    EXPECT_EQ(mac.library_prefix(), "lib");
    EXPECT_EQ(mac.library_suffix(), ".dylib");
    EXPECT_STREQ(mac.os_tag(), "osx");
}

TEST(PlatformProfileTest, UnknownOsUsesCommonConvention) {
    auto unknown = PlatformProfile::make(OsFamily::Unknown, true, ArchFamily::Other);
    EXPECT_EQ(unknown.library_prefix(), "lib");
    EXPECT_EQ(unknown.library_suffix(), ".so");
    EXPECT_STREQ(unknown.os_tag(), "linux");
}

TEST(PlatformProfileTest, OsTags) {
    EXPECT_STREQ(PlatformProfile::make(OsFamily::FreeBSD, true, ArchFamily::X86).os_tag(), "freebsd");
    EXPECT_STREQ(PlatformProfile::make(OsFamily::KFreeBSD, true, ArchFamily::X86).os_tag(), "kfreebsd");
    EXPECT_STREQ(PlatformProfile::make(OsFamily::NetBSD, true, ArchFamily::X86).os_tag(), "netbsd");
    EXPECT_STREQ(PlatformProfile::make(OsFamily::OpenBSD, true, ArchFamily::X86).os_tag(), "openbsd");
    EXPECT_STREQ(PlatformProfile::make(OsFamily::Solaris, true, ArchFamily::X86).os_tag(), "solaris");
}

TEST(PlatformProfileTest, HostIsStable) {
    const PlatformProfile& a = PlatformProfile::host();
    const PlatformProfile& b = PlatformProfile::host();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.is_64bit(), sizeof(void*) == 8);
    EXPECT_FALSE(a.to_string().empty());
}

// ============================================================================
// cpuinfo
// ============================================================================

TEST(CpuInfoTest, ParsesFirstOccurrence) {
    std::istringstream in(
        "processor\t: 0\n"
        "CPU architecture: 7\n"
        "Features\t: half thumb fastmult vfp edsp neon\n"
        "\n"
        "processor\t: 1\n"
        "CPU architecture: 8\n");
    auto table = accelbn::parse_cpu_info(in);
    EXPECT_EQ(table["processor"], "0");
    EXPECT_EQ(table["cpu architecture"], "7");
    EXPECT_EQ(accelbn::arm_architecture_revision(table), 7);
}

TEST(CpuInfoTest, ArmV6ProcessorOverridesArchitecture) {
    std::istringstream in(
        "Processor\t: ARMv6-compatible processor rev 7 (v6l)\n"
        "CPU architecture: 7\n");
    auto table = accelbn::parse_cpu_info(in);
    EXPECT_EQ(accelbn::arm_architecture_revision(table), 6);
}

TEST(CpuInfoTest, UnknownRevisionIsZero) {
    std::istringstream in("model name\t: Intel(R) Core(TM) i7\n");
    auto table = accelbn::parse_cpu_info(in);
    EXPECT_EQ(accelbn::arm_architecture_revision(table), 0);

    std::istringstream bad("CPU architecture: AArch64\n");
    EXPECT_EQ(accelbn::arm_architecture_revision(accelbn::parse_cpu_info(bad)), 0);
}

// ============================================================================
// CPU classification
// ============================================================================

namespace {

CPUFeatures intel(uint32_t family, uint32_t model) {
    CPUFeatures f;
    f.is_intel = true;
    f.vendor = "GenuineIntel";
    f.family = family;
    f.model = model;
    return f;
}

CPUFeatures amd(uint32_t family, uint32_t model) {
    CPUFeatures f;
    f.is_amd = true;
    f.vendor = "AuthenticAMD";
    f.family = family;
    f.model = model;
    return f;
}

class FixedClassifier : public accelbn::cpu::CpuClassifier {
public:
    explicit FixedClassifier(bool known) : known_(known) {}
    Tier classify() const override {
        if (!known_) {
            throw accelbn::UnknownCpuError("test cpu");
        }
        return Tier::Core2;
    }
    std::string model_string() const override { return "test"; }

private:
    bool known_;
};

class BrokenClassifier : public accelbn::cpu::CpuClassifier {
public:
    Tier classify() const override { throw std::runtime_error("cpuid failed"); }
    std::string model_string() const override { throw std::runtime_error("cpuid failed"); }
};

} // anonymous namespace

TEST(CpuClassifierTest, IntelTiers) {
    auto p5 = intel(5, 4);
    EXPECT_EQ(CpuidClassifier::classify(p5), Tier::Pentium);
    p5.has_mmx = true;
    EXPECT_EQ(CpuidClassifier::classify(p5), Tier::PentiumMMX);

    EXPECT_EQ(CpuidClassifier::classify(intel(15, 2)), Tier::Pentium4);

    auto nehalem = intel(6, 0x1A);
    nehalem.has_sse = nehalem.has_ssse3 = nehalem.has_sse42 = true;
    EXPECT_EQ(CpuidClassifier::classify(nehalem), Tier::CoreI);

    auto merom = intel(6, 0x0F);
    merom.has_sse = merom.has_ssse3 = true;
    EXPECT_EQ(CpuidClassifier::classify(merom), Tier::Core2);

    auto atom = intel(6, 0x1C);
    atom.has_sse = atom.has_ssse3 = true;
    EXPECT_EQ(CpuidClassifier::classify(atom), Tier::Atom);

    auto dothan = intel(6, 13);
    dothan.has_sse = true;
    EXPECT_EQ(CpuidClassifier::classify(dothan), Tier::PentiumM);

    auto katmai = intel(6, 7);
    katmai.has_mmx = katmai.has_sse = true;
    EXPECT_EQ(CpuidClassifier::classify(katmai), Tier::Pentium3);

    auto klamath = intel(6, 3);
    klamath.has_mmx = true;
    EXPECT_EQ(CpuidClassifier::classify(klamath), Tier::Pentium2);
}

TEST(CpuClassifierTest, AmdTiers) {
    auto k8 = amd(15, 5);
    k8.has_long_mode = true;
    EXPECT_EQ(CpuidClassifier::classify(k8), Tier::Athlon64);
    EXPECT_EQ(CpuidClassifier::classify(amd(6, 4)), Tier::Athlon);
    EXPECT_EQ(CpuidClassifier::classify(amd(5, 10)), Tier::Geode);
    EXPECT_EQ(CpuidClassifier::classify(amd(5, 9)), Tier::K63);
    EXPECT_EQ(CpuidClassifier::classify(amd(5, 8)), Tier::K62);
    EXPECT_EQ(CpuidClassifier::classify(amd(5, 6)), Tier::K6);
    EXPECT_THROW(CpuidClassifier::classify(amd(4, 0)), accelbn::UnknownCpuError);
}

TEST(CpuClassifierTest, ViaTiers) {
    CPUFeatures via;
    via.is_via = true;
    via.vendor = "CentaurHauls";
    via.family = 6;
    via.model = 9;
    EXPECT_EQ(CpuidClassifier::classify(via), Tier::ViaC3);
    via.has_sse = true;
    EXPECT_EQ(CpuidClassifier::classify(via), Tier::ViaC32);
    via.model = 15;
    EXPECT_EQ(CpuidClassifier::classify(via), Tier::Nano);
}

TEST(CpuClassifierTest, UnknownVendorThrows) {
    CPUFeatures none;
    EXPECT_THROW(CpuidClassifier::classify(none), accelbn::UnknownCpuError);
    none.vendor = "HygonGenuine";
    EXPECT_THROW(CpuidClassifier::classify(none), accelbn::UnknownCpuError);
}

TEST(CpuClassifierTest, ResolveTierPerArchitecture) {
    FixedClassifier known(true);
    FixedClassifier unknown(false);

    auto x86 = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::X86);
    EXPECT_EQ(accelbn::cpu::resolve_tier(known, x86), Tier::Core2);
    EXPECT_FALSE(accelbn::cpu::resolve_tier(unknown, x86).has_value());

    auto arm = PlatformProfile::make(OsFamily::Linux, false, ArchFamily::Arm);
    EXPECT_EQ(accelbn::cpu::resolve_tier(unknown, arm), Tier::Arm);

    auto ppc = PlatformProfile::make(OsFamily::Linux, false, ArchFamily::Ppc);
    EXPECT_EQ(accelbn::cpu::resolve_tier(unknown, ppc), Tier::Ppc);

    auto mac_ppc = PlatformProfile::make(OsFamily::MacOS, false, ArchFamily::Ppc);
    EXPECT_FALSE(accelbn::cpu::resolve_tier(known, mac_ppc).has_value());

    auto other = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::Other);
    EXPECT_FALSE(accelbn::cpu::resolve_tier(known, other).has_value());
}

TEST(CpuClassifierTest, AnyClassifierFailureIsUnknown) {
    BrokenClassifier broken;
    auto x86 = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::X86);
    EXPECT_FALSE(accelbn::cpu::resolve_tier(broken, x86).has_value());
    EXPECT_EQ(accelbn::cpu::describe_model(broken), "unrecognized");

    FixedClassifier known(true);
    EXPECT_EQ(accelbn::cpu::describe_model(known), "test");
}

TEST(CpuClassifierTest, TierNames) {
    EXPECT_STREQ(accelbn::cpu::tier_name(Tier::CoreI), "corei");
    EXPECT_STREQ(accelbn::cpu::tier_name(Tier::Athlon64), "athlon64");
    EXPECT_STREQ(accelbn::cpu::tier_name(Tier::PentiumMMX), "pentiummmx");
    EXPECT_STREQ(accelbn::cpu::tier_name(Tier::ViaC32), "viac32");
}
