/**
 * @file platform.cpp
 * @brief Platform profile detection and cpuinfo parsing
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/core/platform.h"
#include "accelbn/core/common.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>

namespace accelbn {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

OsFamily host_os() {
#if defined(ACCELBN_PLATFORM_WINDOWS)
    return OsFamily::Windows;
#elif defined(ACCELBN_PLATFORM_ANDROID)
    return OsFamily::Android;
#elif defined(ACCELBN_PLATFORM_LINUX)
    return OsFamily::Linux;
#elif defined(ACCELBN_PLATFORM_MACOS)
    return OsFamily::MacOS;
#elif defined(ACCELBN_PLATFORM_KFREEBSD)
    return OsFamily::KFreeBSD;
#elif defined(ACCELBN_PLATFORM_FREEBSD)
    return OsFamily::FreeBSD;
#elif defined(ACCELBN_PLATFORM_NETBSD)
    return OsFamily::NetBSD;
#elif defined(ACCELBN_PLATFORM_OPENBSD)
    return OsFamily::OpenBSD;
#elif defined(ACCELBN_PLATFORM_SOLARIS)
    return OsFamily::Solaris;
#elif defined(ACCELBN_PLATFORM_OS2)
    return OsFamily::OS2;
#else
    return OsFamily::Unknown;
#endif
}

ArchFamily host_arch() {
#if defined(ACCELBN_ARCH_X86)
    return ArchFamily::X86;
#elif defined(ACCELBN_ARCH_ARM)
    return ArchFamily::Arm;
#elif defined(ACCELBN_ARCH_PPC)
    return ArchFamily::Ppc;
#else
    return ArchFamily::Other;
#endif
}

} // anonymous namespace

const char* os_family_name(OsFamily os) {
    switch (os) {
        case OsFamily::Windows:  return "Windows";
        case OsFamily::Linux:    return "Linux";
        case OsFamily::Android:  return "Android";
        case OsFamily::MacOS:    return "macOS";
        case OsFamily::FreeBSD:  return "FreeBSD";
        case OsFamily::KFreeBSD: return "GNU/kFreeBSD";
        case OsFamily::NetBSD:   return "NetBSD";
        case OsFamily::OpenBSD:  return "OpenBSD";
        case OsFamily::Solaris:  return "Solaris";
        case OsFamily::OS2:      return "OS/2";
        case OsFamily::Unknown:  break;
    }
    return "Unknown";
}

const char* arch_family_name(ArchFamily arch) {
    switch (arch) {
        case ArchFamily::X86: return "x86";
        case ArchFamily::Arm: return "arm";
        case ArchFamily::Ppc: return "ppc";
        case ArchFamily::Other: break;
    }
    return "other";
}

// ============================================================================
// PlatformProfile
// ============================================================================

PlatformProfile::PlatformProfile(OsFamily os, bool is_64bit, ArchFamily arch)
    : os_(os), is_64bit_(is_64bit), arch_(arch) {
    const bool dos_style = (os == OsFamily::Windows || os == OsFamily::OS2);
    prefix_ = dos_style ? "" : "lib";
    if (dos_style) {
        suffix_ = ".dll";
    } else if (os == OsFamily::MacOS) {
        suffix_ = ".dylib";
    } else {
        suffix_ = ".so";
    }
}

PlatformProfile PlatformProfile::make(OsFamily os, bool is_64bit, ArchFamily arch) {
    return PlatformProfile(os, is_64bit, arch);
}

const PlatformProfile& PlatformProfile::host() {
    static const PlatformProfile profile(host_os(), sizeof(void*) == 8, host_arch());
    return profile;
}

const char* PlatformProfile::os_tag() const {
    switch (os_) {
        case OsFamily::Windows:  return "windows";
        case OsFamily::KFreeBSD: return "kfreebsd";
        case OsFamily::FreeBSD:  return "freebsd";
        case OsFamily::NetBSD:   return "netbsd";
        case OsFamily::OpenBSD:  return "openbsd";
        case OsFamily::MacOS:    return "osx";
        case OsFamily::OS2:      return "os2";
        case OsFamily::Solaris:  return "solaris";
        default:
            break;
    }
    return "linux";
}

std::string PlatformProfile::library_file_name(const std::string& stem) const {
    return prefix_ + stem + suffix_;
}

std::string PlatformProfile::to_string() const {
    std::string result = os_family_name(os_);
    result += is_64bit_ ? " 64-bit " : " 32-bit ";
    result += arch_family_name(arch_);
    return result;
}

// ============================================================================
// cpuinfo
// ============================================================================

CpuInfoTable parse_cpu_info(std::istream& in) {
    CpuInfoTable table;
    std::string line;
    while (std::getline(in, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = to_lower(trim(line.substr(0, colon)));
        // emplace keeps the first occurrence (first core on SMP listings)
        table.emplace(key, trim(line.substr(colon + 1)));
    }
    return table;
}

CpuInfoTable read_cpu_info() {
    std::ifstream in("/proc/cpuinfo");
    if (!in) {
        return CpuInfoTable();
    }
    return parse_cpu_info(in);
}

int arm_architecture_revision(const CpuInfoTable& info) {
    auto proc = info.find("processor");
    if (proc != info.end() && proc->second.find("ARMv6") != std::string::npos) {
        // Raspberry Pi: "ARMv6-compatible processor rev 7 (v6l)" with architecture 7
        return 6;
    }
    auto arch = info.find("cpu architecture");
    if (arch != info.end() && !arch->second.empty() &&
        std::isdigit(static_cast<unsigned char>(arch->second[0]))) {
        return arch->second[0] - '0';
    }
    return 0;
}

} // namespace accelbn
