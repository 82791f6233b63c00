/**
 * @file platform.h
 * @brief Platform profile used to name and locate acceleration libraries
 *
 * The profile is computed once from compile-time platform macros and is
 * immutable afterwards. Tests construct arbitrary profiles with make().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_CORE_PLATFORM_H
#define ACCELBN_CORE_PLATFORM_H

#include <iosfwd>
#include <map>
#include <string>

namespace accelbn {

/**
 * @brief Operating system families with distinct library naming
 */
enum class OsFamily {
    Windows,
    Linux,
    Android,
    MacOS,
    FreeBSD,
    KFreeBSD,
    NetBSD,
    OpenBSD,
    Solaris,
    OS2,
    Unknown
};

/**
 * @brief Instruction set families
 */
enum class ArchFamily {
    X86,
    Arm,
    Ppc,
    Other
};

const char* os_family_name(OsFamily os);
const char* arch_family_name(ArchFamily arch);

/**
 * @brief Immutable description of the host platform
 */
class PlatformProfile {
public:
    /**
     * @brief Build a profile for an arbitrary platform
     *
     * Prefix and suffix are derived from the OS family.
     */
    static PlatformProfile make(OsFamily os, bool is_64bit, ArchFamily arch);

    /**
     * @brief Profile of the platform this library was compiled for
     */
    static const PlatformProfile& host();

    OsFamily os_family() const { return os_; }
    bool is_64bit() const { return is_64bit_; }
    ArchFamily arch_family() const { return arch_; }

    /// "lib" on Unix-like systems, empty on Windows and OS/2
    const std::string& library_prefix() const { return prefix_; }

    /// ".so", ".dylib" or ".dll"
    const std::string& library_suffix() const { return suffix_; }

    /**
     * @brief OS tag used inside bundled candidate names
     *
     * Unknown OS families (and Android) use the Linux convention.
     */
    const char* os_tag() const;

    /**
     * @brief File name of the library for a stem, e.g. "libstem.so"
     */
    std::string library_file_name(const std::string& stem) const;

    std::string to_string() const;

private:
    PlatformProfile(OsFamily os, bool is_64bit, ArchFamily arch);

    OsFamily os_;
    bool is_64bit_;
    ArchFamily arch_;
    std::string prefix_;
    std::string suffix_;
};

// ============================================================================
// Platform capability table (/proc/cpuinfo)
// ============================================================================

/// Keys are lower-cased and trimmed, values trimmed, first key wins
using CpuInfoTable = std::map<std::string, std::string>;

/**
 * @brief Parse "key : value" lines of a cpuinfo listing
 */
CpuInfoTable parse_cpu_info(std::istream& in);

/**
 * @brief Read /proc/cpuinfo; empty table if it cannot be read
 */
CpuInfoTable read_cpu_info();

/**
 * @brief ARM architecture revision from a cpuinfo table
 *
 * A "processor" entry mentioning ARMv6 yields 6 (ARMv6 cores report
 * architecture 7). Otherwise the leading digit of "cpu architecture",
 * e.g. "5TEJ" yields 5. Returns 0 when undetermined.
 */
int arm_architecture_revision(const CpuInfoTable& info);

} // namespace accelbn

#endif // ACCELBN_CORE_PLATFORM_H
