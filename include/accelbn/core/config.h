/**
 * @file config.h
 * @brief Runtime configuration for acceleration library resolution
 *
 * Environment variables (all optional):
 * - ACCELBN_ENABLE: anything but "true"/"1"/"yes"/"on" disables the native backend
 * - ACCELBN_IMPL: bundled resource name tried before the generated candidates
 * - ACCELBN_RESOURCE_DIR: directory holding bundled acceleration libraries
 * - ACCELBN_SCRATCH_DIR: where bundled libraries are extracted
 * - ACCELBN_INSTALL_DIR: where an extracted library is cached for later runs,
 *   and looked up before bundled resources
 * - ACCELBN_DONT_LOG: suppress console reporting
 * - ACCELBN_DEBUG: include debug lines in console reporting
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_CORE_CONFIG_H
#define ACCELBN_CORE_CONFIG_H

#include <string>

#ifndef ACCELBN_DEFAULT_RESOURCE_DIR
#define ACCELBN_DEFAULT_RESOURCE_DIR "share/accelbn/native"
#endif

namespace accelbn {

/// Logical name of the acceleration library ("libaccelbn_native.so")
constexpr const char* kDefaultLibraryStem = "accelbn_native";

struct Config {
    bool enable_native = true;              ///< Try to load a native backend at all
    std::string library_stem = kDefaultLibraryStem;
    std::string preferred_resource;         ///< Tried first when non-empty
    std::string resource_dir = ACCELBN_DEFAULT_RESOURCE_DIR;
    std::string scratch_dir;                ///< Empty: system temp directory
    std::string install_dir;                ///< Cache searched after the system path
    bool console_log = true;
    bool debug_log = false;

    /**
     * @brief Defaults overridden by ACCELBN_* environment variables
     */
    static Config from_environment();
};

/**
 * @brief Parse a boolean setting, returning fallback for unrecognized text
 */
bool parse_bool(const std::string& text, bool fallback);

} // namespace accelbn

#endif // ACCELBN_CORE_CONFIG_H
