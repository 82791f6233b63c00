/**
 * @file config.cpp
 * @brief Configuration defaults and environment overrides
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/core/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace accelbn {

namespace {

bool read_env(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    out = value;
    return true;
}

} // anonymous namespace

bool parse_bool(const std::string& text, bool fallback) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        return false;
    }
    return fallback;
}

Config Config::from_environment() {
    Config config;
    std::string value;

    if (read_env("ACCELBN_ENABLE", value)) {
        config.enable_native = parse_bool(value, false);
    }
    read_env("ACCELBN_IMPL", config.preferred_resource);
    read_env("ACCELBN_RESOURCE_DIR", config.resource_dir);
    read_env("ACCELBN_SCRATCH_DIR", config.scratch_dir);
    read_env("ACCELBN_INSTALL_DIR", config.install_dir);
    // Presence alone disables console output
    if (read_env("ACCELBN_DONT_LOG", value)) {
        config.console_log = false;
    }
    if (read_env("ACCELBN_DEBUG", value)) {
        config.debug_log = parse_bool(value, true);
    }
    return config;
}

} // namespace accelbn
