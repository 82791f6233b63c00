/**
 * @file resource_provider.cpp
 * @brief Directory-backed resource provider
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/resource_provider.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace accelbn {
namespace loader {

namespace fs = std::filesystem;

DirectoryResourceProvider::DirectoryResourceProvider(std::string directory)
    : directory_(std::move(directory)) {}

std::unique_ptr<std::istream> DirectoryResourceProvider::open(const std::string& name) const {
    if (directory_.empty() || name.empty()) {
        return nullptr;
    }
    const fs::path path = fs::path(directory_) / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return nullptr;
    }
    auto stream = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<std::istream> EmptyResourceProvider::open(const std::string&) const {
    return nullptr;
}

} // namespace loader
} // namespace accelbn
