/**
 * @file resource_provider.h
 * @brief Source of bundled acceleration library binaries
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_RESOURCE_PROVIDER_H
#define ACCELBN_LOADER_RESOURCE_PROVIDER_H

#include <istream>
#include <memory>
#include <string>

namespace accelbn {
namespace loader {

class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;

    /**
     * @brief Open a bundled resource for binary reading
     * @return The stream, or null if no such resource exists
     */
    virtual std::unique_ptr<std::istream> open(const std::string& name) const = 0;
};

/**
 * @brief Resources are regular files in one directory
 */
class DirectoryResourceProvider : public ResourceProvider {
public:
    explicit DirectoryResourceProvider(std::string directory);

    std::unique_ptr<std::istream> open(const std::string& name) const override;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

/**
 * @brief Provider without any resources
 */
class EmptyResourceProvider : public ResourceProvider {
public:
    std::unique_ptr<std::istream> open(const std::string& name) const override;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_RESOURCE_PROVIDER_H
