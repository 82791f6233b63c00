/**
 * @file library_loader.h
 * @brief Two-phase resolution of the acceleration library
 *
 * @details Load order:
 * 1. Nothing at all when disabled by configuration.
 * 2. The bare library name (e.g. libaccelbn_native.so) through the system
 *    dynamic library search path, then the copy cached in the install
 *    directory by an earlier run.
 * 3. The configured preferred resource, then every generated candidate:
 *    the bundled binary is extracted into scratch storage and loaded from
 *    there. On success the file is also copied into the install directory
 *    so later runs find it without extraction; copy failures are ignored
 *    so read-only installs keep working. Except on Windows, the extracted
 *    file is unlinked once loaded.
 *
 * A library that loads but does not export the acceleration entry points
 * counts as a failed candidate. Resolution failure is never fatal; it only
 * leaves the software backend in charge.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_LIBRARY_LOADER_H
#define ACCELBN_LOADER_LIBRARY_LOADER_H

#include "accelbn/core/config.h"
#include "accelbn/core/cpu_features.h"
#include "accelbn/core/platform.h"
#include "accelbn/core/report.h"
#include "accelbn/loader/candidate_names.h"
#include "accelbn/loader/native_api.h"
#include "accelbn/loader/resource_provider.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace accelbn {
namespace loader {

enum class SourceKind {
    None,             ///< Nothing loaded
    SystemPath,       ///< Found by the host's library search
    BundledResource   ///< Extracted from the resource bundle
};

const char* source_kind_name(SourceKind kind);

/**
 * @brief Outcome of resolution; immutable once returned
 */
struct LoadResult {
    bool success = false;
    SourceKind source_kind = SourceKind::None;
    std::optional<std::string> identifier;   ///< Candidate name when bundled
    std::optional<std::string> reason;       ///< Why nothing was loaded
    std::shared_ptr<const NativeApi> api;    ///< Bridge to the loaded library

    static LoadResult failure(std::string why);
};

class LibraryLoader {
public:
    LibraryLoader(Config config,
                  const PlatformProfile& profile,
                  std::shared_ptr<const ResourceProvider> resources);

    LibraryLoader(Config config,
                  const PlatformProfile& profile,
                  std::shared_ptr<const ResourceProvider> resources,
                  CandidateNameGenerator names);

    /**
     * @brief Run the load sequence once
     * @param tier Detected tier, empty if unknown
     * @param arm_revision ARM architecture revision (0 if unknown)
     * @param reporter Receives progress and failure messages
     */
    LoadResult resolve(std::optional<cpu::Tier> tier, int arm_revision,
                       StatusReporter& reporter) const;

    /**
     * @brief Bundled resources in the order resolve() tries them
     */
    std::vector<std::string> resource_list(std::optional<cpu::Tier> tier,
                                           int arm_revision) const;

private:
    std::shared_ptr<const NativeApi> load_from_system(StatusReporter& reporter) const;
    std::shared_ptr<const NativeApi> load_installed(const std::string& path,
                                                    StatusReporter& reporter) const;
    std::shared_ptr<const NativeApi> load_from_resource(const std::string& name,
                                                        StatusReporter& reporter) const;
    void copy_to_install_dir(const std::string& extracted, StatusReporter& reporter) const;

    Config config_;
    PlatformProfile profile_;
    std::shared_ptr<const ResourceProvider> resources_;
    CandidateNameGenerator names_;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_LIBRARY_LOADER_H
