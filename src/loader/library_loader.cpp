/**
 * @file library_loader.cpp
 * @brief System-path and bundled-resource loading of the acceleration library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/library_loader.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace accelbn {
namespace loader {

namespace fs = std::filesystem;

namespace {

long process_id() {
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(getpid());
#endif
}

/**
 * @brief Fresh, not yet existing file name in the scratch directory
 */
fs::path unique_scratch_file(const fs::path& dir, const PlatformProfile& profile,
                             const std::string& stem) {
    static std::atomic<unsigned> counter{0};
    fs::path path;
    std::error_code ec;
    do {
        std::string name = stem + "-" + std::to_string(process_id()) + "-" +
                           std::to_string(counter.fetch_add(1));
        path = dir / profile.library_file_name(name);
    } while (fs::exists(path, ec));
    return path;
}

/**
 * @brief Copy a resource stream into a file
 * @return false on any read or write error
 */
bool extract(std::istream& in, const fs::path& path) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    char buf[4096];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize read = in.gcount();
        if (read > 0) {
            out.write(buf, read);
            if (!out) {
                return false;
            }
        }
    }
    if (in.bad()) {
        return false;
    }
    out.close();
    return !out.fail();
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // anonymous namespace

const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::None:            return "none";
        case SourceKind::SystemPath:      return "system path";
        case SourceKind::BundledResource: return "bundled resource";
    }
    return "none";
}

LoadResult LoadResult::failure(std::string why) {
    LoadResult result;
    result.reason = std::move(why);
    return result;
}

// ============================================================================
// LibraryLoader
// ============================================================================

LibraryLoader::LibraryLoader(Config config,
                             const PlatformProfile& profile,
                             std::shared_ptr<const ResourceProvider> resources)
    : LibraryLoader(config, profile, std::move(resources),
                    CandidateNameGenerator(config.library_stem)) {}

LibraryLoader::LibraryLoader(Config config,
                             const PlatformProfile& profile,
                             std::shared_ptr<const ResourceProvider> resources,
                             CandidateNameGenerator names)
    : config_(std::move(config)),
      profile_(profile),
      resources_(std::move(resources)),
      names_(std::move(names)) {
    if (!resources_) {
        resources_ = std::make_shared<EmptyResourceProvider>();
    }
}

std::vector<std::string> LibraryLoader::resource_list(std::optional<cpu::Tier> tier,
                                                      int arm_revision) const {
    std::vector<std::string> list;
    if (!config_.preferred_resource.empty()) {
        list.push_back(config_.preferred_resource);
    }
    for (auto& name : names_.generate(profile_, tier, arm_revision)) {
        if (name != config_.preferred_resource) {
            list.push_back(std::move(name));
        }
    }
    return list;
}

LoadResult LibraryLoader::resolve(std::optional<cpu::Tier> tier, int arm_revision,
                                  StatusReporter& reporter) const {
    if (!config_.enable_native) {
        reporter.warn("Native acceleration disabled by configuration - using software implementation");
        return LoadResult::failure("disabled by configuration");
    }

    reporter.debug("trying system library " + profile_.library_file_name(config_.library_stem));
    if (auto api = load_from_system(reporter)) {
        reporter.info("Locally installed native acceleration library " + api->library_name() +
                      " loaded from the system path");
        LoadResult result;
        result.success = true;
        result.source_kind = SourceKind::SystemPath;
        result.api = std::move(api);
        return result;
    }

    const std::vector<std::string> to_try = resource_list(tier, arm_revision);
    reporter.debug("resource list to try has " + std::to_string(to_try.size()) + " entries");
    for (const auto& name : to_try) {
        reporter.debug("trying resource " + name);
        if (auto api = load_from_resource(name, reporter)) {
            reporter.info("Native acceleration library " + name + " loaded from resource");
            LoadResult result;
            result.success = true;
            result.source_kind = SourceKind::BundledResource;
            result.identifier = name;
            result.api = std::move(api);
            return result;
        }
    }

    reporter.warn("Native acceleration library " + config_.library_stem +
                  " not loaded - using software implementation - poor performance may result");
    return LoadResult::failure(to_try.empty() ? "no candidate libraries for this platform"
                                              : "no loadable candidate library");
}

std::shared_ptr<const NativeApi> LibraryLoader::load_from_system(StatusReporter& reporter) const {
    const std::string file_name = profile_.library_file_name(config_.library_stem);
    if (auto api = load_installed(file_name, reporter)) {
        return api;
    }
    if (config_.install_dir.empty()) {
        return nullptr;
    }

    // Copy cached by an earlier run, in case install_dir is not on the search path
    std::error_code ec;
    const fs::path cached = fs::path(config_.install_dir) / file_name;
    if (!fs::is_regular_file(cached, ec)) {
        return nullptr;
    }
    reporter.debug("trying cached library " + cached.string());
    return load_installed(cached.string(), reporter);
}

std::shared_ptr<const NativeApi> LibraryLoader::load_installed(const std::string& path,
                                                               StatusReporter& reporter) const {
    std::string error;
    std::shared_ptr<NativeLibrary> library = NativeLibrary::open(path, &error);
    if (!library) {
        reporter.debug("system library not loaded: " + error);
        return nullptr;
    }
    auto api = NativeApi::bind(library);
    if (!api) {
        reporter.warn("System library " + library->name() +
                      " does not export the acceleration entry points");
    }
    return api;
}

std::shared_ptr<const NativeApi> LibraryLoader::load_from_resource(const std::string& name,
                                                                   StatusReporter& reporter) const {
    std::unique_ptr<std::istream> in = resources_->open(name);
    if (!in) {
        reporter.info("Resource name [" + name + "] was not found");
        return nullptr;
    }

    std::error_code ec;
    fs::path scratch = config_.scratch_dir.empty() ? fs::temp_directory_path(ec)
                                                   : fs::path(config_.scratch_dir);
    if (ec) {
        reporter.warn("No scratch directory for native library extraction: " + ec.message());
        return nullptr;
    }

    const fs::path out_file = unique_scratch_file(scratch, profile_, config_.library_stem);
    if (!extract(*in, out_file)) {
        reporter.warn("Problem writing out the temporary native library data to " +
                      out_file.string());
        remove_quietly(out_file);
        return nullptr;
    }

    std::string error;
    std::shared_ptr<NativeLibrary> library = NativeLibrary::open(out_file.string(), &error);
    if (!library) {
        reporter.warn("Failed to load the resource " + name +
                      " - not a valid library for this platform");
        reporter.debug(error);
        remove_quietly(out_file);
        return nullptr;
    }
    auto api = NativeApi::bind(std::move(library));
    if (!api) {
        reporter.warn("Failed to load the resource " + name +
                      " - it does not export the acceleration entry points");
        remove_quietly(out_file);
        return nullptr;
    }

    copy_to_install_dir(out_file.string(), reporter);
#ifndef _WIN32
    // The mapping outlives the directory entry
    remove_quietly(out_file);
#endif
    return api;
}

void LibraryLoader::copy_to_install_dir(const std::string& extracted,
                                        StatusReporter& reporter) const {
    if (config_.install_dir.empty()) {
        return;
    }
    const fs::path target = fs::path(config_.install_dir) /
                            profile_.library_file_name(config_.library_stem);
    std::error_code ec;
    fs::copy_file(extracted, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        reporter.debug("could not cache native library in " + target.string() + ": " + ec.message());
    }
}

} // namespace loader
} // namespace accelbn
