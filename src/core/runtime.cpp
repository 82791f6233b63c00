/**
 * @file runtime.cpp
 * @brief One-time platform detection and library resolution
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/runtime.h"

#include <mutex>
#include <utility>

namespace accelbn {

namespace {

std::shared_ptr<ReportSink> default_sink(const Config& config) {
    if (!config.console_log) {
        return nullptr;
    }
    return std::make_shared<ConsoleReportSink>(config.debug_log);
}

} // anonymous namespace

Runtime::Runtime(PlatformProfile profile, std::optional<cpu::Tier> tier, std::string cpu_model,
                 loader::LoadResult load_result, math::Dispatcher dispatcher,
                 std::string status_message)
    : profile_(std::move(profile)),
      tier_(tier),
      cpu_model_(std::move(cpu_model)),
      load_result_(std::move(load_result)),
      dispatcher_(std::move(dispatcher)),
      status_message_(std::move(status_message)) {}

std::shared_ptr<const Runtime> Runtime::initialize(RuntimeOptions options) {
    const Config& config = options.config;

    auto sink = options.sink ? options.sink : default_sink(config);
    StatusReporter reporter(sink);

    PlatformProfile profile = options.profile ? *options.profile : PlatformProfile::host();
    reporter.debug("platform: " + profile.to_string());

    auto classifier = options.classifier;
    if (!classifier) {
        classifier = std::make_shared<cpu::CpuidClassifier>();
    }
    std::string model = cpu::describe_model(*classifier);
    std::optional<cpu::Tier> tier = cpu::resolve_tier(*classifier, profile);
    reporter.debug("cpu model: " + model + ", tier: " +
                   (tier ? cpu::tier_name(*tier) : cpu::kUnrecognizedCpu));

    int arm_revision = 0;
    if (options.arm_revision) {
        arm_revision = *options.arm_revision;
    } else if (profile.arch_family() == ArchFamily::Arm) {
        arm_revision = arm_architecture_revision(read_cpu_info());
    }

    auto resources = options.resources;
    if (!resources) {
        resources = std::make_shared<loader::DirectoryResourceProvider>(config.resource_dir);
    }

    loader::LibraryLoader library_loader(config, profile, resources);
    loader::LoadResult result = library_loader.resolve(tier, arm_revision, reporter);

    loader::LibraryCapabilities caps;
    std::shared_ptr<const math::ArithmeticBackend> native;
    if (result.success) {
        caps = loader::CapabilityProbe(reporter).probe(*result.api);
        native = std::make_shared<math::NativeBackend>(result.api);
    }

    math::Dispatcher dispatcher(caps, native);
    return std::shared_ptr<const Runtime>(
        new Runtime(std::move(profile), tier, std::move(model), std::move(result),
                    std::move(dispatcher), reporter.last_status()));
}

// ============================================================================
// Process-wide instance
// ============================================================================

namespace {

std::once_flag g_runtime_flag;
std::shared_ptr<const Runtime> g_runtime;

void initialize_global() {
    RuntimeOptions options;
    options.config = Config::from_environment();
    g_runtime = Runtime::initialize(std::move(options));
}

} // anonymous namespace

const Runtime& runtime() {
    std::call_once(g_runtime_flag, initialize_global);
    return *g_runtime;
}

bool is_accelerated() {
    return runtime().capabilities().loaded;
}

int backend_version() {
    return runtime().capabilities().version_major;
}

std::string backend_library_version() {
    return runtime().capabilities().backend_library_version;
}

std::optional<std::string> loaded_candidate_name() {
    return runtime().load_result().identifier;
}

std::string last_status_message() {
    return runtime().status_message();
}

std::string cpu_type() {
    const auto& tier = runtime().tier();
    return tier ? cpu::tier_name(*tier) : cpu::kUnrecognizedCpu;
}

std::string cpu_model() {
    return runtime().cpu_model();
}

} // namespace accelbn
