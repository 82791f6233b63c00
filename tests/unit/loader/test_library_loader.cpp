/**
 * @file test_library_loader.cpp
 * @brief Library resolution tests against the GMP-backed test libraries
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>

#include "accelbn/loader/library_loader.h"
#include "support/test_support.h"

using accelbn::ArchFamily;
using accelbn::Config;
using accelbn::OsFamily;
using accelbn::PlatformProfile;
using accelbn::ReportLevel;
using accelbn::StatusReporter;
using accelbn::cpu::Tier;
using accelbn::loader::DirectoryResourceProvider;
using accelbn::loader::LibraryLoader;
using accelbn::loader::LoadResult;
using accelbn::loader::SourceKind;
using accelbn_test::RecordingSink;
using accelbn_test::TempDir;

namespace {

int count_entries(const accelbn_test::fs::path& dir) {
    int files = 0;
    for (const auto& entry : accelbn_test::fs::directory_iterator(dir)) {
        (void)entry;
        ++files;
    }
    return files;
}

/// Counts lookups so tests can assert the bundle was never consulted
class CountingProvider : public accelbn::loader::ResourceProvider {
public:
    std::unique_ptr<std::istream> open(const std::string&) const override {
        ++opened;
        return nullptr;
    }
    mutable int opened = 0;
};

} // anonymous namespace

class LibraryLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        resources_ = temp_.subdir("resources");
        scratch_ = temp_.subdir("scratch");
        config_.resource_dir = resources_.string();
        config_.scratch_dir = scratch_.string();
        config_.console_log = false;
        sink_ = std::make_shared<RecordingSink>();
    }

    LoadResult resolve(std::optional<Tier> tier, const PlatformProfile& profile) {
        StatusReporter reporter(sink_);
        LibraryLoader loader(config_, profile,
                             std::make_shared<DirectoryResourceProvider>(config_.resource_dir));
        LoadResult result = loader.resolve(tier, 0, reporter);
        last_status_ = reporter.last_status();
        return result;
    }

    static std::string linux_name(const std::string& tag) {
        return "libaccelbn_native-linux-" + tag + ".so";
    }

    TempDir temp_;
    accelbn_test::fs::path resources_;
    accelbn_test::fs::path scratch_;
    Config config_;
    std::shared_ptr<RecordingSink> sink_;
    std::string last_status_;
    PlatformProfile linux64_ = PlatformProfile::make(OsFamily::Linux, true, ArchFamily::X86);
};

TEST_F(LibraryLoaderTest, DisabledNeverTouchesResources) {
    config_.enable_native = false;
    auto provider = std::make_shared<CountingProvider>();
    StatusReporter reporter(sink_);
    LibraryLoader loader(config_, linux64_, provider);

    LoadResult result = loader.resolve(Tier::CoreI, 0, reporter);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.source_kind, SourceKind::None);
    EXPECT_EQ(result.reason, std::string("disabled by configuration"));
    EXPECT_EQ(provider->opened, 0);
    EXPECT_EQ(result.api, nullptr);
}

TEST_F(LibraryLoaderTest, LoadsBundledFallbackCandidate) {
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("core2"));

    LoadResult result = resolve(Tier::CoreI, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.source_kind, SourceKind::BundledResource);
    EXPECT_EQ(result.identifier, linux_name("core2"));
    EXPECT_FALSE(result.reason.has_value());
    ASSERT_NE(result.api, nullptr);
    EXPECT_TRUE(result.api->has_versioned_operations());

    EXPECT_TRUE(sink_->contains(ReportLevel::Info,
                                "Resource name [" + linux_name("corei_64") + "] was not found"));
    EXPECT_EQ(last_status_, "Native acceleration library " + linux_name("core2") +
                            " loaded from resource");
}

TEST_F(LibraryLoaderTest, FirstMatchingCandidateWins) {
    accelbn_test::install_resource(accelbn_test::fixture_v2(), resources_, linux_name("corei_64"));
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("none"));

    LoadResult result = resolve(Tier::CoreI, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.identifier, linux_name("corei_64"));
    EXPECT_FALSE(result.api->has_versioned_operations());
}

TEST_F(LibraryLoaderTest, MalformedCandidateIsSkipped) {
    accelbn_test::write_text(resources_ / linux_name("corei_64"), "this is not a shared library\n");
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("none"));

    LoadResult result = resolve(Tier::CoreI, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.identifier, linux_name("none"));
    EXPECT_TRUE(sink_->contains(ReportLevel::Warning,
                                "Failed to load the resource " + linux_name("corei_64") +
                                " - not a valid library for this platform"));

    // Neither the rejected nor the loaded extraction is left behind
    EXPECT_EQ(count_entries(scratch_), 0);
}

TEST_F(LibraryLoaderTest, RepeatedResolutionLeavesNoScratchFiles) {
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("none"));

    for (int i = 0; i < 3; ++i) {
        LoadResult result = resolve(std::nullopt, linux64_);
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.source_kind, SourceKind::BundledResource);
        EXPECT_TRUE(result.api->has_versioned_operations());
    }
    EXPECT_EQ(count_entries(scratch_), 0);
}

TEST_F(LibraryLoaderTest, PreferredResourceIsTriedFirst) {
    config_.preferred_resource = "custom-build.so";
    accelbn_test::install_resource(accelbn_test::fixture_v2(), resources_, "custom-build.so");
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("corei_64"));

    LoadResult result = resolve(Tier::CoreI, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.identifier, std::string("custom-build.so"));
}

TEST_F(LibraryLoaderTest, CopiesLoadedLibraryToInstallDir) {
    auto install = temp_.subdir("install");
    config_.install_dir = install.string();
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("none"));

    LoadResult result = resolve(std::nullopt, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(accelbn_test::fs::exists(install / "libaccelbn_native.so"));
}

TEST_F(LibraryLoaderTest, CachedCopyInInstallDirIsFound) {
    auto install = temp_.subdir("install");
    config_.install_dir = install.string();
    accelbn_test::install_resource(accelbn_test::fixture_v3(), install, "libaccelbn_native.so");
    auto provider = std::make_shared<CountingProvider>();
    StatusReporter reporter(sink_);
    LibraryLoader loader(config_, linux64_, provider);

    LoadResult result = loader.resolve(Tier::CoreI, 0, reporter);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.source_kind, SourceKind::SystemPath);
    EXPECT_FALSE(result.identifier.has_value());
    EXPECT_TRUE(result.api->has_versioned_operations());
    EXPECT_EQ(provider->opened, 0);
}

TEST_F(LibraryLoaderTest, UnwritableInstallDirIsIgnored) {
    config_.install_dir = (temp_.path() / "missing" / "dir").string();
    accelbn_test::install_resource(accelbn_test::fixture_v3(), resources_, linux_name("none"));

    LoadResult result = resolve(std::nullopt, linux64_);
    EXPECT_TRUE(result.success);
}

TEST_F(LibraryLoaderTest, NothingLoadable) {
    LoadResult result = resolve(Tier::CoreI, linux64_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.source_kind, SourceKind::None);
    EXPECT_EQ(result.reason, std::string("no loadable candidate library"));
    EXPECT_EQ(last_status_,
              "Native acceleration library accelbn_native not loaded - using software "
              "implementation - poor performance may result");
}

TEST_F(LibraryLoaderTest, AndroidHasNoCandidates) {
    auto android = PlatformProfile::make(OsFamily::Android, false, ArchFamily::Arm);
    LoadResult result = resolve(Tier::Arm, android);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, std::string("no candidate libraries for this platform"));
}

TEST_F(LibraryLoaderTest, SystemPathTakesPrecedence) {
    const char* search = std::getenv("LD_LIBRARY_PATH");
    if (search == nullptr || std::string(search).find(ACCELBN_FIXTURE_DIR) == std::string::npos) {
        GTEST_SKIP() << "test libraries are not on the system search path";
    }
    config_.library_stem = "accelbn_fixture_v3";

    LoadResult result = resolve(Tier::CoreI, linux64_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.source_kind, SourceKind::SystemPath);
    EXPECT_FALSE(result.identifier.has_value());
    EXPECT_TRUE(result.api->has_versioned_operations());
}
