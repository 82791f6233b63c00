/**
 * @file test_config.cpp
 * @brief Configuration and status reporting tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "accelbn/core/config.h"
#include "accelbn/core/report.h"

namespace {

const char* const kVariables[] = {
    "ACCELBN_ENABLE", "ACCELBN_IMPL", "ACCELBN_RESOURCE_DIR", "ACCELBN_SCRATCH_DIR",
    "ACCELBN_INSTALL_DIR", "ACCELBN_DONT_LOG", "ACCELBN_DEBUG",
};

/**
 * @brief Clears the accelbn environment around each test
 */
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
    }
};

class RecordingSink : public accelbn::ReportSink {
public:
    void report(accelbn::ReportLevel level, const std::string& message) override {
        entries.emplace_back(level, message);
    }
    std::vector<std::pair<accelbn::ReportLevel, std::string>> entries;
};

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

TEST(ParseBoolTest, Spellings) {
    EXPECT_TRUE(accelbn::parse_bool("true", false));
    EXPECT_TRUE(accelbn::parse_bool("TRUE", false));
    EXPECT_TRUE(accelbn::parse_bool("1", false));
    EXPECT_TRUE(accelbn::parse_bool("yes", false));
    EXPECT_FALSE(accelbn::parse_bool("false", true));
    EXPECT_FALSE(accelbn::parse_bool("Off", true));
    EXPECT_FALSE(accelbn::parse_bool("0", true));
    EXPECT_TRUE(accelbn::parse_bool("maybe", true));
    EXPECT_FALSE(accelbn::parse_bool("", false));
}

TEST_F(ConfigTest, Defaults) {
    accelbn::Config config = accelbn::Config::from_environment();
    EXPECT_TRUE(config.enable_native);
    EXPECT_EQ(config.library_stem, accelbn::kDefaultLibraryStem);
    EXPECT_TRUE(config.preferred_resource.empty());
    EXPECT_EQ(config.resource_dir, ACCELBN_DEFAULT_RESOURCE_DIR);
    EXPECT_TRUE(config.console_log);
    EXPECT_FALSE(config.debug_log);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("ACCELBN_ENABLE", "false", 1);
    setenv("ACCELBN_IMPL", "libaccelbn_native-linux-core2_64.so", 1);
    setenv("ACCELBN_RESOURCE_DIR", "/opt/accelbn/native", 1);
    setenv("ACCELBN_SCRATCH_DIR", "/var/tmp", 1);
    setenv("ACCELBN_INSTALL_DIR", "/opt/accelbn/lib", 1);
    setenv("ACCELBN_DEBUG", "1", 1);

    accelbn::Config config = accelbn::Config::from_environment();
    EXPECT_FALSE(config.enable_native);
    EXPECT_EQ(config.preferred_resource, "libaccelbn_native-linux-core2_64.so");
    EXPECT_EQ(config.resource_dir, "/opt/accelbn/native");
    EXPECT_EQ(config.scratch_dir, "/var/tmp");
    EXPECT_EQ(config.install_dir, "/opt/accelbn/lib");
    EXPECT_TRUE(config.debug_log);
}

TEST_F(ConfigTest, UnrecognizedEnableValueDisables) {
    setenv("ACCELBN_ENABLE", "sure", 1);
    EXPECT_FALSE(accelbn::Config::from_environment().enable_native);
    setenv("ACCELBN_ENABLE", "TRUE", 1);
    EXPECT_TRUE(accelbn::Config::from_environment().enable_native);
}

TEST_F(ConfigTest, DontLogPresenceDisablesConsole) {
    setenv("ACCELBN_DONT_LOG", "false", 1);
    EXPECT_FALSE(accelbn::Config::from_environment().console_log);
}

// ============================================================================
// Reporting
// ============================================================================

TEST(ReportTest, ConsoleFormat) {
    std::ostringstream out;
    accelbn::ConsoleReportSink sink(out, false);
    sink.report(accelbn::ReportLevel::Info, "loaded");
    sink.report(accelbn::ReportLevel::Warning, "not loaded");
    sink.report(accelbn::ReportLevel::Debug, "hidden");
    EXPECT_EQ(out.str(), "INFO: loaded\nWARNING: not loaded\n");
}

TEST(ReportTest, ConsoleShowsDebugWhenEnabled) {
    std::ostringstream out;
    accelbn::ConsoleReportSink sink(out, true);
    sink.report(accelbn::ReportLevel::Debug, "trying resource x");
    EXPECT_EQ(out.str(), "DEBUG: trying resource x\n");
}

TEST(ReportTest, LastStatusTracksInfoAndWarnings) {
    auto sink = std::make_shared<RecordingSink>();
    accelbn::StatusReporter reporter(sink);
    EXPECT_EQ(reporter.last_status(), "uninitialized");

    reporter.info("first");
    reporter.debug("ignored for status");
    EXPECT_EQ(reporter.last_status(), "first");
    reporter.warn("second");
    EXPECT_EQ(reporter.last_status(), "second");

    ASSERT_EQ(sink->entries.size(), 3u);
    EXPECT_EQ(sink->entries[1].first, accelbn::ReportLevel::Debug);
}

TEST(ReportTest, NullSinkIsSilent) {
    accelbn::StatusReporter reporter;
    reporter.warn("nobody listens");
    EXPECT_EQ(reporter.last_status(), "nobody listens");
}
