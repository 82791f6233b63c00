/**
 * @file report.cpp
 * @brief Console report sink and status recording
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/core/report.h"

#include <iostream>
#include <utility>

namespace accelbn {

const char* report_level_name(ReportLevel level) {
    switch (level) {
        case ReportLevel::Debug:   return "DEBUG";
        case ReportLevel::Info:    return "INFO";
        case ReportLevel::Warning: return "WARNING";
    }
    return "INFO";
}

ConsoleReportSink::ConsoleReportSink(bool show_debug)
    : out_(std::cerr), show_debug_(show_debug) {}

ConsoleReportSink::ConsoleReportSink(std::ostream& out, bool show_debug)
    : out_(out), show_debug_(show_debug) {}

void ConsoleReportSink::report(ReportLevel level, const std::string& message) {
    if (level == ReportLevel::Debug && !show_debug_) {
        return;
    }
    out_ << report_level_name(level) << ": " << message << std::endl;
}

StatusReporter::StatusReporter(std::shared_ptr<ReportSink> sink)
    : sink_(std::move(sink)) {}

void StatusReporter::debug(const std::string& message) {
    emit(ReportLevel::Debug, message);
}

void StatusReporter::info(const std::string& message) {
    emit(ReportLevel::Info, message);
    last_status_ = message;
}

void StatusReporter::warn(const std::string& message) {
    emit(ReportLevel::Warning, message);
    last_status_ = message;
}

void StatusReporter::emit(ReportLevel level, const std::string& message) {
    if (sink_) {
        sink_->report(level, message);
    }
}

} // namespace accelbn
