/**
 * @file report.h
 * @brief Status and warning reporting for library resolution
 *
 * Reporting is fire-and-forget: sinks never influence control flow.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_CORE_REPORT_H
#define ACCELBN_CORE_REPORT_H

#include <iosfwd>
#include <memory>
#include <string>

namespace accelbn {

enum class ReportLevel {
    Debug,
    Info,
    Warning
};

const char* report_level_name(ReportLevel level);

/**
 * @brief Receiver of status and warning messages
 */
class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual void report(ReportLevel level, const std::string& message) = 0;
};

/**
 * @brief Prints "INFO: ..." / "WARNING: ..." lines to a stream (std::cerr)
 */
class ConsoleReportSink : public ReportSink {
public:
    explicit ConsoleReportSink(bool show_debug = false);
    ConsoleReportSink(std::ostream& out, bool show_debug);

    void report(ReportLevel level, const std::string& message) override;

private:
    std::ostream& out_;
    bool show_debug_;
};

/**
 * @brief Forwards messages to an optional sink and remembers the last status
 *
 * Info and warning messages become the status message; debug output
 * does not.
 */
class StatusReporter {
public:
    explicit StatusReporter(std::shared_ptr<ReportSink> sink = nullptr);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);

    const std::string& last_status() const { return last_status_; }

private:
    void emit(ReportLevel level, const std::string& message);

    std::shared_ptr<ReportSink> sink_;
    std::string last_status_ = "uninitialized";
};

} // namespace accelbn

#endif // ACCELBN_CORE_REPORT_H
