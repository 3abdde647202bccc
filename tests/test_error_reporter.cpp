#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[errors]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::GetLastError().user_message.empty());

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "first");
    ErrorReporter::ReportFatal(ErrorCategory::Waypoints, "second", "details");
    REQUIRE(ErrorReporter::PendingCount() == 2);

    const auto last = ErrorReporter::GetLastError();
    REQUIRE(last.user_message == "second");
    REQUIRE(last.is_fatal);
    REQUIRE_FALSE(last.timestamp.empty());

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].user_message == "first");
    REQUIRE(reports[0].severity == ErrorSeverity::Warning);
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - Oldest reports are dropped", "[errors]")
{
    ErrorReporter::ClearErrors();
    for (std::size_t i = 0; i < ErrorReporter::kMaxQueued + 5; ++i)
        ErrorReporter::ReportError(ErrorCategory::Unknown, std::to_string(i));

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == ErrorReporter::kMaxQueued);
    REQUIRE(reports.front().user_message == "5");
}

TEST_CASE("ErrorReporter - Formatting", "[errors]")
{
    ErrorReport report;
    report.severity = ErrorSeverity::Warning;
    report.user_message = "Invalid ClaimPoints configuration, using defaults.";
    report.technical_details = "bad alias";

    REQUIRE(ErrorReporter::Format(report) == "Warning: Invalid ClaimPoints configuration, using defaults. (bad alias)");
    REQUIRE(ErrorReporter::Format(report, false) == "Warning: Invalid ClaimPoints configuration, using defaults.");
    REQUIRE(std::string(toString(ErrorCategory::Waypoints)) == "Waypoints");
}
