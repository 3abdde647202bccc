#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // config.toml parsing and pattern validation
    Waypoints,      // waypoint file load/save
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // fell back to something usable
    Error,   // an operation failed, the session goes on
    Fatal    // nothing sensible left to do, the host should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // shown to the player
    std::string technical_details; // logs only, unless the host prints them
    std::string timestamp;
    bool is_fatal = false;
};

const char* toString(ErrorCategory category);
const char* toString(ErrorSeverity severity);

/**
 * @brief Process-wide queue of user-visible problems
 *
 * Subsystems report here instead of throwing. Every report is logged through
 * plog right away and queued until the host takes it with GetPendingErrors().
 * Only the newest kMaxQueued reports are kept. Thread-safe.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Invalid ClaimPoints configuration, using defaults.",
 *                                "bad alias: Alias 'ABC' is longer than 2 characters.");
 *
 *   // once per tick:
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       print(ErrorReporter::Format(report));
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxQueued = 100;

    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();
    static std::size_t PendingCount();

    /// Take every queued report, oldest first.
    static std::vector<ErrorReport> GetPendingErrors();

    /// Newest queued report, or a default-constructed one.
    static ErrorReport GetLastError();

    static void ClearErrors();

    /// One-line rendering for a console: "Warning: message (details)".
    static std::string Format(const ErrorReport& report, bool with_details = true);

private:
    static std::string Timestamp();

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace utils
