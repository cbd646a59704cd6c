#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,  // logger setup
    Configuration,   // TOML parsing, invalid config values
    Sanitization,    // input caps and normalization
    PatternMatching, // regex failures while matching a line
    Extraction,      // scoring, deduplication, account info
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Nothing degraded
    Warning, // A default or a partial result was used
    Error    // An operation gave up; the caller still gets a result
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;   // What happened, in one line
    std::string details;   // Values, file names, exception text
    std::string timestamp; // UTC, ISO 8601
};

/**
 * @brief Process-wide collector for degraded-but-not-fatal conditions
 *
 * The detection engine never throws on data, so anything worth telling the
 * user (a rejected config value, a failed stage) is logged through plog and
 * queued here. Front-ends drain the queue when a run is over:
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(report) << "\n";
 *
 * The queue holds the newest kMaxQueueSize reports; older ones are counted
 * in DroppedCount().
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, std::string message,
                       std::string details = {});

    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPendingErrors();

    // Drains the queue and resets the dropped counter.
    static std::vector<ErrorReport> GetPendingErrors();

    static std::optional<ErrorReport> GetLastError();
    static std::size_t DroppedCount();
    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category) noexcept;
    static const char* SeverityToString(ErrorSeverity severity) noexcept;

    // "[Warning] Configuration: message (details)"
    static std::string Format(const ErrorReport& report);

private:
    static std::string UtcTimestamp();

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static std::size_t s_dropped;
    static constexpr std::size_t kMaxQueueSize = 100;
};

} // namespace utils
