#include "ErrorReporter.hpp"
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
std::size_t ErrorReporter::s_dropped = 0;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, std::string message, std::string details)
{
    ErrorReport report{ category, severity, std::move(message), std::move(details), UtcTimestamp() };

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << Format(report);
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << Format(report);
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << Format(report);
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    if (s_queue.size() > kMaxQueueSize)
    {
        s_queue.pop_front();
        ++s_dropped;
    }
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    s_dropped = 0;
    return reports;
}

std::optional<ErrorReport> ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.empty())
        return std::nullopt;
    return s_queue.back();
}

std::size_t ErrorReporter::DroppedCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_dropped;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_dropped = 0;
}

const char* ErrorReporter::CategoryToString(ErrorCategory category) noexcept
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Sanitization:
        return "Sanitization";
    case ErrorCategory::PatternMatching:
        return "Pattern Matching";
    case ErrorCategory::Extraction:
        return "Extraction";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity) noexcept
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    }
    return "Unknown";
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string line = "[";
    line += SeverityToString(report.severity);
    line += "] ";
    line += CategoryToString(report.category);
    line += ": ";
    line += report.message;
    if (!report.details.empty())
    {
        line += " (";
        line += report.details;
        line += ")";
    }
    return line;
}

std::string ErrorReporter::UtcTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &now);
#else
    gmtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace utils
