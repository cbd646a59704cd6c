#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders of the process. Logger instances:
//   0                                   main log (settings.file, optional stderr copy)
//   detection::Diagnostics::kLogInstance verbose detection trace (detection.log)
//   profiling::kProfilingLogInstance     scope timings (profiling.log), profiling builds only
class LogManager
{
public:
    // [logging] config section
    struct Settings
    {
        plog::Severity level = plog::info;
        std::string file = "logs/formscan.log";
        bool append = true;
        bool console = false;
        bool verbose = false;
        std::size_t max_preview = 160;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Applies the Diagnostics settings and registers every logger. Safe to call twice.
    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static bool IsInitialized();

    // Creates the parent directory of `filepath`; failures are reported, not thrown.
    static void PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static std::string siblingPath(const std::string& file, const char* name);

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
