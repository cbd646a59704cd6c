#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../detection/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    detection::Diagnostics::SetVerbose(settings.verbose);
    detection::Diagnostics::SetMaxPreview(settings.max_preview);

    PrepareLogDirectory(settings.file);
    s_initialized = true;

    if (!RegisterLogger<0>({ .name = "main",
                             .filepath = settings.file,
                             .append_override = std::nullopt,
                             .level_override = std::nullopt,
                             .max_file_size = 10 * 1024 * 1024,
                             .backup_count = 3,
                             .add_console_appender = settings.console }))
    {
        s_initialized = false;
        return false;
    }

    // Detection trace only carries records when verbose is on.
    if (!RegisterLogger<detection::Diagnostics::kLogInstance>({ .name = "detection",
                                                                .filepath = siblingPath(settings.file, "detection.log"),
                                                                .append_override = std::nullopt,
                                                                .level_override = plog::verbose,
                                                                .max_file_size = 10 * 1024 * 1024,
                                                                .backup_count = 3,
                                                                .add_console_appender = false }))
        return false;

#if FORMSCAN_PROFILING_LEVEL >= 1
    if (!RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                           .filepath = siblingPath(settings.file, "profiling.log"),
                                                           .append_override = std::nullopt,
                                                           .level_override = plog::debug,
                                                           .max_file_size = 10 * 1024 * 1024,
                                                           .backup_count = 3,
                                                           .add_console_appender = false }))
        PLOG_WARNING << "Profiling log unavailable";
#endif

    PLOG_INFO << "Logging started: level=" << plog::severityToString(settings.level) << " file=" << settings.file
              << (settings.verbose ? " (verbose detection trace)" : "");
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }

    try
    {
        if (!config.append_override.value_or(s_settings.append))
            std::ofstream(config.filepath, std::ios::trunc).close();

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
        auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_settings.level), file.get());
        s_appenders.push_back(std::move(file));

        if (config.add_console_appender)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<detection::Diagnostics::kLogInstance>(const LoggerConfig&);

#if FORMSCAN_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

bool LogManager::IsInitialized() { return s_initialized; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
}

std::string LogManager::siblingPath(const std::string& file, const char* name)
{
    return (std::filesystem::path(file).parent_path() / name).string();
}

} // namespace utils
