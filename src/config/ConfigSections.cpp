#include "ConfigSections.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <string>

namespace config_sections
{

namespace
{

void rejectValue(const char* section, const char* key, const std::string& value)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        std::string("Invalid ") + section + "." + key + ", keeping default",
                                        "value=" + value);
}

// Positive integer caps only; zero or negative would disable a safety limit.
void readCap(const toml::table& section, const char* key, std::size_t& out)
{
    if (auto v = section[key].value<std::int64_t>())
    {
        if (*v > 0)
            out = static_cast<std::size_t>(*v);
        else
            rejectValue("detection", key, std::to_string(*v));
    }
}

} // namespace

void loadDetectionSection(const toml::table& section, detection::DetectionConfig& out)
{
    readCap(section, "max_text_bytes", out.max_text_bytes);
    readCap(section, "max_lines", out.max_lines);
    readCap(section, "max_line_length", out.max_line_length);

    if (auto v = section["confidence_threshold"].value<double>())
    {
        if (*v >= 0.0 && *v < 1.0)
            out.confidence_threshold = *v;
        else
            rejectValue("detection", "confidence_threshold", std::to_string(*v));
    }

    if (auto v = section["normalize_unicode"].value<bool>())
        out.normalize_unicode = *v;
}

void loadLoggingSection(const toml::table& section, utils::LogManager::Settings& out)
{
    if (auto level = section["level"].value<std::int64_t>())
    {
        int level_int = static_cast<int>(*level);
        if (level_int >= 0 && level_int <= 6)
            out.level = static_cast<plog::Severity>(level_int);
        else
            rejectValue("logging", "level", std::to_string(*level));
    }

    if (auto v = section["file"].value<std::string>())
    {
        if (!v->empty())
            out.file = *v;
        else
            rejectValue("logging", "file", "\"\"");
    }

    if (auto v = section["append"].value<bool>())
        out.append = *v;
    if (auto v = section["console"].value<bool>())
        out.console = *v;
    if (auto v = section["verbose"].value<bool>())
        out.verbose = *v;

    if (auto v = section["max_preview"].value<std::int64_t>())
    {
        if (*v > 0)
            out.max_preview = static_cast<std::size_t>(*v);
        else
            rejectValue("logging", "max_preview", std::to_string(*v));
    }
}

bool registerSections(ConfigManager& manager, detection::DetectionConfig& detection_cfg,
                      utils::LogManager::Settings& logging_cfg)
{
    bool ok = manager.registerTable(
        "detection",
        TableCallbacks{ [&detection_cfg](const toml::table& section) { loadDetectionSection(section, detection_cfg); } },
        { "max_text_bytes", "max_lines", "max_line_length", "confidence_threshold", "normalize_unicode" });

    ok = manager.registerTable(
             "logging",
             TableCallbacks{ [&logging_cfg](const toml::table& section) { loadLoggingSection(section, logging_cfg); } },
             { "level", "file", "append", "console", "verbose", "max_preview" }) &&
         ok;
    return ok;
}

} // namespace config_sections
