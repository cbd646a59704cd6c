#pragma once

#include "ConfigManager.hpp"
#include "../detection/DetectionConfig.hpp"
#include "../utils/LogManager.hpp"

#include <toml++/toml.h>

namespace config_sections
{

// Apply a [detection] table onto `out`. Invalid values are reported and skipped.
void loadDetectionSection(const toml::table& section, detection::DetectionConfig& out);

// Apply a [logging] table onto `out`. Invalid values are reported and skipped.
void loadLoggingSection(const toml::table& section, utils::LogManager::Settings& out);

// Registers both sections on `manager`; the targets must outlive the manager's load() calls.
bool registerSections(ConfigManager& manager, detection::DetectionConfig& detection_cfg,
                      utils::LogManager::Settings& logging_cfg);

} // namespace config_sections
