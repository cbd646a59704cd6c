#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <iterator>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        auto clash = std::find_first_of(ownedKeys.begin(), ownedKeys.end(), handler.ownedKeys.begin(),
                                        handler.ownedKeys.end());
        if (clash != ownedKeys.end())
        {
            last_error_ = "Duplicate ownership: key '" + *clash + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        last_error_.clear();
        root_ = std::make_unique<toml::table>();
        dispatchSections();
        return true;
    }

    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse(text, config_path_);
}

bool ConfigManager::loadFromString(std::string_view text, std::string_view source_name)
{
    return parse(text, source_name);
}

bool ConfigManager::parse(std::string_view text, std::string_view source_name)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(text, source_name));
        dispatchSections();
        PLOG_INFO << "Config loaded from " << source_name;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + std::string(pe.description());

        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
            details = "line " + std::to_string(pe.source().begin.line) + ": " + details;
        details += " | File: " + std::string(source_name);

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", details);

        root_ = std::make_unique<toml::table>();
        dispatchSections();
        return false;
    }
}

void ConfigManager::dispatchSections()
{
    static const toml::table empty;

    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(handler.path);
        if (section)
            reportUnknownKeys(handler, *section);

        if (handler.callbacks.load)
            handler.callbacks.load(section ? *section : empty);
    }
}

void ConfigManager::reportUnknownKeys(const HandlerEntry& handler, const toml::table& section) const
{
    // Several handlers may share a path: report once, from the first one, and
    // only keys that none of them owns.
    auto samePath = [&](const HandlerEntry& other) { return other.path == handler.path; };
    if (&*std::find_if(handlers_.begin(), handlers_.end(), samePath) != &handler)
        return;

    for (const auto& [key, node] : section)
    {
        const std::string_view name = key.str();
        bool owned = std::any_of(handlers_.begin(), handlers_.end(), [&](const HandlerEntry& other) {
            return samePath(other) &&
                   std::find(other.ownedKeys.begin(), other.ownedKeys.end(), name) != other.ownedKeys.end();
        });
        if (owned || node.is_table())
            continue;

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Unknown config key " + handler.path + "." + std::string(name),
                                            "File: " + config_path_);
    }
}

const toml::table& ConfigManager::root() const
{
    return *root_;
}

const toml::table* ConfigManager::resolveTablePath(const std::string& path) const
{
    const toml::table* current = root_.get();
    if (path.empty())
        return current;

    std::size_t start = 0;
    while (current && start <= path.size())
    {
        std::size_t dot = path.find('.', start);
        std::string_view segment = std::string_view(path).substr(start, dot == std::string::npos ? dot : dot - start);
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid config path: " << path;
            return nullptr;
        }

        current = (*current)[segment].as_table();
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return current;
}
