#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads a TOML file and hands each registered section to its callback.
// A missing file or a parse error is never fatal: every section then sees an
// empty table and keeps its defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "formscan.toml");
    ~ConfigManager();

    // ownedKeys lists the keys the section understands; others are reported as unknown.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // false on a parse error (reported through ErrorReporter, defaults dispatched)
    bool load();
    bool loadFromString(std::string_view text, std::string_view source_name = "<string>");

    const toml::table& root() const;
    const std::string& configPath() const noexcept { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    bool parse(std::string_view text, std::string_view source_name);
    void dispatchSections();
    void reportUnknownKeys(const HandlerEntry& handler, const toml::table& section) const;
    const toml::table* resolveTablePath(const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
