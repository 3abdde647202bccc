#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

/// Load/save hooks for one table of the config file.
struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/**
 * @brief Owner of config.toml
 *
 * Subsystems register the dotted table path and the keys they own. load()
 * hands each one its section (an empty table when the file or section is
 * missing) and save() merges their output back into the document, so keys
 * nobody owns, like [logging], survive a save untouched. Writes go to a temp
 * file that is renamed over the target.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    /// Fails if another handler on the same path already owns one of the keys.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    /// Returns false on a parse error; the handlers were still called, with
    /// empty sections.
    bool load();
    bool save();

    /// The file's mtime differs from what the last load()/save() saw.
    bool changedOnDisk() const;

    const std::string& path() const { return config_path_; }
    bool fileExists() const;
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
