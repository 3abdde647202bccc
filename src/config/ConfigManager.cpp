#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <utility>

namespace fs = std::filesystem;

namespace
{

long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        tp - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(sctp.time_since_epoch()).count();
}

// "a.b.c" -> {"a", "b", "c"}; empty on a malformed path
std::vector<std::string> split_path(const std::string& path)
{
    std::vector<std::string> segments;
    std::size_t begin = 0;
    while (begin <= path.size())
    {
        const std::size_t dot = std::min(path.find('.', begin), path.size());
        if (dot == begin)
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return {};
        }
        segments.push_back(path.substr(begin, dot - begin));
        begin = dot + 1;
    }
    return segments;
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
    last_mtime_ = file_mtime_ms(config_path_);
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::fileExists() const
{
    std::error_code ec;
    return fs::exists(config_path_, ec);
}

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    root_ = std::make_unique<toml::table>();

    bool ok = true;
    std::ifstream ifs(config_path_, std::ios::binary);
    if (ifs)
    {
        try
        {
            *root_ = toml::parse(ifs, config_path_);
        }
        catch (const toml::parse_error& pe)
        {
            last_error_ = std::string("config parse error: ") + std::string(pe.description());
            std::string details = std::string(pe.description());
            if (pe.source().begin.line > 0)
                details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;

            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Configuration file has errors. Using defaults.",
                                                details + "\nFile: " + config_path_);
            root_ = std::make_unique<toml::table>();
            ok = false;
        }
    }
    else
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
    }

    // Handlers always get a call so they can reset to defaults.
    const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(std::as_const(*root_), handler.path);
        handler.callbacks.load(section ? *section : empty);
    }

    last_mtime_ = file_mtime_ms(config_path_);
    return ok;
}

bool ConfigManager::changedOnDisk() const
{
    auto mtime = file_mtime_ms(config_path_);
    return mtime != 0 && mtime != last_mtime_;
}

bool ConfigManager::save()
{
    last_error_.clear();

    if (!root_)
        root_ = std::make_unique<toml::table>();

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();

        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
            target = &output;

        for (const auto& entry : produced)
        {
            const std::string key(entry.first.str());
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) == handler.ownedKeys.end())
            {
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key
                             << "' (not in ownedKeys); stripping it";
            }
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    std::error_code ec;
    const fs::path target_path(config_path_);
    if (target_path.has_parent_path())
        fs::create_directories(target_path.parent_path(), ec);

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output << '\n';
    }

    fs::rename(tmp, target_path, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    last_mtime_ = file_mtime_ms(config_path_);
    *root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}


toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    const auto segments = split_path(path);
    if (segments.empty())
        return nullptr;

    toml::table* current = &root;
    for (const auto& segment : segments)
    {
        toml::node* node = current->get(segment);
        if (!node)
        {
            auto [it, inserted] = current->insert(segment, toml::table{});
            if (!inserted)
            {
                PLOG_WARNING << "Failed to create table at path segment: " << segment;
                return nullptr;
            }
            node = &it->second;
        }

        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    const auto segments = split_path(path);
    if (segments.empty())
        return nullptr;

    const toml::table* current = &root;
    for (const auto& segment : segments)
    {
        const toml::node* node = current->get(segment);
        if (!node)
            return nullptr;

        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}
