#include "ClaimPointConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

using claimpoints::ClaimPointSettings;
using claimpoints::ConfigErrorInfo;
using claimpoints::PatternSet;

namespace
{

std::vector<std::string> read_string_array(const toml::table& section, const char* key,
                                           std::vector<std::string> fallback)
{
    const toml::array* arr = section[key].as_array();
    if (!arr)
        return fallback;

    std::vector<std::string> out;
    for (const auto& node : *arr)
    {
        if (auto str = node.value<std::string>())
            out.push_back(*str);
        else
            PLOG_WARNING << "Ignoring non-string entry in '" << key << "'";
    }
    return out;
}

toml::array to_array(const std::vector<std::string>& values)
{
    toml::array arr;
    for (const auto& value : values)
        arr.push_back(value);
    return arr;
}

} // namespace

ClaimPointConfig::ClaimPointConfig(ConfigManager& manager)
    : manager_(manager)
{
    manager_.registerTable("claimpoints",
                           { [this](const toml::table& t) { loadClaimPoints(t); },
                             [this]() { return saveClaimPoints(); } },
                           { "name_format", "alias", "color" });
    manager_.registerTable("griefprevention",
                           { [this](const toml::table& t) { loadGriefPrevention(t); },
                             [this]() { return saveGriefPrevention(); } },
                           { "first_line_pattern", "claim_line_pattern", "ignored_line_patterns",
                             "ending_line_patterns" });
    manager_.registerTable("scan",
                           { [this](const toml::table& t) { loadScan(t); }, [this]() { return saveScan(); } },
                           { "timeout_ms" });
}

bool ClaimPointConfig::load()
{
    const bool existed = manager_.fileExists();
    const bool parsed = manager_.load();
    return validate(parsed, existed);
}

bool ClaimPointConfig::reloadIfChanged()
{
    if (!manager_.changedOnDisk())
        return false;

    const auto previous = patterns_;
    const bool parsed = manager_.load();
    PLOG_INFO << "Config file changed, reloading " << manager_.path();
    validate(parsed, true);
    return patterns_ != previous;
}

bool ClaimPointConfig::validate(bool parsed, bool existed)
{
    ConfigErrorInfo error;
    patterns_ = PatternSet::Compile(settings_, &error);
    if (patterns_ && parsed)
    {
        PLOG_INFO << "Loaded ClaimPoints configuration from " << manager_.path();
        if (!existed && !manager_.save())
            PLOG_WARNING << "Could not write default configuration: " << manager_.lastError();
        return true;
    }

    if (!patterns_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Invalid ClaimPoints configuration, using defaults.",
                                            std::string(claimpoints::toString(error.code)) + ": " + error.message);
    }

    settings_ = ClaimPointSettings{};
    scan_timeout_ = claimpoints::kDefaultScanTimeout;
    patterns_ = PatternSet::Compile(settings_, &error);
    if (!patterns_)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration,
                                          "Built-in ClaimPoints defaults do not compile", error.message);
        return false;
    }

    PLOG_INFO << "Using default configuration.";
    if (!manager_.save())
        PLOG_WARNING << "Could not write default configuration: " << manager_.lastError();
    return false;
}

bool ClaimPointConfig::apply(const ClaimPointSettings& settings, ConfigErrorInfo* error)
{
    auto compiled = PatternSet::Compile(settings, error);
    if (!compiled)
        return false;

    settings_ = settings;
    patterns_ = std::move(compiled);
    if (!manager_.save())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Settings applied but could not be saved", manager_.lastError());
    }
    return true;
}

void ClaimPointConfig::loadClaimPoints(const toml::table& section)
{
    const ClaimPointSettings defaults;
    settings_.name_format = section["name_format"].value_or(defaults.name_format);
    settings_.alias = section["alias"].value_or(defaults.alias);
    settings_.color = section["color"].value_or(defaults.color);
}

void ClaimPointConfig::loadGriefPrevention(const toml::table& section)
{
    const ClaimPointSettings defaults;
    settings_.first_line_pattern = section["first_line_pattern"].value_or(defaults.first_line_pattern);
    settings_.claim_line_pattern = section["claim_line_pattern"].value_or(defaults.claim_line_pattern);
    settings_.ignored_line_patterns =
        read_string_array(section, "ignored_line_patterns", defaults.ignored_line_patterns);
    settings_.ending_line_patterns =
        read_string_array(section, "ending_line_patterns", defaults.ending_line_patterns);
}

void ClaimPointConfig::loadScan(const toml::table& section)
{
    const auto timeout = section["timeout_ms"].value_or(static_cast<int64_t>(claimpoints::kDefaultScanTimeout.count()));
    if (timeout > 0)
    {
        scan_timeout_ = std::chrono::milliseconds(timeout);
    }
    else
    {
        PLOG_WARNING << "Ignoring non-positive scan timeout " << timeout;
        scan_timeout_ = claimpoints::kDefaultScanTimeout;
    }
}

toml::table ClaimPointConfig::saveClaimPoints() const
{
    toml::table t;
    t.insert("name_format", settings_.name_format);
    t.insert("alias", settings_.alias);
    t.insert("color", settings_.color);
    return t;
}

toml::table ClaimPointConfig::saveGriefPrevention() const
{
    toml::table t;
    t.insert("first_line_pattern", settings_.first_line_pattern);
    t.insert("claim_line_pattern", settings_.claim_line_pattern);
    t.insert("ignored_line_patterns", to_array(settings_.ignored_line_patterns));
    t.insert("ending_line_patterns", to_array(settings_.ending_line_patterns));
    return t;
}

toml::table ClaimPointConfig::saveScan() const
{
    toml::table t;
    t.insert("timeout_ms", static_cast<int64_t>(scan_timeout_.count()));
    return t;
}
