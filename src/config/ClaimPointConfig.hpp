#pragma once

#include "ConfigManager.hpp"
#include "../scanning/ClaimPointSettings.hpp"
#include "../scanning/PatternSet.hpp"
#include "../scanning/ScanSessionCreateInfo.hpp"

#include <chrono>
#include <memory>

/// Binds ClaimPointSettings to the [claimpoints], [griefprevention] and
/// [scan] tables of the config file and keeps the compiled PatternSet that
/// matches the persisted settings.
class ClaimPointConfig
{
public:
    explicit ClaimPointConfig(ConfigManager& manager);

    /**
     * @brief Load and validate the settings
     *
     * Invalid settings are replaced by the defaults, reported as a warning
     * and written back so the file is usable again.
     *
     * @return false if the defaults had to be used
     */
    bool load();

    /**
     * @brief Re-read the file if it changed on disk since the last load/save
     * @return true if a new pattern set is now in effect
     */
    bool reloadIfChanged();

    /**
     * @brief Validate and persist new settings
     * @return false (and nothing changes) if the settings do not compile
     */
    bool apply(const claimpoints::ClaimPointSettings& settings, claimpoints::ConfigErrorInfo* error = nullptr);

    const claimpoints::ClaimPointSettings& settings() const { return settings_; }
    const std::shared_ptr<const claimpoints::PatternSet>& patterns() const { return patterns_; }
    std::chrono::milliseconds scanTimeout() const { return scan_timeout_; }

private:
    bool validate(bool parsed, bool existed);
    void loadClaimPoints(const toml::table& section);
    void loadGriefPrevention(const toml::table& section);
    void loadScan(const toml::table& section);
    toml::table saveClaimPoints() const;
    toml::table saveGriefPrevention() const;
    toml::table saveScan() const;

    ConfigManager& manager_;
    claimpoints::ClaimPointSettings settings_;
    std::shared_ptr<const claimpoints::PatternSet> patterns_;
    std::chrono::milliseconds scan_timeout_ = claimpoints::kDefaultScanTimeout;
};
