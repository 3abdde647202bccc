#pragma once

#include "ClaimPointSettings.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace claimpoints
{

enum class ConfigError
{
    None,
    MissingPlaceholder, // name format must contain %d exactly once
    BadAlias,           // alias not UTF-8 or longer than kMaxAliasLength code points
    UnknownColor,       // colour not in kWaypointColorNames
    BadPattern          // regex does not compile, or claim pattern lacks 4 groups
};

struct ConfigErrorInfo
{
    ConfigError code = ConfigError::None;
    std::string message;
};

const char* toString(ConfigError error);

/**
 * @brief Immutable, validated set of compiled matchers
 *
 * Built once from ClaimPointSettings and shared read-only between the scan
 * sessions and the reconciler. Editing a setting means compiling a new set
 * and swapping the pointer; an instance is never modified after Compile().
 *
 * Every pattern is matched against the whole line (std::regex_match).
 */
class PatternSet
{
public:
    static constexpr std::string_view kSizePlaceholder = "%d";
    static constexpr std::size_t kMaxAliasLength = 2;
    static constexpr unsigned kClaimLineGroups = 4;

    /**
     * @brief Validate settings and compile every matcher
     * @param settings Textual settings
     * @param error Receives the failure reason (optional)
     * @return Compiled set, or nullptr when validation fails
     */
    static std::shared_ptr<const PatternSet> Compile(const ClaimPointSettings& settings,
                                                     ConfigErrorInfo* error = nullptr);

    /// Derive the label-matching regex source for a name format.
    /// Returns std::nullopt unless the placeholder occurs exactly once.
    static std::optional<std::string> BuildNamePattern(const std::string& name_format);

    const std::regex& start() const { return start_; }
    const std::regex& claim() const { return claim_; }
    const std::vector<std::regex>& ignored() const { return ignored_; }
    const std::vector<std::regex>& end() const { return end_; }
    const std::string& namePatternSource() const { return name_source_; }

    const ClaimPointSettings& settings() const { return settings_; }
    const std::string& nameFormat() const { return settings_.name_format; }
    const std::string& alias() const { return settings_.alias; }
    const std::string& colorName() const { return settings_.color; }
    int colorIndex() const { return color_index_; }

    /// Render a ClaimPoint label for the given claim size.
    std::string formatName(std::uint32_t size) const;

    /// Recover the size encoded in a label produced by formatName().
    std::optional<std::uint32_t> parseSize(const std::string& label) const;

    /// Size encoded in a waypoint that belongs to this ClaimPoint set: the
    /// label must match the name pattern and alias/colour must be ours.
    std::optional<std::uint32_t> claimPointSize(const std::string& label, const std::string& alias,
                                                int color) const;

private:
    PatternSet() = default;

    ClaimPointSettings settings_;
    std::regex start_;
    std::regex claim_;
    std::vector<std::regex> ignored_;
    std::vector<std::regex> end_;
    std::regex name_;
    std::string name_source_;
    std::string name_prefix_;
    std::string name_suffix_;
    int color_index_ = 0;
};

} // namespace claimpoints
