#pragma once

#include <string>
#include <vector>

namespace claimpoints
{

inline constexpr const char* kDefaultNameFormat = "Claim (%d)";
inline constexpr const char* kDefaultAlias = "CP";
inline constexpr const char* kDefaultColor = "white";
inline constexpr const char* kDefaultFirstLinePattern = R"(^-?\d+ blocks from play \+ -?\d+ bonus = -?\d+ total.$)";
inline constexpr const char* kDefaultClaimLinePattern = R"(^(.+): x(-?\d+), z(-?\d+) \(-?(\d+) blocks\)$)";
inline constexpr const char* kDefaultIgnoredLinePattern = R"(^Claims:$)";
inline constexpr const char* kDefaultEndingLinePattern = R"(^ = -?\d* blocks left to spend$)";

/// User-editable textual settings, as persisted. Compile into a PatternSet
/// before use; nothing here is validated.
struct ClaimPointSettings
{
    // ClaimPoint waypoint appearance
    std::string name_format = kDefaultNameFormat;
    std::string alias = kDefaultAlias;
    std::string color = kDefaultColor;

    // Claim list report layout
    std::string first_line_pattern = kDefaultFirstLinePattern;
    std::string claim_line_pattern = kDefaultClaimLinePattern;
    std::vector<std::string> ignored_line_patterns{ kDefaultIgnoredLinePattern };
    std::vector<std::string> ending_line_patterns{ kDefaultEndingLinePattern };

    bool operator==(const ClaimPointSettings&) const = default;
};

} // namespace claimpoints
