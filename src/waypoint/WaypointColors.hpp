#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace claimpoints
{

// Minimap waypoint colour identifiers. The index is what the waypoint store
// persists, so the order must not change.
inline constexpr std::array<std::string_view, 16> kWaypointColorNames = {
    "black",    "dark_blue", "dark_green", "dark_aqua",    "dark_red", "dark_purple", "gold",   "gray",
    "dark_gray", "blue",     "green",      "aqua",         "red",      "light_purple", "yellow", "white",
};

inline std::optional<int> colorIndex(std::string_view name)
{
    for (std::size_t i = 0; i < kWaypointColorNames.size(); ++i)
    {
        if (kWaypointColorNames[i] == name)
            return static_cast<int>(i);
    }
    return std::nullopt;
}

inline std::string_view colorName(int index)
{
    if (index < 0 || static_cast<std::size_t>(index) >= kWaypointColorNames.size())
        return {};
    return kWaypointColorNames[static_cast<std::size_t>(index)];
}

} // namespace claimpoints
