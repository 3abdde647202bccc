#pragma once

#include <cstdint>
#include <string>

namespace claimpoints
{

using WaypointId = std::uint64_t;

struct Waypoint
{
    WaypointId id = 0;       // assigned by the store, never reused
    std::int32_t x = 0;
    std::int32_t z = 0;
    std::string label;
    std::string alias;       // short symbol drawn on the minimap
    int color = 0;           // index into kWaypointColorNames
    bool visible = true;

    bool samePosition(std::int32_t px, std::int32_t pz) const { return x == px && z == pz; }
};

} // namespace claimpoints
