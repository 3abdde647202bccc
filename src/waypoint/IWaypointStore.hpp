#pragma once

#include "Waypoint.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace claimpoints
{

/**
 * @brief Persistent waypoint collection shared with the user's own waypoints
 *
 * The store is not partitioned by world. Mutators return false when the id
 * is unknown, which makes repeating an already-applied operation harmless.
 */
class IWaypointStore
{
public:
    virtual ~IWaypointStore() = default;

    /// Snapshot of every waypoint, in store order.
    virtual std::vector<Waypoint> list() const = 0;

    virtual WaypointId create(std::int32_t x, std::int32_t z, const std::string& label, const std::string& alias,
                              int color) = 0;
    virtual bool remove(WaypointId id) = 0;
    virtual bool relabel(WaypointId id, const std::string& label) = 0;
    virtual bool setVisible(WaypointId id, bool visible) = 0;
    virtual bool setAlias(WaypointId id, const std::string& alias) = 0;
    virtual bool setColor(WaypointId id, int color) = 0;

    virtual std::size_t count() const = 0;
};

} // namespace claimpoints
