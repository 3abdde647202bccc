#pragma once

#include "../waypoint/Waypoint.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace claimpoints
{

enum class WaypointOpType
{
    Create,
    Delete,
    Relabel
};

struct WaypointOp
{
    WaypointOpType type = WaypointOpType::Create;
    WaypointId target = 0; // Delete / Relabel
    std::int32_t x = 0;
    std::int32_t z = 0;
    std::string label;     // Create / Relabel
    std::string alias;     // Create
    int color = 0;         // Create

    static WaypointOp makeCreate(std::int32_t x, std::int32_t z, std::string label, std::string alias, int color);
    static WaypointOp makeDelete(const Waypoint& wp);
    static WaypointOp makeRelabel(const Waypoint& wp, std::string label);
};

/// Ordered list of waypoint operations: deletes, then creates, then relabels.
/// Each operation is safe to apply on its own.
struct ReconcileDiff
{
    std::vector<WaypointOp> ops;
    std::size_t created = 0;
    std::size_t deleted = 0;
    std::size_t relabeled = 0;

    bool empty() const { return ops.empty(); }
    void push(WaypointOp op);
};

} // namespace claimpoints
