#include "Reconciler.hpp"

#include <plog/Log.h>
#include <unordered_map>
#include <unordered_set>

namespace claimpoints
{

namespace
{

std::uint64_t positionKey(std::int32_t x, std::int32_t z)
{
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32) | static_cast<std::uint32_t>(z);
}

} // namespace

WaypointOp WaypointOp::makeCreate(std::int32_t x, std::int32_t z, std::string label, std::string alias, int color)
{
    WaypointOp op;
    op.type = WaypointOpType::Create;
    op.x = x;
    op.z = z;
    op.label = std::move(label);
    op.alias = std::move(alias);
    op.color = color;
    return op;
}

WaypointOp WaypointOp::makeDelete(const Waypoint& wp)
{
    WaypointOp op;
    op.type = WaypointOpType::Delete;
    op.target = wp.id;
    op.x = wp.x;
    op.z = wp.z;
    op.label = wp.label;
    return op;
}

WaypointOp WaypointOp::makeRelabel(const Waypoint& wp, std::string label)
{
    WaypointOp op;
    op.type = WaypointOpType::Relabel;
    op.target = wp.id;
    op.x = wp.x;
    op.z = wp.z;
    op.label = std::move(label);
    return op;
}

void ReconcileDiff::push(WaypointOp op)
{
    switch (op.type)
    {
    case WaypointOpType::Create:
        ++created;
        break;
    case WaypointOpType::Delete:
        ++deleted;
        break;
    case WaypointOpType::Relabel:
        ++relabeled;
        break;
    }
    ops.push_back(std::move(op));
}

Reconciler::Reconciler(const PatternSet& patterns)
    : patterns_(patterns)
{
}

std::vector<Reconciler::ClaimPoint> Reconciler::claimPoints(const std::vector<Waypoint>& waypoints) const
{
    std::vector<ClaimPoint> out;
    for (const auto& wp : waypoints)
    {
        if (auto size = patterns_.claimPointSize(wp.label, wp.alias, wp.color))
            out.push_back({ &wp, *size });
    }
    return out;
}

ReconcileDiff Reconciler::reconcile(const std::vector<ClaimRecord>& records, ScanKind kind,
                                    const std::vector<Waypoint>& waypoints) const
{
    ReconcileDiff diff;
    const auto existing = claimPoints(waypoints);

    // First record per position wins when the report repeats a corner.
    std::unordered_map<std::uint64_t, std::uint32_t> claimed;
    for (const auto& record : records)
        claimed.try_emplace(positionKey(record.x, record.z), record.size);

    std::vector<ClaimPoint> survivors;
    if (kind == ScanKind::Clean || kind == ScanKind::Update)
    {
        // The store is not per world: ClaimPoints of other worlds are
        // removed too unless a scanned claim shares their corner.
        for (const auto& cp : existing)
        {
            if (claimed.count(positionKey(cp.waypoint->x, cp.waypoint->z)) == 0)
                diff.push(WaypointOp::makeDelete(*cp.waypoint));
            else
                survivors.push_back(cp);
        }
    }

    if (kind == ScanKind::Add || kind == ScanKind::Update)
    {
        std::unordered_set<std::uint64_t> occupied;
        for (const auto& cp : existing)
            occupied.insert(positionKey(cp.waypoint->x, cp.waypoint->z));

        for (const auto& record : records)
        {
            if (!occupied.insert(positionKey(record.x, record.z)).second)
                continue;
            diff.push(WaypointOp::makeCreate(record.x, record.z, patterns_.formatName(record.size),
                                             patterns_.alias(), patterns_.colorIndex()));
        }
    }

    if (kind == ScanKind::Update)
    {
        for (const auto& cp : survivors)
        {
            const std::uint32_t fresh = claimed.at(positionKey(cp.waypoint->x, cp.waypoint->z));
            if (fresh != cp.size)
                diff.push(WaypointOp::makeRelabel(*cp.waypoint, patterns_.formatName(fresh)));
        }
    }

    PLOG_DEBUG << "Reconcile " << toString(kind) << ": " << records.size() << " claims, " << existing.size()
               << " ClaimPoints -> " << diff.created << " create, " << diff.deleted << " delete, " << diff.relabeled
               << " relabel";
    return diff;
}

} // namespace claimpoints
