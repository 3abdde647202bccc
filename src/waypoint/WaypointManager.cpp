#include "WaypointManager.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace claimpoints
{

WaypointManager::WaypointManager(IWaypointStore& store)
    : store_(store)
{
}

namespace
{

bool alreadyCreated(const std::vector<Waypoint>& waypoints, const WaypointOp& op)
{
    return std::any_of(waypoints.begin(), waypoints.end(), [&op](const Waypoint& wp) {
        return wp.samePosition(op.x, op.z) && wp.label == op.label && wp.alias == op.alias && wp.color == op.color;
    });
}

} // namespace

std::size_t WaypointManager::apply(const ReconcileDiff& diff)
{
    std::size_t applied = 0;
    for (const auto& op : diff.ops)
    {
        switch (op.type)
        {
        case WaypointOpType::Create:
            if (alreadyCreated(store_.list(), op))
            {
                PLOG_DEBUG << "WaypointManager: ClaimPoint at " << op.x << ", " << op.z << " already exists";
                break;
            }
            store_.create(op.x, op.z, op.label, op.alias, op.color);
            ++applied;
            break;
        case WaypointOpType::Delete:
            if (store_.remove(op.target))
                ++applied;
            else
                PLOG_WARNING << "WaypointManager: waypoint " << op.target << " vanished before delete";
            break;
        case WaypointOpType::Relabel:
            if (store_.relabel(op.target, op.label))
                ++applied;
            else
                PLOG_WARNING << "WaypointManager: waypoint " << op.target << " vanished before relabel";
            break;
        }
    }
    return applied;
}

std::vector<Waypoint> WaypointManager::claimPoints(const PatternSet& patterns) const
{
    std::vector<Waypoint> out;
    for (auto& wp : store_.list())
    {
        if (patterns.claimPointSize(wp.label, wp.alias, wp.color))
            out.push_back(std::move(wp));
    }
    return out;
}

std::size_t WaypointManager::showClaimPoints(const PatternSet& patterns) { return setVisibility(patterns, true); }

std::size_t WaypointManager::hideClaimPoints(const PatternSet& patterns) { return setVisibility(patterns, false); }

std::size_t WaypointManager::setVisibility(const PatternSet& patterns, bool visible)
{
    std::size_t changed = 0;
    for (const auto& wp : claimPoints(patterns))
    {
        if (store_.setVisible(wp.id, visible))
            ++changed;
    }
    PLOG_INFO << (visible ? "Enabled " : "Disabled ") << changed << " ClaimPoints";
    return changed;
}

std::size_t WaypointManager::clearClaimPoints(const PatternSet& patterns)
{
    std::size_t removed = 0;
    for (const auto& wp : claimPoints(patterns))
    {
        if (store_.remove(wp.id))
            ++removed;
    }
    PLOG_INFO << "Removed " << removed << " ClaimPoints";
    return removed;
}

std::size_t WaypointManager::migrateClaimPoints(const PatternSet& from, const PatternSet& to)
{
    std::size_t changed = 0;
    for (const auto& wp : store_.list())
    {
        auto size = from.claimPointSize(wp.label, wp.alias, wp.color);
        if (!size)
            continue;

        const std::string label = to.formatName(*size);
        bool touched = false;
        if (wp.label != label)
            touched |= store_.relabel(wp.id, label);
        if (wp.alias != to.alias())
            touched |= store_.setAlias(wp.id, to.alias());
        if (wp.color != to.colorIndex())
            touched |= store_.setColor(wp.id, to.colorIndex());
        if (touched)
            ++changed;
    }
    PLOG_INFO << "Updated " << changed << " ClaimPoints to format '" << to.nameFormat() << "', alias '" << to.alias()
              << "', color " << to.colorName();
    return changed;
}

} // namespace claimpoints
