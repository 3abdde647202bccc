#pragma once

#include "IWaypointStore.hpp"
#include "../reconcile/ReconcileTypes.hpp"
#include "../scanning/PatternSet.hpp"

#include <cstddef>
#include <vector>

namespace claimpoints
{

/// Applies reconcile diffs and bulk ClaimPoint edits to a waypoint store.
/// "ClaimPoints" are always the waypoints the given pattern set recognises.
class WaypointManager
{
public:
    explicit WaypointManager(IWaypointStore& store);

    /// Apply operations in order. Returns how many took effect; operations
    /// whose target no longer exists, and creates that already happened,
    /// are skipped.
    std::size_t apply(const ReconcileDiff& diff);

    std::vector<Waypoint> claimPoints(const PatternSet& patterns) const;

    std::size_t showClaimPoints(const PatternSet& patterns);
    std::size_t hideClaimPoints(const PatternSet& patterns);

    /// Delete every ClaimPoint. Returns the number removed.
    std::size_t clearClaimPoints(const PatternSet& patterns);

    /// Rewrite the label, alias and colour of every ClaimPoint recognised by
    /// `from` so that `to` recognises it instead. Sizes are kept.
    std::size_t migrateClaimPoints(const PatternSet& from, const PatternSet& to);

    IWaypointStore& store() { return store_; }

private:
    std::size_t setVisibility(const PatternSet& patterns, bool visible);

    IWaypointStore& store_;
};

} // namespace claimpoints
