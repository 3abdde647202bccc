#pragma once

#include "ReconcileTypes.hpp"
#include "../scanning/PatternSet.hpp"
#include "../scanning/ScanTypes.hpp"

#include <vector>

namespace claimpoints
{

/**
 * @brief Computes the waypoint changes that bring the ClaimPoints in a
 *        waypoint snapshot in line with a completed claim scan
 *
 * Pure: the snapshot is only read, the caller applies the diff. Waypoints
 * are matched to claims by position only. Waypoints that are not
 * ClaimPoints (label, alias or colour differ from the pattern set) are
 * never touched.
 */
class Reconciler
{
public:
    explicit Reconciler(const PatternSet& patterns);

    ReconcileDiff reconcile(const std::vector<ClaimRecord>& records, ScanKind kind,
                            const std::vector<Waypoint>& waypoints) const;

private:
    struct ClaimPoint
    {
        const Waypoint* waypoint;
        std::uint32_t size;
    };

    std::vector<ClaimPoint> claimPoints(const std::vector<Waypoint>& waypoints) const;

    const PatternSet& patterns_;
};

} // namespace claimpoints
