#include "WorldScanSession.hpp"

namespace claimpoints
{

WorldScanSession::WorldScanSession(const ScanSessionCreateInfo& create_info)
    : ScanSessionBase(create_info)
{
}

bool WorldScanSession::OnClaimLine(const LineClassification& cls)
{
    // Only the world name is used, so a bad number does not lose the line.
    if (cls.record.world.empty())
        return false;

    if (!seen_.insert(cls.record.world).second)
        return false;

    worlds_.push_back(cls.record.world);
    return true;
}

} // namespace claimpoints
