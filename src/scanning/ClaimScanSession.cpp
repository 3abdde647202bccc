#include "ClaimScanSession.hpp"

namespace claimpoints
{

ClaimScanSession::ClaimScanSession(const ScanSessionCreateInfo& create_info, std::string world, ScanKind kind)
    : ScanSessionBase(create_info)
    , world_(std::move(world))
    , kind_(kind)
{
}

bool ClaimScanSession::OnClaimLine(const LineClassification& cls)
{
    if (cls.record.world != world_)
    {
        ++filtered_;
        return false;
    }

    if (!cls.hasRecord())
    {
        ++dropped_;
        return false;
    }

    ClaimRecord record = cls.record;
    record.world = world_;
    records_.push_back(std::move(record));
    return true;
}

} // namespace claimpoints
