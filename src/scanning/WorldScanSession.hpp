#pragma once

#include "ScanSessionBase.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace claimpoints
{

/// Harvests the distinct world names mentioned by a claim list response,
/// in first-seen order.
class WorldScanSession : public ScanSessionBase
{
public:
    explicit WorldScanSession(const ScanSessionCreateInfo& create_info);
    ~WorldScanSession() override = default;

    const std::vector<std::string>& Worlds() const { return worlds_; }

protected:
    bool OnClaimLine(const LineClassification& cls) override;
    const char* Name() const override { return "WorldScanSession"; }

private:
    std::vector<std::string> worlds_;
    std::unordered_set<std::string> seen_;
};

} // namespace claimpoints
