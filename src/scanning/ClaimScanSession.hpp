#pragma once

#include "ScanSessionBase.hpp"

#include <string>
#include <vector>

namespace claimpoints
{

/// Collects the claims of one world from a claim list response.
class ClaimScanSession : public ScanSessionBase
{
public:
    ClaimScanSession(const ScanSessionCreateInfo& create_info, std::string world, ScanKind kind);
    ~ClaimScanSession() override = default;

    const std::string& World() const { return world_; }
    ScanKind Kind() const { return kind_; }

    // Arrival order, duplicates kept.
    const std::vector<ClaimRecord>& Records() const { return records_; }
    std::vector<ClaimRecord> TakeRecords() { return std::move(records_); }

    // Claim lines that belonged to another world.
    std::size_t FilteredCount() const { return filtered_; }

protected:
    bool OnClaimLine(const LineClassification& cls) override;
    const char* Name() const override { return "ClaimScanSession"; }

private:
    std::string world_;
    ScanKind kind_;
    std::vector<ClaimRecord> records_;
    std::size_t filtered_ = 0;
};

} // namespace claimpoints
