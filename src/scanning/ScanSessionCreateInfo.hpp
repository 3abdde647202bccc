#pragma once

#include "PatternSet.hpp"

#include <chrono>
#include <memory>

namespace claimpoints
{

inline constexpr std::chrono::milliseconds kDefaultScanTimeout{ 5000 };

struct ScanSessionCreateInfo
{
    std::shared_ptr<const PatternSet> patterns;

    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    std::chrono::milliseconds timeout = kDefaultScanTimeout;
};

} // namespace claimpoints
