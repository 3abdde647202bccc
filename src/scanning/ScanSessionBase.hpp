#pragma once

#include "IScanSession.hpp"
#include "LineClassifier.hpp"
#include "ScanSessionCreateInfo.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace claimpoints
{

/**
 * @brief Shared state machine for claim list scans
 *
 * Handles the parts every scan has in common:
 * - gating on the report header (AwaitingStart)
 * - line classification against the session's pattern set
 * - termination on an ending line or on timeout
 * - diagnostic counters
 *
 * Subclasses decide what a claim line contributes via OnClaimLine().
 */
class ScanSessionBase : public IScanSession
{
public:
    explicit ScanSessionBase(const ScanSessionCreateInfo& create_info);
    ~ScanSessionBase() override = default;

    bool FeedLine(const std::string& line) override;
    bool CheckTimeout(Clock::time_point now) override;
    ScanState State() const override { return state_; }
    bool IsActive() const override { return state_ == ScanState::AwaitingStart || state_ == ScanState::Collecting; }

    bool HasTimedOut(Clock::time_point now) const;

    std::size_t UnrecognizedCount() const { return unrecognized_; }
    std::size_t DroppedCount() const { return dropped_; }
    std::chrono::milliseconds Timeout() const { return timeout_; }
    const PatternSet& Patterns() const { return *patterns_; }

protected:
    /**
     * @brief Handle a claim line seen while Collecting
     * @return true if the line was accumulated
     */
    virtual bool OnClaimLine(const LineClassification& cls) = 0;

    virtual const char* Name() const = 0;

    std::size_t dropped_ = 0;

private:
    std::shared_ptr<const PatternSet> patterns_;
    ScanState state_ = ScanState::AwaitingStart;
    Clock::time_point started_at_;
    std::chrono::milliseconds timeout_;

    std::size_t unrecognized_ = 0;
    std::size_t lines_seen_ = 0;
};

} // namespace claimpoints
