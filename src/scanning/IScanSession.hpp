#pragma once

#include "ScanTypes.hpp"

#include <chrono>
#include <string>

namespace claimpoints
{

/**
 * @brief Interface for one scan of a claim list response
 *
 * A session is purely reactive: lines are pushed in with FeedLine() and the
 * owner drives the timeout through CheckTimeout(). Nothing runs in the
 * background.
 *
 * Lifecycle States:
 * 1. AwaitingStart - created, waiting for the report header
 * 2. Collecting - header seen, accumulating
 * 3. Completed / TimedOut - terminal, discarded by the owner
 */
class IScanSession
{
public:
    using Clock = std::chrono::steady_clock;

    virtual ~IScanSession() = default;

    /**
     * @brief Consume one chat line
     * @return true if the line moved the session or was accumulated
     */
    virtual bool FeedLine(const std::string& line) = 0;

    /**
     * @brief Move to TimedOut if the bound has elapsed without an ending line
     * @return true if this call timed the session out
     */
    virtual bool CheckTimeout(Clock::time_point now) = 0;

    virtual ScanState State() const = 0;

    /**
     * @brief Check whether the session still accepts lines
     */
    virtual bool IsActive() const = 0;
};

} // namespace claimpoints
