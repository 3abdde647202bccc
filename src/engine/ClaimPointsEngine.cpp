#include "ClaimPointsEngine.hpp"
#include "../reconcile/Reconciler.hpp"

#include <plog/Log.h>

namespace claimpoints
{

ClaimPointsEngine::ClaimPointsEngine(std::shared_ptr<const PatternSet> patterns, std::chrono::milliseconds timeout)
    : patterns_(std::move(patterns))
    , timeout_(timeout)
{
}

void ClaimPointsEngine::setPatterns(std::shared_ptr<const PatternSet> patterns)
{
    if (!patterns)
    {
        PLOG_WARNING << "ClaimPointsEngine: ignoring empty pattern set";
        return;
    }
    patterns_ = std::move(patterns);
}

bool ClaimPointsEngine::startClaimScan(const std::string& world, ScanKind kind, Clock::time_point now)
{
    if (hasActiveSession())
    {
        PLOG_WARNING << "ClaimPointsEngine: scan of '" << world << "' rejected, another scan is running";
        return false;
    }
    if (!patterns_)
        return false;

    claim_session_ = std::make_unique<ClaimScanSession>(
        ScanSessionCreateInfo{ .patterns = patterns_, .started_at = now, .timeout = timeout_ }, world, kind);
    PLOG_INFO << "ClaimPointsEngine: started " << toString(kind) << " scan of world '" << world << "'";
    return true;
}

bool ClaimPointsEngine::startWorldScan(Clock::time_point now)
{
    if (hasActiveSession())
    {
        PLOG_WARNING << "ClaimPointsEngine: world scan rejected, another scan is running";
        return false;
    }
    if (!patterns_)
        return false;

    world_session_ = std::make_unique<WorldScanSession>(
        ScanSessionCreateInfo{ .patterns = patterns_, .started_at = now, .timeout = timeout_ });
    PLOG_INFO << "ClaimPointsEngine: started world scan";
    return true;
}

ScanSessionBase* ClaimPointsEngine::activeSession() const
{
    if (claim_session_)
        return claim_session_.get();
    if (world_session_)
        return world_session_.get();
    return nullptr;
}

bool ClaimPointsEngine::hasActiveSession() const
{
    const ScanSessionBase* session = activeSession();
    return session && session->IsActive();
}

SessionType ClaimPointsEngine::activeSessionType() const
{
    if (claim_session_)
        return SessionType::Claims;
    if (world_session_)
        return SessionType::Worlds;
    return SessionType::None;
}

void ClaimPointsEngine::cancel()
{
    if (activeSession())
        PLOG_INFO << "ClaimPointsEngine: scan cancelled";
    claim_session_.reset();
    world_session_.reset();
}

SessionOutcome ClaimPointsEngine::pending() const
{
    SessionOutcome outcome;
    outcome.type = activeSessionType();
    outcome.status = outcome.type == SessionType::None ? SessionStatus::Idle : SessionStatus::Pending;
    return outcome;
}

SessionOutcome ClaimPointsEngine::feedLine(const std::string& line)
{
    ScanSessionBase* session = activeSession();
    if (!session)
        return pending();

    session->FeedLine(line);
    if (session->IsActive())
        return pending();
    return finish();
}

SessionOutcome ClaimPointsEngine::pollTimeout(Clock::time_point now)
{
    ScanSessionBase* session = activeSession();
    if (!session)
        return pending();

    session->CheckTimeout(now);
    if (session->IsActive())
        return pending();
    return finish();
}

SessionOutcome ClaimPointsEngine::finish()
{
    SessionOutcome outcome;
    outcome.type = activeSessionType();

    const ScanSessionBase* session = activeSession();
    outcome.status = session->State() == ScanState::Completed ? SessionStatus::Completed : SessionStatus::TimedOut;
    outcome.unrecognized = session->UnrecognizedCount();
    outcome.dropped = session->DroppedCount();

    if (claim_session_)
    {
        outcome.kind = claim_session_->Kind();
        outcome.world = claim_session_->World();
        outcome.records = claim_session_->TakeRecords();
        PLOG_INFO << "ClaimPointsEngine: " << toString(outcome.kind) << " scan of '" << outcome.world << "' "
                  << (outcome.status == SessionStatus::Completed ? "completed" : "timed out") << " with "
                  << outcome.records.size() << " claims";
    }
    else if (world_session_)
    {
        outcome.worlds = world_session_->Worlds();
        if (outcome.status == SessionStatus::Completed)
        {
            for (const auto& world : outcome.worlds)
            {
                if (known_world_set_.insert(world).second)
                    known_worlds_.push_back(world);
            }
        }
        PLOG_INFO << "ClaimPointsEngine: world scan "
                  << (outcome.status == SessionStatus::Completed ? "completed" : "timed out") << " with "
                  << outcome.worlds.size() << " worlds";
    }

    claim_session_.reset();
    world_session_.reset();
    return outcome;
}

ReconcileDiff ClaimPointsEngine::reconcile(const std::vector<ClaimRecord>& records, ScanKind kind,
                                           const std::vector<Waypoint>& waypoints) const
{
    return Reconciler(*patterns_).reconcile(records, kind, waypoints);
}

} // namespace claimpoints
