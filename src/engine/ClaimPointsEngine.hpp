#pragma once

#include "../reconcile/ReconcileTypes.hpp"
#include "../scanning/ClaimScanSession.hpp"
#include "../scanning/PatternSet.hpp"
#include "../scanning/WorldScanSession.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace claimpoints
{

enum class SessionStatus
{
    Idle,      // no session
    Pending,   // session waiting for or collecting the report
    Completed, // ending line seen; payload filled
    TimedOut   // no complete report in time; payload holds what was collected
};

enum class SessionType
{
    None,
    Claims,
    Worlds
};

struct SessionOutcome
{
    SessionStatus status = SessionStatus::Idle;
    SessionType type = SessionType::None;

    // Claims scans
    ScanKind kind = ScanKind::Add;
    std::string world;
    std::vector<ClaimRecord> records;

    // World scans
    std::vector<std::string> worlds;

    std::size_t unrecognized = 0;
    std::size_t dropped = 0;

    bool terminal() const { return status == SessionStatus::Completed || status == SessionStatus::TimedOut; }
};

/**
 * @brief Owner of the scan state for one host application
 *
 * Holds the current pattern set, at most one active scan session and the
 * worlds learnt from world scans. Single-threaded: the host feeds lines and
 * polls the timeout from the same thread.
 *
 * Usage:
 *   engine.startClaimScan("World1", ScanKind::Add);
 *   // for every chat line:
 *   auto outcome = engine.feedLine(line);
 *   // once per tick:
 *   outcome = engine.pollTimeout(Clock::now());
 *   if (outcome.status == SessionStatus::Completed)
 *       manager.apply(engine.reconcile(outcome.records, outcome.kind, store.list()));
 */
class ClaimPointsEngine
{
public:
    using Clock = std::chrono::steady_clock;

    explicit ClaimPointsEngine(std::shared_ptr<const PatternSet> patterns,
                               std::chrono::milliseconds timeout = kDefaultScanTimeout);

    /// Swap in a new pattern set. A running session keeps the set it started with.
    void setPatterns(std::shared_ptr<const PatternSet> patterns);
    const std::shared_ptr<const PatternSet>& patterns() const { return patterns_; }

    void setScanTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds scanTimeout() const { return timeout_; }

    /// Returns false while another session is active.
    bool startClaimScan(const std::string& world, ScanKind kind, Clock::time_point now = Clock::now());
    bool startWorldScan(Clock::time_point now = Clock::now());

    bool hasActiveSession() const;
    SessionType activeSessionType() const;

    /// Drop the active session without an outcome.
    void cancel();

    /// Feed one chat line. Returns the outcome when the line ended the session,
    /// otherwise Pending (session running) or Idle (no session).
    SessionOutcome feedLine(const std::string& line);

    /// Time the active session out if its bound has elapsed.
    SessionOutcome pollTimeout(Clock::time_point now);

    ReconcileDiff reconcile(const std::vector<ClaimRecord>& records, ScanKind kind,
                            const std::vector<Waypoint>& waypoints) const;

    /// Worlds seen by completed world scans, first-seen order.
    const std::vector<std::string>& getKnownWorlds() const { return known_worlds_; }

private:
    ScanSessionBase* activeSession() const;
    SessionOutcome pending() const;
    SessionOutcome finish();

    std::shared_ptr<const PatternSet> patterns_;
    std::chrono::milliseconds timeout_;

    std::unique_ptr<ClaimScanSession> claim_session_;
    std::unique_ptr<WorldScanSession> world_session_;

    std::vector<std::string> known_worlds_;
    std::unordered_set<std::string> known_world_set_;
};

} // namespace claimpoints
