#pragma once

#include "../engine/ClaimPointsEngine.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

class ClaimPointConfig;

namespace claimpoints
{
class WaypointManager;
}

/**
 * @brief Parses `/cp` commands and turns scan outcomes into user messages
 *
 * Commands:
 *   /cp help
 *   /cp worlds
 *   /cp add|clean|update <world name>
 *   /cp waypoints show|hide|clear
 *   /cp waypoints set nameformat|alias|color <value>
 *
 * World names and setting values take the rest of the line. Scan commands
 * send `claimlist` to the server through the command sink and start the
 * matching engine session; the result is reported when the host passes the
 * terminal SessionOutcome to handleOutcome().
 */
class CommandDispatcher
{
public:
    using MessageSink = std::function<void(const std::string&)>;
    using ServerCommandSink = std::function<void(const std::string&)>;

    static constexpr std::string_view kCommandName = "/cp";
    static constexpr std::string_view kMessagePrefix = "[CP] ";
    static constexpr std::string_view kClaimListCommand = "claimlist";

    CommandDispatcher(claimpoints::ClaimPointsEngine& engine, claimpoints::WaypointManager& waypoints,
                      ClaimPointConfig& config, MessageSink messages, ServerCommandSink server);

    /// True for `/cp` and `/cp ...`.
    static bool IsCommand(std::string_view line);

    /// Run one command line. Returns false if the line is not a known command
    /// (a usage hint has been sent in that case).
    bool dispatch(const std::string& line,
                  claimpoints::ClaimPointsEngine::Clock::time_point now = claimpoints::ClaimPointsEngine::Clock::now());

    /// Report a terminal outcome and, for completed claim scans, reconcile
    /// and apply the result to the waypoint store. Non-terminal outcomes are
    /// ignored.
    void handleOutcome(const claimpoints::SessionOutcome& outcome);

    /// The config now holds a different pattern set than `previous`: move the
    /// existing ClaimPoints over and hand the new set to the engine.
    void adoptPatterns(const std::shared_ptr<const claimpoints::PatternSet>& previous);

private:
    void showHelp();
    void listWorlds(claimpoints::ClaimPointsEngine::Clock::time_point now);
    void scanFrom(const std::string& world, claimpoints::ScanKind kind,
                  claimpoints::ClaimPointsEngine::Clock::time_point now);
    bool handleWaypoints(std::string_view args);
    bool handleSet(std::string_view args);
    void setNameFormat(const std::string& name_format);
    void setAlias(const std::string& alias);
    void setColor(const std::string& color);

    void reportClaims(const claimpoints::SessionOutcome& outcome);
    void reportWorlds(const claimpoints::SessionOutcome& outcome);

    void send(const std::string& text) const;

    claimpoints::ClaimPointsEngine& engine_;
    claimpoints::WaypointManager& waypoints_;
    ClaimPointConfig& config_;
    MessageSink messages_;
    ServerCommandSink server_;
};
