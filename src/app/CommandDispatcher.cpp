#include "CommandDispatcher.hpp"

#include "../config/ClaimPointConfig.hpp"
#include "../utils/Utf8Utils.hpp"
#include "../waypoint/WaypointColors.hpp"
#include "../waypoint/WaypointManager.hpp"

#include <plog/Log.h>

#include <sstream>
#include <utility>

using claimpoints::ClaimPointsEngine;
using claimpoints::ScanKind;
using claimpoints::SessionOutcome;
using claimpoints::SessionStatus;
using claimpoints::SessionType;

namespace
{

std::string_view trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Split off the first word; `rest` receives the trimmed remainder.
std::string_view next_word(std::string_view s, std::string_view& rest)
{
    s = trim(s);
    const auto space = s.find_first_of(" \t");
    if (space == std::string_view::npos)
    {
        rest = {};
        return s;
    }
    rest = trim(s.substr(space));
    return s.substr(0, space);
}

const char* help_text()
{
    return "===============================================\n"
           "ClaimPoints - GriefPrevention claims as waypoints\n"
           "/cp worlds\n"
           "  Lists the GriefPrevention worlds in which you have active claims.\n"
           "/cp add <world>\n"
           "  Adds a ClaimPoint at the northwest corner of every claim in the world.\n"
           "/cp clean <world>\n"
           "  Removes all ClaimPoints that do not match a claim in the world.\n"
           "/cp update <world>\n"
           "  Combines add and clean, and updates the size of existing ClaimPoints.\n"
           "/cp waypoints show\n"
           "  Enables (shows) all ClaimPoints.\n"
           "/cp waypoints hide\n"
           "  Disables (hides) all ClaimPoints.\n"
           "/cp waypoints clear\n"
           "  Permanently deletes all ClaimPoints.\n"
           "/cp waypoints set nameformat <name format>\n"
           "  Sets the name format of all ClaimPoints. Use %d for the claim size.\n"
           "/cp waypoints set alias <alias>\n"
           "  Sets the alias (symbol) of all ClaimPoints.\n"
           "/cp waypoints set color <color>\n"
           "  Sets the color of all ClaimPoints.\n"
           "===============================================";
}

} // namespace

CommandDispatcher::CommandDispatcher(ClaimPointsEngine& engine, claimpoints::WaypointManager& waypoints,
                                     ClaimPointConfig& config, MessageSink messages, ServerCommandSink server)
    : engine_(engine)
    , waypoints_(waypoints)
    , config_(config)
    , messages_(std::move(messages))
    , server_(std::move(server))
{
}

bool CommandDispatcher::IsCommand(std::string_view line)
{
    line = trim(line);
    if (line.substr(0, kCommandName.size()) != kCommandName)
        return false;
    return line.size() == kCommandName.size() || line[kCommandName.size()] == ' ' ||
           line[kCommandName.size()] == '\t';
}

bool CommandDispatcher::dispatch(const std::string& line, ClaimPointsEngine::Clock::time_point now)
{
    if (!IsCommand(line))
        return false;

    std::string_view rest;
    next_word(line, rest); // "/cp"
    std::string_view args;
    const auto sub = next_word(rest, args);

    PLOG_DEBUG << "Command: " << line;

    if (sub.empty() || sub == "help")
    {
        showHelp();
        return true;
    }
    if (sub == "worlds")
    {
        listWorlds(now);
        return true;
    }
    if (sub == "add" || sub == "clean" || sub == "update")
    {
        if (args.empty())
        {
            send("Usage: /cp " + std::string(sub) + " <world>");
            return false;
        }
        const auto kind = sub == "add" ? ScanKind::Add : (sub == "clean" ? ScanKind::Clean : ScanKind::Update);
        scanFrom(std::string(args), kind, now);
        return true;
    }
    if (sub == "waypoints")
        return handleWaypoints(args);

    send("Unknown command '" + std::string(sub) + "'. Use /cp help.");
    return false;
}

void CommandDispatcher::showHelp()
{
    if (messages_)
        messages_(help_text());
}

void CommandDispatcher::listWorlds(ClaimPointsEngine::Clock::time_point now)
{
    if (!engine_.startWorldScan(now))
    {
        send("A claim list request is already in progress.");
        return;
    }
    if (server_)
        server_(std::string(kClaimListCommand));
}

void CommandDispatcher::scanFrom(const std::string& world, ScanKind kind, ClaimPointsEngine::Clock::time_point now)
{
    if (!engine_.startClaimScan(world, kind, now))
    {
        send("A claim list request is already in progress.");
        return;
    }
    if (server_)
        server_(std::string(kClaimListCommand));
}

bool CommandDispatcher::handleWaypoints(std::string_view args)
{
    std::string_view rest;
    const auto action = next_word(args, rest);
    const auto& patterns = *engine_.patterns();

    if (action == "show")
    {
        const auto shown = waypoints_.showClaimPoints(patterns);
        send("Enabled " + std::to_string(shown) + " ClaimPoints.");
        return true;
    }
    if (action == "hide")
    {
        const auto hidden = waypoints_.hideClaimPoints(patterns);
        send("Disabled " + std::to_string(hidden) + " ClaimPoints.");
        return true;
    }
    if (action == "clear")
    {
        const auto removed = waypoints_.clearClaimPoints(patterns);
        send("Removed all ClaimPoints (" + std::to_string(removed) + ").");
        return true;
    }
    if (action == "set")
        return handleSet(rest);

    send("Usage: /cp waypoints show|hide|clear|set");
    return false;
}

bool CommandDispatcher::handleSet(std::string_view args)
{
    std::string_view value;
    const auto key = next_word(args, value);
    if (value.empty() || (key != "nameformat" && key != "alias" && key != "color"))
    {
        send("Usage: /cp waypoints set nameformat|alias|color <value>");
        return false;
    }

    if (key == "nameformat")
        setNameFormat(std::string(value));
    else if (key == "alias")
        setAlias(std::string(value));
    else
        setColor(std::string(value));
    return true;
}

void CommandDispatcher::setNameFormat(const std::string& name_format)
{
    auto settings = config_.settings();
    settings.name_format = name_format;

    const auto previous = config_.patterns();
    claimpoints::ConfigErrorInfo error;
    if (!config_.apply(settings, &error))
    {
        PLOG_DEBUG << "Rejected name format: " << error.message;
        send("'" + name_format + "' is not a valid name format. Requires %d for claim size.");
        return;
    }
    adoptPatterns(previous);
    send("Set ClaimPoint name format to '" + name_format + "'.");
}

void CommandDispatcher::setAlias(const std::string& alias)
{
    auto settings = config_.settings();
    settings.alias = utils::truncateCodepoints(alias, claimpoints::PatternSet::kMaxAliasLength);

    const auto previous = config_.patterns();
    claimpoints::ConfigErrorInfo error;
    if (!config_.apply(settings, &error))
    {
        send("'" + alias + "' is not a valid alias. " + error.message);
        return;
    }
    adoptPatterns(previous);
    send("Set alias of all ClaimPoints to " + settings.alias);
}

void CommandDispatcher::setColor(const std::string& color)
{
    if (!claimpoints::colorIndex(color))
    {
        send("'" + color + "' is not a valid color ID.");
        return;
    }

    auto settings = config_.settings();
    settings.color = color;

    const auto previous = config_.patterns();
    claimpoints::ConfigErrorInfo error;
    if (!config_.apply(settings, &error))
    {
        send("'" + color + "' is not a valid color ID.");
        return;
    }
    adoptPatterns(previous);
    send("Set color of all ClaimPoints to " + color);
}

void CommandDispatcher::adoptPatterns(const std::shared_ptr<const claimpoints::PatternSet>& previous)
{
    const auto& current = config_.patterns();
    if (previous && current && previous != current)
    {
        const auto moved = waypoints_.migrateClaimPoints(*previous, *current);
        PLOG_INFO << "Migrated " << moved << " ClaimPoints to the new settings";
    }
    engine_.setPatterns(current);
}

void CommandDispatcher::handleOutcome(const SessionOutcome& outcome)
{
    if (!outcome.terminal())
        return;

    if (outcome.type == SessionType::Worlds)
        reportWorlds(outcome);
    else if (outcome.type == SessionType::Claims)
        reportClaims(outcome);
}

void CommandDispatcher::reportClaims(const SessionOutcome& outcome)
{
    if (outcome.status == SessionStatus::TimedOut)
    {
        send("No response from the server to the claim list request.");
        return;
    }

    if (outcome.records.empty())
    {
        send("No claims found in world '" + outcome.world + "'.");
        return;
    }

    const auto diff = engine_.reconcile(outcome.records, outcome.kind, waypoints_.store().list());
    const auto applied = waypoints_.apply(diff);
    PLOG_INFO << "Applied " << applied << " of " << diff.ops.size() << " waypoint operations for '" << outcome.world
              << "'";

    const std::string where = " ClaimPoints from claims in '" + outcome.world + "'.";
    switch (outcome.kind)
    {
    case ScanKind::Add:
        send("Added " + std::to_string(diff.created) + " new" + where);
        break;
    case ScanKind::Clean:
        send("Removed " + std::to_string(diff.deleted) + " ClaimPoints not matching claims in '" + outcome.world +
             "'.");
        break;
    case ScanKind::Update:
        send("Updated" + where.substr(0, where.size() - 1) + ": " + std::to_string(diff.created) + " added, " +
             std::to_string(diff.deleted) + " removed, " + std::to_string(diff.relabeled) + " relabeled.");
        break;
    }
}

void CommandDispatcher::reportWorlds(const SessionOutcome& outcome)
{
    if (outcome.status == SessionStatus::TimedOut)
    {
        send("No response from the server to the claim list request.");
        return;
    }

    if (outcome.worlds.empty())
    {
        send("No worlds with claims found.");
        return;
    }

    std::ostringstream oss;
    oss << "Claimed worlds: ";
    for (std::size_t i = 0; i < outcome.worlds.size(); ++i)
    {
        if (i > 0)
            oss << ", ";
        oss << outcome.worlds[i];
    }
    send(oss.str());
}

void CommandDispatcher::send(const std::string& text) const
{
    if (messages_)
        messages_(std::string(kMessagePrefix) + text);
}
