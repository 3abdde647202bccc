#include "Application.hpp"
#include "CommandDispatcher.hpp"
#include "config/ClaimPointConfig.hpp"
#include "config/ConfigManager.hpp"
#include "engine/ClaimPointsEngine.hpp"
#include "scanning/ScanDiagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "waypoint/JsonWaypointStore.hpp"
#include "waypoint/WaypointManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <vector>

namespace
{

constexpr auto kTickInterval = std::chrono::milliseconds(50);

} // namespace

Application::Application(int argc, char** argv)
    : lines_(std::make_shared<PendingQueue<std::string>>())
    , argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    if (!parseCommandLineArgs())
        return false;

    if (show_help_)
    {
        printUsage(argc_ > 0 ? argv_[0] : "claimpoints");
        return false;
    }

    if (!initializeLogging())
        return false;

    setupManagers();
    initialized_ = true;
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            config_path_);
        return false;
    }

    const std::optional<plog::Severity> level =
        verbose_ ? std::optional<plog::Severity>(plog::debug) : std::nullopt;

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filename = "run.log",
                                           .append_override = std::nullopt,
                                           .level_override = level,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = false });

    utils::LogManager::RegisterLogger<claimpoints::ScanDiagnostics::kLogInstance>(
        { .name = "scan",
          .filename = "scan.log",
          .append_override = std::nullopt,
          .level_override = level,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

    claimpoints::ScanDiagnostics::SetVerbose(verbose_);
    PLOG_INFO << "ClaimPoints starting (config " << config_path_ << ", waypoints " << waypoints_path_ << ")";
    return true;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            show_help_ = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            verbose_ = true;
        }
        else if ((std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--waypoints") == 0) && i + 1 < argc_)
        {
            (std::strcmp(arg, "--config") == 0 ? config_path_ : waypoints_path_) = argv_[++i];
        }
        else
        {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            printUsage(argc_ > 0 ? argv_[0] : "claimpoints");
            return false;
        }
    }
    return true;
}

void Application::printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [--config <file>] [--waypoints <file>] [--verbose]\n"
              << "Reads server chat lines and /cp commands from stdin.\n";
}

void Application::setupManagers()
{
    config_ = std::make_unique<ConfigManager>(config_path_);
    claim_config_ = std::make_unique<ClaimPointConfig>(*config_);
    claim_config_->load();

    store_ = std::make_unique<claimpoints::JsonWaypointStore>(waypoints_path_);
    if (!store_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Waypoints,
                                            "Waypoint changes will not be saved until the file is fixed",
                                            waypoints_path_);
    }
    waypoints_ = std::make_unique<claimpoints::WaypointManager>(*store_);

    engine_ = std::make_unique<claimpoints::ClaimPointsEngine>(claim_config_->patterns(), claim_config_->scanTimeout());

    dispatcher_ = std::make_unique<CommandDispatcher>(
        *engine_, *waypoints_, *claim_config_, [](const std::string& text) { std::cout << text << std::endl; },
        [](const std::string& command) { std::cout << "/" << command << std::endl; });
}

int Application::run()
{
    if (!initialize())
        return show_help_ ? 0 : -1;

    startReader();
    mainLoop();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
}

void Application::startReader()
{
    reader_ = std::thread([queue = lines_]() {
        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            queue->push(std::move(line));
            line.clear();
        }
        queue->close();
    });
}

void Application::mainLoop()
{
    while (running_)
    {
        processLines();
        tick();
        flushErrors();

        if (quit_requested_)
            running_ = false;
        else if (lines_->closed() && lines_->empty() && !engine_->hasActiveSession())
            running_ = false;
        else
            std::this_thread::sleep_for(kTickInterval);
    }
}

void Application::processLines()
{
    std::vector<std::string> batch;
    lines_->drain(batch);

    for (const auto& line : batch)
    {
        if (CommandDispatcher::IsCommand(line))
        {
            dispatcher_->dispatch(line);
            continue;
        }

        const auto outcome = engine_->feedLine(line);
        dispatcher_->handleOutcome(outcome);
    }
}

void Application::tick()
{
    dispatcher_->handleOutcome(engine_->pollTimeout(claimpoints::ClaimPointsEngine::Clock::now()));

    const auto previous = claim_config_->patterns();
    if (claim_config_->reloadIfChanged())
        dispatcher_->adoptPatterns(previous);
    engine_->setScanTimeout(claim_config_->scanTimeout());

    if (store_->dirty() && !store_->readOnly() && !store_->save())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Could not save waypoints",
                                          store_->lastError());
    }
}

void Application::flushErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << CommandDispatcher::kMessagePrefix << utils::ErrorReporter::Format(report, verbose_) << std::endl;

        if (report.is_fatal)
            requestExit();
    }
}

void Application::cleanup()
{
    if (initialized_ && store_ && store_->dirty())
    {
        if (store_->readOnly())
            PLOG_WARNING << "Discarding waypoint changes, " << store_->path() << " could not be read";
        else if (!store_->save())
            PLOG_ERROR << "Could not save waypoints on exit: " << store_->lastError();
    }

    if (reader_.joinable())
    {
        // The reader is blocked in getline until stdin closes.
        if (lines_->closed())
            reader_.join();
        else
            reader_.detach();
    }
}
