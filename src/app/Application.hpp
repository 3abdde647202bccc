#pragma once

#include "../utils/PendingQueue.hpp"

#include <memory>
#include <string>
#include <thread>

class ConfigManager;
class ClaimPointConfig;
class CommandDispatcher;

namespace claimpoints
{
class ClaimPointsEngine;
class JsonWaypointStore;
class WaypointManager;
} // namespace claimpoints

/**
 * @brief Console host for the ClaimPoints engine
 *
 * Reads chat lines from stdin on a reader thread. Lines starting with `/cp`
 * are commands; everything else is server chat fed to the active scan.
 * User messages go to stdout, outgoing server commands are written to stdout
 * as `/<command>`.
 */
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    bool initialize();
    bool initializeLogging();
    bool parseCommandLineArgs();
    void setupManagers();

    void startReader();
    void mainLoop();
    void processLines();
    void tick();
    void flushErrors();

    void cleanup();

    static void printUsage(const char* argv0);

    std::string config_path_ = "config.toml";
    std::string waypoints_path_ = "waypoints.json";
    bool verbose_ = false;
    bool show_help_ = false;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<ClaimPointConfig> claim_config_;
    std::unique_ptr<claimpoints::JsonWaypointStore> store_;
    std::unique_ptr<claimpoints::WaypointManager> waypoints_;
    std::unique_ptr<claimpoints::ClaimPointsEngine> engine_;
    std::unique_ptr<CommandDispatcher> dispatcher_;

    // Shared with the reader thread, which may outlive an early exit.
    std::shared_ptr<PendingQueue<std::string>> lines_;
    std::thread reader_;

    bool quit_requested_ = false;
    bool running_ = true;
    bool initialized_ = false;

    int argc_ = 0;
    char** argv_ = nullptr;
};
