#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief plog setup shared by the main log and the scan trace
 *
 * Initialize() reads the [logging] table of the config file:
 *
 *   [logging]
 *   append = true        # keep the previous run's log files
 *   level = "info"       # plog severity name
 *   directory = "logs"
 *
 * It runs before the config layer, so it parses the file on its own and
 * silently keeps the defaults when the file is missing or broken. The config
 * layer reports parse errors once logging is up.
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename; // inside the log directory
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 5 * 1024 * 1024;
        int backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const std::string& config_path = "config.toml");

    /// Attach a rolling file appender (and optionally the console) to plog
    /// instance `InstanceId`.
    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static bool PrepareDirectory();

    static bool s_initialized;
    static bool s_append;
    static plog::Severity s_level;
    static std::string s_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
