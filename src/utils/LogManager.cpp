#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../scanning/ScanDiagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append = true;
plog::Severity LogManager::s_level = plog::info;
std::string LogManager::s_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    if (!PrepareDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging used before initialization", config.name);
        return false;
    }

    const std::string path = (fs::path(s_directory) / config.filename).string();
    if (!config.append_override.value_or(s_append))
    {
        std::error_code ec;
        fs::remove(path, ec);
    }

    try
    {
        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, config.backup_count);
        plog::Logger<InstanceId>& logger = plog::init<InstanceId>(config.level_override.value_or(s_level), file.get());
        s_appenders.push_back(std::move(file));

        if (config.add_console_appender)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Could not open log file " + path, ex.what());
        return false;
    }
    return true;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<claimpoints::ScanDiagnostics::kLogInstance>(const LoggerConfig&);

bool LogManager::PrepareDirectory()
{
    std::error_code ec;
    fs::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create log directory " + s_directory,
                                     ec.message());
        return false;
    }
    return true;
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!fs::exists(config_path, ec))
        return;

    try
    {
        const toml::table cfg = toml::parse_file(config_path);
        const auto logging = cfg["logging"];

        s_append = logging["append"].value_or(s_append);
        s_directory = logging["directory"].value_or(s_directory);

        if (auto level = logging["level"].value<std::string>())
        {
            const plog::Severity parsed = plog::severityFromString(level->c_str());
            if (parsed != plog::none || *level == "none")
                s_level = parsed;
        }
    }
    catch (const toml::parse_error&)
    {
        // Reported by the config layer after logging is up.
    }
}

} // namespace utils
