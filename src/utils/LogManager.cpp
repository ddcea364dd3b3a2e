#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/ScanConfig.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = false;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<std::function<void()>> LogManager::s_silencers;
size_t LogManager::s_console_appenders = 0;

bool LogManager::Initialize(const config::ScanConfig& cfg)
{
    if (s_initialized)
        return true;

    const auto& logging = cfg.logging();
    s_append_logs = logging.append;
    s_console = logging.console;
    s_default_level = static_cast<plog::Severity>(logging.level);
    s_log_directory = logging.directory.empty() ? std::string(".") : logging.directory;

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::Severity level = config.level_override.value_or(s_default_level);

        auto& logger = plog::init<InstanceId>(level, file_appender.get());
        logger.setMaxSeverity(level);

        if (config.add_console_appender || s_console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
            ++s_console_appenders;
        }

        s_appenders.push_back(std::move(file_appender));
        s_silencers.emplace_back([]() {
            if (auto registered = plog::get<InstanceId>())
                registered->setMaxSeverity(plog::none);
        });
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    for (const auto& silence : s_silencers)
        silence();
    s_silencers.clear();

    // plog keeps raw appender pointers for the lifetime of the process, so the
    // appenders themselves stay alive; only the loggers are silenced.
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

bool LogManager::UseConsole() { return s_console; }

size_t LogManager::ConsoleAppenderCount() { return s_console_appenders; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetLogDirectory() { return s_log_directory; }

std::string LogManager::LogFilePath(const std::string& file_name)
{
    return (std::filesystem::path(s_log_directory) / file_name).string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   s_log_directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
