#pragma once

#include <functional>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace config
{
class ScanConfig;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Takes defaults from the [logging] section of cfg and prepares the log directory
    static bool Initialize(const config::ScanConfig& cfg);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Silences every registered logger and forgets the configuration
    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static bool UseConsole();
    // Console appenders attached so far, by LoggerConfig or by [logging] console
    static size_t ConsoleAppenderCount();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogDirectory();

    // "<log directory>/<file_name>"
    static std::string LogFilePath(const std::string& file_name);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_log_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<std::function<void()>> s_silencers;
    static size_t s_console_appenders;
};

} // namespace utils
