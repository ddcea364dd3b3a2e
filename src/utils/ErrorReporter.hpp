#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger setup, log directory
    Configuration,  // TOML parsing, invalid keywords
    Pattern,        // Marker pattern construction
    Input,          // Unreadable input files
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded result, scan continues
    Error,   // Operation failed, caller can continue
    Fatal    // Caller should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short description of what failed
    std::string technical_details; // Paths, parser messages
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Logs every report through plog and keeps the most recent ones in a bounded
 * queue so that a caller (a validator, a CLI front end) can surface them.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Input,
 *                                "Failed to open input", "Path: docs/a.md");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short description
     * @param technical_details Details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Most recent pending report, or a default report when the queue is empty
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
