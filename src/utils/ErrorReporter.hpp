#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging setup, command line
    Configuration,  // TOML parsing, invalid settings
    Input,          // identifier that cannot be decomposed
    Validation,     // identifier out of range or with a wrong check digit
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed
    Fatal    // The tool cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Message shown to the user
    std::string technical_details; // Input or context, for the log
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter for the command-line tool
 *
 * Logs each report through plog and queues it so the caller can present
 * the failures once the command has finished.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Validation,
 *                              "The RUT cannot be less than 1.000.000 ...",
 *                              "input: 999.999-9");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) {
 *       std::cerr << report.user_message << '\n';
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-facing message
     * @param technical_details Context for the log
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

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
