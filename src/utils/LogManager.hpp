#pragma once

#include <map>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
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
        size_t max_file_size = 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Records the defaults used by loggers that carry no override
    static bool Initialize(bool appendLogs, plog::Severity defaultLevel);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Silences the logger. plog keeps raw appender pointers, so appenders stay
    // owned here; a later RegisterLogger swaps in a new file appender.
    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();

    // Maps a configured level (0 = none .. 6 = verbose) to a plog severity
    static std::optional<plog::Severity> SeverityFromInt(long long level);

private:
    LogManager() = default;

    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    // Appenders currently attached to each plog instance; owned by s_appenders
    static std::map<int, plog::IAppender*> s_file_appenders;
    static std::map<int, plog::IAppender*> s_console_appenders;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
