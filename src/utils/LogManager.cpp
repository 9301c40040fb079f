#include "LogManager.hpp"
#include "ErrorReporter.hpp"

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
plog::Severity LogManager::s_default_level = plog::info;
std::map<int, plog::IAppender*> LogManager::s_file_appenders;
std::map<int, plog::IAppender*> LogManager::s_console_appenders;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(bool appendLogs, plog::Severity defaultLevel)
{
    s_append_logs = appendLogs;
    s_default_level = defaultLevel;
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

    plog::Severity level = config.level_override.value_or(s_default_level);

    try
    {
        PrepareLogDirectory(config.filepath);

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        auto logger = plog::get<InstanceId>();
        if (logger)
        {
            // Registered before: swap the file appender of the existing logger
            if (auto it = s_file_appenders.find(InstanceId); it != s_file_appenders.end())
            {
                logger->removeAppender(it->second);
            }
            logger->addAppender(file_appender.get());
            logger->setMaxSeverity(level);
        }
        else
        {
            logger = &plog::init<InstanceId>(level, file_appender.get());
        }
        s_file_appenders[InstanceId] = file_appender.get();
        s_appenders.push_back(std::move(file_appender));

        auto console = s_console_appenders.find(InstanceId);
        if (config.add_console_appender && console == s_console_appenders.end())
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger->addAppender(console_appender.get());
            s_console_appenders[InstanceId] = console_appender.get();
            s_appenders.push_back(std::move(console_appender));
        }
        else if (!config.add_console_appender && console != s_console_appenders.end())
        {
            logger->removeAppender(console->second);
            s_console_appenders.erase(console);
        }

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

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

std::optional<plog::Severity> LogManager::SeverityFromInt(long long level)
{
    if (level < plog::none || level > plog::verbose)
        return std::nullopt;
    return static_cast<plog::Severity>(level);
}

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
