#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <filesystem>
#include <cstdint>
#include <fstream>

namespace fs = std::filesystem;

namespace config
{

namespace
{

// Reads section[key] into out when present. Returns false and fills error
// when the key holds a value of another TOML type.
template <typename T>
bool readExact(const toml::table& section, std::string_view sectionName, std::string_view key, T& out,
               std::string& error)
{
    auto node = section[key];
    if (!node)
        return true;

    if (auto value = node.value_exact<T>())
    {
        out = *value;
        return true;
    }

    error = "[" + std::string(sectionName) + "] " + std::string(key) + " has the wrong type";
    return false;
}

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

bool ConfigManager::load()
{
    last_error_.clear();
    file_found_ = false;

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_DEBUG << "No configuration at " << config_path_ << ", using defaults";
        config_ = ToolConfig{};
        return true;
    }

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        return fail("cannot open config file: " + config_path_);
    }
    file_found_ = true;

    try
    {
        const toml::table root = toml::parse(ifs, config_path_);
        return apply(root);
    }
    catch (const toml::parse_error& pe)
    {
        std::string error_details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            error_details = "line " + std::to_string(pe.source().begin.line) + ": " + error_details;
        }
        return fail("config parse error in " + config_path_ + ", " + error_details);
    }
}

bool ConfigManager::loadFromString(std::string_view content)
{
    last_error_.clear();
    file_found_ = false;

    try
    {
        const toml::table root = toml::parse(content);
        return apply(root);
    }
    catch (const toml::parse_error& pe)
    {
        return fail("config parse error: " + std::string(pe.description()));
    }
}

bool ConfigManager::apply(const toml::table& root)
{
    ToolConfig loaded;

    if (auto node = root["validation"])
    {
        const toml::table* section = node.as_table();
        if (!section)
            return fail("[validation] must be a table");
        if (!applyValidation(*section, loaded))
            return false;
    }

    if (auto node = root["logging"])
    {
        const toml::table* section = node.as_table();
        if (!section)
            return fail("[logging] must be a table");
        if (!applyLogging(*section, loaded))
            return false;
    }

    if (auto node = root["output"])
    {
        const toml::table* section = node.as_table();
        if (!section)
            return fail("[output] must be a table");
        if (!applyOutput(*section, loaded))
            return false;
    }

    config_ = loaded;
    return true;
}

bool ConfigManager::applyValidation(const toml::table& section, ToolConfig& out)
{
    std::string error;
    std::int64_t minimum = out.limits.minimum;
    std::int64_t maximum = out.limits.maximum;
    if (!readExact(section, "validation", "minimum", minimum, error) ||
        !readExact(section, "validation", "maximum", maximum, error))
    {
        return fail(error);
    }

    if (minimum < 0 || maximum < 0)
        return fail("[validation] bounds cannot be negative");
    if (minimum > maximum)
        return fail("[validation] minimum " + std::to_string(minimum) + " is greater than maximum " +
                    std::to_string(maximum));

    out.limits.minimum = minimum;
    out.limits.maximum = maximum;
    return true;
}

bool ConfigManager::applyLogging(const toml::table& section, ToolConfig& out)
{
    std::string error;
    std::int64_t level = out.logging.level;
    std::int64_t max_file_size = static_cast<std::int64_t>(out.logging.max_file_size);
    std::int64_t backup_count = static_cast<std::int64_t>(out.logging.backup_count);

    if (!readExact(section, "logging", "enabled", out.logging.enabled, error) ||
        !readExact(section, "logging", "level", level, error) ||
        !readExact(section, "logging", "file", out.logging.file, error) ||
        !readExact(section, "logging", "append", out.logging.append, error) ||
        !readExact(section, "logging", "console", out.logging.console, error) ||
        !readExact(section, "logging", "max_file_size", max_file_size, error) ||
        !readExact(section, "logging", "backup_count", backup_count, error))
    {
        return fail(error);
    }

    if (level < 0 || level > 6)
        return fail("[logging] level must be between 0 and 6, found " + std::to_string(level));
    if (max_file_size < 0 || backup_count < 0)
        return fail("[logging] max_file_size and backup_count cannot be negative");
    if (out.logging.file.empty())
        return fail("[logging] file cannot be empty");

    out.logging.level = static_cast<int>(level);
    out.logging.max_file_size = static_cast<std::size_t>(max_file_size);
    out.logging.backup_count = static_cast<std::size_t>(backup_count);
    return true;
}

bool ConfigManager::applyOutput(const toml::table& section, ToolConfig& out)
{
    std::string error;
    if (!readExact(section, "output", "grouped", out.output.grouped, error) ||
        !readExact(section, "output", "json", out.output.json, error))
    {
        return fail(error);
    }
    return true;
}

bool ConfigManager::fail(const std::string& message)
{
    last_error_ = message;
    PLOG_WARNING << last_error_;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                      last_error_ + "\nFile: " + config_path_);
    return false;
}

} // namespace config
