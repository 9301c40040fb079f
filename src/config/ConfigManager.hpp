#pragma once

#include "ToolConfig.hpp"

#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace config
{

// Loads rut-tool settings from a TOML file. Keys that are absent keep their
// defaults; a missing file is not an error.
class ConfigManager
{
public:
    static constexpr const char* kDefaultPath = "rut-tool.toml";

    explicit ConfigManager(std::string path = kDefaultPath);

    bool load();
    bool loadFromString(std::string_view content);

    const ToolConfig& config() const { return config_; }

    const std::string& path() const { return config_path_; }

    bool fileFound() const { return file_found_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(const toml::table& root);
    bool applyValidation(const toml::table& section, ToolConfig& out);
    bool applyLogging(const toml::table& section, ToolConfig& out);
    bool applyOutput(const toml::table& section, ToolConfig& out);
    bool fail(const std::string& message);

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;
    ToolConfig config_;
};

} // namespace config
