#pragma once

#include "rut/RutTypes.hpp"

#include <cstddef>
#include <string>

namespace config
{

struct LoggingSettings
{
    bool enabled = true;
    int level = 4; // plog::info
    std::string file = "logs/rut-tool.log";
    bool append = true;
    bool console = false;
    std::size_t max_file_size = 1024 * 1024;
    std::size_t backup_count = 3;
};

struct OutputSettings
{
    bool grouped = false; // "format" prints 12.345.678-5 instead of 12345678-5
    bool json = false;
};

struct ToolConfig
{
    rut::Limits limits;
    LoggingSettings logging;
    OutputSettings output;
};

} // namespace config
