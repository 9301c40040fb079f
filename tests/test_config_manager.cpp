#include <catch2/catch_test_macros.hpp>

#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using config::ConfigManager;

namespace
{

// Writes a TOML file into the temp directory and removes it on destruction
class TempConfigFile
{
public:
    TempConfigFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / name)
    {
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string getPath() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("ConfigManager - Defaults", "[config]")
{
    ConfigManager manager("definitely_missing_rut_tool_config.toml");

    REQUIRE(manager.load());
    REQUIRE_FALSE(manager.fileFound());

    const auto& cfg = manager.config();
    REQUIRE(cfg.limits.minimum == 1000000);
    REQUIRE(cfg.limits.maximum == 99999999);
    REQUIRE(cfg.logging.enabled);
    REQUIRE(cfg.logging.level == 4);
    REQUIRE(cfg.logging.file == "logs/rut-tool.log");
    REQUIRE_FALSE(cfg.output.grouped);
    REQUIRE_FALSE(cfg.output.json);
}

TEST_CASE("ConfigManager - Loads all sections", "[config]")
{
    TempConfigFile file("clrut_config_full.toml", R"(
[validation]
minimum = 10
maximum = 500

[logging]
enabled = false
level = 6
file = "custom/rut.log"
append = false
console = true
max_file_size = 2048
backup_count = 1

[output]
grouped = true
json = true
)");

    ConfigManager manager(file.getPath());
    REQUIRE(manager.load());
    REQUIRE(manager.fileFound());

    const auto& cfg = manager.config();
    REQUIRE(cfg.limits.minimum == 10);
    REQUIRE(cfg.limits.maximum == 500);
    REQUIRE_FALSE(cfg.logging.enabled);
    REQUIRE(cfg.logging.level == 6);
    REQUIRE(cfg.logging.file == "custom/rut.log");
    REQUIRE_FALSE(cfg.logging.append);
    REQUIRE(cfg.logging.console);
    REQUIRE(cfg.logging.max_file_size == 2048);
    REQUIRE(cfg.logging.backup_count == 1);
    REQUIRE(cfg.output.grouped);
    REQUIRE(cfg.output.json);
}

TEST_CASE("ConfigManager - Partial sections keep defaults", "[config]")
{
    ConfigManager manager;
    REQUIRE(manager.loadFromString("[validation]\nmaximum = 200000000\n"));
    REQUIRE(manager.config().limits.minimum == 1000000);
    REQUIRE(manager.config().limits.maximum == 200000000);
    REQUIRE(manager.config().logging.level == 4);
}

TEST_CASE("ConfigManager - Rejects invalid settings", "[config]")
{
    utils::ErrorReporter::ClearErrors();
    ConfigManager manager;

    SECTION("Syntax error")
    {
        REQUIRE_FALSE(manager.loadFromString("[validation\nminimum = 1"));
        REQUIRE(std::string(manager.lastError()).find("config parse error") != std::string::npos);
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("Wrong value type")
    {
        REQUIRE_FALSE(manager.loadFromString("[validation]\nminimum = \"one million\"\n"));
        REQUIRE(std::string(manager.lastError()) == "[validation] minimum has the wrong type");
    }

    SECTION("Section that is not a table")
    {
        REQUIRE_FALSE(manager.loadFromString("logging = 3\n"));
        REQUIRE(std::string(manager.lastError()) == "[logging] must be a table");
    }

    SECTION("Inverted range")
    {
        REQUIRE_FALSE(manager.loadFromString("[validation]\nminimum = 100\nmaximum = 10\n"));
        REQUIRE(std::string(manager.lastError()) == "[validation] minimum 100 is greater than maximum 10");
    }

    SECTION("Negative bound")
    {
        REQUIRE_FALSE(manager.loadFromString("[validation]\nminimum = -1\n"));
    }

    SECTION("Log level out of range")
    {
        REQUIRE_FALSE(manager.loadFromString("[logging]\nlevel = 9\n"));
        REQUIRE(std::string(manager.lastError()) == "[logging] level must be between 0 and 6, found 9");
    }

    SECTION("A failed load keeps the previous configuration")
    {
        REQUIRE(manager.loadFromString("[output]\njson = true\n"));
        REQUIRE_FALSE(manager.loadFromString("[output]\njson = 1\n"));
        REQUIRE(manager.config().output.json);
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("ConfigManager - Syntax error in file", "[config]")
{
    utils::ErrorReporter::ClearErrors();
    TempConfigFile file("clrut_config_broken.toml", "[output]\ngrouped = \n");

    ConfigManager manager(file.getPath());
    REQUIRE_FALSE(manager.load());
    REQUIRE(manager.fileFound());
    REQUIRE(std::string(manager.lastError()).find("line 2") != std::string::npos);

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("ConfigManager - Loading from a string forgets the file", "[config]")
{
    TempConfigFile file("clrut_config_then_string.toml", "[output]\ngrouped = true\n");

    ConfigManager manager(file.getPath());
    REQUIRE(manager.load());
    REQUIRE(manager.fileFound());

    REQUIRE(manager.loadFromString("[output]\njson = true\n"));
    REQUIRE_FALSE(manager.fileFound());
    REQUIRE(manager.config().output.json);
}
