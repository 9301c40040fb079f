#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
}

namespace rut
{
class RutError;
}

// rut-tool front end: parses the command line, loads configuration, sets up
// logging and runs one command against one value.
class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitInvalid = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    Application(std::vector<std::string> args, std::ostream& out, std::ostream& err);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string config_path;
        std::string command;
        std::string value;
        bool json = false;
        bool grouped = false;
        bool number_input = false;
        bool logging = true;
        bool show_help = false;
        bool show_version = false;
    };

    bool parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();

    int dispatch();
    std::string execute();
    void emitResult(const std::string& result);
    int emitFailure(const rut::RutError& error);
    void flushErrors();
    void printUsage(std::ostream& os) const;
    void cleanup();

    std::vector<std::string> args_;
    std::ostream& out_;
    std::ostream& err_;
    Options options_;
    std::unique_ptr<config::ConfigManager> config_;
    bool logging_initialized_ = false;
};
