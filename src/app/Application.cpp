#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "rut/CheckDigit.hpp"
#include "rut/RutErrors.hpp"
#include "rut/RutFormatter.hpp"
#include "rut/RutNormalizer.hpp"
#include "rut/RutValidator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <cstddef>
#include <iostream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

#ifndef CLRUT_VERSION
#define CLRUT_VERSION "unknown"
#endif

namespace
{

std::vector<std::string> collectArgs(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return args;
}

bool isKnownCommand(const std::string& command)
{
    static const char* const kCommands[] = { "validate", "format", "grouped", "dv", "add-dv", "strip", "decompose" };
    for (const char* known : kCommands)
    {
        if (command == known)
            return true;
    }
    return false;
}

} // namespace

Application::Application(int argc, char** argv)
    : Application(collectArgs(argc, argv), std::cout, std::cerr)
{
}

Application::Application(std::vector<std::string> args, std::ostream& out, std::ostream& err)
    : args_(std::move(args))
    , out_(out)
    , err_(err)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    try
    {
        if (!parseCommandLineArgs())
        {
            flushErrors();
            printUsage(err_);
            return kExitUsage;
        }

        if (options_.show_help)
        {
            printUsage(out_);
            return kExitOk;
        }

        if (options_.show_version)
        {
            out_ << "rut-tool " << CLRUT_VERSION << '\n';
            return kExitOk;
        }

        if (!initializeConfig())
        {
            flushErrors();
            return kExitUsage;
        }

        if (options_.logging && config_->config().logging.enabled && !initializeLogging())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                                "Continuing without a log file");
        }

        const int code = dispatch();
        flushErrors();
        return code;
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Unexpected failure", ex.what());
        flushErrors();
        return kExitUsage;
    }
}

bool Application::parseCommandLineArgs()
{
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        if (arg == "--help" || arg == "-h")
        {
            options_.show_help = true;
        }
        else if (arg == "--version")
        {
            options_.show_version = true;
        }
        else if (arg == "--json")
        {
            options_.json = true;
        }
        else if (arg == "--grouped")
        {
            options_.grouped = true;
        }
        else if (arg == "--number")
        {
            options_.number_input = true;
        }
        else if (arg == "--no-log")
        {
            options_.logging = false;
        }
        else if (arg == "--config")
        {
            if (i + 1 >= args_.size())
            {
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                                  "--config requires a path");
                return false;
            }
            options_.config_path = args_[++i];
        }
        else if (arg == "--")
        {
            positional.insert(positional.end(), args_.begin() + static_cast<std::ptrdiff_t>(i) + 1, args_.end());
            break;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Unknown option: " + arg);
            return false;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (options_.show_help || options_.show_version)
        return true;

    if (positional.size() != 2)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                          "Expected a command and exactly one value");
        return false;
    }

    options_.command = positional[0];
    options_.value = positional[1];

    if (!isKnownCommand(options_.command))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                          "Unknown command: " + options_.command);
        return false;
    }

    return true;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<config::ConfigManager>(
        options_.config_path.empty() ? std::string(config::ConfigManager::kDefaultPath) : options_.config_path);

    if (!config_->load())
        return false;

    // Explicit --config must point at an existing file
    if (!options_.config_path.empty() && !config_->fileFound())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                          "Configuration file not found: " + options_.config_path);
        return false;
    }

    const auto& output = config_->config().output;
    options_.json = options_.json || output.json;
    options_.grouped = options_.grouped || output.grouped;
    return true;
}

bool Application::initializeLogging()
{
    const auto& settings = config_->config().logging;
    const auto level = utils::LogManager::SeverityFromInt(settings.level).value_or(plog::info);

    if (!utils::LogManager::Initialize(settings.append, level))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system");
        return false;
    }

    logging_initialized_ = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                                  .filepath = settings.file,
                                                                  .append_override = std::nullopt,
                                                                  .level_override = std::nullopt,
                                                                  .max_file_size = settings.max_file_size,
                                                                  .backup_count = settings.backup_count,
                                                                  .add_console_appender = settings.console });
    if (logging_initialized_)
    {
        PLOG_INFO << "rut-tool " << options_.command << " \"" << options_.value << "\"";
    }
    return logging_initialized_;
}

int Application::dispatch()
{
    try
    {
        const std::string result = execute();
        PLOG_DEBUG << options_.command << " -> " << result;
        emitResult(result);
        return kExitOk;
    }
    catch (const rut::RutError& error)
    {
        return emitFailure(error);
    }
}

std::string Application::execute()
{
    const std::string& command = options_.command;
    const std::string& value = options_.value;

    if (command == "validate")
    {
        rut::validate(value, config_->config().limits);
        return rut::format(value);
    }

    if (command == "format" || command == "grouped")
    {
        const bool grouped = command == "grouped" || options_.grouped;
        if (options_.number_input)
        {
            const rut::RutNumber number = rut::parseNumber(value);
            return grouped ? rut::formatGrouped(number) : rut::format(number);
        }
        return grouped ? rut::formatGrouped(value) : rut::format(value);
    }

    if (command == "dv")
    {
        return std::string(1, rut::computeCheckDigit(rut::parseNumber(value)));
    }

    if (command == "add-dv")
    {
        return rut::appendCheckDigit(rut::parseNumber(value));
    }

    if (command == "strip")
    {
        return std::to_string(rut::removeCheckDigit(value));
    }

    // decompose
    const rut::RutParts parts = rut::decompose(value);
    return std::to_string(parts.number) + ' ' + parts.checkDigit;
}

void Application::emitResult(const std::string& result)
{
    if (options_.json)
    {
        json doc = { { "command", options_.command }, { "input", options_.value }, { "result", result } };
        if (options_.command == "validate")
        {
            doc["valid"] = true;
        }
        out_ << doc.dump() << '\n';
        return;
    }

    if (options_.command == "validate")
    {
        out_ << "OK " << result << '\n';
        return;
    }

    out_ << result << '\n';
}

int Application::emitFailure(const rut::RutError& error)
{
    const auto category = error.kind() == rut::ErrorKind::InvalidInput ? utils::ErrorCategory::Input
                                                                       : utils::ErrorCategory::Validation;
    utils::ErrorReporter::ReportError(category, error.what(), "input: " + options_.value);

    if (options_.json)
    {
        json doc = { { "command", options_.command },
                     { "input", options_.value },
                     { "error", error.what() },
                     { "kind", rut::toString(error.kind()) } };
        if (options_.command == "validate")
        {
            doc["valid"] = false;
        }
        out_ << doc.dump() << '\n';
    }

    return kExitInvalid;
}

void Application::flushErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        err_ << (report.severity == utils::ErrorSeverity::Warning ? "warning: " : "error: ") << report.user_message;
        if (report.category == utils::ErrorCategory::Configuration && !report.technical_details.empty())
        {
            err_ << " (" << report.technical_details << ")";
        }
        err_ << '\n';
    }
}

void Application::printUsage(std::ostream& os) const
{
    os << "usage: rut-tool [options] <command> <value>\n"
          "\n"
          "commands:\n"
          "  validate <rut>     check range and verification digit\n"
          "  format <rut>       compact form, 12345678-5\n"
          "  grouped <rut>      grouped form, 12.345.678-5\n"
          "  dv <number>        verification digit of a number\n"
          "  add-dv <number>    number followed by its verification digit\n"
          "  strip <rut>        numeric part without verification digit\n"
          "  decompose <rut>    numeric part and verification digit\n"
          "\n"
          "options:\n"
          "  --config <path>    settings file (default: rut-tool.toml)\n"
          "  --number           format/grouped take a number and compute the digit\n"
          "  --grouped          format prints the grouped form\n"
          "  --json             print results as JSON\n"
          "  --no-log           do not write a log file\n"
          "  --version          print the version\n"
          "  --help             show this message\n";
}

void Application::cleanup()
{
    if (logging_initialized_)
    {
        PLOG_INFO << "rut-tool finished";
        utils::LogManager::Shutdown();
        logging_initialized_ = false;
    }
}
