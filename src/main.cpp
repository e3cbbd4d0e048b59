#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Core models
#include "core/LogEntry.hpp"
#include "core/VerificationResult.hpp"

// Input
#include "input/FileReader.hpp"
#include "input/LogParser.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

// Analysis
#include "analysis/FrequencyAnalyzer.hpp"

// Verification
#include "verify/VerificationEngine.hpp"

// Reporting
#include "report/JsonReporter.hpp"
#include "report/ReportRenderer.hpp"

namespace Utils  = HiveVerify::Utils;
namespace Input  = HiveVerify::Input;
namespace Verify = HiveVerify::Verify;
namespace Report = HiveVerify::Report;

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string inputFile;
    std::optional<std::string> configFile;
    std::optional<std::string> tools;
    bool verbose = false;
    bool json = false;
    bool stats = false;
    bool help = false;
    std::string error; // non-empty on invocation error
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            if (++i < argc)
                opts.configFile = argv[i];
            else
                opts.error = "Option " + arg + " requires a file argument";
        }
        else if (arg == "--tools" || arg == "-t")
        {
            if (++i < argc)
                opts.tools = argv[i];
            else
                opts.error = "Option " + arg + " requires a tool list";
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--json")
        {
            opts.json = true;
        }
        else if (arg == "--stats")
        {
            opts.stats = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            opts.error = "Unknown option: " + arg;
        }
        else
        {
            positional.push_back(arg);
        }

        if (!opts.error.empty())
            return opts;
    }

    if (positional.size() == 1)
        opts.inputFile = positional.front();
    else if (!opts.help)
        opts.error = "Expected exactly one log file argument";

    return opts;
}

static void printUsage(std::ostream &os, const char *progName)
{
    os << "Usage: " << progName << " [OPTIONS] <log_file>\n\n"
       << "Verify that a captured HIVE tracing log shows a healthy run.\n\n"
       << "OPTIONS:\n"
       << "  -c, --config FILE        Config file (key = value)\n"
       << "  -t, --tools a,b,c        Expected tools (default: planner,spawn_agent,command,file_reader)\n"
       << "  --json                   Print the report as JSON\n"
       << "  --stats                  Append entry statistics\n"
       << "  -v, --verbose            Debug diagnostics on stderr\n"
       << "  -h, --help               Show this help\n\n"
       << "Exit status: 0 if every check passed, 1 otherwise.\n";
}

static int run(const CliOptions &opts)
{
    auto &logger = Utils::getLogger();
    auto &config = Utils::getGlobalConfig();

    if (opts.configFile)
    {
        if (!config.loadFromFile(*opts.configFile))
        {
            std::cerr << "Error: Cannot read config file " << *opts.configFile << "\n";
            return 1;
        }
    }

    if (auto levelName = config.getString("log_level"))
    {
        if (auto level = Utils::parseLogLevel(*levelName))
            logger.setLevel(*level);
        else
            logger.warn("Ignoring unknown log_level: " + *levelName);
    }
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);

    if (auto logFile = config.getString("log_file"))
    {
        if (!logger.setFile(*logFile))
            logger.warn("Cannot open log file " + *logFile + ", logging to stderr only");
    }

    if (opts.tools)
        config.set("expected_tools", *opts.tools);

    bool asJson = opts.json;
    if (!asJson)
    {
        const std::string format = Utils::toLower(config.getStringOr("report_format", "text"));
        if (format == "json")
            asJson = true;
        else if (format != "text")
            logger.warn("Ignoring unknown report_format: " + format);
    }
    const bool showStats = opts.stats || config.getBoolOr("show_stats", false);

    logger.info("Verifying " + opts.inputFile);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(opts.inputFile, ec))
    {
        std::cerr << "Error: Log file " << opts.inputFile << " does not exist\n";
        return 1;
    }

    const auto content = Input::readFile(opts.inputFile);
    if (!content)
    {
        std::cerr << "Error: Log file " << opts.inputFile << " cannot be read\n";
        return 1;
    }

    Input::LogParser parser;
    Input::LogParser::ParseStats parseStats;
    const auto entries = parser.parse(*content, &parseStats);
    logger.info("Parsed " + std::to_string(parseStats.parsedLines) + " entries, skipped " +
                std::to_string(parseStats.skippedLines) + " malformed lines");

    const auto options = Verify::VerificationOptions::fromConfig(config);
    const auto report = Verify::verifyEntries(entries, options);

    std::optional<HiveVerify::Analysis::FrequencyAnalyzer::FrequencyStats> stats;
    if (showStats)
    {
        HiveVerify::Analysis::FrequencyAnalyzer freq;
        freq.addEntries(entries);
        stats = freq.getStats();
    }

    if (asJson)
    {
        std::cout << Report::toJson(report, stats ? &*stats : nullptr);
        std::cout.flush();
    }
    else
    {
        Report::ReportRenderer renderer(Report::ReportRenderer::ColorMode::AUTO);
        if (auto colors = config.getBool("colors"); colors && !*colors)
            renderer.setColorMode(Report::ReportRenderer::ColorMode::NEVER);

        renderer.print(report);
        if (stats)
            renderer.printStatistics(*stats);
    }

    return Report::ReportRenderer::exitStatus(report);
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    if (!opts.error.empty())
    {
        std::cerr << "Error: " << opts.error << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    try
    {
        return run(opts);
    }
    catch (const std::exception &e)
    {
        Utils::getLogger().critical(std::string("Unhandled exception: ") + e.what());
        return 1;
    }
}
