#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "input/FileReader.hpp"
#include "input/RecordParser.hpp"
#include "pipeline/IncidentProcessor.hpp"
#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace
{
    constexpr int kExitOk        = 0;
    constexpr int kExitUsage     = 1;
    constexpr int kExitMalformed = 2;

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::string           alertsFile;
        std::string           metricsFile;
        std::string           configFile;
        std::optional<double> quality;
        bool                  verbose = false;
        bool                  json = false;
        bool                  pretty = false;
        bool                  help = false;
        std::string           error;
    };

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        const auto needValue = [&](int &i, const std::string &flag) -> std::optional<std::string> {
            if (i + 1 >= argc)
            {
                opts.error = flag + " requires a value";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        for (int i = 1; i < argc && opts.error.empty(); ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--alerts" || arg == "-a")
            {
                if (auto v = needValue(i, arg)) opts.alertsFile = *v;
            }
            else if (arg == "--metrics" || arg == "-m")
            {
                if (auto v = needValue(i, arg)) opts.metricsFile = *v;
            }
            else if (arg == "--config" || arg == "-c")
            {
                if (auto v = needValue(i, arg)) opts.configFile = *v;
            }
            else if (arg == "--quality" || arg == "-q")
            {
                if (auto v = needValue(i, arg))
                {
                    opts.quality = OpsTriage::Utils::parseFloat<double>(*v);
                    if (!opts.quality || *opts.quality < 0.0 || *opts.quality > 1.0)
                        opts.error = "--quality expects a number in [0, 1]";
                }
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (arg == "--pretty")
            {
                opts.json = true;
                opts.pretty = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else
            {
                opts.error = "unknown argument '" + arg + "'";
            }
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " --alerts FILE [OPTIONS]\n\n"
            << "OPTIONS:\n"
            << "  -a, --alerts FILE        Alerts, one JSON object per line (required)\n"
            << "  -m, --metrics FILE       Metric points, one JSON object per line\n"
            << "  -c, --config FILE        key = value configuration file\n"
            << "  -q, --quality Q          Observed outcome quality in [0, 1] to learn from\n"
            << "                           (held in memory for this run only; nothing is persisted)\n"
            << "  -v, --verbose            Debug logging\n"
            << "  --json                   Print the incident report as JSON\n"
            << "  --pretty                 Print the incident report as indented JSON\n"
            << "  -h, --help               Show this help\n\n"
            << "Exit codes: 0 success, 1 usage or I/O error, 2 malformed input.\n";
    }
} // namespace

int main(int argc, char *argv[])
{
    using namespace OpsTriage;

    const auto opts = parseArgs(argc, argv);
    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (!opts.error.empty() || opts.alertsFile.empty())
    {
        std::cerr << "Error: " << (opts.error.empty() ? "--alerts is required" : opts.error) << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto &logger = Utils::getLogger();

    // Configuration
    Utils::ConfigLoader loader;
    if (!opts.configFile.empty() && !loader.loadFromFile(opts.configFile))
    {
        logger.log(Utils::LogLevel::ERROR, "Config", "cannot read config file '" + opts.configFile + "'");
        return kExitUsage;
    }

    core::EngineConfig config;
    try
    {
        config = core::loadEngineConfig(loader);
    }
    catch (const core::MalformedInputError &e)
    {
        logger.log(Utils::LogLevel::ERROR, "Config", e.what());
        return kExitUsage;
    }

    if (const auto level = Utils::parseLogLevel(config.logLevel))
        logger.setLevel(*level);
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);
    if (!config.logFile.empty() && !logger.setFile(config.logFile))
        logger.log(Utils::LogLevel::WARN, "Config", "cannot open log file '" + config.logFile + "', console only");

    // Input
    Input::RecordParser parser;

    Input::FileReader alertReader(opts.alertsFile);
    if (!alertReader.isOpen())
    {
        logger.log(Utils::LogLevel::ERROR, "Input", "cannot open alerts file '" + opts.alertsFile + "'");
        return kExitUsage;
    }

    std::vector<core::AlertRecord> alerts;
    try
    {
        alerts = parser.readAlerts(alertReader);
    }
    catch (const core::MalformedInputError &e)
    {
        logger.log(Utils::LogLevel::ERROR, "Input", e.what());
        return kExitMalformed;
    }
    logger.log(Utils::LogLevel::INFO, "Input", "read " + std::to_string(alerts.size()) + " alert(s)");

    std::vector<core::MetricPoint> metrics;
    if (!opts.metricsFile.empty())
    {
        Input::FileReader metricReader(opts.metricsFile);
        if (!metricReader.isOpen())
        {
            logger.log(Utils::LogLevel::ERROR, "Input", "cannot open metrics file '" + opts.metricsFile + "'");
            return kExitUsage;
        }
        std::size_t skipped = 0;
        metrics = parser.readMetrics(metricReader, &skipped);
        logger.log(Utils::LogLevel::INFO, "Input",
                   "read " + std::to_string(metrics.size()) + " metric point(s), skipped " + std::to_string(skipped));
    }

    // Analysis
    Pipeline::IncidentProcessor processor(config);

    core::IncidentReport report;
    try
    {
        report = processor.process(alerts, metrics);
        processor.recordOutcome(report, opts.quality);
        logger.log(Utils::LogLevel::INFO, "Pipeline",
                   "outcome recorded in the in-memory selection store; it is discarded when this run exits");
    }
    catch (const core::MalformedInputError &e)
    {
        logger.log(Utils::LogLevel::ERROR, "Pipeline", e.what());
        return kExitMalformed;
    }

    // Reporting
    if (opts.json)
    {
        Report::JsonReporter json(opts.pretty ? Report::JsonReporter::PrettyPrint::PRETTY
                                              : Report::JsonReporter::PrettyPrint::COMPACT);
        json.generateReport(report);
        json.writeJson(std::cout);
        if (!opts.pretty)
            std::cout << "\n";
    }
    else
    {
        Report::ConsoleReporter console(opts.verbose ? Report::ConsoleReporter::Verbosity::VERBOSE
                                                     : Report::ConsoleReporter::Verbosity::NORMAL);
        console.generateReport(report);
    }

    return kExitOk;
}
