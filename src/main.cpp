#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "engine/CrossMarketAggregator.h"
#include "engine/ReportWriter.h"
#include "engine/Runtime.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace emis;

static void printUsage() {
    std::cout
        << "Usage: emis [options]\n"
        << "  --config <path>               config file (default config/config.json)\n"
        << "  --market <name>               run only this market (repeatable)\n"
        << "  --window <days>               rolling correlation window\n"
        << "  --holding-period <days>       trading days held per trade\n"
        << "  --threshold-percentile <pct>  training percentile for the entry threshold\n"
        << "  --output-dir <dir>            where result CSVs are written\n"
        << "  --json                        print the full report as JSON\n";
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::vector<std::string> markets;
    int window = -1;
    int holding_period = -1;
    double threshold_percentile = -1.0;
    std::string output_dir;
    bool json_mode = false;
    bool help = false;
};

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + arg);
            }
            return argv[++i];
        };

        try {
            if (arg == "--help" || arg == "-h") {
                cli.help = true;
            } else if (arg == "--json") {
                cli.json_mode = true;
            } else if (arg == "--config") {
                cli.config_path = next();
            } else if (arg == "--market") {
                cli.markets.push_back(next());
            } else if (arg == "--window") {
                cli.window = std::stoi(next());
            } else if (arg == "--holding-period") {
                cli.holding_period = std::stoi(next());
            } else if (arg == "--threshold-percentile") {
                cli.threshold_percentile = std::stod(next());
            } else if (arg == "--output-dir") {
                cli.output_dir = next();
            } else {
                throw ConfigError("Unknown argument: " + arg);
            }
        } catch (const std::logic_error& e) {
            // stoi/stod failures
            throw ConfigError("Invalid value for " + arg + ": " + e.what());
        }
    }
    return cli;
}

int main(int argc, char* argv[]) {
    CliOptions cli;
    try {
        cli = parseArgs(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return 2;
    }
    if (cli.help) {
        printUsage();
        return 0;
    }

    try {
        auto& config = Config::getInstance();
        config.load(cli.config_path);

        if (cli.window > 0) {
            config.setWindow(cli.window);
        }
        if (cli.holding_period > 0) {
            config.setHoldingPeriod(cli.holding_period);
        }
        if (cli.threshold_percentile > 0.0) {
            config.setThresholdPercentile(cli.threshold_percentile);
        }
        if (!cli.output_dir.empty()) {
            config.setOutputDir(cli.output_dir);
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel(), cli.json_mode);

        auto markets = config.getMarketConfigs();
        if (!cli.markets.empty()) {
            std::set<std::string> wanted(cli.markets.begin(), cli.markets.end());
            for (const auto& name : wanted) {
                const bool known = std::any_of(markets.begin(), markets.end(),
                    [&](const engine::MarketConfig& m) { return m.name == name; });
                if (!known) {
                    std::cerr << "Unknown market: " << name << "\n";
                    return 2;
                }
            }
            markets.erase(std::remove_if(markets.begin(), markets.end(),
                [&](const engine::MarketConfig& m) { return wanted.count(m.name) == 0; }),
                markets.end());
        }
        if (markets.empty()) {
            std::cerr << "No markets configured\n";
            return 2;
        }

        LOG_INFO("Running {} market(s), window {}, holding {}, p{}",
                 markets.size(), config.getAnalysisConfig().window,
                 config.getAnalysisConfig().holding_period,
                 config.getAnalysisConfig().threshold_percentile);

        auto runtime = engine::Runtime::fromConfig(config);
        engine::CrossMarketAggregator aggregator(
            markets, config.getBaselineConfig(), config.getAnalysisConfig(),
            runtime.cache, runtime.entropy_store);

        const auto report = aggregator.run();

        engine::ReportWriter writer(utils::PathUtils::resolveRelativePath(config.getOutputDir()));
        writer.write(report);

        if (cli.json_mode) {
            std::cout << engine::ReportWriter::toJson(report).dump(2) << "\n";
        } else {
            std::cout << "\n" << engine::ReportWriter::formatTable(report);
            const auto stats = runtime.cache->getStats();
            std::cout << "\ncache: " << stats.hits << " hits, " << stats.misses << " misses, "
                      << stats.fetch_attempts << " fetches\n";
        }

        const auto baseline_name = config.getBaselineConfig().name;
        size_t failed_markets = 0;
        for (const auto& r : report.reports) {
            if (r.indicator != baseline_name && !r.ok()) {
                failed_markets++;
            }
        }
        if (failed_markets == markets.size()) {
            LOG_ERROR("Every market failed");
            return 1;
        }
        return 0;
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
