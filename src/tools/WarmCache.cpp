#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "engine/Runtime.h"

#include <algorithm>
#include <iostream>

// Fetches every configured instrument into the price cache without analysing anything.
int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config/config.json";

    try {
        auto& cfg = emis::Config::getInstance();
        cfg.load(config_path);
        emis::Logger::getInstance().initialize(cfg.getLogDir(), cfg.getLogLevel());

        auto runtime = emis::engine::Runtime::fromConfig(cfg);
        int cached = 0;
        int unavailable = 0;

        auto warm = [&](const std::string& ns, const std::string& ticker, const emis::DateRange& range) {
            try {
                const auto series = runtime.cache->get(ns, ticker, range);
                std::cout << "  " << ticker << ": " << series.size() << " rows "
                          << series.firstDate().toString() << " .. " << series.lastDate().toString() << "\n";
                cached++;
            } catch (const emis::DataUnavailable& e) {
                std::cout << "  " << ticker << ": unavailable (" << e.what() << ")\n";
                unavailable++;
            }
        };

        for (const auto& market : cfg.getMarketConfigs()) {
            std::cout << market.name << " [" << market.cache_namespace << "] "
                      << market.data_range.toString() << "\n";
            warm(market.cache_namespace, market.benchmark, market.data_range);
            for (const auto& ticker : market.tickers) {
                warm(market.cache_namespace, ticker, market.data_range);
            }
        }

        const auto baseline = cfg.getBaselineConfig();
        if (baseline.enabled) {
            const auto a = cfg.getAnalysisConfig();
            const emis::DateRange range(
                std::min(a.training_range.start, a.testing_range.start),
                std::max(a.training_range.end, a.testing_range.end));
            std::cout << baseline.name << " [" << baseline.cache_namespace << "] " << range.toString() << "\n";
            warm(baseline.cache_namespace, baseline.volatility_ticker, range);
            warm(baseline.cache_namespace, baseline.benchmark_ticker, range);
        }

        const auto stats = runtime.cache->getStats();
        std::cout << "\n" << cached << " series cached (" << stats.hits << " already present, "
                  << stats.fetch_attempts << " fetches), " << unavailable << " unavailable\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Warm-up failed: " << e.what() << "\n";
        return 1;
    }
}
