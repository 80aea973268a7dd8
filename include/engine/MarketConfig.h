#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace emis {
namespace engine {

// Everything one market pipeline needs; immutable once built.
struct MarketConfig {
    std::string name;
    std::string benchmark;                 // index the trades are priced on
    std::string cache_namespace;
    std::vector<std::string> tickers;
    DateRange data_range;                  // span fetched from the price source
    AnalysisConfig analysis;
};

class MarketConfigBuilder {
public:
    explicit MarketConfigBuilder(std::string name);

    MarketConfigBuilder& benchmark(const std::string& ticker);
    MarketConfigBuilder& cacheNamespace(const std::string& ns);
    MarketConfigBuilder& tickers(const std::vector<std::string>& tickers);
    MarketConfigBuilder& addTicker(const std::string& ticker);
    MarketConfigBuilder& dataRange(const DateRange& range);
    MarketConfigBuilder& analysis(const AnalysisConfig& analysis);
    MarketConfigBuilder& window(int window);
    MarketConfigBuilder& holdingPeriod(int days);
    MarketConfigBuilder& thresholdPercentile(double pct);
    MarketConfigBuilder& split(const DateRange& training, const DateRange& testing);

    // Validates and fills defaults; throws ConfigError on bad input.
    MarketConfig build() const;

private:
    MarketConfig config_;
    bool has_data_range_ = false;
};

} // namespace engine
} // namespace emis
