#pragma once

#include <memory>
#include <string>
#include <vector>
#include "data/EntropyStore.h"
#include "data/PriceCache.h"
#include "engine/EngineConfig.h"
#include "engine/MarketConfig.h"
#include "engine/MarketPipeline.h"

namespace emis {
namespace engine {

// One line of the comparison table
struct ComparisonRow {
    std::string market;
    BacktestResult result;   // result.strategy names the signal source
};

struct AggregateReport {
    std::vector<MarketReport> reports;     // sorted by (market, indicator)

    std::vector<ComparisonRow> rows() const;   // sorted by (market, strategy, mode)
    std::vector<std::string> marketNames() const;
    size_t failedMarkets() const;
};

class CrossMarketAggregator {
public:
    CrossMarketAggregator(std::vector<MarketConfig> markets,
                          BaselineConfig baseline,
                          AnalysisConfig analysis,
                          std::shared_ptr<data::PriceCache> cache,
                          std::shared_ptr<data::EntropyStore> entropy_store = nullptr);

    // Runs every market and the baseline. A market that lacks history is
    // reported with its error; FetchError and LookaheadViolation propagate.
    AggregateReport run() const;

    // Volatility index as the signal, priced on the baseline benchmark
    MarketReport runBaseline() const;

private:
    MarketReport runMarket(const MarketConfig& market) const;
    std::string baselineMarketName() const;

    std::vector<MarketConfig> markets_;
    BaselineConfig baseline_;
    AnalysisConfig analysis_;         // baseline study and the parallel_markets switch
    std::shared_ptr<data::PriceCache> cache_;
    std::shared_ptr<data::EntropyStore> entropy_store_;
};

} // namespace engine
} // namespace emis
