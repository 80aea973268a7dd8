#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "analytics/EntropyEngine.h"
#include "common/Types.h"
#include "data/EntropyStore.h"
#include "data/PriceCache.h"
#include "engine/MarketConfig.h"

namespace emis {
namespace engine {

struct MarketReport {
    std::string market;
    std::string benchmark;
    std::string indicator = "EMIS";            // strategy name of the rows below
    std::vector<std::string> instruments;      // columns that entered the entropy
    std::vector<std::string> excluded;         // no data, poor coverage or late start
    size_t return_rows = 0;
    double threshold = 0.0;
    size_t training_points = 0;
    size_t enter_signals = 0;
    analytics::EntropySummary entropy;
    std::vector<BacktestResult> results;       // one per trade mode
    std::string error;                         // set when the market was aborted

    bool ok() const { return error.empty(); }
};

// The whole chain for one market: cache -> returns -> entropy -> signals -> trades.
class MarketPipeline {
public:
    MarketPipeline(MarketConfig config,
                   std::shared_ptr<data::PriceCache> cache,
                   std::shared_ptr<data::EntropyStore> entropy_store = nullptr);

    // Throws InsufficientHistory (market unusable), FetchError (network gave up)
    // and LookaheadViolation (bad split).
    MarketReport run() const;

    // Universe prices; instruments without data are appended to excluded
    std::map<std::string, PriceSeries> loadUniverse(std::vector<std::string>& excluded) const;

    // Served from the entropy store when its fingerprint still matches
    EntropySeries computeEntropy(const ReturnMatrix& returns) const;

    std::string entropyFingerprint(const ReturnMatrix& returns) const;

    const MarketConfig& config() const { return config_; }

private:
    PriceSeries loadBenchmark() const;

    MarketConfig config_;
    std::shared_ptr<data::PriceCache> cache_;
    std::shared_ptr<data::EntropyStore> entropy_store_;
};

// Turns a price series into an always-valid indicator series so that a
// volatility index can drive the same signal generator as the entropy.
EntropySeries indicatorFromPrices(const PriceSeries& series);

// Backtests the signal set once per configured trade mode and writes every
// trade to the trade log under (market, strategy).
std::vector<BacktestResult> backtestModes(const std::string& market,
                                          const std::string& strategy,
                                          const PriceSeries& benchmark,
                                          const std::vector<Signal>& signals,
                                          const AnalysisConfig& analysis);

} // namespace engine
} // namespace emis
