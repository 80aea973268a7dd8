#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace emis {
namespace engine {

// Numeric knobs shared by every market pipeline
struct AnalysisConfig {
    int window = 60;                      // rolling correlation window (trading days)
    double threshold_percentile = 90.0;   // percentile of training entropy
    int holding_period = 30;              // trading days held after a signal
    DateRange training_range{Date::fromYmd(2005, 1, 1), Date::fromYmd(2019, 12, 31)};
    DateRange testing_range{Date::fromYmd(2020, 1, 1), Date::fromYmd(2026, 1, 30)};
    int universe_size = 0;                // 0 = keep every configured ticker

    double min_coverage = 0.95;           // share of calendar days an instrument must cover
    int max_start_lag_days = 10;          // first quote may lag the calendar start by this much
    double regularization = 0.0;          // ridge added to the correlation diagonal
    double pivot_tolerance = 1e-10;       // relative LU pivot below which C is degenerate
    int min_training_points = 20;

    std::vector<TradeMode> trade_modes{TradeMode::OVERLAPPING};
    int threads = 1;                      // entropy workers per market
    bool parallel_markets = false;
};

struct FetchConfig {
    std::string base_url = "https://query1.finance.yahoo.com";
    int max_attempts = 4;
    int initial_backoff_ms = 500;
    int max_requests_per_second = 4;
    long timeout_seconds = 30;
};

// Volatility index used as a competing signal source
struct BaselineConfig {
    bool enabled = true;
    std::string name = "VIX";
    std::string volatility_ticker = "^VIX";
    std::string benchmark_ticker = "^GSPC";
    std::string cache_namespace = "baseline";
};

} // namespace engine
} // namespace emis
