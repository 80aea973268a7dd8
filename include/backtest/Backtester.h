#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace emis {
namespace backtest {

// Prices every ENTER signal on a benchmark index held for a fixed number of
// trading days. Only benchmark quotes inside the testing range are used, so
// a trade whose exit would land past the range is discarded, never truncated.
class Backtester {
public:
    Backtester(const PriceSeries& benchmark, const DateRange& testing_range, int holding_period);

    std::vector<Trade> buildTrades(const std::vector<Signal>& signals, TradeMode mode) const;

    BacktestResult run(const std::string& strategy,
                       const std::vector<Signal>& signals,
                       TradeMode mode) const;

    // Win rate, binomial p-value and return distribution of a set of trades
    static BacktestResult summarize(const std::string& strategy, TradeMode mode,
                                    std::vector<Trade> trades);

    size_t tradingDays() const { return benchmark_.size(); }
    int holdingPeriod() const { return holding_period_; }

private:
    PriceSeries benchmark_;
    int holding_period_;
};

} // namespace backtest
} // namespace emis
