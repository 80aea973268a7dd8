#include "backtest/Backtester.h"
#include "analytics/Statistics.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace emis {
namespace backtest {

Backtester::Backtester(const PriceSeries& benchmark, const DateRange& testing_range, int holding_period)
    : benchmark_(benchmark.clip(testing_range))
    , holding_period_(holding_period)
{
    if (holding_period_ < 1) {
        throw std::invalid_argument("Holding period must be at least 1 trading day");
    }
}

std::vector<Trade> Backtester::buildTrades(const std::vector<Signal>& signals, TradeMode mode) const {
    std::vector<Signal> ordered = signals;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Signal& a, const Signal& b) { return a.date < b.date; });

    const auto& points = benchmark_.points;
    const size_t h = static_cast<size_t>(holding_period_);

    std::vector<Trade> trades;
    std::optional<Date> last_exit;
    std::optional<int> last_week;
    int not_traded = 0;
    int past_end = 0;

    for (const auto& s : ordered) {
        if (s.direction != SignalDirection::ENTER) continue;

        auto it = std::lower_bound(points.begin(), points.end(), s.date,
                                   [](const PricePoint& p, const Date& d) { return p.date < d; });
        if (it == points.end() || it->date != s.date) {
            not_traded++;
            continue;
        }

        const size_t entry_idx = static_cast<size_t>(it - points.begin());
        const size_t exit_idx = entry_idx + h;
        if (exit_idx >= points.size()) {
            past_end++;
            continue;
        }

        if (mode == TradeMode::NON_OVERLAPPING && last_exit && s.date < *last_exit) {
            continue;
        }
        if (mode == TradeMode::WEEKLY && last_week && *last_week == s.date.isoWeekKey()) {
            continue;
        }

        Trade trade;
        trade.entry_date = points[entry_idx].date;
        trade.exit_date = points[exit_idx].date;
        trade.entry_price = points[entry_idx].adjusted_close;
        trade.exit_price = points[exit_idx].adjusted_close;
        trade.realized_return = trade.exit_price / trade.entry_price - 1.0;
        trade.log_return = std::log(trade.exit_price / trade.entry_price);
        trade.indicator = s.indicator;
        trades.push_back(trade);

        last_exit = trade.exit_date;
        last_week = s.date.isoWeekKey();
    }

    if (not_traded > 0 || past_end > 0) {
        LOG_DEBUG("{}: {} signals on non-trading dates, {} exits past {}",
                  toString(mode), not_traded, past_end,
                  benchmark_.empty() ? std::string("-") : benchmark_.lastDate().toString());
    }
    return trades;
}

BacktestResult Backtester::run(const std::string& strategy,
                               const std::vector<Signal>& signals,
                               TradeMode mode) const {
    return summarize(strategy, mode, buildTrades(signals, mode));
}

BacktestResult Backtester::summarize(const std::string& strategy, TradeMode mode,
                                     std::vector<Trade> trades) {
    BacktestResult result;
    result.strategy = strategy;
    result.mode = mode;
    result.sample_size = static_cast<int>(trades.size());

    if (trades.empty()) {
        return result;
    }

    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& t : trades) {
        returns.push_back(t.realized_return);
        if (t.win()) {
            result.wins++;
        }
    }

    result.win_rate = static_cast<double>(result.wins) / static_cast<double>(result.sample_size);
    result.p_value = analytics::Statistics::binomialUpperTail(result.wins, result.sample_size, 0.5);
    result.mean_return = analytics::Statistics::mean(returns);
    result.std_return = analytics::Statistics::stddev(returns);
    result.min_return = *std::min_element(returns.begin(), returns.end());
    result.max_return = *std::max_element(returns.begin(), returns.end());

    const auto ttest = analytics::Statistics::oneSampleTTest(returns);
    result.t_stat = ttest.t_stat;
    result.p_return = ttest.p_value;
    result.ci_low = ttest.ci_low;
    result.ci_high = ttest.ci_high;
    result.trades = std::move(trades);
    return result;
}

} // namespace backtest
} // namespace emis
