#include "backtest/Backtester.h"
#include "analytics/Statistics.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace emis;
using emis::analytics::Statistics;
using emis::backtest::Backtester;

namespace {

std::vector<Date> sessions(Date start, int n) {
    std::vector<Date> out;
    Date d = start;
    while (static_cast<int>(out.size()) < n) {
        if (d.weekday() < 5) out.push_back(d);
        d = d.addDays(1);
    }
    return out;
}

Signal enter(Date d) {
    Signal s;
    s.date = d;
    s.direction = SignalDirection::ENTER;
    s.indicator = 1.0;
    return s;
}

Trade tradeWithReturn(double r) {
    Trade t;
    t.entry_price = 100.0;
    t.exit_price = 100.0 * (1.0 + r);
    t.realized_return = r;
    return t;
}

bool near(double a, double b, double tol) { return std::abs(a - b) < tol; }

} // namespace

int main() {
    // 2021-01-04 is a Monday
    const auto days = sessions(Date::fromYmd(2021, 1, 4), 70);
    PriceSeries benchmark;
    benchmark.ticker = "^GSPC";
    for (size_t i = 0; i < days.size(); ++i) {
        benchmark.points.push_back({days[i], 100.0 + static_cast<double>(i)});
    }
    const DateRange testing(days[0], days[59]);
    const Backtester backtester(benchmark, testing, 5);
    assert(backtester.tradingDays() == 60);

    std::vector<Signal> signals;
    for (int i : {10, 0, 2, 1, 5, 57}) {
        signals.push_back(enter(days[i]));
    }
    signals.push_back(enter(Date::fromYmd(2021, 1, 9)));   // Saturday
    Signal neutral;
    neutral.date = days[20];
    signals.push_back(neutral);

    {
        // Day 57 would exit on day 62, past the testing range: dropped
        const auto trades = backtester.buildTrades(signals, TradeMode::OVERLAPPING);
        assert(trades.size() == 5);
        assert(trades[0].entry_date == days[0]);
        assert(trades[0].exit_date == days[5]);
        assert(trades[0].entry_price == 100.0 && trades[0].exit_price == 105.0);
        assert(near(trades[0].realized_return, 0.05, 1e-12));
        assert(near(trades[0].log_return, std::log(1.05), 1e-12));
        for (size_t k = 1; k < trades.size(); ++k) {
            assert(trades[k - 1].entry_date < trades[k].entry_date);
        }
    }

    {
        // Re-entry allowed on the exit day of the previous trade
        const auto trades = backtester.buildTrades(signals, TradeMode::NON_OVERLAPPING);
        assert(trades.size() == 3);
        assert(trades[0].entry_date == days[0]);
        assert(trades[1].entry_date == days[5]);
        assert(trades[2].entry_date == days[10]);
    }

    {
        // First signal of each ISO week
        const auto trades = backtester.buildTrades(signals, TradeMode::WEEKLY);
        assert(trades.size() == 3);
        assert(trades[0].entry_date == days[0]);
        assert(trades[1].entry_date == days[5]);
        assert(trades[2].entry_date == days[10]);

        std::vector<Signal> week;
        week.push_back(enter(days[1]));
        week.push_back(enter(days[3]));
        week.push_back(enter(days[4]));
        assert(backtester.buildTrades(week, TradeMode::WEEKLY).size() == 1);
        assert(backtester.buildTrades(week, TradeMode::NON_OVERLAPPING).size() == 1);
        assert(backtester.buildTrades(week, TradeMode::OVERLAPPING).size() == 3);
    }

    {
        // Same inputs, same report
        const auto a = backtester.run("EMIS", signals, TradeMode::OVERLAPPING);
        const auto b = backtester.run("EMIS", signals, TradeMode::OVERLAPPING);
        assert(a.sample_size == 5 && a.wins == 5);
        assert(a.win_rate == 1.0);
        assert(near(a.p_value, 1.0 / 32.0, 1e-12));
        assert(a.p_value == b.p_value && a.mean_return == b.mean_return && a.t_stat == b.t_stat);
        assert(a.strategy == "EMIS" && a.mode == TradeMode::OVERLAPPING);

        const auto none = backtester.run("EMIS", {}, TradeMode::OVERLAPPING);
        assert(none.sample_size == 0 && none.p_value == 1.0 && none.win_rate == 0.0);
    }

    {
        std::vector<Trade> trades;
        for (int i = 0; i < 7; ++i) trades.push_back(tradeWithReturn(0.01));
        for (int i = 0; i < 3; ++i) trades.push_back(tradeWithReturn(-0.01));
        const auto r = Backtester::summarize("EMIS", TradeMode::OVERLAPPING, trades);
        assert(r.wins == 7);
        assert(near(r.p_value, 176.0 / 1024.0, 1e-12));
        assert(near(r.mean_return, 0.004, 1e-12));
        assert(r.min_return == -0.01 && r.max_return == 0.01);

        // A flat trade is not a win
        const auto flat = Backtester::summarize("EMIS", TradeMode::WEEKLY, {tradeWithReturn(0.0)});
        assert(flat.wins == 0 && flat.p_value == 1.0);
    }

    {
        assert(near(Statistics::binomialUpperTail(10, 10), 1.0 / 1024.0, 1e-15));
        assert(near(Statistics::binomialUpperTail(1, 1), 0.5, 1e-15));
        assert(Statistics::binomialUpperTail(0, 4) == 1.0);

        // t = 2*sqrt(3) on 2 degrees of freedom
        const auto t = Statistics::oneSampleTTest({0.01, 0.02, 0.03});
        assert(near(t.t_stat, 2.0 * std::sqrt(3.0), 1e-9));
        assert(near(t.p_value, 0.5 * (1.0 - 2.0 * std::sqrt(3.0) / std::sqrt(14.0)), 1e-9));
        assert(near(t.ci_low, 0.02 - 1.96 * 0.01 / std::sqrt(3.0), 1e-12));

        const auto losing = Statistics::oneSampleTTest({-0.01, -0.02, -0.03});
        assert(losing.t_stat < 0.0 && losing.p_value == 1.0);
    }

    {
        bool threw = false;
        try {
            Backtester bad(benchmark, testing, 0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] Backtester PASSED\n";
    return 0;
}
