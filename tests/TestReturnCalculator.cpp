#include "analytics/ReturnCalculator.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>

using namespace emis;
using emis::analytics::ReturnCalculator;

namespace {

// Weekday calendar of n sessions starting at start
std::vector<Date> sessions(Date start, int n) {
    std::vector<Date> out;
    Date d = start;
    while (static_cast<int>(out.size()) < n) {
        if (d.weekday() < 5) out.push_back(d);
        d = d.addDays(1);
    }
    return out;
}

PriceSeries geometric(const std::string& ticker, const std::vector<Date>& dates, double growth) {
    PriceSeries s;
    s.ticker = ticker;
    double price = 50.0;
    for (const auto& d : dates) {
        s.points.push_back({d, price});
        price *= growth;
    }
    return s;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-12; }

} // namespace

int main() {
    const auto calendar = sessions(Date::fromYmd(2021, 1, 4), 100);

    {
        // A: complete. B: two holes. C: starts a month late. D: nothing.
        std::map<std::string, PriceSeries> prices;
        prices["A"] = geometric("A", calendar, 1.01);

        auto b_dates = calendar;
        const Date hole1 = b_dates[10];
        const Date hole2 = b_dates[40];
        b_dates.erase(b_dates.begin() + 40);
        b_dates.erase(b_dates.begin() + 10);
        prices["B"] = geometric("B", b_dates, 0.99);

        prices["C"] = geometric("C", std::vector<Date>(calendar.begin() + 22, calendar.end()), 1.0);
        prices["D"] = PriceSeries{"D", {}};

        ReturnCalculator::Options options;
        const auto result = ReturnCalculator::build(prices, options);
        const auto& m = result.matrix;

        assert(m.columnCount() == 2);
        assert(m.tickers[0] == "A" && m.tickers[1] == "B");
        assert(result.excluded.size() == 2);

        // 98 common prices -> 97 returns; holes are absent, not filled
        assert(m.rowCount() == 97);
        assert(m.dates.size() == m.rowCount());
        assert(m.dates.front() == calendar[1]);
        for (const auto& d : m.dates) {
            assert(d != hole1 && d != hole2);
        }

        // Return across B's hole spans two sessions of A
        size_t after_hole = 0;
        while (m.dates[after_hole] != calendar[11]) ++after_hole;
        assert(near(m.rows[after_hole][0], 2.0 * std::log(1.01)));
        assert(near(m.rows[after_hole][1], std::log(0.99)));
        assert(near(m.rows[0][0], std::log(1.01)));

        for (size_t t = 1; t < m.dates.size(); ++t) {
            assert(m.dates[t - 1] < m.dates[t]);
        }
    }

    {
        // Lenient options keep the late starter
        std::map<std::string, PriceSeries> prices;
        prices["A"] = geometric("A", calendar, 1.01);
        prices["C"] = geometric("C", std::vector<Date>(calendar.begin() + 22, calendar.end()), 1.0);

        ReturnCalculator::Options options;
        options.min_coverage = 0.5;
        options.max_start_lag_days = 60;
        const auto result = ReturnCalculator::build(prices, options);
        assert(result.excluded.empty());
        assert(result.matrix.dates.front() == calendar[23]);
    }

    {
        // One usable instrument is not a universe
        std::map<std::string, PriceSeries> prices;
        prices["A"] = geometric("A", calendar, 1.01);
        prices["C"] = geometric("C", std::vector<Date>(calendar.begin() + 50, calendar.end()), 1.0);

        bool threw = false;
        try {
            ReturnCalculator::build(prices, ReturnCalculator::Options{});
        } catch (const InsufficientHistory&) {
            threw = true;
        }
        assert(threw);
    }

    {
        // Too few common dates for the requested window
        std::map<std::string, PriceSeries> prices;
        prices["A"] = geometric("A", calendar, 1.01);
        prices["B"] = geometric("B", calendar, 1.02);

        ReturnCalculator::Options options;
        options.min_common_dates = 101;
        bool threw = false;
        try {
            ReturnCalculator::build(prices, options);
        } catch (const InsufficientHistory&) {
            threw = true;
        }
        assert(threw);

        options.min_common_dates = 100;
        assert(ReturnCalculator::build(prices, options).matrix.rowCount() == 99);
    }

    {
        const auto r = ReturnCalculator::logReturns(geometric("A", sessions(Date::fromYmd(2021, 1, 4), 3), 2.0));
        assert(r.size() == 2);
        assert(near(r[0], std::log(2.0)) && near(r[1], std::log(2.0)));
    }

    std::cout << "[TEST] ReturnCalculator PASSED\n";
    return 0;
}
