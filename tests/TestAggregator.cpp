#include "engine/CrossMarketAggregator.h"
#include "engine/ReportWriter.h"
#include "common/Errors.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <random>
#include <set>

using namespace emis;
using namespace emis::engine;

namespace {

uint32_t tickerSeed(const std::string& ticker) {
    uint32_t h = 2166136261u;
    for (unsigned char c : ticker) {
        h = (h ^ c) * 16777619u;
    }
    return h;
}

// Deterministic daily walks with a shared market factor; some tickers fail on purpose
class SyntheticSource : public data::IPriceSource {
public:
    std::set<std::string> missing;
    std::set<std::string> broken;
    std::atomic<int> calls{0};

    PriceSeries fetch(const std::string& ticker, const DateRange& range) override {
        calls++;
        if (missing.count(ticker)) throw DataUnavailable(ticker, "unknown symbol");
        if (broken.count(ticker)) throw FetchError(ticker + ": HTTP 502");

        std::mt19937 own(tickerSeed(ticker));
        std::normal_distribution<double> normal(0.0, 1.0);
        const double beta = 0.3 + static_cast<double>(tickerSeed(ticker) % 7) / 10.0;

        PriceSeries s;
        s.ticker = ticker;
        double price = 100.0;
        for (Date d = range.start; d <= range.end; d = d.addDays(1)) {
            if (d.weekday() >= 5) continue;
            std::mt19937 day(static_cast<uint32_t>(d.days));
            std::normal_distribution<double> common(0.0, 1.0);
            const double factor = common(day);
            price *= std::exp(0.01 * (beta * factor + normal(own)));
            s.points.push_back({d, price});
        }
        return s;
    }
};

AnalysisConfig studyConfig() {
    AnalysisConfig a;
    a.window = 20;
    a.holding_period = 5;
    a.threshold_percentile = 90.0;
    a.training_range = DateRange(Date::fromYmd(2019, 1, 1), Date::fromYmd(2019, 12, 31));
    a.testing_range = DateRange(Date::fromYmd(2020, 1, 1), Date::fromYmd(2020, 12, 31));
    a.trade_modes = {TradeMode::OVERLAPPING, TradeMode::NON_OVERLAPPING, TradeMode::WEEKLY};
    return a;
}

std::vector<MarketConfig> markets(const AnalysisConfig& a) {
    std::vector<MarketConfig> out;
    out.push_back(MarketConfigBuilder("Beta").benchmark("^B")
                      .tickers({"B1", "B2", "B3", "B4"}).analysis(a).build());
    out.push_back(MarketConfigBuilder("Alpha").benchmark("^A")
                      .tickers({"A1", "A2", "A3", "A4", "A5"}).analysis(a).build());
    out.push_back(MarketConfigBuilder("Gamma").benchmark("^GONE")
                      .tickers({"G1", "G2", "G3"}).analysis(a).build());
    return out;
}

BaselineConfig baselineConfig() {
    BaselineConfig b;
    b.volatility_ticker = "^VOL";
    b.benchmark_ticker = "^A";
    return b;
}

std::shared_ptr<data::PriceCache> freshCache(std::shared_ptr<SyntheticSource> source) {
    auto cache = std::make_shared<data::PriceCache>(std::make_shared<data::MemoryPriceStore>(), source);
    cache->setSleeper([](std::chrono::milliseconds) {});
    return cache;
}

std::shared_ptr<SyntheticSource> makeSource() {
    auto source = std::make_shared<SyntheticSource>();
    source->missing = {"A5", "^GONE"};
    return source;
}

bool testReportShape() {
    const auto a = studyConfig();
    CrossMarketAggregator aggregator(markets(a), baselineConfig(), a, freshCache(makeSource()));
    const auto report = aggregator.run();

    if (report.reports.size() != 4) {
        std::cerr << "[TEST] expected 4 reports, got " << report.reports.size() << "\n";
        return false;
    }
    const auto& alpha = report.reports[0];
    const auto& vix = report.reports[1];
    const auto& beta = report.reports[2];
    const auto& gamma = report.reports[3];

    if (alpha.market != "Alpha" || alpha.indicator != "EMIS" || vix.market != "Alpha" ||
        vix.indicator != "VIX" || beta.market != "Beta" || gamma.market != "Gamma") {
        std::cerr << "[TEST] reports not sorted by market then indicator\n";
        return false;
    }
    if (!alpha.ok() || !beta.ok() || !vix.ok()) {
        std::cerr << "[TEST] unexpected failure: " << alpha.error << beta.error << vix.error << "\n";
        return false;
    }
    if (gamma.ok() || gamma.error.find("^GONE") == std::string::npos || report.failedMarkets() != 1) {
        std::cerr << "[TEST] market without benchmark should be reported as failed\n";
        return false;
    }
    if (alpha.instruments.size() != 4 ||
        std::find(alpha.excluded.begin(), alpha.excluded.end(), "A5") == alpha.excluded.end()) {
        std::cerr << "[TEST] A5 should be excluded, not fatal\n";
        return false;
    }
    if (alpha.results.size() != 3 || vix.results.size() != 3 || alpha.training_points == 0) {
        std::cerr << "[TEST] every trade mode should be backtested\n";
        return false;
    }
    for (const auto& r : alpha.results) {
        if (r.sample_size != static_cast<int>(r.trades.size())) {
            std::cerr << "[TEST] sample size mismatch\n";
            return false;
        }
        for (const auto& t : r.trades) {
            if (!a.testing_range.contains(t.entry_date) || !a.testing_range.contains(t.exit_date)) {
                std::cerr << "[TEST] trade outside testing range\n";
                return false;
            }
        }
    }
    // Non-overlapping and weekly are subsets of the overlapping trades
    if (alpha.results[1].sample_size > alpha.results[0].sample_size ||
        alpha.results[2].sample_size > alpha.results[0].sample_size) {
        std::cerr << "[TEST] filtered modes produced more trades than overlapping\n";
        return false;
    }

    const auto rows = report.rows();
    if (rows.size() != 9 || rows.front().market != "Alpha" || rows.front().result.strategy != "EMIS" ||
        rows[3].result.strategy != "VIX" || rows.back().market != "Beta") {
        std::cerr << "[TEST] comparison rows wrong\n";
        return false;
    }
    return true;
}

bool testOrderIndependence() {
    auto a = studyConfig();
    auto forward = markets(a);
    auto backward = forward;
    std::reverse(backward.begin(), backward.end());

    const auto first = CrossMarketAggregator(forward, baselineConfig(), a, freshCache(makeSource())).run();
    const auto second = CrossMarketAggregator(backward, baselineConfig(), a, freshCache(makeSource())).run();

    a.parallel_markets = true;
    auto parallel_markets = markets(a);
    const auto third = CrossMarketAggregator(parallel_markets, baselineConfig(), a, freshCache(makeSource())).run();

    const auto expected = ReportWriter::comparisonCsv(first);
    if (ReportWriter::comparisonCsv(second) != expected || ReportWriter::comparisonCsv(third) != expected) {
        std::cerr << "[TEST] comparison depends on market order or scheduling\n";
        return false;
    }
    return true;
}

bool testFetchErrorPropagates() {
    const auto a = studyConfig();
    auto source = makeSource();
    source->broken = {"B3"};

    bool threw = false;
    try {
        CrossMarketAggregator(markets(a), baselineConfig(), a, freshCache(source)).run();
    } catch (const FetchError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] exhausted retries must stop the run\n";
        return false;
    }
    return true;
}

bool testEntropyReuseAndReports() {
    const auto dir = std::filesystem::temp_directory_path() / "emis_test_aggregator";
    std::filesystem::remove_all(dir);

    const auto a = studyConfig();
    auto store = std::make_shared<data::EntropyStore>(dir / "cache");
    auto source = makeSource();
    auto cache = freshCache(source);

    BaselineConfig no_baseline = baselineConfig();
    no_baseline.enabled = false;

    const auto first = CrossMarketAggregator(markets(a), no_baseline, a, cache, store).run();
    const auto second = CrossMarketAggregator(markets(a), no_baseline, a, cache, store).run();

    const auto stem = data::PriceCacheKey::make("alpha", markets(a)[1].data_range).stem();
    if (!std::filesystem::exists(store->metaPath(stem))) {
        std::cerr << "[TEST] entropy artifact not written for " << stem << "\n";
        return false;
    }
    if (ReportWriter::comparisonCsv(first) != ReportWriter::comparisonCsv(second)) {
        std::cerr << "[TEST] cached entropy changed the results\n";
        return false;
    }
    if (first.reports.size() != 3) {
        std::cerr << "[TEST] disabled baseline still reported\n";
        return false;
    }

    ReportWriter writer(dir / "output");
    const auto files = writer.write(first);
    for (const char* name : {"results_Alpha.csv", "results_Beta.csv", "results_Gamma.csv", "comparison.csv"}) {
        if (!std::filesystem::exists(dir / "output" / name)) {
            std::cerr << "[TEST] missing " << name << "\n";
            return false;
        }
    }
    if (files.size() != 4) {
        std::cerr << "[TEST] expected 4 files, got " << files.size() << "\n";
        return false;
    }

    const auto json = ReportWriter::toJson(first);
    if (!json.contains("markets") || json["markets"].size() != 3 || json["comparison"].size() != 6) {
        std::cerr << "[TEST] JSON report incomplete\n";
        return false;
    }

    std::filesystem::remove_all(dir);
    return true;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting Aggregator Test..." << std::endl;

    if (!testReportShape() || !testOrderIndependence() || !testFetchErrorPropagates() ||
        !testEntropyReuseAndReports()) {
        std::cerr << "[TEST] Aggregator FAILED" << std::endl;
        return 1;
    }

    std::cout << "[TEST] Aggregator PASSED" << std::endl;
    return 0;
}
