#include "engine/CrossMarketAggregator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "strategy/SignalGenerator.h"
#include <algorithm>
#include <future>
#include <set>
#include <tuple>

namespace emis {
namespace engine {

std::vector<ComparisonRow> AggregateReport::rows() const {
    std::vector<ComparisonRow> out;
    for (const auto& report : reports) {
        for (const auto& result : report.results) {
            out.push_back({report.market, result});
        }
    }
    std::sort(out.begin(), out.end(), [](const ComparisonRow& a, const ComparisonRow& b) {
        return std::make_tuple(a.market, a.result.strategy, static_cast<int>(a.result.mode)) <
               std::make_tuple(b.market, b.result.strategy, static_cast<int>(b.result.mode));
    });
    return out;
}

std::vector<std::string> AggregateReport::marketNames() const {
    std::set<std::string> names;
    for (const auto& report : reports) {
        names.insert(report.market);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

size_t AggregateReport::failedMarkets() const {
    return static_cast<size_t>(std::count_if(reports.begin(), reports.end(),
                                             [](const MarketReport& r) { return !r.ok(); }));
}

CrossMarketAggregator::CrossMarketAggregator(std::vector<MarketConfig> markets,
                                             BaselineConfig baseline,
                                             AnalysisConfig analysis,
                                             std::shared_ptr<data::PriceCache> cache,
                                             std::shared_ptr<data::EntropyStore> entropy_store)
    : markets_(std::move(markets))
    , baseline_(std::move(baseline))
    , analysis_(std::move(analysis))
    , cache_(std::move(cache))
    , entropy_store_(std::move(entropy_store))
{
    if (!cache_) {
        throw std::invalid_argument("CrossMarketAggregator needs a price cache");
    }
}

MarketReport CrossMarketAggregator::runMarket(const MarketConfig& market) const {
    try {
        return MarketPipeline(market, cache_, entropy_store_).run();
    } catch (const InsufficientHistory& e) {
        LOG_ERROR("[{}] aborted: {}", market.name, e.what());
        MarketReport report;
        report.market = market.name;
        report.benchmark = market.benchmark;
        report.error = e.what();
        return report;
    }
}

std::string CrossMarketAggregator::baselineMarketName() const {
    // Report the baseline next to the market priced on the same index
    std::vector<std::string> matches;
    for (const auto& m : markets_) {
        if (m.benchmark == baseline_.benchmark_ticker) {
            matches.push_back(m.name);
        }
    }
    if (!matches.empty()) {
        return *std::min_element(matches.begin(), matches.end());
    }
    return baseline_.benchmark_ticker;
}

MarketReport CrossMarketAggregator::runBaseline() const {
    MarketReport report;
    report.market = baselineMarketName();
    report.benchmark = baseline_.benchmark_ticker;
    report.indicator = baseline_.name;
    report.instruments = {baseline_.volatility_ticker};

    const DateRange range(
        std::min(analysis_.training_range.start, analysis_.testing_range.start),
        std::max(analysis_.training_range.end, analysis_.testing_range.end));
    const strategy::StudySplit split(analysis_.training_range, analysis_.testing_range);

    try {
        PriceSeries volatility;
        PriceSeries benchmark;
        try {
            volatility = cache_->get(baseline_.cache_namespace, baseline_.volatility_ticker, range);
            benchmark = cache_->get(baseline_.cache_namespace, baseline_.benchmark_ticker, range);
        } catch (const DataUnavailable& e) {
            throw InsufficientHistory(std::string("baseline input unavailable: ") + e.what());
        }

        const auto indicator = indicatorFromPrices(volatility);
        report.entropy = analytics::EntropyEngine::summarize(indicator);
        report.return_rows = indicator.size();

        const strategy::SignalGenerator generator(analysis_.threshold_percentile,
                                                  static_cast<size_t>(analysis_.min_training_points));
        const auto signals = generator.run(split, indicator);
        report.threshold = signals.threshold;
        report.training_points = signals.training_points;
        report.enter_signals = signals.enter_count;

        report.results = backtestModes(report.market, baseline_.name, benchmark,
                                       signals.signals, analysis_);
    } catch (const InsufficientHistory& e) {
        LOG_ERROR("[{}] baseline aborted: {}", baseline_.name, e.what());
        report.error = e.what();
    }
    return report;
}

AggregateReport CrossMarketAggregator::run() const {
    AggregateReport aggregate;

    if (analysis_.parallel_markets && markets_.size() > 1) {
        std::vector<std::future<MarketReport>> futures;
        for (const auto& market : markets_) {
            futures.push_back(std::async(std::launch::async,
                                         [this, &market]() { return runMarket(market); }));
        }
        if (baseline_.enabled) {
            aggregate.reports.push_back(runBaseline());
        }
        for (auto& f : futures) {
            aggregate.reports.push_back(f.get());
        }
    } else {
        for (const auto& market : markets_) {
            aggregate.reports.push_back(runMarket(market));
        }
        if (baseline_.enabled) {
            aggregate.reports.push_back(runBaseline());
        }
    }

    std::sort(aggregate.reports.begin(), aggregate.reports.end(),
              [](const MarketReport& a, const MarketReport& b) {
                  return std::tie(a.market, a.indicator) < std::tie(b.market, b.indicator);
              });

    LOG_INFO("Aggregated {} report(s), {} failed", aggregate.reports.size(), aggregate.failedMarkets());
    return aggregate;
}

} // namespace engine
} // namespace emis
