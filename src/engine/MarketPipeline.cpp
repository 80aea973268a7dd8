#include "engine/MarketPipeline.h"
#include "analytics/ReturnCalculator.h"
#include "backtest/Backtester.h"
#include "common/Errors.h"
#include "common/Fingerprint.h"
#include "common/Logger.h"
#include "strategy/SignalGenerator.h"
#include <iomanip>
#include <sstream>

namespace emis {
namespace engine {

MarketPipeline::MarketPipeline(MarketConfig config,
                               std::shared_ptr<data::PriceCache> cache,
                               std::shared_ptr<data::EntropyStore> entropy_store)
    : config_(std::move(config))
    , cache_(std::move(cache))
    , entropy_store_(std::move(entropy_store))
{
    if (!cache_) {
        throw std::invalid_argument("MarketPipeline needs a price cache");
    }
}

PriceSeries MarketPipeline::loadBenchmark() const {
    try {
        return cache_->get(config_.cache_namespace, config_.benchmark, config_.data_range);
    } catch (const DataUnavailable& e) {
        // Without the benchmark nothing can be backtested.
        throw InsufficientHistory(config_.name + ": benchmark " + config_.benchmark +
                                  " unavailable (" + e.what() + ")");
    }
}

std::map<std::string, PriceSeries> MarketPipeline::loadUniverse(std::vector<std::string>& excluded) const {
    std::map<std::string, PriceSeries> prices;
    for (const auto& ticker : config_.tickers) {
        try {
            prices[ticker] = cache_->get(config_.cache_namespace, ticker, config_.data_range);
        } catch (const DataUnavailable& e) {
            LOG_WARN("[{}] excluding {}: {}", config_.name, ticker, e.what());
            excluded.push_back(ticker);
        }
    }
    return prices;
}

std::string MarketPipeline::entropyFingerprint(const ReturnMatrix& returns) const {
    const auto& a = config_.analysis;

    std::ostringstream instruments;
    for (const auto& t : returns.tickers) {
        instruments << t << ';';
    }

    // Digest of the matrix itself so re-fetched prices invalidate the artifact
    std::ostringstream body;
    body << std::setprecision(17);
    for (size_t t = 0; t < returns.rowCount(); ++t) {
        body << returns.dates[t].days;
        for (double v : returns.rows[t]) {
            body << ',' << v;
        }
        body << '\n';
    }

    std::ostringstream num;
    num << std::setprecision(17);
    num << a.regularization << '|' << a.pivot_tolerance;

    return Fingerprint::of({
        {"window", std::to_string(a.window)},
        {"numerics", num.str()},
        {"instruments", instruments.str()},
        {"returns", Fingerprint::sha256Hex(body.str())}
    });
}

EntropySeries MarketPipeline::computeEntropy(const ReturnMatrix& returns) const {
    const auto stem = data::PriceCacheKey::make(config_.cache_namespace, config_.data_range).stem();

    std::string fingerprint;
    if (entropy_store_) {
        fingerprint = entropyFingerprint(returns);
        if (auto cached = entropy_store_->load(stem, fingerprint)) {
            LOG_INFO("[{}] entropy loaded from cache ({} points)", config_.name, cached->size());
            return *cached;
        }
    }

    analytics::EntropyOptions options;
    options.window = config_.analysis.window;
    options.regularization = config_.analysis.regularization;
    options.pivot_tolerance = config_.analysis.pivot_tolerance;
    options.threads = config_.analysis.threads;

    auto series = analytics::EntropyEngine(options).compute(returns);

    if (entropy_store_) {
        nlohmann::json meta;
        meta["market"] = config_.name;
        meta["window"] = options.window;
        meta["regularization"] = options.regularization;
        meta["pivot_tolerance"] = options.pivot_tolerance;
        meta["instruments"] = returns.tickers;
        entropy_store_->save(stem, fingerprint, series, meta);
    }
    return series;
}

MarketReport MarketPipeline::run() const {
    const auto& a = config_.analysis;
    const strategy::StudySplit split(a.training_range, a.testing_range);

    MarketReport report;
    report.market = config_.name;
    report.benchmark = config_.benchmark;

    LOG_INFO("[{}] {} tickers, benchmark {}, data {}", config_.name, config_.tickers.size(),
             config_.benchmark, config_.data_range.toString());

    const auto benchmark = loadBenchmark();
    auto prices = loadUniverse(report.excluded);

    analytics::ReturnCalculator::Options return_options;
    return_options.min_coverage = a.min_coverage;
    return_options.max_start_lag_days = a.max_start_lag_days;
    return_options.min_common_dates = static_cast<size_t>(a.window) + 1;

    auto built = analytics::ReturnCalculator::build(prices, return_options);
    report.excluded.insert(report.excluded.end(), built.excluded.begin(), built.excluded.end());
    report.instruments = built.matrix.tickers;
    report.return_rows = built.matrix.rowCount();

    const auto entropy = computeEntropy(built.matrix);
    report.entropy = analytics::EntropyEngine::summarize(entropy);
    if (report.entropy.degenerate > 0) {
        LOG_WARN("[{}] {} degenerate entropy dates left as gaps", config_.name, report.entropy.degenerate);
    }

    const strategy::SignalGenerator generator(a.threshold_percentile,
                                              static_cast<size_t>(a.min_training_points));
    const auto signals = generator.run(split, entropy);
    report.threshold = signals.threshold;
    report.training_points = signals.training_points;
    report.enter_signals = signals.enter_count;

    report.results = backtestModes(config_.name, report.indicator, benchmark, signals.signals, a);
    return report;
}

EntropySeries indicatorFromPrices(const PriceSeries& series) {
    EntropySeries out;
    out.reserve(series.size());
    for (const auto& p : series.points) {
        EntropyPoint point;
        point.date = p.date;
        point.value = p.adjusted_close;
        point.status = EntropyStatus::VALID;
        out.push_back(point);
    }
    return out;
}

std::vector<BacktestResult> backtestModes(const std::string& market,
                                          const std::string& strategy,
                                          const PriceSeries& benchmark,
                                          const std::vector<Signal>& signals,
                                          const AnalysisConfig& analysis) {
    const backtest::Backtester backtester(benchmark, analysis.testing_range, analysis.holding_period);

    std::vector<BacktestResult> results;
    for (auto mode : analysis.trade_modes) {
        auto result = backtester.run(strategy, signals, mode);
        for (const auto& trade : result.trades) {
            Logger::getInstance().logTrade(market, strategy, toString(mode), trade);
        }
        LOG_INFO("[{}] {} {}: {} trades, win rate {:.1f}%, p={:.4f}, mean {:+.2f}%",
                 market, strategy, toString(mode), result.sample_size, result.win_rate * 100.0,
                 result.p_value, result.mean_return * 100.0);
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace engine
} // namespace emis
