#include "engine/MarketConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace emis {
namespace engine {

namespace {
std::string defaultNamespace(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (!out.empty() && out.back() != '_') {
            out.push_back('_');
        }
    }
    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }
    return out.empty() ? "market" : out;
}
}

MarketConfigBuilder::MarketConfigBuilder(std::string name) {
    config_.name = std::move(name);
}

MarketConfigBuilder& MarketConfigBuilder::benchmark(const std::string& ticker) {
    config_.benchmark = ticker;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::cacheNamespace(const std::string& ns) {
    config_.cache_namespace = ns;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::tickers(const std::vector<std::string>& tickers) {
    config_.tickers = tickers;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::addTicker(const std::string& ticker) {
    config_.tickers.push_back(ticker);
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::dataRange(const DateRange& range) {
    config_.data_range = range;
    has_data_range_ = true;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::analysis(const AnalysisConfig& analysis) {
    config_.analysis = analysis;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::window(int window) {
    config_.analysis.window = window;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::holdingPeriod(int days) {
    config_.analysis.holding_period = days;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::thresholdPercentile(double pct) {
    config_.analysis.threshold_percentile = pct;
    return *this;
}

MarketConfigBuilder& MarketConfigBuilder::split(const DateRange& training, const DateRange& testing) {
    config_.analysis.training_range = training;
    config_.analysis.testing_range = testing;
    return *this;
}

MarketConfig MarketConfigBuilder::build() const {
    MarketConfig out = config_;
    const auto& a = out.analysis;

    if (out.name.empty()) {
        throw ConfigError("market name is empty");
    }
    if (out.benchmark.empty()) {
        throw ConfigError(out.name + ": benchmark ticker is empty");
    }
    if (a.window < 2) {
        throw ConfigError(out.name + ": window must be >= 2");
    }
    if (!(a.threshold_percentile > 0.0 && a.threshold_percentile < 100.0)) {
        throw ConfigError(out.name + ": threshold_percentile must be in (0, 100)");
    }
    if (a.holding_period < 1) {
        throw ConfigError(out.name + ": holding_period must be >= 1");
    }
    if (!a.training_range.valid() || !a.testing_range.valid()) {
        throw ConfigError(out.name + ": training/testing range start is after its end");
    }
    if (a.training_range.overlaps(a.testing_range) || a.training_range.end >= a.testing_range.start) {
        throw LookaheadViolation(out.name + ": training range " + a.training_range.toString() +
                                 " must end before testing range " + a.testing_range.toString());
    }
    if (a.min_coverage < 0.0 || a.min_coverage > 1.0) {
        throw ConfigError(out.name + ": min_coverage must be in [0, 1]");
    }
    if (a.trade_modes.empty()) {
        throw ConfigError(out.name + ": no trade modes selected");
    }

    // Drop duplicates but keep the configured order.
    std::set<std::string> seen;
    std::vector<std::string> unique;
    for (const auto& t : out.tickers) {
        if (!t.empty() && seen.insert(t).second) {
            unique.push_back(t);
        }
    }
    if (a.universe_size > 0 && unique.size() > static_cast<size_t>(a.universe_size)) {
        unique.resize(static_cast<size_t>(a.universe_size));
    }
    if (unique.size() < 2) {
        throw ConfigError(out.name + ": universe needs at least two tickers");
    }
    out.tickers = std::move(unique);

    if (out.cache_namespace.empty()) {
        out.cache_namespace = defaultNamespace(out.name);
    }
    if (!has_data_range_) {
        out.data_range = DateRange(
            std::min(a.training_range.start, a.testing_range.start),
            std::max(a.training_range.end, a.testing_range.end));
    }
    if (!out.data_range.valid()) {
        throw ConfigError(out.name + ": data range start is after its end");
    }
    return out;
}

} // namespace engine
} // namespace emis
