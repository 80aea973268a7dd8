#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace emis {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

DateRange readRange(const nlohmann::json& node, const char* key, const DateRange& fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    const auto& r = node.at(key);
    DateRange out = fallback;
    if (r.contains("start")) out.start = Date::parse(r.at("start").get<std::string>());
    if (r.contains("end")) out.end = Date::parse(r.at("end").get<std::string>());
    return out;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetDefaults() {
    log_level_ = "info";
    log_dir_ = "logs";
    cache_dir_ = "cache";
    output_dir_ = "output";
    analysis_ = engine::AnalysisConfig();
    fetch_ = engine::FetchConfig();
    baseline_ = engine::BaselineConfig();
    markets_.clear();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cerr << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found, using defaults." << std::endl;
        resetDefaults();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Config parse error in " + config_path.string() + ": " + e.what());
    }
    loadFromJson(j);
    std::cerr << "Config loaded: " << markets_.size() << " market(s), window="
              << analysis_.window << ", holding=" << analysis_.holding_period << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    resetDefaults();
    try {
        log_level_ = j.value("log_level", log_level_);
        log_dir_ = j.value("log_dir", log_dir_);
        cache_dir_ = j.value("cache_dir", cache_dir_);
        output_dir_ = j.value("output_dir", output_dir_);

        if (j.contains("analysis")) {
            const auto& a = j["analysis"];
            analysis_.window = a.value("window", analysis_.window);
            analysis_.threshold_percentile = a.value("threshold_percentile", analysis_.threshold_percentile);
            analysis_.holding_period = a.value("holding_period", analysis_.holding_period);
            analysis_.training_range = readRange(a, "training_range", analysis_.training_range);
            analysis_.testing_range = readRange(a, "testing_range", analysis_.testing_range);
            analysis_.universe_size = a.value("universe_size", analysis_.universe_size);
            analysis_.min_coverage = a.value("min_coverage", analysis_.min_coverage);
            analysis_.max_start_lag_days = a.value("max_start_lag_days", analysis_.max_start_lag_days);
            analysis_.regularization = a.value("regularization", analysis_.regularization);
            analysis_.pivot_tolerance = a.value("pivot_tolerance", analysis_.pivot_tolerance);
            analysis_.min_training_points = a.value("min_training_points", analysis_.min_training_points);
            analysis_.threads = std::max(1, a.value("threads", analysis_.threads));
            analysis_.parallel_markets = a.value("parallel_markets", analysis_.parallel_markets);

            if (a.contains("trade_modes")) {
                analysis_.trade_modes.clear();
                for (const auto& m : a["trade_modes"]) {
                    analysis_.trade_modes.push_back(tradeModeFromString(trimCopy(m.get<std::string>())));
                }
            }
        }

        if (j.contains("fetch")) {
            const auto& f = j["fetch"];
            fetch_.base_url = f.value("base_url", fetch_.base_url);
            fetch_.max_attempts = std::max(1, f.value("max_attempts", fetch_.max_attempts));
            fetch_.initial_backoff_ms = std::max(0, f.value("initial_backoff_ms", fetch_.initial_backoff_ms));
            fetch_.max_requests_per_second = std::max(1, f.value("max_requests_per_second", fetch_.max_requests_per_second));
            fetch_.timeout_seconds = f.value("timeout_seconds", fetch_.timeout_seconds);
        }

        if (j.contains("baseline")) {
            const auto& b = j["baseline"];
            baseline_.enabled = b.value("enabled", baseline_.enabled);
            baseline_.name = b.value("name", baseline_.name);
            baseline_.volatility_ticker = b.value("volatility_ticker", baseline_.volatility_ticker);
            baseline_.benchmark_ticker = b.value("benchmark_ticker", baseline_.benchmark_ticker);
            baseline_.cache_namespace = b.value("cache_namespace", baseline_.cache_namespace);
        }

        if (j.contains("markets")) {
            for (const auto& m : j["markets"]) {
                MarketEntry entry;
                entry.name = trimCopy(m.value("name", std::string()));
                entry.benchmark = trimCopy(m.value("benchmark", std::string()));
                entry.cache_namespace = m.value("cache_namespace", std::string());
                if (m.contains("tickers")) {
                    for (const auto& t : m["tickers"]) {
                        entry.tickers.push_back(trimCopy(t.get<std::string>()));
                    }
                }
                if (m.contains("start") || m.contains("end")) {
                    DateRange r(
                        std::min(analysis_.training_range.start, analysis_.testing_range.start),
                        std::max(analysis_.training_range.end, analysis_.testing_range.end));
                    if (m.contains("start")) r.start = Date::parse(m["start"].get<std::string>());
                    if (m.contains("end")) r.end = Date::parse(m["end"].get<std::string>());
                    entry.data_range = r;
                }
                markets_.push_back(std::move(entry));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Config value error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Config value error: ") + e.what());
    }
}

std::vector<engine::MarketConfig> Config::getMarketConfigs() const {
    std::vector<engine::MarketConfig> out;
    out.reserve(markets_.size());
    for (const auto& m : markets_) {
        engine::MarketConfigBuilder builder(m.name);
        builder.benchmark(m.benchmark)
               .cacheNamespace(m.cache_namespace)
               .tickers(m.tickers)
               .analysis(analysis_);
        if (m.data_range) {
            builder.dataRange(*m.data_range);
        }
        out.push_back(builder.build());
    }
    return out;
}

} // namespace emis
