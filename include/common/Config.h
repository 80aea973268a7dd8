#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "engine/MarketConfig.h"

namespace emis {

class Config {
public:
    static Config& getInstance();

    // Missing file: defaults are kept. Malformed file: ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getCacheDir() const { return cache_dir_; }
    std::string getOutputDir() const { return output_dir_; }
    void setOutputDir(const std::string& v) { output_dir_ = v; }

    engine::AnalysisConfig getAnalysisConfig() const { return analysis_; }
    engine::FetchConfig getFetchConfig() const { return fetch_; }
    engine::BaselineConfig getBaselineConfig() const { return baseline_; }

    // CLI overrides
    void setWindow(int v) { analysis_.window = v; }
    void setHoldingPeriod(int v) { analysis_.holding_period = v; }
    void setThresholdPercentile(double v) { analysis_.threshold_percentile = v; }

    // Builds every configured market against the current analysis settings.
    std::vector<engine::MarketConfig> getMarketConfigs() const;

private:
    struct MarketEntry {
        std::string name;
        std::string benchmark;
        std::string cache_namespace;
        std::vector<std::string> tickers;
        std::optional<DateRange> data_range;
    };

    Config() = default;
    void resetDefaults();

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string cache_dir_ = "cache";
    std::string output_dir_ = "output";

    engine::AnalysisConfig analysis_;
    engine::FetchConfig fetch_;
    engine::BaselineConfig baseline_;
    std::vector<MarketEntry> markets_;
};

} // namespace emis
