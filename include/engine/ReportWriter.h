#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/CrossMarketAggregator.h"

namespace emis {
namespace engine {

class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path output_dir);

    // results_<market>.csv per market plus comparison.csv; returns the files written
    std::vector<std::filesystem::path> write(const AggregateReport& report) const;

    static std::string marketCsv(const AggregateReport& report, const std::string& market);
    static std::string comparisonCsv(const AggregateReport& report);
    static nlohmann::json toJson(const AggregateReport& report);
    static std::string formatTable(const AggregateReport& report);

private:
    std::filesystem::path output_dir_;
};

} // namespace engine
} // namespace emis
