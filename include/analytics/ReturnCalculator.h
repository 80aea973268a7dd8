#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"

namespace emis {
namespace analytics {

struct ReturnBuildResult {
    ReturnMatrix matrix;
    std::vector<std::string> excluded;   // dropped for poor coverage or late start
};

class ReturnCalculator {
public:
    struct Options {
        double min_coverage = 0.95;      // share of the union calendar an instrument must cover
        int max_start_lag_days = 10;     // allowed gap between calendar start and first quote
        size_t min_common_dates = 2;     // price rows needed after intersection
    };

    // Excludes incomplete instruments, intersects the remaining calendars
    // strictly and takes r(t) = ln(p(t) / p(t-1)). Never interpolates.
    // Throws InsufficientHistory when fewer than two instruments or
    // min_common_dates dates survive.
    static ReturnBuildResult build(const std::map<std::string, PriceSeries>& prices,
                                   const Options& options);

    // Log returns of one series; output[k] belongs to points[k + 1]
    static std::vector<double> logReturns(const PriceSeries& series);
};

} // namespace analytics
} // namespace emis
