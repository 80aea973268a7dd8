#include "analytics/ReturnCalculator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace emis {
namespace analytics {

ReturnBuildResult ReturnCalculator::build(const std::map<std::string, PriceSeries>& prices,
                                          const Options& options) {
    ReturnBuildResult result;

    std::set<Date> calendar;
    for (const auto& [ticker, series] : prices) {
        for (const auto& p : series.points) {
            calendar.insert(p.date);
        }
    }
    if (calendar.empty()) {
        throw InsufficientHistory("No price data for any instrument");
    }
    const Date calendar_start = *calendar.begin();

    std::vector<const PriceSeries*> retained;
    std::vector<std::string> names;
    for (const auto& [ticker, series] : prices) {
        if (series.empty()) {
            result.excluded.push_back(ticker);
            continue;
        }
        const double coverage = static_cast<double>(series.size()) / static_cast<double>(calendar.size());
        const int start_lag = series.firstDate().days - calendar_start.days;
        if (coverage < options.min_coverage || start_lag > options.max_start_lag_days) {
            LOG_WARN("Excluding {}: coverage {:.3f}, first quote {} ({} days after {})",
                     ticker, coverage, series.firstDate().toString(), start_lag,
                     calendar_start.toString());
            result.excluded.push_back(ticker);
            continue;
        }
        retained.push_back(&series);
        names.push_back(ticker);
    }

    if (retained.size() < 2) {
        throw InsufficientHistory("Only " + std::to_string(retained.size()) +
                                  " instruments left after coverage filtering");
    }

    // Strict intersection of trading dates
    std::vector<Date> common;
    for (const auto& p : retained.front()->points) {
        common.push_back(p.date);
    }
    for (size_t k = 1; k < retained.size(); ++k) {
        std::vector<Date> own;
        own.reserve(retained[k]->size());
        for (const auto& p : retained[k]->points) {
            own.push_back(p.date);
        }
        std::vector<Date> merged;
        std::set_intersection(common.begin(), common.end(), own.begin(), own.end(),
                              std::back_inserter(merged));
        common.swap(merged);
    }

    if (common.size() < std::max<size_t>(2, options.min_common_dates)) {
        throw InsufficientHistory("Only " + std::to_string(common.size()) +
                                  " common trading dates across " +
                                  std::to_string(retained.size()) + " instruments, need " +
                                  std::to_string(options.min_common_dates));
    }

    // Price matrix aligned on the common calendar
    const size_t n = retained.size();
    std::vector<std::vector<double>> aligned(n);
    for (size_t i = 0; i < n; ++i) {
        aligned[i].reserve(common.size());
        const auto& points = retained[i]->points;
        size_t cursor = 0;
        for (const auto& d : common) {
            while (points[cursor].date < d) {
                ++cursor;
            }
            aligned[i].push_back(points[cursor].adjusted_close);
        }
    }

    auto& matrix = result.matrix;
    matrix.tickers = names;
    matrix.dates.assign(common.begin() + 1, common.end());
    matrix.rows.assign(common.size() - 1, std::vector<double>(n, 0.0));
    for (size_t t = 1; t < common.size(); ++t) {
        for (size_t i = 0; i < n; ++i) {
            matrix.rows[t - 1][i] = std::log(aligned[i][t] / aligned[i][t - 1]);
        }
    }

    LOG_INFO("Return matrix: {} dates x {} instruments ({} excluded), {} .. {}",
             matrix.rowCount(), matrix.columnCount(), result.excluded.size(),
             matrix.dates.front().toString(), matrix.dates.back().toString());
    return result;
}

std::vector<double> ReturnCalculator::logReturns(const PriceSeries& series) {
    std::vector<double> out;
    for (size_t k = 1; k < series.points.size(); ++k) {
        out.push_back(std::log(series.points[k].adjusted_close / series.points[k - 1].adjusted_close));
    }
    return out;
}

} // namespace analytics
} // namespace emis
