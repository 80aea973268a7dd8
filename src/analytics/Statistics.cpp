#include "analytics/Statistics.h"
#include <boost/math/distributions/binomial.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace emis {
namespace analytics {

double Statistics::percentile(std::vector<double> values, double pct) {
    if (values.empty()) {
        throw std::invalid_argument("percentile of an empty sample");
    }
    if (pct < 0.0 || pct > 100.0) {
        throw std::invalid_argument("percentile must be within [0, 100]");
    }

    std::sort(values.begin(), values.end());
    const double rank = (pct / 100.0) * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Statistics::stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double Statistics::binomialUpperTail(int successes, int trials, double p) {
    if (trials <= 0 || successes <= 0) {
        return 1.0;
    }
    if (successes > trials) {
        return 0.0;
    }
    boost::math::binomial_distribution<double> dist(static_cast<double>(trials), p);
    // P(X >= k) = 1 - P(X <= k - 1)
    return boost::math::cdf(boost::math::complement(dist, static_cast<double>(successes - 1)));
}

Statistics::TTest Statistics::oneSampleTTest(const std::vector<double>& values) {
    TTest result;
    const double m = mean(values);
    result.ci_low = m;
    result.ci_high = m;
    if (values.size() < 2) {
        return result;
    }

    const double sd = stddev(values);
    const double n = static_cast<double>(values.size());
    const double se = sd / std::sqrt(n);
    result.ci_low = m - 1.96 * se;
    result.ci_high = m + 1.96 * se;
    if (se <= 0.0) {
        return result;
    }

    result.t_stat = m / se;
    if (result.t_stat > 0.0) {
        boost::math::students_t_distribution<double> dist(n - 1.0);
        result.p_value = boost::math::cdf(boost::math::complement(dist, result.t_stat));
    }
    return result;
}

} // namespace analytics
} // namespace emis
