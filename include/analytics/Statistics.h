#pragma once

#include <vector>

namespace emis {
namespace analytics {

class Statistics {
public:
    // Linear interpolation between order statistics (the "linear" / type-7 rule).
    // pct in [0, 100]. Throws std::invalid_argument on an empty sample.
    static double percentile(std::vector<double> values, double pct);

    static double mean(const std::vector<double>& values);

    // Sample standard deviation (n - 1); 0 for fewer than two values
    static double stddev(const std::vector<double>& values);

    // P(X >= successes) for X ~ Binomial(trials, p)
    static double binomialUpperTail(int successes, int trials, double p = 0.5);

    struct TTest {
        double t_stat = 0.0;
        double p_value = 1.0;    // one-sided, H1: mean > 0
        double ci_low = 0.0;     // mean -/+ 1.96 standard errors
        double ci_high = 0.0;
    };
    static TTest oneSampleTTest(const std::vector<double>& values);
};

} // namespace analytics
} // namespace emis
