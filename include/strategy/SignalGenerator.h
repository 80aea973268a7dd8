#pragma once

#include <vector>
#include "common/Types.h"

namespace emis {
namespace strategy {

// A training period strictly before a disjoint testing period.
// Throws LookaheadViolation otherwise.
class StudySplit {
public:
    StudySplit(const DateRange& training, const DateRange& testing);

    const DateRange& training() const { return training_; }
    const DateRange& testing() const { return testing_; }

private:
    DateRange training_;
    DateRange testing_;
};

// Indicator points inside the training range. The only input a threshold accepts.
class TrainingSlice {
public:
    static TrainingSlice cut(const StudySplit& split, const EntropySeries& series);

    const EntropySeries& points() const { return points_; }
    const DateRange& range() const { return range_; }

private:
    TrainingSlice(DateRange range, EntropySeries points)
        : range_(range), points_(std::move(points)) {}

    DateRange range_;
    EntropySeries points_;
};

// Indicator points inside the testing range, sorted by date.
class EvaluationSlice {
public:
    static EvaluationSlice cut(const StudySplit& split, const EntropySeries& series);

    const EntropySeries& points() const { return points_; }
    const DateRange& range() const { return range_; }

private:
    EvaluationSlice(DateRange range, EntropySeries points)
        : range_(range), points_(std::move(points)) {}

    DateRange range_;
    EntropySeries points_;
};

class SignalGenerator {
public:
    explicit SignalGenerator(double threshold_percentile = 90.0, size_t min_training_points = 20);

    // Percentile of the valid training values.
    // Throws InsufficientHistory below min_training_points valid values.
    double computeThreshold(const TrainingSlice& training) const;

    // ENTER iff the point is valid and strictly above the threshold.
    // One signal per evaluation point, ascending by date.
    std::vector<Signal> generate(const EvaluationSlice& evaluation, double threshold) const;

    struct Output {
        double threshold = 0.0;
        size_t training_points = 0;
        size_t enter_count = 0;
        std::vector<Signal> signals;
    };
    Output run(const StudySplit& split, const EntropySeries& series) const;

private:
    double threshold_percentile_;
    size_t min_training_points_;
};

} // namespace strategy
} // namespace emis
