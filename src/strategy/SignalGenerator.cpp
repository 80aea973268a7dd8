#include "strategy/SignalGenerator.h"
#include "analytics/Statistics.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace emis {
namespace strategy {

namespace {

EntropySeries sliceSorted(const EntropySeries& series, const DateRange& range) {
    EntropySeries out;
    for (const auto& p : series) {
        if (range.contains(p.date)) {
            out.push_back(p);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const EntropyPoint& a, const EntropyPoint& b) { return a.date < b.date; });
    return out;
}

}

StudySplit::StudySplit(const DateRange& training, const DateRange& testing)
    : training_(training), testing_(testing)
{
    if (!training.valid() || !testing.valid()) {
        throw LookaheadViolation("Invalid study ranges: training " + training.toString() +
                                 ", testing " + testing.toString());
    }
    if (training.overlaps(testing) || training.end >= testing.start) {
        throw LookaheadViolation("Training " + training.toString() +
                                 " must end before testing " + testing.toString() + " starts");
    }
}

TrainingSlice TrainingSlice::cut(const StudySplit& split, const EntropySeries& series) {
    return TrainingSlice(split.training(), sliceSorted(series, split.training()));
}

EvaluationSlice EvaluationSlice::cut(const StudySplit& split, const EntropySeries& series) {
    return EvaluationSlice(split.testing(), sliceSorted(series, split.testing()));
}

SignalGenerator::SignalGenerator(double threshold_percentile, size_t min_training_points)
    : threshold_percentile_(threshold_percentile)
    , min_training_points_(std::max<size_t>(1, min_training_points))
{
    if (threshold_percentile_ <= 0.0 || threshold_percentile_ >= 100.0) {
        throw std::invalid_argument("Threshold percentile must be within (0, 100)");
    }
}

double SignalGenerator::computeThreshold(const TrainingSlice& training) const {
    std::vector<double> values;
    for (const auto& p : training.points()) {
        if (p.valid()) {
            values.push_back(p.value);
        }
    }
    if (values.size() < min_training_points_) {
        throw InsufficientHistory("Only " + std::to_string(values.size()) +
                                  " valid indicator values in training " +
                                  training.range().toString() + ", need " +
                                  std::to_string(min_training_points_));
    }
    return analytics::Statistics::percentile(std::move(values), threshold_percentile_);
}

std::vector<Signal> SignalGenerator::generate(const EvaluationSlice& evaluation, double threshold) const {
    std::vector<Signal> signals;
    signals.reserve(evaluation.points().size());
    for (const auto& p : evaluation.points()) {
        Signal s;
        s.date = p.date;
        s.indicator = p.value;
        s.direction = (p.valid() && p.value > threshold) ? SignalDirection::ENTER
                                                         : SignalDirection::NEUTRAL;
        signals.push_back(s);
    }
    return signals;
}

SignalGenerator::Output SignalGenerator::run(const StudySplit& split, const EntropySeries& series) const {
    Output out;
    const auto training = TrainingSlice::cut(split, series);
    out.threshold = computeThreshold(training);
    out.training_points = training.points().size();

    out.signals = generate(EvaluationSlice::cut(split, series), out.threshold);
    out.enter_count = static_cast<size_t>(std::count_if(
        out.signals.begin(), out.signals.end(),
        [](const Signal& s) { return s.direction == SignalDirection::ENTER; }));

    LOG_INFO("Threshold {:.6f} (p{} of {} training points), {} of {} evaluation dates enter",
             out.threshold, threshold_percentile_, out.training_points,
             out.enter_count, out.signals.size());
    return out;
}

} // namespace strategy
} // namespace emis
