#pragma once

#include <Eigen/Dense>
#include "common/Types.h"

namespace emis {
namespace analytics {

struct EntropyOptions {
    int window = 60;
    double regularization = 0.0;      // added to the correlation diagonal
    double pivot_tolerance = 1e-10;   // relative to the largest |pivot|
    int threads = 1;
};

// log|det A| with the sign tracked through the LU factorization
struct LogDeterminant {
    double log_abs = 0.0;
    int sign = 0;             // -1, 0 or +1
    bool singular = false;    // a pivot fell under the tolerance
};

struct EntropySummary {
    size_t count = 0;
    size_t valid = 0;
    size_t degenerate = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
};

// Rolling "entanglement entropy" S(t) = -log(det C_t) / N where C_t is the
// Pearson correlation of the N return columns over rows t-W+1..t.
// S is 0 for uncorrelated columns and grows as the market moves together.
class EntropyEngine {
public:
    explicit EntropyEngine(EntropyOptions options);

    // One point per row t >= W-1, ascending by date.
    // Throws InsufficientHistory if the matrix has fewer than W rows.
    EntropySeries compute(const ReturnMatrix& returns) const;

    // Entropy of one W x N block of returns
    EntropyPoint evaluate(const Eigen::Ref<const Eigen::MatrixXd>& window_returns, Date date) const;

    // Pearson correlation of the columns; a zero-variance column yields NaN entries
    static Eigen::MatrixXd correlation(const Eigen::Ref<const Eigen::MatrixXd>& window_returns);

    static LogDeterminant logDeterminant(const Eigen::MatrixXd& matrix, double pivot_tolerance);

    static EntropySummary summarize(const EntropySeries& series);

    const EntropyOptions& options() const { return options_; }

private:
    void computeRange(const Eigen::MatrixXd& data, const ReturnMatrix& returns,
                      size_t first_row, size_t last_row, EntropySeries& out) const;

    EntropyOptions options_;
};

} // namespace analytics
} // namespace emis
