#include "analytics/EntropyEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <Eigen/LU>
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <thread>
#include <vector>

namespace emis {
namespace analytics {

EntropyEngine::EntropyEngine(EntropyOptions options)
    : options_(options)
{
    if (options_.window < 2) {
        throw std::invalid_argument("Entropy window must be at least 2");
    }
    if (options_.regularization < 0.0) {
        throw std::invalid_argument("Regularization must be non-negative");
    }
    options_.threads = std::max(1, options_.threads);
}

Eigen::MatrixXd EntropyEngine::correlation(const Eigen::Ref<const Eigen::MatrixXd>& window_returns) {
    const Eigen::Index rows = window_returns.rows();
    const Eigen::Index cols = window_returns.cols();

    Eigen::RowVectorXd mean = window_returns.colwise().mean();
    Eigen::MatrixXd centered = window_returns.rowwise() - mean;
    Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(rows - 1);

    Eigen::VectorXd sd = cov.diagonal().cwiseMax(0.0).cwiseSqrt();

    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd corr(cols, cols);
    for (Eigen::Index i = 0; i < cols; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            if (sd(i) <= 0.0 || sd(j) <= 0.0) {
                corr(i, j) = nan;
            } else if (i == j) {
                corr(i, j) = 1.0;
            } else {
                // Rounding can push |r| a hair past 1
                corr(i, j) = std::clamp(cov(i, j) / (sd(i) * sd(j)), -1.0, 1.0);
            }
        }
    }
    return corr;
}

LogDeterminant EntropyEngine::logDeterminant(const Eigen::MatrixXd& matrix, double pivot_tolerance) {
    LogDeterminant result;
    if (matrix.rows() == 0 || matrix.rows() != matrix.cols()) {
        result.singular = true;
        return result;
    }

    Eigen::PartialPivLU<Eigen::MatrixXd> lu(matrix);
    const Eigen::MatrixXd& factors = lu.matrixLU();

    double max_pivot = 0.0;
    for (Eigen::Index i = 0; i < factors.rows(); ++i) {
        max_pivot = std::max(max_pivot, std::abs(factors(i, i)));
    }

    int sign = static_cast<int>(lu.permutationP().determinant());
    double log_abs = 0.0;
    for (Eigen::Index i = 0; i < factors.rows(); ++i) {
        const double pivot = factors(i, i);
        if (!std::isfinite(pivot) || std::abs(pivot) <= pivot_tolerance * max_pivot) {
            result.singular = true;
            result.sign = 0;
            return result;
        }
        if (pivot < 0.0) {
            sign = -sign;
        }
        log_abs += std::log(std::abs(pivot));
    }

    result.log_abs = log_abs;
    result.sign = sign;
    return result;
}

EntropyPoint EntropyEngine::evaluate(const Eigen::Ref<const Eigen::MatrixXd>& window_returns,
                                     Date date) const {
    EntropyPoint point;
    point.date = date;

    Eigen::MatrixXd corr = correlation(window_returns);
    if (!corr.allFinite()) {
        return point;
    }
    if (options_.regularization > 0.0) {
        corr.diagonal().array() += options_.regularization;
    }

    const auto det = logDeterminant(corr, options_.pivot_tolerance);
    if (det.singular || det.sign <= 0) {
        return point;
    }

    const double value = -det.log_abs / static_cast<double>(corr.rows());
    if (!std::isfinite(value)) {
        return point;
    }
    point.value = value;
    point.status = EntropyStatus::VALID;
    return point;
}

void EntropyEngine::computeRange(const Eigen::MatrixXd& data, const ReturnMatrix& returns,
                                 size_t first_row, size_t last_row, EntropySeries& out) const {
    const size_t w = static_cast<size_t>(options_.window);
    for (size_t t = first_row; t < last_row; ++t) {
        auto block = data.block(static_cast<Eigen::Index>(t + 1 - w), 0,
                                static_cast<Eigen::Index>(w), data.cols());
        out[t + 1 - w] = evaluate(block, returns.dates[t]);
    }
}

EntropySeries EntropyEngine::compute(const ReturnMatrix& returns) const {
    const size_t w = static_cast<size_t>(options_.window);
    const size_t rows = returns.rowCount();
    const size_t cols = returns.columnCount();

    if (rows < w) {
        throw InsufficientHistory("Return matrix has " + std::to_string(rows) +
                                  " rows, window needs " + std::to_string(w));
    }
    if (cols < 2) {
        throw InsufficientHistory("Entropy needs at least 2 instruments");
    }

    Eigen::MatrixXd data(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (size_t t = 0; t < rows; ++t) {
        for (size_t i = 0; i < cols; ++i) {
            data(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(i)) = returns.rows[t][i];
        }
    }

    EntropySeries out(rows - w + 1);
    const size_t first = w - 1;
    const size_t total = rows - first;
    const size_t workers = std::min(static_cast<size_t>(options_.threads), total);

    if (workers <= 1) {
        computeRange(data, returns, first, rows, out);
    } else {
        // Disjoint row slices, each worker fills its own slots
        std::vector<std::thread> pool;
        std::vector<std::exception_ptr> errors(workers);
        const size_t chunk = (total + workers - 1) / workers;
        for (size_t k = 0; k < workers; ++k) {
            const size_t begin = first + k * chunk;
            const size_t end = std::min(rows, begin + chunk);
            if (begin >= end) break;
            pool.emplace_back([&, k, begin, end]() {
                try {
                    computeRange(data, returns, begin, end, out);
                } catch (...) {
                    errors[k] = std::current_exception();
                }
            });
        }
        for (auto& th : pool) {
            th.join();
        }
        for (const auto& err : errors) {
            if (err) {
                std::rethrow_exception(err);
            }
        }
    }

    const auto summary = summarize(out);
    LOG_INFO("Entropy: {} points, {} valid, {} degenerate (window {}, {} instruments)",
             summary.count, summary.valid, summary.degenerate, w, cols);
    return out;
}

EntropySummary EntropyEngine::summarize(const EntropySeries& series) {
    EntropySummary summary;
    summary.count = series.size();
    double sum = 0.0;
    for (const auto& p : series) {
        if (!p.valid()) {
            summary.degenerate++;
            continue;
        }
        if (summary.valid == 0) {
            summary.min = p.value;
            summary.max = p.value;
        } else {
            summary.min = std::min(summary.min, p.value);
            summary.max = std::max(summary.max, p.value);
        }
        summary.valid++;
        sum += p.value;
    }
    if (summary.valid > 0) {
        summary.mean = sum / static_cast<double>(summary.valid);
    }
    return summary;
}

} // namespace analytics
} // namespace emis
