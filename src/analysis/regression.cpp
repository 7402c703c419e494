/// @file src/analysis/regression.cpp
/// @brief Least-squares slope (Eigen) and sample moments.

#include "analysis/regression.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <numeric>

namespace medsim::analysis {

std::optional<double>
least_squares_slope(std::span<const double> x, std::span<const double> y) noexcept {
    if (x.size() != y.size() || x.size() < 2) {
        return std::nullopt;
    }

    const auto n = static_cast<Eigen::Index>(x.size());
    Eigen::MatrixXd A(n, 2);
    Eigen::VectorXd b(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        A(i, 0) = 1.0;
        A(i, 1) = x[static_cast<std::size_t>(i)];
        b(i)    = y[static_cast<std::size_t>(i)];
    }

    // Rank-revealing QR so a constant x column is detected instead of solved.
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    if (qr.rank() < 2) {
        return std::nullopt;
    }
    const Eigen::VectorXd beta = qr.solve(b);
    if (!std::isfinite(beta(1))) {
        return std::nullopt;
    }
    return beta(1);
}

std::vector<double>
window_counts(std::span<const std::size_t> incident_steps,
              std::size_t steps,
              std::size_t window) {
    if (window == 0) return {};
    std::vector<double> counts(steps / window, 0.0);
    for (const auto s : incident_steps) {
        const std::size_t w = s / window;
        if (w < counts.size()) counts[w] += 1.0;
    }
    return counts;
}

double mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

std::optional<double> sample_stddev(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return std::nullopt;
    const double m = mean(xs);
    double ss = 0.0;
    for (const double v : xs) ss += (v - m) * (v - m);
    return std::sqrt(ss / static_cast<double>(xs.size() - 1));
}

}  // namespace medsim::analysis
