#pragma once

/// @file src/analysis/regression.hpp
/// @brief Small least-squares and moment helpers shared by the analysers.

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace medsim::analysis {

/// Slope β₁ of the least-squares line y = β₀ + β₁·x.
///
/// # Returns
/// `nullopt` if the spans differ in length, hold fewer than two points, or
/// every x is identical.
[[nodiscard]] std::optional<double>
least_squares_slope(std::span<const double> x, std::span<const double> y) noexcept;

/// Incident counts per consecutive window of `window` steps over the first
/// `steps` steps.  A trailing partial window is dropped.
[[nodiscard]] std::vector<double>
window_counts(std::span<const std::size_t> incident_steps,
              std::size_t steps,
              std::size_t window);

[[nodiscard]] double mean(std::span<const double> xs) noexcept;

/// Sample standard deviation (n − 1); `nullopt` for fewer than two samples.
[[nodiscard]] std::optional<double> sample_stddev(std::span<const double> xs) noexcept;

}  // namespace medsim::analysis
