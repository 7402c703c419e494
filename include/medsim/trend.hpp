#pragma once

/// @file include/medsim/trend.hpp
/// @brief TrendAnalyzer: summary metrics over a simulation's incident log.
///
/// # Module: IncidentLog / TrendAnalyzer
///
/// ## Metrics
///   - total, mean and max severity
///   - trend: first-half vs second-half incident counts
///
///         escalating  if second > ratio · first  and  second − first ≥ min_diff
///         declining   if first  > ratio · second and  first − second ≥ min_diff
///         stable      otherwise
///
///   - compliance per party:  1 − violations / activities
///   - hotline effectiveness: de-escalated / mechanism attempts
///   - assessment good / mixed / concerning from incident rate and severity
///   - slope of incident counts per window (least squares)
///
/// Every threshold is configuration so scenarios can be recalibrated.
///
/// ## Guarantees
/// - Stateless, const, thread-safe
/// - Works on complete and cancelled (incomplete) runs alike: halves are taken
///   over the steps actually simulated

#include "medsim/constants.hpp"
#include "medsim/incident.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>

namespace medsim::sim {
struct SimulationRun;
}  // namespace medsim::sim

namespace medsim::analysis {

struct TrendConfig {
    double      trend_ratio              = constants::DEFAULT_TREND_RATIO;
    std::size_t trend_min_difference     = constants::DEFAULT_TREND_MIN_DIFFERENCE;
    double      good_incident_rate       = constants::DEFAULT_GOOD_INCIDENT_RATE;
    double      concerning_incident_rate = constants::DEFAULT_CONCERNING_INCIDENT_RATE;
    double      good_severity            = constants::DEFAULT_GOOD_SEVERITY;
    double      concerning_severity      = constants::DEFAULT_CONCERNING_SEVERITY;
    std::size_t slope_window             = constants::DEFAULT_SLOPE_WINDOW;

    /// # Throws
    /// `ConfigurationError` if trend_ratio < 1, slope_window is 0, or a
    /// good threshold exceeds its concerning counterpart.
    void validate() const;
};

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(TrendConfig config = TrendConfig{});

    /// Summarise a finished (or cancelled) run.
    [[nodiscard]] sim::Summary summarize(const sim::SimulationRun& run) const;

    /// Summarise a raw incident sequence covering `steps` simulated steps.
    [[nodiscard]] sim::Summary
    summarize(std::span<const sim::Incident> incidents,
              std::size_t steps,
              const std::map<std::string, sim::PartyActivity>& activity) const;

    /// Trend from half-run counts.
    [[nodiscard]] sim::Trend classify_trend(std::size_t first_half,
                                            std::size_t second_half) const noexcept;

    /// Assessment from incident rate (per 100 steps) and mean severity.
    [[nodiscard]] sim::Assessment assess(double incident_rate,
                                         double avg_severity) const noexcept;

    [[nodiscard]] const TrendConfig& config() const noexcept { return config_; }

private:
    TrendConfig config_;
};

}  // namespace medsim::analysis
