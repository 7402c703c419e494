/// @file src/analysis/trend_analyzer.cpp
/// @brief TrendAnalyzer: half-run trend, compliance and assessment.

#include "medsim/trend.hpp"
#include "medsim/errors.hpp"
#include "medsim/simulation.hpp"
#include "analysis/regression.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace medsim::analysis {

void TrendConfig::validate() const {
    if (!std::isfinite(trend_ratio) || trend_ratio < 1.0) {
        throw ConfigurationError("trend.trend_ratio",
                                 fmt::format("{} must be at least 1", trend_ratio));
    }
    if (slope_window == 0) {
        throw ConfigurationError("trend.slope_window", "must be at least 1");
    }
    if (!(good_incident_rate >= 0.0) || good_incident_rate > concerning_incident_rate) {
        throw ConfigurationError("trend.good_incident_rate",
            fmt::format("{} must lie in [0, concerning_incident_rate {}]",
                        good_incident_rate, concerning_incident_rate));
    }
    if (!(good_severity >= 0.0) || good_severity > concerning_severity || concerning_severity > 1.0) {
        throw ConfigurationError("trend.good_severity",
            fmt::format("need 0 <= good_severity {} <= concerning_severity {} <= 1",
                        good_severity, concerning_severity));
    }
}

TrendAnalyzer::TrendAnalyzer(TrendConfig config)
    : config_(config) {
    config_.validate();
}

// ─── Classification ───────────────────────────────────────────────────────────

sim::Trend TrendAnalyzer::classify_trend(std::size_t first_half,
                                         std::size_t second_half) const noexcept {
    const auto first  = static_cast<double>(first_half);
    const auto second = static_cast<double>(second_half);

    if (second > config_.trend_ratio * first
        && second_half - first_half >= config_.trend_min_difference) {
        return sim::Trend::Escalating;
    }
    if (first > config_.trend_ratio * second
        && first_half - second_half >= config_.trend_min_difference) {
        return sim::Trend::Declining;
    }
    return sim::Trend::Stable;
}

sim::Assessment TrendAnalyzer::assess(double incident_rate, double avg_severity) const noexcept {
    if (incident_rate >= config_.concerning_incident_rate
        || avg_severity >= config_.concerning_severity) {
        return sim::Assessment::Concerning;
    }
    if (incident_rate <= config_.good_incident_rate
        && avg_severity <= config_.good_severity) {
        return sim::Assessment::Good;
    }
    return sim::Assessment::Mixed;
}

// ─── Summaries ────────────────────────────────────────────────────────────────

sim::Summary TrendAnalyzer::summarize(const sim::SimulationRun& run) const {
    return summarize(run.incident_log, run.steps_completed, run.activity);
}

sim::Summary
TrendAnalyzer::summarize(std::span<const sim::Incident> incidents,
                         std::size_t steps,
                         const std::map<std::string, sim::PartyActivity>& activity) const {
    sim::Summary s;
    s.total_incidents = incidents.size();

    const std::size_t midpoint = steps / 2;
    double severity_sum = 0.0;
    std::size_t attempts = 0;
    std::size_t rescued  = 0;
    std::vector<std::size_t> incident_steps;
    incident_steps.reserve(incidents.size());

    for (const auto& inc : incidents) {
        severity_sum   += inc.severity;
        s.max_severity  = std::max(s.max_severity, inc.severity);
        if (inc.agreement_violation) ++s.violations;
        if (inc.de_escalated)        ++s.de_escalated;
        if (inc.step < midpoint) {
            ++s.first_half_incidents;
        } else {
            ++s.second_half_incidents;
        }
        if (inc.mechanism != sim::Mechanism::None) {
            ++attempts;
            if (inc.de_escalated) ++rescued;
        }
        incident_steps.push_back(inc.step);
    }

    if (!incidents.empty()) {
        s.avg_severity = severity_sum / static_cast<double>(incidents.size());
    }
    if (steps > 0) {
        s.incident_rate = 100.0 * static_cast<double>(incidents.size())
                        / static_cast<double>(steps);
    }

    s.trend      = classify_trend(s.first_half_incidents, s.second_half_incidents);
    s.assessment = assess(s.incident_rate, s.avg_severity);

    for (const auto& [party, tally] : activity) {
        double rate = 1.0;
        if (tally.activities > 0) {
            rate = 1.0 - static_cast<double>(tally.violations)
                       / static_cast<double>(tally.activities);
        }
        s.compliance_rate_per_party[party] = std::clamp(rate, 0.0, 1.0);
    }

    if (attempts > 0) {
        s.hotline_effectiveness = static_cast<double>(rescued) / static_cast<double>(attempts);
    }

    const auto counts = window_counts(incident_steps, steps, config_.slope_window);
    if (counts.size() >= 2) {
        std::vector<double> x(counts.size());
        std::iota(x.begin(), x.end(), 0.0);
        s.incident_slope = least_squares_slope(x, counts);
    }
    return s;
}

}  // namespace medsim::analysis
