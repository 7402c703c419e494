/// @file src/analysis/summary.cpp
/// @brief Names and text rendering for incidents and run summaries.

#include "medsim/incident.hpp"

#include <fmt/format.h>

namespace medsim::sim {

const char* to_string(IncidentType t) noexcept {
    switch (t) {
        case IncidentType::CloseApproach:       return "close_approach";
        case IncidentType::Warning:             return "warning";
        case IncidentType::Blocking:            return "blocking";
        case IncidentType::WaterCannon:         return "water_cannon";
        case IncidentType::DetentionAttempt:    return "detention_attempt";
        case IncidentType::Collision:           return "collision";
        case IncidentType::ProceduralViolation: return "procedural_violation";
    }
    return "unknown";
}

const char* to_string(Mechanism m) noexcept {
    switch (m) {
        case Mechanism::None:    return "none";
        case Mechanism::Cues:    return "cues";
        case Mechanism::Hotline: return "hotline";
    }
    return "unknown";
}

const char* to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Declining:  return "declining";
        case Trend::Stable:     return "stable";
        case Trend::Escalating: return "escalating";
    }
    return "unknown";
}

const char* to_string(Assessment a) noexcept {
    switch (a) {
        case Assessment::Good:       return "good";
        case Assessment::Mixed:      return "mixed";
        case Assessment::Concerning: return "concerning";
    }
    return "unknown";
}

std::string Summary::to_string() const {
    std::string out;
    out += fmt::format("  incidents        : {} ({} violations, {} de-escalated)\n",
                       total_incidents, violations, de_escalated);
    out += fmt::format("  halves           : {} / {}\n",
                       first_half_incidents, second_half_incidents);
    out += fmt::format("  severity         : avg {:.3f}  max {:.3f}\n",
                       avg_severity, max_severity);
    out += fmt::format("  rate / 100 steps : {:.2f}\n", incident_rate);
    out += fmt::format("  trend            : {}\n", sim::to_string(trend));
    out += fmt::format("  assessment       : {}\n", sim::to_string(assessment));
    if (incident_slope) {
        out += fmt::format("  window slope     : {:+.4f}\n", *incident_slope);
    }
    if (hotline_effectiveness) {
        out += fmt::format("  de-escalation    : {:.1f}%\n", 100.0 * *hotline_effectiveness);
    } else {
        out += "  de-escalation    : n/a\n";
    }
    for (const auto& [party, rate] : compliance_rate_per_party) {
        out += fmt::format("  compliance {:<6}: {:.1f}%\n", party, 100.0 * rate);
    }
    return out;
}

}  // namespace medsim::sim
