#pragma once

/// @file include/medsim/incident.hpp
/// @brief Incident records and run summaries shared by the simulator and the
///        TrendAnalyzer.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace medsim::sim {

// ─── Incident ─────────────────────────────────────────────────────────────────

/// Incident type, ordered by the severity band it is classified from.
enum class IncidentType {
    CloseApproach,
    Warning,
    Blocking,
    WaterCannon,
    DetentionAttempt,
    Collision,
    ProceduralViolation,  ///< Resupply run breaching escort or notice terms
};

/// De-escalation channel that was tried on an incident.
enum class Mechanism {
    None,
    Cues,     ///< Code for Unplanned Encounters at Sea, on scene
    Hotline,  ///< Government-to-government hotline
};

[[nodiscard]] const char* to_string(IncidentType t) noexcept;
[[nodiscard]] const char* to_string(Mechanism m) noexcept;

/// A recorded adverse interaction.  Immutable once appended to a run's log.
struct Incident {
    std::size_t              step = 0;
    std::vector<std::size_t> actors;               ///< Agent ids, initiator first
    IncidentType             type = IncidentType::CloseApproach;
    double                   severity = 0.0;       ///< ∈ [0, 1]
    bool                     agreement_violation = false;
    bool                     de_escalated = false;
    Mechanism                mechanism = Mechanism::None;  ///< Last channel tried
    bool                     accidental = false;   ///< Weather, not behaviour
    std::string              responsible_party;    ///< Empty when accidental

    bool operator==(const Incident&) const = default;
};

/// Activity and violation counts for one party over a run.
struct PartyActivity {
    std::size_t activities = 0;
    std::size_t violations = 0;

    bool operator==(const PartyActivity&) const = default;
};

// ─── Summary ──────────────────────────────────────────────────────────────────

enum class Trend {
    Declining,
    Stable,
    Escalating,
};

enum class Assessment {
    Good,
    Mixed,
    Concerning,
};

[[nodiscard]] const char* to_string(Trend t) noexcept;
[[nodiscard]] const char* to_string(Assessment a) noexcept;

struct Summary {
    std::size_t total_incidents  = 0;
    std::size_t violations       = 0;   ///< Incidents breaching the agreement
    std::size_t de_escalated     = 0;
    std::size_t first_half_incidents  = 0;
    std::size_t second_half_incidents = 0;
    double      avg_severity     = 0.0; ///< 0 for an incident-free run
    double      max_severity     = 0.0;
    double      incident_rate    = 0.0; ///< Incidents per 100 steps
    Trend       trend            = Trend::Stable;
    Assessment  assessment       = Assessment::Good;
    std::map<std::string, double> compliance_rate_per_party;

    /// De-escalated / incidents where CUES or the hotline was tried;
    /// nullopt when no mechanism was ever tried.
    std::optional<double> hotline_effectiveness;

    /// Least-squares slope of per-window incident counts; nullopt for runs
    /// shorter than two windows.
    std::optional<double> incident_slope;

    bool operator==(const Summary&) const = default;

    /// Multi-line report.
    [[nodiscard]] std::string to_string() const;
};

}  // namespace medsim::sim
