#pragma once

/// @file include/medsim/simulation.hpp
/// @brief AgentSimulator: discrete-time stochastic field simulation of an
///        agreement.
///
/// # Module: AgentSimulator
///
/// ## Responsibility
/// Advance a roster of rule-based agents (coast-guard cutters, navy escorts,
/// maritime militia, fishing boats) for a fixed number of steps under the
/// terms of a proposal, and record every adverse interaction as an Incident.
///
/// ## Step
///   1. Weather evolves (slow Markov chain: calm ↔ moderate ↔ rough).
///   2. Tension decays exponentially; aggression relaxes toward base and is
///      pushed up by remaining tension.
///   3. Each agent samples an activity (patrol, resupply, fishing) from its
///      role's base rates.  Resupply runs are checked against the escort
///      limit and the notice period.
///   4. Active agents of different parties sharing a zone interact.  The
///      deliberate-violation probability is
///
///         p = rate · aggr · (1 − ½·compliance) · e^(−standoff/scale)
///               · (1 + tension) · (1 + weather_perturbation · w)
///
///      and accidents occur at accident_rate · w, independent of behaviour
///      (w ∈ {0, ½, 1} is the weather index).
///   5. CUES, then the hotline, try to de-escalate each incident with their
///      configured success probability when the proposal enables them.
///   6. Both agents remember the interaction; incidents raise tension.
///
/// ## Determinism
/// All randomness flows from one mt19937_64 seeded per run.  Same seed,
/// proposal, parties, duration and configuration ⇒ identical run.
///
/// ## Concurrency
/// A run is strictly sequential.  Independent runs share nothing and may be
/// executed concurrently.  `CancellationToken` is the only cross-thread
/// channel; it is observed at step boundaries.

#include "medsim/constants.hpp"
#include "medsim/incident.hpp"
#include "medsim/issue_space.hpp"
#include "medsim/party.hpp"
#include "medsim/trend.hpp"
#include "medsim/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace medsim::sim {

// ─── Agents ───────────────────────────────────────────────────────────────────

enum class AgentRole {
    CoastGuard,
    Navy,
    Militia,
    Fisher,
};

enum class ActivityKind {
    Patrol,
    Resupply,
    Fishing,
};

enum class WeatherState {
    Calm,
    Moderate,
    Rough,
};

[[nodiscard]] const char* to_string(AgentRole r) noexcept;
[[nodiscard]] const char* to_string(ActivityKind a) noexcept;
[[nodiscard]] const char* to_string(WeatherState w) noexcept;

/// Roster entry: `count` identical agents for one party.
struct AgentSpec {
    std::string party_id;
    AgentRole   role            = AgentRole::CoastGuard;
    double      base_aggression = 0.1;
    double      compliance_bias = 0.7;  ///< Propensity to respect the terms
    std::size_t count           = 1;
};

/// One remembered interaction.
struct MemoryEntry {
    std::size_t step     = 0;
    double      severity = 0.0;   ///< 0 for a benign encounter
    bool        incident = false;

    bool operator==(const MemoryEntry&) const = default;
};

/// Mutable per-agent state, owned by exactly one run.
struct AgentState {
    std::size_t             id = 0;
    std::string             party_id;
    AgentRole               role = AgentRole::CoastGuard;
    std::size_t             zone = 0;
    double                  base_aggression  = 0.1;
    double                  aggression_level = 0.1;
    double                  compliance_bias  = 0.7;
    double                  tension          = 0.0;  ///< Decaying incident memory
    std::deque<MemoryEntry> memory;                  ///< Most recent last; incidents in it raise violation odds

    bool operator==(const AgentState&) const = default;
};

// ─── Agreement terms ──────────────────────────────────────────────────────────

/// Proposal dimension ids the simulator reads its rules from.
struct TermBindings {
    std::string standoff_nm  = "standoff_nm";
    std::string escort_limit = "escorts";
    std::string notice_hours = "notice_hours";
    std::string hotline      = "hotline";
    std::string cues         = "cues";
};

/// Field rules extracted from a proposal.  Absent terms are ungoverned.
struct AgreementTerms {
    std::optional<double> standoff_nm;
    std::optional<double> escort_limit;
    std::optional<double> notice_hours;
    bool                  hotline = false;
    bool                  cues    = false;

    /// Continuous terms read numerically; switches accept a boolean or a
    /// non-zero number.
    [[nodiscard]] static AgreementTerms from_proposal(const Proposal& proposal,
                                                      const TermBindings& bindings) noexcept;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct SimulationConfig {
    TermBindings terms{};

    double cues_success        = constants::DEFAULT_CUES_SUCCESS;
    double hotline_success     = constants::DEFAULT_HOTLINE_SUCCESS;
    double weather_perturbation = constants::DEFAULT_WEATHER_PERTURBATION;
    double weather_change_rate = constants::DEFAULT_WEATHER_CHANGE_RATE;
    double accident_rate       = constants::DEFAULT_ACCIDENT_RATE;
    double memory_decay        = constants::DEFAULT_MEMORY_DECAY;
    double tension_cap         = constants::DEFAULT_TENSION_CAP;
    std::size_t memory_capacity = constants::DEFAULT_MEMORY_CAPACITY;
    double recent_incident_weight = constants::DEFAULT_RECENT_INCIDENT_WEIGHT;
    double interaction_rate    = constants::DEFAULT_INTERACTION_RATE;
    double standoff_scale_nm   = constants::DEFAULT_STANDOFF_SCALE_NM;
    double notice_tolerance_hours = constants::DEFAULT_NOTICE_TOLERANCE_HOURS;
    std::size_t zone_count     = constants::DEFAULT_ZONE_COUNT;
    WeatherState initial_weather = WeatherState::Calm;
    std::uint64_t random_draw_budget = constants::DEFAULT_RANDOM_DRAW_BUDGET;

    /// Explicit roster; empty ⇒ default roster derived from the parties.
    std::vector<AgentSpec> roster;

    /// Emit per-step diagnostics to stderr.
    bool verbose = false;

    /// # Throws
    /// `ConfigurationError` for probabilities outside [0, 1], memory_decay
    /// outside (0, 1], a negative recent_incident_weight, non-positive
    /// scales, tension_cap ≤ 0, zone_count or
    /// memory_capacity of 0, or a roster entry with bad rates or count 0.
    void validate() const;
};

// ─── Cancellation ─────────────────────────────────────────────────────────────

/// Cooperative cancellation flag shared between a caller and a run.
/// Copies refer to the same flag.
class CancellationToken {
public:
    CancellationToken();

    void request() noexcept;
    [[nodiscard]] bool requested() const noexcept;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct RunOptions {
    CancellationToken cancel{};

    /// Called after every completed step with its 0-based index.
    std::function<void(std::size_t)> on_step;
};

// ─── SimulationRun ────────────────────────────────────────────────────────────

struct SimulationRun {
    Proposal      proposal;
    std::size_t   duration        = 0;
    std::uint64_t seed            = 0;
    std::size_t   steps_completed = 0;
    bool          complete        = false;  ///< false ⇒ cancelled at a step boundary
    std::vector<Incident> incident_log;     ///< Non-decreasing step order
    std::map<std::string, PartyActivity> activity;  ///< Party id → tallies
    std::vector<WeatherState> weather_trace;        ///< One entry per step
    std::vector<AgentState>   final_agents;
    Summary       summary;
};

// ─── AgentSimulator ───────────────────────────────────────────────────────────

class AgentSimulator {
public:
    /// # Throws
    /// `ConfigurationError` if either configuration fails validation.
    explicit AgentSimulator(SimulationConfig config = SimulationConfig{},
                            analysis::TrendConfig trend = analysis::TrendConfig{});

    /// Simulate `duration` steps of the agreement.
    ///
    /// # Throws
    /// - `ValidationError`: proposal invalid for `space`, no parties, a
    ///   roster entry naming an unknown party, or a duration longer than the
    ///   step trace can hold
    /// - `SimulationError`: random-draw budget exhausted (this run only)
    [[nodiscard]] SimulationRun run(const Proposal& proposal,
                                    const IssueSpace& space,
                                    std::span<const PartyProfile> parties,
                                    std::size_t duration,
                                    std::uint64_t seed,
                                    const RunOptions& options = RunOptions{}) const;

    /// Instantiate agents for a roster (or the default roster when empty).
    [[nodiscard]] std::vector<AgentState>
    build_agents(std::span<const PartyProfile> parties) const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    SimulationConfig        config_;
    analysis::TrendAnalyzer analyzer_;
};

}  // namespace medsim::sim
