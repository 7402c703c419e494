#pragma once

/// @file include/medsim/engine.hpp
/// @brief Engine: public facade of the Bargaining & Simulation Engine.
///
/// # Module: Engine
///
/// ## Responsibility
/// Expose the three host-facing operations:
///   evaluate_proposal   IssueSpace + Proposal + parties →
///                       UtilityEngine → AcceptanceModel → Evaluation
///   simulate_agreement  IssueSpace + Proposal + parties + duration + seed →
///                       AgentSimulator → TrendAnalyzer → SimulationRun
///   cancel_simulation   cooperative cancellation of an in-flight run
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// engine.register_issue_space(IssueSpace("scs", dims));
/// auto eval = engine.evaluate_proposal("scs", proposal, parties);
/// fmt::print("{}\n", eval.to_string());
///
/// auto run = engine.simulate_agreement("scs", proposal, parties, 300);
/// fmt::print("seed {} → {}\n", run.seed, run.summary.to_string());
/// ```
///
/// ## Guarantees
/// - The engine keeps no process-wide state: every call is a function of its
///   explicit arguments, the registered issue spaces and the run's own RNG
/// - `evaluate_proposal` and `simulate_agreement` are const and may be called
///   concurrently; registration takes an exclusive lock
/// - Configuration is validated once, here, at construction

#include "medsim/acceptance.hpp"
#include "medsim/constants.hpp"
#include "medsim/issue_space.hpp"
#include "medsim/party.hpp"
#include "medsim/simulation.hpp"
#include "medsim/trend.hpp"
#include "medsim/types.hpp"
#include "medsim/utility.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace medsim::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Thresholds of the negotiation-level analysis.
struct AgreementConfig {
    /// An agreement is Pareto efficient when every party clears its BATNA and
    /// at least one reaches `aspiration_fraction · aspiration_level`.
    double aspiration_level    = constants::DEFAULT_ASPIRATION_LEVEL;
    double aspiration_fraction = constants::DEFAULT_ASPIRATION_FRACTION;

    /// # Throws
    /// `ConfigurationError` unless both values lie in (0, 1].
    void validate() const;
};

/// Every tunable threshold and rate, grouped by the component that uses it.
struct EngineConfig {
    bargaining::UtilityConfig    utility{};
    bargaining::AcceptanceConfig acceptance{};
    sim::SimulationConfig        simulation{};
    analysis::TrendConfig        trend{};
    AgreementConfig              agreement{};

    /// If true, emit diagnostics to stderr.  Also switches on the
    /// simulator's per-step output.
    bool verbose = false;

    /// # Throws
    /// `ConfigurationError` naming the first inconsistent setting.
    void validate() const;
};

// ─── Evaluation ───────────────────────────────────────────────────────────────

/// Negotiation-level diagnostics over all parties.
struct AgreementAnalysis {
    bool   zopa_exists      = false;  ///< Every party at or above its BATNA
    bool   pareto_efficient = false;  ///< ZOPA and some party near its aspiration
    double nash_product     = 0.0;    ///< Π of positive surpluses over BATNA; 0 if none
    std::vector<std::string> below_batna;  ///< Party ids
    std::vector<std::string> hints;        ///< Facilitator-facing suggestions
};

struct Evaluation {
    std::vector<bargaining::UtilityScore>     utilities;    ///< Party order
    std::vector<bargaining::AcceptanceResult> acceptances;  ///< Party order
    double            overall_probability = 0.0;            ///< Π p_i
    AgreementAnalysis analysis;

    /// Formatted per-party table.
    [[nodiscard]] std::string to_string() const;
};

// ─── SimulationHandle ─────────────────────────────────────────────────────────

/// An in-flight simulation started with `Engine::start_simulation`.
/// Move-only.  Destroying (or assigning over) a handle whose result was
/// never taken cancels the run and waits for it to stop at its next step
/// boundary.
class SimulationHandle {
public:
    SimulationHandle(std::future<sim::SimulationRun> result,
                     sim::CancellationToken token,
                     std::uint64_t seed);
    ~SimulationHandle();

    SimulationHandle(SimulationHandle&&) noexcept = default;
    SimulationHandle& operator=(SimulationHandle&& other) noexcept;
    SimulationHandle(const SimulationHandle&)            = delete;
    SimulationHandle& operator=(const SimulationHandle&) = delete;

    /// Seed the run uses (generated when the caller supplied none).
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

    /// Request cancellation; the run stops at its next step boundary.
    void cancel() noexcept;

    /// Block until the run finishes and take its result.  Rethrows any
    /// `ValidationError` or `SimulationError` raised by the run.  The result
    /// can be taken once; a second call throws `SimulationError`.
    [[nodiscard]] sim::SimulationRun get();

    /// False once the result has been taken.
    [[nodiscard]] bool pending() const noexcept { return result_.valid(); }

private:
    std::future<sim::SimulationRun> result_;
    sim::CancellationToken          token_;
    std::uint64_t                   seed_;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// # Throws
    /// `ConfigurationError` if `config` fails validation.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Register (or replace) an issue space under its id.
    void register_issue_space(IssueSpace space);

    /// # Throws
    /// `ValidationError(UnknownIssueSpace)` if nothing is registered under `id`.
    [[nodiscard]] std::shared_ptr<const IssueSpace>
    issue_space(std::string_view id) const;

    /// Score `proposal` for every party and combine acceptance probabilities.
    ///
    /// # Throws
    /// `ValidationError` for an unknown issue space, an empty party list,
    /// duplicate party ids, or any proposal / profile defect.
    [[nodiscard]] Evaluation
    evaluate_proposal(std::string_view issue_space_id,
                      const Proposal& proposal,
                      std::span<const PartyProfile> parties) const;

    /// Run one simulation synchronously.  When `seed` is empty a fresh seed
    /// is drawn and recorded in the returned run.
    [[nodiscard]] sim::SimulationRun
    simulate_agreement(std::string_view issue_space_id,
                       const Proposal& proposal,
                       std::span<const PartyProfile> parties,
                       std::size_t duration,
                       std::optional<std::uint64_t> seed = std::nullopt,
                       const sim::RunOptions& options = sim::RunOptions{}) const;

    /// Start a simulation on its own thread.  Inputs are copied; the
    /// returned handle owns the only reference to the result.
    [[nodiscard]] SimulationHandle
    start_simulation(std::string_view issue_space_id,
                     Proposal proposal,
                     std::vector<PartyProfile> parties,
                     std::size_t duration,
                     std::optional<std::uint64_t> seed = std::nullopt) const;

    /// Best-effort cooperative cancellation.
    static void cancel_simulation(SimulationHandle& handle) noexcept;

    /// Fresh non-deterministic seed.
    [[nodiscard]] static std::uint64_t generate_seed();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] AgreementAnalysis
    analyse(std::span<const bargaining::UtilityScore> utilities) const;

    EngineConfig                 config_;
    bargaining::UtilityEngine    utility_;
    bargaining::AcceptanceModel  acceptance_;
    sim::AgentSimulator          simulator_;

    mutable std::shared_mutex    registry_mutex_;
    std::map<std::string, std::shared_ptr<const IssueSpace>, std::less<>> registry_;
};

}  // namespace medsim::core
