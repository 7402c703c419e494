#pragma once

/// @file include/medsim/monte_carlo.hpp
/// @brief Monte Carlo exploration and one-at-a-time sensitivity analysis.
///
/// # Module: MonteCarloExplorer / SensitivityAnalyzer
///
/// ## Responsibility
/// Run many independent simulations of the same agreement (different seeds,
/// candidate proposals, or parameter settings) and reduce them to
/// distribution statistics.
///
/// ## Concurrency
/// Fan-out / fan-in: each run is launched with `std::async` and owns its RNG,
/// agents and incident log.  Results are only combined after every future has
/// been collected.  No accumulator is shared between runs.
///
/// ## Sensitivity Index
/// For a parameter swept over values x_i with mean incident counts y_i:
///
///     index = |slope(y ~ x)| · (max x − min x)
///
/// where the slope is the least-squares fit computed with Eigen.

#include "medsim/engine.hpp"
#include "medsim/incident.hpp"
#include "medsim/party.hpp"
#include "medsim/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace medsim::analysis {

// ─── Monte Carlo ──────────────────────────────────────────────────────────────

struct MonteCarloReport {
    std::string proposal_id;
    std::size_t runs          = 0;
    double      mean_incidents = 0.0;
    std::optional<double> stddev_incidents;   ///< nullopt for a single run
    double      mean_severity  = 0.0;
    double      escalating_share = 0.0;       ///< Fraction of runs trending up
    std::map<std::string, double> mean_compliance;  ///< Party id → mean rate
    std::vector<sim::Summary> summaries;      ///< Seed order

    [[nodiscard]] std::string to_string() const;
};

class MonteCarloExplorer {
public:
    explicit MonteCarloExplorer(const core::Engine& engine) noexcept;

    /// One simulation per seed, concurrently.
    ///
    /// # Throws
    /// `ValidationError` if `seeds` is empty or any run rejects its inputs;
    /// `SimulationError` if any run fails.
    [[nodiscard]] MonteCarloReport
    explore(std::string_view issue_space_id,
            const Proposal& proposal,
            std::span<const PartyProfile> parties,
            std::size_t duration,
            std::span<const std::uint64_t> seeds) const;

    /// Explore several candidates over the same seeds; reports are ordered by
    /// ascending mean incident count (ties keep input order).
    [[nodiscard]] std::vector<MonteCarloReport>
    compare(std::string_view issue_space_id,
            std::span<const Proposal> candidates,
            std::span<const PartyProfile> parties,
            std::size_t duration,
            std::span<const std::uint64_t> seeds) const;

    /// Seeds base, base + 1, …, base + n − 1.
    [[nodiscard]] static std::vector<std::uint64_t>
    seed_sequence(std::uint64_t base, std::size_t n);

    /// Reduce finished summaries (seed order preserved).
    [[nodiscard]] static MonteCarloReport
    reduce(std::string proposal_id, std::vector<sim::Summary> summaries);

private:
    const core::Engine& engine_;
};

// ─── Sensitivity ──────────────────────────────────────────────────────────────

enum class SimParameter {
    CuesSuccess,
    HotlineSuccess,
    WeatherPerturbation,
    MemoryDecay,
    InteractionRate,
};

[[nodiscard]] const char* to_string(SimParameter p) noexcept;

struct SensitivityResult {
    SimParameter        parameter = SimParameter::InteractionRate;
    std::vector<double> values;
    std::vector<double> mean_incidents;
    std::vector<double> stddev_incidents;
    double              sensitivity_index = 0.0;

    [[nodiscard]] std::string to_string() const;
};

class SensitivityAnalyzer {
public:
    /// `base` is the configuration every sweep starts from.
    ///
    /// # Throws
    /// `ConfigurationError` if `base` fails validation.
    explicit SensitivityAnalyzer(core::EngineConfig base);

    /// Vary one parameter, holding the rest of `base` fixed.  Each value is
    /// simulated over `seeds`.
    ///
    /// # Throws
    /// `ConfigurationError` if a swept value is invalid for the parameter;
    /// `ValidationError` if fewer than two values or no seeds are given.
    [[nodiscard]] SensitivityResult
    one_at_a_time(const IssueSpace& space,
                  const Proposal& proposal,
                  std::span<const PartyProfile> parties,
                  SimParameter parameter,
                  std::span<const double> values,
                  std::size_t duration,
                  std::span<const std::uint64_t> seeds) const;

    /// Copy of `config` with `parameter` set to `value`.
    [[nodiscard]] static core::EngineConfig
    with_parameter(core::EngineConfig config, SimParameter parameter, double value) noexcept;

private:
    core::EngineConfig base_;
};

}  // namespace medsim::analysis
