#pragma once

/// @file src/sim/behavior_table.hpp
/// @brief Role behaviour table and default roster.
///
/// Agents are explicit behaviour-table entities: what an agent does on a step
/// is sampled from the base rates of its role; the rest of its behaviour is
/// driven by {aggression_level, compliance_bias, memory}.
///
///     role        patrol  resupply  fishing  max escorts
///     CoastGuard   0.45     0.10     0.00        3
///     Navy         0.35     0.15     0.00        4
///     Militia      0.25     0.15     0.20        4
///     Fisher       0.00     0.05     0.55        1
///
/// The remaining probability mass is "idle in port".

#include "medsim/party.hpp"
#include "medsim/simulation.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace medsim::sim {

struct ActivityRates {
    double      patrol      = 0.0;
    double      resupply    = 0.0;
    double      fishing     = 0.0;
    std::size_t max_escorts = 0;
};

[[nodiscard]] ActivityRates activity_rates(AgentRole role) noexcept;

/// Map a uniform draw u ∈ [0, 1) onto the role's activity distribution.
/// nullopt means the agent stays idle this step.
[[nodiscard]] std::optional<ActivityKind>
select_activity(const ActivityRates& rates, double u) noexcept;

/// Roster used when the configuration supplies none.
///
/// The first party fields three coast-guard cutters and four militia
/// vessels, the second two coast-guard patrols and six fishing boats, any
/// further party two patrols and three fishing boats.
[[nodiscard]] std::vector<AgentSpec>
default_roster(std::span<const PartyProfile> parties);

}  // namespace medsim::sim
