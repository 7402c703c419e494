/// @file src/sim/behavior_table.cpp
/// @brief Role base rates and the default roster.

#include "sim/behavior_table.hpp"

namespace medsim::sim {

ActivityRates activity_rates(AgentRole role) noexcept {
    switch (role) {
        case AgentRole::CoastGuard:
            return {.patrol = 0.45, .resupply = 0.10, .fishing = 0.00, .max_escorts = 3};
        case AgentRole::Navy:
            return {.patrol = 0.35, .resupply = 0.15, .fishing = 0.00, .max_escorts = 4};
        case AgentRole::Militia:
            return {.patrol = 0.25, .resupply = 0.15, .fishing = 0.20, .max_escorts = 4};
        case AgentRole::Fisher:
            return {.patrol = 0.00, .resupply = 0.05, .fishing = 0.55, .max_escorts = 1};
    }
    return {};
}

std::optional<ActivityKind> select_activity(const ActivityRates& rates, double u) noexcept {
    double edge = rates.patrol;
    if (u < edge) return ActivityKind::Patrol;
    edge += rates.resupply;
    if (u < edge) return ActivityKind::Resupply;
    edge += rates.fishing;
    if (u < edge) return ActivityKind::Fishing;
    return std::nullopt;
}

std::vector<AgentSpec> default_roster(std::span<const PartyProfile> parties) {
    std::vector<AgentSpec> roster;
    for (std::size_t i = 0; i < parties.size(); ++i) {
        const auto& id = parties[i].party_id;
        if (i == 0) {
            roster.push_back({.party_id = id, .role = AgentRole::CoastGuard,
                              .base_aggression = 0.15, .compliance_bias = 0.7, .count = 3});
            roster.push_back({.party_id = id, .role = AgentRole::Militia,
                              .base_aggression = 0.20, .compliance_bias = 0.5, .count = 4});
        } else if (i == 1) {
            roster.push_back({.party_id = id, .role = AgentRole::CoastGuard,
                              .base_aggression = 0.10, .compliance_bias = 0.8, .count = 2});
            roster.push_back({.party_id = id, .role = AgentRole::Fisher,
                              .base_aggression = 0.05, .compliance_bias = 0.6, .count = 6});
        } else {
            roster.push_back({.party_id = id, .role = AgentRole::CoastGuard,
                              .base_aggression = 0.10, .compliance_bias = 0.8, .count = 2});
            roster.push_back({.party_id = id, .role = AgentRole::Fisher,
                              .base_aggression = 0.05, .compliance_bias = 0.6, .count = 3});
        }
    }
    return roster;
}

}  // namespace medsim::sim
