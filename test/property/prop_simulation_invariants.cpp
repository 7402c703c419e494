/**
 * @file  prop_simulation_invariants.cpp
 * @brief Property: ∀ seeds, proposals in range: a simulation run is
 *        reproducible and its log satisfies the incident invariants
 *
 * Run with 200 random inputs (each input simulates two runs):
 *   RC_PARAMS="max_success=200" ./prop_simulation_invariants
 *
 * Invariants:
 *   1. Same seed ⇒ identical incident log and summary
 *   2. severity ∈ [0, 1], steps non-decreasing and < duration
 *   3. accidental ⇔ no responsible party
 *   4. memory ≤ capacity, aggression within [MIN, MAX], tension ≤ cap
 *   5. summary totals agree with the log
 */

#include <rapidcheck.h>
#include <cstdint>

#include "medsim/simulation.hpp"
#include "scenario_fixtures.hpp"

using namespace medsim;
using namespace medsim::sim;

int main() {
    const auto space   = fixtures::standoff_space_with_mechanisms();
    const auto parties = fixtures::both_parties();
    const AgentSimulator simulator;

    rc::check(
        "simulation_invariants: reproducible and well-formed",
        [&](std::uint64_t seed, unsigned standoff_raw, bool hotline, bool cues) {
            Proposal p = fixtures::draft_proposal();
            p.values["standoff_nm"] = static_cast<double>(standoff_raw % 11);
            p.values["hotline"]     = hotline;
            p.values["cues"]        = cues;

            constexpr std::size_t duration = 120;
            const auto run   = simulator.run(p, space, parties, duration, seed);
            const auto again = simulator.run(p, space, parties, duration, seed);

            RC_ASSERT(run.incident_log == again.incident_log);
            RC_ASSERT(run.summary == again.summary);
            RC_ASSERT(run.complete);
            RC_ASSERT(run.weather_trace.size() == duration);

            std::size_t previous = 0;
            for (const auto& inc : run.incident_log) {
                RC_ASSERT(inc.severity >= 0.0 && inc.severity <= 1.0);
                RC_ASSERT(inc.step >= previous);
                RC_ASSERT(inc.step < duration);
                RC_ASSERT(inc.accidental == inc.responsible_party.empty());
                if (!hotline && !cues) RC_ASSERT(inc.mechanism == Mechanism::None);
                previous = inc.step;
            }

            const auto& cfg = simulator.config();
            for (const auto& agent : run.final_agents) {
                RC_ASSERT(agent.memory.size() <= cfg.memory_capacity);
                RC_ASSERT(agent.aggression_level >= constants::MIN_AGGRESSION);
                RC_ASSERT(agent.aggression_level <= constants::MAX_AGGRESSION);
                RC_ASSERT(agent.tension <= cfg.tension_cap);
            }

            RC_ASSERT(run.summary.total_incidents == run.incident_log.size());
            RC_ASSERT(run.summary.first_half_incidents + run.summary.second_half_incidents
                      == run.summary.total_incidents);
        }
    );

    return 0;
}
