/// @file tests/integration/test_end_to_end.cpp
/// @brief End-to-end tests for the full mediation pipeline.
///
/// These tests exercise the complete path:
///   scenario text → ScenarioLoader → IssueSpace → Engine::evaluate_proposal
///   (UtilityEngine → AcceptanceModel) → Engine::simulate_agreement
///   (AgentSimulator → TrendAnalyzer) → MonteCarloExplorer

#include "medsim/engine.hpp"
#include "medsim/monte_carlo.hpp"
#include "medsim/scenario_loader.hpp"
#include "medsim/errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace medsim;
using namespace medsim::core;

namespace {

const std::string SCENARIO = R"(
dimension,standoff_nm,continuous,0,10,nm
dimension,escorts,continuous,0,5
dimension,notice_hours,continuous,0,48,h
dimension,hotline,boolean
dimension,cues,boolean
party,PartyA,0.30,0.50
party,PartyB,0.40,0.30
interest,PartyA,standoff_nm,0.4,5,2
interest,PartyA,escorts,0.3,2,1
interest,PartyA,notice_hours,0.3,12,48
interest,PartyB,standoff_nm,0.5,2,4
interest,PartyB,escorts,0.2,0,1
interest,PartyB,notice_hours,0.3,72,24
proposal,draft-1,1,Mediator
term,standoff_nm,3
term,escorts,1
term,notice_hours,24
)";

/// Engine with the scenario's space registered under "scenario".
struct Pipeline {
    Scenario scenario = ScenarioLoader::parse_string(SCENARIO);
    Engine   engine;

    Pipeline() { engine.register_issue_space(scenario.issue_space("scenario")); }
};

}  // namespace

TEST(EndToEnd_Evaluate, LoadedScenarioReproducesHandComputedUtilities) {
    Pipeline p;
    ASSERT_EQ(p.scenario.skipped_rows, 0u);

    const auto eval = p.engine.evaluate_proposal("scenario", p.scenario.proposal, p.scenario.parties);
    EXPECT_NEAR(eval.utilities[0].score, 0.6667, 1e-4);
    EXPECT_NEAR(eval.utilities[1].score, 0.625, 1e-12);
    EXPECT_EQ(eval.acceptances[0].status, bargaining::AcceptanceStatus::Strong);
    EXPECT_EQ(eval.acceptances[1].status, bargaining::AcceptanceStatus::Strong);
    EXPECT_NEAR(eval.overall_probability,
                eval.acceptances[0].probability * eval.acceptances[1].probability, 1e-15);
}

TEST(EndToEnd_Evaluate, MechanismsDoNotChangeUtility) {
    // Neither party weights the hotline or CUES.
    Pipeline p;
    auto with = p.scenario.proposal;
    with.values["hotline"] = true;
    with.values["cues"]    = true;

    const auto base = p.engine.evaluate_proposal("scenario", p.scenario.proposal, p.scenario.parties);
    const auto mech = p.engine.evaluate_proposal("scenario", with, p.scenario.parties);
    EXPECT_DOUBLE_EQ(base.overall_probability, mech.overall_probability);
}

TEST(EndToEnd_Simulate, MechanismsContainIncidents) {
    Pipeline p;
    auto with = p.scenario.proposal;
    with.id = "draft-mech";
    with.values["hotline"] = true;
    with.values["cues"]    = true;

    const auto seeds = analysis::MonteCarloExplorer::seed_sequence(500, 10);
    const analysis::MonteCarloExplorer explorer(p.engine);
    const auto bare = explorer.explore("scenario", p.scenario.proposal, p.scenario.parties, 300, seeds);
    const auto mech = explorer.explore("scenario", with, p.scenario.parties, 300, seeds);

    const auto live = [](const analysis::MonteCarloReport& r) {
        std::size_t n = 0;
        for (const auto& s : r.summaries) n += s.total_incidents - s.de_escalated;
        return n;
    };
    EXPECT_LT(live(mech), live(bare));

    for (const auto& s : bare.summaries) {
        EXPECT_EQ(s.de_escalated, 0u);
        EXPECT_FALSE(s.hotline_effectiveness.has_value());
    }
    for (const auto& s : mech.summaries) {
        ASSERT_TRUE(s.hotline_effectiveness.has_value());
        EXPECT_GT(*s.hotline_effectiveness, 0.8);
    }
}

TEST(EndToEnd_Simulate, RunSummaryIsConsistentWithLog) {
    Pipeline p;
    const auto run = p.engine.simulate_agreement("scenario", p.scenario.proposal,
                                                 p.scenario.parties, 300, 2718);
    ASSERT_TRUE(run.complete);

    const auto& s = run.summary;
    EXPECT_EQ(s.total_incidents, run.incident_log.size());
    EXPECT_EQ(s.first_half_incidents + s.second_half_incidents, s.total_incidents);
    EXPECT_NEAR(s.incident_rate, 100.0 * static_cast<double>(s.total_incidents) / 300.0, 1e-12);

    const auto violations = std::count_if(run.incident_log.begin(), run.incident_log.end(),
        [](const sim::Incident& i) { return i.agreement_violation; });
    EXPECT_EQ(static_cast<std::size_t>(violations), s.violations);

    for (const auto& [party, rate] : s.compliance_rate_per_party) {
        const auto& tally = run.activity.at(party);
        EXPECT_NEAR(rate, 1.0 - static_cast<double>(tally.violations)
                               / static_cast<double>(tally.activities), 1e-12) << party;
    }
    EXPECT_NE(s.to_string().find("incidents"), std::string::npos);
}

TEST(EndToEnd_Errors, BadScenarioSurfacesAsValidationError) {
    Scenario sc = ScenarioLoader::parse_string(SCENARIO + "interest,PartyA,escorts,0.9,2,1\n");
    Engine engine;
    engine.register_issue_space(sc.issue_space("scenario"));
    // PartyA's weights now sum to 1.6.
    EXPECT_THROW((void)engine.evaluate_proposal("scenario", sc.proposal, sc.parties), ValidationError);
}
