/// @file tests/bargaining/test_utility_engine.cpp
/// @brief Tests for UtilityEngine: satisfaction curve, veto and aggregation.

#include "medsim/utility.hpp"
#include "medsim/errors.hpp"
#include "scenario_fixtures.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace medsim;
using namespace medsim::bargaining;

// ─── satisfaction ─────────────────────────────────────────────────────────────

TEST(UtilityEngine_Satisfaction, OneAtIdealAndFloorAtMinimum) {
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(5.0, 5.0, 2.0, FalloffShape::Linear, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(2.0, 5.0, 2.0, FalloffShape::Linear, 0.5), 0.5);
}

TEST(UtilityEngine_Satisfaction, FavourableSideOfIdealIsFull) {
    // Floor bound: more is better.
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(8.0, 5.0, 2.0, FalloffShape::Linear, 0.5), 1.0);
    // Ceiling bound: less is better.
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(0.0, 2.0, 4.0, FalloffShape::Linear, 0.5), 1.0);
}

TEST(UtilityEngine_Satisfaction, PastMinimumIsZero) {
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(1.0, 5.0, 2.0, FalloffShape::Linear, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(4.5, 2.0, 4.0, FalloffShape::Linear, 0.5), 0.0);
}

TEST(UtilityEngine_Satisfaction, LinearInterpolatesBetweenIdealAndMinimum) {
    // t = (5 − 3) / 3 = 2/3 → 1 − 0.5 · 2/3
    EXPECT_NEAR(UtilityEngine::satisfaction(3.0, 5.0, 2.0, FalloffShape::Linear, 0.5),
                2.0 / 3.0, 1e-12);
    // Ceiling: t = (24 − 12) / 36 = 1/3
    EXPECT_NEAR(UtilityEngine::satisfaction(24.0, 12.0, 48.0, FalloffShape::Linear, 0.5),
                1.0 - 0.5 / 3.0, 1e-12);
}

TEST(UtilityEngine_Satisfaction, ShapesOrderAtMidpoint) {
    // t = 0.5: convex 1 − 0.5·0.25, linear 1 − 0.5·0.5, concave 1 − 0.5·√0.5
    const double convex  = UtilityEngine::satisfaction(3.5, 5.0, 2.0, FalloffShape::Convex, 0.5);
    const double linear  = UtilityEngine::satisfaction(3.5, 5.0, 2.0, FalloffShape::Linear, 0.5);
    const double concave = UtilityEngine::satisfaction(3.5, 5.0, 2.0, FalloffShape::Concave, 0.5);
    EXPECT_NEAR(convex, 0.875, 1e-12);
    EXPECT_NEAR(linear, 0.75, 1e-12);
    EXPECT_NEAR(concave, 1.0 - 0.5 * std::sqrt(0.5), 1e-12);
    EXPECT_GT(convex, linear);
    EXPECT_GT(linear, concave);
}

TEST(UtilityEngine_Satisfaction, ExactBoundIsAllOrNothing) {
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(1.0, 1.0, 1.0, FalloffShape::Linear, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(0.0, 1.0, 1.0, FalloffShape::Linear, 0.5), 0.0);
}

TEST(UtilityEngine_Satisfaction, ZeroFloorReachesZeroAtMinimum) {
    EXPECT_DOUBLE_EQ(UtilityEngine::satisfaction(2.0, 5.0, 2.0, FalloffShape::Linear, 0.0), 0.0);
}

TEST(UtilityEngine_PastMinimum, StrictlyBeyondOnly) {
    EXPECT_FALSE(UtilityEngine::past_minimum(2.0, 5.0, 2.0));
    EXPECT_TRUE(UtilityEngine::past_minimum(1.99, 5.0, 2.0));
    EXPECT_FALSE(UtilityEngine::past_minimum(4.0, 2.0, 4.0));
    EXPECT_TRUE(UtilityEngine::past_minimum(4.01, 2.0, 4.0));
}

// ─── score ────────────────────────────────────────────────────────────────────

TEST(UtilityEngine_Score, ReproducesDraftScenario) {
    const UtilityEngine engine;
    const auto space = fixtures::standoff_space();
    const auto proposal = fixtures::draft_proposal();

    const auto a = engine.score(proposal, fixtures::party_a(), space);
    EXPECT_NEAR(a.score, 2.0 / 3.0, 1e-9);
    EXPECT_FALSE(a.vetoed);
    EXPECT_FALSE(a.below_batna);
    EXPECT_NEAR(a.batna_margin, 2.0 / 3.0 - 0.30, 1e-9);

    const auto b = engine.score(proposal, fixtures::party_b(), space);
    EXPECT_NEAR(b.score, 0.625, 1e-9);
    EXPECT_GT(b.score, 0.0);
    EXPECT_LT(b.score, a.score);
}

TEST(UtilityEngine_Score, BreakdownFollowsInterests) {
    const UtilityEngine engine;
    const auto b = engine.score(fixtures::draft_proposal(), fixtures::party_b(),
                                fixtures::standoff_space());
    ASSERT_EQ(b.breakdown.size(), 3u);

    double total = 0.0;
    for (const auto& d : b.breakdown) {
        EXPECT_TRUE(d.present);
        EXPECT_NEAR(d.contribution, d.weight * d.satisfaction, 1e-12);
        total += d.contribution;
    }
    EXPECT_NEAR(total, b.score, 1e-12);

    // Map order: escorts, notice_hours, standoff_nm
    EXPECT_EQ(b.breakdown[0].dimension_id, "escorts");
    EXPECT_NEAR(b.breakdown[0].satisfaction, 0.5, 1e-12);
    EXPECT_NEAR(b.breakdown[1].satisfaction, 0.5, 1e-12);
    EXPECT_NEAR(b.breakdown[2].satisfaction, 0.75, 1e-12);
}

TEST(UtilityEngine_Score, AllIdealsGiveOne) {
    const UtilityEngine engine;
    Proposal p = fixtures::draft_proposal();
    p.values["standoff_nm"]  = 5.0;
    p.values["escorts"]      = 2.0;
    p.values["notice_hours"] = 12.0;
    const auto a = engine.score(p, fixtures::party_a(), fixtures::standoff_space());
    EXPECT_DOUBLE_EQ(a.score, 1.0);
}

TEST(UtilityEngine_Score, RedLineViolationVetoes) {
    const UtilityEngine engine;
    auto a = fixtures::party_a();
    a.red_lines.insert("standoff_nm");

    Proposal p = fixtures::draft_proposal();
    p.values["standoff_nm"]  = 1.0;  // past PartyA's minimum of 2
    p.values["escorts"]      = 2.0;
    p.values["notice_hours"] = 12.0;

    const auto s = engine.score(p, a, fixtures::standoff_space());
    EXPECT_DOUBLE_EQ(s.score, 0.0);
    EXPECT_TRUE(s.vetoed);
    ASSERT_EQ(s.vetoing_dimensions.size(), 1u);
    EXPECT_EQ(s.vetoing_dimensions.front(), "standoff_nm");
    EXPECT_TRUE(s.below_batna);
}

TEST(UtilityEngine_Score, RedLineAtMinimumDoesNotVeto) {
    const UtilityEngine engine;
    auto a = fixtures::party_a();
    a.red_lines.insert("standoff_nm");
    Proposal p = fixtures::draft_proposal();
    p.values["standoff_nm"] = 2.0;
    const auto s = engine.score(p, a, fixtures::standoff_space());
    EXPECT_FALSE(s.vetoed);
    EXPECT_GT(s.score, 0.0);
}

TEST(UtilityEngine_Score, VetoCanBeSwitchedOff) {
    const UtilityEngine engine(UtilityConfig{.red_line_veto = false});
    auto a = fixtures::party_a();
    a.red_lines.insert("standoff_nm");
    Proposal p = fixtures::draft_proposal();
    p.values["standoff_nm"] = 1.0;

    const auto s = engine.score(p, a, fixtures::standoff_space());
    EXPECT_FALSE(s.vetoed);
    EXPECT_EQ(s.vetoing_dimensions.size(), 1u);
    // standoff contributes 0; escorts 0.3·0.5, notice 0.3·(1 − 0.5/3)
    EXPECT_NEAR(s.score, 0.15 + 0.25, 1e-9);
}

TEST(UtilityEngine_Score, BelowBatnaIsFlaggedNotZeroed) {
    const UtilityEngine engine;
    auto b = fixtures::party_b();
    b.batna_utility = 0.7;
    const auto s = engine.score(fixtures::draft_proposal(), b, fixtures::standoff_space());
    EXPECT_TRUE(s.below_batna);
    EXPECT_NEAR(s.score, 0.625, 1e-9);
    EXPECT_NEAR(s.batna_margin, -0.075, 1e-9);
}

TEST(UtilityEngine_Score, MissingDimensionEarnsNothing) {
    const UtilityEngine engine;
    Proposal p = fixtures::draft_proposal();
    p.values.erase("escorts");
    const auto a = engine.score(p, fixtures::party_a(), fixtures::standoff_space());
    EXPECT_NEAR(a.score, 2.0 / 3.0 - 0.3 * 0.5, 1e-9);
    EXPECT_FALSE(a.breakdown[0].present);
}

TEST(UtilityEngine_Score, MovingTowardIdealNeverLowersUtility) {
    const UtilityEngine engine;
    const auto space = fixtures::standoff_space();
    const auto a = fixtures::party_a();

    Proposal p = fixtures::draft_proposal();
    double previous = -1.0;
    for (double standoff = 0.0; standoff <= 10.0; standoff += 0.5) {
        p.values["standoff_nm"] = standoff;
        const double u = engine.score(p, a, space).score;
        EXPECT_GE(u, previous - 1e-12) << "standoff " << standoff;
        previous = u;
    }
}

// ─── errors ───────────────────────────────────────────────────────────────────

TEST(UtilityEngine_Errors, UnknownDimensionIsDimensionMismatch) {
    const UtilityEngine engine;
    Proposal p = fixtures::draft_proposal();
    p.values["ais_cell"] = true;
    try {
        (void)engine.score(p, fixtures::party_a(), fixtures::standoff_space());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationKind::DimensionMismatch);
        EXPECT_EQ(e.subject(), "ais_cell");
    }
}

TEST(UtilityEngine_Errors, OutOfRangeNamesTheBound) {
    const UtilityEngine engine;
    Proposal p = fixtures::draft_proposal();
    p.values["notice_hours"] = 60.0;
    try {
        (void)engine.score(p, fixtures::party_a(), fixtures::standoff_space());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationKind::OutOfRange);
        EXPECT_NE(std::string(e.what()).find("48"), std::string::npos);
    }
}

TEST(UtilityEngine_Errors, BadFloorIsConfigurationError) {
    EXPECT_THROW(UtilityEngine(UtilityConfig{.satisfaction_at_minimum = 1.0}), ConfigurationError);
    EXPECT_THROW(UtilityEngine(UtilityConfig{.satisfaction_at_minimum = -0.1}), ConfigurationError);
}

TEST(UtilityScore_ToString, MentionsPartyAndScore) {
    const UtilityEngine engine;
    const auto a = engine.score(fixtures::draft_proposal(), fixtures::party_a(),
                                fixtures::standoff_space());
    const auto text = a.to_string();
    EXPECT_NE(text.find("PartyA"), std::string::npos);
    EXPECT_NE(text.find("0.6667"), std::string::npos);
}
