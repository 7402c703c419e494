/// @file tests/party/test_party_profile.cpp
/// @brief Tests for PartyProfile validation and bound direction.

#include "medsim/party.hpp"
#include "medsim/errors.hpp"
#include "scenario_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace medsim;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

void expect_malformed(const PartyProfile& p, const IssueSpace& space, const std::string& fragment) {
    try {
        p.validate(space);
        ADD_FAILURE() << "expected MalformedProfile containing '" << fragment << "'";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationKind::MalformedProfile);
        EXPECT_EQ(e.subject(), p.party_id.empty() ? "<unnamed>" : p.party_id);
        EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
    }
}

}  // namespace

// ─── bound_direction ──────────────────────────────────────────────────────────

TEST(BoundDirection_FromPositions, FloorCeilingExact) {
    EXPECT_EQ(bound_direction(5.0, 2.0), BoundDirection::Floor);
    EXPECT_EQ(bound_direction(12.0, 48.0), BoundDirection::Ceiling);
    EXPECT_EQ(bound_direction(1.0, 1.0), BoundDirection::Exact);
}

// ─── validate ─────────────────────────────────────────────────────────────────

TEST(PartyProfile_Validate, FixturePartiesAreValid) {
    const auto space = fixtures::standoff_space();
    EXPECT_NO_THROW(fixtures::party_a().validate(space));
    EXPECT_NO_THROW(fixtures::party_b().validate(space));
}

TEST(PartyProfile_Validate, AspirationIdealBeyondRangeIsAllowed) {
    // PartyB's notice ideal (72 h) lies past the 48 h ceiling of the range.
    const auto space = fixtures::standoff_space();
    const auto b = fixtures::party_b();
    ASSERT_GT(std::get<double>(b.interests.at("notice_hours").ideal), 48.0);
    EXPECT_NO_THROW(b.validate(space));
}

TEST(PartyProfile_Validate, MinimumOutsideRangeIsRejected) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.interests["standoff_nm"].minimum_acceptable = 11.0;
    expect_malformed(a, space, "minimum_acceptable");
}

TEST(PartyProfile_Validate, WeightsMustSumToOne) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.interests["escorts"].weight = 0.5;
    expect_malformed(a, space, "sum to");
}

TEST(PartyProfile_Validate, NegativeWeightIsRejected) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.interests["escorts"].weight = -0.3;
    a.interests["standoff_nm"].weight = 1.0;
    expect_malformed(a, space, "weight of 'escorts'");
}

TEST(PartyProfile_Validate, UnknownDimensionIsRejected) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.interests["fisheries"] = Interest{.weight = 0.0, .ideal = true, .minimum_acceptable = true};
    expect_malformed(a, space, "fisheries");
}

TEST(PartyProfile_Validate, KindMismatchIsRejected) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.interests["escorts"].ideal = std::string{"two"};
    expect_malformed(a, space, "ideal_value");
}

TEST(PartyProfile_Validate, RedLineNeedsAnInterest) {
    const auto space = fixtures::standoff_space_with_mechanisms();
    auto a = fixtures::party_a();
    a.red_lines.insert("hotline");
    expect_malformed(a, space, "red line 'hotline'");
}

TEST(PartyProfile_Validate, RedLineMustBeADimension) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.red_lines.insert("sovereignty");
    expect_malformed(a, space, "sovereignty");
}

TEST(PartyProfile_Validate, BatnaAndRiskToleranceInUnitInterval) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.batna_utility = 1.2;
    expect_malformed(a, space, "batna_utility");

    a = fixtures::party_a();
    a.risk_tolerance = -0.1;
    expect_malformed(a, space, "risk_tolerance");
}

TEST(PartyProfile_Validate, EmptyIdAndNoInterestsAreRejected) {
    const auto space = fixtures::standoff_space();
    auto a = fixtures::party_a();
    a.party_id.clear();
    expect_malformed(a, space, "party_id");

    PartyProfile bare;
    bare.party_id = "Empty";
    expect_malformed(bare, space, "no interests");
}
