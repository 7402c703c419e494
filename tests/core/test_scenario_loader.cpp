/// @file tests/core/test_scenario_loader.cpp
/// @brief Tests for ScenarioLoader: row parsing, skipping and file loading.

#include "medsim/scenario_loader.hpp"
#include "medsim/errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace medsim;
using namespace medsim::core;

namespace {

const std::string DRAFT_SCENARIO = R"(# South China Sea draft
dimension,standoff_nm,continuous,0,10,nm
dimension,escorts,continuous,0,5
dimension,notice_hours,continuous,0,48,h
dimension,hotline,boolean
dimension,regime,categorical,closed|joint|open

party,PartyA,0.30,0.50
party,PartyB,0.40,0.30
interest,PartyA,standoff_nm,0.4,5,2
interest,PartyA,escorts,0.3,2,1
interest,PartyA,notice_hours,0.3,12,48
interest,PartyB,standoff_nm,0.5,2,4   # PartyB wants the cutters close
interest,PartyB,escorts,0.2,0,1
interest,PartyB,notice_hours,0.3,72,24
redline,PartyA,standoff_nm

proposal,draft-1,2,Mediator
term,standoff_nm,3
term,escorts,1
term,notice_hours,24
term,hotline,Yes
)";

}  // namespace

// ─── parse_string ─────────────────────────────────────────────────────────────

TEST(ScenarioLoader_Parse, ReadsEveryRecordKind) {
    const auto sc = ScenarioLoader::parse_string(DRAFT_SCENARIO);
    EXPECT_EQ(sc.skipped_rows, 0u);
    ASSERT_EQ(sc.dimensions.size(), 5u);
    EXPECT_EQ(sc.dimensions[0].unit, "nm");
    EXPECT_EQ(sc.dimensions[3].kind, DimensionKind::Boolean);
    EXPECT_EQ(sc.dimensions[4].labels.size(), 3u);

    ASSERT_EQ(sc.parties.size(), 2u);
    EXPECT_DOUBLE_EQ(sc.parties[0].batna_utility, 0.30);
    EXPECT_EQ(sc.parties[0].interests.size(), 3u);
    EXPECT_EQ(sc.parties[0].red_lines.count("standoff_nm"), 1u);
    EXPECT_DOUBLE_EQ(std::get<double>(sc.parties[1].interests.at("notice_hours").ideal), 72.0);

    EXPECT_EQ(sc.proposal.id, "draft-1");
    EXPECT_EQ(sc.proposal.round_number, 2u);
    EXPECT_EQ(sc.proposal.proposer, "Mediator");
    EXPECT_DOUBLE_EQ(std::get<double>(sc.proposal.values.at("standoff_nm")), 3.0);
    EXPECT_TRUE(std::get<bool>(sc.proposal.values.at("hotline")));
}

TEST(ScenarioLoader_Parse, LoadedScenarioValidates) {
    const auto sc = ScenarioLoader::parse_string(DRAFT_SCENARIO);
    const auto space = sc.issue_space("scenario");
    EXPECT_NO_THROW(space.validate(sc.proposal));
    for (const auto& p : sc.parties) {
        EXPECT_NO_THROW(p.validate(space)) << p.party_id;
    }
}

TEST(ScenarioLoader_Parse, MalformedRowsAreSkippedAndCounted) {
    const std::string text =
        "dimension,standoff_nm,continuous,0,ten\n"   // bad bound
        "dimension,escorts,continuous,0,5\n"
        "dimension,mystery,quaternion\n"             // unknown kind
        "party,PartyA,0.3\n"                         // missing field
        "party,PartyA,0.3,0.5\n"
        "party,PartyA,0.2,0.5\n"                     // duplicate
        "interest,PartyZ,escorts,1,0,1\n"            // unknown party
        "interest,PartyA,standoff_nm,1,0,1\n"        // undeclared dimension
        "interest,PartyA,escorts,1,0,1\n"
        "term,escorts,many\n"                        // not a number
        "vessel,Haiyang\n";                          // unknown record
    const auto sc = ScenarioLoader::parse_string(text);
    EXPECT_EQ(sc.skipped_rows, 8u);
    EXPECT_EQ(sc.dimensions.size(), 1u);
    ASSERT_EQ(sc.parties.size(), 1u);
    EXPECT_EQ(sc.parties[0].interests.size(), 1u);
    EXPECT_TRUE(sc.proposal.values.empty());
}

TEST(ScenarioLoader_Parse, EmptyInputGivesDefaultProposal) {
    const auto sc = ScenarioLoader::parse_string("");
    EXPECT_EQ(sc.proposal.id, "proposal");
    EXPECT_EQ(sc.skipped_rows, 0u);
    EXPECT_TRUE(sc.dimensions.empty());
}

TEST(ScenarioLoader_Parse, CommentsAndBlankLinesIgnored) {
    const auto sc = ScenarioLoader::parse_string("# only comments\n\n   \n# more\r\n");
    EXPECT_EQ(sc.skipped_rows, 0u);
}

TEST(ScenarioLoader_Parse, FractionalRoundIsRejected) {
    const auto sc = ScenarioLoader::parse_string("proposal,p,1.5\n");
    EXPECT_EQ(sc.skipped_rows, 1u);
}

TEST(ScenarioLoader_Parse, OversizedRoundIsRejected) {
    const auto sc = ScenarioLoader::parse_string(
        "proposal,p,1e300,Mediator\n"
        "proposal,q,18446744073709551616,Mediator\n");
    EXPECT_EQ(sc.skipped_rows, 2u);
    EXPECT_EQ(sc.proposal.id, "proposal");
    EXPECT_EQ(sc.proposal.round_number, 0u);
}

TEST(ScenarioLoader_Parse, InconsistentSpaceSurfacesOnBuild) {
    const auto sc = ScenarioLoader::parse_string(
        "dimension,standoff_nm,continuous,10,0\n");
    ASSERT_EQ(sc.dimensions.size(), 1u);
    EXPECT_THROW((void)sc.issue_space("x"), ValidationError);
}

// ─── parse_value ──────────────────────────────────────────────────────────────

TEST(ScenarioLoader_ParseValue, BooleanSpellings) {
    const auto dim = Dimension::boolean("hotline");
    for (const char* t : {"true", "TRUE", "1", "yes"}) {
        ASSERT_TRUE(ScenarioLoader::parse_value(dim, t).has_value()) << t;
        EXPECT_TRUE(std::get<bool>(*ScenarioLoader::parse_value(dim, t))) << t;
    }
    for (const char* t : {"false", "0", "No"}) {
        EXPECT_FALSE(std::get<bool>(*ScenarioLoader::parse_value(dim, t))) << t;
    }
    EXPECT_FALSE(ScenarioLoader::parse_value(dim, "maybe").has_value());
}

TEST(ScenarioLoader_ParseValue, ContinuousRejectsGarbage) {
    const auto dim = Dimension::continuous("escorts", 0.0, 5.0);
    EXPECT_DOUBLE_EQ(std::get<double>(*ScenarioLoader::parse_value(dim, " 2.5 ")), 2.5);
    EXPECT_FALSE(ScenarioLoader::parse_value(dim, "2.5nm").has_value());
    EXPECT_FALSE(ScenarioLoader::parse_value(dim, "").has_value());
    EXPECT_FALSE(ScenarioLoader::parse_value(dim, "1e999").has_value());
    EXPECT_FALSE(ScenarioLoader::parse_value(dim, "nan").has_value());
}

TEST(ScenarioLoader_ParseValue, CategoricalPassesLabelThrough) {
    const auto dim = Dimension::categorical("regime", {"closed", "open"});
    EXPECT_EQ(std::get<std::string>(*ScenarioLoader::parse_value(dim, "shared")), "shared");
}

// ─── load_file ────────────────────────────────────────────────────────────────

TEST(ScenarioLoader_LoadFile, MissingFileIsNullopt) {
    EXPECT_FALSE(ScenarioLoader::load_file("/nonexistent/medsim/scenario.csv").has_value());
}

TEST(ScenarioLoader_LoadFile, ReadsFromDisk) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path file = dir / ("medsim_scenario_" + std::to_string(nonce) + ".csv");

    {
        std::ofstream out(file);
        ASSERT_TRUE(out.is_open());
        out << DRAFT_SCENARIO;
    }
    const auto sc = ScenarioLoader::load_file(file.string());
    fs::remove(file, ec);

    ASSERT_TRUE(sc.has_value());
    EXPECT_EQ(sc->parties.size(), 2u);
    EXPECT_EQ(sc->proposal.values.size(), 4u);
}
