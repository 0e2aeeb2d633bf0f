// counter_builder_test.cpp — hedge tickets from flipped legs, ticket analysis

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "coverage/counter_builder.hpp"
#include "parlay/ticket_analysis.hpp"

#include "test_helpers.hpp"

#include <vector>

using test_helpers::make_leg;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// Flipped edges: G1 +0.10, G2 +0.02, G3 about -0.033.
std::vector<Leg> make_ticket() {
    return {
        make_leg("G1", "h2h", "home", "+150", 0.30),
        make_leg("G2", "h2h", "home", "+100", 0.48),
        make_leg("G3", "h2h", "home", "-200", 0.70),
    };
}

}  // namespace

// ===========================================================================
// 1. CounterBuilder
// ===========================================================================
class CounterBuilderTest : public ::testing::Test {};

TEST_F(CounterBuilderTest, FlipAllKeepsOrder) {
    auto legs = make_ticket();
    CounterResult r = CounterBuilder::generate_counter(legs, CounterMode::FLIP_ALL);
    EXPECT_EQ(r.target_legs, 3);
    ASSERT_EQ(r.counter_legs.size(), 3u);
    for (size_t i = 0; i < legs.size(); ++i) {
        EXPECT_EQ(r.counter_legs[i].game_id, legs[i].game_id);
        EXPECT_EQ(r.counter_legs[i].outcome, "away");
    }
    EXPECT_EQ(r.analysis.num_legs, 3);
}

TEST_F(CounterBuilderTest, CandidatesRankedByScore) {
    CounterResult r = CounterBuilder::generate_counter(make_ticket(), CounterMode::FLIP_ALL);
    ASSERT_EQ(r.candidates.size(), 3u);
    EXPECT_EQ(r.candidates[0].original_index, 0);
    EXPECT_EQ(r.candidates[1].original_index, 1);
    EXPECT_EQ(r.candidates[2].original_index, 2);
    EXPECT_GT(r.candidates[0].score, r.candidates[1].score);
}

TEST_F(CounterBuilderTest, BestEdgesTakesPassingLegs) {
    CounterResult r = CounterBuilder::generate_counter(make_ticket(), CounterMode::BEST_EDGES, 2, 0.0);
    EXPECT_EQ(r.target_legs, 2);
    ASSERT_EQ(r.counter_legs.size(), 2u);
    EXPECT_EQ(r.counter_legs[0].game_id, "G1");
    EXPECT_EQ(r.counter_legs[1].game_id, "G2");
    for (const auto& leg : r.counter_legs) EXPECT_GE(leg.edge, 0.0);
}

TEST_F(CounterBuilderTest, BestEdgesFallsBackWhenTooFewPass) {
    CounterResult r = CounterBuilder::generate_counter(make_ticket(), CounterMode::BEST_EDGES, 3, 0.05);
    ASSERT_EQ(r.counter_legs.size(), 3u);
    EXPECT_EQ(r.counter_legs[2].game_id, "G3");
}

TEST_F(CounterBuilderTest, TargetIsClampedToTicketSize) {
    CounterResult r = CounterBuilder::generate_counter(make_ticket(), CounterMode::BEST_EDGES, 10, -1.0);
    EXPECT_EQ(r.target_legs, 3);
    EXPECT_EQ(r.counter_legs.size(), 3u);
}

TEST_F(CounterBuilderTest, EmptyTicketThrows) {
    EXPECT_THROW(CounterBuilder::generate_counter({}, CounterMode::FLIP_ALL), ValidationError);
}

TEST_F(CounterBuilderTest, ParseMode) {
    EXPECT_EQ(parse_counter_mode("Best_Edges"), CounterMode::BEST_EDGES);
    EXPECT_EQ(parse_counter_mode("flip_all"), CounterMode::FLIP_ALL);
    EXPECT_THROW(parse_counter_mode("random"), ValidationError);
}

// ===========================================================================
// 2. TicketAnalysis
// ===========================================================================
class TicketAnalysisTest : public ::testing::Test {};

TEST_F(TicketAnalysisTest, TwoStrongLegs) {
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "+100", 0.55, 60.0),
                          make_leg("G2", "h2h", "home", "+100", 0.55, 80.0)};
    TicketAnalysis a = ticket_analysis::analyze(legs);
    EXPECT_EQ(a.num_legs, 2);
    EXPECT_NEAR(a.parlay_decimal_odds, 4.0, 1e-12);
    EXPECT_EQ(a.parlay_american_odds, 300);
    EXPECT_NEAR(a.combined_implied_probability, 0.25, 1e-12);
    EXPECT_NEAR(a.combined_model_probability, 0.3025, 1e-12);
    EXPECT_DOUBLE_EQ(a.overall_confidence, 70.0);
    EXPECT_EQ(a.confidence_color, "green");
    ASSERT_EQ(a.leg_recommendations.size(), 2u);
    EXPECT_EQ(a.leg_recommendations[0], LegRecommendation::MODERATE);
    EXPECT_EQ(a.leg_recommendations[1], LegRecommendation::STRONG);
    EXPECT_EQ(a.strong_legs.size(), 1u);
    EXPECT_TRUE(a.weak_legs.empty());
    EXPECT_EQ(a.recommendation, TicketRecommendation::STRONG_PLAY);
}

TEST_F(TicketAnalysisTest, LongWeakTicketIsRisky) {
    std::vector<Leg> legs = test_helpers::make_slate(5, "+100", 0.52, 50.0);
    TicketAnalysis a = ticket_analysis::analyze(legs);
    EXPECT_DOUBLE_EQ(a.overall_confidence, 46.0);
    EXPECT_EQ(a.confidence_color, "red");
    EXPECT_EQ(a.weak_legs.size(), 5u);
    EXPECT_EQ(a.recommendation, TicketRecommendation::RISKY_PLAY);
    EXPECT_NE(a.risk_notes.find("5 leg(s)"), std::string::npos);
}

TEST_F(TicketAnalysisTest, ShortPriceAmericanOdds) {
    TicketAnalysis a = ticket_analysis::analyze({make_leg("G1", "h2h", "home", "-200", 0.70)});
    EXPECT_EQ(a.parlay_american_odds, -200);
}

TEST_F(TicketAnalysisTest, ConfidenceFloor) {
    EXPECT_DOUBLE_EQ(ticket_analysis::overall_confidence(test_helpers::make_slate(12, "+100", 0.52, 20.0)),
                     10.0);
}

TEST_F(TicketAnalysisTest, EmptyTicketThrows) {
    EXPECT_THROW(ticket_analysis::analyze({}), ValidationError);
}
