// leg_selection_optimizer_test.cpp — staged filtering, greedy selection, relaxation ladder

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "probability/parlay_probability_calculator.hpp"
#include "selection/conflict_rules.hpp"
#include "selection/leg_selection_optimizer.hpp"
#include "selection/selection_stages.hpp"

#include "test_helpers.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using test_helpers::make_leg;
using test_helpers::make_priced_leg;
using test_helpers::make_slate;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

bool has_stage(const SelectionResult& r, StageResult::Reason reason) {
    return std::find(r.stages.begin(), r.stages.end(), reason) != r.stages.end();
}

void expect_invariants(const SelectionResult& r) {
    std::map<std::string, int> per_game;
    for (size_t i = 0; i < r.legs.size(); ++i) {
        per_game[r.legs[i].game_id] += 1;
        for (size_t j = i + 1; j < r.legs.size(); ++j) {
            EXPECT_FALSE(same_selection(r.legs[i], r.legs[j]));
            EXPECT_FALSE(conflict_rules::conflicts(r.legs[i], r.legs[j]));
        }
    }
    for (const auto& [game, n] : per_game) EXPECT_LE(n, 2) << game;
    EXPECT_EQ(r.scores.size(), r.legs.size());
}

}  // namespace

// ===========================================================================
// 1. Conflict rules
// ===========================================================================
class ConflictRulesTest : public ::testing::Test {};

TEST_F(ConflictRulesTest, OppositeMoneylineSidesConflict) {
    EXPECT_TRUE(conflict_rules::conflicts(make_leg("G1", "h2h", "home", "+100", 0.5),
                                          make_leg("G1", "h2h", "AwayG1", "+100", 0.5)));
}

TEST_F(ConflictRulesTest, OverUnderConflict) {
    EXPECT_TRUE(conflict_rules::conflicts(make_leg("G1", "totals", "over", "-110", 0.5, 60.0, 44.5),
                                          make_leg("G1", "totals", "under", "-110", 0.5, 60.0, 44.5)));
}

TEST_F(ConflictRulesTest, DifferentGamesOrMarketsDoNotConflict) {
    EXPECT_FALSE(conflict_rules::conflicts(make_leg("G1", "h2h", "home", "+100", 0.5),
                                           make_leg("G2", "h2h", "away", "+100", 0.5)));
    EXPECT_FALSE(conflict_rules::conflicts(make_leg("G1", "h2h", "home", "+100", 0.5),
                                           make_leg("G1", "spreads", "away", "-110", 0.5, 60.0, 3.5)));
}

// ===========================================================================
// 2. Pipeline stages
// ===========================================================================
class SelectionStagesTest : public ::testing::Test {};

TEST_F(SelectionStagesTest, DedupKeepsHighestConfidence) {
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "-110", 0.56, 60.0),
                          make_leg("G1", "h2h", "HomeG1", "-105", 0.56, 72.0),
                          make_leg("G2", "h2h", "home", "-110", 0.56, 60.0)};
    StageResult r = selection_stages::deduplicate(legs, 2);
    EXPECT_EQ(r.reason, StageResult::Reason::OK);
    ASSERT_EQ(r.pool.size(), 2u);
    EXPECT_DOUBLE_EQ(r.pool[0].confidence_score, 72.0);
}

TEST_F(SelectionStagesTest, EdgeFilterSortsAndFallsBack) {
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "+100", 0.52),
                          make_leg("G2", "h2h", "home", "+100", 0.58),
                          make_leg("G3", "h2h", "home", "+100", 0.45)};
    StageResult ok = selection_stages::filter_edge(legs, 2, 0.01);
    EXPECT_EQ(ok.reason, StageResult::Reason::OK);
    ASSERT_EQ(ok.pool.size(), 2u);
    EXPECT_EQ(ok.pool[0].game_id, "G2");

    StageResult fallback = selection_stages::filter_edge(legs, 3, 0.01);
    EXPECT_EQ(fallback.reason, StageResult::Reason::EDGE_FALLBACK);
    EXPECT_EQ(fallback.pool.size(), 3u);
}

TEST_F(SelectionStagesTest, ConfidenceRelaxesThenFallsBack) {
    SelectionConfig cfg;
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "+100", 0.55, 60.0),
                          make_leg("G2", "h2h", "home", "+100", 0.55, 48.0),
                          make_leg("G3", "h2h", "home", "+100", 0.55, 30.0)};
    auto relaxed = selection_stages::filter_confidence(legs, 2, cfg.balanced, cfg.confidence_relax_factor);
    EXPECT_EQ(relaxed.reason, StageResult::Reason::CONFIDENCE_RELAXED);
    EXPECT_EQ(relaxed.pool.size(), 2u);

    auto all = selection_stages::filter_confidence(legs, 3, cfg.balanced, cfg.confidence_relax_factor);
    EXPECT_EQ(all.reason, StageResult::Reason::CONFIDENCE_FALLBACK);
    EXPECT_EQ(all.pool.size(), 3u);
}

TEST_F(SelectionStagesTest, DegenDoesNotRelax) {
    SelectionConfig cfg;
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "+100", 0.55, 45.0),
                          make_leg("G2", "h2h", "home", "+100", 0.55, 35.0)};
    auto r = selection_stages::filter_confidence(legs, 2, cfg.degen, cfg.confidence_relax_factor);
    EXPECT_EQ(r.reason, StageResult::Reason::CONFIDENCE_FALLBACK);
}

TEST_F(SelectionStagesTest, ScoreWeighsEvConfidenceAndEdge) {
    SelectionConfig cfg;
    Leg leg = make_leg("G1", "h2h", "home", "+100", 0.60, 50.0);
    double ev = 0.60 * 2.0 - 1.0;
    EXPECT_NEAR(selection_stages::score_leg(leg, cfg), ev * (0.7 + 0.3 * 0.5) + 0.10 * 0.5, 1e-12);
}

// ===========================================================================
// 3. LegSelectionOptimizer
// ===========================================================================
class LegSelectionOptimizerTest : public ::testing::Test {
protected:
    LegSelectionOptimizer optimizer;
};

TEST_F(LegSelectionOptimizerTest, TwoIndependentLegs) {
    Leg a = make_priced_leg("G1", "h2h", "home", "-122", 0.55, 0.60);
    Leg b = make_priced_leg("G2", "totals", "over", "+100", 0.50, 0.52);
    b.point = 44.5;

    SelectionResult r = optimizer.select({a, b}, 2, RiskProfile::BALANCED);
    ASSERT_EQ(r.legs.size(), 2u);
    EXPECT_TRUE(r.complete(2));
    EXPECT_NEAR(combined_implied_probability(r.legs), 0.275, 1e-12);

    ParlayProbabilityCalculator calc;
    JointProbability joint = calc.breakdown(r.legs, RiskProfile::BALANCED);
    EXPECT_NEAR(joint.naive, 0.312, 1e-12);
    EXPECT_DOUBLE_EQ(joint.adjusted, joint.naive);
    EXPECT_EQ(joint.same_game_groups, 0);
}

TEST_F(LegSelectionOptimizerTest, NoDuplicateSelections) {
    std::vector<Leg> pool{make_leg("G1", "h2h", "home", "+100", 0.60, 70.0),
                          make_leg("G1", "h2h", "HomeG1", "+105", 0.60, 65.0),
                          make_leg("G2", "h2h", "away", "+110", 0.55, 70.0),
                          make_leg("G3", "h2h", "home", "+100", 0.56, 70.0)};
    SelectionResult r = optimizer.select(pool, 3, RiskProfile::BALANCED);
    ASSERT_EQ(r.legs.size(), 3u);
    expect_invariants(r);
}

TEST_F(LegSelectionOptimizerTest, AtMostTwoLegsPerGame) {
    std::vector<Leg> pool{make_leg("G1", "h2h", "home", "+100", 0.60, 70.0),
                          make_leg("G1", "spreads", "home", "-110", 0.58, 70.0, -3.5),
                          make_leg("G1", "totals", "over", "-110", 0.57, 70.0, 44.5)};
    SelectionResult r = optimizer.select(pool, 3, RiskProfile::DEGEN);
    EXPECT_EQ(r.legs.size(), 2u);
    EXPECT_FALSE(r.complete(3));
    expect_invariants(r);
}

TEST_F(LegSelectionOptimizerTest, ConflictingSidesNeverBothSelected) {
    std::vector<Leg> pool{make_leg("G1", "h2h", "home", "+100", 0.62, 70.0),
                          make_leg("G1", "h2h", "away", "+100", 0.58, 70.0),
                          make_leg("G2", "totals", "over", "-110", 0.56, 70.0, 41.5)};
    SelectionResult r = optimizer.select(pool, 3, RiskProfile::BALANCED);
    ASSERT_EQ(r.legs.size(), 2u);
    expect_invariants(r);
    EXPECT_EQ(r.legs[0].outcome, "home");
}

TEST_F(LegSelectionOptimizerTest, CeilingRelaxesForCorrelatedLegs) {
    // Moneyline and spread on the same side correlate at 0.7.
    std::vector<Leg> pool{make_leg("G1", "h2h", "home", "+120", 0.55, 80.0),
                          make_leg("G1", "spreads", "home", "+105", 0.55, 80.0, 2.5),
                          make_leg("G2", "h2h", "home", "+100", 0.54, 80.0)};
    SelectionResult two = optimizer.select(pool, 2, RiskProfile::CONSERVATIVE);
    ASSERT_EQ(two.legs.size(), 2u);
    EXPECT_DOUBLE_EQ(two.ceiling_used, 0.35);
    EXPECT_NE(two.legs[0].game_id, two.legs[1].game_id);

    SelectionResult three = optimizer.select(pool, 3, RiskProfile::CONSERVATIVE);
    ASSERT_EQ(three.legs.size(), 3u);
    EXPECT_DOUBLE_EQ(three.ceiling_used, 0.85);
    expect_invariants(three);
}

TEST_F(LegSelectionOptimizerTest, BestScoreFirst) {
    std::vector<Leg> pool{make_leg("G1", "h2h", "home", "+100", 0.52, 70.0),
                          make_leg("G2", "h2h", "home", "+100", 0.60, 70.0),
                          make_leg("G3", "h2h", "home", "+100", 0.56, 70.0)};
    SelectionResult r = optimizer.select(pool, 2, RiskProfile::BALANCED);
    ASSERT_EQ(r.legs.size(), 2u);
    EXPECT_EQ(r.legs[0].game_id, "G2");
    EXPECT_EQ(r.legs[1].game_id, "G3");
    EXPECT_GT(r.scores[0], r.scores[1]);
}

TEST_F(LegSelectionOptimizerTest, NegativeEdgePoolStillFills) {
    SelectionResult r = optimizer.select(make_slate(4, "-150", 0.55, 70.0), 3, RiskProfile::BALANCED);
    EXPECT_EQ(r.legs.size(), 3u);
    EXPECT_TRUE(has_stage(r, StageResult::Reason::EDGE_FALLBACK));
}

TEST_F(LegSelectionOptimizerTest, EmptyPoolThrowsInsufficient) {
    try {
        optimizer.select({}, 3, RiskProfile::BALANCED);
        FAIL() << "expected InsufficientCandidatesError";
    } catch (const InsufficientCandidatesError& e) {
        EXPECT_EQ(e.needed(), 3);
        EXPECT_EQ(e.have(), 0);
        EXPECT_NE(std::string(e.what()).find("Found 0 candidate legs"), std::string::npos);
    }
}

TEST_F(LegSelectionOptimizerTest, LegCountOutOfRangeThrows) {
    auto pool = make_slate(3);
    EXPECT_THROW(optimizer.select(pool, 0, RiskProfile::BALANCED), ValidationError);
    EXPECT_THROW(optimizer.select(pool, 21, RiskProfile::BALANCED), ValidationError);
}

TEST_F(LegSelectionOptimizerTest, ConstraintLadderPerProfile) {
    auto ladder = optimizer.constraint_profiles(RiskProfile::DEGEN);
    ASSERT_EQ(ladder.size(), 3u);
    EXPECT_DOUBLE_EQ(ladder[0].max_pair_correlation, 0.75);
    EXPECT_DOUBLE_EQ(ladder[1].max_pair_correlation, 0.85);
    EXPECT_DOUBLE_EQ(ladder[2].max_pair_correlation, 0.99);
    EXPECT_EQ(ladder[0].max_legs_per_game, 2);
}

TEST_F(LegSelectionOptimizerTest, LegacyDiversifyDropsNearDuplicates) {
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "+100", 0.55),
                          make_leg("G1", "h2h", "away", "+100", 0.55),
                          make_leg("G1", "spreads", "home", "-110", 0.55, 60.0, -1.5),
                          make_leg("G2", "h2h", "home", "+100", 0.55)};
    auto kept = LegSelectionOptimizer::legacy_diversify(legs, 0.8);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[1].market_type, MarketType::SPREAD);
    EXPECT_EQ(kept[2].game_id, "G2");
}
