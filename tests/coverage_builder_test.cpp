// coverage_builder_test.cpp — scenario enumeration and round-robin packs

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "coverage/coverage_builder.hpp"

#include "test_helpers.hpp"

#include <cstdint>
#include <future>
#include <numeric>
#include <vector>

using test_helpers::make_leg;
using test_helpers::make_slate;

// ===========================================================================
// 1. Counting
// ===========================================================================
class CoverageCountTest : public ::testing::Test {};

TEST_F(CoverageCountTest, Binomial) {
    EXPECT_EQ(CoverageBuilder::binomial(5, 0), 1u);
    EXPECT_EQ(CoverageBuilder::binomial(5, 2), 10u);
    EXPECT_EQ(CoverageBuilder::binomial(20, 10), 184756u);
    EXPECT_EQ(CoverageBuilder::binomial(3, 4), 0u);
}

TEST_F(CoverageCountTest, UpsetCountsSumToScenarioTotal) {
    CoverageBuilder builder;
    for (int n : {1, 3, 7}) {
        CoveragePack pack = builder.build_coverage_pack(make_slate(n), 1, 2, 0, 1);
        EXPECT_EQ(pack.total_scenarios, uint64_t{1} << n);
        ASSERT_EQ(pack.by_upset_count.size(), static_cast<size_t>(n + 1));
        uint64_t sum = std::accumulate(pack.by_upset_count.begin(), pack.by_upset_count.end(), uint64_t{0});
        EXPECT_EQ(sum, pack.total_scenarios);
    }
}

TEST_F(CoverageCountTest, ThreeLegBreakdown) {
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(3), 4, 2, 10, 20);
    EXPECT_EQ(pack.by_upset_count, (std::vector<uint64_t>{1, 3, 3, 1}));
}

// ===========================================================================
// 2. Scenario tickets
// ===========================================================================
class CoverageScenarioTest : public ::testing::Test {};

TEST_F(CoverageScenarioTest, MostLikelyScenarioFirst) {
    // Every leg favoured (0.55), so no flips is the top scenario.
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(3), 4, 2, 0, 20);
    ASSERT_EQ(pack.scenario_tickets.size(), 4u);
    EXPECT_EQ(pack.scenario_tickets[0].num_upsets, 0);
    EXPECT_NEAR(pack.scenario_tickets[0].probability, 0.55 * 0.55 * 0.55, 1e-12);
    for (size_t i = 1; i < 4; ++i) {
        EXPECT_EQ(pack.scenario_tickets[i].num_upsets, 1);
        EXPECT_NEAR(pack.scenario_tickets[i].probability, 0.55 * 0.55 * 0.45, 1e-12);
    }
}

TEST_F(CoverageScenarioTest, TicketsOrderedByProbability) {
    std::vector<Leg> legs{make_leg("G1", "h2h", "home", "-150", 0.70),
                          make_leg("G2", "h2h", "home", "+200", 0.30),
                          make_leg("G3", "totals", "over", "-110", 0.52, 60.0, 44.5)};
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(legs, 8, 2, 0, 20);
    ASSERT_EQ(pack.scenario_tickets.size(), 8u);
    for (size_t i = 1; i < pack.scenario_tickets.size(); ++i) {
        EXPECT_GE(pack.scenario_tickets[i - 1].probability, pack.scenario_tickets[i].probability);
    }
    // Best: G1 home, G2 flipped to away, G3 over.
    const auto& best = pack.scenario_tickets[0];
    EXPECT_EQ(best.num_upsets, 1);
    EXPECT_EQ(best.legs[0].outcome, "home");
    EXPECT_EQ(best.legs[1].outcome, "away");
    EXPECT_EQ(best.legs[2].outcome, "over");
}

TEST_F(CoverageScenarioTest, TicketCarriesAnalysis) {
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(2), 1, 2, 0, 20);
    ASSERT_EQ(pack.scenario_tickets.size(), 1u);
    EXPECT_EQ(pack.scenario_tickets[0].analysis.num_legs, 2);
    EXPECT_FALSE(pack.scenario_tickets[0].analysis.summary.empty());
}

TEST_F(CoverageScenarioTest, MaxTotalCapsBothLists) {
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(3), 10, 2, 10, 5);
    EXPECT_EQ(pack.scenario_tickets.size(), 5u);
    EXPECT_TRUE(pack.round_robin_tickets.empty());
}

TEST_F(CoverageScenarioTest, TopKIsExactOverFullSpace) {
    std::vector<double> p{0.6, 0.7, 0.2};
    std::vector<double> q{0.4, 0.3, 0.8};
    auto top = CoverageBuilder::top_k_scenarios(p, q, 8);
    ASSERT_EQ(top.size(), 8u);
    double total = 0.0;
    for (const auto& s : top) total += s.probability;
    EXPECT_NEAR(total, 1.0, 1e-12);
    EXPECT_EQ(top[0].mask, 4u);   // flip only the 0.2 leg
}

// ===========================================================================
// 3. Round robins
// ===========================================================================
class CoverageRoundRobinTest : public ::testing::Test {};

TEST_F(CoverageRoundRobinTest, AllPairsOfThree) {
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(3), 0, 2, 10, 20);
    EXPECT_TRUE(pack.scenario_tickets.empty());
    ASSERT_EQ(pack.round_robin_tickets.size(), 3u);
    for (const auto& t : pack.round_robin_tickets) {
        EXPECT_EQ(t.legs.size(), 2u);
        EXPECT_EQ(t.num_upsets, 0);
    }
}

TEST_F(CoverageRoundRobinTest, StrongestPairFirst) {
    std::vector<double> p{0.5, 0.9, 0.8, 0.3};
    auto top = CoverageBuilder::top_k_round_robins(p, 2, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].indices, (std::vector<int>{1, 2}));
    EXPECT_NEAR(top[0].probability, 0.72, 1e-12);
    EXPECT_EQ(top[1].indices, (std::vector<int>{0, 1}));
}

TEST_F(CoverageRoundRobinTest, SizeOutOfRangeIsEmpty) {
    std::vector<double> p{0.5, 0.6};
    EXPECT_TRUE(CoverageBuilder::top_k_round_robins(p, 3, 5).empty());
    EXPECT_TRUE(CoverageBuilder::top_k_round_robins(p, 1, 5).empty());
}

// ===========================================================================
// 4. Limits and async
// ===========================================================================
class CoverageLimitsTest : public ::testing::Test {};

TEST_F(CoverageLimitsTest, RejectsTooManyLegs) {
    EXPECT_THROW(CoverageBuilder{}.build_coverage_pack(make_slate(21), 1, 2, 1, 2), ValidationError);
}

TEST_F(CoverageLimitsTest, RejectsEmptyAndNegativeLimits) {
    EXPECT_THROW(CoverageBuilder{}.build_coverage_pack({}, 1, 2, 1, 2), ValidationError);
    EXPECT_THROW(CoverageBuilder{}.build_coverage_pack(make_slate(2), -1, 2, 1, 2), ValidationError);
}

TEST_F(CoverageLimitsTest, TicketLimitsAboveCapRejected) {
    CoverageBuilder builder;
    auto legs = make_slate(18);
    EXPECT_THROW(builder.build_coverage_pack(legs, 1'000'000, 2, 1'000'000, 1'000'000), ValidationError);
    EXPECT_THROW(builder.build_coverage_pack(legs, 21, 2, 0, 20), ValidationError);
    EXPECT_THROW(builder.build_coverage_pack(legs, 0, 2, 21, 20), ValidationError);
    EXPECT_THROW(builder.build_coverage_pack(legs, 10, 2, 10, 21), ValidationError);
}

TEST_F(CoverageLimitsTest, RoundRobinSizeBelowTwoRejected) {
    CoverageBuilder builder;
    EXPECT_THROW(builder.build_coverage_pack(make_slate(4), 2, 1, 2, 4), ValidationError);
    EXPECT_THROW(builder.build_coverage_pack(make_slate(4), 2, 0, 2, 4), ValidationError);
}

TEST_F(CoverageLimitsTest, LimitsAtCapAreAccepted) {
    CoveragePack pack = CoverageBuilder{}.build_coverage_pack(make_slate(6), 20, 2, 20, 20);
    EXPECT_EQ(pack.scenario_tickets.size(), 20u);
    EXPECT_TRUE(pack.round_robin_tickets.empty());
}

TEST_F(CoverageLimitsTest, OffloadThreshold) {
    CoverageBuilder builder;
    EXPECT_FALSE(builder.should_offload(15));
    EXPECT_TRUE(builder.should_offload(16));
}

TEST_F(CoverageLimitsTest, AsyncMatchesSynchronous) {
    CoverageBuilder builder;
    auto legs = make_slate(16, "-105", 0.53);
    auto pending = builder.build_coverage_pack_async(legs, 3, 2, 3, 6);
    CoveragePack async_pack = pending.get();
    CoveragePack sync_pack = builder.build_coverage_pack(legs, 3, 2, 3, 6);

    EXPECT_EQ(async_pack.total_scenarios, uint64_t{1} << 16);
    ASSERT_EQ(async_pack.scenario_tickets.size(), sync_pack.scenario_tickets.size());
    for (size_t i = 0; i < sync_pack.scenario_tickets.size(); ++i) {
        EXPECT_DOUBLE_EQ(async_pack.scenario_tickets[i].probability, sync_pack.scenario_tickets[i].probability);
    }
    EXPECT_EQ(async_pack.round_robin_tickets.size(), 3u);
}

TEST_F(CoverageLimitsTest, AsyncPropagatesValidationError) {
    auto pending = CoverageBuilder{}.build_coverage_pack_async(make_slate(21), 1, 2, 1, 2);
    EXPECT_THROW(pending.get(), ValidationError);
}
