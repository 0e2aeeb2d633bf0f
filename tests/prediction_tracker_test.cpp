// prediction_tracker_test.cpp — save / resolve / stats / team bias over an in-memory store

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "tracking/prediction_tracker.hpp"
#include "tracking/sqlite_prediction_store.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using test_helpers::DAY0;
using test_helpers::make_prediction_input;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

constexpr int64_t DAY = 86400;

std::shared_ptr<SqlitePredictionStore> memory_store() {
    StoreConfig c;
    c.path = ":memory:";
    return std::make_shared<SqlitePredictionStore>(c);
}

}  // namespace

class PredictionTrackerTest : public ::testing::Test {
protected:
    std::shared_ptr<SqlitePredictionStore> store = memory_store();
    int64_t now = DAY0;
    PredictionTracker tracker{store, TrackerConfig{}, [this] { return now; }};

    // n moneyline picks on the home side, each on its own event, resolved with
    // the given winner.
    void add_resolved(int n, double prob, const std::string& winner, const std::string& prefix = "E") {
        for (int i = 0; i < n; ++i) {
            std::string event = prefix + std::to_string(i);
            tracker.save_prediction(make_prediction_input(event, "home", prob, MarketType::MONEYLINE, 0));
            ASSERT_EQ(tracker.resolve_prediction(event, winner), 1) << event;
        }
    }

    // Chiefs at home against the Bills in every game; the model backs the Chiefs.
    void add_team_games(int n, double prob, const std::string& winner) {
        for (int i = 0; i < n; ++i) {
            std::string event = "KC" + std::to_string(i);
            PredictionInput in = make_prediction_input(event, "home", prob, MarketType::MONEYLINE, 0);
            in.home_team = "Chiefs";
            in.away_team = "Bills";
            tracker.save_prediction(in);
            ASSERT_EQ(tracker.resolve_prediction(event, winner), 1) << event;
        }
    }
};

// ===========================================================================
// 1. save_prediction
// ===========================================================================
TEST_F(PredictionTrackerTest, SaveStampsClock) {
    Prediction p = tracker.save_prediction(make_prediction_input("G1", "home", 0.6, MarketType::MONEYLINE, 0));
    EXPECT_EQ(p.created_at, DAY0);
    EXPECT_GT(p.id, 0);
}

TEST_F(PredictionTrackerTest, SaveIsIdempotentWithinDay) {
    auto in = make_prediction_input("G1", "home", 0.6, MarketType::MONEYLINE, 0);
    Prediction a = tracker.save_prediction(in);
    now += 60;
    Prediction b = tracker.save_prediction(in);
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(store->prediction_count(), 1u);
}

TEST_F(PredictionTrackerTest, InvalidInputThrows) {
    auto in = make_prediction_input("G1", "home", 1.2);
    EXPECT_THROW(tracker.save_prediction(in), ValidationError);
    in = make_prediction_input("", "home", 0.6);
    EXPECT_THROW(tracker.save_prediction(in), ValidationError);
}

// ===========================================================================
// 2. resolve_prediction
// ===========================================================================
TEST_F(PredictionTrackerTest, ResolvesEveryMarketForTheGame) {
    tracker.save_prediction(make_prediction_input("G1", "home", 0.6, MarketType::MONEYLINE, 0));
    auto spread = make_prediction_input("G1", "away", 0.55, MarketType::SPREAD, 0);
    spread.point = 6.5;
    tracker.save_prediction(spread);
    auto total = make_prediction_input("G1", "over", 0.52, MarketType::TOTAL, 0);
    total.total_line = 41.5;
    tracker.save_prediction(total);

    EXPECT_EQ(tracker.resolve_prediction("G1", "home", 24, 20), 3);
    auto rows = store->resolved(PredictionQuery{});
    ASSERT_EQ(rows.size(), 3u);
    for (const auto& r : rows) {
        EXPECT_EQ(r.prediction.status, ResolutionStatus::WIN) << market_key(r.prediction.market_type);
        EXPECT_EQ(r.outcome.resolved_at, DAY0);
    }
}

TEST_F(PredictionTrackerTest, SecondResolutionIsNoop) {
    tracker.save_prediction(make_prediction_input("G1", "home", 0.6, MarketType::MONEYLINE, 0));
    EXPECT_EQ(tracker.resolve_prediction("G1", "home"), 1);
    EXPECT_EQ(tracker.resolve_prediction("G1", "away"), 0);
    auto rows = store->resolved(PredictionQuery{});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].prediction.status, ResolutionStatus::WIN);
}

TEST_F(PredictionTrackerTest, UngradableRowIsSkipped) {
    tracker.save_prediction(make_prediction_input("G1", "home", 0.6, MarketType::MONEYLINE, 0));
    tracker.save_prediction(make_prediction_input("G1", "Nobody", 0.6, MarketType::MONEYLINE, 0));
    EXPECT_EQ(tracker.resolve_prediction("G1", "home"), 1);
    EXPECT_EQ(store->unresolved_for_event("G1").size(), 1u);
}

TEST_F(PredictionTrackerTest, UnknownGameResolvesNothing) {
    EXPECT_EQ(tracker.resolve_prediction("NOPE", "home"), 0);
    EXPECT_THROW(tracker.resolve_prediction("", "home"), ValidationError);
}

// ===========================================================================
// 3. get_accuracy_stats
// ===========================================================================
TEST_F(PredictionTrackerTest, InsufficientBelowThirty) {
    add_resolved(29, 0.6, "home");
    AccuracyStats st = tracker.get_accuracy_stats();
    EXPECT_FALSE(st.sufficient);
    EXPECT_EQ(st.resolved_count, 29);
    EXPECT_EQ(st.required_count, 30);
    EXPECT_EQ(st.message, "Insufficient data: 29 resolved predictions, need 30");
    EXPECT_FALSE(st.accuracy.has_value());
}

TEST_F(PredictionTrackerTest, SufficientAtThirty) {
    add_resolved(20, 0.6, "home");
    add_resolved(10, 0.6, "away", "L");
    AccuracyStats st = tracker.get_accuracy_stats();
    ASSERT_TRUE(st.sufficient);
    EXPECT_EQ(st.wins, 20);
    EXPECT_EQ(st.losses, 10);
    ASSERT_TRUE(st.accuracy.has_value());
    EXPECT_NEAR(*st.accuracy, 20.0 / 30.0, 1e-12);
    // Brier: 20 * 0.16 + 10 * 0.36 over 30.
    EXPECT_NEAR(*st.brier_score, (20 * 0.16 + 10 * 0.36) / 30.0, 1e-12);
    EXPECT_NEAR(*st.calibration_error, std::abs((20 * -0.4 + 10 * 0.6) / 30.0), 1e-12);
    EXPECT_NEAR(*st.avg_edge, 0.1, 1e-12);
    EXPECT_EQ(st.positive_edge_count, 30);
    EXPECT_EQ(st.message, "ok");
}

TEST_F(PredictionTrackerTest, PushesExcludedFromAccuracy) {
    add_resolved(28, 0.6, "home");
    add_resolved(2, 0.6, "tie", "T");
    AccuracyStats st = tracker.get_accuracy_stats();
    ASSERT_TRUE(st.sufficient);
    EXPECT_EQ(st.pushes, 2);
    EXPECT_DOUBLE_EQ(*st.accuracy, 1.0);
}

TEST_F(PredictionTrackerTest, LookbackWindow) {
    add_resolved(30, 0.6, "home");
    now += 31 * DAY;
    EXPECT_EQ(tracker.get_accuracy_stats().resolved_count, 0);
    EXPECT_EQ(tracker.get_accuracy_stats(std::nullopt, std::nullopt, 60).resolved_count, 30);
    EXPECT_THROW(tracker.get_accuracy_stats(std::nullopt, std::nullopt, 0), ValidationError);
}

TEST_F(PredictionTrackerTest, SportAndMarketFilters) {
    add_resolved(3, 0.6, "home");
    EXPECT_EQ(tracker.get_accuracy_stats(std::string("NBA")).resolved_count, 0);
    EXPECT_EQ(tracker.get_accuracy_stats(std::string("NFL"), MarketType::MONEYLINE).resolved_count, 3);
    EXPECT_EQ(tracker.get_accuracy_stats(std::string("NFL"), MarketType::TOTAL).resolved_count, 0);
}

// ===========================================================================
// 4. Team bias
// ===========================================================================
TEST_F(PredictionTrackerTest, TooFewGamesHasNoBias) {
    add_team_games(9, 0.6, "away");
    EXPECT_FALSE(tracker.calculate_team_bias("Chiefs", "NFL").has_value());
}

TEST_F(PredictionTrackerTest, OverratedTeamGetsNegativeAdjustment) {
    add_team_games(10, 0.6, "away");
    auto chiefs = tracker.calculate_team_bias("Chiefs", "NFL");
    ASSERT_TRUE(chiefs.has_value());
    EXPECT_EQ(chiefs->sample_size, 10);
    EXPECT_NEAR(chiefs->avg_signed_error, 0.6, 1e-12);
    EXPECT_DOUBLE_EQ(chiefs->bias_adjustment, -0.05);
    EXPECT_DOUBLE_EQ(chiefs->accuracy, 0.0);
    EXPECT_EQ(chiefs->updated_at, DAY0);

    // The opponent sees the same errors with the opposite sign.
    auto bills = tracker.calculate_team_bias("bills", "NFL");
    ASSERT_TRUE(bills.has_value());
    EXPECT_NEAR(bills->avg_signed_error, -0.6, 1e-12);
    EXPECT_DOUBLE_EQ(bills->bias_adjustment, 0.05);
}

TEST_F(PredictionTrackerTest, SmallBiasIsNotClamped) {
    // Six wins and four losses at 0.6: mean signed error 0.
    add_team_games(6, 0.6, "home");
    for (int i = 0; i < 4; ++i) {
        std::string event = "KCL" + std::to_string(i);
        PredictionInput in = make_prediction_input(event, "home", 0.6, MarketType::MONEYLINE, 0);
        in.home_team = "Chiefs";
        in.away_team = "Bills";
        tracker.save_prediction(in);
        tracker.resolve_prediction(event, "away");
    }
    auto chiefs = tracker.calculate_team_bias("Chiefs", "NFL");
    ASSERT_TRUE(chiefs.has_value());
    EXPECT_NEAR(chiefs->bias_adjustment, 0.0, 1e-12);
    EXPECT_NEAR(chiefs->accuracy, 0.6, 1e-12);
}

TEST_F(PredictionTrackerTest, RecalibrationIsRepeatable) {
    add_team_games(12, 0.6, "away");
    EXPECT_EQ(tracker.update_team_calibrations("NFL"), 2);
    auto first = store->team_calibrations("NFL");
    EXPECT_EQ(tracker.update_team_calibrations("NFL"), 2);
    auto second = store->team_calibrations("NFL");

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].team, second[i].team);
        EXPECT_DOUBLE_EQ(first[i].bias_adjustment, second[i].bias_adjustment);
        EXPECT_EQ(first[i].sample_size, second[i].sample_size);
    }
}

TEST_F(PredictionTrackerTest, RecalibrationRefreshesCache) {
    EXPECT_TRUE(tracker.get_team_bias_adjustments("NFL").empty());
    add_team_games(10, 0.6, "away");
    // Still the cached (empty) snapshot until a recalibration.
    EXPECT_TRUE(tracker.get_team_bias_adjustments("NFL").empty());

    tracker.update_team_calibrations("NFL");
    auto adj = tracker.get_team_bias_adjustments("NFL");
    ASSERT_EQ(adj.size(), 2u);
    EXPECT_DOUBLE_EQ(adj.at("Chiefs"), -0.05);
    EXPECT_DOUBLE_EQ(adj.at("Bills"), 0.05);
}

TEST_F(PredictionTrackerTest, CacheExpiresAfterRecalibrationPeriod) {
    tracker.get_team_bias_adjustments("NFL");
    uint64_t loads = tracker.calibration_cache().loads();
    now += 6 * DAY;
    tracker.get_team_bias_adjustments("NFL");
    EXPECT_EQ(tracker.calibration_cache().loads(), loads);
    now += DAY;
    tracker.get_team_bias_adjustments("NFL");
    EXPECT_EQ(tracker.calibration_cache().loads(), loads + 1);
}

TEST_F(PredictionTrackerTest, ConcurrentRecalibrationsAgree) {
    add_team_games(10, 0.6, "away");
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] { tracker.update_team_calibrations("NFL"); });
    }
    for (auto& w : workers) w.join();
    auto rows = store->team_calibrations("NFL");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].team, "Bills");
    EXPECT_DOUBLE_EQ(rows[0].bias_adjustment, 0.05);
}

TEST_F(PredictionTrackerTest, NullStoreThrows) {
    EXPECT_THROW(PredictionTracker(nullptr), ValidationError);
}
