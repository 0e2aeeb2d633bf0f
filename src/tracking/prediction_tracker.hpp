#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "time_utils.hpp"
#include "tracking/accuracy_stats.hpp"
#include "tracking/outcome_grader.hpp"
#include "tracking/prediction.hpp"
#include "tracking/prediction_store.hpp"
#include "tracking/team_calibration_cache.hpp"
#include "tracking/tracker_config.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// PredictionTracker
//
// Records predictions once per (sport, event, market, side, model, day),
// grades them when the game settles, and turns the graded history into
// accuracy stats and per-team bias corrections.
// ---------------------------------------------------------------------------
class PredictionTracker {
public:
    using Clock = std::function<int64_t()>;

    explicit PredictionTracker(std::shared_ptr<PredictionStore> store,
                               TrackerConfig config = TrackerConfig{},
                               Clock clock = time_utils::now_seconds)
        : store_(std::move(store)), config_(config), clock_(std::move(clock)),
          cache_([this](const std::string& sport) { return load_adjustments(sport); },
                 static_cast<int64_t>(config.recalibration_days) * time_utils::SEC_PER_DAY,
                 clock_) {
        if (!store_) throw ValidationError("PredictionTracker needs a store");
    }

    const TrackerConfig& config() const { return config_; }
    TeamCalibrationCache& calibration_cache() { return cache_; }

    // Returns the stored row; an existing row when the same prediction was
    // already recorded today.
    Prediction save_prediction(const PredictionInput& input) {
        PredictionInput stamped = input;
        if (stamped.created_at == 0) stamped.created_at = clock_();
        return store_->insert_or_fetch(make_prediction(stamped));
    }

    // Grades every unresolved prediction for the game. Rows that fail to
    // grade or persist are skipped. Returns the number resolved.
    int resolve_prediction(const GameResult& result) {
        if (result.event_id.empty()) throw ValidationError("resolve_prediction needs a game id");
        int resolved = 0;
        for (const auto& p : store_->unresolved_for_event(result.event_id)) {
            try {
                ResolutionStatus status = outcome_grader::grade(p, result, config_.default_total_line);
                PredictionOutcome outcome = outcome_grader::make_outcome(p, status, result, clock_());
                if (store_->mark_resolved(p, status, outcome)) ++resolved;
            } catch (const ValidationError& e) {
                std::cerr << "[PredictionTracker] skipped prediction " << p.id << ": " << e.what() << "\n";
            } catch (const StorageError& e) {
                std::cerr << "[PredictionTracker] skipped prediction " << p.id << ": " << e.what() << "\n";
            }
        }
        return resolved;
    }

    int resolve_prediction(const std::string& game_id, const std::string& winner,
                           std::optional<int> home_score = std::nullopt,
                           std::optional<int> away_score = std::nullopt) {
        return resolve_prediction(GameResult{game_id, winner, home_score, away_score});
    }

    AccuracyStats get_accuracy_stats(const std::optional<std::string>& sport = std::nullopt,
                                     const std::optional<MarketType>& market_type = std::nullopt,
                                     std::optional<int> days = std::nullopt) {
        int window = days.value_or(config_.default_lookback_days);
        if (window <= 0) throw ValidationError("Lookback window must be positive");
        PredictionQuery q;
        q.sport = sport;
        q.market_type = market_type;
        q.since = clock_() - static_cast<int64_t>(window) * time_utils::SEC_PER_DAY;
        return accuracy_stats::compute(store_->resolved(q), config_);
    }

    // Mean signed error from the team's perspective over its most recent
    // games; the adjustment inverts it. Empty below min_team_games.
    std::optional<TeamCalibration> calculate_team_bias(const std::string& team, const std::string& sport) {
        auto rows = store_->resolved_for_team(team, sport, config_.team_lookback_games);
        std::string key = text::to_lower(team);

        int count = 0;
        int correct = 0;
        double team_err_sum = 0.0;
        double sq_sum = 0.0;
        for (const auto& r : rows) {
            if (r.outcome.is_push) continue;
            const Prediction& p = r.prediction;
            Side pick = outcome_grader::resolve_side(p.side, p.home_team, p.away_team);
            if (pick != Side::HOME && pick != Side::AWAY) continue;
            Side team_side = text::to_lower(p.home_team) == key ? Side::HOME : Side::AWAY;
            double sign = pick == team_side ? 1.0 : -1.0;
            team_err_sum += sign * r.outcome.signed_error;
            sq_sum += r.outcome.signed_error * r.outcome.signed_error;
            if (r.outcome.was_correct) ++correct;
            ++count;
        }
        if (count < config_.min_team_games) return std::nullopt;

        TeamCalibration c;
        c.team = team;
        c.sport = normalize_sport(sport);
        c.sample_size = count;
        c.avg_signed_error = team_err_sum / count;
        c.bias_adjustment = std::clamp(-c.avg_signed_error, -config_.max_bias_adjustment,
                                       config_.max_bias_adjustment);
        c.accuracy = static_cast<double>(correct) / count;
        c.brier_score = sq_sum / count;
        c.updated_at = clock_();
        return c;
    }

    // Recomputes and upserts every team with resolved history for the sport.
    // One writer at a time. Returns the number of rows upserted.
    int update_team_calibrations(const std::string& sport) {
        std::lock_guard<std::mutex> lock(recalibration_mutex_);
        int updated = 0;
        for (const auto& team : store_->teams_with_resolved(sport)) {
            auto c = calculate_team_bias(team, sport);
            if (!c) continue;
            store_->upsert_team_calibration(*c);
            ++updated;
        }
        cache_.invalidate();
        std::cerr << "[PredictionTracker] recalibrated " << updated << " teams for " << sport << "\n";
        return updated;
    }

    std::map<std::string, double> get_team_bias_adjustments(const std::string& sport) {
        return cache_.get(normalize_sport(sport));
    }

private:
    std::shared_ptr<PredictionStore> store_;
    TrackerConfig config_;
    Clock clock_;
    TeamCalibrationCache cache_;
    std::mutex recalibration_mutex_;

    std::map<std::string, double> load_adjustments(const std::string& sport) {
        std::map<std::string, double> out;
        for (const auto& c : store_->team_calibrations(sport)) out[c.team] = c.bias_adjustment;
        return out;
    }
};
