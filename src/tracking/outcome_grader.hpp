#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "tracking/prediction.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// GameResult — final result of one event as reported by the results feed
// ---------------------------------------------------------------------------
struct GameResult {
    std::string event_id;
    std::string winner;                 // home/away, a team name, or tie/draw
    std::optional<int> home_score;
    std::optional<int> away_score;

    bool has_scores() const { return home_score.has_value() && away_score.has_value(); }
};

// ---------------------------------------------------------------------------
// Outcome grading by market
//   moneyline  side == winner; level scores or tie -> push
//   spread     side score + point vs opponent score; equal -> push.
//              Without a point or scores, falls back to the winner.
//   total      home + away vs total line (default 45); equal -> push.
//              Missing scores grade as a loss.
// ---------------------------------------------------------------------------
namespace outcome_grader {

inline Side resolve_side(const std::string& pick, const std::string& home_team,
                         const std::string& away_team) {
    std::string s = text::to_lower(text::trim(pick));
    if (s == "home") return Side::HOME;
    if (s == "away") return Side::AWAY;
    if (s == "over") return Side::OVER;
    if (s == "under") return Side::UNDER;
    if (!home_team.empty() && s == text::to_lower(home_team)) return Side::HOME;
    if (!away_team.empty() && s == text::to_lower(away_team)) return Side::AWAY;
    return Side::UNKNOWN;
}

// HOME / AWAY, or UNKNOWN for a tie.
inline Side winning_side(const GameResult& r, const std::string& home_team,
                         const std::string& away_team) {
    if (r.has_scores()) {
        if (*r.home_score > *r.away_score) return Side::HOME;
        if (*r.away_score > *r.home_score) return Side::AWAY;
        return Side::UNKNOWN;
    }
    std::string w = text::to_lower(text::trim(r.winner));
    if (w == "tie" || w == "draw") return Side::UNKNOWN;
    Side s = resolve_side(r.winner, home_team, away_team);
    if (s != Side::HOME && s != Side::AWAY) {
        throw ValidationError("Unrecognized winner '" + r.winner + "' for event " + r.event_id);
    }
    return s;
}

inline ResolutionStatus grade_moneyline(Side side, const GameResult& r, const Prediction& p) {
    Side winner = winning_side(r, p.home_team, p.away_team);
    if (winner == Side::UNKNOWN) return ResolutionStatus::PUSH;
    return side == winner ? ResolutionStatus::WIN : ResolutionStatus::LOSS;
}

inline ResolutionStatus grade_spread(Side side, const GameResult& r, const Prediction& p) {
    if (!p.point || !r.has_scores()) return grade_moneyline(side, r, p);
    double own = side == Side::HOME ? *r.home_score : *r.away_score;
    double opp = side == Side::HOME ? *r.away_score : *r.home_score;
    double margin = own + *p.point - opp;
    if (margin > 0.0) return ResolutionStatus::WIN;
    if (margin < 0.0) return ResolutionStatus::LOSS;
    return ResolutionStatus::PUSH;
}

inline ResolutionStatus grade_total(Side side, const GameResult& r, const Prediction& p,
                                    double default_line) {
    if (!r.has_scores()) return ResolutionStatus::LOSS;
    double line = p.total_line.value_or(default_line);
    double total = static_cast<double>(*r.home_score + *r.away_score);
    if (total == line) return ResolutionStatus::PUSH;
    bool over_hit = total > line;
    return (side == Side::OVER) == over_hit ? ResolutionStatus::WIN : ResolutionStatus::LOSS;
}

inline ResolutionStatus grade(const Prediction& p, const GameResult& r, double default_total_line) {
    Side side = resolve_side(p.side, p.home_team, p.away_team);
    switch (p.market_type) {
        case MarketType::MONEYLINE:
        case MarketType::SPREAD:
            if (side != Side::HOME && side != Side::AWAY) {
                throw ValidationError("Prediction " + std::to_string(p.id) + " has side '" + p.side +
                                      "' that is neither home nor away");
            }
            return p.market_type == MarketType::MONEYLINE ? grade_moneyline(side, r, p)
                                                          : grade_spread(side, r, p);
        case MarketType::TOTAL:
            if (side != Side::OVER && side != Side::UNDER) {
                throw ValidationError("Prediction " + std::to_string(p.id) + " has side '" + p.side +
                                      "' that is neither over nor under");
            }
            return grade_total(side, r, p, default_total_line);
    }
    throw ValidationError("Unsupported market type for prediction " + std::to_string(p.id));
}

inline PredictionOutcome make_outcome(const Prediction& p, ResolutionStatus status,
                                      const GameResult& r, int64_t resolved_at) {
    PredictionOutcome o;
    o.prediction_id = p.id;
    o.was_correct = status == ResolutionStatus::WIN;
    o.is_push = status == ResolutionStatus::PUSH;
    o.actual_value = status == ResolutionStatus::WIN ? 1.0
                   : status == ResolutionStatus::PUSH ? 0.5 : 0.0;
    o.signed_error = p.predicted_prob - o.actual_value;
    o.error_magnitude = std::abs(o.signed_error);
    o.home_score = r.home_score;
    o.away_score = r.away_score;
    o.resolved_at = resolved_at;
    return o;
}

}  // namespace outcome_grader
