#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "core/odds.hpp"

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CandidateRecord — loosely-typed leg as delivered by the candidate feed.
// Every optional field is resolved exactly once in to_leg().
// ---------------------------------------------------------------------------
struct CandidateRecord {
    std::string game_id;
    std::string sport;
    std::string market_type;
    std::string outcome;
    std::optional<double> point;
    std::optional<std::string> odds;            // American, e.g. "+180"
    std::optional<double> decimal_odds;
    std::optional<double> implied_prob;
    std::optional<double> model_prob;
    std::optional<double> confidence_score;
    std::optional<double> market_move;
    std::string home_team;
    std::string away_team;
    std::optional<std::string> opposite_odds;   // price of the other outcome
    std::optional<double> opposite_model_prob;
    std::optional<int> week;                    // schedule week, where the sport has one
};

namespace detail {

inline Quote make_quote(int american, std::optional<double> implied, double model) {
    Quote q;
    q.american_odds = american;
    q.decimal_odds = odds::american_to_decimal(american);
    q.implied_probability = implied.value_or(odds::implied_from_american(american));
    q.model_probability = clamp_model_probability(model);
    return q;
}

inline void require_probability(double p, const std::string& field, const std::string& game_id) {
    if (!std::isfinite(p) || p <= 0.0 || p >= 1.0) {
        throw ValidationError(field + " must be in (0, 1) for game " + game_id +
                              ", got " + std::to_string(p));
    }
}

}  // namespace detail

// Validate a feed record into a Leg. Throws ValidationError on any defect.
inline Leg to_leg(const CandidateRecord& r) {
    if (text::trim(r.game_id).empty()) throw ValidationError("Candidate leg has no game_id");

    auto market = parse_market_type(r.market_type);
    if (!market) {
        throw ValidationError("Unsupported market_type '" + r.market_type +
                              "' (expected h2h/spreads/totals)");
    }

    Leg leg;
    leg.game_id = text::trim(r.game_id);
    leg.sport = r.sport;
    leg.market_type = *market;
    leg.outcome = text::trim(r.outcome);
    leg.point = r.point;
    leg.home_team = r.home_team;
    leg.away_team = r.away_team;

    if (leg.outcome.empty()) throw ValidationError("Candidate leg has no outcome for game " + leg.game_id);
    if (leg.point && !std::isfinite(*leg.point)) {
        throw ValidationError("Non-finite point for game " + leg.game_id);
    }

    // Canonical spelling so flips round-trip exactly.
    std::string lowered = text::to_lower(leg.outcome);
    if (lowered == "home" || lowered == "away" || lowered == "over" || lowered == "under") {
        leg.outcome = lowered;
    } else if (!leg.home_team.empty() && lowered == text::to_lower(leg.home_team)) {
        leg.outcome = leg.home_team;
    } else if (!leg.away_team.empty() && lowered == text::to_lower(leg.away_team)) {
        leg.outcome = leg.away_team;
    }

    Side side = leg.side();
    bool side_ok = (leg.market_type == MarketType::TOTAL)
        ? (side == Side::OVER || side == Side::UNDER)
        : (side == Side::HOME || side == Side::AWAY);
    if (!side_ok) {
        throw ValidationError("Invalid " + std::string(market_key(leg.market_type)) +
                              " pick '" + leg.outcome + "' for game " + leg.game_label());
    }

    int american = 0;
    if (r.odds) {
        american = odds::parse_american(*r.odds);
    } else if (r.decimal_odds) {
        american = odds::decimal_to_american(*r.decimal_odds);
    } else {
        throw ValidationError("Candidate leg has no odds for game " + leg.game_id);
    }

    if (!r.model_prob) throw ValidationError("Candidate leg has no model probability for game " + leg.game_id);
    if (!r.confidence_score) throw ValidationError("Candidate leg has no confidence for game " + leg.game_id);
    detail::require_probability(*r.model_prob, "model_prob", leg.game_id);
    if (r.implied_prob) detail::require_probability(*r.implied_prob, "implied_prob", leg.game_id);
    if (!std::isfinite(*r.confidence_score)) {
        throw ValidationError("Non-finite confidence for game " + leg.game_id);
    }

    Quote own = detail::make_quote(american, r.implied_prob, *r.model_prob);
    if (r.decimal_odds && !r.odds) own.decimal_odds = *r.decimal_odds;
    leg.set_quote(own);
    leg.confidence_score = std::clamp(*r.confidence_score, 0.0, 100.0);
    leg.market_move = r.market_move.value_or(0.0);

    double opposite_model = r.opposite_model_prob.value_or(1.0 - *r.model_prob);
    if (r.opposite_odds) {
        leg.opposite = detail::make_quote(odds::parse_american(*r.opposite_odds),
                                          std::nullopt, opposite_model);
    } else {
        // No quote for the other side: use the no-vig complement.
        double implied = 1.0 - leg.implied_probability;
        Quote q;
        q.decimal_odds = 1.0 / implied;
        q.american_odds = odds::decimal_to_american(q.decimal_odds);
        q.implied_probability = implied;
        q.model_probability = clamp_model_probability(opposite_model);
        leg.opposite = q;
    }
    return leg;
}

// Batch conversion for feed pools: bad records are skipped and logged.
inline std::vector<Leg> legs_from_records(const std::vector<CandidateRecord>& records,
                                          int* rejected = nullptr) {
    std::vector<Leg> legs;
    legs.reserve(records.size());
    int skipped = 0;
    for (const auto& r : records) {
        try {
            legs.push_back(to_leg(r));
        } catch (const ValidationError& e) {
            ++skipped;
            std::cerr << "[CandidatePool] skipped record: " << e.what() << "\n";
        }
    }
    if (rejected) *rejected = skipped;
    return legs;
}
