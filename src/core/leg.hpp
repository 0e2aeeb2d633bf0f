#pragma once

#include "core/odds.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Market / profile / side enums
// ---------------------------------------------------------------------------
enum class MarketType { MONEYLINE, SPREAD, TOTAL };

enum class RiskProfile { CONSERVATIVE, BALANCED, DEGEN };

enum class Side { HOME, AWAY, OVER, UNDER, UNKNOWN };

namespace text {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}  // namespace text

// Wire keys follow the odds-feed naming (h2h / spreads / totals).
inline const char* market_key(MarketType m) {
    switch (m) {
        case MarketType::MONEYLINE: return "h2h";
        case MarketType::SPREAD:    return "spreads";
        case MarketType::TOTAL:     return "totals";
    }
    return "h2h";
}

inline std::optional<MarketType> parse_market_type(const std::string& raw) {
    std::string s = text::to_lower(text::trim(raw));
    if (s == "h2h" || s == "moneyline" || s == "ml") return MarketType::MONEYLINE;
    if (s == "spreads" || s == "spread") return MarketType::SPREAD;
    if (s == "totals" || s == "total") return MarketType::TOTAL;
    return std::nullopt;
}

inline const char* risk_profile_name(RiskProfile p) {
    switch (p) {
        case RiskProfile::CONSERVATIVE: return "conservative";
        case RiskProfile::BALANCED:     return "balanced";
        case RiskProfile::DEGEN:        return "degen";
    }
    return "balanced";
}

// Unknown or empty profiles normalize to balanced.
inline RiskProfile parse_risk_profile(const std::string& raw) {
    std::string s = text::to_lower(text::trim(raw));
    if (s == "conservative" || s == "safe") return RiskProfile::CONSERVATIVE;
    if (s == "degen") return RiskProfile::DEGEN;
    return RiskProfile::BALANCED;
}

// ---------------------------------------------------------------------------
// Quote — one side's price and probabilities. A Leg keeps the quote for the
// opposite outcome so flipping needs no further lookups.
// ---------------------------------------------------------------------------
struct Quote {
    int american_odds = 100;
    double decimal_odds = 2.0;
    double implied_probability = 0.5;
    double model_probability = 0.5;

    bool operator==(const Quote&) const = default;
};

// ---------------------------------------------------------------------------
// Leg — one validated wager selection. Construct through to_leg() (see
// core/candidate_record.hpp); fields are trusted downstream.
// ---------------------------------------------------------------------------
struct Leg {
    std::string game_id;
    std::string sport;
    MarketType market_type = MarketType::MONEYLINE;
    std::string outcome;                 // team name, home/away, over/under
    std::optional<double> point;         // spread or total line
    int american_odds = 100;
    double decimal_odds = 2.0;
    double implied_probability = 0.5;
    double model_probability = 0.5;      // clamped to [0.05, 0.95]
    double confidence_score = 50.0;      // [0, 100]
    double edge = 0.0;                   // model - implied
    double market_move = 0.0;            // line-movement tiebreak
    std::string home_team;
    std::string away_team;
    Quote opposite;

    static constexpr double MIN_MODEL_PROB = 0.05;
    static constexpr double MAX_MODEL_PROB = 0.95;

    bool operator==(const Leg&) const = default;

    bool is_plus_money() const { return american_odds > 0; }

    double expected_value() const { return model_probability * decimal_odds - 1.0; }

    std::string odds_string() const { return odds::format_american(american_odds); }

    std::string game_label() const {
        if (!home_team.empty() && !away_team.empty()) return away_team + " @ " + home_team;
        return game_id;
    }

    std::string pick_label() const {
        std::string label = outcome;
        if (point.has_value()) {
            char buf[32];
            if (market_type == MarketType::SPREAD && *point > 0) {
                std::snprintf(buf, sizeof(buf), " +%.1f", *point);
            } else {
                std::snprintf(buf, sizeof(buf), " %.1f", *point);
            }
            label += buf;
        }
        return label + " (" + odds_string() + ")";
    }

    // Resolves team-name picks against home/away.
    Side side() const {
        std::string o = text::to_lower(text::trim(outcome));
        if (o == "home") return Side::HOME;
        if (o == "away") return Side::AWAY;
        if (o == "over") return Side::OVER;
        if (o == "under") return Side::UNDER;
        if (!home_team.empty() && o == text::to_lower(home_team)) return Side::HOME;
        if (!away_team.empty() && o == text::to_lower(away_team)) return Side::AWAY;
        return Side::UNKNOWN;
    }

    // Side name when the pick resolves to one, else the lowercased pick.
    std::string outcome_key() const {
        switch (side()) {
            case Side::HOME:  return "home";
            case Side::AWAY:  return "away";
            case Side::OVER:  return "over";
            case Side::UNDER: return "under";
            case Side::UNKNOWN: break;
        }
        return text::to_lower(outcome);
    }

    Quote quote() const {
        return Quote{american_odds, decimal_odds, implied_probability, model_probability};
    }

    void set_quote(const Quote& q) {
        american_odds = q.american_odds;
        decimal_odds = q.decimal_odds;
        implied_probability = q.implied_probability;
        model_probability = q.model_probability;
        edge = model_probability - implied_probability;
    }
};

inline double clamp_model_probability(double p) {
    return std::clamp(p, Leg::MIN_MODEL_PROB, Leg::MAX_MODEL_PROB);
}

inline bool same_game(const Leg& a, const Leg& b) {
    return a.game_id == b.game_id;
}

// Selection-distinctness key: (game, market, outcome).
inline bool same_selection(const Leg& a, const Leg& b) {
    return a.game_id == b.game_id && a.market_type == b.market_type &&
           a.outcome_key() == b.outcome_key();
}

inline double combined_implied_probability(const std::vector<Leg>& legs) {
    double p = 1.0;
    for (const auto& leg : legs) p *= leg.implied_probability;
    return legs.empty() ? 0.0 : p;
}

inline double combined_decimal_odds(const std::vector<Leg>& legs) {
    double d = 1.0;
    for (const auto& leg : legs) d *= leg.decimal_odds;
    return d;
}
