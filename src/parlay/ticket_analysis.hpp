#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Per-leg and per-ticket recommendation grades
// ---------------------------------------------------------------------------
enum class LegRecommendation { STRONG, MODERATE, WEAK, AVOID };

enum class TicketRecommendation { STRONG_PLAY, SOLID_PLAY, RISKY_PLAY, AVOID };

inline const char* leg_recommendation_name(LegRecommendation r) {
    switch (r) {
        case LegRecommendation::STRONG:   return "strong";
        case LegRecommendation::MODERATE: return "moderate";
        case LegRecommendation::WEAK:     return "weak";
        case LegRecommendation::AVOID:    return "avoid";
    }
    return "avoid";
}

inline const char* ticket_recommendation_name(TicketRecommendation r) {
    switch (r) {
        case TicketRecommendation::STRONG_PLAY: return "strong_play";
        case TicketRecommendation::SOLID_PLAY:  return "solid_play";
        case TicketRecommendation::RISKY_PLAY:  return "risky_play";
        case TicketRecommendation::AVOID:       return "avoid";
    }
    return "avoid";
}

// ---------------------------------------------------------------------------
// TicketAnalysis — parlay-shaped summary derived from leg data only
// ---------------------------------------------------------------------------
struct TicketAnalysis {
    int num_legs = 0;
    double combined_implied_probability = 0.0;
    double combined_model_probability = 0.0;
    double parlay_decimal_odds = 1.0;
    int64_t parlay_american_odds = 100;
    double overall_confidence = 0.0;
    std::string confidence_color;
    std::vector<LegRecommendation> leg_recommendations;
    std::vector<std::string> weak_legs;
    std::vector<std::string> strong_legs;
    TicketRecommendation recommendation = TicketRecommendation::AVOID;
    std::string summary;
    std::string risk_notes;
};

namespace ticket_analysis {

constexpr double PROB_FLOOR = 1e-6;
constexpr double PROB_CEIL = 1.0 - 1e-6;
constexpr double MIN_DECIMAL = 1.01;
constexpr double CONFIDENCE_FLOOR = 10.0;

inline LegRecommendation recommend_leg(const Leg& leg) {
    double c = leg.confidence_score;
    if (c >= 70.0 && leg.edge >= 0.02) return LegRecommendation::STRONG;
    if (c >= 55.0 && leg.edge >= 0.0) return LegRecommendation::MODERATE;
    if (c >= 40.0) return LegRecommendation::WEAK;
    return LegRecommendation::AVOID;
}

inline const char* confidence_color(double score) {
    if (score >= 70.0) return "green";
    if (score >= 50.0) return "yellow";
    return "red";
}

inline TicketRecommendation recommend_ticket(double overall_confidence, int weak_count, int num_legs) {
    double weak_ratio = num_legs > 0 ? static_cast<double>(weak_count) / num_legs : 0.0;
    if (overall_confidence >= 65.0 && weak_ratio < 0.2) return TicketRecommendation::STRONG_PLAY;
    if (overall_confidence >= 50.0 && weak_ratio < 0.4) return TicketRecommendation::SOLID_PLAY;
    if (overall_confidence >= 35.0) return TicketRecommendation::RISKY_PLAY;
    return TicketRecommendation::AVOID;
}

// Mean confidence less 2 points per leg beyond three, floored at 10.
inline double overall_confidence(const std::vector<Leg>& legs) {
    if (legs.empty()) return CONFIDENCE_FLOOR;
    double sum = 0.0;
    for (const auto& leg : legs) sum += leg.confidence_score;
    double avg = sum / static_cast<double>(legs.size());
    double penalty = std::max(0.0, (static_cast<double>(legs.size()) - 3.0) * 2.0);
    return std::max(CONFIDENCE_FLOOR, avg - penalty);
}

namespace detail {

inline std::string join_first(const std::vector<std::string>& items, size_t n) {
    std::string out;
    for (size_t i = 0; i < items.size() && i < n; ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

inline void write_text(TicketAnalysis& a) {
    const char* level = a.overall_confidence >= 60.0 ? "high"
                      : a.overall_confidence >= 40.0 ? "moderate" : "risky";
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "This %d-leg parlay has a %.2f%% combined probability by our model. "
                  "Overall confidence is %s at %.1f/100.",
                  a.num_legs, a.combined_model_probability * 100.0, level, a.overall_confidence);
    a.summary = buf;
    if (!a.strong_legs.empty()) a.summary += " Strong picks: " + join_first(a.strong_legs, 2) + ".";
    if (!a.weak_legs.empty()) a.summary += " Watch outs: " + join_first(a.weak_legs, 2) + ".";

    a.risk_notes = "With " + std::to_string(a.num_legs) +
                   " legs, the ticket compounds risk (every leg must hit). ";
    if (!a.weak_legs.empty()) {
        a.risk_notes += "There are concerns flagged on " + std::to_string(a.weak_legs.size()) + " leg(s). ";
    }
    a.risk_notes += "Consider trimming lower-confidence legs for a higher hit rate.";
}

}  // namespace detail

inline TicketAnalysis analyze(const std::vector<Leg>& legs) {
    if (legs.empty()) throw ValidationError("Cannot build analysis for empty ticket");

    TicketAnalysis a;
    a.num_legs = static_cast<int>(legs.size());
    a.combined_implied_probability = 1.0;
    a.combined_model_probability = 1.0;
    a.parlay_decimal_odds = 1.0;

    for (const auto& leg : legs) {
        a.combined_implied_probability *= std::clamp(leg.implied_probability, PROB_FLOOR, PROB_CEIL);
        a.combined_model_probability *= std::clamp(leg.model_probability, PROB_FLOOR, PROB_CEIL);
        a.parlay_decimal_odds *= std::max(MIN_DECIMAL, leg.decimal_odds);

        LegRecommendation rec = recommend_leg(leg);
        a.leg_recommendations.push_back(rec);
        std::string label = leg.game_label() + ": " + leg.pick_label();
        if (rec == LegRecommendation::AVOID || rec == LegRecommendation::WEAK) {
            a.weak_legs.push_back(label);
        } else if (rec == LegRecommendation::STRONG) {
            a.strong_legs.push_back(label);
        }
    }

    double d = a.parlay_decimal_odds;
    a.parlay_american_odds = d >= 2.0 ? std::llround((d - 1.0) * 100.0)
                                      : std::llround(-100.0 / (d - 1.0));
    a.overall_confidence = overall_confidence(legs);
    a.confidence_color = confidence_color(a.overall_confidence);
    a.recommendation = recommend_ticket(a.overall_confidence,
                                        static_cast<int>(a.weak_legs.size()), a.num_legs);
    detail::write_text(a);
    return a;
}

}  // namespace ticket_analysis
