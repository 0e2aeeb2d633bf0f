#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "coverage/counter_builder.hpp"
#include "coverage/coverage_builder.hpp"
#include "io/json_text.hpp"
#include "parlay/parlay.hpp"
#include "parlay/ticket_analysis.hpp"
#include "tracking/accuracy_stats.hpp"
#include "tracking/prediction.hpp"
#include "time_utils.hpp"
#include "upsets/upset_finder.hpp"

#include <exception>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace parlay_io {

using json_text::number;
using json_text::optional_number;
using json_text::quote;

inline std::string to_json(const Leg& leg) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"game_id\":" << quote(leg.game_id);
    ss << ",\"game\":" << quote(leg.game_label());
    ss << ",\"sport\":" << quote(leg.sport);
    ss << ",\"market_type\":" << quote(market_key(leg.market_type));
    ss << ",\"outcome\":" << quote(leg.outcome);
    ss << ",\"pick\":" << quote(leg.pick_label());
    ss << ",\"point\":" << optional_number(leg.point);
    ss << ",\"odds\":" << quote(leg.odds_string());
    ss << ",\"decimal_odds\":" << number(leg.decimal_odds);
    ss << ",\"implied_probability\":" << number(leg.implied_probability);
    ss << ",\"model_probability\":" << number(leg.model_probability);
    ss << ",\"edge\":" << number(leg.edge);
    ss << ",\"confidence\":" << number(leg.confidence_score);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const std::vector<Leg>& legs) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < legs.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(legs[i]);
    }
    ss << "]";
    return ss.str();
}

inline std::string string_array(const std::vector<std::string>& items) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quote(items[i]);
    }
    ss << "]";
    return ss.str();
}

inline std::string to_json(const TicketAnalysis& a) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"num_legs\":" << a.num_legs;
    ss << ",\"combined_implied_probability\":" << number(a.combined_implied_probability);
    ss << ",\"combined_model_probability\":" << number(a.combined_model_probability);
    ss << ",\"parlay_decimal_odds\":" << number(a.parlay_decimal_odds);
    ss << ",\"parlay_american_odds\":" << a.parlay_american_odds;
    ss << ",\"overall_confidence\":" << number(a.overall_confidence);
    ss << ",\"confidence_color\":" << quote(a.confidence_color);
    ss << ",\"leg_recommendations\":[";
    for (size_t i = 0; i < a.leg_recommendations.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quote(leg_recommendation_name(a.leg_recommendations[i]));
    }
    ss << "]";
    ss << ",\"weak_legs\":" << string_array(a.weak_legs);
    ss << ",\"strong_legs\":" << string_array(a.strong_legs);
    ss << ",\"recommendation\":" << quote(ticket_recommendation_name(a.recommendation));
    ss << ",\"summary\":" << quote(a.summary);
    ss << ",\"risk_notes\":" << quote(a.risk_notes);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Parlay& p) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"sport\":" << quote(p.sport);
    ss << ",\"risk_profile\":" << quote(risk_profile_name(p.risk_profile));
    ss << ",\"num_legs\":" << p.num_legs;
    ss << ",\"requested_legs\":" << p.requested_legs;
    ss << ",\"legs\":" << to_json(p.legs);
    ss << ",\"combined_implied_probability\":" << number(p.combined_implied_probability);
    ss << ",\"naive_probability\":" << number(p.naive_probability);
    ss << ",\"combined_model_probability\":" << number(p.combined_model_probability);
    ss << ",\"raw_parlay_hit_prob\":" << number(p.raw_probability);
    ss << ",\"parlay_hit_prob\":" << number(p.calibrated_probability);
    ss << ",\"decimal_odds\":" << number(p.decimal_odds);
    ss << ",\"parlay_ev\":" << number(p.expected_value);
    ss << ",\"confidence_scores\":[";
    for (size_t i = 0; i < p.confidence_scores.size(); ++i) {
        if (i > 0) ss << ",";
        ss << number(p.confidence_scores[i]);
    }
    ss << "]";
    ss << ",\"overall_confidence\":" << number(p.overall_confidence);
    ss << ",\"model_confidence\":" << number(p.model_confidence);
    ss << ",\"upset_count\":" << p.upset_count;
    ss << ",\"correlation_ceiling\":" << number(p.correlation_ceiling);
    ss << ",\"relaxations\":[";
    for (size_t i = 0; i < p.relaxations.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quote(stage_reason_name(p.relaxations[i]));
    }
    ss << "]";
    ss << ",\"model_version\":" << quote(p.model_version);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const TripleParlay& t) {
    std::ostringstream ss;
    ss << "{";
    for (size_t i = 0; i < t.entries.size(); ++i) {
        const auto& e = t.entries[i];
        if (i > 0) ss << ",";
        ss << quote(e.name) << ":{";
        ss << "\"parlay\":" << to_json(e.parlay);
        ss << ",\"config\":{";
        ss << "\"num_legs\":" << e.parlay.num_legs;
        ss << ",\"risk_profile\":" << quote(risk_profile_name(e.risk_profile));
        ss << ",\"sport\":" << quote(e.sport);
        ss << ",\"confidence_floor\":" << number(e.confidence_floor);
        ss << ",\"leg_range\":[" << e.min_legs << "," << e.max_legs << "]";
        ss << "}}";
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const CoverageTicket& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"num_upsets\":" << t.num_upsets;
    ss << ",\"probability\":" << number(t.probability);
    ss << ",\"legs\":" << to_json(t.legs);
    ss << ",\"analysis\":" << to_json(t.analysis);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const CoveragePack& pack) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"num_legs\":" << pack.num_legs;
    ss << ",\"total_scenarios\":" << pack.total_scenarios;
    ss << ",\"by_upset_count\":{";
    for (size_t k = 0; k < pack.by_upset_count.size(); ++k) {
        if (k > 0) ss << ",";
        ss << "\"" << k << "\":" << pack.by_upset_count[k];
    }
    ss << "}";
    ss << ",\"scenario_tickets\":[";
    for (size_t i = 0; i < pack.scenario_tickets.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(pack.scenario_tickets[i]);
    }
    ss << "]";
    ss << ",\"round_robin_tickets\":[";
    for (size_t i = 0; i < pack.round_robin_tickets.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(pack.round_robin_tickets[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const CounterResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"mode\":" << quote(counter_mode_name(r.mode));
    ss << ",\"target_legs\":" << r.target_legs;
    ss << ",\"counter_legs\":" << to_json(r.counter_legs);
    ss << ",\"analysis\":" << to_json(r.analysis);
    ss << ",\"candidates\":[";
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        const auto& c = r.candidates[i];
        if (i > 0) ss << ",";
        ss << "{\"original_index\":" << c.original_index;
        ss << ",\"score\":" << number(c.score);
        ss << ",\"leg\":" << to_json(c.flipped) << "}";
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const UpsetCandidate& u) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"team\":" << quote(u.team);
    ss << ",\"opponent\":" << quote(u.opponent);
    ss << ",\"ev\":" << number(u.ev);
    ss << ",\"risk_tier\":" << quote(risk_tier_name(u.risk_tier));
    ss << ",\"reasoning\":" << quote(u.reasoning);
    ss << ",\"leg\":" << to_json(u.leg);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const std::vector<UpsetCandidate>& upsets) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < upsets.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(upsets[i]);
    }
    ss << "]";
    return ss.str();
}

inline std::string to_json(const AccuracyStats& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"sufficient\":" << (s.sufficient ? "true" : "false");
    ss << ",\"resolved_count\":" << s.resolved_count;
    ss << ",\"required_count\":" << s.required_count;
    ss << ",\"message\":" << quote(s.message);
    ss << ",\"wins\":" << s.wins;
    ss << ",\"losses\":" << s.losses;
    ss << ",\"pushes\":" << s.pushes;
    ss << ",\"accuracy\":" << optional_number(s.accuracy);
    ss << ",\"brier_score\":" << optional_number(s.brier_score);
    ss << ",\"calibration_error\":" << optional_number(s.calibration_error);
    ss << ",\"avg_edge\":" << optional_number(s.avg_edge);
    ss << ",\"avg_expected_value\":" << optional_number(s.avg_expected_value);
    ss << ",\"positive_edge_count\":" << s.positive_edge_count;
    ss << ",\"positive_edge_accuracy\":" << optional_number(s.positive_edge_accuracy);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Prediction& p) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"id\":" << p.id;
    ss << ",\"idempotency_key\":" << quote(p.idempotency_key);
    ss << ",\"sport\":" << quote(p.sport);
    ss << ",\"event_id\":" << quote(p.event_id);
    ss << ",\"market_type\":" << quote(market_key(p.market_type));
    ss << ",\"side\":" << quote(p.side);
    ss << ",\"model_version\":" << quote(p.model_version);
    ss << ",\"predicted_prob\":" << number(p.predicted_prob);
    ss << ",\"implied_prob\":" << number(p.implied_prob);
    ss << ",\"edge\":" << number(p.edge);
    ss << ",\"confidence\":" << number(p.confidence);
    ss << ",\"status\":" << quote(resolution_status_name(p.status));
    ss << ",\"created_at\":" << quote(time_utils::iso8601(p.created_at));
    ss << "}";
    return ss.str();
}

inline std::string to_json(const TeamCalibration& c) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"team\":" << quote(c.team);
    ss << ",\"sport\":" << quote(c.sport);
    ss << ",\"bias_adjustment\":" << number(c.bias_adjustment);
    ss << ",\"avg_signed_error\":" << number(c.avg_signed_error);
    ss << ",\"sample_size\":" << c.sample_size;
    ss << ",\"accuracy\":" << number(c.accuracy);
    ss << ",\"brier_score\":" << number(c.brier_score);
    ss << "}";
    return ss.str();
}

// Error payload; insufficient-candidate failures carry counts and remediation.
inline std::string error_json(const std::exception& e) {
    std::ostringstream ss;
    ss << "{\"error\":" << quote(e.what());
    if (const auto* ic = dynamic_cast<const InsufficientCandidatesError*>(&e)) {
        ss << ",\"kind\":\"insufficient_candidates\"";
        ss << ",\"needed\":" << ic->needed();
        ss << ",\"have\":" << ic->have();
        ss << ",\"remediation\":" << quote(remediation_name(ic->remediation()));
    } else if (dynamic_cast<const ValidationError*>(&e)) {
        ss << ",\"kind\":\"validation\"";
    }
    ss << "}";
    return ss.str();
}

}  // namespace parlay_io
