#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "core/odds.hpp"
#include "selection/leg_selection_optimizer.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

enum class RiskTier { LOW, MEDIUM, HIGH };

enum class ParlayType { SAFE, BALANCED, DEGEN };

inline const char* risk_tier_name(RiskTier t) {
    switch (t) {
        case RiskTier::LOW:    return "low";
        case RiskTier::MEDIUM: return "medium";
        case RiskTier::HIGH:   return "high";
    }
    return "high";
}

inline ParlayType parse_parlay_type(const std::string& raw) {
    std::string s = text::to_lower(text::trim(raw));
    if (s == "safe") return ParlayType::SAFE;
    if (s == "degen") return ParlayType::DEGEN;
    if (s == "balanced" || s.empty()) return ParlayType::BALANCED;
    throw ValidationError("Unknown parlay type '" + raw + "' (expected safe/balanced/degen)");
}

// ---------------------------------------------------------------------------
// UpsetConfig — tier bands are checked low, medium, high; first match wins
// ---------------------------------------------------------------------------
struct UpsetConfig {
    struct TierBand {
        double min_prob = 0.0;
        int max_odds = 10000;
    };

    TierBand low{0.40, 200};
    TierBand medium{0.30, 350};
    TierBand high{0.0, 10000};

    double min_edge_threshold = 0.03;
    int default_max_results = 20;

    int max_upsets_safe = 1;
    int max_upsets_balanced = 2;
    int max_upsets_degen = 4;

    // Two upsets at or above this heuristic correlation are not both kept.
    double diversify_threshold = 0.8;
};

struct UpsetCandidate {
    Leg leg;
    std::string team;
    std::string opponent;
    double ev = 0.0;
    RiskTier risk_tier = RiskTier::HIGH;
    std::string reasoning;
};

struct GameUpsetAnalysis {
    std::string game_id;
    std::vector<UpsetCandidate> candidates;
    std::string summary;
};

// ---------------------------------------------------------------------------
// UpsetFinder — positive-EV underdogs, tiered by risk
// ---------------------------------------------------------------------------
class UpsetFinder {
public:
    explicit UpsetFinder(UpsetConfig config = UpsetConfig{})
        : config_(config) {}

    // EV per unit staked from American-odds payout.
    static double expected_value(double model_prob, int american_odds) {
        return model_prob * odds::payout_per_100(american_odds) / 100.0 - (1.0 - model_prob);
    }

    RiskTier tier_for(double model_prob, int american_odds) const {
        if (model_prob >= config_.low.min_prob && american_odds <= config_.low.max_odds) return RiskTier::LOW;
        if (model_prob >= config_.medium.min_prob && american_odds <= config_.medium.max_odds) return RiskTier::MEDIUM;
        if (model_prob >= config_.high.min_prob && american_odds <= config_.high.max_odds) return RiskTier::HIGH;
        return RiskTier::HIGH;
    }

    std::vector<UpsetCandidate> find_upsets(const std::vector<Leg>& legs,
                                            std::optional<double> min_edge = std::nullopt,
                                            std::optional<int> max_results = std::nullopt,
                                            std::optional<RiskTier> tier_filter = std::nullopt) const {
        double threshold = min_edge.value_or(config_.min_edge_threshold);
        int limit = max_results.value_or(config_.default_max_results);
        if (limit < 0) throw ValidationError("max_results must be non-negative");

        std::vector<UpsetCandidate> out;
        for (const auto& leg : legs) {
            auto c = evaluate(leg, threshold);
            if (!c) continue;
            if (tier_filter && c->risk_tier != *tier_filter) continue;
            out.push_back(std::move(*c));
        }
        std::stable_sort(out.begin(), out.end(), [](const UpsetCandidate& a, const UpsetCandidate& b) {
            return a.ev > b.ev;
        });
        if (static_cast<int>(out.size()) > limit) out.resize(limit);
        return out;
    }

    std::vector<UpsetCandidate> get_upsets_for_parlay(const std::vector<Leg>& legs, ParlayType type,
                                                      std::optional<int> num_upsets = std::nullopt) const {
        int n = num_upsets.value_or(max_upsets(type));
        if (n < 0) throw ValidationError("num_upsets must be non-negative");

        std::vector<UpsetCandidate> upsets;
        switch (type) {
            case ParlayType::SAFE:
                upsets = find_upsets(legs, 0.08, n * 2, RiskTier::LOW);
                break;
            case ParlayType::BALANCED:
                upsets = find_upsets(legs, 0.05, n * 2);
                break;
            case ParlayType::DEGEN:
                upsets = find_upsets(legs, 0.03, n * 2);
                std::stable_sort(upsets.begin(), upsets.end(),
                                 [](const UpsetCandidate& a, const UpsetCandidate& b) {
                                     return a.leg.american_odds > b.leg.american_odds;
                                 });
                break;
        }
        upsets = diversify(upsets);
        if (static_cast<int>(upsets.size()) > n) upsets.resize(n);
        return upsets;
    }

    GameUpsetAnalysis analyze_game(const std::vector<Leg>& legs, const std::string& game_id) const {
        GameUpsetAnalysis a;
        a.game_id = game_id;
        std::vector<Leg> game_legs;
        for (const auto& leg : legs) {
            if (leg.game_id == game_id) game_legs.push_back(leg);
        }
        a.candidates = find_upsets(game_legs, config_.min_edge_threshold,
                                   static_cast<int>(game_legs.size()));
        if (a.candidates.empty()) {
            a.summary = "No significant upset potential identified.";
        } else {
            const auto& best = a.candidates.front();
            char buf[160];
            std::snprintf(buf, sizeof(buf), "%zu upset angle(s); best is %s at %s (%.1f%% edge).",
                          a.candidates.size(), best.leg.outcome.c_str(),
                          best.leg.odds_string().c_str(), best.leg.edge * 100.0);
            a.summary = buf;
        }
        return a;
    }

    int max_upsets(ParlayType type) const {
        switch (type) {
            case ParlayType::SAFE:     return config_.max_upsets_safe;
            case ParlayType::BALANCED: return config_.max_upsets_balanced;
            case ParlayType::DEGEN:    return config_.max_upsets_degen;
        }
        return config_.max_upsets_balanced;
    }

    const UpsetConfig& config() const { return config_; }

private:
    UpsetConfig config_;

    std::optional<UpsetCandidate> evaluate(const Leg& leg, double min_edge) const {
        if (leg.implied_probability > 0.50 || leg.american_odds <= 0) return std::nullopt;
        if (leg.edge < min_edge) return std::nullopt;
        double ev = expected_value(leg.model_probability, leg.american_odds);
        if (ev <= 0.0) return std::nullopt;

        UpsetCandidate c;
        c.leg = leg;
        c.ev = ev;
        c.risk_tier = tier_for(leg.model_probability, leg.american_odds);
        Side side = leg.side();
        if (side == Side::HOME) {
            c.team = leg.home_team;
            c.opponent = leg.away_team;
        } else if (side == Side::AWAY) {
            c.team = leg.away_team;
            c.opponent = leg.home_team;
        }
        c.reasoning = reasoning(leg, c.risk_tier);
        return c;
    }

    static std::string reasoning(const Leg& leg, RiskTier tier) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Model sees %.1f%% edge over the market. (%.0f%% vs %.0f%% implied)",
                      leg.edge * 100.0, leg.model_probability * 100.0, leg.implied_probability * 100.0);
        std::string out = buf;
        switch (tier) {
            case RiskTier::LOW:    out += ". Lower-risk upset candidate"; break;
            case RiskTier::MEDIUM: out += ". Moderate-risk value play"; break;
            case RiskTier::HIGH:   out += ". High-risk longshot with upside"; break;
        }
        if (leg.confidence_score >= 70.0) out += ". High model confidence";
        else if (leg.confidence_score >= 55.0) out += ". Solid model confidence";
        return out + ".";
    }

    std::vector<UpsetCandidate> diversify(const std::vector<UpsetCandidate>& upsets) const {
        std::vector<Leg> legs;
        for (const auto& u : upsets) legs.push_back(u.leg);
        std::vector<Leg> kept = LegSelectionOptimizer::legacy_diversify(legs, config_.diversify_threshold);
        std::vector<UpsetCandidate> out;
        size_t j = 0;
        for (const auto& u : upsets) {
            if (j < kept.size() && u.leg == kept[j]) {
                out.push_back(u);
                ++j;
            }
        }
        return out;
    }
};
