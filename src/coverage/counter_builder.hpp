#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "coverage/leg_flipper.hpp"
#include "parlay/ticket_analysis.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CounterBuilder — hedge ticket made of the flipped legs of a parlay
//
//   FLIP_ALL    every leg flipped
//   BEST_EDGES  flipped legs with edge >= min_edge, best score first,
//               truncated to target_legs (all flipped legs if too few pass)
// ---------------------------------------------------------------------------
enum class CounterMode { FLIP_ALL, BEST_EDGES };

inline const char* counter_mode_name(CounterMode m) {
    return m == CounterMode::FLIP_ALL ? "flip_all" : "best_edges";
}

inline CounterMode parse_counter_mode(const std::string& raw) {
    std::string s = text::to_lower(text::trim(raw));
    if (s == "flip_all") return CounterMode::FLIP_ALL;
    if (s == "best_edges") return CounterMode::BEST_EDGES;
    throw ValidationError("Unknown counter mode '" + raw + "' (expected flip_all/best_edges)");
}

struct CounterCandidate {
    int original_index = 0;
    Leg flipped;
    double score = 0.0;
};

struct CounterResult {
    CounterMode mode = CounterMode::FLIP_ALL;
    int target_legs = 0;
    std::vector<Leg> counter_legs;
    TicketAnalysis analysis;
    std::vector<CounterCandidate> candidates;   // every flipped leg, best score first
};

struct CounterBuilder {
    static double counter_score(const Leg& leg) {
        double p = std::clamp(leg.model_probability, 0.0001, 0.9999);
        double dec = std::max(1.01, leg.decimal_odds);
        double ev = p * dec - 1.0;
        double conf = std::clamp(leg.confidence_score / 100.0, 0.0, 1.0);
        return ev * (0.7 + 0.3 * conf) + leg.edge * 0.5;
    }

    static CounterResult generate_counter(const std::vector<Leg>& legs, CounterMode mode,
                                          std::optional<int> target_legs = std::nullopt,
                                          std::optional<double> min_edge = std::nullopt) {
        if (legs.empty()) throw ValidationError("Counter ticket needs at least one leg");
        const int n = static_cast<int>(legs.size());

        CounterResult result;
        result.mode = mode;
        for (int i = 0; i < n; ++i) {
            Leg f = LegFlipper::flip(legs[i]);
            double s = counter_score(f);
            result.candidates.push_back({i, std::move(f), s});
        }

        std::vector<CounterCandidate> ranked = result.candidates;
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const CounterCandidate& a, const CounterCandidate& b) {
                             return a.score > b.score;
                         });

        if (mode == CounterMode::FLIP_ALL) {
            result.target_legs = n;
            for (const auto& c : result.candidates) result.counter_legs.push_back(c.flipped);
        } else {
            int target = std::clamp(target_legs.value_or(n), 1, n);
            double threshold = min_edge.value_or(0.0);
            std::vector<CounterCandidate> passing;
            for (const auto& c : ranked) {
                if (c.flipped.edge >= threshold) passing.push_back(c);
            }
            const auto& pool = static_cast<int>(passing.size()) >= target ? passing : ranked;
            result.target_legs = target;
            for (int i = 0; i < target; ++i) result.counter_legs.push_back(pool[i].flipped);
        }

        result.candidates = std::move(ranked);
        result.analysis = ticket_analysis::analyze(result.counter_legs);
        return result;
    }
};
