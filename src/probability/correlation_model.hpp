#pragma once

#include "core/leg.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

// ---------------------------------------------------------------------------
// CorrelationModel
//
// Two separate notions:
//   heuristic(a, b)        coarse score for pool diversification only
//                          (+0.5 same game, +0.3 same market, +0.2 same outcome)
//   pair_correlation(a, b) latent same-game correlation, used for selection
//                          ceilings and the joint-probability distortion factor
// ---------------------------------------------------------------------------
struct CorrelationModel {
    // Latent correlation table (same game only; different games are 0).
    double same_market_same_side = 0.9;
    double moneyline_spread_same_side = 0.7;
    double side_vs_total = 0.25;
    double opposite_sides = -0.6;
    double other_same_game = 0.15;

    // Distortion factor: lambda = min(max_pull, s * (1 - 1/m)), s >= min_similarity.
    double min_similarity = 0.1;
    double max_pull = 0.95;

    static double heuristic(const Leg& a, const Leg& b) {
        double c = 0.0;
        if (same_game(a, b)) {
            c += 0.5;
            if (a.market_type == b.market_type) c += 0.3;
            if (text::to_lower(a.outcome) == text::to_lower(b.outcome)) c += 0.2;
        }
        return std::min(1.0, c);
    }

    double pair_correlation(const Leg& a, const Leg& b) const {
        if (!same_game(a, b)) return 0.0;

        Side sa = a.side();
        Side sb = b.side();
        bool a_total = a.market_type == MarketType::TOTAL;
        bool b_total = b.market_type == MarketType::TOTAL;

        if (a_total != b_total) return side_vs_total;
        if (sa == Side::UNKNOWN || sb == Side::UNKNOWN) return other_same_game;
        if (sa != sb) return opposite_sides;
        if (a.market_type == b.market_type) return same_market_same_side;
        return moneyline_spread_same_side;
    }

    // Mean pairwise correlation within a group, floored at min_similarity.
    double group_similarity(const std::vector<Leg>& group) const {
        if (group.size() < 2) return 0.0;
        double sum = 0.0;
        int pairs = 0;
        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                sum += std::max(0.0, pair_correlation(group[i], group[j]));
                ++pairs;
            }
        }
        return std::max(min_similarity, sum / static_cast<double>(pairs));
    }

    // Share of the gap between naive product and weakest leg that is closed.
    double distortion_factor(const std::vector<Leg>& group) const {
        size_t m = group.size();
        if (m < 2) return 0.0;
        double s = group_similarity(group);
        double lambda = s * (1.0 - 1.0 / static_cast<double>(m));
        return std::min(max_pull, lambda);
    }
};
