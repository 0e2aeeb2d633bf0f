#pragma once

#include "core/leg.hpp"
#include "probability/correlation_model.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// JointProbability — calculator output with the independent baseline
// ---------------------------------------------------------------------------
struct JointProbability {
    double naive = 0.0;       // product of leg model probabilities
    double adjusted = 0.0;    // correlation-adjusted joint probability
    int same_game_groups = 0; // games contributing two or more legs
};

// ---------------------------------------------------------------------------
// ParlayProbabilityCalculator
//
// Legs are grouped by game. A single-leg group contributes its probability.
// A group of m >= 2 legs contributes
//     naive_g + lambda * (min_i p_i - naive_g)
// where lambda = CorrelationModel::distortion_factor, capped per risk profile.
// Groups multiply (games are independent). Result is bounded to (0, 1).
// ---------------------------------------------------------------------------
class ParlayProbabilityCalculator {
public:
    static constexpr double MIN_PROB = 1e-6;
    static constexpr double MAX_PROB = 1.0 - 1e-6;

    explicit ParlayProbabilityCalculator(CorrelationModel model = CorrelationModel{})
        : model_(model) {}

    double calculate(const std::vector<Leg>& legs,
                     RiskProfile profile = RiskProfile::BALANCED) const {
        return breakdown(legs, profile).adjusted;
    }

    JointProbability breakdown(const std::vector<Leg>& legs,
                               RiskProfile profile = RiskProfile::BALANCED) const {
        JointProbability out;
        if (legs.empty()) return out;

        std::map<std::string, std::vector<Leg>> groups;
        for (const auto& leg : legs) groups[leg.game_id].push_back(leg);

        double naive_total = 1.0;
        double adjusted_total = 1.0;
        for (const auto& [game_id, group] : groups) {
            double naive = 1.0;
            double weakest = 1.0;
            for (const auto& leg : group) {
                naive *= leg.model_probability;
                weakest = std::min(weakest, leg.model_probability);
            }
            naive_total *= naive;

            if (group.size() == 1) {
                adjusted_total *= naive;
                continue;
            }
            ++out.same_game_groups;
            double lambda = std::min(model_.distortion_factor(group), pull_cap(profile));
            adjusted_total *= naive + lambda * (weakest - naive);
        }

        out.naive = std::clamp(naive_total, MIN_PROB, MAX_PROB);
        out.adjusted = std::clamp(adjusted_total, MIN_PROB, MAX_PROB);
        return out;
    }

    const CorrelationModel& model() const { return model_; }

    // Conservative profiles credit less of the same-game correlation.
    static double pull_cap(RiskProfile profile) {
        switch (profile) {
            case RiskProfile::CONSERVATIVE: return 0.5;
            case RiskProfile::BALANCED:     return 0.75;
            case RiskProfile::DEGEN:        return 0.95;
        }
        return 0.75;
    }

private:
    CorrelationModel model_;
};
