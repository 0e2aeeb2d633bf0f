#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "probability/correlation_model.hpp"
#include "selection/conflict_rules.hpp"
#include "selection/selection_config.hpp"
#include "selection/selection_stages.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SelectionResult — chosen legs plus how the pipeline got there
// ---------------------------------------------------------------------------
struct SelectionResult {
    std::vector<Leg> legs;
    std::vector<double> scores;                 // parallel to legs
    std::vector<StageResult::Reason> stages;    // non-OK stage outcomes, in order
    double ceiling_used = 0.0;
    int pool_size = 0;

    bool complete(int num_legs) const { return static_cast<int>(legs.size()) >= num_legs; }
};

// ---------------------------------------------------------------------------
// ConstraintProfile — one step of the relaxation ladder
// ---------------------------------------------------------------------------
struct ConstraintProfile {
    double max_pair_correlation = 0.55;
    int max_legs_per_game = 2;
};

// ---------------------------------------------------------------------------
// LegSelectionOptimizer
//
// dedup -> edge filter -> confidence prefilter -> score -> greedy selection
// against an ordered list of constraint profiles. The first profile that
// fills num_legs wins; otherwise the longest selection is returned.
// ---------------------------------------------------------------------------
class LegSelectionOptimizer {
public:
    explicit LegSelectionOptimizer(SelectionConfig config = SelectionConfig{},
                                   CorrelationModel model = CorrelationModel{})
        : config_(std::move(config)), model_(model) {}

    SelectionResult select(const std::vector<Leg>& candidates, int num_legs,
                           RiskProfile profile) const {
        if (num_legs < 1 || num_legs > config_.max_num_legs) {
            throw ValidationError("num_legs must be between 1 and " +
                                  std::to_string(config_.max_num_legs) + ", got " +
                                  std::to_string(num_legs));
        }
        if (candidates.empty()) {
            throw InsufficientCandidatesError(
                num_legs, 0, "Not enough candidate legs available. Found 0 candidate legs.");
        }

        const auto& thresholds = config_.for_profile(profile);
        SelectionResult result;
        auto note = [&](const StageResult& s) {
            if (s.reason != StageResult::Reason::OK) result.stages.push_back(s.reason);
        };

        StageResult deduped = selection_stages::deduplicate(candidates, num_legs);
        note(deduped);
        StageResult edged = selection_stages::filter_edge(deduped.pool, num_legs, thresholds.min_edge);
        note(edged);
        StageResult confident = selection_stages::filter_confidence(
            edged.pool, num_legs, thresholds, config_.confidence_relax_factor);
        note(confident);

        std::vector<ScoredLeg> scored = selection_stages::score_pool(confident.pool, config_);
        result.pool_size = static_cast<int>(scored.size());

        std::vector<ScoredLeg> best;
        for (const auto& constraints : constraint_profiles(profile)) {
            std::vector<ScoredLeg> picked = greedy_select(scored, num_legs, constraints);
            if (picked.size() > best.size() || best.empty()) {
                best = std::move(picked);
                result.ceiling_used = constraints.max_pair_correlation;
            }
            if (static_cast<int>(best.size()) >= num_legs) break;
        }

        for (const auto& s : best) {
            result.legs.push_back(s.leg);
            result.scores.push_back(s.score);
        }
        return result;
    }

    std::vector<ConstraintProfile> constraint_profiles(RiskProfile profile) const {
        std::vector<ConstraintProfile> out;
        for (double ceiling : config_.ceilings(profile)) {
            out.push_back({ceiling, config_.max_legs_per_game});
        }
        return out;
    }

    // Pool diversification on the coarse heuristic: drops any leg whose
    // heuristic correlation with a kept leg reaches max_correlation, or that
    // conflicts with one. Input order is preserved.
    static std::vector<Leg> legacy_diversify(const std::vector<Leg>& legs, double max_correlation) {
        std::vector<Leg> kept;
        for (const auto& leg : legs) {
            bool drop = conflict_rules::conflicts_with_any(leg, kept);
            for (const auto& k : kept) {
                if (drop) break;
                drop = CorrelationModel::heuristic(leg, k) >= max_correlation;
            }
            if (!drop) kept.push_back(leg);
        }
        return kept;
    }

    const SelectionConfig& config() const { return config_; }

private:
    SelectionConfig config_;
    CorrelationModel model_;

    bool admissible(const Leg& leg, const std::vector<Leg>& chosen,
                    const std::map<std::string, int>& per_game,
                    const ConstraintProfile& c) const {
        auto it = per_game.find(leg.game_id);
        if (it != per_game.end() && it->second >= c.max_legs_per_game) return false;
        for (const auto& other : chosen) {
            if (same_selection(leg, other)) return false;
            if (conflict_rules::conflicts(leg, other)) return false;
            if (model_.pair_correlation(leg, other) > c.max_pair_correlation) return false;
        }
        return true;
    }

    std::vector<ScoredLeg> greedy_select(const std::vector<ScoredLeg>& scored, int num_legs,
                                         const ConstraintProfile& c) const {
        std::vector<ScoredLeg> picked;
        std::vector<Leg> chosen;
        std::map<std::string, int> per_game;
        for (const auto& s : scored) {
            if (static_cast<int>(picked.size()) >= num_legs) break;
            if (!admissible(s.leg, chosen, per_game, c)) continue;
            picked.push_back(s);
            chosen.push_back(s.leg);
            per_game[s.leg.game_id] += 1;
        }
        return picked;
    }
};
