#pragma once

#include "core/candidate_record.hpp"
#include "core/errors.hpp"
#include "core/leg.hpp"
#include "parlay/candidate_pool.hpp"
#include "parlay/parlay.hpp"
#include "probability/parlay_probability_calculator.hpp"
#include "probability/probability_calibration.hpp"
#include "selection/leg_selection_optimizer.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ParlayBuilderConfig {
    std::string model_version = "parlay-engine-1.0";
    int min_pool_size = 50;       // candidates fetched = max(min_pool_size, pool_per_leg * num_legs)
    int pool_per_leg = 5;
    int triple_pool_size = 500;
};

// Leg-count range and default for one entry of build_triple_parlay.
struct TripleProfile {
    std::string name;
    RiskProfile risk_profile = RiskProfile::BALANCED;
    int default_legs = 4;
    int min_legs = 1;
    int max_legs = 20;
};

inline std::vector<TripleProfile> default_triple_profiles() {
    return {
        {"safe", RiskProfile::CONSERVATIVE, 4, 3, 6},
        {"balanced", RiskProfile::BALANCED, 8, 7, 12},
        {"degen", RiskProfile::DEGEN, 14, 13, 20},
    };
}

// ---------------------------------------------------------------------------
// ParlayBuilder
//
// pool fetch -> boundary validation -> LegSelectionOptimizer ->
// ParlayProbabilityCalculator -> ProbabilityCalibrationService -> Parlay.
// ---------------------------------------------------------------------------
class ParlayBuilder {
public:
    explicit ParlayBuilder(std::shared_ptr<CandidatePool> pool,
                           LegSelectionOptimizer optimizer = LegSelectionOptimizer{},
                           ParlayProbabilityCalculator calculator = ParlayProbabilityCalculator{},
                           ProbabilityCalibrationService calibration = ProbabilityCalibrationService{},
                           ParlayBuilderConfig config = ParlayBuilderConfig{})
        : pool_(std::move(pool)), optimizer_(std::move(optimizer)),
          calculator_(calculator), calibration_(std::move(calibration)),
          config_(std::move(config)) {
        if (!pool_) throw ValidationError("ParlayBuilder needs a candidate pool");
    }

    static int clamp_legs(int num_legs) { return std::clamp(num_legs, 1, 20); }

    Parlay build_parlay(int num_legs, const std::string& risk_profile, const std::string& sport,
                        std::optional<int> week = std::nullopt, bool include_player_props = false) {
        int requested = clamp_legs(num_legs);
        RiskProfile profile = parse_risk_profile(risk_profile);

        CandidateQuery q;
        q.sport = sport;
        q.min_confidence = fetch_confidence_floor(profile);
        q.max_legs = std::max(config_.min_pool_size, config_.pool_per_leg * requested);
        q.week = week;
        q.include_player_props = include_player_props;

        std::vector<Leg> legs = load_legs(q);
        if (legs.empty() && week) {
            std::cerr << "[ParlayBuilder] no candidates for " << sport << " week " << *week
                      << ", retrying without a week filter\n";
            q.week.reset();
            legs = load_legs(q);
        }
        if (legs.empty()) throw empty_pool_error(sport, requested, week);

        SelectionResult selection = optimizer_.select(legs, requested, profile);
        Parlay p = price(selection.legs, profile, sport);
        p.requested_legs = requested;
        p.correlation_ceiling = selection.ceiling_used;
        p.relaxations = selection.stages;
        return p;
    }

    // Safe / balanced / degen tickets. Each profile tries the sports in order
    // and keeps the first that produces a parlay; the pool is fetched once
    // per sport.
    TripleParlay build_triple_parlay(const std::vector<std::string>& sports,
                                     const std::map<std::string, int>& leg_overrides = {}) {
        if (sports.empty()) throw ValidationError("At least one sport is needed to build triple parlays");

        std::map<std::string, std::vector<Leg>> pools;
        TripleParlay out;
        for (const auto& profile : default_triple_profiles()) {
            int num_legs = profile.default_legs;
            auto ov = leg_overrides.find(profile.name);
            if (ov != leg_overrides.end()) num_legs = std::clamp(ov->second, profile.min_legs, profile.max_legs);

            std::string tried;
            bool built = false;
            for (const auto& sport : sports) {
                try {
                    auto it = pools.find(sport);
                    if (it == pools.end()) {
                        CandidateQuery q;
                        q.sport = sport;
                        q.max_legs = config_.triple_pool_size;
                        it = pools.emplace(sport, load_legs(q)).first;
                    }
                    if (it->second.empty()) throw empty_pool_error(sport, num_legs, std::nullopt);

                    SelectionResult selection = optimizer_.select(it->second, num_legs, profile.risk_profile);
                    TripleParlayEntry entry;
                    entry.name = profile.name;
                    entry.risk_profile = profile.risk_profile;
                    entry.sport = sport;
                    entry.min_legs = profile.min_legs;
                    entry.max_legs = profile.max_legs;
                    entry.confidence_floor = optimizer_.config().for_profile(profile.risk_profile).min_confidence;
                    entry.parlay = price(selection.legs, profile.risk_profile, sport);
                    entry.parlay.requested_legs = num_legs;
                    entry.parlay.correlation_ceiling = selection.ceiling_used;
                    entry.parlay.relaxations = selection.stages;
                    out.entries.push_back(std::move(entry));
                    built = true;
                    break;
                } catch (const InsufficientCandidatesError& e) {
                    tried += (tried.empty() ? "" : ", ") + sport + ": " + e.what();
                }
            }
            if (!built) {
                throw InsufficientCandidatesError(num_legs, 0, "Failed to build " + profile.name +
                                                  " parlay. No sports have enough games. Tried: " + tried);
            }
        }
        return out;
    }

    // Prices an already-selected leg list.
    Parlay price(const std::vector<Leg>& selected, RiskProfile profile, const std::string& sport) const {
        if (selected.empty()) {
            std::cerr << "[ParlayBuilder] empty selection reached the payload builder\n";
            throw ComputationError("Selected leg list is empty");
        }

        Parlay p;
        p.legs = selected;
        p.num_legs = static_cast<int>(selected.size());
        p.requested_legs = p.num_legs;
        p.risk_profile = profile;
        p.sport = sport;
        p.model_version = config_.model_version;

        JointProbability joint = calculator_.breakdown(selected, profile);
        p.combined_implied_probability = combined_implied_probability(selected);
        p.naive_probability = joint.naive;
        p.combined_model_probability = joint.adjusted;
        p.raw_probability = joint.adjusted;
        p.calibrated_probability = calibration_.calibrate(joint.adjusted);
        p.decimal_odds = combined_decimal_odds(selected);
        p.expected_value = p.calibrated_probability * p.decimal_odds - 1.0;

        double sum = 0.0;
        for (const auto& leg : selected) {
            p.confidence_scores.push_back(leg.confidence_score);
            sum += leg.confidence_score;
            if (leg.is_plus_money()) ++p.upset_count;
        }
        p.overall_confidence = sum / p.num_legs;
        p.model_confidence = p.overall_confidence > 0.0 ? std::min(1.0, p.overall_confidence / 100.0) : 0.5;
        return p;
    }

    ProbabilityCalibrationService& calibration() { return calibration_; }
    const LegSelectionOptimizer& optimizer() const { return optimizer_; }

private:
    std::shared_ptr<CandidatePool> pool_;
    LegSelectionOptimizer optimizer_;
    ParlayProbabilityCalculator calculator_;
    ProbabilityCalibrationService calibration_;
    ParlayBuilderConfig config_;

    // Lowest confidence the optimizer could still accept after relaxation.
    double fetch_confidence_floor(RiskProfile profile) const {
        const auto& t = optimizer_.config().for_profile(profile);
        double factor = t.relax_confidence ? optimizer_.config().confidence_relax_factor : 1.0;
        return t.min_confidence * factor;
    }

    std::vector<Leg> load_legs(const CandidateQuery& q) {
        int rejected = 0;
        std::vector<Leg> legs = legs_from_records(pool_->get_candidate_legs(q), &rejected);
        if (rejected > 0) {
            std::cerr << "[ParlayBuilder] " << rejected << " candidate records rejected for " << q.sport << "\n";
        }
        return legs;
    }

    InsufficientCandidatesError empty_pool_error(const std::string& sport, int needed,
                                                 std::optional<int> week) {
        using Remediation = InsufficientCandidatesError::Remediation;
        SlateStatus status = pool_->slate_status(sport);
        std::string scope = sport + (week ? " for week " + std::to_string(*week) : "");
        std::string base = "Not enough candidate legs available for " + scope + ". Found 0 candidate legs. ";
        if (status.games_scheduled == 0) {
            return InsufficientCandidatesError(needed, 0, base + "No games are scheduled right now.",
                                               Remediation::NO_GAMES);
        }
        if (status.games_with_odds == 0) {
            return InsufficientCandidatesError(
                needed, 0,
                base + std::to_string(status.games_scheduled) + " games are scheduled but odds are not loaded yet.",
                Remediation::ODDS_NOT_LOADED);
        }
        return InsufficientCandidatesError(needed, 0,
                                           base + "Games have odds but too few legs meet the confidence bar.",
                                           Remediation::LOW_CONFIDENCE);
    }
};
