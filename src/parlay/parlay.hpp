#pragma once

#include "core/leg.hpp"
#include "selection/selection_stages.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parlay — priced, calibrated multi-leg ticket
// ---------------------------------------------------------------------------
struct Parlay {
    std::vector<Leg> legs;
    int num_legs = 0;
    int requested_legs = 0;
    RiskProfile risk_profile = RiskProfile::BALANCED;
    std::string sport;

    double combined_implied_probability = 0.0;  // product of implied
    double naive_probability = 0.0;             // product of model
    double combined_model_probability = 0.0;    // correlation-adjusted
    double raw_probability = 0.0;               // before calibration
    double calibrated_probability = 0.0;
    double decimal_odds = 1.0;
    double expected_value = 0.0;                // calibrated * decimal - 1

    std::vector<double> confidence_scores;
    double overall_confidence = 0.0;
    double model_confidence = 0.5;
    int upset_count = 0;

    double correlation_ceiling = 0.0;
    std::vector<StageResult::Reason> relaxations;
    std::string model_version;

    bool short_of_request() const { return num_legs < requested_legs; }
};

// One profile of a safe / balanced / degen bundle.
struct TripleParlayEntry {
    std::string name;
    RiskProfile risk_profile = RiskProfile::BALANCED;
    std::string sport;
    int min_legs = 1;
    int max_legs = 20;
    double confidence_floor = 0.0;
    Parlay parlay;
};

struct TripleParlay {
    std::vector<TripleParlayEntry> entries;   // safe, balanced, degen
};
