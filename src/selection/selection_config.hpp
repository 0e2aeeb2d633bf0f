#pragma once

#include "core/leg.hpp"

#include <vector>

// ---------------------------------------------------------------------------
// SelectionConfig — per-profile thresholds for LegSelectionOptimizer
// ---------------------------------------------------------------------------
struct SelectionConfig {
    struct ProfileThresholds {
        double min_edge = 0.01;
        double min_confidence = 55.0;
        double base_ceiling = 0.55;
        bool relax_confidence = true;
    };

    ProfileThresholds conservative{0.02, 70.0, 0.35, true};
    ProfileThresholds balanced{0.01, 55.0, 0.55, true};
    ProfileThresholds degen{0.0, 40.0, 0.75, false};

    double confidence_relax_factor = 0.8;
    std::vector<double> fallback_ceilings{0.85, 0.99};
    int max_legs_per_game = 2;
    int max_num_legs = 20;

    // score = ev * (ev_base + ev_conf * conf/100) + edge * edge_w + move * move_w
    double ev_base_weight = 0.7;
    double ev_confidence_weight = 0.3;
    double edge_weight = 0.5;
    double movement_weight = 0.08;

    const ProfileThresholds& for_profile(RiskProfile profile) const {
        switch (profile) {
            case RiskProfile::CONSERVATIVE: return conservative;
            case RiskProfile::DEGEN:        return degen;
            case RiskProfile::BALANCED:     break;
        }
        return balanced;
    }

    // Ordered correlation ceilings: profile base, then the fallbacks.
    std::vector<double> ceilings(RiskProfile profile) const {
        std::vector<double> out{for_profile(profile).base_ceiling};
        out.insert(out.end(), fallback_ceilings.begin(), fallback_ceilings.end());
        return out;
    }
};
