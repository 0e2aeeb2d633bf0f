#pragma once

#include "tracking/prediction.hpp"
#include "tracking/tracker_config.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AccuracyStats — model accuracy over a window of resolved predictions.
// `sufficient` is false below the minimum sample; metrics are then unset.
// ---------------------------------------------------------------------------
struct AccuracyStats {
    bool sufficient = false;
    int resolved_count = 0;
    int required_count = 0;
    std::string message;

    int wins = 0;
    int losses = 0;
    int pushes = 0;
    std::optional<double> accuracy;             // wins / (wins + losses)
    std::optional<double> brier_score;          // pushes excluded
    std::optional<double> calibration_error;    // |mean signed error|
    std::optional<double> avg_edge;
    std::optional<double> avg_expected_value;
    int positive_edge_count = 0;
    std::optional<double> positive_edge_accuracy;
};

// Brier, accuracy and mean signed error over graded (non-push) rows.
struct ErrorSummary {
    int graded = 0;
    int correct = 0;
    double brier = 0.0;
    double mean_signed_error = 0.0;

    double accuracy() const { return graded > 0 ? static_cast<double>(correct) / graded : 0.0; }
};

namespace accuracy_stats {

inline ErrorSummary summarize(const std::vector<ResolvedPrediction>& rows) {
    ErrorSummary s;
    double sq = 0.0;
    double signed_sum = 0.0;
    for (const auto& r : rows) {
        if (r.outcome.is_push) continue;
        ++s.graded;
        if (r.outcome.was_correct) ++s.correct;
        sq += r.outcome.signed_error * r.outcome.signed_error;
        signed_sum += r.outcome.signed_error;
    }
    if (s.graded > 0) {
        s.brier = sq / s.graded;
        s.mean_signed_error = signed_sum / s.graded;
    }
    return s;
}

inline AccuracyStats compute(const std::vector<ResolvedPrediction>& rows, const TrackerConfig& config) {
    AccuracyStats st;
    st.resolved_count = static_cast<int>(rows.size());
    st.required_count = config.min_resolved_for_stats;

    for (const auto& r : rows) {
        if (r.outcome.is_push) ++st.pushes;
        else if (r.outcome.was_correct) ++st.wins;
        else ++st.losses;
    }

    if (st.resolved_count < config.min_resolved_for_stats) {
        st.message = "Insufficient data: " + std::to_string(st.resolved_count) + " resolved predictions, need " +
                     std::to_string(config.min_resolved_for_stats);
        return st;
    }

    st.sufficient = true;
    ErrorSummary all = summarize(rows);
    st.accuracy = all.accuracy();
    st.brier_score = all.brier;
    st.calibration_error = std::abs(all.mean_signed_error);

    double edge_sum = 0.0;
    double ev_sum = 0.0;
    std::vector<ResolvedPrediction> positive;
    for (const auto& r : rows) {
        edge_sum += r.prediction.edge;
        ev_sum += r.prediction.expected_value();
        if (r.prediction.edge > 0.0) positive.push_back(r);
    }
    st.avg_edge = edge_sum / st.resolved_count;
    st.avg_expected_value = ev_sum / st.resolved_count;
    st.positive_edge_count = static_cast<int>(positive.size());
    if (!positive.empty()) st.positive_edge_accuracy = summarize(positive).accuracy();
    st.message = "ok";
    return st;
}

}  // namespace accuracy_stats
