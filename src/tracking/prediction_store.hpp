#pragma once

#include "core/leg.hpp"
#include "probability/probability_calibration.hpp"
#include "tracking/prediction.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Filter for resolved-prediction reads. Unset fields do not filter.
struct PredictionQuery {
    std::optional<std::string> sport;
    std::optional<MarketType> market_type;
    std::optional<int64_t> since;           // created_at >= since
};

// ---------------------------------------------------------------------------
// PredictionStore — persistence boundary for the tracker
//
// insert_or_fetch is idempotent on idempotency_key. mark_resolved writes the
// status and the outcome row together and returns false when the prediction
// was already resolved.
// ---------------------------------------------------------------------------
class PredictionStore {
public:
    virtual ~PredictionStore() = default;

    virtual Prediction insert_or_fetch(const Prediction& row) = 0;
    virtual std::optional<Prediction> find_by_key(const std::string& key) = 0;
    virtual std::vector<Prediction> unresolved_for_event(const std::string& event_id) = 0;
    virtual bool mark_resolved(const Prediction& prediction, ResolutionStatus status,
                               const PredictionOutcome& outcome) = 0;

    virtual std::vector<ResolvedPrediction> resolved(const PredictionQuery& query) = 0;
    // Newest first, at most `limit` rows where the team is home or away.
    virtual std::vector<ResolvedPrediction> resolved_for_team(const std::string& team,
                                                              const std::string& sport,
                                                              int limit) = 0;
    virtual std::vector<std::string> teams_with_resolved(const std::string& sport) = 0;

    virtual void upsert_team_calibration(const TeamCalibration& row) = 0;
    virtual std::vector<TeamCalibration> team_calibrations(const std::string& sport) = 0;

    virtual int64_t record_parlay_result(const ParlayResult& row) = 0;
    virtual std::vector<ParlayResult> parlay_results() = 0;

    virtual size_t prediction_count() = 0;
};
