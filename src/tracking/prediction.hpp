#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "io/json_text.hpp"
#include "time_utils.hpp"

#include <openssl/evp.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// ResolutionStatus — unresolved -> {win, loss, push}; terminal once resolved
// ---------------------------------------------------------------------------
enum class ResolutionStatus { UNRESOLVED, WIN, LOSS, PUSH };

inline const char* resolution_status_name(ResolutionStatus s) {
    switch (s) {
        case ResolutionStatus::UNRESOLVED: return "unresolved";
        case ResolutionStatus::WIN:        return "win";
        case ResolutionStatus::LOSS:       return "loss";
        case ResolutionStatus::PUSH:       return "push";
    }
    return "unresolved";
}

inline ResolutionStatus parse_resolution_status(const std::string& s) {
    if (s == "win") return ResolutionStatus::WIN;
    if (s == "loss") return ResolutionStatus::LOSS;
    if (s == "push") return ResolutionStatus::PUSH;
    if (s == "unresolved") return ResolutionStatus::UNRESOLVED;
    throw StorageError("Unknown resolution status '" + s + "'");
}

// ---------------------------------------------------------------------------
// PredictionInput — what the caller records at generation time
// ---------------------------------------------------------------------------
struct PredictionInput {
    std::string sport;
    std::string event_id;
    MarketType market_type = MarketType::MONEYLINE;
    std::string side;                       // home/away, over/under
    std::string model_version = "v1";
    double predicted_prob = 0.5;
    double implied_prob = 0.5;
    double confidence = 50.0;
    std::string home_team;
    std::string away_team;
    std::optional<double> point;            // spread line for the side
    std::optional<double> total_line;       // totals line
    std::map<std::string, double> features;
    int64_t created_at = 0;                 // epoch seconds; 0 = now
};

struct Prediction {
    int64_t id = 0;
    std::string idempotency_key;
    std::string sport;
    std::string event_id;
    MarketType market_type = MarketType::MONEYLINE;
    std::string side;
    std::string model_version;
    double predicted_prob = 0.0;
    double implied_prob = 0.0;
    double edge = 0.0;
    double confidence = 0.0;
    std::string home_team;
    std::string away_team;
    std::optional<double> point;
    std::optional<double> total_line;
    std::string feature_snapshot;           // JSON object text
    ResolutionStatus status = ResolutionStatus::UNRESOLVED;
    int64_t created_at = 0;
    std::optional<int64_t> resolved_at;

    bool resolved() const { return status != ResolutionStatus::UNRESOLVED; }

    // Expected value per unit at fair odds implied by the market.
    double expected_value() const {
        if (implied_prob <= 0.0) return 0.0;
        return predicted_prob / implied_prob - 1.0;
    }
};

struct PredictionOutcome {
    int64_t prediction_id = 0;
    bool was_correct = false;
    bool is_push = false;
    double actual_value = 0.0;              // 1 win, 0 loss, 0.5 push
    double error_magnitude = 0.0;           // |p - actual|
    double signed_error = 0.0;              // p - actual
    std::optional<int> home_score;
    std::optional<int> away_score;
    int64_t resolved_at = 0;
};

struct ResolvedPrediction {
    Prediction prediction;
    PredictionOutcome outcome;
};

// ---------------------------------------------------------------------------
// TeamCalibration — per (team, sport) bias correction
// ---------------------------------------------------------------------------
struct TeamCalibration {
    std::string team;
    std::string sport;
    double bias_adjustment = 0.0;           // clamped to [-0.05, 0.05]
    double avg_signed_error = 0.0;
    int sample_size = 0;
    double accuracy = 0.0;
    double brier_score = 0.0;
    int64_t updated_at = 0;
};

// Sports are stored and queried as trimmed upper case ("nfl " -> "NFL").
inline std::string normalize_sport(const std::string& sport) {
    return text::to_upper(text::trim(sport));
}

namespace prediction_keys {

inline std::string natural_key(const PredictionInput& in) {
    int64_t ts = in.created_at != 0 ? in.created_at : time_utils::now_seconds();
    return text::to_lower(normalize_sport(in.sport)) + "|" + in.event_id + "|" +
           market_key(in.market_type) + "|" +
           text::to_lower(in.side) + "|" + in.model_version + "|" + time_utils::calendar_day(ts);
}

inline std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw ComputationError("SHA-256 digest failed");
    }
    std::string hex;
    hex.reserve(len * 2);
    char buf[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

// Same logical prediction on the same UTC day -> same key.
inline std::string idempotency_key(const PredictionInput& in) {
    return sha256_hex(natural_key(in));
}

}  // namespace prediction_keys

// Validates the input and builds the row to insert (id 0, unresolved).
inline Prediction make_prediction(const PredictionInput& in) {
    if (normalize_sport(in.sport).empty()) throw ValidationError("Prediction needs a sport");
    if (in.event_id.empty()) throw ValidationError("Prediction needs an event id");
    if (in.side.empty()) throw ValidationError("Prediction needs a side");
    auto check = [](double p, const char* name) {
        if (!std::isfinite(p) || p <= 0.0 || p >= 1.0) {
            throw ValidationError(std::string(name) + " must be in (0, 1)");
        }
    };
    check(in.predicted_prob, "predicted_prob");
    check(in.implied_prob, "implied_prob");

    PredictionInput stamped = in;
    if (stamped.created_at == 0) stamped.created_at = time_utils::now_seconds();

    Prediction p;
    p.idempotency_key = prediction_keys::idempotency_key(stamped);
    p.sport = normalize_sport(in.sport);
    p.event_id = in.event_id;
    p.market_type = in.market_type;
    p.side = text::to_lower(in.side);
    p.model_version = in.model_version;
    p.predicted_prob = in.predicted_prob;
    p.implied_prob = in.implied_prob;
    p.edge = in.predicted_prob - in.implied_prob;
    p.confidence = in.confidence;
    p.home_team = in.home_team;
    p.away_team = in.away_team;
    p.point = in.point;
    p.total_line = in.total_line;
    p.feature_snapshot = json_text::object(in.features);
    p.created_at = stamped.created_at;
    return p;
}

// Convenience: a prediction row from a selected leg.
inline PredictionInput prediction_from_leg(const Leg& leg, const std::string& model_version) {
    PredictionInput in;
    in.sport = leg.sport;
    in.event_id = leg.game_id;
    in.market_type = leg.market_type;
    in.side = leg.outcome_key();
    in.model_version = model_version;
    in.predicted_prob = leg.model_probability;
    in.implied_prob = leg.implied_probability;
    in.confidence = leg.confidence_score;
    in.home_team = leg.home_team;
    in.away_team = leg.away_team;
    if (leg.market_type == MarketType::TOTAL) in.total_line = leg.point;
    else in.point = leg.point;
    in.features["edge"] = leg.edge;
    in.features["decimal_odds"] = leg.decimal_odds;
    in.features["market_move"] = leg.market_move;
    if (in.total_line) in.features["total_line"] = *in.total_line;
    return in;
}
