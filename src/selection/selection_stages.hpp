#pragma once

#include "core/leg.hpp"
#include "selection/selection_config.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

// ---------------------------------------------------------------------------
// ScoredLeg — leg plus its selection score
// ---------------------------------------------------------------------------
struct ScoredLeg {
    Leg leg;
    double score = 0.0;
};

// ---------------------------------------------------------------------------
// StageResult — output of one pool-narrowing stage. A stage never throws when
// it runs short; it falls back and reports why in `reason`.
// ---------------------------------------------------------------------------
struct StageResult {
    enum class Reason {
        OK,
        DEDUP_BY_GAME_OUTCOME,  // strict dedup too small, merged by (game, outcome)
        DEDUP_EXACT_ONLY,       // only exact duplicates removed
        EDGE_FALLBACK,          // too few positive-edge legs, kept the unfiltered pool
        CONFIDENCE_RELAXED,     // threshold lowered to the relax factor
        CONFIDENCE_FALLBACK,    // still short, kept the whole pool
    };

    std::vector<Leg> pool;
    Reason reason = Reason::OK;
};

inline const char* stage_reason_name(StageResult::Reason r) {
    switch (r) {
        case StageResult::Reason::OK:                    return "ok";
        case StageResult::Reason::DEDUP_BY_GAME_OUTCOME: return "dedup_by_game_outcome";
        case StageResult::Reason::DEDUP_EXACT_ONLY:      return "dedup_exact_only";
        case StageResult::Reason::EDGE_FALLBACK:         return "edge_fallback";
        case StageResult::Reason::CONFIDENCE_RELAXED:    return "confidence_relaxed";
        case StageResult::Reason::CONFIDENCE_FALLBACK:   return "confidence_fallback";
    }
    return "ok";
}

namespace selection_stages {

namespace detail {

// Keep the highest-confidence leg per key, in first-seen order.
template <typename KeyFn>
std::vector<Leg> dedup_keep_best(const std::vector<Leg>& legs, KeyFn key_of) {
    std::map<std::string, size_t> index;
    std::vector<Leg> out;
    for (const auto& leg : legs) {
        std::string key = key_of(leg);
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, out.size());
            out.push_back(leg);
        } else if (leg.confidence_score > out[it->second].confidence_score) {
            out[it->second] = leg;
        }
    }
    return out;
}

}  // namespace detail

inline std::vector<Leg> dedup_strict(const std::vector<Leg>& legs) {
    return detail::dedup_keep_best(legs, [](const Leg& l) {
        return l.game_id + "|" + market_key(l.market_type) + "|" + l.outcome_key();
    });
}

inline std::vector<Leg> dedup_by_game_outcome(const std::vector<Leg>& legs) {
    return detail::dedup_keep_best(legs, [](const Leg& l) {
        return l.game_id + "|" + l.outcome_key();
    });
}

inline std::vector<Leg> dedup_exact(const std::vector<Leg>& legs) {
    std::set<std::tuple<std::string, int, std::string, int>> seen;
    std::vector<Leg> out;
    for (const auto& leg : legs) {
        auto key = std::make_tuple(leg.game_id, static_cast<int>(leg.market_type),
                                   leg.outcome_key(), leg.american_odds);
        if (seen.insert(key).second) out.push_back(leg);
    }
    return out;
}

// Strict dedup, widening only when it leaves fewer than num_legs.
inline StageResult deduplicate(const std::vector<Leg>& legs, int num_legs) {
    StageResult r;
    r.pool = dedup_strict(legs);
    if (static_cast<int>(r.pool.size()) >= num_legs) return r;

    r.pool = dedup_by_game_outcome(legs);
    r.reason = StageResult::Reason::DEDUP_BY_GAME_OUTCOME;
    if (static_cast<int>(r.pool.size()) >= num_legs) return r;

    r.pool = dedup_exact(legs);
    r.reason = StageResult::Reason::DEDUP_EXACT_ONLY;
    return r;
}

// Legs with edge >= min_edge, best edge first; unfiltered pool if too few.
inline StageResult filter_edge(const std::vector<Leg>& legs, int num_legs, double min_edge) {
    StageResult r;
    for (const auto& leg : legs) {
        if (leg.edge >= min_edge) r.pool.push_back(leg);
    }
    std::stable_sort(r.pool.begin(), r.pool.end(),
                     [](const Leg& a, const Leg& b) { return a.edge > b.edge; });
    if (static_cast<int>(r.pool.size()) < num_legs) {
        r.pool = legs;
        r.reason = StageResult::Reason::EDGE_FALLBACK;
    }
    return r;
}

inline StageResult filter_confidence(const std::vector<Leg>& legs, int num_legs,
                                     const SelectionConfig::ProfileThresholds& t,
                                     double relax_factor) {
    auto at_least = [&](double threshold) {
        std::vector<Leg> out;
        for (const auto& leg : legs) {
            if (leg.confidence_score >= threshold) out.push_back(leg);
        }
        return out;
    };

    StageResult r;
    r.pool = at_least(t.min_confidence);
    if (static_cast<int>(r.pool.size()) >= num_legs) return r;

    if (t.relax_confidence) {
        r.pool = at_least(t.min_confidence * relax_factor);
        r.reason = StageResult::Reason::CONFIDENCE_RELAXED;
        if (static_cast<int>(r.pool.size()) >= num_legs) return r;
    }

    r.pool = legs;
    r.reason = StageResult::Reason::CONFIDENCE_FALLBACK;
    return r;
}

inline double score_leg(const Leg& leg, const SelectionConfig& cfg) {
    double ev = leg.expected_value();
    double conf = std::clamp(leg.confidence_score / 100.0, 0.0, 1.0);
    return ev * (cfg.ev_base_weight + cfg.ev_confidence_weight * conf) +
           leg.edge * cfg.edge_weight + leg.market_move * cfg.movement_weight;
}

// Scored and ordered best-first (stable on ties).
inline std::vector<ScoredLeg> score_pool(const std::vector<Leg>& legs, const SelectionConfig& cfg) {
    std::vector<ScoredLeg> out;
    out.reserve(legs.size());
    for (const auto& leg : legs) out.push_back({leg, score_leg(leg, cfg)});
    std::stable_sort(out.begin(), out.end(),
                     [](const ScoredLeg& a, const ScoredLeg& b) { return a.score > b.score; });
    return out;
}

}  // namespace selection_stages
