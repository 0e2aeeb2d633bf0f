#pragma once

#include "core/candidate_record.hpp"
#include "core/leg.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

struct CandidateQuery {
    std::string sport;
    double min_confidence = 0.0;
    int max_legs = 500;
    std::optional<int> week;
    bool include_player_props = false;
};

// What the feed knows about a sport's slate, used to explain an empty pool.
struct SlateStatus {
    int games_scheduled = 0;
    int games_with_odds = 0;
};

// ---------------------------------------------------------------------------
// CandidatePool — source of candidate legs, fetched fresh per request
// ---------------------------------------------------------------------------
class CandidatePool {
public:
    virtual ~CandidatePool() = default;

    virtual std::vector<CandidateRecord> get_candidate_legs(const CandidateQuery& query) = 0;
    virtual SlateStatus slate_status(const std::string& sport) = 0;
};

// ---------------------------------------------------------------------------
// StaticCandidatePool — pool over a fixed record set (CSV file, fixtures)
// ---------------------------------------------------------------------------
class StaticCandidatePool : public CandidatePool {
public:
    StaticCandidatePool() = default;
    explicit StaticCandidatePool(std::vector<CandidateRecord> records)
        : records_(std::move(records)) {}

    void add(const CandidateRecord& record) { records_.push_back(record); }

    // Games known to be on the slate whether or not they have odds yet.
    void schedule_game(const std::string& sport, const std::string& game_id) {
        schedule_[upper(sport)].insert(game_id);
    }

    std::vector<CandidateRecord> get_candidate_legs(const CandidateQuery& query) override {
        std::string sport = upper(query.sport);
        std::vector<CandidateRecord> out;
        for (const auto& r : records_) {
            if (upper(r.sport) != sport) continue;
            if (!query.include_player_props && is_prop_market(r.market_type)) continue;
            if (query.week && r.week && *r.week != *query.week) continue;
            if (r.confidence_score && *r.confidence_score < query.min_confidence) continue;
            out.push_back(r);
        }
        // Most confident first, then capped.
        std::stable_sort(out.begin(), out.end(), [](const CandidateRecord& a, const CandidateRecord& b) {
            return a.confidence_score.value_or(0.0) > b.confidence_score.value_or(0.0);
        });
        if (query.max_legs >= 0 && static_cast<int>(out.size()) > query.max_legs) {
            out.resize(static_cast<size_t>(query.max_legs));
        }
        return out;
    }

    SlateStatus slate_status(const std::string& sport) override {
        std::string key = upper(sport);
        std::set<std::string> scheduled;
        std::set<std::string> priced;
        auto it = schedule_.find(key);
        if (it != schedule_.end()) scheduled = it->second;
        for (const auto& r : records_) {
            if (upper(r.sport) != key) continue;
            scheduled.insert(r.game_id);
            if (r.odds || r.decimal_odds) priced.insert(r.game_id);
        }
        return SlateStatus{static_cast<int>(scheduled.size()), static_cast<int>(priced.size())};
    }

    const std::vector<CandidateRecord>& records() const { return records_; }

private:
    std::vector<CandidateRecord> records_;
    std::map<std::string, std::set<std::string>> schedule_;

    static std::string upper(const std::string& s) { return text::to_upper(text::trim(s)); }

    static bool is_prop_market(const std::string& market) {
        return text::to_lower(market).rfind("player_", 0) == 0;
    }
};
