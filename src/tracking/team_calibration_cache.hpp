#pragma once

#include "core/errors.hpp"
#include "time_utils.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// TeamCalibrationCache — process-wide {sport -> {team -> bias_adjustment}}
//
// Readers load an immutable snapshot without locking. A stale or missing
// sport is reloaded under the refresh mutex (one writer at a time) and
// published as a new snapshot. invalidate() drops every sport.
// ---------------------------------------------------------------------------
class TeamCalibrationCache {
public:
    using Adjustments = std::map<std::string, double>;
    using Loader = std::function<Adjustments(const std::string& sport)>;
    using Clock = std::function<int64_t()>;

    struct Entry {
        Adjustments adjustments;
        int64_t loaded_at = 0;
    };

    struct Snapshot {
        std::map<std::string, Entry> by_sport;
    };

    TeamCalibrationCache(Loader loader, int64_t ttl_seconds, Clock clock = time_utils::now_seconds)
        : loader_(std::move(loader)), ttl_seconds_(ttl_seconds), clock_(std::move(clock)),
          snapshot_(std::make_shared<const Snapshot>()) {
        if (!loader_) throw ValidationError("TeamCalibrationCache needs a loader");
        if (ttl_seconds_ <= 0) throw ValidationError("TeamCalibrationCache TTL must be positive");
    }

    Adjustments get(const std::string& sport) {
        auto snap = snapshot_.load();
        if (const Entry* e = fresh_entry(snap, sport)) return e->adjustments;

        std::lock_guard<std::mutex> lock(refresh_mutex_);
        auto current = snapshot_.load();
        if (const Entry* e = fresh_entry(current, sport)) return e->adjustments;

        Entry entry{loader_(sport), clock_()};
        auto next = std::make_shared<Snapshot>(*current);
        next->by_sport[sport] = entry;
        snapshot_.store(std::shared_ptr<const Snapshot>(std::move(next)));
        loads_.fetch_add(1, std::memory_order_relaxed);
        return entry.adjustments;
    }

    void invalidate() {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        snapshot_.store(std::make_shared<const Snapshot>());
    }

    // Time of the last refresh for a sport, 0 if not cached.
    int64_t last_refresh(const std::string& sport) const {
        auto snap = snapshot_.load();
        auto it = snap->by_sport.find(sport);
        return it == snap->by_sport.end() ? 0 : it->second.loaded_at;
    }

    uint64_t loads() const { return loads_.load(std::memory_order_relaxed); }
    int64_t ttl_seconds() const { return ttl_seconds_; }

private:
    Loader loader_;
    int64_t ttl_seconds_;
    Clock clock_;
    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
    std::mutex refresh_mutex_;
    std::atomic<uint64_t> loads_{0};

    const Entry* fresh_entry(const std::shared_ptr<const Snapshot>& snap, const std::string& sport) const {
        auto it = snap->by_sport.find(sport);
        if (it == snap->by_sport.end()) return nullptr;
        if (clock_() - it->second.loaded_at >= ttl_seconds_) return nullptr;
        return &it->second;
    }
};
