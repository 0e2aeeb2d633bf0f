#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "coverage/leg_flipper.hpp"
#include "parlay/ticket_analysis.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <functional>
#include <future>
#include <queue>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CoverageLimits — enumeration is 2^N, so N is hard-capped
// ---------------------------------------------------------------------------
struct CoverageLimits {
    int max_legs = 20;
    int offload_threshold = 16;   // N at or above this runs on a worker thread
    int max_scenario_tickets = 20;
    int max_round_robin_tickets = 20;
    int max_total_tickets = 20;
    int min_round_robin_size = 2;
};

struct CoverageTicket {
    std::vector<Leg> legs;
    int num_upsets = 0;           // flipped legs
    double probability = 0.0;     // joint model probability used for ranking
    TicketAnalysis analysis;
};

struct CoveragePack {
    int num_legs = 0;
    uint64_t total_scenarios = 0;
    std::vector<uint64_t> by_upset_count;   // index k = C(N, k)
    std::vector<CoverageTicket> scenario_tickets;
    std::vector<CoverageTicket> round_robin_tickets;
};

// ---------------------------------------------------------------------------
// CoverageBuilder
//
// Scenario tickets: every flip mask over N legs, top-K by joint probability.
// Round-robin tickets: every size-r subset of the original legs, top-K.
// Both use a bounded min-heap of size K, so the full space is never sorted.
// ---------------------------------------------------------------------------
class CoverageBuilder {
public:
    static constexpr double PROB_FLOOR = 1e-6;
    static constexpr double PROB_CEIL = 1.0 - 1e-6;

    struct ScoredMask {
        double probability = 0.0;
        uint32_t mask = 0;
    };

    struct ScoredCombo {
        double probability = 0.0;
        std::vector<int> indices;
    };

    explicit CoverageBuilder(CoverageLimits limits = CoverageLimits{})
        : limits_(limits) {}

    CoveragePack build_coverage_pack(const std::vector<Leg>& legs, int scenario_max,
                                     int round_robin_size, int round_robin_max,
                                     int max_total) const {
        validate(legs, scenario_max, round_robin_size, round_robin_max, max_total);
        const int n = static_cast<int>(legs.size());

        CoveragePack pack;
        pack.num_legs = n;
        pack.total_scenarios = uint64_t{1} << n;
        for (int k = 0; k <= n; ++k) pack.by_upset_count.push_back(binomial(n, k));

        std::vector<Leg> flipped = LegFlipper::flip_all(legs);
        std::vector<double> p_orig = clamped_probabilities(legs);
        std::vector<double> p_flip = clamped_probabilities(flipped);

        int scenario_k = std::min(scenario_max, max_total);
        for (const auto& sm : top_k_scenarios(p_orig, p_flip, scenario_k)) {
            CoverageTicket t;
            for (int i = 0; i < n; ++i) {
                t.legs.push_back((sm.mask >> i) & 1u ? flipped[i] : legs[i]);
            }
            t.num_upsets = std::popcount(sm.mask);
            t.probability = sm.probability;
            t.analysis = ticket_analysis::analyze(t.legs);
            pack.scenario_tickets.push_back(std::move(t));
        }

        int rr_k = std::min(round_robin_max,
                            max_total - static_cast<int>(pack.scenario_tickets.size()));
        for (const auto& sc : top_k_round_robins(p_orig, round_robin_size, rr_k)) {
            CoverageTicket t;
            for (int idx : sc.indices) t.legs.push_back(legs[idx]);
            t.probability = sc.probability;
            t.analysis = ticket_analysis::analyze(t.legs);
            pack.round_robin_tickets.push_back(std::move(t));
        }
        return pack;
    }

    // Runs on a worker thread when N reaches the offload threshold; smaller
    // requests are deferred and evaluated by the caller on get().
    std::future<CoveragePack> build_coverage_pack_async(std::vector<Leg> legs, int scenario_max,
                                                        int round_robin_size, int round_robin_max,
                                                        int max_total) const {
        auto policy = should_offload(legs.size()) ? std::launch::async : std::launch::deferred;
        CoverageBuilder self = *this;
        return std::async(policy, [self, legs = std::move(legs), scenario_max, round_robin_size,
                                   round_robin_max, max_total]() {
            return self.build_coverage_pack(legs, scenario_max, round_robin_size,
                                            round_robin_max, max_total);
        });
    }

    bool should_offload(size_t num_legs) const {
        return static_cast<int>(num_legs) >= limits_.offload_threshold;
    }

    static std::vector<ScoredMask> top_k_scenarios(const std::vector<double>& p_orig,
                                                   const std::vector<double>& p_flip, int k) {
        const int n = static_cast<int>(p_orig.size());
        if (k <= 0 || n == 0) return {};

        using Entry = std::pair<double, uint32_t>;
        std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;
        const uint32_t end = uint32_t{1} << n;
        for (uint32_t mask = 0; mask < end; ++mask) {
            double prob = 1.0;
            for (int i = 0; i < n; ++i) {
                prob *= ((mask >> i) & 1u) ? p_flip[i] : p_orig[i];
            }
            if (static_cast<int>(heap.size()) < k) {
                heap.emplace(prob, mask);
            } else if (prob > heap.top().first) {
                heap.pop();
                heap.emplace(prob, mask);
            }
        }

        std::vector<ScoredMask> out;
        out.reserve(heap.size());
        while (!heap.empty()) {
            out.push_back({heap.top().first, heap.top().second});
            heap.pop();
        }
        std::sort(out.begin(), out.end(), [](const ScoredMask& a, const ScoredMask& b) {
            if (a.probability != b.probability) return a.probability > b.probability;
            return a.mask < b.mask;
        });
        return out;
    }

    static std::vector<ScoredCombo> top_k_round_robins(const std::vector<double>& p,
                                                       int size, int k) {
        const int n = static_cast<int>(p.size());
        if (k <= 0 || size < 2 || size > n) return {};

        auto worse = [](const ScoredCombo& a, const ScoredCombo& b) {
            if (a.probability != b.probability) return a.probability > b.probability;
            return a.indices < b.indices;
        };
        // Min-heap on probability: top() is the weakest retained combo.
        std::priority_queue<ScoredCombo, std::vector<ScoredCombo>, decltype(worse)> heap(worse);

        std::vector<int> idx(size);
        for (int i = 0; i < size; ++i) idx[i] = i;
        while (true) {
            double prob = 1.0;
            for (int i : idx) prob *= p[i];
            if (static_cast<int>(heap.size()) < k) {
                heap.push({prob, idx});
            } else if (prob > heap.top().probability) {
                heap.pop();
                heap.push({prob, idx});
            }

            // Advance to the next combination in lexicographic order.
            int pos = size - 1;
            while (pos >= 0 && idx[pos] == n - size + pos) --pos;
            if (pos < 0) break;
            ++idx[pos];
            for (int j = pos + 1; j < size; ++j) idx[j] = idx[j - 1] + 1;
        }

        std::vector<ScoredCombo> out;
        out.reserve(heap.size());
        while (!heap.empty()) {
            out.push_back(heap.top());
            heap.pop();
        }
        std::sort(out.begin(), out.end(), [](const ScoredCombo& a, const ScoredCombo& b) {
            if (a.probability != b.probability) return a.probability > b.probability;
            return a.indices < b.indices;
        });
        return out;
    }

    static uint64_t binomial(int n, int k) {
        if (k < 0 || k > n) return 0;
        k = std::min(k, n - k);
        uint64_t c = 1;
        for (int i = 1; i <= k; ++i) {
            c = c * static_cast<uint64_t>(n - k + i) / static_cast<uint64_t>(i);
        }
        return c;
    }

    const CoverageLimits& limits() const { return limits_; }

private:
    CoverageLimits limits_;

    void validate(const std::vector<Leg>& legs, int scenario_max, int round_robin_size,
                  int round_robin_max, int max_total) const {
        if (legs.empty()) throw ValidationError("Coverage pack needs at least one leg");
        if (static_cast<int>(legs.size()) > limits_.max_legs) {
            throw ValidationError("Coverage pack supports at most " +
                                  std::to_string(limits_.max_legs) + " legs, got " +
                                  std::to_string(legs.size()));
        }
        if (scenario_max < 0 || round_robin_max < 0 || max_total < 0) {
            throw ValidationError("Ticket limits must be non-negative");
        }
        check_cap("scenario_max", scenario_max, limits_.max_scenario_tickets);
        check_cap("round_robin_max", round_robin_max, limits_.max_round_robin_tickets);
        check_cap("max_total", max_total, limits_.max_total_tickets);
        if (round_robin_size < limits_.min_round_robin_size || round_robin_size > limits_.max_legs) {
            throw ValidationError("round_robin_size must be between " +
                                  std::to_string(limits_.min_round_robin_size) + " and " +
                                  std::to_string(limits_.max_legs) + ", got " +
                                  std::to_string(round_robin_size));
        }
    }

    static void check_cap(const char* name, int value, int cap) {
        if (value > cap) {
            throw ValidationError(std::string(name) + " must be at most " + std::to_string(cap) +
                                  ", got " + std::to_string(value));
        }
    }

    static std::vector<double> clamped_probabilities(const std::vector<Leg>& legs) {
        std::vector<double> p;
        p.reserve(legs.size());
        for (const auto& leg : legs) p.push_back(std::clamp(leg.model_probability, PROB_FLOOR, PROB_CEIL));
        return p;
    }
};
