#pragma once

#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// ParlayResult — one settled parlay: what we predicted and whether it hit.
// ---------------------------------------------------------------------------
struct ParlayResult {
    int64_t id = 0;
    double raw_probability = 0.0;
    bool hit = false;
    int num_legs = 0;
    int64_t settled_at = 0;
};

struct CalibrationConfig {
    double bucket_width = 0.05;
    int min_samples = 20;
    double min_calibrated = 0.01;
    double max_calibrated = 0.99;
};

// ---------------------------------------------------------------------------
// CalibrationBucket — history summary for one raw-probability range
// ---------------------------------------------------------------------------
struct CalibrationBucket {
    double lower = 0.0;
    double upper = 0.0;
    int count = 0;
    double mean_raw = 0.0;
    double hit_rate = 0.0;
};

// ---------------------------------------------------------------------------
// ProbabilityCalibrationService
//
// calibrate(raw) shifts raw by (hit_rate - mean_raw) of its bucket, clamped.
// Buckets with fewer than min_samples results pass raw through unchanged.
// ---------------------------------------------------------------------------
class ProbabilityCalibrationService {
public:
    explicit ProbabilityCalibrationService(CalibrationConfig config = CalibrationConfig{})
        : config_(config) {
        if (!(config_.bucket_width > 0.0) || config_.bucket_width > 1.0) {
            throw ValidationError("Calibration bucket width must be in (0, 1]");
        }
        buckets_.resize(num_buckets());
        reset_bounds();
    }

    void fit(const std::vector<ParlayResult>& history) {
        std::vector<double> raw_sum(buckets_.size(), 0.0);
        std::vector<int> hits(buckets_.size(), 0);
        for (auto& b : buckets_) b.count = 0;

        for (const auto& r : history) {
            if (!std::isfinite(r.raw_probability)) continue;
            size_t i = bucket_index(r.raw_probability);
            buckets_[i].count += 1;
            raw_sum[i] += r.raw_probability;
            if (r.hit) hits[i] += 1;
        }
        for (size_t i = 0; i < buckets_.size(); ++i) {
            auto& b = buckets_[i];
            b.mean_raw = b.count > 0 ? raw_sum[i] / b.count : 0.0;
            b.hit_rate = b.count > 0 ? static_cast<double>(hits[i]) / b.count : 0.0;
        }
    }

    double calibrate(double raw) const {
        if (!std::isfinite(raw)) throw ValidationError("Cannot calibrate a non-finite probability");
        const auto& b = buckets_[bucket_index(raw)];
        if (b.count < config_.min_samples) return raw;
        return std::clamp(raw + (b.hit_rate - b.mean_raw),
                          config_.min_calibrated, config_.max_calibrated);
    }

    bool has_correction(double raw) const {
        return buckets_[bucket_index(raw)].count >= config_.min_samples;
    }

    const std::vector<CalibrationBucket>& buckets() const { return buckets_; }
    const CalibrationConfig& config() const { return config_; }

private:
    CalibrationConfig config_;
    std::vector<CalibrationBucket> buckets_;

    size_t num_buckets() const {
        return static_cast<size_t>(std::ceil(1.0 / config_.bucket_width - 1e-9));
    }

    void reset_bounds() {
        for (size_t i = 0; i < buckets_.size(); ++i) {
            buckets_[i].lower = static_cast<double>(i) * config_.bucket_width;
            buckets_[i].upper = std::min(1.0, buckets_[i].lower + config_.bucket_width);
        }
    }

    size_t bucket_index(double p) const {
        double clamped = std::clamp(p, 0.0, 1.0);
        auto i = static_cast<size_t>(clamped / config_.bucket_width);
        return std::min(i, buckets_.size() - 1);
    }
};
