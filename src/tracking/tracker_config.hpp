#pragma once

#include <cstdint>

struct TrackerConfig {
    int min_resolved_for_stats = 30;
    int default_lookback_days = 30;
    int team_lookback_games = 50;
    int min_team_games = 10;
    double max_bias_adjustment = 0.05;
    int recalibration_days = 7;          // also the calibration cache TTL
    double default_total_line = 45.0;
};
