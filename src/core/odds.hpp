#pragma once

#include "core/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

// ---------------------------------------------------------------------------
// American / decimal / implied-probability conversions
// ---------------------------------------------------------------------------
namespace odds {

// Largest magnitude accepted for American odds (a 10000:1 price).
constexpr long MAX_AMERICAN = 1'000'000;

inline void require_valid_american(long american) {
    if (american > -100 && american < 100) {
        throw ValidationError("Invalid American odds " + std::to_string(american) +
                              " (must be <= -100 or >= +100)");
    }
    if (american > MAX_AMERICAN || american < -MAX_AMERICAN) {
        throw ValidationError("American odds " + std::to_string(american) + " out of range (|odds| <= " +
                              std::to_string(MAX_AMERICAN) + ")");
    }
}

inline double american_to_decimal(int american) {
    require_valid_american(american);
    if (american > 0) return 1.0 + static_cast<double>(american) / 100.0;
    return 1.0 + 100.0 / static_cast<double>(-american);
}

inline double implied_from_american(int american) {
    require_valid_american(american);
    if (american > 0) return 100.0 / (static_cast<double>(american) + 100.0);
    double a = static_cast<double>(-american);
    return a / (a + 100.0);
}

inline int decimal_to_american(double decimal) {
    if (!(decimal > 1.0) || !std::isfinite(decimal)) {
        throw ValidationError("Invalid decimal odds " + std::to_string(decimal));
    }
    double american = decimal >= 2.0 ? (decimal - 1.0) * 100.0 : -100.0 / (decimal - 1.0);
    if (std::fabs(american) > static_cast<double>(MAX_AMERICAN)) {
        throw ValidationError("Decimal odds " + std::to_string(decimal) + " out of range");
    }
    long rounded = std::lround(american);
    if (decimal < 2.0 && rounded > -100) rounded = -100;
    return static_cast<int>(rounded);
}

// Profit per 100 staked.
inline double payout_per_100(int american) {
    if (american > 0) return static_cast<double>(american);
    return 100.0 / std::abs(static_cast<double>(american)) * 100.0;
}

inline std::string format_american(int american) {
    if (american > 0) return "+" + std::to_string(american);
    return std::to_string(american);
}

// Accepts "+180", "-110", "180", "EVEN".
inline int parse_american(const std::string& text) {
    if (text == "EVEN" || text == "even" || text == "EV") return 100;
    if (text.empty()) throw ValidationError("Empty American odds");
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        throw ValidationError("Unparseable American odds '" + text + "'");
    }
    require_valid_american(v);
    return static_cast<int>(v);
}

}  // namespace odds
