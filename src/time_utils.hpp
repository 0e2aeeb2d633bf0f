#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC epoch-second timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t SEC_PER_MIN  = 60;
constexpr int64_t SEC_PER_HOUR = 3600;
constexpr int64_t SEC_PER_DAY  = 24 * SEC_PER_HOUR;

inline int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Floor to 00:00:00 UTC of the same day (handles pre-epoch values).
inline int64_t midnight_utc(int64_t ts) {
    int64_t day = ts / SEC_PER_DAY;
    if (ts < 0 && ts % SEC_PER_DAY != 0) day -= 1;
    return day * SEC_PER_DAY;
}

// Days since epoch -> civil date (Howard Hinnant's algorithm).
inline void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

// "YYYY-MM-DD" for the UTC calendar day containing ts.
inline std::string calendar_day(int64_t ts) {
    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(midnight_utc(ts) / SEC_PER_DAY, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

// "YYYY-MM-DDTHH:MM:SSZ"
inline std::string iso8601(int64_t ts) {
    int64_t midnight = midnight_utc(ts);
    int64_t secs = ts - midnight;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02dZ",
                  calendar_day(ts).c_str(),
                  static_cast<int>(secs / SEC_PER_HOUR),
                  static_cast<int>((secs % SEC_PER_HOUR) / SEC_PER_MIN),
                  static_cast<int>(secs % SEC_PER_MIN));
    return buf;
}

}  // namespace time_utils
