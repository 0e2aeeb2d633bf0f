#pragma once

#include <cmath>
#include <cstdio>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace json_text {

// Escape a string for JSON output
inline std::string escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

inline std::string quote(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

// Finite numbers with up to 6 significant decimals; NaN/inf become null.
inline std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

inline std::string optional_number(const std::optional<double>& v) {
    return v ? number(*v) : "null";
}

// {"k":v,...} in key order.
inline std::string object(const std::map<std::string, double>& values) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& [k, v] : values) {
        if (!first) ss << ",";
        first = false;
        ss << quote(k) << ":" << number(v);
    }
    ss << "}";
    return ss.str();
}

}  // namespace json_text
