#pragma once

#include "core/candidate_record.hpp"
#include "core/errors.hpp"
#include "core/leg.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Candidate CSV — one leg per row, columns located by header name.
//
// Required: game_id, market_type, outcome. Everything else is optional and
// left unset when the column is absent or the cell is empty; to_leg()
// decides whether the record is usable.
// ---------------------------------------------------------------------------
namespace candidate_csv {

inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r') {
            cell += c;
        }
    }
    cells.push_back(cell);
    return cells;
}

// Quotes a cell for writing when it holds a comma, quote or line break;
// split_line() reads it back unchanged.
inline std::string quote_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

namespace detail {

inline std::optional<double> to_double(const std::string& raw, const std::string& column, int line_no) {
    std::string s = text::trim(raw);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') {
        throw ValidationError("Line " + std::to_string(line_no) + ": column '" + column +
                              "' is not a number: '" + s + "'");
    }
    return v;
}

inline std::optional<std::string> to_text(const std::string& raw) {
    std::string s = text::trim(raw);
    if (s.empty()) return std::nullopt;
    return s;
}

}  // namespace detail

// Rows that cannot be parsed are skipped and logged.
inline std::vector<CandidateRecord> parse(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) throw ValidationError("Candidate CSV is empty");

    std::map<std::string, size_t> col;
    auto header = split_line(line);
    for (size_t i = 0; i < header.size(); ++i) col[text::to_lower(text::trim(header[i]))] = i;
    for (const char* required : {"game_id", "market_type", "outcome"}) {
        if (!col.count(required)) {
            throw ValidationError(std::string("Candidate CSV is missing column '") + required + "'");
        }
    }

    std::vector<CandidateRecord> records;
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (text::trim(line).empty()) continue;
        auto cells = split_line(line);
        auto cell = [&](const char* name) -> std::string {
            auto it = col.find(name);
            if (it == col.end() || it->second >= cells.size()) return "";
            return cells[it->second];
        };
        try {
            CandidateRecord r;
            r.game_id = text::trim(cell("game_id"));
            r.sport = text::trim(cell("sport"));
            r.market_type = text::trim(cell("market_type"));
            r.outcome = text::trim(cell("outcome"));
            r.home_team = text::trim(cell("home_team"));
            r.away_team = text::trim(cell("away_team"));
            r.point = detail::to_double(cell("point"), "point", line_no);
            r.odds = detail::to_text(cell("odds"));
            r.decimal_odds = detail::to_double(cell("decimal_odds"), "decimal_odds", line_no);
            r.implied_prob = detail::to_double(cell("implied_prob"), "implied_prob", line_no);
            r.model_prob = detail::to_double(cell("model_prob"), "model_prob", line_no);
            r.confidence_score = detail::to_double(cell("confidence_score"), "confidence_score", line_no);
            r.market_move = detail::to_double(cell("market_move"), "market_move", line_no);
            r.opposite_odds = detail::to_text(cell("opposite_odds"));
            r.opposite_model_prob = detail::to_double(cell("opposite_model_prob"), "opposite_model_prob", line_no);
            if (auto week = detail::to_double(cell("week"), "week", line_no)) {
                r.week = static_cast<int>(std::lround(*week));
            }
            records.push_back(r);
        } catch (const ValidationError& e) {
            std::cerr << "[CandidateCsv] skipped line " << line_no << ": " << e.what() << "\n";
        }
    }
    return records;
}

inline std::vector<CandidateRecord> load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Cannot open candidate file: " + path);
    return parse(file);
}

}  // namespace candidate_csv
