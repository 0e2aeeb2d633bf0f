#pragma once

#include "core/errors.hpp"
#include "tracking/prediction_store.hpp"

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct StoreConfig {
    std::string path = "predictions.db";    // ":memory:" for a private in-memory database
    int busy_retries = 5;
    int initial_backoff_ms = 10;
    double backoff_factor = 2.0;
};

namespace sqlite_detail {

inline bool is_busy(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

inline void check(sqlite3* db, int rc, const std::string& what) {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (is_busy(rc)) throw TransientStorageError(msg);
    throw StorageError(msg);
}

inline void exec(sqlite3* db, const char* sql, const std::string& what) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = what + ": " + (err ? err : sqlite3_errstr(rc));
        sqlite3_free(err);
        if (is_busy(rc)) throw TransientStorageError(msg);
        throw StorageError(msg);
    }
}

struct ConnectionCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

// ---------------------------------------------------------------------------
// Statement — prepared statement, finalized on destruction
// ---------------------------------------------------------------------------
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        check(db_, sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), "prepare");
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int i, const std::string& v) {
        check(db_, sqlite3_bind_text(stmt_, i, v.c_str(), -1, SQLITE_TRANSIENT), "bind");
    }
    void bind_real(int i, double v) { check(db_, sqlite3_bind_double(stmt_, i, v), "bind"); }
    void bind_int(int i, int64_t v) { check(db_, sqlite3_bind_int64(stmt_, i, v), "bind"); }
    void bind_opt_real(int i, const std::optional<double>& v) {
        if (v) bind_real(i, *v);
        else check(db_, sqlite3_bind_null(stmt_, i), "bind");
    }
    void bind_opt_int(int i, const std::optional<int64_t>& v) {
        if (v) bind_int(i, *v);
        else check(db_, sqlite3_bind_null(stmt_, i), "bind");
    }

    // true while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        check(db_, rc, "step");
        return false;
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    std::optional<double> opt_real(int col) const {
        if (is_null(col)) return std::nullopt;
        return real(col);
    }
    std::optional<int64_t> opt_int(int col) const {
        if (is_null(col)) return std::nullopt;
        return int64(col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE", "begin"); }
    ~Transaction() {
        if (committed_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[SqlitePredictionStore] rollback failed: " << (err ? err : "unknown") << "\n";
        }
        sqlite3_free(err);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT", "commit");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

constexpr const char* SCHEMA = R"(
CREATE TABLE IF NOT EXISTS predictions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    idempotency_key TEXT NOT NULL UNIQUE,
    sport TEXT NOT NULL,
    event_id TEXT NOT NULL,
    market_type TEXT NOT NULL,
    side TEXT NOT NULL,
    model_version TEXT NOT NULL,
    predicted_prob REAL NOT NULL,
    implied_prob REAL NOT NULL,
    edge REAL NOT NULL,
    confidence REAL NOT NULL,
    home_team TEXT NOT NULL DEFAULT '',
    away_team TEXT NOT NULL DEFAULT '',
    point REAL,
    total_line REAL,
    feature_snapshot TEXT NOT NULL DEFAULT '{}',
    status TEXT NOT NULL DEFAULT 'unresolved',
    created_at INTEGER NOT NULL,
    resolved_at INTEGER
);
CREATE INDEX IF NOT EXISTS idx_predictions_event ON predictions(event_id, status);
CREATE INDEX IF NOT EXISTS idx_predictions_sport_created ON predictions(sport, created_at);
CREATE TABLE IF NOT EXISTS prediction_outcomes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    prediction_id INTEGER NOT NULL UNIQUE REFERENCES predictions(id),
    was_correct INTEGER NOT NULL,
    is_push INTEGER NOT NULL,
    actual_value REAL NOT NULL,
    error_magnitude REAL NOT NULL,
    signed_error REAL NOT NULL,
    home_score INTEGER,
    away_score INTEGER,
    resolved_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS team_calibrations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    team TEXT NOT NULL,
    sport TEXT NOT NULL,
    bias_adjustment REAL NOT NULL,
    avg_signed_error REAL NOT NULL,
    sample_size INTEGER NOT NULL,
    accuracy REAL NOT NULL,
    brier_score REAL NOT NULL,
    updated_at INTEGER NOT NULL,
    UNIQUE(team, sport)
);
CREATE TABLE IF NOT EXISTS parlay_results (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    raw_probability REAL NOT NULL,
    hit INTEGER NOT NULL,
    num_legs INTEGER NOT NULL,
    settled_at INTEGER NOT NULL
);
)";

// Column lists shared by every prediction read; indices below follow them.
constexpr const char* PREDICTION_COLUMNS =
    "p.id, p.idempotency_key, p.sport, p.event_id, p.market_type, p.side, p.model_version, "
    "p.predicted_prob, p.implied_prob, p.edge, p.confidence, p.home_team, p.away_team, "
    "p.point, p.total_line, p.feature_snapshot, p.status, p.created_at, p.resolved_at";
constexpr int OUTCOME_FIRST_COL = 19;
constexpr const char* OUTCOME_COLUMNS =
    "o.was_correct, o.is_push, o.actual_value, o.error_magnitude, o.signed_error, "
    "o.home_score, o.away_score, o.resolved_at";

inline Prediction read_prediction(const Statement& s) {
    Prediction p;
    p.id = s.int64(0);
    p.idempotency_key = s.text(1);
    p.sport = s.text(2);
    p.event_id = s.text(3);
    auto market = parse_market_type(s.text(4));
    if (!market) throw StorageError("Stored prediction " + std::to_string(p.id) + " has unknown market '" +
                                    s.text(4) + "'");
    p.market_type = *market;
    p.side = s.text(5);
    p.model_version = s.text(6);
    p.predicted_prob = s.real(7);
    p.implied_prob = s.real(8);
    p.edge = s.real(9);
    p.confidence = s.real(10);
    p.home_team = s.text(11);
    p.away_team = s.text(12);
    p.point = s.opt_real(13);
    p.total_line = s.opt_real(14);
    p.feature_snapshot = s.text(15);
    p.status = parse_resolution_status(s.text(16));
    p.created_at = s.int64(17);
    p.resolved_at = s.opt_int(18);
    return p;
}

inline PredictionOutcome read_outcome(const Statement& s, int64_t prediction_id) {
    const int c = OUTCOME_FIRST_COL;
    PredictionOutcome o;
    o.prediction_id = prediction_id;
    o.was_correct = s.int64(c) != 0;
    o.is_push = s.int64(c + 1) != 0;
    o.actual_value = s.real(c + 2);
    o.error_magnitude = s.real(c + 3);
    o.signed_error = s.real(c + 4);
    if (!s.is_null(c + 5)) o.home_score = static_cast<int>(s.int64(c + 5));
    if (!s.is_null(c + 6)) o.away_score = static_cast<int>(s.int64(c + 6));
    o.resolved_at = s.int64(c + 7);
    return o;
}

inline std::optional<int64_t> widen(const std::optional<int>& v) {
    if (!v) return std::nullopt;
    return static_cast<int64_t>(*v);
}

}  // namespace sqlite_detail

// ---------------------------------------------------------------------------
// SqlitePredictionStore — PredictionStore over one SQLite connection.
//
// The connection is guarded by a mutex. BUSY/LOCKED results surface as
// TransientStorageError and are retried here with exponential backoff;
// callers only see them once the retry budget is spent.
// ---------------------------------------------------------------------------
class SqlitePredictionStore : public PredictionStore {
public:
    explicit SqlitePredictionStore(StoreConfig config = StoreConfig{})
        : config_(std::move(config)) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(config_.path.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        db_.reset(raw);
        if (rc != SQLITE_OK) {
            throw StorageError("Failed to open database '" + config_.path + "': " +
                               (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
        }
        with_retry("schema", [&] {
            sqlite_detail::exec(db(), "PRAGMA foreign_keys = ON", "pragma");
            sqlite_detail::exec(db(), sqlite_detail::SCHEMA, "schema");
        });
    }

    const StoreConfig& config() const { return config_; }

    Prediction insert_or_fetch(const Prediction& row) override {
        return with_retry("insert_or_fetch", [&] {
            sqlite_detail::Statement ins(db(),
                "INSERT OR IGNORE INTO predictions (idempotency_key, sport, event_id, market_type, side, "
                "model_version, predicted_prob, implied_prob, edge, confidence, home_team, away_team, "
                "point, total_line, feature_snapshot, status, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
            ins.bind_text(1, row.idempotency_key);
            ins.bind_text(2, normalize_sport(row.sport));
            ins.bind_text(3, row.event_id);
            ins.bind_text(4, market_key(row.market_type));
            ins.bind_text(5, row.side);
            ins.bind_text(6, row.model_version);
            ins.bind_real(7, row.predicted_prob);
            ins.bind_real(8, row.implied_prob);
            ins.bind_real(9, row.edge);
            ins.bind_real(10, row.confidence);
            ins.bind_text(11, row.home_team);
            ins.bind_text(12, row.away_team);
            ins.bind_opt_real(13, row.point);
            ins.bind_opt_real(14, row.total_line);
            ins.bind_text(15, row.feature_snapshot.empty() ? "{}" : row.feature_snapshot);
            ins.bind_text(16, resolution_status_name(ResolutionStatus::UNRESOLVED));
            ins.bind_int(17, row.created_at);
            ins.step();

            auto stored = find_by_key_locked(row.idempotency_key);
            if (!stored) throw StorageError("Prediction vanished after insert: " + row.idempotency_key);
            return *stored;
        });
    }

    std::optional<Prediction> find_by_key(const std::string& key) override {
        return with_retry("find_by_key", [&] { return find_by_key_locked(key); });
    }

    std::vector<Prediction> unresolved_for_event(const std::string& event_id) override {
        return with_retry("unresolved_for_event", [&] {
            std::string sql = std::string("SELECT ") + sqlite_detail::PREDICTION_COLUMNS +
                              " FROM predictions p WHERE p.event_id = ? AND p.status = 'unresolved'"
                              " ORDER BY p.id";
            sqlite_detail::Statement q(db(), sql.c_str());
            q.bind_text(1, event_id);
            std::vector<Prediction> out;
            while (q.step()) out.push_back(sqlite_detail::read_prediction(q));
            return out;
        });
    }

    bool mark_resolved(const Prediction& prediction, ResolutionStatus status,
                       const PredictionOutcome& outcome) override {
        if (status == ResolutionStatus::UNRESOLVED) {
            throw ValidationError("Cannot resolve prediction " + std::to_string(prediction.id) +
                                  " to unresolved");
        }
        return with_retry("mark_resolved", [&] {
            sqlite_detail::Transaction tx(db());
            sqlite_detail::Statement upd(db(),
                "UPDATE predictions SET status = ?, resolved_at = ? WHERE id = ? AND status = 'unresolved'");
            upd.bind_text(1, resolution_status_name(status));
            upd.bind_int(2, outcome.resolved_at);
            upd.bind_int(3, prediction.id);
            upd.step();
            if (sqlite3_changes(db()) == 0) return false;

            sqlite_detail::Statement ins(db(),
                "INSERT INTO prediction_outcomes (prediction_id, was_correct, is_push, actual_value, "
                "error_magnitude, signed_error, home_score, away_score, resolved_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
            ins.bind_int(1, prediction.id);
            ins.bind_int(2, outcome.was_correct ? 1 : 0);
            ins.bind_int(3, outcome.is_push ? 1 : 0);
            ins.bind_real(4, outcome.actual_value);
            ins.bind_real(5, outcome.error_magnitude);
            ins.bind_real(6, outcome.signed_error);
            ins.bind_opt_int(7, sqlite_detail::widen(outcome.home_score));
            ins.bind_opt_int(8, sqlite_detail::widen(outcome.away_score));
            ins.bind_int(9, outcome.resolved_at);
            ins.step();
            tx.commit();
            return true;
        });
    }

    std::vector<ResolvedPrediction> resolved(const PredictionQuery& query) override {
        return with_retry("resolved", [&] {
            std::string sql = std::string("SELECT ") + sqlite_detail::PREDICTION_COLUMNS + ", " +
                              sqlite_detail::OUTCOME_COLUMNS +
                              " FROM predictions p JOIN prediction_outcomes o ON o.prediction_id = p.id"
                              " WHERE p.status != 'unresolved'";
            if (query.sport) sql += " AND p.sport = ?";
            if (query.market_type) sql += " AND p.market_type = ?";
            if (query.since) sql += " AND p.created_at >= ?";
            sql += " ORDER BY p.created_at DESC, p.id DESC";

            sqlite_detail::Statement q(db(), sql.c_str());
            int i = 1;
            if (query.sport) q.bind_text(i++, normalize_sport(*query.sport));
            if (query.market_type) q.bind_text(i++, market_key(*query.market_type));
            if (query.since) q.bind_int(i++, *query.since);
            return read_resolved(q);
        });
    }

    std::vector<ResolvedPrediction> resolved_for_team(const std::string& team, const std::string& sport,
                                                      int limit) override {
        return with_retry("resolved_for_team", [&] {
            std::string sql = std::string("SELECT ") + sqlite_detail::PREDICTION_COLUMNS + ", " +
                              sqlite_detail::OUTCOME_COLUMNS +
                              " FROM predictions p JOIN prediction_outcomes o ON o.prediction_id = p.id"
                              " WHERE p.sport = ? AND (lower(p.home_team) = lower(?) OR lower(p.away_team) = lower(?))"
                              " ORDER BY p.created_at DESC, p.id DESC LIMIT ?";
            sqlite_detail::Statement q(db(), sql.c_str());
            q.bind_text(1, normalize_sport(sport));
            q.bind_text(2, team);
            q.bind_text(3, team);
            q.bind_int(4, limit);
            return read_resolved(q);
        });
    }

    std::vector<std::string> teams_with_resolved(const std::string& sport) override {
        return with_retry("teams_with_resolved", [&] {
            sqlite_detail::Statement q(db(),
                "SELECT team FROM ("
                " SELECT p.home_team AS team FROM predictions p WHERE p.sport = ? AND p.status != 'unresolved'"
                " UNION"
                " SELECT p.away_team AS team FROM predictions p WHERE p.sport = ? AND p.status != 'unresolved'"
                ") WHERE team != '' ORDER BY team");
            const std::string key = normalize_sport(sport);
            q.bind_text(1, key);
            q.bind_text(2, key);
            std::vector<std::string> out;
            while (q.step()) out.push_back(q.text(0));
            return out;
        });
    }

    void upsert_team_calibration(const TeamCalibration& row) override {
        with_retry("upsert_team_calibration", [&] {
            sqlite_detail::Statement q(db(),
                "INSERT INTO team_calibrations (team, sport, bias_adjustment, avg_signed_error, sample_size, "
                "accuracy, brier_score, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(team, sport) DO UPDATE SET bias_adjustment = excluded.bias_adjustment, "
                "avg_signed_error = excluded.avg_signed_error, sample_size = excluded.sample_size, "
                "accuracy = excluded.accuracy, brier_score = excluded.brier_score, "
                "updated_at = excluded.updated_at");
            q.bind_text(1, row.team);
            q.bind_text(2, normalize_sport(row.sport));
            q.bind_real(3, row.bias_adjustment);
            q.bind_real(4, row.avg_signed_error);
            q.bind_int(5, row.sample_size);
            q.bind_real(6, row.accuracy);
            q.bind_real(7, row.brier_score);
            q.bind_int(8, row.updated_at);
            q.step();
        });
    }

    std::vector<TeamCalibration> team_calibrations(const std::string& sport) override {
        return with_retry("team_calibrations", [&] {
            sqlite_detail::Statement q(db(),
                "SELECT team, sport, bias_adjustment, avg_signed_error, sample_size, accuracy, brier_score, "
                "updated_at FROM team_calibrations WHERE sport = ? ORDER BY team");
            q.bind_text(1, normalize_sport(sport));
            std::vector<TeamCalibration> out;
            while (q.step()) {
                TeamCalibration c;
                c.team = q.text(0);
                c.sport = q.text(1);
                c.bias_adjustment = q.real(2);
                c.avg_signed_error = q.real(3);
                c.sample_size = static_cast<int>(q.int64(4));
                c.accuracy = q.real(5);
                c.brier_score = q.real(6);
                c.updated_at = q.int64(7);
                out.push_back(c);
            }
            return out;
        });
    }

    int64_t record_parlay_result(const ParlayResult& row) override {
        if (!(row.raw_probability >= 0.0 && row.raw_probability <= 1.0)) {
            throw ValidationError("Parlay raw probability must be in [0, 1]");
        }
        return with_retry("record_parlay_result", [&] {
            sqlite_detail::Statement q(db(),
                "INSERT INTO parlay_results (raw_probability, hit, num_legs, settled_at) VALUES (?, ?, ?, ?)");
            q.bind_real(1, row.raw_probability);
            q.bind_int(2, row.hit ? 1 : 0);
            q.bind_int(3, row.num_legs);
            q.bind_int(4, row.settled_at);
            q.step();
            return static_cast<int64_t>(sqlite3_last_insert_rowid(db()));
        });
    }

    std::vector<ParlayResult> parlay_results() override {
        return with_retry("parlay_results", [&] {
            sqlite_detail::Statement q(db(),
                "SELECT id, raw_probability, hit, num_legs, settled_at FROM parlay_results ORDER BY id");
            std::vector<ParlayResult> out;
            while (q.step()) {
                ParlayResult r;
                r.id = q.int64(0);
                r.raw_probability = q.real(1);
                r.hit = q.int64(2) != 0;
                r.num_legs = static_cast<int>(q.int64(3));
                r.settled_at = q.int64(4);
                out.push_back(r);
            }
            return out;
        });
    }

    size_t prediction_count() override {
        return with_retry("prediction_count", [&] {
            sqlite_detail::Statement q(db(), "SELECT COUNT(*) FROM predictions");
            q.step();
            return static_cast<size_t>(q.int64(0));
        });
    }

private:
    StoreConfig config_;
    std::unique_ptr<sqlite3, sqlite_detail::ConnectionCloser> db_;
    std::mutex mutex_;

    sqlite3* db() const { return db_.get(); }

    // Runs fn under the connection mutex, retrying transient failures with
    // exponential backoff. The mutex is released while sleeping.
    template <typename Fn>
    auto with_retry(const char* op, Fn&& fn) -> decltype(fn()) {
        auto delay = std::chrono::milliseconds(config_.initial_backoff_ms);
        for (int attempt = 0;; ++attempt) {
            try {
                std::lock_guard<std::mutex> lock(mutex_);
                return fn();
            } catch (const TransientStorageError& e) {
                if (attempt >= config_.busy_retries) throw;
                std::cerr << "[SqlitePredictionStore] " << op << " busy (attempt " << attempt + 1
                          << "): " << e.what() << "\n";
            }
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<int64_t>(static_cast<double>(delay.count()) * config_.backoff_factor));
        }
    }

    std::optional<Prediction> find_by_key_locked(const std::string& key) {
        std::string sql = std::string("SELECT ") + sqlite_detail::PREDICTION_COLUMNS +
                          " FROM predictions p WHERE p.idempotency_key = ?";
        sqlite_detail::Statement q(db(), sql.c_str());
        q.bind_text(1, key);
        if (!q.step()) return std::nullopt;
        return sqlite_detail::read_prediction(q);
    }

    static std::vector<ResolvedPrediction> read_resolved(sqlite_detail::Statement& q) {
        std::vector<ResolvedPrediction> out;
        while (q.step()) {
            ResolvedPrediction r;
            r.prediction = sqlite_detail::read_prediction(q);
            r.outcome = sqlite_detail::read_outcome(q, r.prediction.id);
            out.push_back(std::move(r));
        }
        return out;
    }
};
