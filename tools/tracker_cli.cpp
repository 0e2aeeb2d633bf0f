// tracker_cli.cpp — record, resolve and evaluate model predictions
//
// Usage: ./tracker_cli <command> --db <path> [options]

#include "core/errors.hpp"
#include "core/leg.hpp"
#include "io/parlay_json.hpp"
#include "tracking/prediction_tracker.hpp"
#include "tracking/sqlite_prediction_store.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> --db <path> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  save           --sport <S> --event <id> --market h2h|spreads|totals --side <pick>\n"
              << "                 --prob <p> --implied <p> [--confidence <c>] [--home <team>] [--away <team>]\n"
              << "                 [--point <x>] [--total-line <x>] [--model-version <v>]\n"
              << "  resolve        --event <id> --winner <home|away|team|tie> [--home-score <n>] [--away-score <n>]\n"
              << "  stats          [--sport <S>] [--market <m>] [--days <n>]\n"
              << "  recalibrate    --sport <S>\n"
              << "  bias           --sport <S>\n"
              << "  record-parlay  --prob <p> --hit 0|1 --legs <n>\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    std::map<std::string, std::string> opts;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
            opts[arg.substr(2)] = argv[++i];
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    auto opt = [&](const std::string& key) -> std::optional<std::string> {
        auto it = opts.find(key);
        if (it == opts.end()) return std::nullopt;
        return it->second;
    };
    auto require = [&](const std::string& key) -> std::string {
        auto v = opt(key);
        if (!v) throw ValidationError("Missing required argument: --" + key);
        return *v;
    };
    auto market = [](const std::string& raw) {
        auto m = parse_market_type(raw);
        if (!m) throw ValidationError("Unsupported market type '" + raw + "'");
        return *m;
    };

    try {
        StoreConfig sc;
        sc.path = require("db");
        auto store = std::make_shared<SqlitePredictionStore>(sc);
        PredictionTracker tracker(store);

        if (command == "save") {
            PredictionInput in;
            in.sport = require("sport");
            in.event_id = require("event");
            in.market_type = market(require("market"));
            in.side = require("side");
            in.predicted_prob = std::stod(require("prob"));
            in.implied_prob = std::stod(require("implied"));
            in.confidence = std::stod(opt("confidence").value_or("50"));
            in.home_team = opt("home").value_or("");
            in.away_team = opt("away").value_or("");
            in.model_version = opt("model-version").value_or("v1");
            if (auto v = opt("point")) in.point = std::stod(*v);
            if (auto v = opt("total-line")) {
                in.total_line = std::stod(*v);
                in.features["total_line"] = *in.total_line;
            }
            std::cout << parlay_io::to_json(tracker.save_prediction(in)) << "\n";
            return 0;
        }

        if (command == "resolve") {
            std::optional<int> home_score;
            std::optional<int> away_score;
            if (auto v = opt("home-score")) home_score = std::stoi(*v);
            if (auto v = opt("away-score")) away_score = std::stoi(*v);
            int n = tracker.resolve_prediction(require("event"), require("winner"), home_score, away_score);
            std::cout << "{\"resolved\":" << n << "}\n";
            return 0;
        }

        if (command == "stats") {
            std::optional<MarketType> m;
            std::optional<int> days;
            if (auto v = opt("market")) m = market(*v);
            if (auto v = opt("days")) days = std::stoi(*v);
            std::cout << parlay_io::to_json(tracker.get_accuracy_stats(opt("sport"), m, days)) << "\n";
            return 0;
        }

        if (command == "recalibrate") {
            std::string sport = require("sport");
            int n = tracker.update_team_calibrations(sport);
            std::cout << "{\"sport\":" << json_text::quote(sport) << ",\"teams_updated\":" << n << "}\n";
            return 0;
        }

        if (command == "bias") {
            std::cout << json_text::object(tracker.get_team_bias_adjustments(require("sport"))) << "\n";
            return 0;
        }

        if (command == "record-parlay") {
            ParlayResult r;
            r.raw_probability = std::stod(require("prob"));
            r.hit = require("hit") == "1";
            r.num_legs = std::stoi(require("legs"));
            r.settled_at = time_utils::now_seconds();
            std::cout << "{\"id\":" << store->record_parlay_result(r) << "}\n";
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const ValidationError& e) {
        std::cout << parlay_io::error_json(e) << "\n";
        return 1;
    } catch (const StorageError& e) {
        std::cerr << "[tracker_cli] storage failure: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[tracker_cli] " << e.what() << "\n";
        return 1;
    }
}
