// parlay_cli.cpp — build, hedge and scan parlays from a candidate-leg CSV
//
// Pipeline: candidate CSV -> CandidatePool -> ParlayBuilder / CoverageBuilder /
// CounterBuilder / UpsetFinder -> JSON on stdout.
//
// Usage: ./parlay_cli <command> --candidates <csv> [options]

#include "core/candidate_record.hpp"
#include "core/errors.hpp"
#include "coverage/counter_builder.hpp"
#include "coverage/coverage_builder.hpp"
#include "io/candidate_csv.hpp"
#include "io/parlay_json.hpp"
#include "parlay/candidate_pool.hpp"
#include "parlay/parlay_builder.hpp"
#include "tracking/sqlite_prediction_store.hpp"
#include "upsets/upset_finder.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> --candidates <csv> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  build     --sport <S> --legs <n> [--profile conservative|balanced|degen] [--week <w>]\n"
              << "            [--db <path>]  fit calibration from settled parlays in the database\n"
              << "  triple    --sports <S1,S2,...> [--safe <n>] [--balanced <n>] [--degen <n>]\n"
              << "  coverage  [--scenario-max <k>] [--rr-size <r>] [--rr-max <k>] [--max-total <k>]\n"
              << "  counter   [--mode flip_all|best_edges] [--target <n>] [--min-edge <x>]\n"
              << "  upsets    [--type safe|balanced|degen] [--min-edge <x>] [--max-results <n>]\n"
              << "\n"
              << "  coverage, counter and upsets use every valid leg in the file, in file order.\n";
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = text::trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
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

    if (!opt("candidates")) {
        std::cerr << "Missing required argument: --candidates\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto records = candidate_csv::load(*opt("candidates"));
        auto pool = std::make_shared<StaticCandidatePool>(records);

        if (command == "build") {
            if (!opt("sport") || !opt("legs")) {
                std::cerr << "Missing required argument: --sport and --legs\n";
                print_usage(argv[0]);
                return 1;
            }
            ProbabilityCalibrationService calibration;
            if (auto db = opt("db")) {
                StoreConfig sc;
                sc.path = *db;
                SqlitePredictionStore store(sc);
                calibration.fit(store.parlay_results());
            }
            ParlayBuilder builder(pool, LegSelectionOptimizer{}, ParlayProbabilityCalculator{}, calibration);
            std::optional<int> week;
            if (auto w = opt("week")) week = std::stoi(*w);
            Parlay p = builder.build_parlay(std::stoi(*opt("legs")), opt("profile").value_or("balanced"),
                                            *opt("sport"), week);
            std::cout << parlay_io::to_json(p) << "\n";
            return 0;
        }

        if (command == "triple") {
            if (!opt("sports")) {
                std::cerr << "Missing required argument: --sports\n";
                print_usage(argv[0]);
                return 1;
            }
            std::map<std::string, int> overrides;
            for (const char* name : {"safe", "balanced", "degen"}) {
                if (auto v = opt(name)) overrides[name] = std::stoi(*v);
            }
            ParlayBuilder builder(pool);
            std::cout << parlay_io::to_json(builder.build_triple_parlay(split_list(*opt("sports")), overrides))
                      << "\n";
            return 0;
        }

        int rejected = 0;
        std::vector<Leg> legs = legs_from_records(records, &rejected);
        if (rejected > 0) std::cerr << "[parlay_cli] " << rejected << " records rejected\n";

        if (command == "coverage") {
            CoverageBuilder builder;
            auto pending = builder.build_coverage_pack_async(
                legs, std::stoi(opt("scenario-max").value_or("10")), std::stoi(opt("rr-size").value_or("2")),
                std::stoi(opt("rr-max").value_or("10")), std::stoi(opt("max-total").value_or("20")));
            std::cout << parlay_io::to_json(pending.get()) << "\n";
            return 0;
        }

        if (command == "counter") {
            std::optional<int> target;
            std::optional<double> min_edge;
            if (auto t = opt("target")) target = std::stoi(*t);
            if (auto m = opt("min-edge")) min_edge = std::stod(*m);
            CounterResult r = CounterBuilder::generate_counter(
                legs, parse_counter_mode(opt("mode").value_or("flip_all")), target, min_edge);
            std::cout << parlay_io::to_json(r) << "\n";
            return 0;
        }

        if (command == "upsets") {
            UpsetFinder finder;
            if (auto type = opt("type")) {
                std::cout << parlay_io::to_json(finder.get_upsets_for_parlay(legs, parse_parlay_type(*type)))
                          << "\n";
                return 0;
            }
            std::optional<double> min_edge;
            std::optional<int> max_results;
            if (auto m = opt("min-edge")) min_edge = std::stod(*m);
            if (auto m = opt("max-results")) max_results = std::stoi(*m);
            std::cout << parlay_io::to_json(finder.find_upsets(legs, min_edge, max_results)) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const InsufficientCandidatesError& e) {
        std::cout << parlay_io::error_json(e) << "\n";
        return 2;
    } catch (const ValidationError& e) {
        std::cout << parlay_io::error_json(e) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[parlay_cli] " << e.what() << "\n";
        return 1;
    }
}
