// prediction_export.cpp — export resolved predictions with their outcomes
//
// Pipeline: SqlitePredictionStore -> resolved rows -> CSV or Parquet (ZSTD).
//
// Usage: ./prediction_export --db <path> --output <path.csv|path.parquet> [--sport <S>] [--days <n>]

#include "core/leg.hpp"
#include "io/candidate_csv.hpp"
#include "time_utils.hpp"
#include "tracking/prediction.hpp"
#include "tracking/sqlite_prediction_store.hpp"

// Arrow/Parquet for Parquet output
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Column buffers
// ===========================================================================
struct ExportColumns {
    std::vector<int64_t> id;
    std::vector<std::string> sport;
    std::vector<std::string> event_id;
    std::vector<std::string> market_type;
    std::vector<std::string> side;
    std::vector<std::string> model_version;
    std::vector<double> predicted_prob;
    std::vector<double> implied_prob;
    std::vector<double> edge;
    std::vector<double> confidence;
    std::vector<std::string> status;
    std::vector<double> actual_value;
    std::vector<double> signed_error;
    std::vector<int64_t> created_at;
    std::vector<int64_t> resolved_at;

    void add(const ResolvedPrediction& r) {
        const auto& p = r.prediction;
        id.push_back(p.id);
        sport.push_back(p.sport);
        event_id.push_back(p.event_id);
        market_type.push_back(market_key(p.market_type));
        side.push_back(p.side);
        model_version.push_back(p.model_version);
        predicted_prob.push_back(p.predicted_prob);
        implied_prob.push_back(p.implied_prob);
        edge.push_back(p.edge);
        confidence.push_back(p.confidence);
        status.push_back(resolution_status_name(p.status));
        actual_value.push_back(r.outcome.actual_value);
        signed_error.push_back(r.outcome.signed_error);
        created_at.push_back(p.created_at);
        resolved_at.push_back(r.outcome.resolved_at);
    }

    size_t size() const { return id.size(); }
};

// ===========================================================================
// CSV Writer
// ===========================================================================
bool write_csv_file(const std::string& path, const ExportColumns& c) {
    std::ofstream csv(path);
    if (!csv.is_open()) {
        std::cerr << "Cannot open output file: " << path << "\n";
        return false;
    }
    csv << std::setprecision(17);
    csv << "id,sport,event_id,market_type,side,model_version,predicted_prob,implied_prob,edge,"
           "confidence,status,actual_value,signed_error,created_at,resolved_at\n";
    using candidate_csv::quote_field;
    for (size_t i = 0; i < c.size(); ++i) {
        csv << c.id[i] << "," << quote_field(c.sport[i]) << "," << quote_field(c.event_id[i]) << ","
            << c.market_type[i] << "," << quote_field(c.side[i]) << "," << quote_field(c.model_version[i])
            << "," << c.predicted_prob[i] << "," << c.implied_prob[i] << "," << c.edge[i] << ","
            << c.confidence[i] << "," << c.status[i] << "," << c.actual_value[i] << ","
            << c.signed_error[i] << "," << time_utils::iso8601(c.created_at[i]) << ","
            << time_utils::iso8601(c.resolved_at[i]) << "\n";
    }
    return true;
}

// ===========================================================================
// Parquet Writer
// ===========================================================================
arrow::Status append_strings(std::vector<std::shared_ptr<arrow::Array>>& arrays,
                             const std::vector<std::string>& v) {
    std::shared_ptr<arrow::Array> arr;
    arrow::StringBuilder b;
    for (const auto& s : v) ARROW_RETURN_NOT_OK(b.Append(s));
    ARROW_RETURN_NOT_OK(b.Finish(&arr));
    arrays.push_back(arr);
    return arrow::Status::OK();
}

arrow::Status append_doubles(std::vector<std::shared_ptr<arrow::Array>>& arrays,
                             const std::vector<double>& v) {
    std::shared_ptr<arrow::Array> arr;
    arrow::DoubleBuilder b;
    ARROW_RETURN_NOT_OK(b.AppendValues(v.data(), static_cast<int64_t>(v.size())));
    ARROW_RETURN_NOT_OK(b.Finish(&arr));
    arrays.push_back(arr);
    return arrow::Status::OK();
}

arrow::Status append_int64s(std::vector<std::shared_ptr<arrow::Array>>& arrays,
                            const std::vector<int64_t>& v) {
    std::shared_ptr<arrow::Array> arr;
    arrow::Int64Builder b;
    ARROW_RETURN_NOT_OK(b.AppendValues(v));
    ARROW_RETURN_NOT_OK(b.Finish(&arr));
    arrays.push_back(arr);
    return arrow::Status::OK();
}

// Column order matches the schema in write_parquet_file().
arrow::Status build_arrays(const ExportColumns& c, std::vector<std::shared_ptr<arrow::Array>>& arrays) {
    ARROW_RETURN_NOT_OK(append_int64s(arrays, c.id));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.sport));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.event_id));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.market_type));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.side));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.model_version));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.predicted_prob));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.implied_prob));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.edge));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.confidence));
    ARROW_RETURN_NOT_OK(append_strings(arrays, c.status));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.actual_value));
    ARROW_RETURN_NOT_OK(append_doubles(arrays, c.signed_error));
    ARROW_RETURN_NOT_OK(append_int64s(arrays, c.created_at));
    ARROW_RETURN_NOT_OK(append_int64s(arrays, c.resolved_at));
    return arrow::Status::OK();
}

bool write_parquet_file(const std::string& path, const ExportColumns& c) {
    int64_t num_rows = static_cast<int64_t>(c.size());

    arrow::FieldVector fields;
    fields.push_back(arrow::field("id", arrow::int64()));
    fields.push_back(arrow::field("sport", arrow::utf8()));
    fields.push_back(arrow::field("event_id", arrow::utf8()));
    fields.push_back(arrow::field("market_type", arrow::utf8()));
    fields.push_back(arrow::field("side", arrow::utf8()));
    fields.push_back(arrow::field("model_version", arrow::utf8()));
    fields.push_back(arrow::field("predicted_prob", arrow::float64()));
    fields.push_back(arrow::field("implied_prob", arrow::float64()));
    fields.push_back(arrow::field("edge", arrow::float64()));
    fields.push_back(arrow::field("confidence", arrow::float64()));
    fields.push_back(arrow::field("status", arrow::utf8()));
    fields.push_back(arrow::field("actual_value", arrow::float64()));
    fields.push_back(arrow::field("signed_error", arrow::float64()));
    fields.push_back(arrow::field("created_at", arrow::int64()));
    fields.push_back(arrow::field("resolved_at", arrow::int64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    auto built = build_arrays(c, arrays);
    if (!built.ok()) {
        std::cerr << "[prediction_export] failed to build columns: " << built.ToString() << "\n";
        return false;
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        std::cerr << "Cannot open Parquet output file: " << path << "\n";
        return false;
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/std::max<int64_t>(num_rows, 1), props);
    if (!status.ok()) {
        std::cerr << "Failed to write Parquet: " << status.ToString() << "\n";
        return false;
    }
    return true;
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --db <path> --output <path> [--sport <S>] [--days <n>]\n"
              << "\n"
              << "  --db      Prediction database (SQLite)\n"
              << "  --output  Output file path (.csv or .parquet)\n"
              << "  --sport   Only this sport\n"
              << "  --days    Only predictions created in the last n days\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string db_path;
    std::string output_path;
    std::optional<std::string> sport;
    std::optional<int> days;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--sport" && i + 1 < argc) {
            sport = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            std::string raw = argv[++i];
            try {
                days = std::stoi(raw);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid --days value: " << raw << "\n";
                print_usage(argv[0]);
                return 1;
            }
            if (*days < 0) {
                std::cerr << "--days must be non-negative, got " << raw << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    }

    if (db_path.empty()) {
        std::cerr << "Missing required argument: --db\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }

    bool use_parquet = false;
    {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    try {
        StoreConfig sc;
        sc.path = db_path;
        SqlitePredictionStore store(sc);

        PredictionQuery q;
        q.sport = sport;
        if (days) q.since = time_utils::now_seconds() - static_cast<int64_t>(*days) * time_utils::SEC_PER_DAY;

        ExportColumns columns;
        for (const auto& r : store.resolved(q)) columns.add(r);

        bool ok = use_parquet ? write_parquet_file(output_path, columns)
                              : write_csv_file(output_path, columns);
        if (!ok) return 1;
        std::cerr << "Exported " << columns.size() << " resolved predictions to " << output_path << "\n";
        return 0;
    } catch (const StorageError& e) {
        std::cerr << "[prediction_export] storage failure: " << e.what() << "\n";
        return 3;
    }
}
