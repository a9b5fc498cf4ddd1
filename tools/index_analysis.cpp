// index_analysis.cpp — CLI tool for batch volatility / state analysis of one index
//
// Pipeline: DBN OHLCV records -> TimeSeries -> IndexAnalyzer -> summary + per-period export.
//
// Usage: ./index_analysis --input <ohlcv.dbn[.zst]> [--related <file>]... --output <path>

#include "ensemble/return_learner.hpp"
#include "orchestrator/index_analyzer.hpp"

#include <databento/dbn_file_store.hpp>
#include <databento/record.hpp>

// Arrow/Parquet for Parquet output
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr double PRICE_SCALE = 1e-9;  // DBN fixed-point prices
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// ===========================================================================
// DBN input
// ===========================================================================
TimeSeries load_ohlcv(const std::string& path, const std::string& symbol) {
    std::vector<int64_t> timestamps;
    std::vector<double> closes;

    databento::DbnFileStore store{std::filesystem::path(path)};
    while (const auto* record = store.NextRecord()) {
        if (const auto* bar = record->GetIf<databento::OhlcvMsg>()) {
            int64_t ts = static_cast<int64_t>(bar->hd.ts_event.time_since_epoch().count());
            // Multi-instrument files repeat timestamps; keep the first bar per ts.
            if (!timestamps.empty() && ts <= timestamps.back()) continue;
            timestamps.push_back(ts);
            closes.push_back(static_cast<double>(bar->close) * PRICE_SCALE);
        }
    }

    std::string name = symbol.empty() ? std::filesystem::path(path).stem().string() : symbol;
    return TimeSeries::from_prices(name, std::move(timestamps), std::move(closes));
}

std::vector<LearnerKind> parse_learners(const std::string& list) {
    std::vector<LearnerKind> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(parse_learner_kind(item));
    }
    return out;
}

// ===========================================================================
// Per-period export table (price grid; return-grid columns are NaN at row 0)
// ===========================================================================
struct PeriodTable {
    std::vector<int64_t> timestamp;
    std::vector<double> price;
    std::vector<double> ret;
    std::vector<double> conditional_volatility;
    std::vector<double> standardized_residual;
    std::vector<double> kalman_level;
    std::vector<double> kalman_slope;
    std::vector<int64_t> volatility_regime;
    std::vector<int64_t> combined_signal;
    std::vector<bool> anomaly;
};

PeriodTable make_period_table(const CompositeReport& report) {
    PeriodTable t;
    size_t n = report.prices.size();
    const auto& g = report.best_garch();
    auto level = level_path(report.kalman);
    auto slope = slope_path(report.kalman);

    auto on_return_grid = [](const auto& v, size_t i, auto missing) {
        return (i > 0 && i - 1 < v.size()) ? v[i - 1] : missing;
    };

    for (size_t i = 0; i < n; ++i) {
        t.timestamp.push_back(i < report.timestamps.size() ? report.timestamps[i] : static_cast<int64_t>(i));
        t.price.push_back(report.prices[i]);
        t.ret.push_back(on_return_grid(report.returns, i, NaN));
        t.conditional_volatility.push_back(on_return_grid(g.conditional_volatility, i, NaN));
        t.standardized_residual.push_back(on_return_grid(g.standardized_residuals, i, NaN));
        t.kalman_level.push_back(i < level.size() ? level[i] : NaN);
        t.kalman_slope.push_back(i < slope.size() ? slope[i] : NaN);
        t.volatility_regime.push_back(on_return_grid(report.regime.value.volatility.regimes, i, -1));
        t.combined_signal.push_back(on_return_grid(report.signals.value.combined, i, 0));
        bool flagged = false;
        if (i > 0 && i - 1 < report.anomalies.value.combined.size()) {
            flagged = report.anomalies.value.combined[i - 1];
        }
        t.anomaly.push_back(flagged);
    }
    return t;
}

std::string format_double(double val) {
    if (std::isnan(val)) return "NaN";
    if (std::isinf(val)) return "Inf";
    std::ostringstream os;
    os << std::setprecision(17) << val;
    return os.str();
}

// ===========================================================================
// Writers
// ===========================================================================
bool write_csv_file(const std::string& path, const PeriodTable& t) {
    std::ofstream csv(path);
    if (!csv.is_open()) {
        std::cerr << "Cannot open output file: " << path << "\n";
        return false;
    }
    csv << "timestamp,price,return,conditional_volatility,standardized_residual,"
           "kalman_level,kalman_slope,volatility_regime,combined_signal,anomaly\n";
    for (size_t i = 0; i < t.timestamp.size(); ++i) {
        csv << t.timestamp[i]
            << "," << format_double(t.price[i])
            << "," << format_double(t.ret[i])
            << "," << format_double(t.conditional_volatility[i])
            << "," << format_double(t.standardized_residual[i])
            << "," << format_double(t.kalman_level[i])
            << "," << format_double(t.kalman_slope[i])
            << "," << t.volatility_regime[i]
            << "," << t.combined_signal[i]
            << "," << (t.anomaly[i] ? "true" : "false") << "\n";
    }
    return true;
}

bool write_parquet_file(const std::string& path, const PeriodTable& t) {
    int64_t num_rows = static_cast<int64_t>(t.timestamp.size());

    arrow::FieldVector fields;
    fields.push_back(arrow::field("timestamp", arrow::int64()));
    fields.push_back(arrow::field("price", arrow::float64()));
    fields.push_back(arrow::field("return", arrow::float64()));
    fields.push_back(arrow::field("conditional_volatility", arrow::float64()));
    fields.push_back(arrow::field("standardized_residual", arrow::float64()));
    fields.push_back(arrow::field("kalman_level", arrow::float64()));
    fields.push_back(arrow::field("kalman_slope", arrow::float64()));
    fields.push_back(arrow::field("volatility_regime", arrow::int64()));
    fields.push_back(arrow::field("combined_signal", arrow::int64()));
    fields.push_back(arrow::field("anomaly", arrow::boolean()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    auto int_column = [&](const std::vector<int64_t>& v) {
        arrow::Int64Builder b;
        (void)b.AppendValues(v);
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };
    auto double_column = [&](const std::vector<double>& v) {
        arrow::DoubleBuilder b;
        (void)b.AppendValues(v.data(), static_cast<int64_t>(v.size()));
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };

    int_column(t.timestamp);
    double_column(t.price);
    double_column(t.ret);
    double_column(t.conditional_volatility);
    double_column(t.standardized_residual);
    double_column(t.kalman_level);
    double_column(t.kalman_slope);
    int_column(t.volatility_regime);
    int_column(t.combined_signal);
    {
        arrow::BooleanBuilder b;
        for (bool v : t.anomaly) (void)b.Append(v);
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    }

    auto table = arrow::Table::Make(schema, arrays);

    // Write to Parquet with ZSTD compression
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
        /*chunk_size=*/num_rows, props);
    if (!status.ok()) {
        std::cerr << "Failed to write Parquet: " << status.ToString() << "\n";
        return false;
    }
    return true;
}

// ===========================================================================
// Summary
// ===========================================================================
void print_summary(const CompositeReport& r) {
    const auto& g = r.best_garch();
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n=== " << r.symbol << " (" << r.num_observations << " prices) ===\n";

    std::cout << "\nVolatility models:\n";
    for (const auto& row : r.comparison.garch) {
        std::cout << "  " << std::setw(7) << to_string(row.kind)
                  << "  LL=" << row.log_likelihood << "  AIC=" << row.aic << "  BIC=" << row.bic
                  << (row.degraded ? "  [degraded]" : "") << "\n";
    }
    std::cout << "  best: " << to_string(g.kind) << "  persistence=" << g.persistence
              << (g.stationary ? "" : "  (non-stationary)") << "\n";

    std::cout << "\nKalman local trend: LL=" << r.kalman.log_likelihood
              << (r.kalman.degraded ? "  [degraded: " + r.kalman.degraded_reason + "]" : "") << "\n";
    std::cout << "Cointegration: n_cointegrating=" << r.cointegration.johansen.n_cointegrating
              << (r.cointegration.degraded ? "  [degraded: " + r.cointegration.degraded_reason + "]" : "")
              << "\n";

    if (r.risk.is_ok()) {
        const auto& m = r.risk.value;
        std::cout << "\nRisk:\n"
                  << "  annualized vol  " << m.annualized_volatility << "\n"
                  << "  VaR 95 / 99     " << m.var_95 << " / " << m.var_99 << "\n"
                  << "  ES 95 / 99      " << m.expected_shortfall_95 << " / " << m.expected_shortfall_99 << "\n"
                  << "  max drawdown    " << m.drawdown.max_drawdown << "\n"
                  << "  Sharpe          " << m.sharpe_ratio << "\n";
    }
    if (r.regime.is_ok()) {
        std::cout << "Current volatility regime: " << r.regime.value.current_regime << "\n";
    }
    if (r.ensemble.is_ok()) {
        std::cout << "Ensemble best component: " << r.ensemble.value.best_component
                  << "  hold-out R2=" << r.ensemble.value.holdout_r2 << "\n";
    }
    if (r.patterns.is_ok()) {
        const auto& p = r.patterns.value;
        std::cout << "Patterns: momentum=" << p.patterns.momentum_strength
                  << "  mean-reversion=" << p.patterns.mean_reversion_tendency
                  << "  Hurst=" << p.patterns.hurst_exponent
                  << "  jumps=" << p.patterns.jump_frequency << "\n";
        if (p.correlation.has_reference) {
            std::cout << "Correlation risk vs " << p.correlation.reference << ": "
                      << p.correlation.correlation_risk << "\n";
        }
    }
    if (r.diagnostics.is_ok()) {
        std::cout << "Quality score: " << r.diagnostics.value.quality_score << "\n";
    }

    for (const auto& name : r.degraded_sections()) {
        std::cerr << "  degraded section: " << name << "\n";
    }

    std::cout << "\nInsights:\n";
    for (const auto& s : r.narrative.value.insights) std::cout << "  - " << s << "\n";
    std::cout << "\nRecommendations:\n";
    for (const auto& s : r.narrative.value.recommendations) std::cout << "  - " << s << "\n";
}

}  // anonymous namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <file> --output <path> [options]\n"
              << "\n"
              << "  --input     DBN file of OHLCV records for the index\n"
              << "  --related   DBN file of a related series (repeatable)\n"
              << "  --output    Output file path (.csv or .parquet)\n"
              << "  --symbol    Index symbol (default: input file stem)\n"
              << "  --horizon   Ensemble forecast horizon (default: 30)\n"
              << "  --lags      VECM lag order (default: 1)\n"
              << "  --learners  Comma list of ridge,gbt,mlp (default: all)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::vector<std::string> related_paths;
    std::string output_path;
    std::string symbol;
    AnalyzerConfig config;

    // Parse CLI args
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--related" && i + 1 < argc) {
                related_paths.push_back(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--symbol" && i + 1 < argc) {
                symbol = argv[++i];
            } else if (arg == "--horizon" && i + 1 < argc) {
                config.ensemble.horizon = std::stoi(argv[++i]);
            } else if (arg == "--lags" && i + 1 < argc) {
                config.vecm.lags = std::stoi(argv[++i]);
            } else if (arg == "--learners" && i + 1 < argc) {
                config.ensemble.learners = parse_learners(argv[++i]);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Validate required args
    if (input_path.empty()) {
        std::cerr << "Missing required argument: --input\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }

    // Detect output format by file extension
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

    for (const auto& p : related_paths) {
        if (!std::filesystem::exists(p)) {
            std::cerr << "Related file not found: " << p << "\n";
            return 1;
        }
    }
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Input file not found: " << input_path << "\n";
        return 1;
    }

    CompositeReport report;
    try {
        std::cout << "Loading " << input_path << "... " << std::flush;
        TimeSeries index = load_ohlcv(input_path, symbol);
        std::cout << index.size() << " bars\n";

        std::vector<TimeSeries> related;
        for (const auto& p : related_paths) {
            std::cout << "Loading " << p << "... " << std::flush;
            related.push_back(load_ohlcv(p, ""));
            std::cout << related.back().size() << " bars\n";
        }

        if (!related.empty()) {
            // Related files may cover other sessions; keep the shared ts_event grid.
            std::vector<TimeSeries> all;
            all.push_back(std::move(index));
            for (auto& s : related) all.push_back(std::move(s));
            size_t before = all.front().size();
            all = align_on_timestamps(all);
            index = std::move(all.front());
            related.assign(std::make_move_iterator(all.begin() + 1), std::make_move_iterator(all.end()));
            std::cout << "Aligned on " << index.size() << " shared timestamps";
            if (index.size() < before) std::cout << " (" << before - index.size() << " index bars dropped)";
            std::cout << "\n";
        }

        std::cout << "Analyzing..." << std::endl;
        report = IndexAnalyzer(config).analyze(std::move(index), std::move(related));
    } catch (const DataShapeError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << "\n";
        return 1;
    }

    print_summary(report);

    PeriodTable table = make_period_table(report);
    bool written = use_parquet ? write_parquet_file(output_path, table)
                               : write_csv_file(output_path, table);
    if (!written) return 1;

    std::cout << "\nTotal periods exported: " << table.timestamp.size() << "\n";
    std::cout << "Output: " << output_path << "\n";
    return 0;
}
