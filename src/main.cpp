/// @file src/main.cpp
/// @brief FRAS CLI entry point.
///
/// Usage:
///   fras --analyze <file> [options]   Score a batch of transactions
///   fras --profile <file>             Print the batch profile as JSON
///   fras --train <file> --out <model> Train a classifier on labelled records
///   fras --help                       Print usage

#include "fras/alert_sink.hpp"
#include "fras/classifier.hpp"
#include "fras/data_loader.hpp"
#include "fras/model_io.hpp"
#include "fras/pipeline.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  fras --analyze <file> [--model <path>] [--json] [--threads <n>] [--top <n>]\n"
        "                        [--verbose]\n"
        "  fras --profile <file>\n"
        "  fras --train <file> --out <path> [--epochs <n>] [--lr <x>] [--batch <n>]\n"
        "                      [--seed <s>] [--validation <f>] [--threads <n>]\n"
        "                      [--binary] [--binary-format] [--verbose]\n"
        "  fras --help\n"
        "\n"
        "Input: JSON array of transactions (or {{\"transactions\": [...]}}), or CSV with\n"
        "header: id,amount,timestamp,account,vendor,description[,label]\n"
    );
}

/// Parsed `--key value` / `--flag` arguments after the mode.
struct Args {
    std::map<std::string, std::string> values;
    std::map<std::string, bool>        flags;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        const auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
    [[nodiscard]] bool has(const std::string& flag) const { return flags.count(flag) > 0; }
};

const std::vector<std::string> VALUE_OPTIONS = {
    "--model", "--threads", "--top", "--out", "--epochs", "--lr",
    "--batch", "--seed", "--validation",
};
const std::vector<std::string> FLAG_OPTIONS = {
    "--json", "--verbose", "--binary", "--binary-format",
};

std::optional<Args> parse_args(int argc, char* argv[], int start) {
    Args args;
    for (int i = start; i < argc; ++i) {
        const std::string key(argv[i]);
        if (std::find(FLAG_OPTIONS.begin(), FLAG_OPTIONS.end(), key) != FLAG_OPTIONS.end()) {
            args.flags[key] = true;
        } else if (std::find(VALUE_OPTIONS.begin(), VALUE_OPTIONS.end(), key) != VALUE_OPTIONS.end()) {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", key);
                return std::nullopt;
            }
            args.values[key] = argv[++i];
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }
    return args;
}

/// Numeric option, or `fallback` when absent. Reports and returns nullopt on
/// malformed input.
template <typename T>
std::optional<T> numeric(const Args& args, const std::string& key, T fallback) {
    const auto text = args.get(key);
    if (!text) return fallback;
    try {
        std::size_t pos = 0;
        T v{};
        if constexpr (std::is_floating_point_v<T>) {
            v = static_cast<T>(std::stod(*text, &pos));
        } else {
            v = static_cast<T>(std::stoll(*text, &pos));
        }
        if (pos == text->size()) return v;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    fmt::print(stderr, "Error: invalid value '{}' for {}\n", *text, key);
    return std::nullopt;
}

/// True when `value` fits the `int` field behind `key`; reports it otherwise.
bool fits_int(long long value, const std::string& key) {
    if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max()) {
        return true;
    }
    fmt::print(stderr, "Error: {} value {} is out of range\n", key, value);
    return false;
}

std::optional<std::vector<fras::RawRecord>> load_records(const std::string& path) {
    auto records = fras::core::DataLoader::load_file(path);
    if (!records) {
        fmt::print(stderr, "Error: cannot read transactions from '{}'\n", path);
    }
    return records;
}

// ─── --analyze ────────────────────────────────────────────────────────────────

int run_analyze(const std::string& path, const Args& args) {
    const auto threads = numeric<long long>(args, "--threads", 1);
    const auto top     = numeric<long long>(args, "--top", 10);
    if (!threads || !top || *threads < 1 || *top < 0) {
        fmt::print(stderr, "Error: --threads must be ≥ 1 and --top ≥ 0\n");
        return 1;
    }

    const auto records = load_records(path);
    if (!records) return 1;

    fras::pipeline::PipelineConfig config;
    config.worker_threads = static_cast<std::size_t>(*threads);
    config.top_alerts     = static_cast<std::size_t>(*top);
    config.verbose        = args.has("--verbose");
    const fras::pipeline::FraudAnalysisPipeline pipeline(config);

    std::optional<fras::pipeline::AnalysisReport> report;
    if (const auto model_path = args.get("--model")) {
        auto params = fras::classifier::load_model(*model_path);
        if (!params) {
            fmt::print(stderr, "Error: cannot load model '{}'\n", *model_path);
            return 1;
        }
        auto model = fras::classifier::Classifier::from_parameters(std::move(*params));
        if (!model) {
            fmt::print(stderr, "Error: model '{}' is inconsistent\n", *model_path);
            return 1;
        }
        report = pipeline.run(*records, *model);
    } else {
        report = pipeline.run(*records);
    }

    if (!report) {
        for (const auto& p : config.validate()) fmt::print(stderr, "Error: {}\n", p);
        return 1;
    }

    if (args.has("--json")) {
        fmt::print("{}\n", fras::pipeline::to_json(*report));
        return 0;
    }

    fmt::print("Status: {}  (input {}, analysed {}, skipped {})\n",
               report->status, report->input_count, report->batch_size,
               report->skipped.size());
    for (const auto& s : report->skipped) {
        fmt::print("  skipped #{} '{}': {}\n", s.index, s.id, s.reason);
    }
    if (report->classifier_error) {
        fmt::print("Classifier error: {} (rule-only scores)\n", *report->classifier_error);
    }
    if (report->profile && report->profile->benford) {
        const auto& b = *report->profile->benford;
        fmt::print("Benford: chi-square {:.3f} ({}{})\n", b.chi_square,
                   fras::profile::to_string(b.compliance),
                   b.low_confidence ? ", low confidence" : "");
    }
    fmt::print("Severity:");
    for (const auto level : fras::ALL_RISK_LEVELS) {
        fmt::print(" {}={}", fras::to_string(level), report->count(level));
    }
    fmt::print("\nOutliers: {}\n", report->outlier_count);

    fras::pipeline::StreamAlertSink sink(stdout);
    fras::pipeline::notify(*report, sink);

    fmt::print("Recommendations:\n");
    for (const auto& r : report->recommendations) fmt::print("  - {}\n", r);
    return 0;
}

// ─── --profile ────────────────────────────────────────────────────────────────

int run_profile(const std::string& path) {
    const auto records = load_records(path);
    if (!records) return 1;

    const fras::pipeline::FraudAnalysisPipeline pipeline;
    const auto batch = pipeline.featurize(*records);
    if (!batch || !batch->profile) {
        fmt::print(stderr, "Error: no valid records in '{}'\n", path);
        return 1;
    }
    for (const auto& s : batch->skipped) {
        fmt::print(stderr, "skipped #{} '{}': {}\n", s.index, s.id, s.reason);
    }
    fmt::print("{}\n", fras::pipeline::to_json(*batch->profile));
    return 0;
}

// ─── --train ──────────────────────────────────────────────────────────────────

int run_train(const std::string& path, const Args& args) {
    const auto out_path = args.get("--out");
    if (!out_path) {
        fmt::print(stderr, "Error: --train requires --out <model path>\n");
        return 1;
    }

    const auto epochs     = numeric<long long>(args, "--epochs", 200);
    const auto lr         = numeric<double>(args, "--lr", 0.05);
    const auto batch_size = numeric<long long>(args, "--batch", 8);
    const auto seed       = numeric<long long>(args, "--seed", 42);
    const auto split      = numeric<double>(args, "--validation", 0.2);
    const auto threads    = numeric<long long>(args, "--threads", 1);
    if (!epochs || !lr || !batch_size || !seed || !split || !threads) return 1;
    if (!fits_int(*epochs, "--epochs") || !fits_int(*batch_size, "--batch")
        || !fits_int(*threads, "--threads")) {
        return 1;
    }

    const auto records = load_records(path);
    if (!records) return 1;

    const fras::pipeline::FraudAnalysisPipeline pipeline;
    const auto batch = pipeline.featurize(*records);
    if (!batch) {
        fmt::print(stderr, "Error: invalid pipeline configuration\n");
        return 1;
    }

    const auto shape = args.has("--binary") ? fras::classifier::ClassifierConfig::binary()
                                            : fras::classifier::ClassifierConfig{};
    const auto examples =
        fras::pipeline::labelled_examples(*records, *batch, shape.layers.back().units);
    fmt::print("Labelled examples: {} of {} record(s)\n", examples.size(), records->size());

    fras::classifier::Classifier model(shape);
    model.compile(static_cast<std::uint64_t>(*seed));

    fras::classifier::TrainingConfig tc;
    tc.epochs           = static_cast<int>(*epochs);
    tc.learning_rate    = *lr;
    tc.batch_size       = static_cast<int>(*batch_size);
    tc.seed             = static_cast<std::uint64_t>(*seed);
    tc.validation_split = *split;
    tc.threads          = static_cast<int>(*threads);
    tc.verbose          = args.has("--verbose");

    const auto report = model.train(examples, tc);
    if (!report.ok()) {
        fmt::print(stderr, "Error: training failed: {}\n", fras::to_string(*report.error));
        for (const auto& p : tc.validate()) fmt::print(stderr, "  {}\n", p);
        return 1;
    }

    fmt::print("Trained {} epoch(s); final loss {:.6f}\n",
               report.epochs_completed,
               report.epoch_losses.empty() ? 0.0 : report.epoch_losses.back());
    if (report.best_validation_accuracy) {
        fmt::print("Best validation accuracy: {:.4f}\n", *report.best_validation_accuracy);
    }
    if (const auto m = model.evaluate(examples)) {
        fmt::print("Training set: accuracy {:.4f}  precision {:.4f}  recall {:.4f}  F1 {:.4f}\n",
                   m->accuracy, m->precision, m->recall, m->f1);
    }

    const auto format = args.has("--binary-format") ? fras::classifier::ModelFormat::Binary
                                                    : fras::classifier::ModelFormat::Json;
    if (!fras::classifier::save_model(model.parameters(), *out_path, format)) {
        fmt::print(stderr, "Error: cannot write model to '{}'\n", *out_path);
        return 1;
    }
    fmt::print("Model written to '{}'\n", *out_path);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--analyze" && mode != "--profile" && mode != "--train") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires an input file\n", mode);
        print_usage();
        return 1;
    }

    const std::string path(argv[2]);
    const auto args = parse_args(argc, argv, 3);
    if (!args) {
        print_usage();
        return 1;
    }

    if (mode == "--analyze") return run_analyze(path, *args);
    if (mode == "--profile") return run_profile(path);
    return run_train(path, *args);
}
