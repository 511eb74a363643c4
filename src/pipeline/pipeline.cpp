/// @file src/pipeline/pipeline.cpp
/// @brief FraudAnalysisPipeline: validation, profiling barrier, parallel
///        scoring and report aggregation.

#include "fras/pipeline.hpp"
#include "fras/calendar.hpp"
#include "fras/parallel.hpp"
#include "fras/report_cache.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace fras::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Validated subset of a batch.
struct ValidBatch {
    std::vector<Transaction>   transactions;
    std::vector<std::size_t>   source_index;
    std::vector<SkippedRecord> skipped;
};

ValidBatch validate_all(std::span<const RawRecord> records) {
    ValidBatch vb;
    vb.transactions.reserve(records.size());
    vb.source_index.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto check = validate_record(records[i]);
        if (check.transaction) {
            vb.transactions.push_back(std::move(*check.transaction));
            vb.source_index.push_back(i);
        } else {
            vb.skipped.push_back({i, records[i].id, std::move(check.reason)});
        }
    }
    return vb;
}

bool finite_unit(double x) noexcept {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

} // anonymous namespace

// ─── PipelineConfig ───────────────────────────────────────────────────────────

std::vector<std::string> PipelineConfig::validate() const {
    std::vector<std::string> problems;
    if (!weights.is_valid()) {
        problems.push_back(fmt::format(
            "risk weights must be non-negative and sum to 1 (sum = {})", weights.sum()));
    }
    if (!finite_unit(thresholds.classifier) || !finite_unit(thresholds.outlier) ||
        !finite_unit(thresholds.amount) || !finite_unit(thresholds.timing) ||
        !finite_unit(thresholds.pattern)) {
        problems.emplace_back("reasoning thresholds must lie in [0, 1]");
    }
    if (!std::isfinite(outlier.zscore_threshold) || outlier.zscore_threshold <= 0.0) {
        problems.emplace_back("z-score threshold must be positive");
    }
    if (!std::isfinite(outlier.iqr_multiplier) || outlier.iqr_multiplier < 0.0) {
        problems.emplace_back("IQR multiplier must be non-negative");
    }
    if (!std::isfinite(features.micro_threshold) || features.micro_threshold <= 0.0) {
        problems.emplace_back("micro-amount threshold must be positive");
    }
    if (!std::isfinite(features.zscore_threshold) || features.zscore_threshold <= 0.0) {
        problems.emplace_back("feature z-score threshold must be positive");
    }
    if (features.velocity_window_seconds < 0) {
        problems.emplace_back("velocity window must not be negative");
    }
    for (const auto& h : features.holidays) {
        if (!std::chrono::month{h.month}.ok() || h.day < 1 || h.day > 31) {
            problems.push_back(fmt::format("invalid holiday {}-{}", h.month, h.day));
        }
    }
    if (worker_threads < 1) {
        problems.emplace_back("worker_threads must be at least 1");
    }
    return problems;
}

// ─── validate_record ──────────────────────────────────────────────────────────

RecordCheck validate_record(const RawRecord& record) {
    RecordCheck check;

    if (!record.amount) {
        check.reason = "missing amount";
        return check;
    }
    const std::string text{trim(*record.amount)};
    if (text.empty()) {
        check.reason = "missing amount";
        return check;
    }

    double amount = 0.0;
    try {
        std::size_t pos = 0;
        amount = std::stod(text, &pos);
        if (pos != text.size()) {
            check.reason = fmt::format("non-numeric amount '{}'", text);
            return check;
        }
    } catch (const std::invalid_argument&) {
        check.reason = fmt::format("non-numeric amount '{}'", text);
        return check;
    } catch (const std::out_of_range&) {
        check.reason = fmt::format("amount out of range '{}'", text);
        return check;
    }
    if (!std::isfinite(amount)) {
        check.reason = fmt::format("non-finite amount '{}'", text);
        return check;
    }

    if (!record.timestamp || trim(*record.timestamp).empty()) {
        check.reason = "missing timestamp";
        return check;
    }
    const auto ts = calendar::parse_iso8601(*record.timestamp);
    if (!ts) {
        check.reason = fmt::format("unparseable timestamp '{}'", *record.timestamp);
        return check;
    }

    check.transaction = Transaction{
        .id          = record.id,
        .amount      = amount,
        .timestamp   = *ts,
        .account     = record.account,
        .vendor      = record.vendor,
        .description = record.description,
    };
    return check;
}

// ─── FraudAnalysisPipeline ────────────────────────────────────────────────────

FraudAnalysisPipeline::FraudAnalysisPipeline(PipelineConfig config)
    : config_(std::move(config)) {}

std::optional<AnalysisReport>
FraudAnalysisPipeline::run(std::span<const RawRecord> records) const {
    return analyse(records, nullptr);
}

std::optional<AnalysisReport>
FraudAnalysisPipeline::run(std::span<const RawRecord> records,
                           const classifier::Classifier& model) const {
    return analyse(records, &model);
}

std::optional<AnalysisReport>
FraudAnalysisPipeline::run_cached(std::span<const RawRecord> records,
                                  const classifier::Classifier* model,
                                  ReportCache& cache) const {
    const auto key = cache_key(records, config_, model ? &model->parameters() : nullptr);
    if (auto hit = cache.get(key)) {
        if (config_.verbose) fmt::print(stderr, "report cache hit {}\n", key);
        return hit;
    }
    auto report = analyse(records, model);
    if (report) cache.put(key, *report);
    return report;
}

std::optional<FeaturizedBatch>
FraudAnalysisPipeline::featurize(std::span<const RawRecord> records) const {
    if (!config_.validate().empty()) return std::nullopt;

    auto valid = validate_all(records);
    FeaturizedBatch out;
    out.skipped      = std::move(valid.skipped);
    out.source_index = std::move(valid.source_index);
    out.transactions = std::move(valid.transactions);
    if (out.transactions.empty()) return out;

    std::vector<double> amounts;
    amounts.reserve(out.transactions.size());
    for (const auto& t : out.transactions) amounts.push_back(t.amount);

    out.profile = profile::BatchProfiler(config_.profiler).profile(amounts);
    if (!out.profile) return out;

    const features::FeatureExtractor extractor(config_.features);
    out.features = extractor.extract_all(out.transactions, *out.profile);
    return out;
}

std::optional<AnalysisReport>
FraudAnalysisPipeline::analyse(std::span<const RawRecord> records,
                               const classifier::Classifier* model) const {
    const auto problems = config_.validate();
    if (!problems.empty()) {
        if (config_.verbose) {
            for (const auto& p : problems) fmt::print(stderr, "configuration error: {}\n", p);
        }
        return std::nullopt;
    }
    const auto scorer = risk::RiskScorer::create(config_.weights, config_.thresholds);
    if (!scorer) return std::nullopt;

    const auto t0 = Clock::now();
    AnalysisReport report;
    report.input_count = records.size();

    // ── Stage 1: validation ──────────────────────────────────────────────────
    auto valid = validate_all(records);
    report.skipped    = std::move(valid.skipped);
    report.batch_size = valid.transactions.size();
    const auto& txs   = valid.transactions;

    if (config_.verbose) {
        fmt::print(stderr, "validated {} record(s), {} skipped ({:.2f} ms)\n",
                   records.size(), report.skipped.size(), elapsed_ms(t0));
    }

    if (txs.empty()) {
        report.status = "no_valid_records";
        report.recommendations = recommendations_for(report);
        return report;
    }

    // ── Stage 2: profile (barrier) ───────────────────────────────────────────
    std::vector<double> amounts;
    amounts.reserve(txs.size());
    for (const auto& t : txs) amounts.push_back(t.amount);

    auto prof = profile::BatchProfiler(config_.profiler).profile(amounts);
    if (!prof) {
        report.status = "no_valid_records";
        report.recommendations = recommendations_for(report);
        return report;
    }
    const profile::BatchProfile& profile = *prof;
    const auto context = features::BatchContext::build(txs);

    // ── Classifier availability ──────────────────────────────────────────────
    const classifier::Classifier* active = nullptr;
    if (model) {
        if (!model->is_compiled()) {
            report.classifier_error = std::string(to_string(ErrorCode::ModelNotCompiled));
        } else if (model->input_size() != constants::FEATURE_DIM) {
            report.classifier_error = std::string(to_string(ErrorCode::ConfigurationError));
        } else {
            active = model;
        }
    }

    // ── Stage 3: per-transaction scoring ─────────────────────────────────────
    const std::size_t n = txs.size();
    const features::FeatureExtractor extractor(config_.features);
    const outlier::OutlierDetector   detector(config_.outlier);

    std::vector<risk::RiskVerdict> verdicts(n);
    std::vector<FeatureVector>     feature_rows(n);
    std::vector<char>              outlier_flags(n, 0);

    const auto score_range = [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            const auto& t = txs[i];
            feature_rows[i] = extractor.extract(t, context, profile);
            const auto o = detector.detect(t.amount, profile);
            auto signals = risk::derive_signals(feature_rows[i], o);
            if (active) {
                signals.classifier_probability =
                    active->fraud_probability(Eigen::VectorXd(feature_rows[i]));
            }
            outlier_flags[i] = o.is_outlier ? 1 : 0;
            verdicts[i] = scorer->score(t.id, signals);
        }
    };

    const auto t_score = Clock::now();
    const std::size_t threads = for_each_chunk(
        n, config_.worker_threads,
        [&](std::size_t, std::size_t begin, std::size_t end) { score_range(begin, end); });

    if (config_.verbose) {
        fmt::print(stderr, "scored {} transaction(s) on {} thread(s) ({:.2f} ms)\n",
                   n, std::max<std::size_t>(threads, 1), elapsed_ms(t_score));
    }

    // ── Stage 4: aggregation ─────────────────────────────────────────────────
    report.outlier_count = static_cast<std::size_t>(
        std::count(outlier_flags.begin(), outlier_flags.end(), 1));

    auto& micro = report.micro_skimming;
    for (std::size_t i = 0; i < n; ++i) {
        if (features::at(feature_rows[i], features::Feature::MicroAmount) > 0.5) {
            ++micro.count;
            micro.total += std::abs(txs[i].amount);
        }
    }
    if (micro.count > 0) micro.mean = micro.total / static_cast<double>(micro.count);
    micro.share    = static_cast<double>(micro.count) / static_cast<double>(n);
    micro.detected = micro.count >= constants::MICRO_SKIMMING_MIN_COUNT;

    if (config_.keep_features) {
        report.features.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            report.features.push_back({txs[i].id, feature_rows[i]});
        }
    }

    for (const auto& v : verdicts) {
        ++report.severity_counts[static_cast<std::size_t>(v.risk_level)];
    }

    std::stable_sort(verdicts.begin(), verdicts.end(),
                     [](const risk::RiskVerdict& a, const risk::RiskVerdict& b) {
                         return a.risk_score > b.risk_score;
                     });

    for (const auto& v : verdicts) {
        if (report.top_alerts.size() >= config_.top_alerts) break;
        if (v.risk_level == RiskLevel::High || v.risk_level == RiskLevel::Critical) {
            report.top_alerts.push_back(v);
        }
    }

    report.verdicts = std::move(verdicts);
    report.profile  = std::move(prof);
    report.recommendations = recommendations_for(report);

    if (config_.verbose) {
        fmt::print(stderr, "analysis complete: {} alert(s), {} outlier(s) ({:.2f} ms)\n",
                   report.top_alerts.size(), report.outlier_count, elapsed_ms(t0));
    }
    return report;
}

// ─── Training support ─────────────────────────────────────────────────────────

std::vector<classifier::TrainingExample>
labelled_examples(std::span<const RawRecord> records,
                  const FeaturizedBatch& batch,
                  int output_size) {
    std::vector<classifier::TrainingExample> out;
    const std::size_t n = std::min(batch.features.size(), batch.source_index.size());
    out.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        const std::size_t src = batch.source_index[k];
        if (src >= records.size() || !records[src].label) continue;
        const auto label = classifier::label_from_string(*records[src].label);
        if (!label) continue;
        out.push_back({
            Eigen::VectorXd(batch.features[k]),
            output_size == 1 ? classifier::binary_target(*label) : classifier::one_hot(*label),
        });
    }
    return out;
}

// ─── Recommendations ──────────────────────────────────────────────────────────

std::vector<std::string> recommendations_for(const AnalysisReport& report) {
    std::vector<std::string> recs;

    if (report.status == "no_valid_records") {
        recs.emplace_back("No valid records to analyse; check the skipped-record reasons");
        return recs;
    }

    if (report.profile && report.profile->benford) {
        const auto& b = *report.profile->benford;
        if (b.compliance == profile::BenfordCompliance::Poor) {
            recs.push_back(fmt::format(
                "Benford's Law deviation (chi-square {:.2f}): review how these amounts were produced",
                b.chi_square));
        }
    }

    const auto& micro = report.micro_skimming;
    if (micro.detected) {
        recs.push_back(fmt::format(
            "Investigate possible micro-skimming: {} micro-amount transaction(s) totalling {:.4f}",
            micro.count, micro.total));
    }
    if (micro.share > 0.1) {
        recs.push_back(fmt::format(
            "High share of micro-amount transactions ({:.1f}%): confirm their business purpose",
            micro.share * 100.0));
    }

    if (const auto critical = report.count(RiskLevel::Critical); critical > 0) {
        recs.push_back(fmt::format("Escalate {} CRITICAL transaction(s) for immediate review",
                                   critical));
    }
    if (const auto high = report.count(RiskLevel::High); high > 0) {
        recs.push_back(fmt::format("Review {} HIGH-risk transaction(s)", high));
    }
    if (report.outlier_count > 0) {
        recs.push_back(fmt::format("Check {} statistical outlier(s) against source documents",
                                   report.outlier_count));
    }
    if (report.classifier_error) {
        recs.push_back(fmt::format("Classifier unavailable ({}): scores are rule-only",
                                   *report.classifier_error));
    }
    if (!report.skipped.empty()) {
        recs.push_back(fmt::format("Correct {} skipped record(s) and re-run the analysis",
                                   report.skipped.size()));
    }

    if (recs.empty()) recs.emplace_back("No batch-level anomalies detected");
    return recs;
}

} // namespace fras::pipeline
