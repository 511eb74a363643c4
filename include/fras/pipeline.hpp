#pragma once

/// @file include/fras/pipeline.hpp
/// @brief Fraud Analysis Pipeline: batch orchestration and report assembly.
///
/// # Module: FraudAnalysisPipeline
///
/// ## Responsibility
/// Run every component over one batch of raw records and assemble a single
/// report.
///
/// ## Stages
/// ```
/// RawRecord[] ──validate──► Transaction[]  (+ skipped records)
///             ──profile───► BatchProfile   (barrier: written once)
///             ──parallel──► per transaction: features → outlier → classifier
///                                            → RiskVerdict
///             ──aggregate─► AnalysisReport
/// ```
/// The profile is finished before any worker starts; workers only read it
/// and write into their own pre-sized slots, so no locks are taken.
///
/// ## Guarantees
/// - Pure function of (records, model, configuration): identical inputs give
///   identical reports, independent of `worker_threads`
/// - Never mutates records, the model or the configuration
/// - A batch that is empty after validation yields a report with status
///   `no_valid_records`, not an error
/// - An invalid configuration is rejected before any work (`nullopt`)
///
/// ## NOT Responsible For
/// - Training (call `Classifier::train` explicitly)
/// - Alert delivery and report caching (see alert_sink.hpp, report_cache.hpp)

#include "fras/types.hpp"
#include "fras/features.hpp"
#include "fras/profile.hpp"
#include "fras/outlier.hpp"
#include "fras/risk.hpp"
#include "fras/classifier.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fras::pipeline {

class ReportCache;

// ─── Configuration ────────────────────────────────────────────────────────────

struct PipelineConfig {
    features::FeatureConfig   features;
    profile::ProfilerConfig   profiler;
    outlier::OutlierConfig    outlier;
    risk::RiskWeights         weights;
    risk::RiskThresholds      thresholds;
    std::size_t top_alerts     = 10;    ///< Max HIGH/CRITICAL verdicts listed
    std::size_t worker_threads = 1;
    bool        keep_features  = false; ///< Copy feature vectors into the report
    bool        verbose        = false; ///< Stage timings on stderr

    /// Human-readable problems; empty when the configuration is usable.
    [[nodiscard]] std::vector<std::string> validate() const;
};

// ─── Validation ───────────────────────────────────────────────────────────────

struct SkippedRecord {
    std::size_t index;   ///< Position in the input
    std::string id;
    std::string reason;
};

/// Outcome of validating one raw record: a transaction or a reason.
struct RecordCheck {
    std::optional<Transaction> transaction;
    std::string                reason;
};

/// Validate one record (`InvalidRecord` conditions).
[[nodiscard]] RecordCheck validate_record(const RawRecord& record);

// ─── Report ───────────────────────────────────────────────────────────────────

/// Transactions whose micro-amount feature exceeds 0.5.
struct MicroSkimmingSummary {
    std::size_t count    = 0;
    double      total    = 0.0;   ///< Σ |amount|
    double      mean     = 0.0;
    double      share    = 0.0;   ///< count / batch_size
    bool        detected = false; ///< count ≥ MICRO_SKIMMING_MIN_COUNT
};

struct FeatureRow {
    std::string   transaction_id;
    FeatureVector values;
};

struct AnalysisReport {
    std::string status = "ok";   ///< "ok" or "no_valid_records"
    std::size_t input_count = 0;
    std::size_t batch_size  = 0; ///< input_count − skipped.size()

    std::vector<SkippedRecord> skipped;
    std::optional<profile::BatchProfile> profile;

    std::vector<risk::RiskVerdict> verdicts;  ///< Descending score, stable
    std::array<std::size_t, RISK_LEVEL_COUNT> severity_counts{};
    std::size_t outlier_count = 0;
    std::vector<risk::RiskVerdict> top_alerts;

    MicroSkimmingSummary     micro_skimming;
    std::vector<std::string> recommendations;

    /// Name of the `ErrorCode` that forced a rule-only score, if any.
    std::optional<std::string> classifier_error;

    std::vector<FeatureRow> features;  ///< Only with `keep_features`

    [[nodiscard]] std::size_t count(RiskLevel level) const noexcept {
        return severity_counts[static_cast<std::size_t>(level)];
    }
};

/// Validated, featurised batch (for training and inspection).
struct FeaturizedBatch {
    std::vector<Transaction>   transactions;
    std::vector<std::size_t>   source_index;  ///< Input position of each transaction
    std::vector<FeatureVector> features;
    std::vector<SkippedRecord> skipped;
    std::optional<profile::BatchProfile> profile;
};

// ─── Pipeline ─────────────────────────────────────────────────────────────────

class FraudAnalysisPipeline {
public:
    explicit FraudAnalysisPipeline(PipelineConfig config = PipelineConfig{});

    /// Rule-only analysis (classifier weight redistributed).
    [[nodiscard]] std::optional<AnalysisReport>
    run(std::span<const RawRecord> records) const;

    /// Analysis with a classifier signal. An uncompiled or mis-shaped model
    /// falls back to rule-only scoring and sets `classifier_error`.
    [[nodiscard]] std::optional<AnalysisReport>
    run(std::span<const RawRecord> records,
        const classifier::Classifier& model) const;

    /// Look the report up in `cache` first; store it there on a miss.
    /// `model` may be null for rule-only analysis.
    [[nodiscard]] std::optional<AnalysisReport>
    run_cached(std::span<const RawRecord> records,
               const classifier::Classifier* model,
               ReportCache& cache) const;

    /// Validate, profile and featurise without scoring.
    [[nodiscard]] std::optional<FeaturizedBatch>
    featurize(std::span<const RawRecord> records) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::optional<AnalysisReport>
    analyse(std::span<const RawRecord> records,
            const classifier::Classifier* model) const;

    PipelineConfig config_;
};

/// Turn the labelled records of a featurised batch into training examples.
/// Records without a recognisable label are left out. `output_size` 1 gives
/// binary targets, otherwise three-class one-hot targets.
[[nodiscard]] std::vector<classifier::TrainingExample>
labelled_examples(std::span<const RawRecord> records,
                  const FeaturizedBatch& batch,
                  int output_size);

/// Batch-level recommendations for a finished report.
[[nodiscard]] std::vector<std::string>
recommendations_for(const AnalysisReport& report);

/// Serialise a report (stable key order, 17 significant digits).
[[nodiscard]] std::string to_json(const AnalysisReport& report);

/// Serialise a profile on its own.
[[nodiscard]] std::string to_json(const profile::BatchProfile& profile);

} // namespace fras::pipeline
