#pragma once

/// @file include/fras/features.hpp
/// @brief Feature Extractor: transaction → fixed-length numeric encoding.
///
/// # Module: Feature Extractor
///
/// ## Responsibility
/// Encode one validated transaction as a `FeatureVector` of exactly
/// `FEATURE_DIM` (= 20) values, each in [0, 1]. The layout is fixed by the
/// `Feature` enumeration below; model snapshots depend on it.
///
/// ## Feature Groups
///   - 0–4   amount: log magnitude, micro-amount, anchor deviation,
///           round number, fractional manipulation
///   - 5–12  time: hour, weekday, weekend, holiday, business hours,
///           unusual timing, month end, quarter end
///   - 13–16 behaviour within the batch: counterparty frequency, velocity,
///           duplicate amounts, suspicious description terms
///   - 17–19 position in the batch distribution: z-score magnitude,
///           percentile, Benford digit deviation
///
/// Features 13–15 and 17–19 need a `BatchContext` and a `BatchProfile`. The
/// single-transaction overload of `extract` leaves them at their neutral
/// values (0, or 0.5 for the percentile); the description feature needs
/// only the record and is always filled.
///
/// ## Guarantees
/// - Deterministic: no randomness, no clock reads
/// - Every feature is finite and within [0, 1]
///
/// ## NOT Responsible For
/// - Record validation (see pipeline.hpp; invalid records never get here)
/// - Turning features into risk signals (see risk.hpp)

#include "fras/types.hpp"
#include "fras/profile.hpp"

#include <array>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace fras::features {

/// Index of each value in a FeatureVector.
enum class Feature : int {
    AmountLog = 0,
    MicroAmount,
    MagnitudeDeviation,
    RoundNumber,
    FractionalManipulation,
    HourOfDay,
    DayOfWeek,
    Weekend,
    Holiday,
    BusinessHours,
    UnusualTiming,
    MonthEnd,
    QuarterEnd,
    CounterpartyFrequency,
    Velocity,
    DuplicateAmount,
    DescriptionRisk,
    ZScoreMagnitude,
    AmountPercentile,
    BenfordDigitDeviation,
};

static_assert(static_cast<int>(Feature::BenfordDigitDeviation) + 1
                  == constants::FEATURE_DIM,
              "Feature enumeration must cover the whole vector");

/// Read one named feature.
[[nodiscard]] inline double at(const FeatureVector& v, Feature f) noexcept {
    return v(static_cast<int>(f));
}

/// snake_case feature name, for reports and debugging.
[[nodiscard]] std::string_view to_string(Feature f) noexcept;

/// A fixed-date holiday (same month and day every year).
struct MonthDay {
    unsigned month;
    unsigned day;
};

/// Extraction parameters.
struct FeatureConfig {
    double micro_threshold = constants::MICRO_AMOUNT_THRESHOLD;
    long long velocity_window_seconds = constants::VELOCITY_WINDOW_SECONDS;
    double zscore_threshold = constants::DEFAULT_ZSCORE_THRESHOLD;

    std::vector<MonthDay> holidays = {{1, 1}, {7, 4}, {12, 25}};

    /// Lower-case terms; a word starting with one raises the description
    /// feature ("loans" matches "loan").
    std::vector<std::string> suspicious_terms = {
        "cash", "reimburse", "personal", "loan", "advance",
    };
};

// ─── BatchContext ─────────────────────────────────────────────────────────────

/// Per-batch lookup tables for the behavioural features.
///
/// Built once from the validated batch, then read-only; safe to share across
/// worker threads.
class BatchContext {
public:
    /// Index a batch.
    static BatchContext build(std::span<const Transaction> batch);

    /// Number of transactions in the batch sharing `t`'s counterparty
    /// (including `t`). 0 when `t` has no counterparty.
    [[nodiscard]] std::size_t counterparty_count(const Transaction& t) const;

    /// Same-counterparty transactions other than `t` whose timestamps lie
    /// within ±`window_seconds` of `t`.
    [[nodiscard]] std::size_t
    neighbours_within(const Transaction& t, long long window_seconds) const;

    /// Other transactions whose amount equals `t`'s to 1/10000 of a unit.
    [[nodiscard]] std::size_t duplicate_amounts(const Transaction& t) const;

    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    /// Amount rounded to 1/10000 (the duplicate-detection key). Amounts too
    /// large to scale key on their exact value.
    [[nodiscard]] static double amount_key(double amount) noexcept;

    std::size_t size_ = 0;
    std::unordered_map<std::string, std::vector<long long>> times_by_party_;
    std::unordered_map<double, std::size_t>                 amount_counts_;
};

// ─── FeatureExtractor ─────────────────────────────────────────────────────────

/// Builds FeatureVectors. Holds only configuration; `extract` is const and
/// may be called concurrently.
class FeatureExtractor {
public:
    explicit FeatureExtractor(FeatureConfig config = FeatureConfig{});

    /// Encode a transaction on its own (batch features neutral).
    [[nodiscard]] FeatureVector extract(const Transaction& t) const;

    /// Encode a transaction within its batch.
    [[nodiscard]] FeatureVector
    extract(const Transaction& t,
            const BatchContext& context,
            const profile::BatchProfile& profile) const;

    /// Encode a whole batch (context built internally).
    [[nodiscard]] std::vector<FeatureVector>
    extract_all(std::span<const Transaction> batch,
                const profile::BatchProfile& profile) const;

    [[nodiscard]] const FeatureConfig& config() const noexcept { return config_; }

    // ── Individual encoders (exposed for testing) ───────────────────────────

    [[nodiscard]] static double amount_log(double amount) noexcept;
    [[nodiscard]] double micro_amount(double amount) const noexcept;
    [[nodiscard]] static double magnitude_deviation(double amount) noexcept;
    [[nodiscard]] static double round_number(double amount) noexcept;
    [[nodiscard]] static double fractional_manipulation(double amount) noexcept;
    [[nodiscard]] static double unusual_timing(int hour, unsigned weekday) noexcept;
    [[nodiscard]] double description_risk(const std::string& description) const;

private:
    void fill_amount(FeatureVector& v, double amount) const noexcept;
    void fill_temporal(FeatureVector& v, const Transaction& t) const;

    FeatureConfig config_;
};

} // namespace fras::features
