#pragma once

/// @file include/fras/profile.hpp
/// @brief Batch Profiler: distributional statistics over transaction amounts.
///
/// # Module: Batch Profiler
///
/// ## Responsibility
/// Compute, once per batch, the statistics every downstream component reads:
/// location and spread, higher moments, a percentile table, the absolute-
/// amount quartiles used by the IQR outlier test, and a Benford's-Law
/// first-digit test.
///
/// ## Formulas
/// ```
/// mean     = Σx / n
/// variance = Σ(x − mean)² / n                       (population)
/// skewness = n/((n−1)(n−2)) · Σ((x − mean)/s)³
/// kurtosis = n(n+1)/((n−1)(n−2)(n−3)) · Σ((x − mean)/s)⁴
///            − 3(n−1)²/((n−2)(n−3))
/// ```
/// where `s` is the sample standard deviation (the estimators above are the
/// adjusted Fisher–Pearson forms, defined on `s`).
///
/// Percentiles interpolate linearly between order statistics at index
/// `p/100 · (n − 1)`.
///
/// ## Benford's Law
/// The leading significant digit d ∈ 1…9 of every positive amount is
/// counted. Zero and negative amounts are ignored unless
/// `ProfilerConfig::benford_strip_sign` is set, in which case the sign is
/// stripped first and negatives are counted by magnitude.
/// ```
/// expected(d) = log10(1 + 1/d)
/// χ²          = Σ (observed_count − expected_count)² / expected_count   (df = 8)
/// ```
/// Compliance: Good if χ² < 15.51, Acceptable if χ² < 20.09, else Poor.
/// Below 10 digits the band is Indeterminate; χ² is still reported.
///
/// ## Edge Cases
/// - Empty batch: `profile()` returns `nullopt`
/// - n = 1: `sample_size_insufficient`, moments 0
/// - n < 4 or zero spread: moments 0, `moments_low_confidence`
/// - fewer than 10 leading digits: Benford `low_confidence`, compliance
///   Indeterminate
/// - no positive amount: no Benford analysis at all
///
/// ## Guarantees
/// - Pure: the same amounts always produce the same profile
/// - Write-once: a profile describes exactly one batch and is never updated

#include "fras/types.hpp"
#include "fras/constants.hpp"

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace fras::profile {

// ─── Benford ──────────────────────────────────────────────────────────────────

enum class BenfordCompliance { Good, Acceptable, Poor, Indeterminate };

/// Lower-case compliance name ("good", "acceptable", "poor",
/// "indeterminate").
[[nodiscard]] std::string_view to_string(BenfordCompliance c) noexcept;

/// Result of the first-digit test. Arrays are indexed by digit − 1.
struct BenfordAnalysis {
    std::array<std::size_t, 9> observed_counts{};
    std::array<double, 9>      observed{};   ///< Observed frequencies, Σ = 1
    std::array<double, 9>      expected{};   ///< log10(1 + 1/d), Σ = 1
    std::size_t       sample_size    = 0;    ///< Digits counted
    double            chi_square     = 0.0;
    double            deviation_score = 0.0; ///< Σ |observed − expected|
    BenfordCompliance compliance     = BenfordCompliance::Good;
    bool              low_confidence = false; ///< sample_size < 10
};

// ─── Profile ──────────────────────────────────────────────────────────────────

/// Percentile ranks reported in every profile.
static constexpr std::array<double, 9> PERCENTILE_RANKS = {
    1.0, 5.0, 10.0, 25.0, 50.0, 75.0, 90.0, 95.0, 99.0,
};

struct PercentileEntry {
    double rank;   ///< 0–100
    double value;
};

/// Aggregate statistics over the amounts of one batch.
struct BatchProfile {
    std::size_t count = 0;
    double mean     = 0.0;
    double median   = 0.0;
    double variance = 0.0;  ///< Population variance
    double stddev   = 0.0;  ///< Population standard deviation
    double min      = 0.0;
    double max      = 0.0;
    double coefficient_of_variation = 0.0;  ///< stddev / |mean|, 0 if mean = 0
    double skewness = 0.0;
    double kurtosis = 0.0;                  ///< Excess kurtosis

    bool sample_size_insufficient = false;  ///< n = 1
    bool moments_low_confidence   = false;  ///< n < 4 or zero spread

    std::vector<PercentileEntry> percentiles;

    double abs_q1 = 0.0;  ///< 25th percentile of |amount|
    double abs_q3 = 0.0;  ///< 75th percentile of |amount|

    std::vector<double> sorted_amounts;  ///< Ascending

    std::optional<BenfordAnalysis> benford;

    /// Value at `rank` from the percentile table, if that rank was computed.
    [[nodiscard]] std::optional<double> percentile_at(double rank) const noexcept;

    /// Fraction of batch amounts ≤ `amount`, in [0, 1].
    [[nodiscard]] double percentile_rank(double amount) const noexcept;
};

/// Knobs for the profiler.
struct ProfilerConfig {
    /// Count negative amounts in the Benford test by magnitude.
    bool benford_strip_sign = false;
};

// ─── BatchProfiler ────────────────────────────────────────────────────────────

/// Computes BatchProfile values. Stateless apart from its configuration.
class BatchProfiler {
public:
    explicit BatchProfiler(ProfilerConfig config = ProfilerConfig{}) noexcept;

    /// Profile a batch of amounts.
    ///
    /// # Returns
    /// `nullopt` for an empty batch or any non-finite amount.
    [[nodiscard]] std::optional<BatchProfile>
    profile(std::span<const double> amounts) const;

    /// Linear-interpolation percentile of an ascending-sorted sample.
    ///
    /// # Arguments
    /// * `sorted`: Ascending values, non-empty
    /// * `rank`: Percentile in [0, 100]; clamped outside that range
    ///
    /// # Returns
    /// `nullopt` if `sorted` is empty.
    [[nodiscard]] static std::optional<double>
    percentile(std::span<const double> sorted, double rank) noexcept;

    /// Run the Benford first-digit test alone.
    ///
    /// # Returns
    /// `nullopt` when no amount contributes a digit.
    [[nodiscard]] static std::optional<BenfordAnalysis>
    benford(std::span<const double> amounts, bool strip_sign = false);

    /// Leading significant digit of |x| (1–9), or `nullopt` for zero and
    /// non-finite values.
    [[nodiscard]] static std::optional<int> leading_digit(double x);

private:
    ProfilerConfig config_;
};

} // namespace fras::profile
