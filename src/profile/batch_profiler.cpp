/// @file src/profile/batch_profiler.cpp
/// @brief BatchProfiler: moments, percentiles and quartiles of a batch.

#include "fras/profile.hpp"

#include <algorithm>
#include <cmath>

namespace fras::profile {

namespace {

/// Adjusted Fisher–Pearson skewness and excess kurtosis, standardised by the
/// sample standard deviation `s`. Requires n ≥ 4 and s > 0.
void sample_moments(std::span<const double> xs, double mean, double s,
                    double& skewness, double& kurtosis) noexcept {
    const double n = static_cast<double>(xs.size());
    double m3 = 0.0;
    double m4 = 0.0;
    for (const double x : xs) {
        const double z  = (x - mean) / s;
        const double z2 = z * z;
        m3 += z2 * z;
        m4 += z2 * z2;
    }
    skewness = n / ((n - 1.0) * (n - 2.0)) * m3;
    kurtosis = n * (n + 1.0) / ((n - 1.0) * (n - 2.0) * (n - 3.0)) * m4
             - 3.0 * (n - 1.0) * (n - 1.0) / ((n - 2.0) * (n - 3.0));
}

} // anonymous namespace

// ─── BatchProfile ─────────────────────────────────────────────────────────────

std::optional<double> BatchProfile::percentile_at(double rank) const noexcept {
    for (const auto& p : percentiles) {
        if (std::abs(p.rank - rank) < 1e-9) return p.value;
    }
    return std::nullopt;
}

double BatchProfile::percentile_rank(double amount) const noexcept {
    if (sorted_amounts.empty() || std::isnan(amount)) return 0.5;
    const auto it = std::upper_bound(sorted_amounts.begin(), sorted_amounts.end(), amount);
    return static_cast<double>(it - sorted_amounts.begin())
         / static_cast<double>(sorted_amounts.size());
}

// ─── BatchProfiler ────────────────────────────────────────────────────────────

BatchProfiler::BatchProfiler(ProfilerConfig config) noexcept
    : config_(config) {}

std::optional<double>
BatchProfiler::percentile(std::span<const double> sorted, double rank) noexcept {
    if (sorted.empty() || std::isnan(rank)) return std::nullopt;

    const double r   = std::clamp(rank, 0.0, 100.0);
    const double idx = r / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto   lo  = static_cast<std::size_t>(std::floor(idx));
    const auto   hi  = static_cast<std::size_t>(std::ceil(idx));
    const double frac = idx - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

std::optional<BatchProfile>
BatchProfiler::profile(std::span<const double> amounts) const {
    if (amounts.empty()) return std::nullopt;
    for (const double a : amounts) {
        if (!std::isfinite(a)) return std::nullopt;
    }

    BatchProfile p;
    const std::size_t n  = amounts.size();
    const double      nd = static_cast<double>(n);
    p.count = n;

    // ── Location and spread (population) ─────────────────────────────────────
    double sum = 0.0;
    for (const double a : amounts) sum += a;
    p.mean = sum / nd;

    double ss = 0.0;
    for (const double a : amounts) {
        const double d = a - p.mean;
        ss += d * d;
    }
    p.variance = ss / nd;
    p.stddev   = std::sqrt(p.variance);
    p.coefficient_of_variation =
        std::abs(p.mean) > constants::FLOAT_EPSILON ? p.stddev / std::abs(p.mean) : 0.0;

    p.sorted_amounts.assign(amounts.begin(), amounts.end());
    std::sort(p.sorted_amounts.begin(), p.sorted_amounts.end());
    p.min    = p.sorted_amounts.front();
    p.max    = p.sorted_amounts.back();
    p.median = *percentile(p.sorted_amounts, 50.0);

    // ── Higher moments ───────────────────────────────────────────────────────
    p.sample_size_insufficient = n == 1;
    const double sample_sd = n > 1 ? std::sqrt(ss / (nd - 1.0)) : 0.0;
    if (n >= constants::MIN_SAMPLES_FOR_MOMENTS && sample_sd > constants::FLOAT_EPSILON) {
        sample_moments(amounts, p.mean, sample_sd, p.skewness, p.kurtosis);
    } else {
        p.moments_low_confidence = true;
    }

    // ── Percentile table ─────────────────────────────────────────────────────
    p.percentiles.reserve(PERCENTILE_RANKS.size());
    for (const double r : PERCENTILE_RANKS) {
        p.percentiles.push_back({r, *percentile(p.sorted_amounts, r)});
    }

    // ── Absolute-amount quartiles (IQR test) ─────────────────────────────────
    std::vector<double> abs_sorted(n);
    std::transform(amounts.begin(), amounts.end(), abs_sorted.begin(),
                   [](double a) { return std::abs(a); });
    std::sort(abs_sorted.begin(), abs_sorted.end());
    p.abs_q1 = *percentile(abs_sorted, 25.0);
    p.abs_q3 = *percentile(abs_sorted, 75.0);

    p.benford = benford(amounts, config_.benford_strip_sign);
    return p;
}

} // namespace fras::profile
