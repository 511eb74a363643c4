/// @file src/outlier/outlier_detector.cpp
/// @brief OutlierDetector: z-score and IQR tests.

#include "fras/outlier.hpp"

#include <algorithm>
#include <cmath>

namespace fras::outlier {

using constants::FLOAT_EPSILON;

std::string_view to_string(OutlierSeverity s) noexcept {
    switch (s) {
        case OutlierSeverity::None:     return "none";
        case OutlierSeverity::Mild:     return "mild";
        case OutlierSeverity::Moderate: return "moderate";
        case OutlierSeverity::Extreme:  return "extreme";
    }
    return "unknown";
}

OutlierDetector::OutlierDetector(OutlierConfig config) noexcept
    : config_(config) {}

double OutlierDetector::zscore(double amount,
                               const profile::BatchProfile& profile) noexcept {
    if (!(profile.stddev > FLOAT_EPSILON) || !std::isfinite(amount)) return 0.0;
    return std::abs(amount - profile.mean) / profile.stddev;
}

OutlierSeverity OutlierDetector::severity_for(double score, bool flagged) noexcept {
    if (!flagged) return OutlierSeverity::None;
    if (score < 0.25) return OutlierSeverity::Mild;
    if (score < 0.75) return OutlierSeverity::Moderate;
    return OutlierSeverity::Extreme;
}

OutlierResult
OutlierDetector::detect(double amount,
                        const profile::BatchProfile& profile) const noexcept {
    OutlierResult r;
    if (!std::isfinite(amount)) return r;

    // ── Z-score ──────────────────────────────────────────────────────────────
    const double t = config_.zscore_threshold;
    r.zscore = zscore(amount, profile);
    if (profile.stddev > FLOAT_EPSILON && t > 0.0 && r.zscore > t) {
        r.zscore_flag  = true;
        r.zscore_score = std::clamp((r.zscore - t) / t, 0.0, 1.0);
    }

    // ── IQR on |amount| ──────────────────────────────────────────────────────
    const double x     = std::abs(amount);
    const double iqr   = profile.abs_q3 - profile.abs_q1;
    const double lower = profile.abs_q1 - config_.iqr_multiplier * iqr;
    const double upper = profile.abs_q3 + config_.iqr_multiplier * iqr;

    if (x > upper) {
        r.iqr_flag  = true;
        r.iqr_score = std::clamp((x - upper) / std::max(std::abs(upper), FLOAT_EPSILON),
                                 0.0, 1.0);
    } else if (x < lower) {
        r.iqr_flag  = true;
        r.iqr_score = std::clamp((lower - x) / std::max(std::abs(lower), FLOAT_EPSILON),
                                 0.0, 1.0);
    }

    r.score      = std::max(r.zscore_score, r.iqr_score);
    r.is_outlier = r.zscore_flag || r.iqr_flag;
    r.severity   = severity_for(r.score, r.is_outlier);
    return r;
}

} // namespace fras::outlier
