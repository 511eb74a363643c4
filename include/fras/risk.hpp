#pragma once

/// @file include/fras/risk.hpp
/// @brief Risk Scorer: weighted signal combination into a 0–100 verdict.
///
/// # Module: Risk Scorer
///
/// ## Responsibility
/// Combine five per-transaction signals into an integer risk score, map it to
/// a band and explain which signals drove it.
///
/// ## Formula
/// ```
/// score = round(100 · (w_c·classifier + w_o·outlier + w_a·amount
///                      + w_t·timing + w_p·pattern))
/// ```
/// Each signal is clamped to [0, 1] first (NaN counts as 0). Without a
/// classifier signal, `w_c` is spread over the other four weights in
/// proportion to their size.
///
/// ## Bands
/// | score   | band     |
/// |---------|----------|
/// | < 20    | MINIMAL  |
/// | 20–39   | LOW      |
/// | 40–59   | MEDIUM   |
/// | 60–79   | HIGH     |
/// | ≥ 80    | CRITICAL |
///
/// ## Guarantees
/// - `risk_score ∈ [0, 100]` for any input, including NaN and ±∞
/// - Deterministic, no shared state

#include "fras/types.hpp"
#include "fras/outlier.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fras::risk {

/// Relative weight of each signal. Must be non-negative and sum to 1.
struct RiskWeights {
    double classifier = 0.40;
    double outlier    = 0.20;
    double amount     = 0.15;
    double timing     = 0.15;
    double pattern    = 0.10;

    [[nodiscard]] double sum() const noexcept;

    /// Non-negative, finite, Σ = 1 within `WEIGHT_SUM_TOLERANCE`.
    [[nodiscard]] bool is_valid() const noexcept;

    /// Weights with `classifier` moved onto the other four proportionally.
    /// If the other four are all zero, they share it equally.
    [[nodiscard]] RiskWeights without_classifier() const noexcept;
};

/// Level above which a signal is named in the reasoning.
struct RiskThresholds {
    double classifier = 0.50;
    double outlier    = 0.25;
    double amount     = 0.50;
    double timing     = 0.50;
    double pattern    = 0.50;
};

struct RiskSignals {
    double amount_risk   = 0.0;
    double timing_risk   = 0.0;
    double pattern_risk  = 0.0;
    double outlier_score = 0.0;
    bool   outlier_flag  = false;
    std::optional<double> classifier_probability;  ///< nullopt ⇒ rule-only
};

struct RiskVerdict {
    std::string              transaction_id;
    int                      risk_score = 0;   ///< 0–100
    RiskLevel                risk_level = RiskLevel::Minimal;
    RiskSignals              signals;          ///< Clamped values actually used
    std::vector<std::string> reasoning;
};

/// Band for an integer score.
[[nodiscard]] RiskLevel level_for(int score) noexcept;

/// Derive the rule-based signals from a feature vector and outlier result.
/// `classifier_probability` is left empty.
[[nodiscard]] RiskSignals
derive_signals(const FeatureVector& features,
               const outlier::OutlierResult& outlier) noexcept;

class RiskScorer {
public:
    /// # Returns
    /// `nullopt` if `weights` is not valid.
    [[nodiscard]] static std::optional<RiskScorer>
    create(RiskWeights weights = RiskWeights{},
           RiskThresholds thresholds = RiskThresholds{}) noexcept;

    [[nodiscard]] RiskVerdict score(std::string transaction_id,
                                    const RiskSignals& signals) const;

    [[nodiscard]] const RiskWeights& weights() const noexcept { return weights_; }

private:
    RiskScorer(RiskWeights weights, RiskThresholds thresholds) noexcept;

    RiskWeights    weights_;
    RiskThresholds thresholds_;
};

} // namespace fras::risk
