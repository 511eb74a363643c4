/// @file src/risk/risk_scorer.cpp
/// @brief RiskScorer: signal derivation, weighting and reasoning.

#include "fras/risk.hpp"
#include "fras/features.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace fras::risk {

using features::Feature;

namespace {

inline double clamp01(double x) noexcept {
    if (!(x > 0.0)) return 0.0;   // NaN and negatives
    return x < 1.0 ? x : 1.0;
}

inline bool usable_weight(double w) noexcept {
    return std::isfinite(w) && w >= 0.0;
}

} // anonymous namespace

// ─── RiskWeights ──────────────────────────────────────────────────────────────

double RiskWeights::sum() const noexcept {
    return classifier + outlier + amount + timing + pattern;
}

bool RiskWeights::is_valid() const noexcept {
    if (!usable_weight(classifier) || !usable_weight(outlier) || !usable_weight(amount)
        || !usable_weight(timing) || !usable_weight(pattern)) {
        return false;
    }
    return std::abs(sum() - 1.0) <= constants::WEIGHT_SUM_TOLERANCE;
}

RiskWeights RiskWeights::without_classifier() const noexcept {
    const double rest = outlier + amount + timing + pattern;
    if (rest <= constants::FLOAT_EPSILON) {
        return RiskWeights{0.0, 0.25, 0.25, 0.25, 0.25};
    }
    const double total = rest + classifier;
    return RiskWeights{
        .classifier = 0.0,
        .outlier    = outlier / rest * total,
        .amount     = amount  / rest * total,
        .timing     = timing  / rest * total,
        .pattern    = pattern / rest * total,
    };
}

// ─── Signals ──────────────────────────────────────────────────────────────────

RiskLevel level_for(int score) noexcept {
    if (score >= constants::RISK_CRITICAL_FLOOR) return RiskLevel::Critical;
    if (score >= constants::RISK_HIGH_FLOOR)     return RiskLevel::High;
    if (score >= constants::RISK_MEDIUM_FLOOR)   return RiskLevel::Medium;
    if (score >= constants::RISK_LOW_FLOOR)      return RiskLevel::Low;
    return RiskLevel::Minimal;
}

RiskSignals derive_signals(const FeatureVector& f,
                           const outlier::OutlierResult& outlier) noexcept {
    using features::at;

    RiskSignals s;
    s.amount_risk = std::max({at(f, Feature::MicroAmount),
                              at(f, Feature::FractionalManipulation),
                              0.5 * at(f, Feature::RoundNumber)});
    s.timing_risk = std::max({at(f, Feature::UnusualTiming),
                              0.5 * at(f, Feature::Holiday),
                              0.3 * at(f, Feature::QuarterEnd),
                              0.2 * at(f, Feature::MonthEnd)});
    s.pattern_risk = std::max({at(f, Feature::DuplicateAmount),
                               at(f, Feature::Velocity),
                               at(f, Feature::DescriptionRisk)});
    s.outlier_score = outlier.score;
    s.outlier_flag  = outlier.is_outlier;
    return s;
}

// ─── RiskScorer ───────────────────────────────────────────────────────────────

RiskScorer::RiskScorer(RiskWeights weights, RiskThresholds thresholds) noexcept
    : weights_(weights), thresholds_(thresholds) {}

std::optional<RiskScorer>
RiskScorer::create(RiskWeights weights, RiskThresholds thresholds) noexcept {
    if (!weights.is_valid()) return std::nullopt;
    return RiskScorer(weights, thresholds);
}

RiskVerdict RiskScorer::score(std::string transaction_id,
                              const RiskSignals& in) const {
    RiskSignals s;
    s.amount_risk   = clamp01(in.amount_risk);
    s.timing_risk   = clamp01(in.timing_risk);
    s.pattern_risk  = clamp01(in.pattern_risk);
    s.outlier_score = clamp01(in.outlier_score);
    s.outlier_flag  = in.outlier_flag;
    if (in.classifier_probability) {
        s.classifier_probability = clamp01(*in.classifier_probability);
    }

    const RiskWeights w = s.classifier_probability ? weights_
                                                   : weights_.without_classifier();
    const double combined = w.classifier * s.classifier_probability.value_or(0.0)
                          + w.outlier    * s.outlier_score
                          + w.amount     * s.amount_risk
                          + w.timing     * s.timing_risk
                          + w.pattern    * s.pattern_risk;

    RiskVerdict v;
    v.transaction_id = std::move(transaction_id);
    v.risk_score     = static_cast<int>(std::clamp(std::lround(100.0 * combined), 0L, 100L));
    v.risk_level     = level_for(v.risk_score);

    if (s.classifier_probability && *s.classifier_probability > thresholds_.classifier) {
        v.reasoning.push_back(fmt::format("classifier fraud probability {:.2f}",
                                          *s.classifier_probability));
    }
    if (s.outlier_score > thresholds_.outlier) {
        v.reasoning.push_back(fmt::format("statistical outlier detected (score {:.2f})",
                                          s.outlier_score));
    }
    if (s.amount_risk > thresholds_.amount) {
        v.reasoning.push_back(fmt::format("suspicious amount pattern (risk {:.2f})",
                                          s.amount_risk));
    }
    if (s.timing_risk > thresholds_.timing) {
        v.reasoning.push_back(fmt::format("unusual transaction timing (risk {:.2f})",
                                          s.timing_risk));
    }
    if (s.pattern_risk > thresholds_.pattern) {
        v.reasoning.push_back(fmt::format("repetitive or high-velocity pattern (risk {:.2f})",
                                          s.pattern_risk));
    }
    if (v.reasoning.empty()) {
        v.reasoning.emplace_back("no specific fraud indicators detected");
    }
    if (!s.classifier_probability) {
        v.reasoning.emplace_back("classifier unavailable; rule-only score");
    }

    v.signals = s;
    return v;
}

} // namespace fras::risk
