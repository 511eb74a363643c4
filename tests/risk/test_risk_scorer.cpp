/// @file tests/risk/test_risk_scorer.cpp
/// @brief Unit tests for risk weighting, banding and reasoning.
///
/// Test categories:
///   - Weight validation and classifier-weight redistribution
///   - Band boundaries
///   - Weighted score with and without a classifier signal
///   - Clamping of NaN, infinite and out-of-range signals
///   - Reasoning order and fallbacks
///   - Signal derivation from a feature vector

#include <gtest/gtest.h>
#include "fras/risk.hpp"
#include "fras/features.hpp"

#include <cmath>
#include <limits>

using namespace fras;
using namespace fras::risk;

// ─── Weights ─────────────────────────────────────────────────────────────────

TEST(RiskWeights, DefaultsAreValid) {
    const RiskWeights w;
    EXPECT_TRUE(w.is_valid());
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

TEST(RiskWeights, RejectsBadWeights) {
    EXPECT_FALSE((RiskWeights{0.4, 0.2, 0.15, 0.15, 0.0}).is_valid());
    EXPECT_FALSE((RiskWeights{-0.1, 0.3, 0.3, 0.3, 0.2}).is_valid());
    EXPECT_FALSE((RiskWeights{std::nan(""), 0.3, 0.3, 0.2, 0.2}).is_valid());
    EXPECT_FALSE(RiskScorer::create(RiskWeights{0.5, 0.5, 0.5, 0.0, 0.0}).has_value());
}

TEST(RiskWeights, WithoutClassifierRedistributesProportionally) {
    const auto w = RiskWeights{}.without_classifier();
    EXPECT_DOUBLE_EQ(w.classifier, 0.0);
    EXPECT_NEAR(w.outlier, 0.20 / 0.60, 1e-12);
    EXPECT_NEAR(w.amount, 0.25, 1e-12);
    EXPECT_NEAR(w.timing, 0.25, 1e-12);
    EXPECT_NEAR(w.pattern, 0.10 / 0.60, 1e-12);
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

TEST(RiskWeights, ClassifierOnlyWeightsShareEqually) {
    const auto w = RiskWeights{1.0, 0.0, 0.0, 0.0, 0.0}.without_classifier();
    EXPECT_DOUBLE_EQ(w.outlier, 0.25);
    EXPECT_DOUBLE_EQ(w.pattern, 0.25);
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

// ─── Bands ───────────────────────────────────────────────────────────────────

TEST(RiskScorer, BandBoundaries) {
    EXPECT_EQ(level_for(0), RiskLevel::Minimal);
    EXPECT_EQ(level_for(19), RiskLevel::Minimal);
    EXPECT_EQ(level_for(20), RiskLevel::Low);
    EXPECT_EQ(level_for(39), RiskLevel::Low);
    EXPECT_EQ(level_for(40), RiskLevel::Medium);
    EXPECT_EQ(level_for(59), RiskLevel::Medium);
    EXPECT_EQ(level_for(60), RiskLevel::High);
    EXPECT_EQ(level_for(79), RiskLevel::High);
    EXPECT_EQ(level_for(80), RiskLevel::Critical);
    EXPECT_EQ(level_for(100), RiskLevel::Critical);
    EXPECT_EQ(to_string(RiskLevel::Critical), "CRITICAL");
}

// ─── Scoring ─────────────────────────────────────────────────────────────────

TEST(RiskScorer, WeightedScoreWithClassifier) {
    const auto scorer = RiskScorer::create();
    ASSERT_TRUE(scorer.has_value());

    RiskSignals s;
    s.classifier_probability = 0.9;
    s.outlier_score = 0.5;
    s.amount_risk   = 0.6;
    s.timing_risk   = 0.8;
    s.pattern_risk  = 0.3;

    const auto v = scorer->score("t1", s);
    EXPECT_EQ(v.transaction_id, "t1");
    EXPECT_EQ(v.risk_score, 70);
    EXPECT_EQ(v.risk_level, RiskLevel::High);
    ASSERT_EQ(v.reasoning.size(), 4u);
    EXPECT_EQ(v.reasoning[0], "classifier fraud probability 0.90");
    EXPECT_EQ(v.reasoning[1], "statistical outlier detected (score 0.50)");
    EXPECT_EQ(v.reasoning[2], "suspicious amount pattern (risk 0.60)");
    EXPECT_EQ(v.reasoning[3], "unusual transaction timing (risk 0.80)");
}

TEST(RiskScorer, ClassifierAloneReachesMedium) {
    RiskSignals s;
    s.classifier_probability = 1.0;
    const auto v = RiskScorer::create()->score("c", s);
    EXPECT_EQ(v.risk_score, 40);
    EXPECT_EQ(v.risk_level, RiskLevel::Medium);
}

TEST(RiskScorer, RuleOnlyUsesRedistributedWeights) {
    RiskSignals s;
    s.amount_risk = 1.0;
    const auto v = RiskScorer::create()->score("r", s);
    EXPECT_EQ(v.risk_score, 25);
    EXPECT_EQ(v.risk_level, RiskLevel::Low);
    ASSERT_EQ(v.reasoning.size(), 2u);
    EXPECT_EQ(v.reasoning[0], "suspicious amount pattern (risk 1.00)");
    EXPECT_EQ(v.reasoning[1], "classifier unavailable; rule-only score");
    EXPECT_FALSE(v.signals.classifier_probability.has_value());
}

TEST(RiskScorer, AllSignalsSaturatedIsCritical) {
    RiskSignals s{1.0, 1.0, 1.0, 1.0, true, std::nullopt};
    const auto v = RiskScorer::create()->score("max", s);
    EXPECT_EQ(v.risk_score, 100);
    EXPECT_EQ(v.risk_level, RiskLevel::Critical);
}

TEST(RiskScorer, QuietTransaction) {
    const auto v = RiskScorer::create()->score("q", RiskSignals{});
    EXPECT_EQ(v.risk_score, 0);
    EXPECT_EQ(v.risk_level, RiskLevel::Minimal);
    ASSERT_EQ(v.reasoning.size(), 2u);
    EXPECT_EQ(v.reasoning[0], "no specific fraud indicators detected");
}

// ─── Clamping ────────────────────────────────────────────────────────────────

TEST(RiskScorer, NonFiniteSignalsClamped) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    RiskSignals s;
    s.classifier_probability = nan;
    s.outlier_score = inf;
    s.amount_risk   = -inf;
    s.timing_risk   = 7.0;
    s.pattern_risk  = -3.0;

    const auto v = RiskScorer::create()->score("bad", s);
    EXPECT_GE(v.risk_score, 0);
    EXPECT_LE(v.risk_score, 100);
    ASSERT_TRUE(v.signals.classifier_probability.has_value());
    EXPECT_DOUBLE_EQ(*v.signals.classifier_probability, 0.0);
    EXPECT_DOUBLE_EQ(v.signals.outlier_score, 1.0);
    EXPECT_DOUBLE_EQ(v.signals.amount_risk, 0.0);
    EXPECT_DOUBLE_EQ(v.signals.timing_risk, 1.0);
    EXPECT_DOUBLE_EQ(v.signals.pattern_risk, 0.0);
    // 0.2 · 1 + 0.15 · 1
    EXPECT_EQ(v.risk_score, 35);
}

// ─── Signal derivation ───────────────────────────────────────────────────────

TEST(RiskSignals, DerivedFromFeatures) {
    using features::Feature;
    FeatureVector f = FeatureVector::Zero();
    f(static_cast<int>(Feature::MicroAmount))            = 0.9;
    f(static_cast<int>(Feature::FractionalManipulation)) = 0.5;
    f(static_cast<int>(Feature::RoundNumber))            = 0.9;
    f(static_cast<int>(Feature::UnusualTiming))          = 0.6;
    f(static_cast<int>(Feature::Holiday))                = 1.0;
    f(static_cast<int>(Feature::DuplicateAmount))        = 1.0 / 3.0;
    f(static_cast<int>(Feature::Velocity))               = 0.2;
    f(static_cast<int>(Feature::DescriptionRisk))        = 1.0;

    outlier::OutlierResult o;
    o.score      = 0.4;
    o.is_outlier = true;

    const auto s = derive_signals(f, o);
    EXPECT_DOUBLE_EQ(s.amount_risk, 0.9);
    EXPECT_DOUBLE_EQ(s.timing_risk, 0.6);
    EXPECT_DOUBLE_EQ(s.pattern_risk, 1.0);
    EXPECT_DOUBLE_EQ(s.outlier_score, 0.4);
    EXPECT_TRUE(s.outlier_flag);
    EXPECT_FALSE(s.classifier_probability.has_value());
}

TEST(RiskSignals, RoundNumberAndPeriodEndsAreDamped) {
    using features::Feature;
    FeatureVector f = FeatureVector::Zero();
    f(static_cast<int>(Feature::RoundNumber)) = 0.9;
    f(static_cast<int>(Feature::QuarterEnd))  = 1.0;
    f(static_cast<int>(Feature::MonthEnd))    = 1.0;

    const auto s = derive_signals(f, outlier::OutlierResult{});
    EXPECT_DOUBLE_EQ(s.amount_risk, 0.45);
    EXPECT_DOUBLE_EQ(s.timing_risk, 0.3);
}
