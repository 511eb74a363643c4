#pragma once

#include <cstddef>

/// @file include/fras/constants.hpp
/// @brief Statistical and scoring constants for the FRAS engine.
///
/// Config structs take their defaults from here; change a default in one
/// place rather than at each call site.

namespace fras::constants {

// ─── Feature Layout ───────────────────────────────────────────────────────────

/// Fixed length of every FeatureVector.
static constexpr int FEATURE_DIM = 20;

/// Amounts strictly below this score on the micro-amount feature.
static constexpr double MICRO_AMOUNT_THRESHOLD = 0.10;

/// Floor applied before taking log10 of an amount.
static constexpr double MIN_LOG_AMOUNT = 1e-4;

/// Half-width of the same-counterparty velocity window, in seconds.
static constexpr long long VELOCITY_WINDOW_SECONDS = 3600;

/// Neighbour count at which the velocity feature saturates at 1.0.
static constexpr double VELOCITY_SATURATION = 5.0;

/// Duplicate amounts are compared at this many steps per currency unit.
static constexpr double DUPLICATE_AMOUNT_SCALE = 10000.0;

/// Duplicate count at which the duplicate-amount feature saturates.
static constexpr double DUPLICATE_SATURATION = 3.0;

/// Suspicious-term hits at which the description feature saturates.
static constexpr double DESCRIPTION_SATURATION = 2.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Tolerance on the sum of risk weights.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;

// ─── Sample-Size Thresholds ───────────────────────────────────────────────────

/// Skewness and kurtosis need at least this many samples.
static constexpr std::size_t MIN_SAMPLES_FOR_MOMENTS = 4;

/// Benford's-Law test is low-confidence below this many leading digits.
static constexpr std::size_t MIN_SAMPLES_FOR_BENFORD = 10;

// ─── Benford's Law ────────────────────────────────────────────────────────────

/// χ² critical value, df = 8, p = 0.05.
static constexpr double BENFORD_CHI2_CRITICAL_05 = 15.51;

/// χ² critical value, df = 8, p = 0.01.
static constexpr double BENFORD_CHI2_CRITICAL_01 = 20.09;

// ─── Outlier Detection ────────────────────────────────────────────────────────

static constexpr double DEFAULT_ZSCORE_THRESHOLD = 3.0;
static constexpr double DEFAULT_IQR_MULTIPLIER   = 1.5;

// ─── Risk Bands ───────────────────────────────────────────────────────────────

static constexpr int RISK_LOW_FLOOR      = 20;
static constexpr int RISK_MEDIUM_FLOOR   = 40;
static constexpr int RISK_HIGH_FLOOR     = 60;
static constexpr int RISK_CRITICAL_FLOOR = 80;

/// Micro-skimming is reported once this many micro-amount records appear.
static constexpr std::size_t MICRO_SKIMMING_MIN_COUNT = 3;

// ─── Report Cache ─────────────────────────────────────────────────────────────

static constexpr long long   REPORT_CACHE_TTL_SECONDS = 300;
static constexpr std::size_t REPORT_CACHE_MAX_ENTRIES = 256;

} // namespace fras::constants
