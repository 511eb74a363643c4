/// @file src/features/feature_extractor.cpp
/// @brief FeatureExtractor: amount, temporal, behavioural and distribution
///        encoders.

#include "fras/features.hpp"
#include "fras/calendar.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

namespace fras::features {

using constants::FLOAT_EPSILON;

namespace {

constexpr std::array<double, 5> MAGNITUDE_ANCHORS = {1.0, 10.0, 100.0, 1000.0, 10000.0};

constexpr std::array<std::string_view, constants::FEATURE_DIM> FEATURE_NAMES = {
    "amount_log",         "micro_amount",      "magnitude_deviation",
    "round_number",       "fractional_manipulation",
    "hour_of_day",        "day_of_week",       "weekend",
    "holiday",            "business_hours",    "unusual_timing",
    "month_end",          "quarter_end",       "counterparty_frequency",
    "velocity",           "duplicate_amount",  "description_risk",
    "zscore_magnitude",   "amount_percentile", "benford_digit_deviation",
};

inline double clamp01(double x) noexcept {
    if (!(x > 0.0)) return 0.0;   // also maps NaN to 0
    return x < 1.0 ? x : 1.0;
}

inline void set(FeatureVector& v, Feature f, double x) noexcept {
    v(static_cast<int>(f)) = x;
}

inline double indicator(bool b) noexcept { return b ? 1.0 : 0.0; }

} // anonymous namespace

std::string_view to_string(Feature f) noexcept {
    const auto i = static_cast<std::size_t>(f);
    return i < FEATURE_NAMES.size() ? FEATURE_NAMES[i] : "unknown";
}

FeatureExtractor::FeatureExtractor(FeatureConfig config)
    : config_(std::move(config)) {}

// ─── Amount encoders ──────────────────────────────────────────────────────────

double FeatureExtractor::amount_log(double amount) noexcept {
    if (!std::isfinite(amount)) return 0.0;
    const double a = std::max(std::abs(amount), constants::MIN_LOG_AMOUNT);
    return clamp01((std::log10(a) + 4.0) / 10.0);
}

double FeatureExtractor::micro_amount(double amount) const noexcept {
    const double a = std::abs(amount);
    if (!std::isfinite(a) || a == 0.0 || config_.micro_threshold <= 0.0) return 0.0;
    return a < config_.micro_threshold ? 1.0 - a / config_.micro_threshold : 0.0;
}

double FeatureExtractor::magnitude_deviation(double amount) noexcept {
    const double a = std::abs(amount);
    if (!std::isfinite(a)) return 1.0;
    double best = 1.0;
    for (const double anchor : MAGNITUDE_ANCHORS) {
        best = std::min(best, std::abs(a - anchor) / anchor);
    }
    return best;
}

double FeatureExtractor::round_number(double amount) noexcept {
    const double a = std::abs(amount);
    if (!std::isfinite(a) || a < 1.0) return 0.0;
    if (std::abs(a - std::round(a)) > 1e-9) return 0.0;   // has cents

    // Above 2^53 every double is whole; trailing zeros stop meaning much.
    if (a >= 9.0e15) return 0.9;

    auto whole = static_cast<long long>(std::llround(a));
    int zeros = 0;
    while (whole > 0 && whole % 10 == 0 && zeros < 3) {
        whole /= 10;
        ++zeros;
    }
    switch (zeros) {
        case 0:  return 0.1;
        case 1:  return 0.3;
        case 2:  return 0.7;
        default: return 0.9;
    }
}

double FeatureExtractor::fractional_manipulation(double amount) noexcept {
    const double a = std::abs(amount);
    if (!std::isfinite(a)) return 0.0;
    const double frac = a - std::floor(a);
    if (frac < 1e-9) return 0.0;

    if (frac < 0.01) return 0.8;
    if (frac > 0.99) return 0.6;

    const double cents = frac * 100.0;
    if (std::abs(cents - std::round(cents)) > 1e-6) return 0.5;
    return 0.0;
}

void FeatureExtractor::fill_amount(FeatureVector& v, double amount) const noexcept {
    set(v, Feature::AmountLog,              amount_log(amount));
    set(v, Feature::MicroAmount,            micro_amount(amount));
    set(v, Feature::MagnitudeDeviation,     magnitude_deviation(amount));
    set(v, Feature::RoundNumber,            round_number(amount));
    set(v, Feature::FractionalManipulation, fractional_manipulation(amount));
}

// ─── Temporal encoders ────────────────────────────────────────────────────────

double FeatureExtractor::unusual_timing(int hour, unsigned weekday) noexcept {
    if (hour >= 2 && hour <= 6) return 0.8;
    if (hour >= 23 || hour <= 1) return 0.6;
    if (weekday == 0 || weekday == 6) return 0.3;
    return 0.0;
}

void FeatureExtractor::fill_temporal(FeatureVector& v, const Transaction& t) const {
    const auto c = calendar::to_civil(t.timestamp);
    const bool weekend = c.weekday == 0 || c.weekday == 6;

    const bool holiday = std::any_of(
        config_.holidays.begin(), config_.holidays.end(),
        [&](const MonthDay& h) { return h.month == c.month && h.day == c.day; });

    set(v, Feature::HourOfDay,     static_cast<double>(c.hour) / 23.0);
    set(v, Feature::DayOfWeek,     static_cast<double>(c.weekday) / 6.0);
    set(v, Feature::Weekend,       indicator(weekend));
    set(v, Feature::Holiday,       indicator(holiday));
    set(v, Feature::BusinessHours, indicator(!weekend && c.hour >= 9 && c.hour <= 17));
    set(v, Feature::UnusualTiming, unusual_timing(c.hour, c.weekday));
    set(v, Feature::MonthEnd,      indicator(c.is_month_end));
    set(v, Feature::QuarterEnd,    indicator(c.is_quarter_end));
}

// ─── Description ──────────────────────────────────────────────────────────────

double FeatureExtractor::description_risk(const std::string& description) const {
    std::size_t hits = 0;
    std::string word;

    auto flush = [&] {
        if (word.empty()) return;
        for (const auto& term : config_.suspicious_terms) {
            if (!term.empty() && word.starts_with(term)) {
                ++hits;
                break;
            }
        }
        word.clear();
    };

    for (const char ch : description) {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc)) {
            word.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            flush();
        }
    }
    flush();

    return clamp01(static_cast<double>(hits) / constants::DESCRIPTION_SATURATION);
}

// ─── extract ──────────────────────────────────────────────────────────────────

FeatureVector FeatureExtractor::extract(const Transaction& t) const {
    FeatureVector v = FeatureVector::Zero();
    fill_amount(v, t.amount);
    fill_temporal(v, t);
    set(v, Feature::DescriptionRisk,  description_risk(t.description));
    set(v, Feature::AmountPercentile, 0.5);
    return v;
}

FeatureVector FeatureExtractor::extract(const Transaction& t,
                                        const BatchContext& context,
                                        const profile::BatchProfile& profile) const {
    FeatureVector v = extract(t);

    const std::size_t peers = context.counterparty_count(t);
    set(v, Feature::CounterpartyFrequency,
        peers > 0 ? 1.0 - 1.0 / static_cast<double>(peers) : 0.0);

    const std::size_t near = context.neighbours_within(t, config_.velocity_window_seconds);
    set(v, Feature::Velocity,
        clamp01(static_cast<double>(near) / constants::VELOCITY_SATURATION));

    set(v, Feature::DuplicateAmount,
        clamp01(static_cast<double>(context.duplicate_amounts(t))
                / constants::DUPLICATE_SATURATION));

    if (profile.stddev > FLOAT_EPSILON && config_.zscore_threshold > 0.0) {
        const double z = std::abs(t.amount - profile.mean) / profile.stddev;
        set(v, Feature::ZScoreMagnitude, clamp01(z / (2.0 * config_.zscore_threshold)));
    }

    set(v, Feature::AmountPercentile, clamp01(profile.percentile_rank(t.amount)));

    if (profile.benford) {
        if (const auto d = profile::BatchProfiler::leading_digit(t.amount)) {
            const auto i = static_cast<std::size_t>(*d - 1);
            const double expected = profile.benford->expected[i];
            const double observed = profile.benford->observed[i];
            set(v, Feature::BenfordDigitDeviation,
                clamp01(std::abs(observed - expected) / expected));
        }
    }
    return v;
}

std::vector<FeatureVector>
FeatureExtractor::extract_all(std::span<const Transaction> batch,
                              const profile::BatchProfile& profile) const {
    const auto context = BatchContext::build(batch);
    std::vector<FeatureVector> out;
    out.reserve(batch.size());
    for (const auto& t : batch) {
        out.push_back(extract(t, context, profile));
    }
    return out;
}

} // namespace fras::features
