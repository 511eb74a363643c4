/// @file src/profile/benford.cpp
/// @brief Benford's-Law first-digit test.

#include "fras/profile.hpp"

#include <fmt/format.h>

#include <cmath>

namespace fras::profile {

std::string_view to_string(BenfordCompliance c) noexcept {
    switch (c) {
        case BenfordCompliance::Good:       return "good";
        case BenfordCompliance::Acceptable: return "acceptable";
        case BenfordCompliance::Poor:       return "poor";
        case BenfordCompliance::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

std::optional<int> BatchProfiler::leading_digit(double x) {
    if (!std::isfinite(x) || x == 0.0) return std::nullopt;
    // 15 significant digits: decimal inputs such as 0.3 keep their digit.
    const std::string s = fmt::format("{:.14e}", std::abs(x));
    const int d = s.front() - '0';
    if (d < 1 || d > 9) return std::nullopt;
    return d;
}

std::optional<BenfordAnalysis>
BatchProfiler::benford(std::span<const double> amounts, bool strip_sign) {
    BenfordAnalysis b;

    for (const double a : amounts) {
        if (!strip_sign && !(a > 0.0)) continue;
        const auto d = leading_digit(a);
        if (!d) continue;
        ++b.observed_counts[static_cast<std::size_t>(*d - 1)];
        ++b.sample_size;
    }

    if (b.sample_size == 0) return std::nullopt;

    const double n = static_cast<double>(b.sample_size);
    for (std::size_t i = 0; i < 9; ++i) {
        const double digit    = static_cast<double>(i + 1);
        const double expected = std::log10(1.0 + 1.0 / digit);
        const double count    = static_cast<double>(b.observed_counts[i]);
        const double exp_count = expected * n;

        b.expected[i] = expected;
        b.observed[i] = count / n;
        b.chi_square += (count - exp_count) * (count - exp_count) / exp_count;
        b.deviation_score += std::abs(b.observed[i] - expected);
    }

    b.low_confidence = b.sample_size < constants::MIN_SAMPLES_FOR_BENFORD;
    if (b.low_confidence) {
        b.compliance = BenfordCompliance::Indeterminate;
    } else if (b.chi_square < constants::BENFORD_CHI2_CRITICAL_05) {
        b.compliance = BenfordCompliance::Good;
    } else if (b.chi_square < constants::BENFORD_CHI2_CRITICAL_01) {
        b.compliance = BenfordCompliance::Acceptable;
    } else {
        b.compliance = BenfordCompliance::Poor;
    }
    return b;
}

} // namespace fras::profile
