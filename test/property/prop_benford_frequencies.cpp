/**
 * @file  prop_benford_frequencies.cpp
 * @brief Property: ∀ batches, the first-digit test is a proper distribution
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_benford_frequencies
 *
 * Mathematical basis:
 *   observed_d = count_d / N,  Σ_d observed_d = 1
 *   expected_d = log10(1 + 1/d), Σ_d expected_d = 1
 *   χ² = N · Σ_d (observed_d − expected_d)² / expected_d  ≥ 0
 *
 * A sum away from 1 would mean a digit was dropped or double-counted, which
 * would bias every compliance verdict.
 */

#include <rapidcheck.h>
#include <cmath>
#include <numeric>
#include <vector>

#include "fras/profile.hpp"

using namespace fras::profile;

namespace {

/// Map an arbitrary double onto a finite amount, keeping its sign.
double to_amount(double raw) {
    if (!std::isfinite(raw)) return 0.0;
    return std::fmod(raw, 1.0e7);
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: frequencies sum to 1, counts sum to N ────────────────────
    ok &= rc::check(
        "benford: observed and expected frequencies each sum to 1",
        [](const std::vector<double>& raw, bool strip_sign) {
            std::vector<double> amounts;
            amounts.reserve(raw.size());
            for (const double r : raw) amounts.push_back(to_amount(r));

            const auto b = BatchProfiler::benford(amounts, strip_sign);
            if (!b) {
                // No amount contributed a digit.
                for (const double a : amounts) {
                    if (strip_sign || a > 0.0) {
                        RC_ASSERT(!BatchProfiler::leading_digit(a).has_value());
                    }
                }
                return;
            }

            const double obs = std::accumulate(b->observed.begin(), b->observed.end(), 0.0);
            const double exp = std::accumulate(b->expected.begin(), b->expected.end(), 0.0);
            RC_ASSERT(std::abs(obs - 1.0) < 1e-12);
            RC_ASSERT(std::abs(exp - 1.0) < 1e-12);

            const auto counted = std::accumulate(b->observed_counts.begin(),
                                                 b->observed_counts.end(), std::size_t{0});
            RC_ASSERT(counted == b->sample_size);
            RC_ASSERT(b->sample_size <= amounts.size());
            RC_ASSERT(b->low_confidence == (b->sample_size < 10));
        }
    );

    // ── Property 2: χ² and deviation are finite and non-negative ─────────────
    ok &= rc::check(
        "benford: chi-square and deviation score are finite and >= 0",
        [](const std::vector<double>& raw) {
            std::vector<double> amounts;
            for (const double r : raw) amounts.push_back(std::abs(to_amount(r)));
            const auto b = BatchProfiler::benford(amounts);
            if (!b) return;
            RC_ASSERT(std::isfinite(b->chi_square));
            RC_ASSERT(b->chi_square >= 0.0);
            RC_ASSERT(b->deviation_score >= 0.0);
            RC_ASSERT(b->deviation_score <= 2.0 + 1e-12);
        }
    );

    // ── Property 3: leading digit is 1–9 for every non-zero finite value ─────
    ok &= rc::check(
        "benford: leading digit of any non-zero finite value is in [1, 9]",
        [](double raw) {
            RC_PRE(std::isfinite(raw) && raw != 0.0);
            const auto d = BatchProfiler::leading_digit(raw);
            RC_ASSERT(d.has_value());
            RC_ASSERT(*d >= 1 && *d <= 9);
        }
    );

    return ok ? 0 : 1;
}
