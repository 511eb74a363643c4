/// @file src/features/batch_context.cpp
/// @brief BatchContext: per-batch counterparty and amount indexes.

#include "fras/features.hpp"

#include <algorithm>
#include <cmath>

namespace fras::features {

double BatchContext::amount_key(double amount) noexcept {
    const double scaled = amount * constants::DUPLICATE_AMOUNT_SCALE;
    if (!std::isfinite(scaled)) return amount;
    return std::round(scaled) / constants::DUPLICATE_AMOUNT_SCALE;
}

BatchContext BatchContext::build(std::span<const Transaction> batch) {
    BatchContext ctx;
    ctx.size_ = batch.size();

    for (const auto& t : batch) {
        const auto& party = t.counterparty();
        if (!party.empty()) {
            ctx.times_by_party_[party].push_back(t.timestamp.time_since_epoch().count());
        }
        ++ctx.amount_counts_[amount_key(t.amount)];
    }

    for (auto& [party, times] : ctx.times_by_party_) {
        std::sort(times.begin(), times.end());
    }
    return ctx;
}

std::size_t BatchContext::counterparty_count(const Transaction& t) const {
    const auto& party = t.counterparty();
    if (party.empty()) return 0;
    const auto it = times_by_party_.find(party);
    return it == times_by_party_.end() ? 0 : it->second.size();
}

std::size_t BatchContext::neighbours_within(const Transaction& t,
                                            long long window_seconds) const {
    const auto& party = t.counterparty();
    if (party.empty()) return 0;
    const auto it = times_by_party_.find(party);
    if (it == times_by_party_.end()) return 0;

    const auto& times = it->second;
    const long long ts = t.timestamp.time_since_epoch().count();
    const auto lo = std::lower_bound(times.begin(), times.end(), ts - window_seconds);
    const auto hi = std::upper_bound(times.begin(), times.end(), ts + window_seconds);
    const auto in_window = static_cast<std::size_t>(hi - lo);

    // `t` itself is in the window when it belongs to the batch.
    return in_window > 0 ? in_window - 1 : 0;
}

std::size_t BatchContext::duplicate_amounts(const Transaction& t) const {
    const auto it = amount_counts_.find(amount_key(t.amount));
    if (it == amount_counts_.end() || it->second == 0) return 0;
    return it->second - 1;
}

} // namespace fras::features
