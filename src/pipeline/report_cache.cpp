/// @file src/pipeline/report_cache.cpp
/// @brief Cache key derivation and the in-memory TTL cache.

#include "fras/report_cache.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace fras::pipeline {

namespace {

constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME  = 0x100000001b3ULL;

std::uint64_t fnv1a(std::string_view bytes) noexcept {
    std::uint64_t h = FNV_OFFSET;
    for (const char c : bytes) {
        h ^= static_cast<std::uint8_t>(c);
        h *= FNV_PRIME;
    }
    return h;
}

/// Length-prefixed so that field boundaries cannot be forged by content.
void field(fmt::memory_buffer& buf, std::string_view s) {
    fmt::format_to(std::back_inserter(buf), "{}:{}|", s.size(), s);
}

void optional_field(fmt::memory_buffer& buf, const std::optional<std::string>& s) {
    if (s) {
        field(buf, *s);
    } else {
        buf.push_back('~');
    }
}

std::uint64_t bits_of(double d) noexcept {
    std::uint64_t b = 0;
    std::memcpy(&b, &d, sizeof b);
    return b;
}

} // anonymous namespace

std::string cache_key(std::span<const RawRecord> records,
                      const PipelineConfig& config,
                      const classifier::ModelParameters* model) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "records:{}|", records.size());
    for (const auto& r : records) {
        field(buf, r.id);
        optional_field(buf, r.amount);
        optional_field(buf, r.timestamp);
        field(buf, r.account);
        field(buf, r.vendor);
        field(buf, r.description);
        optional_field(buf, r.label);
    }

    // worker_threads and verbose do not change the report.
    const auto& f = config.features;
    fmt::format_to(out, "features:{}:{}:{}|", f.micro_threshold, f.velocity_window_seconds,
                   f.zscore_threshold);
    for (const auto& h : f.holidays) fmt::format_to(out, "h{}-{}|", h.month, h.day);
    for (const auto& t : f.suspicious_terms) field(buf, t);

    const auto& w  = config.weights;
    const auto& th = config.thresholds;
    fmt::format_to(out, "profiler:{}|outlier:{}:{}|weights:{}:{}:{}:{}:{}|",
                   config.profiler.benford_strip_sign,
                   config.outlier.zscore_threshold, config.outlier.iqr_multiplier,
                   w.classifier, w.outlier, w.amount, w.timing, w.pattern);
    fmt::format_to(out, "thresholds:{}:{}:{}:{}:{}|top:{}|keep:{}|",
                   th.classifier, th.outlier, th.amount, th.timing, th.pattern,
                   config.top_alerts, config.keep_features);

    if (model) {
        fmt::format_to(out, "model:{}|", model->input_size);
        for (std::size_t l = 0; l < model->layers.size(); ++l) {
            fmt::format_to(out, "L{}:{}|", model->layers[l].units,
                           classifier::to_string(model->layers[l].activation));
            if (l < model->weights.size()) {
                const auto& m = model->weights[l];
                for (Eigen::Index i = 0; i < m.size(); ++i) {
                    fmt::format_to(out, "{:x},", bits_of(m.data()[i]));
                }
            }
            if (l < model->biases.size()) {
                const auto& b = model->biases[l];
                for (Eigen::Index i = 0; i < b.size(); ++i) {
                    fmt::format_to(out, "{:x},", bits_of(b(i)));
                }
            }
        }
    } else {
        fmt::format_to(out, "model:none|");
    }

    return fmt::format("{:016x}", fnv1a(std::string_view(buf.data(), buf.size())));
}

// ─── InMemoryReportCache ──────────────────────────────────────────────────────

InMemoryReportCache::InMemoryReportCache(std::chrono::seconds ttl,
                                         std::size_t max_entries)
    : ttl_(ttl), max_entries_(max_entries) {}

std::optional<AnalysisReport> InMemoryReportCache::get(const std::string& key) {
    const std::lock_guard lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (Clock::now() >= it->second.expires) {
        entries_.erase(it);
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.report;
}

void InMemoryReportCache::put(const std::string& key, const AnalysisReport& report) {
    const std::lock_guard lock(mutex_);
    if (max_entries_ == 0) return;

    const auto now = Clock::now();
    if (!entries_.contains(key)) evict_for_insert(now);
    entries_.insert_or_assign(key, Entry{report, now + ttl_, next_sequence_++});
}

void InMemoryReportCache::evict_for_insert(Clock::time_point now) {
    if (entries_.size() < max_entries_) return;

    evictions_ += std::erase_if(entries_, [now](const auto& kv) {
        return now >= kv.second.expires;
    });

    while (entries_.size() >= max_entries_) {
        const auto victim = std::min_element(
            entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
                if (a.second.expires != b.second.expires) {
                    return a.second.expires < b.second.expires;
                }
                return a.second.sequence < b.second.sequence;
            });
        entries_.erase(victim);
        ++evictions_;
    }
}

std::size_t InMemoryReportCache::size() const {
    const std::lock_guard lock(mutex_);
    return entries_.size();
}

void InMemoryReportCache::purge() {
    const std::lock_guard lock(mutex_);
    const auto now = Clock::now();
    std::erase_if(entries_, [now](const auto& kv) { return now >= kv.second.expires; });
}

std::uint64_t InMemoryReportCache::hits() const {
    const std::lock_guard lock(mutex_);
    return hits_;
}

std::uint64_t InMemoryReportCache::misses() const {
    const std::lock_guard lock(mutex_);
    return misses_;
}

std::uint64_t InMemoryReportCache::evictions() const {
    const std::lock_guard lock(mutex_);
    return evictions_;
}

} // namespace fras::pipeline
