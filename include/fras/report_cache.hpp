#pragma once

/// @file include/fras/report_cache.hpp
/// @brief Caller-owned memoisation of analysis reports.
///
/// Reports are keyed by `cache_key`, a 64-bit FNV-1a hash over a canonical
/// encoding of the records, the pipeline configuration and the model
/// parameters. The pipeline is re-entrant, so a cached report is exactly the
/// report a fresh run would produce.

#include "fras/constants.hpp"
#include "fras/pipeline.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace fras::pipeline {

/// Hex FNV-1a digest of (records, config, model). `model` may be null.
[[nodiscard]] std::string cache_key(std::span<const RawRecord> records,
                                    const PipelineConfig& config,
                                    const classifier::ModelParameters* model);

class ReportCache {
public:
    virtual ~ReportCache() = default;

    [[nodiscard]] virtual std::optional<AnalysisReport>
    get(const std::string& key) = 0;

    virtual void put(const std::string& key, const AnalysisReport& report) = 0;
};

/// Thread-safe map with a fixed time-to-live per entry and a bounded size.
///
/// Inserting a new key into a full cache first drops expired entries, then,
/// if still full, the entry that expires soonest. A capacity of 0 stores
/// nothing.
class InMemoryReportCache final : public ReportCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit InMemoryReportCache(
        std::chrono::seconds ttl = std::chrono::seconds{constants::REPORT_CACHE_TTL_SECONDS},
        std::size_t max_entries  = constants::REPORT_CACHE_MAX_ENTRIES);

    [[nodiscard]] std::optional<AnalysisReport>
    get(const std::string& key) override;

    void put(const std::string& key, const AnalysisReport& report) override;

    /// Entries currently held, expired ones included until next access.
    [[nodiscard]] std::size_t size() const;

    /// Drop expired entries.
    void purge();

    [[nodiscard]] std::size_t capacity() const noexcept { return max_entries_; }

    [[nodiscard]] std::uint64_t hits() const;
    [[nodiscard]] std::uint64_t misses() const;
    [[nodiscard]] std::uint64_t evictions() const;

private:
    struct Entry {
        AnalysisReport    report;
        Clock::time_point expires;
        std::uint64_t     sequence;  ///< Insertion order, breaks expiry ties
    };

    /// Make room for one new entry. Caller holds `mutex_`.
    void evict_for_insert(Clock::time_point now);

    std::chrono::seconds ttl_;
    std::size_t          max_entries_;
    mutable std::mutex   mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::uint64_t next_sequence_ = 0;
    std::uint64_t hits_      = 0;
    std::uint64_t misses_    = 0;
    std::uint64_t evictions_ = 0;
};

} // namespace fras::pipeline
