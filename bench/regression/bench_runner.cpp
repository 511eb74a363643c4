/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for the performance regression suite.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for at least 500ms of wall time, then divides total
 * time by iteration count.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "fras/pipeline.hpp"
#include "fras/model_io.hpp"

#include <fmt/core.h>

using namespace fras;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 20) {
    for (long i = 0; i < std::min(min_iters / 10L, 100L); ++i) fn();

    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn();
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        ++iters;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Fixtures ──────────────────────────────────────────────────────────────────

static std::vector<RawRecord> records(std::size_t n) {
    std::vector<RawRecord> rs;
    rs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        RawRecord r;
        r.id        = fmt::format("t{}", i);
        r.amount    = fmt::format("{}.{:02d}", 10 + (i * 53) % 2000, i % 100);
        r.timestamp = fmt::format("2025-05-{:02d}T{:02d}:{:02d}:00Z",
                                  1 + i % 28, i % 24, (i * 11) % 60);
        r.account   = fmt::format("ACC-{}", i % 211);
        rs.push_back(std::move(r));
    }
    return rs;
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_validate_record_1k() {
    const auto rs = records(1000);
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        for (const auto& r : rs) sink += pipeline::validate_record(r).transaction ? 1 : 0;
    });
}

double bench_pipeline_rule_only_10k() {
    const auto rs = records(10'000);
    const pipeline::FraudAnalysisPipeline fap;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        const auto report = fap.run(rs);
        sink += report ? report->batch_size : 0;
    });
}

double bench_pipeline_with_model_10k() {
    const auto rs = records(10'000);
    classifier::Classifier model;
    model.compile(42);
    const pipeline::FraudAnalysisPipeline fap;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        const auto report = fap.run(rs, model);
        sink += report ? report->batch_size : 0;
    });
}

double bench_report_json_10k() {
    const auto report = pipeline::FraudAnalysisPipeline().run(records(10'000));
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += report ? pipeline::to_json(*report).size() : 0;
    });
}

double bench_model_binary_roundtrip() {
    classifier::Classifier model;
    model.compile(42);
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        const auto p = classifier::from_binary(classifier::to_binary(model.parameters()));
        sink += p ? p->layers.size() : 0;
    }, 1000);
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <benchmark_name>\n", argv[0]);
        return 1;
    }

    const std::string name = argv[1];
    double result = -1.0;

    if (name == "validate_record_1k")            result = bench_validate_record_1k();
    else if (name == "pipeline_rule_only_10k")   result = bench_pipeline_rule_only_10k();
    else if (name == "pipeline_with_model_10k")  result = bench_pipeline_with_model_10k();
    else if (name == "report_json_10k")          result = bench_report_json_10k();
    else if (name == "model_binary_roundtrip")   result = bench_model_binary_roundtrip();
    else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.2f\n", result);
    return 0;
}
