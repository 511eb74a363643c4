/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the FRAS scoring path.
 *
 * Benchmarks
 * ----------
 *   BM_Profile               BatchProfiler over N amounts
 *   BM_ExtractAll            FeatureExtractor::extract_all over N transactions
 *   BM_ClassifierPredict     one forward pass of the default network
 *   BM_PipelineRun           full rule-only run, 1 and 4 workers
 *   BM_PipelineRunWithModel  full run with the classifier signal
 *   BM_TrainEpoch            one training epoch over N examples
 *
 * Build (CMake):
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (transactions processed).
 */

#include "benchmark/benchmark.h"

#include "fras/pipeline.hpp"
#include "fras/calendar.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace fras;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N raw records: mostly ordinary payments, every 25th a micro-amount at night.
static std::vector<RawRecord> make_records(std::size_t n) {
    std::vector<RawRecord> rs;
    rs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        RawRecord r;
        r.id = fmt::format("t{}", i);
        if (i % 25 == 0) {
            r.amount    = fmt::format("0.0{}", 1 + i % 4);
            r.timestamp = fmt::format("2025-02-{:02d}T03:{:02d}:00Z", 3 + i % 5, i % 60);
            r.account   = "SKIM";
        } else {
            r.amount    = fmt::format("{}.{:02d}", 20 + (i * 37) % 900, 11 + i % 80);
            r.timestamp = fmt::format("2025-02-{:02d}T{:02d}:{:02d}:00Z",
                                      3 + i % 5, 9 + i % 8, (i * 7) % 60);
            r.account   = fmt::format("ACC-{}", i % 97);
        }
        r.vendor = fmt::format("VENDOR-{}", i % 13);
        rs.push_back(std::move(r));
    }
    return rs;
}

static std::vector<Transaction> make_transactions(std::size_t n) {
    std::vector<Transaction> out;
    for (const auto& r : make_records(n)) {
        auto check = pipeline::validate_record(r);
        if (check.transaction) out.push_back(std::move(*check.transaction));
    }
    return out;
}

static std::vector<double> amounts_of(const std::vector<Transaction>& txs) {
    std::vector<double> a;
    a.reserve(txs.size());
    for (const auto& t : txs) a.push_back(t.amount);
    return a;
}

// ── Components ─────────────────────────────────────────────────────────────────

static void BM_Profile(benchmark::State& state) {
    const auto amounts = amounts_of(make_transactions(static_cast<std::size_t>(state.range(0))));
    const profile::BatchProfiler profiler;
    for (auto _ : state) {
        auto p = profiler.profile(amounts);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(amounts.size()));
}
BENCHMARK(BM_Profile)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_ExtractAll(benchmark::State& state) {
    const auto txs  = make_transactions(static_cast<std::size_t>(state.range(0)));
    const auto prof = profile::BatchProfiler().profile(amounts_of(txs));
    const features::FeatureExtractor extractor;
    for (auto _ : state) {
        auto rows = extractor.extract_all(txs, *prof);
        benchmark::DoNotOptimize(rows.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(txs.size()));
}
BENCHMARK(BM_ExtractAll)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_ClassifierPredict(benchmark::State& state) {
    classifier::Classifier model;
    model.compile(42);
    const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(constants::FEATURE_DIM, 0.0, 1.0);
    for (auto _ : state) {
        auto p = model.fraud_probability(x);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ClassifierPredict);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_PipelineRun(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    pipeline::PipelineConfig cfg;
    cfg.worker_threads = static_cast<std::size_t>(state.range(1));
    const pipeline::FraudAnalysisPipeline fap(cfg);
    for (auto _ : state) {
        auto report = fap.run(records);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(records.size()));
}
BENCHMARK(BM_PipelineRun)
    ->ArgsProduct({{1024, 16384, 65536}, {1, 4}})
    ->Unit(benchmark::kMillisecond);

static void BM_PipelineRunWithModel(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    classifier::Classifier model;
    model.compile(42);
    const pipeline::FraudAnalysisPipeline fap;
    for (auto _ : state) {
        auto report = fap.run(records, model);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(records.size()));
}
BENCHMARK(BM_PipelineRunWithModel)->Arg(1024)->Arg(16384)->Unit(benchmark::kMillisecond);

// ── Training ───────────────────────────────────────────────────────────────────

static void BM_TrainEpoch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto txs  = make_transactions(n);
    const auto prof = profile::BatchProfiler().profile(amounts_of(txs));
    const auto rows = features::FeatureExtractor().extract_all(txs, *prof);

    std::vector<classifier::TrainingExample> examples;
    examples.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto label = txs[i].account == "SKIM" ? classifier::ClassLabel::Fraudulent
                                                    : classifier::ClassLabel::Legitimate;
        examples.push_back({Eigen::VectorXd(rows[i]), classifier::one_hot(label)});
    }

    classifier::TrainingConfig tc;
    tc.epochs     = 1;
    tc.batch_size = 32;
    tc.threads    = static_cast<int>(state.range(1));
    for (auto _ : state) {
        state.PauseTiming();
        classifier::Classifier model;
        model.compile(7);
        state.ResumeTiming();
        auto r = model.train(examples, tc);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(examples.size()));
}
BENCHMARK(BM_TrainEpoch)
    ->ArgsProduct({{1024, 8192}, {1, 4}})
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
