/**
 * @file  fuzz_pipeline.cpp
 * @brief libFuzzer target for the full analysis pipeline (end-to-end)
 *
 * Build:
 *   cmake -DFRAS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_pipeline
 *
 * Run for 60 seconds:
 *   ./fuzz_pipeline -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no uncaught exception for any byte sequence.
 *   2. A report is always returned for the default configuration.
 *   3. input_count = batch_size + skipped.
 *   4. Every risk_score ∈ [0, 100]; verdicts sorted by descending score.
 *   5. Severity counts sum to batch_size.
 *   6. Every signal is finite and in [0, 1].
 *
 * Fuzzer strategy:
 *   The input is read as CSV rows of "amount,timestamp,account,description".
 *   Tokens such as "nan", "1e308", "-0", "2024-02-29T23:59:59+14:00" and
 *   binary garbage all reach the validator, profiler and scorer.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "fras/data_loader.hpp"
#include "fras/pipeline.hpp"

using namespace fras;
using namespace fras::pipeline;

namespace {

bool unit(double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; }

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    std::vector<RawRecord> records;
    std::istringstream lines(input);
    std::string line;
    std::size_t row = 0;
    while (std::getline(lines, line) && records.size() < 512) {
        const auto fields = core::DataLoader::split_csv_line(line);
        RawRecord r;
        r.id = std::to_string(row++);
        if (fields.size() > 0) r.amount      = fields[0];
        if (fields.size() > 1) r.timestamp   = fields[1];
        if (fields.size() > 2) r.account     = fields[2];
        if (fields.size() > 3) r.description = fields[3];
        records.push_back(std::move(r));
    }

    PipelineConfig cfg;
    cfg.worker_threads = 2;
    const auto report = FraudAnalysisPipeline(cfg).run(records);

    // Invariant 2
    assert(report.has_value());

    // Invariant 3
    assert(report->input_count == records.size());
    assert(report->batch_size + report->skipped.size() == report->input_count);

    // Invariants 4 and 6
    for (std::size_t i = 0; i < report->verdicts.size(); ++i) {
        const auto& v = report->verdicts[i];
        assert(v.risk_score >= 0 && v.risk_score <= 100);
        if (i > 0) assert(report->verdicts[i - 1].risk_score >= v.risk_score);
        assert(unit(v.signals.amount_risk));
        assert(unit(v.signals.timing_risk));
        assert(unit(v.signals.pattern_risk));
        assert(unit(v.signals.outlier_score));
    }

    // Invariant 5
    std::size_t total = 0;
    for (const auto level : ALL_RISK_LEVELS) total += report->count(level);
    assert(total == report->verdicts.size());

    return 0;
}
