/**
 * @file  fuzz_model_io.cpp
 * @brief libFuzzer target for the model snapshot readers
 *
 * Build:
 *   cmake -DFRAS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_model_io
 *
 * Run for 60 seconds:
 *   ./fuzz_model_io -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no huge allocation for any byte sequence.
 *   2. Any accepted snapshot has consistent shapes and finite weights.
 *   3. An accepted binary snapshot re-encodes to the same bytes.
 *   4. An accepted snapshot loads into a Classifier that can predict.
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "fras/model_io.hpp"

using namespace fras::classifier;

namespace {

void check_accepted(const ModelParameters& p) {
    // Invariant 2
    assert(p.is_consistent());

    // Invariant 4
    const auto model = Classifier::from_parameters(p);
    assert(model.has_value());
    const auto pred = model->predict(Eigen::VectorXd::Zero(p.input_size));
    assert(pred.has_value());
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::span<const std::uint8_t> bytes(data, size);

    if (const auto p = from_binary(bytes)) {
        check_accepted(*p);
        // Invariant 3
        const auto again = to_binary(*p);
        assert(again.size() == size);
        assert(std::equal(again.begin(), again.end(), bytes.begin()));
    }

    const std::string_view text(reinterpret_cast<const char*>(data), size);
    if (const auto p = from_json(text)) {
        check_accepted(*p);
    }

    return 0;
}
