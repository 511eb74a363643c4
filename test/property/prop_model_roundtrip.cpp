/**
 * @file  prop_model_roundtrip.cpp
 * @brief Property: ∀ seeds, saved models restore bit-exactly and predict
 *        identically; softmax outputs are distributions
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_model_roundtrip
 *
 * Mathematical basis:
 *   softmax(z)_i = exp(z_i − max z) / Σ_j exp(z_j − max z)
 *   ⇒ softmax(z)_i ∈ [0, 1],  Σ_i softmax(z)_i = 1
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstdint>
#include <vector>

#include "fras/classifier.hpp"
#include "fras/model_io.hpp"

using namespace fras;
using namespace fras::classifier;

namespace {

Eigen::VectorXd to_input(const std::vector<double>& raw) {
    Eigen::VectorXd x = Eigen::VectorXd::Zero(constants::FEATURE_DIM);
    for (std::size_t i = 0; i < raw.size() && i < static_cast<std::size_t>(x.size()); ++i) {
        x(static_cast<Eigen::Index>(i)) = std::isfinite(raw[i]) ? std::tanh(raw[i]) : 0.0;
    }
    return x;
}

bool same_parameters(const ModelParameters& a, const ModelParameters& b) {
    if (a.input_size != b.input_size || a.layers.size() != b.layers.size()) return false;
    for (std::size_t l = 0; l < a.layers.size(); ++l) {
        if (a.layers[l].units != b.layers[l].units) return false;
        if (a.layers[l].activation != b.layers[l].activation) return false;
        if (!(a.weights[l] == b.weights[l]) || !(a.biases[l] == b.biases[l])) return false;
    }
    return true;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: binary and JSON snapshots are exact ──────────────────────
    ok &= rc::check(
        "model_io: binary and JSON snapshots restore every weight exactly",
        [](std::uint64_t seed, bool binary_head) {
            Classifier model(binary_head ? ClassifierConfig::binary() : ClassifierConfig{});
            RC_ASSERT(model.compile(seed));

            const auto from_bin = from_binary(to_binary(model.parameters()));
            RC_ASSERT(from_bin.has_value());
            RC_ASSERT(same_parameters(model.parameters(), *from_bin));

            const auto from_text = from_json(to_json(model.parameters()));
            RC_ASSERT(from_text.has_value());
            RC_ASSERT(same_parameters(model.parameters(), *from_text));
        }
    );

    // ── Property 2: restored models predict identically ──────────────────────
    ok &= rc::check(
        "model_io: restored model gives identical predictions",
        [](std::uint64_t seed, const std::vector<double>& raw) {
            Classifier model;
            RC_ASSERT(model.compile(seed));
            const auto restored = Classifier::from_parameters(*from_binary(to_binary(model.parameters())));
            RC_ASSERT(restored.has_value());

            const auto x = to_input(raw);
            const auto a = model.predict(x);
            const auto b = restored->predict(x);
            RC_ASSERT(a.has_value() && b.has_value());
            RC_ASSERT(a->output == b->output);
            RC_ASSERT(a->prediction == b->prediction);
        }
    );

    // ── Property 3: softmax head is a distribution ───────────────────────────
    ok &= rc::check(
        "classifier: softmax output sums to 1; fraud probability in [0, 1]",
        [](std::uint64_t seed, const std::vector<double>& raw) {
            Classifier model;
            RC_ASSERT(model.compile(seed));
            const auto x = to_input(raw);
            const auto pred = model.predict(x);
            RC_ASSERT(pred.has_value());
            RC_ASSERT(pred->output.allFinite());
            RC_ASSERT(pred->output.minCoeff() >= 0.0);
            RC_ASSERT(std::abs(pred->output.sum() - 1.0) < 1e-12);

            const auto p = model.fraud_probability(x);
            RC_ASSERT(p.has_value());
            RC_ASSERT(*p >= 0.0 && *p <= 1.0);
        }
    );

    return ok ? 0 : 1;
}
