/// @file src/classifier/classifier.cpp
/// @brief Classifier: shape, initialisation and inference.

#include "fras/classifier.hpp"
#include "classifier/activation.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>
#include <utility>

namespace fras::classifier {

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(Activation a) noexcept {
    switch (a) {
        case Activation::Identity: return "identity";
        case Activation::Relu:     return "relu";
        case Activation::Sigmoid:  return "sigmoid";
        case Activation::Tanh:     return "tanh";
        case Activation::Softmax:  return "softmax";
    }
    return "unknown";
}

std::optional<Activation> activation_from_string(std::string_view name) noexcept {
    if (name == "identity" || name == "linear") return Activation::Identity;
    if (name == "relu")    return Activation::Relu;
    if (name == "sigmoid") return Activation::Sigmoid;
    if (name == "tanh")    return Activation::Tanh;
    if (name == "softmax") return Activation::Softmax;
    return std::nullopt;
}

std::string_view to_string(ClassLabel c) noexcept {
    switch (c) {
        case ClassLabel::Legitimate: return "legitimate";
        case ClassLabel::Suspicious: return "suspicious";
        case ClassLabel::Fraudulent: return "fraudulent";
    }
    return "unknown";
}

std::optional<ClassLabel> label_from_string(std::string_view text) {
    std::string s;
    for (const char ch : text) {
        const auto uc = static_cast<unsigned char>(ch);
        if (!std::isspace(uc)) s.push_back(static_cast<char>(std::tolower(uc)));
    }
    if (s == "legitimate" || s == "legit" || s == "0") return ClassLabel::Legitimate;
    if (s == "suspicious" || s == "1")                 return ClassLabel::Suspicious;
    if (s == "fraudulent" || s == "fraud" || s == "2") return ClassLabel::Fraudulent;
    return std::nullopt;
}

Eigen::VectorXd one_hot(ClassLabel c) {
    Eigen::VectorXd v = Eigen::VectorXd::Zero(CLASS_COUNT);
    v(static_cast<int>(c)) = 1.0;
    return v;
}

Eigen::VectorXd binary_target(ClassLabel c) {
    return Eigen::VectorXd::Constant(1, c == ClassLabel::Fraudulent ? 1.0 : 0.0);
}

// ─── Configuration ────────────────────────────────────────────────────────────

ClassifierConfig ClassifierConfig::binary() {
    ClassifierConfig c;
    c.layers.back() = {1, Activation::Sigmoid};
    return c;
}

std::vector<std::string> ClassifierConfig::validate() const {
    std::vector<std::string> problems;
    if (input_size <= 0) problems.emplace_back("input_size must be positive");
    if (layers.empty())  problems.emplace_back("at least one layer is required");
    for (std::size_t i = 0; i < layers.size(); ++i) {
        if (layers[i].units <= 0) {
            problems.push_back("layer " + std::to_string(i) + " has no units");
        }
    }
    return problems;
}

bool ModelParameters::is_consistent() const noexcept {
    if (input_size <= 0 || layers.empty()) return false;
    if (weights.size() != layers.size() || biases.size() != layers.size()) return false;

    Eigen::Index fan_in = input_size;
    for (std::size_t i = 0; i < layers.size(); ++i) {
        const Eigen::Index units = layers[i].units;
        if (units <= 0) return false;
        if (weights[i].rows() != fan_in || weights[i].cols() != units) return false;
        if (biases[i].size() != units) return false;
        if (!weights[i].allFinite() || !biases[i].allFinite()) return false;
        fan_in = units;
    }
    return true;
}

int ModelParameters::output_size() const noexcept {
    return layers.empty() ? 0 : layers.back().units;
}

// ─── Construction ─────────────────────────────────────────────────────────────

Classifier::Classifier(ClassifierConfig config)
    : config_(std::move(config)) {
    params_.input_size = config_.input_size;
    params_.layers     = config_.layers;
}

std::optional<Classifier> Classifier::from_parameters(ModelParameters params) {
    if (!params.is_consistent()) return std::nullopt;
    Classifier c(ClassifierConfig{params.input_size, params.layers});
    c.params_   = std::move(params);
    c.compiled_ = true;
    return c;
}

bool Classifier::compile(std::uint64_t seed) {
    if (!config_.validate().empty()) return false;

    std::mt19937_64 rng(seed);
    ModelParameters p;
    p.input_size = config_.input_size;
    p.layers     = config_.layers;

    int fan_in = config_.input_size;
    for (const auto& layer : config_.layers) {
        const double scale = std::sqrt(2.0 / static_cast<double>(fan_in));
        Eigen::MatrixXd w(fan_in, layer.units);
        for (int r = 0; r < fan_in; ++r) {
            for (int c = 0; c < layer.units; ++c) {
                w(r, c) = (2.0 * detail::uniform01(rng) - 1.0) * scale;
            }
        }
        p.weights.push_back(std::move(w));
        p.biases.push_back(Eigen::VectorXd::Zero(layer.units));
        fan_in = layer.units;
    }

    params_   = std::move(p);
    compiled_ = true;
    return true;
}

// ─── Inference ────────────────────────────────────────────────────────────────

Classifier::Activations Classifier::forward(const Eigen::VectorXd& x) const {
    Activations acts;
    acts.reserve(params_.layers.size() + 1);
    acts.push_back(x);
    for (std::size_t l = 0; l < params_.layers.size(); ++l) {
        const Eigen::VectorXd z = params_.weights[l].transpose() * acts.back()
                                + params_.biases[l];
        acts.push_back(detail::activate(z, params_.layers[l].activation));
    }
    return acts;
}

int Classifier::class_of_output(const Eigen::VectorXd& out) const noexcept {
    if (out.size() == 1) return out(0) >= 0.5 ? 1 : 0;
    Eigen::Index idx = 0;
    out.maxCoeff(&idx);
    return static_cast<int>(idx);
}

int Classifier::class_of_label(const Eigen::VectorXd& label) const noexcept {
    return class_of_output(label);
}

std::optional<Prediction> Classifier::predict(const Eigen::VectorXd& x) const {
    if (!compiled_ || x.size() != params_.input_size) return std::nullopt;

    Eigen::VectorXd out = std::move(forward(x).back());
    const int cls = class_of_output(out);
    const double confidence = out.maxCoeff();
    return Prediction{std::move(out), cls, confidence};
}

std::optional<double> Classifier::fraud_probability(const Eigen::VectorXd& x) const {
    const auto pred = predict(x);
    if (!pred) return std::nullopt;

    const auto& out = pred->output;
    double p = 0.0;
    if (out.size() == 1) {
        p = out(0);
    } else if (out.size() == CLASS_COUNT) {
        p = out(static_cast<int>(ClassLabel::Fraudulent))
          + 0.5 * out(static_cast<int>(ClassLabel::Suspicious));
    } else {
        p = out(out.size() - 1);
    }
    if (!(p > 0.0)) return 0.0;
    return std::min(p, 1.0);
}

} // namespace fras::classifier
