/// @file src/classifier/training.cpp
/// @brief Classifier: backpropagation, mini-batch training and evaluation.

#include "fras/classifier.hpp"
#include "fras/parallel.hpp"
#include "classifier/activation.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace fras::classifier {

// ─── TrainingConfig ───────────────────────────────────────────────────────────

std::vector<std::string> TrainingConfig::validate() const {
    std::vector<std::string> problems;
    if (epochs <= 0) {
        problems.emplace_back("epochs must be positive");
    }
    if (!std::isfinite(learning_rate) || learning_rate <= 0.0) {
        problems.emplace_back("learning_rate must be positive");
    }
    if (batch_size < 1) {
        problems.emplace_back("batch_size must be at least 1");
    }
    if (!(validation_split >= 0.0 && validation_split < 1.0)) {
        problems.emplace_back("validation_split must be in [0, 1)");
    }
    if (validation_interval < 1) {
        problems.emplace_back("validation_interval must be at least 1");
    }
    if (threads < 1) {
        problems.emplace_back("threads must be at least 1");
    }
    return problems;
}

// ─── Gradients ────────────────────────────────────────────────────────────────

bool Classifier::shape_matches(const TrainingExample& ex) const noexcept {
    return ex.features.size() == params_.input_size
        && ex.label.size() == params_.output_size()
        && ex.features.allFinite() && ex.label.allFinite();
}

Classifier::Gradients Classifier::zero_gradients() const {
    Gradients g;
    for (std::size_t l = 0; l < params_.layers.size(); ++l) {
        g.weights.push_back(Eigen::MatrixXd::Zero(params_.weights[l].rows(),
                                                  params_.weights[l].cols()));
        g.biases.push_back(Eigen::VectorXd::Zero(params_.biases[l].size()));
    }
    return g;
}

void Classifier::backprop(const TrainingExample& ex, Gradients& acc) const {
    const Activations acts = forward(ex.features);
    const Eigen::VectorXd diff = acts.back() - ex.label;
    const double k = static_cast<double>(diff.size());

    acc.loss += diff.squaredNorm() / k;

    // dL/da for L = ‖a − y‖² / K
    Eigen::VectorXd grad = (2.0 / k) * diff;

    for (std::size_t l = params_.layers.size(); l-- > 0;) {
        const Eigen::VectorXd delta =
            detail::backward(grad, acts[l + 1], params_.layers[l].activation);
        acc.weights[l].noalias() += acts[l] * delta.transpose();
        acc.biases[l] += delta;
        if (l > 0) {
            grad = params_.weights[l] * delta;
        }
    }
}

Classifier::Gradients
Classifier::batch_gradients(std::span<const TrainingExample> batch, int threads) const {
    const std::size_t n = batch.size();
    const std::size_t workers =
        std::clamp<std::size_t>(static_cast<std::size_t>(std::max(threads, 1)), 1, n);

    if (workers <= 1) {
        Gradients g = zero_gradients();
        for (const auto& ex : batch) backprop(ex, g);
        return g;
    }

    // Contiguous chunks, one gradient slot per worker, reduced in slot order
    // so the sum does not depend on scheduling.
    std::vector<Gradients> partial(workers, zero_gradients());
    for_each_chunk(n, workers, [&](std::size_t w, std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) backprop(batch[i], partial[w]);
    });

    Gradients total = std::move(partial.front());
    for (std::size_t w = 1; w < workers; ++w) {
        for (std::size_t l = 0; l < total.weights.size(); ++l) {
            total.weights[l] += partial[w].weights[l];
            total.biases[l]  += partial[w].biases[l];
        }
        total.loss += partial[w].loss;
    }
    return total;
}

// ─── train ────────────────────────────────────────────────────────────────────

TrainingReport Classifier::train(std::span<const TrainingExample> examples,
                                 const TrainingConfig& config) {
    TrainingReport report;
    if (!config.validate().empty()) {
        report.error = ErrorCode::ConfigurationError;
        return report;
    }
    if (!compiled_) {
        report.error = ErrorCode::ModelNotCompiled;
        return report;
    }
    if (examples.empty()) {
        report.error = ErrorCode::InsufficientTrainingData;
        return report;
    }
    if (config.validation_split <= 0.0) {
        return train(examples, {}, config);
    }

    // Seeded Fisher–Yates over indices; the tail becomes the validation set.
    std::vector<std::size_t> order(examples.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::mt19937_64 rng(config.seed);
    for (std::size_t i = order.size(); i > 1; --i) {
        const auto j = static_cast<std::size_t>(rng() % i);
        std::swap(order[i - 1], order[j]);
    }

    const auto n_val = static_cast<std::size_t>(
        std::floor(config.validation_split * static_cast<double>(examples.size())));
    const std::size_t n_train = examples.size() - n_val;
    if (n_train == 0) {
        report.error = ErrorCode::InsufficientTrainingData;
        return report;
    }

    std::vector<std::size_t> train_idx(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n_train));
    std::sort(train_idx.begin(), train_idx.end());

    std::vector<TrainingExample> train_set;
    std::vector<TrainingExample> val_set;
    train_set.reserve(n_train);
    val_set.reserve(n_val);
    for (const auto i : train_idx) train_set.push_back(examples[i]);
    for (std::size_t k = n_train; k < order.size(); ++k) val_set.push_back(examples[order[k]]);

    return train(train_set, val_set, config);
}

TrainingReport Classifier::train(std::span<const TrainingExample> examples,
                                 std::span<const TrainingExample> validation,
                                 const TrainingConfig& config) {
    TrainingReport report;
    if (!config.validate().empty()) {
        report.error = ErrorCode::ConfigurationError;
        return report;
    }
    if (!compiled_) {
        report.error = ErrorCode::ModelNotCompiled;
        return report;
    }
    if (examples.empty()) {
        report.error = ErrorCode::InsufficientTrainingData;
        return report;
    }
    const auto mismatched = [this](const TrainingExample& ex) { return !shape_matches(ex); };
    if (std::any_of(examples.begin(), examples.end(), mismatched) ||
        std::any_of(validation.begin(), validation.end(), mismatched)) {
        report.error = ErrorCode::ConfigurationError;
        return report;
    }

    const std::size_t n  = examples.size();
    const auto        bs = static_cast<std::size_t>(config.batch_size);
    report.epoch_losses.reserve(static_cast<std::size_t>(config.epochs));

    for (int epoch = 1; epoch <= config.epochs && !report.cancelled; ++epoch) {
        double loss = 0.0;

        for (std::size_t start = 0; start < n; start += bs) {
            if (config.stop.stop_requested()) {
                report.cancelled = true;
                break;
            }
            const auto batch = examples.subspan(start, std::min(bs, n - start));
            const Gradients g = batch_gradients(batch, config.threads);
            loss += g.loss;

            const double step = config.learning_rate / static_cast<double>(batch.size());
            for (std::size_t l = 0; l < params_.layers.size(); ++l) {
                params_.weights[l] -= step * g.weights[l];
                params_.biases[l]  -= step * g.biases[l];
            }
        }
        if (report.cancelled) break;

        report.epoch_losses.push_back(loss / static_cast<double>(n));
        report.epochs_completed = epoch;

        const bool validate_now =
            !validation.empty() &&
            (epoch % config.validation_interval == 0 || epoch == config.epochs);
        if (validate_now) {
            const double acc = accuracy(validation).value_or(0.0);
            report.validation_history.push_back({epoch, acc});
            if (!report.best_validation_accuracy || acc > *report.best_validation_accuracy) {
                report.best_validation_accuracy = acc;
            }
            if (config.verbose) {
                fmt::print(stderr, "epoch {:>5}/{}  loss {:.6f}  val_acc {:.4f}\n",
                           epoch, config.epochs, report.epoch_losses.back(), acc);
            }
        } else if (config.verbose && (epoch % config.validation_interval == 0 || epoch == 1)) {
            fmt::print(stderr, "epoch {:>5}/{}  loss {:.6f}\n",
                       epoch, config.epochs, report.epoch_losses.back());
        }
    }

    if (config.verbose && report.cancelled) {
        fmt::print(stderr, "training cancelled after {} epoch(s)\n", report.epochs_completed);
    }
    return report;
}

// ─── Evaluation ───────────────────────────────────────────────────────────────

std::optional<double>
Classifier::accuracy(std::span<const TrainingExample> examples) const {
    if (!compiled_ || examples.empty()) return std::nullopt;
    std::size_t correct = 0;
    for (const auto& ex : examples) {
        if (!shape_matches(ex)) return std::nullopt;
        const Eigen::VectorXd out = forward(ex.features).back();
        if (class_of_output(out) == class_of_label(ex.label)) ++correct;
    }
    return static_cast<double>(correct) / static_cast<double>(examples.size());
}

std::optional<EvaluationMetrics>
Classifier::evaluate(std::span<const TrainingExample> examples) const {
    if (!compiled_ || examples.empty()) return std::nullopt;

    const int out_size = params_.output_size();
    const auto k = static_cast<std::size_t>(out_size == 1 ? 2 : out_size);
    const std::size_t fraud = k - 1;

    EvaluationMetrics m;
    m.sample_count = examples.size();
    m.confusion.assign(k, std::vector<std::size_t>(k, 0));

    for (const auto& ex : examples) {
        if (!shape_matches(ex)) return std::nullopt;
        const Eigen::VectorXd out = forward(ex.features).back();
        const auto actual    = static_cast<std::size_t>(class_of_label(ex.label));
        const auto predicted = static_cast<std::size_t>(class_of_output(out));
        ++m.confusion[actual][predicted];
    }

    std::size_t correct = 0;
    std::size_t fp = 0;
    std::size_t fn = 0;
    for (std::size_t i = 0; i < k; ++i) {
        correct += m.confusion[i][i];
        if (i != fraud) {
            fp += m.confusion[i][fraud];
            fn += m.confusion[fraud][i];
        }
    }
    const auto tp = static_cast<double>(m.confusion[fraud][fraud]);

    m.accuracy  = static_cast<double>(correct) / static_cast<double>(m.sample_count);
    m.precision = tp + static_cast<double>(fp) > 0.0 ? tp / (tp + static_cast<double>(fp)) : 0.0;
    m.recall    = tp + static_cast<double>(fn) > 0.0 ? tp / (tp + static_cast<double>(fn)) : 0.0;
    m.f1 = m.precision + m.recall > 0.0
         ? 2.0 * m.precision * m.recall / (m.precision + m.recall)
         : 0.0;
    return m;
}

} // namespace fras::classifier
