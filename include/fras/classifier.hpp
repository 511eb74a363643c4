#pragma once

/// @file include/fras/classifier.hpp
/// @brief Classifier: small feed-forward network producing a fraud signal.
///
/// # Module: Classifier
///
/// ## Responsibility
/// Hold one set of `ModelParameters`, run inference on feature vectors and
/// fit the parameters to labelled examples by gradient descent.
///
/// ## Forward Pass
/// ```
/// a₀ = x
/// zₗ = Wₗᵀ aₗ₋₁ + bₗ          Wₗ is (units of layer l−1) × (units of layer l)
/// aₗ = fₗ(zₗ)
/// softmax(z)ᵢ = exp(zᵢ − max z) / Σⱼ exp(zⱼ − max z)
/// ```
/// Softmax normalises over the whole layer, never per neuron.
///
/// ## Training
/// Per-example loss is the mean squared error against the label vector.
/// Gradients come from full backpropagation and are averaged over each
/// mini-batch before one update; with `threads > 1` the per-example
/// gradients of a batch are accumulated in contiguous chunks on worker
/// threads and reduced in chunk order.
///
/// ## Initialisation
/// He-scaled uniform: `W ~ U(−1, 1) · sqrt(2 / fan_in)`, biases zero, drawn
/// from `std::mt19937_64(seed)`. The same seed always yields bit-identical
/// weights on every platform.
///
/// ## Ownership
/// A Classifier exclusively owns its parameters. `train` is the only
/// mutating call; `predict` and `evaluate` are const and may run
/// concurrently with each other, never with `train`.
///
/// ## NOT Responsible For
/// - Feature extraction (see features.hpp)
/// - Mixing the probability into a risk score (see risk.hpp)
/// - Persistence (see model_io.hpp)

#include "fras/types.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace fras::classifier {

// ─── Layers ───────────────────────────────────────────────────────────────────

enum class Activation { Identity, Relu, Sigmoid, Tanh, Softmax };

/// Lower-case activation name ("identity", "relu", …).
[[nodiscard]] std::string_view to_string(Activation a) noexcept;

/// Inverse of `to_string`.
[[nodiscard]] std::optional<Activation>
activation_from_string(std::string_view name) noexcept;

struct LayerSpec {
    int        units;
    Activation activation;
};

// ─── Labels ───────────────────────────────────────────────────────────────────

/// Output classes of the three-class model.
enum class ClassLabel { Legitimate = 0, Suspicious = 1, Fraudulent = 2 };

static constexpr int CLASS_COUNT = 3;

[[nodiscard]] std::string_view to_string(ClassLabel c) noexcept;

/// Parse "legitimate" / "suspicious" / "fraudulent" (case-insensitive), or
/// the digits "0" / "1" / "2".
[[nodiscard]] std::optional<ClassLabel> label_from_string(std::string_view text);

/// One-hot target for the three-class model.
[[nodiscard]] Eigen::VectorXd one_hot(ClassLabel c);

/// 0/1 target for the single-output binary model (fraudulent ⇒ 1).
[[nodiscard]] Eigen::VectorXd binary_target(ClassLabel c);

// ─── Configuration ────────────────────────────────────────────────────────────

/// Network shape.
struct ClassifierConfig {
    int input_size = constants::FEATURE_DIM;
    std::vector<LayerSpec> layers = {
        {32, Activation::Relu},
        {16, Activation::Relu},
        {8,  Activation::Relu},
        {3,  Activation::Softmax},
    };

    /// Same hidden stack ending in one sigmoid unit.
    [[nodiscard]] static ClassifierConfig binary();

    /// Human-readable problems; empty when the shape is usable.
    [[nodiscard]] std::vector<std::string> validate() const;
};

/// Weights and biases of a compiled network.
///
/// Invariant: `weights[0].rows() == input_size`, and for every later layer
/// `weights[i].rows() == layers[i−1].units`; `weights[i].cols()` and
/// `biases[i].size()` equal `layers[i].units`.
struct ModelParameters {
    int input_size = 0;
    std::vector<LayerSpec>       layers;
    std::vector<Eigen::MatrixXd> weights;
    std::vector<Eigen::VectorXd> biases;

    [[nodiscard]] bool is_consistent() const noexcept;
    [[nodiscard]] int  output_size() const noexcept;
};

// ─── Inference ────────────────────────────────────────────────────────────────

struct Prediction {
    Eigen::VectorXd output;      ///< Final-layer activations
    int             prediction;  ///< Arg-max index (binary: 1 if output ≥ 0.5)
    double          confidence;  ///< Max output value
};

// ─── Training ─────────────────────────────────────────────────────────────────

struct TrainingExample {
    Eigen::VectorXd features;
    Eigen::VectorXd label;
};

struct TrainingConfig {
    int         epochs           = 100;
    double      learning_rate    = 0.05;
    int         batch_size       = 1;
    double      validation_split = 0.0;   ///< Fraction held out, [0, 1)
    std::uint64_t seed           = 42;    ///< Drives the validation carve
    int         validation_interval = 10; ///< Evaluate every K epochs
    int         threads          = 1;     ///< Gradient workers per batch
    std::stop_token stop;                 ///< Checked between batches
    bool        verbose          = false; ///< Epoch lines on stderr

    [[nodiscard]] std::vector<std::string> validate() const;
};

struct ValidationPoint {
    int    epoch;     ///< 1-based
    double accuracy;
};

struct TrainingReport {
    std::optional<ErrorCode>     error;  ///< Set when training did not run
    int                          epochs_completed = 0;
    std::vector<double>          epoch_losses;        ///< Mean MSE per epoch
    std::vector<ValidationPoint> validation_history;
    std::optional<double>        best_validation_accuracy;
    bool                         cancelled = false;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// ─── Evaluation ───────────────────────────────────────────────────────────────

/// Held-out performance. Precision, recall and F1 refer to the fraud class
/// (index 2 of the three-class model, 1 of the binary model).
struct EvaluationMetrics {
    std::size_t sample_count = 0;
    double accuracy  = 0.0;
    double precision = 0.0;
    double recall    = 0.0;
    double f1        = 0.0;
    /// confusion[actual][predicted]
    std::vector<std::vector<std::size_t>> confusion;
};

// ─── Classifier ───────────────────────────────────────────────────────────────

class Classifier {
public:
    explicit Classifier(ClassifierConfig config = ClassifierConfig{});

    /// Adopt existing parameters (e.g. loaded from disk).
    ///
    /// # Returns
    /// `nullopt` if the parameters violate the layer-consistency invariant.
    [[nodiscard]] static std::optional<Classifier>
    from_parameters(ModelParameters params);

    /// Allocate and initialise weights.
    ///
    /// # Returns
    /// `false` if the configured shape is invalid; the model stays
    /// uncompiled.
    bool compile(std::uint64_t seed);

    [[nodiscard]] bool is_compiled() const noexcept { return compiled_; }

    /// Forward pass.
    ///
    /// # Returns
    /// `nullopt` if the model is not compiled or `x` has the wrong length.
    [[nodiscard]] std::optional<Prediction>
    predict(const Eigen::VectorXd& x) const;

    /// Fraud probability of one input: `P(fraudulent) + ½·P(suspicious)` for
    /// the three-class model, the sigmoid output for the binary model, the
    /// last output otherwise. Clamped to [0, 1].
    [[nodiscard]] std::optional<double>
    fraud_probability(const Eigen::VectorXd& x) const;

    /// Fit to `examples`, holding out `config.validation_split` of them.
    TrainingReport train(std::span<const TrainingExample> examples,
                         const TrainingConfig& config);

    /// Fit to `examples`, validating on the caller's held-out set.
    TrainingReport train(std::span<const TrainingExample> examples,
                         std::span<const TrainingExample> validation,
                         const TrainingConfig& config);

    /// Arg-max accuracy over a labelled set; `nullopt` if uncompiled or empty.
    [[nodiscard]] std::optional<double>
    accuracy(std::span<const TrainingExample> examples) const;

    /// Full metrics over a labelled set; `nullopt` if uncompiled, empty or
    /// mis-shaped.
    [[nodiscard]] std::optional<EvaluationMetrics>
    evaluate(std::span<const TrainingExample> examples) const;

    [[nodiscard]] const ModelParameters& parameters() const noexcept {
        return params_;
    }

    [[nodiscard]] int input_size() const noexcept { return params_.input_size; }
    [[nodiscard]] int output_size() const noexcept { return params_.output_size(); }

private:
    /// Per-layer activations of one forward pass (index 0 is the input).
    using Activations = std::vector<Eigen::VectorXd>;

    struct Gradients {
        std::vector<Eigen::MatrixXd> weights;
        std::vector<Eigen::VectorXd> biases;
        double loss = 0.0;
    };

    [[nodiscard]] Activations forward(const Eigen::VectorXd& x) const;
    [[nodiscard]] Gradients   zero_gradients() const;

    /// Add one example's gradient to `acc`.
    void backprop(const TrainingExample& ex, Gradients& acc) const;

    /// Gradient sum over `batch`, split across `threads` workers.
    [[nodiscard]] Gradients
    batch_gradients(std::span<const TrainingExample> batch, int threads) const;

    [[nodiscard]] int class_of_output(const Eigen::VectorXd& out) const noexcept;
    [[nodiscard]] int class_of_label(const Eigen::VectorXd& label) const noexcept;
    [[nodiscard]] bool shape_matches(const TrainingExample& ex) const noexcept;

    ClassifierConfig config_;
    ModelParameters  params_;
    bool             compiled_ = false;
};

} // namespace fras::classifier
