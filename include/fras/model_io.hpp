#pragma once

/// @file include/fras/model_io.hpp
/// @brief Model snapshot persistence (JSON and binary).
///
/// # Module: Model I/O
///
/// ## JSON Layout
/// ```
/// {
///   "format": "fras-model", "version": 1, "inputSize": 20,
///   "layers": [ {"units": 32, "activation": "relu",
///                "weights": [[…row…], …], "biases": […]}, … ]
/// }
/// ```
/// Doubles are written with 17 significant digits, so a JSON round trip
/// reproduces every weight exactly.
///
/// ## Binary Layout (little-endian)
/// ```
/// "FRASMDL1"                      8-byte magic
/// u32 input_size, u32 layer_count
/// per layer: u32 units, u32 activation, f64 weights (row-major), f64 biases
/// ```
/// Bit-exact round trip.
///
/// ## Guarantees
/// - Loading validates the layer-consistency invariant; inconsistent or
///   truncated snapshots yield `nullopt`
/// - Never throws

#include "fras/classifier.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fras::classifier {

enum class ModelFormat { Json, Binary };

[[nodiscard]] std::string to_json(const ModelParameters& params);

[[nodiscard]] std::optional<ModelParameters> from_json(std::string_view text);

[[nodiscard]] std::vector<std::uint8_t> to_binary(const ModelParameters& params);

[[nodiscard]] std::optional<ModelParameters>
from_binary(std::span<const std::uint8_t> bytes);

/// Write a snapshot to `path`. Returns `false` on I/O failure.
[[nodiscard]] bool save_model(const ModelParameters& params,
                              const std::string& path,
                              ModelFormat format);

/// Read a snapshot, detecting the format from the binary magic.
[[nodiscard]] std::optional<ModelParameters> load_model(const std::string& path);

} // namespace fras::classifier
