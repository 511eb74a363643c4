/// @file src/classifier/model_io.cpp
/// @brief Model snapshots: jsoncpp and little-endian binary encodings.

#include "fras/model_io.hpp"

#include <json/json.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>

namespace fras::classifier {

namespace {

constexpr char BINARY_MAGIC[8] = {'F', 'R', 'A', 'S', 'M', 'D', 'L', '1'};
constexpr int  JSON_VERSION    = 1;

// ─── Binary primitives ────────────────────────────────────────────────────────

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void put_f64(std::vector<std::uint8_t>& out, double d) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &d, sizeof bits);
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>(bits >> (8 * i)));
}

/// Bounds-checked little-endian reader.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

    bool u32(std::uint32_t& v) noexcept {
        if (remaining() < 4) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(bytes_[pos_ + i]) << (8 * i);
        pos_ += 4;
        return true;
    }

    bool f64(double& d) noexcept {
        if (remaining() < 8) return false;
        std::uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) bits |= static_cast<std::uint64_t>(bytes_[pos_ + i]) << (8 * i);
        std::memcpy(&d, &bits, sizeof d);
        pos_ += 8;
        return true;
    }

    bool magic() noexcept {
        if (remaining() < sizeof BINARY_MAGIC) return false;
        if (std::memcmp(bytes_.data() + pos_, BINARY_MAGIC, sizeof BINARY_MAGIC) != 0) return false;
        pos_ += sizeof BINARY_MAGIC;
        return true;
    }

private:
    std::span<const std::uint8_t> bytes_;
    std::size_t pos_ = 0;
};

constexpr std::array<Activation, 5> ACTIVATIONS = {
    Activation::Identity, Activation::Relu, Activation::Sigmoid,
    Activation::Tanh,     Activation::Softmax,
};

std::uint32_t activation_code(Activation a) noexcept {
    const auto it = std::find(ACTIVATIONS.begin(), ACTIVATIONS.end(), a);
    return static_cast<std::uint32_t>(it - ACTIVATIONS.begin());
}

// ─── JSON helpers ─────────────────────────────────────────────────────────────

Json::StreamWriterBuilder exact_writer() {
    Json::StreamWriterBuilder wb;
    wb["indentation"]   = "  ";
    wb["precision"]     = 17;
    wb["precisionType"] = "significant";
    return wb;
}

} // anonymous namespace

// ─── JSON ─────────────────────────────────────────────────────────────────────

std::string to_json(const ModelParameters& params) {
    Json::Value root(Json::objectValue);
    root["format"]    = "fras-model";
    root["version"]   = JSON_VERSION;
    root["inputSize"] = params.input_size;

    Json::Value layers(Json::arrayValue);
    for (std::size_t l = 0; l < params.layers.size(); ++l) {
        Json::Value layer(Json::objectValue);
        layer["units"]      = params.layers[l].units;
        layer["activation"] = std::string(to_string(params.layers[l].activation));

        Json::Value rows(Json::arrayValue);
        if (l < params.weights.size()) {
            const auto& w = params.weights[l];
            for (Eigen::Index r = 0; r < w.rows(); ++r) {
                Json::Value row(Json::arrayValue);
                for (Eigen::Index c = 0; c < w.cols(); ++c) row.append(w(r, c));
                rows.append(std::move(row));
            }
        }
        layer["weights"] = std::move(rows);

        Json::Value biases(Json::arrayValue);
        if (l < params.biases.size()) {
            for (Eigen::Index i = 0; i < params.biases[l].size(); ++i) {
                biases.append(params.biases[l](i));
            }
        }
        layer["biases"] = std::move(biases);
        layers.append(std::move(layer));
    }
    root["layers"] = std::move(layers);

    return Json::writeString(exact_writer(), root);
}

std::optional<ModelParameters> from_json(std::string_view text) {
    if (text.empty()) return std::nullopt;

    Json::CharReaderBuilder rb;
    const std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::nullopt;
    }

    try {
        if (!root.isObject() || !root["inputSize"].isInt() || !root["layers"].isArray()) {
            return std::nullopt;
        }

        ModelParameters p;
        p.input_size = root["inputSize"].asInt();

        Eigen::Index fan_in = p.input_size;
        for (const auto& layer : root["layers"]) {
            if (!layer.isObject() || !layer["units"].isInt() || !layer["activation"].isString()
                || !layer["weights"].isArray() || !layer["biases"].isArray()) {
                return std::nullopt;
            }
            const auto act = activation_from_string(layer["activation"].asString());
            const int units = layer["units"].asInt();
            if (!act || units <= 0 || fan_in <= 0) return std::nullopt;

            // Every shape check runs before allocation: `units` and `fan_in`
            // may only size matrices whose elements the document holds.
            const auto& rows = layer["weights"];
            const auto& bs   = layer["biases"];
            if (rows.size() != static_cast<Json::ArrayIndex>(fan_in)) return std::nullopt;
            if (bs.size() != static_cast<Json::ArrayIndex>(units)) return std::nullopt;
            for (const auto& row : rows) {
                if (!row.isArray() || row.size() != static_cast<Json::ArrayIndex>(units)) {
                    return std::nullopt;
                }
            }

            Eigen::MatrixXd w(fan_in, units);
            for (Json::ArrayIndex r = 0; r < rows.size(); ++r) {
                const auto& row = rows[r];
                for (Json::ArrayIndex c = 0; c < row.size(); ++c) {
                    if (!row[c].isNumeric()) return std::nullopt;
                    w(r, c) = row[c].asDouble();
                }
            }

            Eigen::VectorXd b(units);
            for (Json::ArrayIndex i = 0; i < bs.size(); ++i) {
                if (!bs[i].isNumeric()) return std::nullopt;
                b(i) = bs[i].asDouble();
            }

            p.layers.push_back({units, *act});
            p.weights.push_back(std::move(w));
            p.biases.push_back(std::move(b));
            fan_in = units;
        }

        if (!p.is_consistent()) return std::nullopt;
        return p;
    } catch (const Json::Exception&) {
        return std::nullopt;
    }
}

// ─── Binary ───────────────────────────────────────────────────────────────────

std::vector<std::uint8_t> to_binary(const ModelParameters& params) {
    std::vector<std::uint8_t> out(std::begin(BINARY_MAGIC), std::end(BINARY_MAGIC));
    put_u32(out, static_cast<std::uint32_t>(params.input_size));
    put_u32(out, static_cast<std::uint32_t>(params.layers.size()));

    for (std::size_t l = 0; l < params.layers.size(); ++l) {
        put_u32(out, static_cast<std::uint32_t>(params.layers[l].units));
        put_u32(out, activation_code(params.layers[l].activation));
        const auto& w = params.weights[l];
        for (Eigen::Index r = 0; r < w.rows(); ++r) {
            for (Eigen::Index c = 0; c < w.cols(); ++c) put_f64(out, w(r, c));
        }
        for (Eigen::Index i = 0; i < params.biases[l].size(); ++i) {
            put_f64(out, params.biases[l](i));
        }
    }
    return out;
}

std::optional<ModelParameters> from_binary(std::span<const std::uint8_t> bytes) {
    ByteReader in(bytes);
    std::uint32_t input_size = 0;
    std::uint32_t layer_count = 0;
    if (!in.magic() || !in.u32(input_size) || !in.u32(layer_count)) return std::nullopt;
    if (input_size == 0 || input_size > 1u << 20) return std::nullopt;

    ModelParameters p;
    p.input_size = static_cast<int>(input_size);

    std::uint64_t fan_in = input_size;
    for (std::uint32_t l = 0; l < layer_count; ++l) {
        std::uint32_t units = 0;
        std::uint32_t code  = 0;
        if (!in.u32(units) || !in.u32(code)) return std::nullopt;
        if (units == 0 || units > 1u << 20 || code >= ACTIVATIONS.size()) return std::nullopt;

        // Refuse to allocate more than the snapshot can hold.
        const std::uint64_t needed = (fan_in * units + units) * 8;
        if (needed > in.remaining()) return std::nullopt;

        Eigen::MatrixXd w(static_cast<Eigen::Index>(fan_in), static_cast<Eigen::Index>(units));
        for (Eigen::Index r = 0; r < w.rows(); ++r) {
            for (Eigen::Index c = 0; c < w.cols(); ++c) {
                if (!in.f64(w(r, c))) return std::nullopt;
            }
        }
        Eigen::VectorXd b(static_cast<Eigen::Index>(units));
        for (Eigen::Index i = 0; i < b.size(); ++i) {
            if (!in.f64(b(i))) return std::nullopt;
        }

        p.layers.push_back({static_cast<int>(units), ACTIVATIONS[code]});
        p.weights.push_back(std::move(w));
        p.biases.push_back(std::move(b));
        fan_in = units;
    }

    if (in.remaining() != 0 || !p.is_consistent()) return std::nullopt;
    return p;
}

// ─── Files ────────────────────────────────────────────────────────────────────

bool save_model(const ModelParameters& params, const std::string& path, ModelFormat format) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;

    if (format == ModelFormat::Binary) {
        const auto bytes = to_binary(params);
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    } else {
        file << to_json(params) << '\n';
    }
    return static_cast<bool>(file);
}

std::optional<ModelParameters> load_model(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                          std::istreambuf_iterator<char>());
    if (bytes.size() >= sizeof BINARY_MAGIC &&
        std::memcmp(bytes.data(), BINARY_MAGIC, sizeof BINARY_MAGIC) == 0) {
        return from_binary(bytes);
    }
    return from_json(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

} // namespace fras::classifier
