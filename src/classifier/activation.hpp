#pragma once

/// @file src/classifier/activation.hpp
/// @brief Activation functions, their backward pass and the portable
///        uniform draw used for weight initialisation.

#include "fras/classifier.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <random>

namespace fras::classifier::detail {

/// Uniform double in [0, 1) from the top 53 bits of one draw. Unlike
/// `std::uniform_real_distribution`, identical on every standard library.
inline double uniform01(std::mt19937_64& rng) noexcept {
    return static_cast<double>(rng() >> 11) * 0x1.0p-53;
}

inline Eigen::VectorXd activate(const Eigen::VectorXd& z, Activation a) {
    switch (a) {
        case Activation::Identity:
            return z;
        case Activation::Relu:
            return z.cwiseMax(0.0);
        case Activation::Sigmoid:
            return z.unaryExpr([](double v) { return 1.0 / (1.0 + std::exp(-v)); });
        case Activation::Tanh:
            return z.array().tanh().matrix();
        case Activation::Softmax: {
            const double shift = z.maxCoeff();
            const Eigen::VectorXd e = (z.array() - shift).exp().matrix();
            return e / e.sum();
        }
    }
    return z;
}

/// dL/dz from dL/da (`grad`) and the layer output `a = f(z)`.
inline Eigen::VectorXd backward(const Eigen::VectorXd& grad,
                                const Eigen::VectorXd& a,
                                Activation act) {
    switch (act) {
        case Activation::Identity:
            return grad;
        case Activation::Relu:
            return grad.cwiseProduct((a.array() > 0.0).cast<double>().matrix());
        case Activation::Sigmoid:
            return grad.cwiseProduct((a.array() * (1.0 - a.array())).matrix());
        case Activation::Tanh:
            return grad.cwiseProduct((1.0 - a.array().square()).matrix());
        case Activation::Softmax:
            // Jacobian-vector product: δⱼ = aⱼ (gⱼ − Σₖ gₖ aₖ)
            return a.cwiseProduct((grad.array() - grad.dot(a)).matrix());
    }
    return grad;
}

} // namespace fras::classifier::detail
