/// @file src/core/types.cpp
/// @brief Names for the shared enumerations.

#include "fras/types.hpp"

namespace fras {

std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Minimal:  return "MINIMAL";
        case RiskLevel::Low:      return "LOW";
        case RiskLevel::Medium:   return "MEDIUM";
        case RiskLevel::High:     return "HIGH";
        case RiskLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidRecord:            return "InvalidRecord";
        case ErrorCode::InsufficientBatchSize:    return "InsufficientBatchSize";
        case ErrorCode::ModelNotCompiled:         return "ModelNotCompiled";
        case ErrorCode::InsufficientTrainingData: return "InsufficientTrainingData";
        case ErrorCode::ConfigurationError:       return "ConfigurationError";
    }
    return "Unknown";
}

} // namespace fras
