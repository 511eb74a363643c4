#pragma once

/// @file include/fras/types.hpp
/// @brief Shared value types for the Fraud Risk Analytics System (FRAS).
///
/// Every module includes this file. It defines the transaction record in its
/// raw and validated forms, the Eigen-based feature vector, the risk band
/// enumeration and the error taxonomy.

#include "fras/constants.hpp"

#include <Eigen/Dense>

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fras {

// ─── Records ──────────────────────────────────────────────────────────────────

/// A transaction exactly as an ingestion source delivered it.
///
/// `amount` and `timestamp` stay textual until validation so that missing,
/// null and malformed values can be told apart and reported.
struct RawRecord {
    std::string                id;
    std::optional<std::string> amount;     ///< nullopt when absent or null
    std::optional<std::string> timestamp;  ///< ISO-8601, nullopt when absent
    std::string                account;
    std::string                vendor;
    std::string                description;
    std::optional<std::string> label;      ///< Ground truth, training files only
};

/// A validated transaction. Immutable once ingested.
struct Transaction {
    std::string                          id;
    double                               amount;
    std::chrono::sys_seconds             timestamp;  ///< UTC
    std::string                          account;
    std::string                          vendor;
    std::string                          description;

    /// Counterparty used for frequency and velocity features: the account,
    /// or the vendor when no account is present. Empty when neither is set.
    [[nodiscard]] const std::string& counterparty() const noexcept {
        return account.empty() ? vendor : account;
    }
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Fixed-length numeric encoding of one transaction.
using FeatureVector = Eigen::Vector<double, constants::FEATURE_DIM>;

// ─── Risk Bands ───────────────────────────────────────────────────────────────

enum class RiskLevel { Minimal, Low, Medium, High, Critical };

static constexpr std::size_t RISK_LEVEL_COUNT = 5;

static constexpr std::array<RiskLevel, RISK_LEVEL_COUNT> ALL_RISK_LEVELS = {
    RiskLevel::Minimal, RiskLevel::Low, RiskLevel::Medium,
    RiskLevel::High,    RiskLevel::Critical,
};

/// Upper-case band name ("MINIMAL" … "CRITICAL").
[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;

// ─── Error Taxonomy ───────────────────────────────────────────────────────────

enum class ErrorCode {
    InvalidRecord,
    InsufficientBatchSize,
    ModelNotCompiled,
    InsufficientTrainingData,
    ConfigurationError,
};

/// CamelCase error name ("InvalidRecord", "ModelNotCompiled", …).
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

} // namespace fras
