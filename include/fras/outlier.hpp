#pragma once

/// @file include/fras/outlier.hpp
/// @brief Outlier Detector: z-score and IQR tests against a batch profile.
///
/// # Module: Outlier Detector
///
/// ## Responsibility
/// Decide whether one amount is a statistical outlier within its batch and
/// how far outside the normal range it lies.
///
/// ## Methods
/// ```
/// z      = |a − mean| / stddev                 flag if z > t   (t = 3.0)
/// score  = clamp((z − t) / t, 0, 1)            when flagged, else 0
///
/// IQR    = Q3 − Q1                              (quartiles of |amount|)
/// bounds = [Q1 − k·IQR, Q3 + k·IQR]             (k = 1.5)
/// score  = clamp(distance beyond bound / |bound|, 0, 1)
/// ```
/// Both tests run independently; the outlier signal is the larger score.
///
/// ## Edge Cases
/// - stddev = 0: the z-score test never flags
/// - IQR = 0: any |amount| other than the common value falls outside
///
/// ## Guarantees
/// - Pure and `noexcept`; reads the profile only

#include "fras/profile.hpp"

namespace fras::outlier {

enum class OutlierSeverity { None, Mild, Moderate, Extreme };

[[nodiscard]] std::string_view to_string(OutlierSeverity s) noexcept;

struct OutlierConfig {
    double zscore_threshold = constants::DEFAULT_ZSCORE_THRESHOLD;
    double iqr_multiplier   = constants::DEFAULT_IQR_MULTIPLIER;
};

struct OutlierResult {
    double zscore       = 0.0;   ///< |a − mean| / stddev (0 when stddev = 0)
    bool   zscore_flag  = false;
    double zscore_score = 0.0;   ///< [0, 1]
    bool   iqr_flag     = false;
    double iqr_score    = 0.0;   ///< [0, 1]
    double score        = 0.0;   ///< max(zscore_score, iqr_score)
    bool   is_outlier   = false; ///< Either test flagged
    OutlierSeverity severity = OutlierSeverity::None;
};

class OutlierDetector {
public:
    explicit OutlierDetector(OutlierConfig config = OutlierConfig{}) noexcept;

    /// Test one amount against the batch profile.
    [[nodiscard]] OutlierResult
    detect(double amount, const profile::BatchProfile& profile) const noexcept;

    /// Z-score of `amount`; 0 when the profile has no spread.
    [[nodiscard]] static double
    zscore(double amount, const profile::BatchProfile& profile) noexcept;

    /// Severity band for a combined score.
    [[nodiscard]] static OutlierSeverity severity_for(double score,
                                                      bool flagged) noexcept;

private:
    OutlierConfig config_;
};

} // namespace fras::outlier
