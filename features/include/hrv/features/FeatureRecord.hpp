/**
 * @file FeatureRecord.hpp
 * @brief Fixed-schema HRV feature vector produced for one window.
 * @author MasterLaplace
 *
 * The eleven feature fields are always present and always finite. Zero is
 * the sentinel for values that are undefined on a degenerate window; the
 * spectral status tag tells a measured zero apart from a failed estimate.
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <array>
#include <string_view>

namespace hrv::features {

/**
 * @brief Outcome of the frequency-domain stage for a window.
 */
enum class SpectralStatus : core::u8 {
    kEstimated,  ///< lf, hf, lf_hf are measurements (possibly zero)
    kDegenerate  ///< estimation failed; lf, hf, lf_hf hold the 0.0 sentinel
};

[[nodiscard]] constexpr std::string_view spectralStatusName(SpectralStatus status) noexcept
{
    switch (status) {
        case SpectralStatus::kEstimated:  return "estimated";
        case SpectralStatus::kDegenerate: return "degenerate";
    }
    return "unknown";
}

/// Number of numeric features in a FeatureRecord.
inline constexpr core::usize kFeatureCount = 11;

/// External feature names, in schema order.
inline constexpr std::array<std::string_view, kFeatureCount> kFeatureNames = {
    "mean_rr", "sdnn", "rmssd", "pnn50", "cv",
    "lf", "hf", "lf_hf",
    "sd1", "sd2", "si"
};

/**
 * @brief HRV features of one window.
 */
struct FeatureRecord {
    core::usize startIndex = 0; ///< beat index of the window start

    // Time domain
    core::f64 meanRr = 0.0; ///< ms
    core::f64 sdnn   = 0.0; ///< ms
    core::f64 rmssd  = 0.0; ///< ms
    core::f64 pnn50  = 0.0; ///< percent
    core::f64 cv     = 0.0; ///< percent

    // Frequency domain
    core::f64 lf   = 0.0; ///< ms^2
    core::f64 hf   = 0.0; ///< ms^2
    core::f64 lfHf = 0.0;

    // Nonlinear
    core::f64 sd1 = 0.0; ///< ms
    core::f64 sd2 = 0.0; ///< ms
    core::f64 si  = 0.0;

    SpectralStatus spectral = SpectralStatus::kEstimated;

    /**
     * @brief Feature values in kFeatureNames order.
     */
    [[nodiscard]] std::array<core::f64, kFeatureCount> values() const noexcept
    {
        return {meanRr, sdnn, rmssd, pnn50, cv, lf, hf, lfHf, sd1, sd2, si};
    }

    /**
     * @brief True if every feature value is finite.
     */
    [[nodiscard]] bool isFinite() const noexcept;

    bool operator==(const FeatureRecord &) const = default;
};

} // namespace hrv::features
