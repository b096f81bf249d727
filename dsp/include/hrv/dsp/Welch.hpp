/**
 * @file Welch.hpp
 * @brief Welch power spectral density estimate.
 * @author MasterLaplace
 *
 * Averages the modified periodograms of overlapping, detrended, Hann
 * windowed segments. Output scaling is a one-sided density, so the
 * integral of the PSD over frequency equals the signal variance.
 *
 * @see HannWindow, Fft, integrateBand
 */

#pragma once

#include "Types.hpp"

#include "hrv/core/Expected.hpp"

#include <span>

namespace hrv::dsp {

/**
 * @brief Per-segment trend removal applied before windowing.
 */
enum class DetrendMode : core::u8 {
    kNone,
    kConstant,
    kLinear
};

/**
 * @brief Parameters of a Welch estimate.
 */
struct WelchConfig {
    core::f64 sampleRate = 4.0;
    core::usize segmentLength = 64;          ///< nperseg, clamped to the signal length
    core::usize overlap = kHalfSegment;      ///< noverlap; kHalfSegment means nperseg / 2
    DetrendMode detrend = DetrendMode::kLinear;

    static constexpr core::usize kHalfSegment = static_cast<core::usize>(-1);
};

/**
 * @brief Segment length that adapts to short resampled series.
 *
 * min(64, max(8, n / 4)), never longer than @p n itself.
 *
 * @param n Number of uniformly resampled points
 */
[[nodiscard]] core::usize adaptiveSegmentLength(core::usize n) noexcept;

/**
 * @brief Estimates the PSD of @p signal with Welch's method.
 *
 * @param signal Uniformly sampled input
 * @param config Sampling rate, segmentation, and detrending
 * @return The one-sided PSD, or an Error when the signal is shorter than
 *         two samples, the sample rate is not positive, or the estimate
 *         is not finite
 */
[[nodiscard]] core::Expected<PowerSpectralDensity> welch(
    std::span<const core::f64> signal,
    const WelchConfig &config);

} // namespace hrv::dsp
