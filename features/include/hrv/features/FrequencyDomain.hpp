/**
 * @file FrequencyDomain.hpp
 * @brief LF / HF spectral power of an RR window.
 * @author MasterLaplace
 *
 * RR intervals are not uniformly spaced in time, so the tachogram is
 * first placed on its cumulative time axis, resampled onto a uniform grid
 * with a cubic spline, then passed to Welch's method. Band powers are
 * trapezoidal integrals of the resulting PSD.
 *
 * The stage never throws: every failure is returned as an Error with
 * code kSpectralEstimationFailed and the original cause in its message.
 *
 * @see CubicSpline, welch, integrateBand
 */

#pragma once

#include "hrv/core/Expected.hpp"
#include "hrv/core/Types.hpp"
#include "hrv/dsp/Types.hpp"

#include <span>
#include <vector>

namespace hrv::features {

/**
 * @brief Band powers of a successful spectral estimate.
 */
struct SpectralPower {
    core::f64 lf   = 0.0; ///< 0.04-0.15 Hz (ms^2)
    core::f64 hf   = 0.0; ///< 0.15-0.40 Hz (ms^2)
    core::f64 lfHf = 0.0; ///< lf / hf, 0 when hf == 0
};

/**
 * @brief Uniformly resampled tachogram.
 */
struct ResampledTachogram {
    std::vector<core::f64> time;   ///< seconds, step 1 / sampleRate
    std::vector<core::f64> values; ///< interpolated RR (ms)
    core::f64 sampleRate = 0.0;
};

/**
 * @brief Cumulative beat times t[i] = sum(rr[0..i]) / 1000, in seconds.
 */
[[nodiscard]] std::vector<core::f64> cumulativeTimeAxis(std::span<const core::f64> rr);

/**
 * @brief Resamples @p rr at @p sampleRate Hz on [t[0], t[N-1]).
 *
 * @return The uniform series, or an Error when the time axis is not
 *         strictly increasing, the spline cannot be fitted, or fewer than
 *         two grid points fit in the recording
 */
[[nodiscard]] core::Expected<ResampledTachogram> resampleTachogram(
    std::span<const core::f64> rr,
    core::f64 sampleRate);

/**
 * @brief Estimates the PSD of the resampled tachogram.
 *
 * Hann window, linear detrend, 50 % overlap, segment length
 * adaptiveSegmentLength(resampled size).
 */
[[nodiscard]] core::Expected<dsp::PowerSpectralDensity> tachogramPsd(
    std::span<const core::f64> rr,
    core::f64 sampleRate);

/**
 * @brief LF, HF and LF/HF of @p rr.
 *
 * @param rr         RR window (ms)
 * @param sampleRate Uniform resampling rate (Hz)
 * @return Band powers, or an Error with code kSpectralEstimationFailed
 */
[[nodiscard]] core::Expected<SpectralPower> computeSpectralPower(
    std::span<const core::f64> rr,
    core::f64 sampleRate);

} // namespace hrv::features
