/**
 * @file BandPower.hpp
 * @brief Integrates PSD power within a frequency band.
 * @author MasterLaplace
 *
 * Replaces a plain bin sum with a trapezoidal integral over the bins that
 * fall inside the band, so the result is independent of frequency
 * resolution.
 *
 * @see welch, FrequencyBand
 */

#pragma once

#include "Types.hpp"

namespace hrv::dsp {

/**
 * @brief Trapezoidal integral of the PSD over bins with low <= f < high.
 *
 * A band containing fewer than two bins has no area and yields 0.
 *
 * @param psd  One-sided power spectral density
 * @param band Frequency range of interest
 * @return Band power (signal units squared)
 */
[[nodiscard]] core::f64 integrateBand(
    const PowerSpectralDensity &psd,
    FrequencyBand band) noexcept;

/**
 * @brief Number of PSD bins with low <= f < high.
 */
[[nodiscard]] core::usize binsInBand(
    const PowerSpectralDensity &psd,
    FrequencyBand band) noexcept;

} // namespace hrv::dsp
