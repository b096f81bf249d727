/**
 * @file Types.hpp
 * @brief Spectral vocabulary types shared by the DSP stages.
 * @author MasterLaplace
 *
 * Defines frequency bands, the physiological HRV bands, and the
 * one-sided power spectral density produced by Welch's method.
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <vector>

namespace hrv::dsp {

// ─── Frequency Band ──────────────────────────────────────────────────────────

/**
 * @brief Half-open frequency range [low, high) in Hz.
 */
struct FrequencyBand {
    core::f64 low;
    core::f64 high;
};

/**
 * @brief Standard HRV frequency bands (Task Force of the ESC, 1996).
 */
namespace band {

inline constexpr FrequencyBand kVlf{0.0033, 0.04};
inline constexpr FrequencyBand kLf{0.04, 0.15};
inline constexpr FrequencyBand kHf{0.15, 0.40};

} // namespace band

// ─── Power Spectral Density ──────────────────────────────────────────────────

/**
 * @brief One-sided PSD: power[k] is the density at freqs[k] (units^2 / Hz).
 *
 * freqs is uniformly spaced from 0 with step fs / nperseg.
 */
struct PowerSpectralDensity {
    std::vector<core::f64> freqs;
    std::vector<core::f64> power;

    [[nodiscard]] core::usize binCount() const noexcept { return freqs.size(); }
    [[nodiscard]] bool empty() const noexcept { return freqs.empty(); }
};

} // namespace hrv::dsp
