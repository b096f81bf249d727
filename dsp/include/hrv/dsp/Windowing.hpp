/**
 * @file Windowing.hpp
 * @brief Window functions applied to segments before spectral analysis.
 * @author MasterLaplace
 *
 * Implements the Hann window. The coefficients are pre-computed at
 * construction time and reused for every Welch segment of equal length.
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>
#include <vector>

namespace hrv::dsp {

/**
 * @brief Denominator convention of the raised cosine.
 *
 * kSymmetric divides by N-1 (filter design); kPeriodic divides by N and
 * is the convention for spectral estimation.
 */
enum class WindowSymmetry : core::u8 {
    kSymmetric,
    kPeriodic
};

/**
 * @brief Hann (raised cosine) window w[n] = 0.5 * (1 - cos(2 pi n / D)).
 *
 * @code
 *   HannWindow window(64, WindowSymmetry::kPeriodic);
 *   window.apply(segment);
 * @endcode
 */
class HannWindow final {
public:
    /**
     * @brief Constructs a Hann window of the given length.
     *
     * @param windowSize Number of coefficients
     * @param symmetry   Denominator convention (N-1 or N)
     */
    explicit HannWindow(core::usize windowSize,
                        WindowSymmetry symmetry = WindowSymmetry::kPeriodic);

    /**
     * @brief Multiplies @p segment in place by the window coefficients.
     *
     * Only the first min(size(), segment.size()) samples are touched.
     */
    void apply(std::span<core::f64> segment) const noexcept;

    /**
     * @brief Sum of squared coefficients, used for PSD density scaling.
     */
    [[nodiscard]] core::f64 energy() const noexcept { return _energy; }

    [[nodiscard]] core::usize size() const noexcept { return _coefficients.size(); }

    [[nodiscard]] std::span<const core::f64> coefficients() const noexcept { return _coefficients; }

private:
    std::vector<core::f64> _coefficients;
    core::f64 _energy = 0.0;
};

} // namespace hrv::dsp
