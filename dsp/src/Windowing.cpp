/**
 * @file Windowing.cpp
 * @brief Implementation of the Hann window.
 * @author MasterLaplace
 */

#include "hrv/dsp/Windowing.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace hrv::dsp {

HannWindow::HannWindow(core::usize windowSize, WindowSymmetry symmetry)
    : _coefficients(windowSize, 1.0)
{
    if (windowSize < 2) {
        _energy = static_cast<core::f64>(windowSize);
        return;
    }

    const auto denominator = static_cast<core::f64>(
        symmetry == WindowSymmetry::kPeriodic ? windowSize : windowSize - 1);

    for (core::usize i = 0; i < windowSize; ++i) {
        _coefficients[i] = 0.5 * (1.0 - std::cos(
            2.0 * std::numbers::pi * static_cast<core::f64>(i) / denominator));
        _energy += _coefficients[i] * _coefficients[i];
    }
}

void HannWindow::apply(std::span<core::f64> segment) const noexcept
{
    const core::usize count = std::min(segment.size(), _coefficients.size());
    for (core::usize t = 0; t < count; ++t)
        segment[t] *= _coefficients[t];
}

} // namespace hrv::dsp
