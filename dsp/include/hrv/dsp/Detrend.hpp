/**
 * @file Detrend.hpp
 * @brief Removal of the least-squares linear trend from a segment.
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>

namespace hrv::dsp {

/**
 * @brief Subtracts the least-squares line a + b*t (t = 0..N-1) in place.
 *
 * A single sample is reduced to zero; an empty span is left untouched.
 */
void detrendLinear(std::span<core::f64> segment) noexcept;

/**
 * @brief Subtracts the segment mean in place.
 */
void detrendConstant(std::span<core::f64> segment) noexcept;

} // namespace hrv::dsp
