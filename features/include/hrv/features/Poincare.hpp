/**
 * @file Poincare.hpp
 * @brief Poincaré plot descriptors SD1 and SD2.
 * @author MasterLaplace
 *
 * Each successive pair (rr[i], rr[i+1]) is a point of the Poincaré plot.
 * SD1 is the dispersion across the identity line (short-term variability),
 * SD2 the dispersion along it (long-term variability).
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>

namespace hrv::features {

struct PoincareFeatures {
    core::f64 sd1 = 0.0; ///< sample std of (rr[i+1] - rr[i]) / sqrt(2)
    core::f64 sd2 = 0.0; ///< sample std of (rr[i+1] + rr[i]) / sqrt(2)
};

/**
 * @brief Computes SD1 and SD2 over all successive pairs of @p rr.
 *
 * Fewer than three intervals (two pairs) yield zeros.
 */
[[nodiscard]] PoincareFeatures computePoincare(std::span<const core::f64> rr);

} // namespace hrv::features
