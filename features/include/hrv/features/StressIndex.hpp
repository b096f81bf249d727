/**
 * @file StressIndex.hpp
 * @brief Baevsky stress index from the RR-interval histogram.
 * @author MasterLaplace
 *
 * SI = AMo / (2 * Mo * MxDMn), where Mo is the centre of the modal bin
 * (ms), AMo the modal bin share (percent) and MxDMn the variation range
 * (ms). Higher values indicate stronger sympathetic dominance.
 *
 * @see Baevsky R.M. (2002), Analysis of HRV in space medicine.
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>

namespace hrv::features {

/**
 * @brief Histogram summary used by the stress index.
 */
struct RrHistogramMode {
    core::f64 mode = 0.0;          ///< Mo, centre of the highest bin (ms)
    core::f64 modeAmplitude = 0.0; ///< AMo, highest bin count / N * 100
    core::f64 range = 0.0;         ///< MxDMn, max - min (ms)
    core::usize binCount = 0;
};

/**
 * @brief Builds the min(50, N/2)-bin histogram of @p rr and locates its mode.
 *
 * Bins are equal-width over [min, max] with the last bin closed; a
 * constant input spans [v - 0.5, v + 0.5]. Ties pick the lowest bin.
 * Fewer than two samples or any non-finite value yield a zeroed summary.
 */
[[nodiscard]] RrHistogramMode computeHistogramMode(std::span<const core::f64> rr);

/**
 * @brief Baevsky stress index of @p rr.
 *
 * @return SI >= 0; exactly 0 for fewer than 10 samples, Mo == 0 or MxDMn == 0
 */
[[nodiscard]] core::f64 baevskyStressIndex(std::span<const core::f64> rr);

} // namespace hrv::features
