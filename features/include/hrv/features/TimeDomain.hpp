/**
 * @file TimeDomain.hpp
 * @brief Time-domain HRV statistics of an RR window.
 * @author MasterLaplace
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>

namespace hrv::features {

/**
 * @brief Descriptive statistics of the intervals and their successive differences.
 */
struct TimeDomainFeatures {
    core::f64 meanRr = 0.0; ///< arithmetic mean (ms)
    core::f64 sdnn   = 0.0; ///< sample standard deviation, N-1 (ms)
    core::f64 rmssd  = 0.0; ///< root mean square of successive differences (ms)
    core::f64 pnn50  = 0.0; ///< percent of |successive differences| > 50 ms
    core::f64 cv     = 0.0; ///< sdnn / meanRr * 100, 0 when meanRr == 0
};

/**
 * @brief Computes the time-domain features of @p rr.
 *
 * Fewer than two intervals leave the difference-based fields at 0.
 */
[[nodiscard]] TimeDomainFeatures computeTimeDomain(std::span<const core::f64> rr);

} // namespace hrv::features
