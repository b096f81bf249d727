/**
 * @file Statistics.hpp
 * @brief Descriptive statistics over RR-interval sequences.
 * @author MasterLaplace
 *
 * Provides mean, Bessel-corrected standard deviation, root mean square,
 * successive differences, and median. These are the building blocks used
 * by the time-domain, Poincaré, and labelling stages.
 *
 * @see TimeDomain, Poincare
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>
#include <vector>

namespace hrv::math {

/**
 * @brief Pure-function statistical utilities for RR-interval sequences.
 */
class Statistics {
public:
    Statistics() = delete;

    /**
     * @brief Arithmetic mean.
     *
     * @param data Input values
     * @return Mean, or 0 if @p data is empty
     */
    [[nodiscard]] static core::f64 mean(std::span<const core::f64> data) noexcept;

    /**
     * @brief Sample standard deviation with divisor N-1.
     *
     * @param data Input values
     * @return Standard deviation, or 0 if fewer than two values
     */
    [[nodiscard]] static core::f64 sampleStdDev(std::span<const core::f64> data) noexcept;

    /**
     * @brief Root mean square, sqrt(mean(x^2)).
     *
     * @param data Input values
     * @return RMS value, or 0 if @p data is empty
     */
    [[nodiscard]] static core::f64 rootMeanSquare(std::span<const core::f64> data) noexcept;

    /**
     * @brief Successive differences d[i] = x[i+1] - x[i].
     *
     * @param data Input values
     * @return N-1 differences, empty if fewer than two values
     */
    [[nodiscard]] static std::vector<core::f64> successiveDifferences(
        std::span<const core::f64> data);

    /**
     * @brief Median; the mean of the two middle values for even counts.
     *
     * @param data Input values (not modified)
     * @return Median, or 0 if @p data is empty
     */
    [[nodiscard]] static core::f64 median(std::span<const core::f64> data);
};

} // namespace hrv::math
