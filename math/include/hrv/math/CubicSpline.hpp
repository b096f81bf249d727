/**
 * @file CubicSpline.hpp
 * @brief Interpolating cubic spline with not-a-knot end conditions.
 * @author MasterLaplace
 *
 * Used to resample the non-uniform RR tachogram onto a uniform time grid
 * before spectral estimation. The banded second-derivative system is stored
 * sparse and factorized with Eigen::SparseLU. Evaluation outside the knot
 * range extrapolates the first or last polynomial piece.
 *
 * @see FrequencyDomain
 */

#pragma once

#include "hrv/core/Expected.hpp"
#include "hrv/core/Types.hpp"

#include <span>
#include <vector>

namespace hrv::math {

/**
 * @brief Piecewise cubic C2 interpolant through (x[i], y[i]).
 *
 * The not-a-knot condition makes the third derivative continuous at the
 * second and penultimate knots, so any cubic polynomial is reproduced
 * exactly.
 *
 * @code
 *   auto spline = CubicSpline::fit(t, rr);
 *   if (spline)
 *       auto uniform = spline->evaluate(grid);
 * @endcode
 */
class CubicSpline {
public:
    /// Minimum knot count for the not-a-knot system to be determined.
    static constexpr core::usize kMinKnots = 4;

    /**
     * @brief Fits the spline through the given knots.
     *
     * @param x Knot abscissae, strictly increasing
     * @param y Knot ordinates, same length as @p x
     * @return The fitted spline, or an Error when the knots are fewer than
     *         kMinKnots, mismatched, non-finite, not strictly increasing,
     *         or the linear system is singular
     */
    [[nodiscard]] static core::Expected<CubicSpline> fit(
        std::span<const core::f64> x,
        std::span<const core::f64> y);

    /**
     * @brief Evaluates the spline at @p xq (extrapolating outside the knots).
     */
    [[nodiscard]] core::f64 operator()(core::f64 xq) const noexcept;

    /**
     * @brief Evaluates the spline at every query point.
     */
    [[nodiscard]] std::vector<core::f64> evaluate(std::span<const core::f64> xq) const;

    [[nodiscard]] core::usize knotCount() const noexcept { return _x.size(); }

private:
    CubicSpline(std::vector<core::f64> x, std::vector<core::f64> y, std::vector<core::f64> m);

    [[nodiscard]] core::usize segmentFor(core::f64 xq) const noexcept;

    std::vector<core::f64> _x;
    std::vector<core::f64> _y;
    std::vector<core::f64> _m; ///< second derivatives at the knots
};

} // namespace hrv::math
