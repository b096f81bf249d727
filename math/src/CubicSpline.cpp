/**
 * @file CubicSpline.cpp
 * @brief Implementation of the not-a-knot cubic spline.
 */

#include "hrv/math/CubicSpline.hpp"

#include <Eigen/Sparse>

#include <algorithm>
#include <cmath>
#include <format>

namespace hrv::math {

using core::ErrorCode;
using core::f64;
using core::usize;

CubicSpline::CubicSpline(std::vector<f64> x, std::vector<f64> y, std::vector<f64> m)
    : _x(std::move(x)), _y(std::move(y)), _m(std::move(m))
{
}

core::Expected<CubicSpline> CubicSpline::fit(std::span<const f64> x, std::span<const f64> y)
{
    if (x.size() != y.size())
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("knot size mismatch: {} abscissae, {} ordinates", x.size(), y.size()));

    const usize n = x.size();
    if (n < kMinKnots)
        return core::makeError(ErrorCode::kInsufficientData,
            std::format("cubic spline needs at least {} knots, got {}", kMinKnots, n));

    for (usize i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i]))
            return core::makeError(ErrorCode::kInvalidArgument,
                std::format("non-finite knot at index {}", i));
        if (i > 0 && !(x[i] > x[i - 1]))
            return core::makeError(ErrorCode::kInvalidArgument,
                std::format("knot abscissae not strictly increasing at index {}", i));
    }

    std::vector<f64> h(n - 1);
    for (usize i = 0; i + 1 < n; ++i)
        h[i] = x[i + 1] - x[i];

    const auto size = static_cast<Eigen::Index>(n);
    std::vector<Eigen::Triplet<f64>> entries;
    entries.reserve(3 * n);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(size);

    // Not-a-knot at x[1]: M0 * h1 - M1 * (h0 + h1) + M2 * h0 = 0
    entries.emplace_back(0, 0, h[1]);
    entries.emplace_back(0, 1, -(h[0] + h[1]));
    entries.emplace_back(0, 2, h[0]);

    for (usize i = 1; i + 1 < n; ++i) {
        const auto r = static_cast<Eigen::Index>(i);
        entries.emplace_back(r, r - 1, h[i - 1]);
        entries.emplace_back(r, r, 2.0 * (h[i - 1] + h[i]));
        entries.emplace_back(r, r + 1, h[i]);
        rhs(r) = 6.0 * ((y[i + 1] - y[i]) / h[i] - (y[i] - y[i - 1]) / h[i - 1]);
    }

    // Not-a-knot at x[n-2]
    const auto last = size - 1;
    entries.emplace_back(last, last - 2, h[n - 2]);
    entries.emplace_back(last, last - 1, -(h[n - 3] + h[n - 2]));
    entries.emplace_back(last, last, h[n - 3]);

    Eigen::SparseMatrix<f64> a(size, size);
    a.setFromTriplets(entries.begin(), entries.end());
    a.makeCompressed();

    Eigen::SparseLU<Eigen::SparseMatrix<f64>, Eigen::COLAMDOrdering<int>> lu;
    lu.compute(a);
    if (lu.info() != Eigen::Success)
        return core::makeError(ErrorCode::kSingularSystem,
            std::format("spline system factorization failed: {}", lu.lastErrorMessage()));

    const Eigen::VectorXd m = lu.solve(rhs);
    if (lu.info() != Eigen::Success || !m.allFinite())
        return core::makeError(ErrorCode::kSingularSystem, "spline solve produced non-finite values");

    return CubicSpline{
        std::vector<f64>(x.begin(), x.end()),
        std::vector<f64>(y.begin(), y.end()),
        std::vector<f64>(m.data(), m.data() + m.size())};
}

usize CubicSpline::segmentFor(f64 xq) const noexcept
{
    if (xq <= _x.front())
        return 0;
    if (xq >= _x.back())
        return _x.size() - 2;

    const auto it = std::upper_bound(_x.begin(), _x.end(), xq);
    return static_cast<usize>(std::distance(_x.begin(), it)) - 1;
}

f64 CubicSpline::operator()(f64 xq) const noexcept
{
    const usize i = segmentFor(xq);
    const f64 h = _x[i + 1] - _x[i];
    const f64 left = _x[i + 1] - xq;
    const f64 right = xq - _x[i];

    return _m[i] * left * left * left / (6.0 * h)
         + _m[i + 1] * right * right * right / (6.0 * h)
         + (_y[i] / h - _m[i] * h / 6.0) * left
         + (_y[i + 1] / h - _m[i + 1] * h / 6.0) * right;
}

std::vector<f64> CubicSpline::evaluate(std::span<const f64> xq) const
{
    std::vector<f64> out(xq.size());
    std::transform(xq.begin(), xq.end(), out.begin(),
        [this](f64 v) { return (*this)(v); });
    return out;
}

} // namespace hrv::math
