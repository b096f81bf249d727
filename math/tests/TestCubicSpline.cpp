/**
 * @file TestCubicSpline.cpp
 * @brief Unit tests for math::CubicSpline (not-a-knot).
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include "hrv/math/CubicSpline.hpp"

namespace hrv::math {

using Catch::Matchers::WithinAbs;

namespace {

core::f64 cubic(core::f64 x)
{
    return 0.5 * x * x * x - 2.0 * x * x + x + 3.0;
}

} // namespace

TEST_CASE("CubicSpline reproduces a cubic polynomial", "[math][spline]")
{
    const std::vector<core::f64> x = {0.0, 0.7, 1.5, 2.1, 3.4, 4.0, 5.2};
    std::vector<core::f64> y;
    for (const core::f64 v : x)
        y.push_back(cubic(v));

    auto spline = CubicSpline::fit(x, y);
    REQUIRE(spline.has_value());
    REQUIRE(spline->knotCount() == x.size());

    SECTION("at the knots")
    {
        for (std::size_t i = 0; i < x.size(); ++i)
            REQUIRE_THAT((*spline)(x[i]), WithinAbs(y[i], 1e-9));
    }

    SECTION("between the knots")
    {
        for (core::f64 q = 0.05; q < 5.2; q += 0.25)
            REQUIRE_THAT((*spline)(q), WithinAbs(cubic(q), 1e-9));
    }

    SECTION("extrapolates the end segments")
    {
        REQUIRE_THAT((*spline)(-0.5), WithinAbs(cubic(-0.5), 1e-8));
        REQUIRE_THAT((*spline)(5.6), WithinAbs(cubic(5.6), 1e-8));
    }
}

TEST_CASE("CubicSpline fits thousands of non-uniform knots", "[math][spline]")
{
    constexpr std::size_t kKnots = 4000;

    std::vector<core::f64> x(kKnots);
    std::vector<core::f64> y(kKnots);
    for (std::size_t i = 1; i < kKnots; ++i)
        x[i] = x[i - 1] + 1e-3 * (1.0 + 0.5 * std::sin(static_cast<core::f64>(i)));
    for (std::size_t i = 0; i < kKnots; ++i)
        y[i] = cubic(x[i]);

    auto spline = CubicSpline::fit(x, y);
    REQUIRE(spline.has_value());
    REQUIRE(spline->knotCount() == kKnots);

    for (std::size_t i = 0; i < kKnots; i += 97)
        REQUIRE_THAT((*spline)(x[i]), WithinAbs(y[i], 1e-8));

    for (std::size_t i = 0; i + 1 < kKnots; i += 131) {
        const core::f64 mid = 0.5 * (x[i] + x[i + 1]);
        REQUIRE_THAT((*spline)(mid), WithinAbs(cubic(mid), 1e-8));
    }
}

TEST_CASE("CubicSpline::evaluate matches pointwise evaluation", "[math][spline]")
{
    const std::vector<core::f64> x = {0.0, 0.8, 1.6, 2.4, 3.2};
    const std::vector<core::f64> y = {800.0, 820.0, 790.0, 805.0, 812.0};

    auto spline = CubicSpline::fit(x, y);
    REQUIRE(spline.has_value());

    const std::vector<core::f64> grid = {0.0, 0.25, 0.5, 1.0, 2.0, 3.0};
    const auto values = spline->evaluate(grid);

    REQUIRE(values.size() == grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i)
        REQUIRE(values[i] == (*spline)(grid[i]));
}

TEST_CASE("CubicSpline::fit rejects invalid knots", "[math][spline]")
{
    SECTION("size mismatch")
    {
        const std::vector<core::f64> x = {0.0, 1.0, 2.0, 3.0};
        const std::vector<core::f64> y = {0.0, 1.0, 2.0};
        auto result = CubicSpline::fit(x, y);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("too few knots")
    {
        const std::vector<core::f64> x = {0.0, 1.0, 2.0};
        auto result = CubicSpline::fit(x, x);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInsufficientData);
    }

    SECTION("non-increasing abscissae")
    {
        const std::vector<core::f64> x = {0.0, 1.0, 1.0, 2.0};
        auto result = CubicSpline::fit(x, x);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("non-finite ordinate")
    {
        const std::vector<core::f64> x = {0.0, 1.0, 2.0, 3.0};
        const std::vector<core::f64> y = {0.0, std::numeric_limits<core::f64>::quiet_NaN(), 2.0, 3.0};
        auto result = CubicSpline::fit(x, y);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

} // namespace hrv::math
