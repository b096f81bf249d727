/**
 * @file Detrend.cpp
 * @brief Implementation of segment detrending.
 */

#include "hrv/dsp/Detrend.hpp"

#include <numeric>

namespace hrv::dsp {

void detrendLinear(std::span<core::f64> segment) noexcept
{
    const core::usize n = segment.size();
    if (n < 2) {
        detrendConstant(segment);
        return;
    }

    const auto count = static_cast<core::f64>(n);
    const core::f64 tMean = (count - 1.0) / 2.0;
    const core::f64 yMean = std::accumulate(segment.begin(), segment.end(), 0.0) / count;

    core::f64 covariance = 0.0;
    core::f64 variance = 0.0;
    for (core::usize i = 0; i < n; ++i) {
        const core::f64 dt = static_cast<core::f64>(i) - tMean;
        covariance += dt * (segment[i] - yMean);
        variance += dt * dt;
    }

    const core::f64 slope = covariance / variance;
    for (core::usize i = 0; i < n; ++i)
        segment[i] -= yMean + slope * (static_cast<core::f64>(i) - tMean);
}

void detrendConstant(std::span<core::f64> segment) noexcept
{
    if (segment.empty())
        return;

    const core::f64 mean = std::accumulate(segment.begin(), segment.end(), 0.0)
                         / static_cast<core::f64>(segment.size());
    for (core::f64 &v : segment)
        v -= mean;
}

} // namespace hrv::dsp
