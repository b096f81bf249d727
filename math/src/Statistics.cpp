/**
 * @file Statistics.cpp
 * @brief Implementation of descriptive statistics.
 */

#include "hrv/math/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace hrv::math {

core::f64 Statistics::mean(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    return std::accumulate(data.begin(), data.end(), 0.0)
         / static_cast<core::f64>(data.size());
}

core::f64 Statistics::sampleStdDev(std::span<const core::f64> data) noexcept
{
    if (data.size() < 2)
        return 0.0;

    const core::f64 mu = mean(data);

    core::f64 varianceSum = 0.0;
    for (const core::f64 x : data) {
        const core::f64 diff = x - mu;
        varianceSum += diff * diff;
    }

    return std::sqrt(varianceSum / static_cast<core::f64>(data.size() - 1));
}

core::f64 Statistics::rootMeanSquare(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    core::f64 sumSq = 0.0;
    for (const core::f64 x : data)
        sumSq += x * x;

    return std::sqrt(sumSq / static_cast<core::f64>(data.size()));
}

std::vector<core::f64> Statistics::successiveDifferences(std::span<const core::f64> data)
{
    if (data.size() < 2)
        return {};

    std::vector<core::f64> diffs(data.size() - 1);
    for (core::usize i = 0; i + 1 < data.size(); ++i)
        diffs[i] = data[i + 1] - data[i];
    return diffs;
}

core::f64 Statistics::median(std::span<const core::f64> data)
{
    if (data.empty())
        return 0.0;

    std::vector<core::f64> sorted(data.begin(), data.end());
    std::sort(sorted.begin(), sorted.end());

    const core::usize mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1)
        return sorted[mid];
    return 0.5 * (sorted[mid - 1] + sorted[mid]);
}

} // namespace hrv::math
