/**
 * @file StressIndex.cpp
 * @brief Implementation of the Baevsky stress index.
 * @author MasterLaplace
 */

#include "hrv/features/StressIndex.hpp"

#include "hrv/core/Constants.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace hrv::features {

RrHistogramMode computeHistogramMode(std::span<const core::f64> rr)
{
    const core::usize n = rr.size();
    if (n < 2)
        return {};

    if (!std::all_of(rr.begin(), rr.end(), [](core::f64 v) { return std::isfinite(v); }))
        return {};

    const auto [minIt, maxIt] = std::minmax_element(rr.begin(), rr.end());
    const core::f64 minRr = *minIt;
    const core::f64 maxRr = *maxIt;

    core::f64 lo = minRr;
    core::f64 hi = maxRr;
    if (lo == hi) {
        lo -= 0.5;
        hi += 0.5;
    }

    const core::usize bins = std::min(core::kMaxHistogramBins, n / 2);
    const core::f64 width = (hi - lo) / static_cast<core::f64>(bins);
    if (!(width > 0.0) || !std::isfinite(width)) {
        // Widening by one unit is lost at this magnitude: a single bin.
        return {.mode = minRr, .modeAmplitude = 100.0, .range = maxRr - minRr, .binCount = bins};
    }

    const auto edge = [&](core::usize i) {
        return lo + width * static_cast<core::f64>(i);
    };

    std::vector<core::usize> counts(bins, 0);
    for (const core::f64 v : rr) {
        auto idx = static_cast<core::usize>(
            std::clamp((v - lo) / width, 0.0, static_cast<core::f64>(bins - 1)));

        // Floating-point rounding can land one bin off at an edge.
        if (idx > 0 && v < edge(idx))
            --idx;
        else if (idx + 1 < bins && v >= edge(idx + 1))
            ++idx;

        ++counts[idx];
    }

    const auto modal = static_cast<core::usize>(
        std::distance(counts.begin(), std::max_element(counts.begin(), counts.end())));

    return {
        .mode = 0.5 * (edge(modal) + edge(modal + 1)),
        .modeAmplitude = 100.0 * static_cast<core::f64>(counts[modal]) / static_cast<core::f64>(n),
        .range = maxRr - minRr,
        .binCount = bins,
    };
}

core::f64 baevskyStressIndex(std::span<const core::f64> rr)
{
    if (rr.size() < core::kMinStressIndexSamples)
        return 0.0;

    const RrHistogramMode hist = computeHistogramMode(rr);
    if (hist.mode == 0.0 || hist.range == 0.0)
        return 0.0;

    const core::f64 si = hist.modeAmplitude / (2.0 * hist.mode * hist.range);
    return (std::isfinite(si) && si > 0.0) ? si : 0.0;
}

} // namespace hrv::features
