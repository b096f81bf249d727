/**
 * @file TimeDomain.cpp
 * @brief Implementation of the time-domain HRV statistics.
 * @author MasterLaplace
 */

#include "hrv/features/TimeDomain.hpp"

#include "hrv/core/Constants.hpp"
#include "hrv/math/Statistics.hpp"

#include <algorithm>
#include <cmath>

namespace hrv::features {

using math::Statistics;

TimeDomainFeatures computeTimeDomain(std::span<const core::f64> rr)
{
    TimeDomainFeatures out;
    out.meanRr = Statistics::mean(rr);
    out.sdnn = Statistics::sampleStdDev(rr);

    const auto diffs = Statistics::successiveDifferences(rr);
    if (!diffs.empty()) {
        out.rmssd = Statistics::rootMeanSquare(diffs);

        const auto over = std::count_if(diffs.begin(), diffs.end(),
            [](core::f64 d) { return std::abs(d) > core::kPnnThresholdMs; });
        out.pnn50 = 100.0 * static_cast<core::f64>(over) / static_cast<core::f64>(diffs.size());
    }

    if (out.meanRr != 0.0)
        out.cv = out.sdnn / out.meanRr * 100.0;

    return out;
}

} // namespace hrv::features
