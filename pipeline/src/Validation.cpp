/**
 * @file Validation.cpp
 * @brief Implementation of RR input validation and artifact rejection.
 * @author MasterLaplace
 */

#include "hrv/pipeline/Validation.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>

namespace hrv::pipeline {

core::ExpectedVoid validateRrSeries(std::span<const core::f64> rr)
{
    for (core::usize i = 0; i < rr.size(); ++i) {
        if (!std::isfinite(rr[i]) || rr[i] <= 0.0)
            return core::makeError(core::ErrorCode::kInvalidRrInterval,
                std::format("RR interval {} at index {} is not a positive finite value", rr[i], i));
    }
    return {};
}

core::RrSeries rejectArtifacts(std::span<const core::f64> rr, core::f64 minMs, core::f64 maxMs)
{
    core::RrSeries kept;
    kept.reserve(rr.size());
    std::copy_if(rr.begin(), rr.end(), std::back_inserter(kept),
        [minMs, maxMs](core::f64 v) { return v >= minMs && v <= maxMs; });
    return kept;
}

} // namespace hrv::pipeline
