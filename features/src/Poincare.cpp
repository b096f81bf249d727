/**
 * @file Poincare.cpp
 * @brief Implementation of the Poincaré descriptors.
 * @author MasterLaplace
 */

#include "hrv/features/Poincare.hpp"

#include "hrv/math/Statistics.hpp"

#include <numbers>
#include <vector>

namespace hrv::features {

PoincareFeatures computePoincare(std::span<const core::f64> rr)
{
    if (rr.size() < 2)
        return {};

    const core::usize pairs = rr.size() - 1;
    std::vector<core::f64> across(pairs);
    std::vector<core::f64> along(pairs);

    for (core::usize i = 0; i < pairs; ++i) {
        across[i] = (rr[i + 1] - rr[i]) / std::numbers::sqrt2;
        along[i]  = (rr[i + 1] + rr[i]) / std::numbers::sqrt2;
    }

    return {
        .sd1 = math::Statistics::sampleStdDev(across),
        .sd2 = math::Statistics::sampleStdDev(along),
    };
}

} // namespace hrv::features
