/**
 * @file FeatureExtractor.cpp
 * @brief Implementation of the per-window feature extractor.
 * @author MasterLaplace
 */

#include "hrv/features/FeatureExtractor.hpp"

#include "hrv/core/Log.hpp"
#include "hrv/features/FrequencyDomain.hpp"
#include "hrv/features/Poincare.hpp"
#include "hrv/features/StressIndex.hpp"
#include "hrv/features/TimeDomain.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace hrv::features {

namespace {

[[nodiscard]] core::f64 finiteOrZero(core::f64 v) noexcept
{
    return std::isfinite(v) ? v : 0.0;
}

} // namespace

bool FeatureRecord::isFinite() const noexcept
{
    const auto v = values();
    return std::all_of(v.begin(), v.end(), [](core::f64 x) { return std::isfinite(x); });
}

FeatureExtractor::FeatureExtractor(core::f64 sampleRate, core::usize minSamples) noexcept
    : _sampleRate(sampleRate)
    , _minSamples(minSamples)
{
}

std::optional<FeatureRecord> FeatureExtractor::extract(
    std::span<const core::f64> window,
    core::usize startIndex) const
{
    if (window.size() < _minSamples)
        return std::nullopt;

    FeatureRecord record;
    record.startIndex = startIndex;

    const TimeDomainFeatures time = computeTimeDomain(window);
    record.meanRr = finiteOrZero(time.meanRr);
    record.sdnn   = finiteOrZero(time.sdnn);
    record.rmssd  = finiteOrZero(time.rmssd);
    record.pnn50  = finiteOrZero(time.pnn50);
    record.cv     = finiteOrZero(time.cv);

    const auto spectral = computeSpectralPower(window, _sampleRate);
    if (spectral) {
        record.lf   = spectral->lf;
        record.hf   = spectral->hf;
        record.lfHf = spectral->lfHf;
        record.spectral = SpectralStatus::kEstimated;
    } else {
        record.spectral = SpectralStatus::kDegenerate;
        core::Log::debug("spectral",
            std::format("window @{}: {}", startIndex, spectral.error().message()));
    }

    const PoincareFeatures poincare = computePoincare(window);
    record.sd1 = finiteOrZero(poincare.sd1);
    record.sd2 = finiteOrZero(poincare.sd2);

    record.si = baevskyStressIndex(window);

    return record;
}

std::optional<FeatureRecord> extractFeatures(std::span<const core::f64> window, core::f64 fsInterp)
{
    return FeatureExtractor{fsInterp}.extract(window);
}

} // namespace hrv::features
