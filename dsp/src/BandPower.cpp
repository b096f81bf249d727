/**
 * @file BandPower.cpp
 * @brief Implementation of the band power integrator.
 * @author MasterLaplace
 */

#include "hrv/dsp/BandPower.hpp"

#include <algorithm>

namespace hrv::dsp {

namespace {

[[nodiscard]] bool inBand(core::f64 f, FrequencyBand band) noexcept
{
    return f >= band.low && f < band.high;
}

} // namespace

core::usize binsInBand(const PowerSpectralDensity &psd, FrequencyBand band) noexcept
{
    return static_cast<core::usize>(std::count_if(psd.freqs.begin(), psd.freqs.end(),
        [band](core::f64 f) { return inBand(f, band); }));
}

core::f64 integrateBand(const PowerSpectralDensity &psd, FrequencyBand band) noexcept
{
    const core::usize bins = std::min(psd.freqs.size(), psd.power.size());

    core::f64 area = 0.0;
    core::usize selected = 0;
    core::f64 prevF = 0.0;
    core::f64 prevP = 0.0;

    for (core::usize k = 0; k < bins; ++k) {
        if (!inBand(psd.freqs[k], band))
            continue;

        if (selected > 0)
            area += 0.5 * (prevP + psd.power[k]) * (psd.freqs[k] - prevF);

        prevF = psd.freqs[k];
        prevP = psd.power[k];
        ++selected;
    }

    return selected < 2 ? 0.0 : area;
}

} // namespace hrv::dsp
