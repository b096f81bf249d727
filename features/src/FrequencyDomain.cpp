/**
 * @file FrequencyDomain.cpp
 * @brief Implementation of the resampling + Welch spectral stage.
 * @author MasterLaplace
 */

#include "hrv/features/FrequencyDomain.hpp"

#include "hrv/core/Constants.hpp"
#include "hrv/dsp/BandPower.hpp"
#include "hrv/dsp/Welch.hpp"
#include "hrv/math/CubicSpline.hpp"

#include <cmath>
#include <exception>
#include <format>

namespace hrv::features {

using core::ErrorCode;
using core::f64;
using core::usize;

namespace {

[[nodiscard]] core::Error spectralFailure(const core::Error &cause)
{
    return core::Error{
        ErrorCode::kSpectralEstimationFailed,
        std::format("{}: {}", core::errorCodeName(cause.code()), cause.message()),
        cause.location()};
}

} // namespace

std::vector<f64> cumulativeTimeAxis(std::span<const f64> rr)
{
    std::vector<f64> t(rr.size());
    f64 acc = 0.0;
    for (usize i = 0; i < rr.size(); ++i) {
        acc += rr[i];
        t[i] = acc / core::kMsPerSecond;
    }
    return t;
}

core::Expected<ResampledTachogram> resampleTachogram(std::span<const f64> rr, f64 sampleRate)
{
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate))
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("invalid resampling rate {}", sampleRate));

    const std::vector<f64> t = cumulativeTimeAxis(rr);
    auto spline = HRV_TRY(math::CubicSpline::fit(t, rr));

    const f64 step = 1.0 / sampleRate;
    const f64 duration = t.back() - t.front();
    const f64 gridSize = std::ceil(duration / step);
    if (!std::isfinite(gridSize) || gridSize > core::kMaxResampledSamples)
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("{} s of data is too long to resample at {} Hz", duration, sampleRate));

    const auto count = static_cast<usize>(gridSize);
    if (count < 2)
        return core::makeError(ErrorCode::kInsufficientData,
            std::format("{:.3f} s of data yields fewer than 2 samples at {} Hz", duration, sampleRate));

    ResampledTachogram out;
    out.sampleRate = sampleRate;
    out.time.resize(count);
    for (usize k = 0; k < count; ++k)
        out.time[k] = t.front() + static_cast<f64>(k) * step;
    out.values = spline.evaluate(out.time);

    return out;
}

core::Expected<dsp::PowerSpectralDensity> tachogramPsd(std::span<const f64> rr, f64 sampleRate)
{
    const auto resampled = HRV_TRY(resampleTachogram(rr, sampleRate));

    const dsp::WelchConfig config{
        .sampleRate = sampleRate,
        .segmentLength = dsp::adaptiveSegmentLength(resampled.values.size()),
        .overlap = dsp::WelchConfig::kHalfSegment,
        .detrend = dsp::DetrendMode::kLinear,
    };
    return dsp::welch(resampled.values, config);
}

core::Expected<SpectralPower> computeSpectralPower(std::span<const f64> rr, f64 sampleRate)
{
    try {
        const auto psd = tachogramPsd(rr, sampleRate);
        if (!psd)
            return std::unexpected(spectralFailure(psd.error()));

        SpectralPower power;
        power.lf = dsp::integrateBand(*psd, dsp::band::kLf);
        power.hf = dsp::integrateBand(*psd, dsp::band::kHf);
        power.lfHf = power.hf > 0.0 ? power.lf / power.hf : 0.0;

        if (!std::isfinite(power.lf) || !std::isfinite(power.hf) || !std::isfinite(power.lfHf))
            return core::makeError(ErrorCode::kSpectralEstimationFailed, "band power is not finite");

        return power;
    } catch (const std::exception &e) {
        return core::makeError(ErrorCode::kSpectralEstimationFailed,
            std::format("spectral stage threw: {}", e.what()));
    }
}

} // namespace hrv::features
