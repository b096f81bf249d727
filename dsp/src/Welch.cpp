/**
 * @file Welch.cpp
 * @brief Implementation of the Welch PSD estimate.
 * @author MasterLaplace
 */

#include "hrv/dsp/Welch.hpp"

#include "hrv/core/Constants.hpp"
#include "hrv/dsp/Detrend.hpp"
#include "hrv/dsp/Fft.hpp"
#include "hrv/dsp/Windowing.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace hrv::dsp {

using core::ErrorCode;
using core::f64;
using core::usize;

usize adaptiveSegmentLength(usize n) noexcept
{
    const usize length = std::min(
        core::kMaxWelchSegment,
        std::max(core::kMinWelchSegment, n / core::kWelchSegmentDivisor));
    return std::min(length, n);
}

core::Expected<PowerSpectralDensity> welch(std::span<const f64> signal, const WelchConfig &config)
{
    const usize n = signal.size();
    if (n < 2)
        return core::makeError(ErrorCode::kInsufficientData,
            std::format("welch needs at least 2 samples, got {}", n));

    if (!(config.sampleRate > 0.0) || !std::isfinite(config.sampleRate))
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("invalid sample rate {}", config.sampleRate));

    const usize nperseg = std::clamp<usize>(config.segmentLength, 2, n);
    const usize noverlap = config.overlap == WelchConfig::kHalfSegment
        ? nperseg / 2
        : std::min(config.overlap, nperseg - 1);
    const usize step = nperseg - noverlap;
    const usize segmentCount = (n - noverlap) / step;

    const HannWindow window(nperseg, WindowSymmetry::kPeriodic);
    const Fft fft(nperseg);
    const f64 scale = 1.0 / (config.sampleRate * window.energy());

    PowerSpectralDensity psd;
    psd.power.assign(fft.binCount(), 0.0);

    std::vector<f64> segment(nperseg);
    for (usize s = 0; s < segmentCount; ++s) {
        const auto first = signal.begin() + static_cast<std::ptrdiff_t>(s * step);
        std::copy(first, first + static_cast<std::ptrdiff_t>(nperseg), segment.begin());

        switch (config.detrend) {
            case DetrendMode::kLinear:   detrendLinear(segment);   break;
            case DetrendMode::kConstant: detrendConstant(segment); break;
            case DetrendMode::kNone:                               break;
        }
        window.apply(segment);

        const std::vector<f64> power = fft.powerSpectrum(segment);
        for (usize k = 0; k < power.size(); ++k)
            psd.power[k] += power[k] * scale;
    }

    // One-sided: double every bin except DC and, for even lengths, Nyquist.
    const usize lastDoubled = (nperseg % 2 == 0) ? psd.power.size() - 1 : psd.power.size();
    for (usize k = 0; k < psd.power.size(); ++k) {
        psd.power[k] /= static_cast<f64>(segmentCount);
        if (k > 0 && k < lastDoubled)
            psd.power[k] *= 2.0;
    }

    psd.freqs.resize(psd.power.size());
    for (usize k = 0; k < psd.freqs.size(); ++k)
        psd.freqs[k] = config.sampleRate * static_cast<f64>(k) / static_cast<f64>(nperseg);

    const bool finite = std::all_of(psd.power.begin(), psd.power.end(),
        [](f64 v) { return std::isfinite(v); });
    if (!finite)
        return core::makeError(ErrorCode::kSpectralEstimationFailed, "welch estimate is not finite");

    return psd;
}

} // namespace hrv::dsp
