/**
 * @file FeatureExtractor.hpp
 * @brief Computes the full HRV feature record of one RR window.
 * @author MasterLaplace
 *
 * Combines the time-domain, frequency-domain, Poincaré and stress-index
 * stages. A window that is too short yields no record; a window whose
 * spectral estimate fails still yields a record, with the frequency
 * fields at 0 and the spectral status set to kDegenerate.
 *
 * @code
 *   FeatureExtractor extractor;
 *   if (auto record = extractor.extract(window))
 *       matrix.push_back(*record);
 * @endcode
 */

#pragma once

#include "FeatureRecord.hpp"

#include "hrv/core/Constants.hpp"
#include "hrv/core/Types.hpp"

#include <optional>
#include <span>

namespace hrv::features {

/**
 * @brief Stateless per-window feature extractor.
 *
 * Immutable after construction and safe to share between threads.
 */
class FeatureExtractor final {
public:
    /**
     * @param sampleRate Uniform resampling rate of the spectral stage (Hz)
     * @param minSamples Minimum window length producing a record
     */
    explicit FeatureExtractor(
        core::f64 sampleRate = core::kDefaultFsInterp,
        core::usize minSamples = core::kMinWindowSamples) noexcept;

    /**
     * @brief Extracts the features of @p window.
     *
     * @param window     RR intervals (ms)
     * @param startIndex Beat index of the window in its recording
     * @return The record, or std::nullopt when the window is shorter than
     *         minSamples()
     */
    [[nodiscard]] std::optional<FeatureRecord> extract(
        std::span<const core::f64> window,
        core::usize startIndex = 0) const;

    [[nodiscard]] core::f64 sampleRate() const noexcept { return _sampleRate; }
    [[nodiscard]] core::usize minSamples() const noexcept { return _minSamples; }

private:
    core::f64 _sampleRate;
    core::usize _minSamples;
};

/**
 * @brief Convenience wrapper around FeatureExtractor with the default
 *        20-sample minimum.
 */
[[nodiscard]] std::optional<FeatureRecord> extractFeatures(
    std::span<const core::f64> window,
    core::f64 fsInterp = core::kDefaultFsInterp);

} // namespace hrv::features
