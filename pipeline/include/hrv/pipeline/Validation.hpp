/**
 * @file Validation.hpp
 * @brief Input checks and physiological artifact rejection for RR sequences.
 * @author MasterLaplace
 */

#pragma once

#include "hrv/core/Constants.hpp"
#include "hrv/core/Expected.hpp"
#include "hrv/core/Types.hpp"

#include <span>

namespace hrv::pipeline {

/**
 * @brief Rejects sequences holding a non-finite or non-positive interval.
 *
 * An empty sequence is valid.
 *
 * @return Nothing on success, or kInvalidRrInterval naming the first
 *         offending index and value
 */
[[nodiscard]] core::ExpectedVoid validateRrSeries(std::span<const core::f64> rr);

/**
 * @brief Keeps only the intervals within [minMs, maxMs].
 *
 * Applied after R-peak detection to drop missed or spurious beats.
 */
[[nodiscard]] core::RrSeries rejectArtifacts(
    std::span<const core::f64> rr,
    core::f64 minMs = core::kArtifactMinMs,
    core::f64 maxMs = core::kArtifactMaxMs);

} // namespace hrv::pipeline
