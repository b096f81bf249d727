/**
 * @file Constants.hpp
 * @brief Pipeline-wide compile-time constants.
 *
 * Physiological band limits, extraction thresholds, and the default
 * segmentation parameters are centralised here so that a single header
 * controls the numerical policy of every module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef HRV_CORE_CONSTANTS_HPP
    #define HRV_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace hrv::core {

// ---- Segmentation --------------------------------------------------------

inline constexpr usize kDefaultWindow          = 60;
inline constexpr usize kDefaultStep            = 20;
inline constexpr f64   kDefaultFsInterp        = 4.0;

// ---- Extraction thresholds -----------------------------------------------

inline constexpr usize kMinWindowSamples       = 20;
inline constexpr usize kMinStressIndexSamples  = 10;
inline constexpr usize kMaxHistogramBins       = 50;
inline constexpr f64   kPnnThresholdMs         = 50.0;
inline constexpr f64   kMsPerSecond            = 1000.0;
inline constexpr f64   kMaxResampledSamples    = 16'777'216.0;

// ---- Welch segmentation --------------------------------------------------

inline constexpr usize kMinWelchSegment        = 8;
inline constexpr usize kMaxWelchSegment        = 64;
inline constexpr usize kWelchSegmentDivisor    = 4;

// ---- Artifact rejection --------------------------------------------------

inline constexpr f64   kArtifactMinMs          = 300.0;
inline constexpr f64   kArtifactMaxMs          = 2000.0;

} // namespace hrv::core

#endif // HRV_CORE_CONSTANTS_HPP
