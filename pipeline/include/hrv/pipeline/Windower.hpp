/**
 * @file Windower.hpp
 * @brief Sliding-window segmentation of an RR sequence.
 * @author MasterLaplace
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <span>
#include <vector>

namespace hrv::pipeline {

/**
 * @brief A contiguous view into the caller's RR sequence.
 */
struct Window {
    core::usize startIndex = 0;
    std::span<const core::f64> samples;
};

/**
 * @brief Number of complete windows: floor((N - window) / step) + 1 when
 *        N >= window, else 0.
 *
 * @param n      Sequence length
 * @param window Beats per window, > 0
 * @param step   Stride in beats, > 0
 */
[[nodiscard]] core::usize windowCount(core::usize n, core::usize window, core::usize step) noexcept;

/**
 * @brief Slices @p rr into windows starting at 0, step, 2*step, ...
 *        while start + window <= N.
 *
 * The windows reference @p rr and must not outlive it. A sequence shorter
 * than one window yields no window. A step larger than the window skips
 * beats between windows.
 *
 * @param rr     Full RR sequence
 * @param window Beats per window, > 0
 * @param step   Stride in beats, > 0
 */
[[nodiscard]] std::vector<Window> buildWindows(
    std::span<const core::f64> rr,
    core::usize window,
    core::usize step);

} // namespace hrv::pipeline
