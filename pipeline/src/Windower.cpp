/**
 * @file Windower.cpp
 * @brief Implementation of the sliding-window segmentation.
 * @author MasterLaplace
 */

#include "hrv/pipeline/Windower.hpp"

#include "hrv/core/Assert.hpp"

namespace hrv::pipeline {

core::usize windowCount(core::usize n, core::usize window, core::usize step) noexcept
{
    if (window == 0 || step == 0 || n < window)
        return 0;
    return (n - window) / step + 1;
}

std::vector<Window> buildWindows(std::span<const core::f64> rr, core::usize window, core::usize step)
{
    HRV_ASSERT(window > 0 && step > 0);

    const core::usize count = windowCount(rr.size(), window, step);

    std::vector<Window> windows;
    windows.reserve(count);
    for (core::usize i = 0; i < count; ++i) {
        const core::usize start = i * step;
        windows.push_back({start, rr.subspan(start, window)});
    }
    return windows;
}

} // namespace hrv::pipeline
