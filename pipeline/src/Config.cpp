/**
 * @file Config.cpp
 * @brief PipelineConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <hrv/pipeline/Config.hpp>

#include <cmath>
#include <format>

namespace hrv::pipeline {

using core::ErrorCode;

PipelineConfig::Builder& PipelineConfig::Builder::window(core::usize beats) noexcept
{
    window_ = beats;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::step(core::usize beats) noexcept
{
    step_ = beats;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::fsInterp(core::f64 hz) noexcept
{
    fsInterp_ = hz;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::minWindowSamples(core::usize n) noexcept
{
    minWindowSamples_ = n;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::threadCount(core::u32 n) noexcept
{
    threadCount_ = n;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::rejectArtifacts(bool enabled) noexcept
{
    rejectArtifacts_ = enabled;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::artifactBounds(core::f64 minMs, core::f64 maxMs) noexcept
{
    artifactMinMs_ = minMs;
    artifactMaxMs_ = maxMs;
    return *this;
}

core::Expected<PipelineConfig> PipelineConfig::Builder::build() const
{
    if (window_ == 0)
        return core::makeError(ErrorCode::kInvalidArgument, "window must be at least 1 beat");
    if (step_ == 0)
        return core::makeError(ErrorCode::kInvalidArgument, "step must be at least 1 beat");
    if (!(fsInterp_ > 0.0) || !std::isfinite(fsInterp_))
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("resampling rate must be positive, got {}", fsInterp_));
    if (minWindowSamples_ < 2)
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("minimum window must be at least 2 samples, got {}", minWindowSamples_));
    if (!(artifactMinMs_ < artifactMaxMs_))
        return core::makeError(ErrorCode::kInvalidArgument,
            std::format("artifact bounds [{}, {}] are not increasing", artifactMinMs_, artifactMaxMs_));

    PipelineConfig config;
    config.window_           = window_;
    config.step_             = step_;
    config.fsInterp_         = fsInterp_;
    config.minWindowSamples_ = minWindowSamples_;
    config.threadCount_      = threadCount_;
    config.rejectArtifacts_  = rejectArtifacts_;
    config.artifactMinMs_    = artifactMinMs_;
    config.artifactMaxMs_    = artifactMaxMs_;
    return config;
}

} // namespace hrv::pipeline
