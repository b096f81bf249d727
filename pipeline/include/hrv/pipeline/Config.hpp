// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Extraction pipeline configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the segmentation, resampling, threading and artifact
/// rejection parameters consumed by MatrixBuilder and DatasetBuilder.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <hrv/core/Constants.hpp>
#include <hrv/core/Expected.hpp>
#include <hrv/core/Types.hpp>

namespace hrv::pipeline {

/// @brief Immutable pipeline configuration.
class PipelineConfig
{
public:
    /// @brief Fluent builder for PipelineConfig.
    class Builder
    {
    public:
        Builder& window(core::usize beats) noexcept;
        Builder& step(core::usize beats) noexcept;
        Builder& fsInterp(core::f64 hz) noexcept;
        Builder& minWindowSamples(core::usize n) noexcept;
        Builder& threadCount(core::u32 n) noexcept;
        Builder& rejectArtifacts(bool enabled) noexcept;
        Builder& artifactBounds(core::f64 minMs, core::f64 maxMs) noexcept;

        /// @brief Validates the parameters and returns the configuration.
        /// @return The configuration, or kInvalidArgument when a window or
        ///         step is zero, the resampling rate is not positive, the
        ///         minimum window is below 2, or the artifact bounds are
        ///         not increasing.
        [[nodiscard]] core::Expected<PipelineConfig> build() const;

    private:
        core::usize window_{core::kDefaultWindow};
        core::usize step_{core::kDefaultStep};
        core::f64   fsInterp_{core::kDefaultFsInterp};
        core::usize minWindowSamples_{core::kMinWindowSamples};
        core::u32   threadCount_{1};
        bool        rejectArtifacts_{false};
        core::f64   artifactMinMs_{core::kArtifactMinMs};
        core::f64   artifactMaxMs_{core::kArtifactMaxMs};
    };

    /// @brief Default configuration: window 60, step 20, 4 Hz, sequential.
    PipelineConfig() = default;

    [[nodiscard]] core::usize window()           const noexcept { return window_; }
    [[nodiscard]] core::usize step()             const noexcept { return step_; }
    [[nodiscard]] core::f64   fsInterp()         const noexcept { return fsInterp_; }
    [[nodiscard]] core::usize minWindowSamples() const noexcept { return minWindowSamples_; }
    /// 1 runs sequentially, 0 uses the hardware concurrency.
    [[nodiscard]] core::u32   threadCount()      const noexcept { return threadCount_; }
    [[nodiscard]] bool        rejectArtifacts()  const noexcept { return rejectArtifacts_; }
    [[nodiscard]] core::f64   artifactMinMs()    const noexcept { return artifactMinMs_; }
    [[nodiscard]] core::f64   artifactMaxMs()    const noexcept { return artifactMaxMs_; }

private:
    friend class Builder;

    core::usize window_{core::kDefaultWindow};
    core::usize step_{core::kDefaultStep};
    core::f64   fsInterp_{core::kDefaultFsInterp};
    core::usize minWindowSamples_{core::kMinWindowSamples};
    core::u32   threadCount_{1};
    bool        rejectArtifacts_{false};
    core::f64   artifactMinMs_{core::kArtifactMinMs};
    core::f64   artifactMaxMs_{core::kArtifactMaxMs};
};

} // namespace hrv::pipeline
