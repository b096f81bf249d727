/**
 * @file MatrixBuilder.hpp
 * @brief Turns a subject's RR sequence into an ordered feature matrix.
 * @author MasterLaplace
 *
 * Windows the sequence, extracts every window and keeps the records of
 * the windows long enough to produce one. Rows follow window order, so
 * the matrix is the subject's HRV time series.
 *
 * @code
 *   auto config = PipelineConfig::Builder{}.window(60).step(20).build();
 *   MatrixBuilder builder(*config);
 *   auto matrix = builder.build(rr);
 * @endcode
 *
 * @see PipelineConfig, FeatureExtractor, buildWindows
 */

#pragma once

#include "Config.hpp"

#include "hrv/core/Expected.hpp"
#include "hrv/core/NonCopyable.hpp"
#include "hrv/features/FeatureExtractor.hpp"

#include <memory>
#include <span>
#include <vector>

namespace hrv::concurrency { class ThreadPool; }

namespace hrv::pipeline {

/// One FeatureRecord per valid window, in window order.
using FeatureMatrix = std::vector<features::FeatureRecord>;

/**
 * @brief Orchestrates windowing and per-window extraction.
 *
 * With PipelineConfig::threadCount() != 1 the windows are extracted on an
 * owned ThreadPool; the output is identical to the sequential path.
 */
class MatrixBuilder final : public core::NonCopyable<MatrixBuilder> {
public:
    explicit MatrixBuilder(PipelineConfig config = {});
    ~MatrixBuilder();

    MatrixBuilder(MatrixBuilder &&) noexcept;
    MatrixBuilder &operator=(MatrixBuilder &&) noexcept;

    /**
     * @brief Builds the feature matrix of @p rr.
     *
     * Artifact rejection (when enabled) runs first, then the remaining
     * sequence is validated.
     *
     * @param rr Full RR sequence of one subject (ms)
     * @return The matrix (possibly empty), or kInvalidRrInterval when an
     *         interval is non-positive or non-finite
     */
    [[nodiscard]] core::Expected<FeatureMatrix> build(std::span<const core::f64> rr) const;

    [[nodiscard]] const PipelineConfig &config() const noexcept { return _config; }

private:
    PipelineConfig _config;
    features::FeatureExtractor _extractor;
    std::unique_ptr<concurrency::ThreadPool> _pool;
};

/**
 * @brief Builds the feature matrix of @p rr with the given segmentation and
 *        every other parameter at its default.
 *
 * @return The matrix, or kInvalidArgument for a zero window or step, or
 *         kInvalidRrInterval for invalid input
 */
[[nodiscard]] core::Expected<FeatureMatrix> buildFeatureMatrix(
    std::span<const core::f64> rr,
    core::usize window = core::kDefaultWindow,
    core::usize step = core::kDefaultStep);

} // namespace hrv::pipeline
