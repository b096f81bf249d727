/**
 * @file MatrixBuilder.cpp
 * @brief Implementation of the feature matrix builder.
 * @author MasterLaplace
 */

#include "hrv/pipeline/MatrixBuilder.hpp"

#include "hrv/concurrency/ThreadPool.hpp"
#include "hrv/core/Log.hpp"
#include "hrv/pipeline/Validation.hpp"
#include "hrv/pipeline/Windower.hpp"

#include <format>
#include <optional>
#include <utility>

namespace hrv::pipeline {

MatrixBuilder::MatrixBuilder(PipelineConfig config)
    : _config(config)
    , _extractor(config.fsInterp(), config.minWindowSamples())
{
    if (_config.threadCount() != 1)
        _pool = std::make_unique<concurrency::ThreadPool>(_config.threadCount());
}

MatrixBuilder::~MatrixBuilder() = default;
MatrixBuilder::MatrixBuilder(MatrixBuilder &&) noexcept = default;
MatrixBuilder &MatrixBuilder::operator=(MatrixBuilder &&) noexcept = default;

core::Expected<FeatureMatrix> MatrixBuilder::build(std::span<const core::f64> rr) const
{
    core::RrSeries filtered;
    if (_config.rejectArtifacts()) {
        filtered = rejectArtifacts(rr, _config.artifactMinMs(), _config.artifactMaxMs());
        if (filtered.size() != rr.size())
            core::Log::debug("pipeline", std::format("artifact rejection dropped {} of {} intervals",
                rr.size() - filtered.size(), rr.size()));
        rr = filtered;
    }

    if (auto valid = validateRrSeries(rr); !valid) {
        core::Log::warn("pipeline", valid.error().message());
        return std::unexpected(std::move(valid.error()));
    }

    const std::vector<Window> windows = buildWindows(rr, _config.window(), _config.step());

    const auto extract = [this](const Window &w) {
        return _extractor.extract(w.samples, w.startIndex);
    };

    std::vector<std::optional<features::FeatureRecord>> records;
    if (_pool) {
        records = _pool->mapOrdered(std::span<const Window>{windows}, extract);
    } else {
        records.reserve(windows.size());
        for (const Window &w : windows)
            records.push_back(extract(w));
    }

    FeatureMatrix matrix;
    matrix.reserve(records.size());
    for (auto &record : records) {
        if (record)
            matrix.push_back(*record);
    }

    core::Log::debug("pipeline", std::format("{} intervals -> {} windows -> {} rows",
        rr.size(), windows.size(), matrix.size()));
    return matrix;
}

core::Expected<FeatureMatrix> buildFeatureMatrix(
    std::span<const core::f64> rr,
    core::usize window,
    core::usize step)
{
    const auto config = HRV_TRY(PipelineConfig::Builder{}.window(window).step(step).build());
    return MatrixBuilder{config}.build(rr);
}

} // namespace hrv::pipeline
