/**
 * @file DatasetBuilder.cpp
 * @brief Implementation of the multi-subject dataset builder.
 * @author MasterLaplace
 */

#include "hrv/pipeline/DatasetBuilder.hpp"

#include "hrv/concurrency/ThreadPool.hpp"
#include "hrv/core/Log.hpp"
#include "hrv/pipeline/Labeling.hpp"

#include <format>
#include <iterator>
#include <utility>

namespace hrv::pipeline {

namespace {

// Subjects already run in parallel; windows of one subject stay sequential.
[[nodiscard]] PipelineConfig sequentialCopy(const PipelineConfig &config)
{
    auto copy = PipelineConfig::Builder{}
        .window(config.window())
        .step(config.step())
        .fsInterp(config.fsInterp())
        .minWindowSamples(config.minWindowSamples())
        .threadCount(1)
        .rejectArtifacts(config.rejectArtifacts())
        .artifactBounds(config.artifactMinMs(), config.artifactMaxMs())
        .build();
    return copy ? *copy : config;
}

} // namespace

DatasetBuilder::DatasetBuilder(PipelineConfig config)
    : _config(config)
{
}

core::Expected<std::vector<LabeledRow>> DatasetBuilder::buildSubject(const Subject &subject) const
{
    const MatrixBuilder builder(sequentialCopy(_config));

    auto matrix = builder.build(subject.rr);
    if (!matrix)
        return std::unexpected(matrix.error().withContext(std::format("subject {}", subject.info.id)));

    const std::vector<core::u8> labels = labelByMedianStressIndex(*matrix);

    std::vector<LabeledRow> rows;
    rows.reserve(matrix->size());
    for (core::usize i = 0; i < matrix->size(); ++i) {
        const auto &record = (*matrix)[i];
        rows.push_back(LabeledRow{
            .subjectId = subject.info.id,
            .features = record,
            .age = subject.info.age,
            .genderEnc = subject.info.genderEnc,
            .stressLabel = labels[i],
            .state = scoreAutonomicState(record),
        });
    }

    core::Log::info("pipeline", std::format("subject {}: {} intervals -> {} rows",
        subject.info.id, subject.rr.size(), rows.size()));
    return rows;
}

core::Expected<std::vector<LabeledRow>> DatasetBuilder::build(std::span<const Subject> subjects) const
{
    using SubjectRows = core::Expected<std::vector<LabeledRow>>;

    const auto perSubject = [this](const Subject &subject) { return buildSubject(subject); };

    std::vector<SubjectRows> results;
    if (_config.threadCount() != 1 && subjects.size() > 1) {
        concurrency::ThreadPool pool(_config.threadCount());
        results = pool.mapOrdered(subjects, perSubject);
    } else {
        results.reserve(subjects.size());
        for (const Subject &subject : subjects)
            results.push_back(perSubject(subject));
    }

    std::vector<LabeledRow> rows;
    for (auto &result : results) {
        if (!result)
            return std::unexpected(std::move(result.error()));
        rows.insert(rows.end(),
            std::make_move_iterator(result->begin()),
            std::make_move_iterator(result->end()));
    }
    return rows;
}

} // namespace hrv::pipeline
