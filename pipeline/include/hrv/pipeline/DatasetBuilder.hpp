/**
 * @file DatasetBuilder.hpp
 * @brief Builds the labelled multi-subject training table.
 * @author MasterLaplace
 *
 * Each subject's RR sequence becomes a feature matrix, labelled against
 * the subject's own median stress index. Demographic fields are attached
 * to every row afterwards; they are never computed by the extraction.
 *
 * @see MatrixBuilder, labelByMedianStressIndex
 */

#pragma once

#include "Config.hpp"
#include "MatrixBuilder.hpp"
#include "StateClassifier.hpp"

#include "hrv/core/Expected.hpp"
#include "hrv/core/Types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hrv::pipeline {

/**
 * @brief Subject identity and demographics.
 */
struct SubjectInfo {
    std::string id;
    std::optional<core::f64> age;
    std::optional<core::i32> genderEnc;
};

/**
 * @brief One subject's recording.
 */
struct Subject {
    SubjectInfo info;
    core::RrSeries rr;
};

/**
 * @brief A feature row with its subject, demographics and labels.
 */
struct LabeledRow {
    std::string subjectId;
    features::FeatureRecord features;
    std::optional<core::f64> age;
    std::optional<core::i32> genderEnc;
    core::u8 stressLabel = 0;
    StateAssessment state;
};

/**
 * @brief Builds labelled rows for a set of subjects.
 *
 * With PipelineConfig::threadCount() != 1 subjects are processed in
 * parallel, each subject's windows sequentially. Rows are ordered by
 * subject then by window.
 */
class DatasetBuilder final {
public:
    explicit DatasetBuilder(PipelineConfig config = {});

    /**
     * @brief Builds the rows of every subject.
     *
     * @return The rows, or the first subject's error, its message prefixed
     *         by the subject id
     */
    [[nodiscard]] core::Expected<std::vector<LabeledRow>> build(std::span<const Subject> subjects) const;

    /**
     * @brief Builds and labels the rows of a single subject.
     */
    [[nodiscard]] core::Expected<std::vector<LabeledRow>> buildSubject(const Subject &subject) const;

private:
    PipelineConfig _config;
};

} // namespace hrv::pipeline
