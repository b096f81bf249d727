/**
 * @file FeatureWriter.cpp
 * @brief Implementation of the feature CSV writer.
 * @author MasterLaplace
 */

#include "hrv/io/FeatureWriter.hpp"

#include "hrv/core/Log.hpp"

#include <format>
#include <fstream>

namespace hrv::io {

void writeFeatureCsv(std::ostream &out, std::span<const pipeline::LabeledRow> rows)
{
    out << kFeatureCsvHeader << '\n';

    for (const auto &row : rows) {
        out << row.subjectId << ',' << row.features.startIndex;
        for (const core::f64 value : row.features.values())
            out << ',' << std::format("{}", value);

        out << ',';
        if (row.age)
            out << std::format("{}", *row.age);
        out << ',';
        if (row.genderEnc)
            out << *row.genderEnc;

        out << ',' << static_cast<unsigned>(row.stressLabel)
            << ',' << pipeline::autonomicStateName(row.state.state) << '\n';
    }
}

core::ExpectedVoid writeFeatureCsv(const std::string &path, std::span<const pipeline::LabeledRow> rows)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kIoError, std::format("cannot open {} for writing", path));

    writeFeatureCsv(file, rows);
    file.flush();
    if (!file)
        return core::makeError(core::ErrorCode::kIoError, std::format("write to {} failed", path));

    core::Log::info("io", std::format("wrote {} rows to {}", rows.size(), path));
    return {};
}

} // namespace hrv::io
