/**
 * @file FeatureWriter.hpp
 * @brief Serialises labelled feature rows as CSV.
 * @author MasterLaplace
 */

#pragma once

#include "hrv/core/Expected.hpp"
#include "hrv/pipeline/DatasetBuilder.hpp"

#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace hrv::io {

/// Column header written before the rows.
inline constexpr std::string_view kFeatureCsvHeader =
    "subject,start,mean_rr,sdnn,rmssd,pnn50,cv,lf,hf,lf_hf,sd1,sd2,si,age,gender_enc,label,state";

/**
 * @brief Writes the header then one line per row.
 *
 * Absent demographic fields are left empty. Values use the shortest
 * representation that round-trips.
 */
void writeFeatureCsv(std::ostream &out, std::span<const pipeline::LabeledRow> rows);

/**
 * @brief Writes the rows to a file, replacing its content.
 *
 * @return kIoError when the file cannot be opened or written
 */
[[nodiscard]] core::ExpectedVoid writeFeatureCsv(const std::string &path, std::span<const pipeline::LabeledRow> rows);

} // namespace hrv::io
