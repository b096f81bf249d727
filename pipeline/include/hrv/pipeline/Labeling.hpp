/**
 * @file Labeling.hpp
 * @brief Per-subject stress labels from the Baevsky stress index.
 * @author MasterLaplace
 *
 * A fixed SI threshold labels almost every window of a high-SI subject as
 * stressed. Thresholding each subject at its own median SI balances the
 * two classes within every subject instead.
 */

#pragma once

#include "MatrixBuilder.hpp"

#include "hrv/core/Types.hpp"

#include <vector>

namespace hrv::pipeline {

/**
 * @brief Median SI over the rows of @p matrix, 0 for an empty matrix.
 */
[[nodiscard]] core::f64 medianStressIndex(const FeatureMatrix &matrix);

/**
 * @brief One label per row: 1 (stress) when si > the median SI, else 0.
 */
[[nodiscard]] std::vector<core::u8> labelByMedianStressIndex(const FeatureMatrix &matrix);

} // namespace hrv::pipeline
