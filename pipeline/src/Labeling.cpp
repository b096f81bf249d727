/**
 * @file Labeling.cpp
 * @brief Implementation of the median-SI labelling.
 * @author MasterLaplace
 */

#include "hrv/pipeline/Labeling.hpp"

#include "hrv/math/Statistics.hpp"

namespace hrv::pipeline {

core::f64 medianStressIndex(const FeatureMatrix &matrix)
{
    std::vector<core::f64> si;
    si.reserve(matrix.size());
    for (const auto &record : matrix)
        si.push_back(record.si);
    return math::Statistics::median(si);
}

std::vector<core::u8> labelByMedianStressIndex(const FeatureMatrix &matrix)
{
    const core::f64 threshold = medianStressIndex(matrix);

    std::vector<core::u8> labels;
    labels.reserve(matrix.size());
    for (const auto &record : matrix)
        labels.push_back(record.si > threshold ? 1 : 0);
    return labels;
}

} // namespace hrv::pipeline
