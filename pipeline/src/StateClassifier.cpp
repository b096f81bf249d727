/**
 * @file StateClassifier.cpp
 * @brief Implementation of the rule-based autonomic state scoring.
 * @author MasterLaplace
 */

#include "hrv/pipeline/StateClassifier.hpp"

namespace hrv::pipeline {

namespace {

[[nodiscard]] core::i32 scoreStressIndex(core::f64 si) noexcept
{
    if (si < 10.0)
        return -2;
    if (si <= 30.0)
        return 0;
    if (si <= 70.0)
        return 1;
    return 2;
}

[[nodiscard]] core::i32 scoreRmssd(core::f64 rmssd) noexcept
{
    if (rmssd > 35.0)
        return -2;
    if (rmssd > 20.0)
        return -1;
    if (rmssd < 15.0)
        return 2;
    return 0;
}

[[nodiscard]] core::i32 scoreLfHf(core::f64 ratio) noexcept
{
    if (ratio < 0.8)
        return -2;
    if (ratio <= 1.5)
        return 0;
    if (ratio <= 3.0)
        return 1;
    return 2;
}

} // namespace

core::f64 heartRateBpm(const features::FeatureRecord &record) noexcept
{
    return record.meanRr > 0.0 ? 60000.0 / record.meanRr : 0.0;
}

AutonomicState stateForScore(core::i32 score) noexcept
{
    if (score <= -3)
        return AutonomicState::kRecovery;
    if (score <= -1)
        return AutonomicState::kRest;
    if (score <= 1)
        return AutonomicState::kMildStress;
    return AutonomicState::kHighStress;
}

StateAssessment scoreAutonomicState(const features::FeatureRecord &record) noexcept
{
    core::i32 score = scoreStressIndex(record.si) + scoreRmssd(record.rmssd);

    if (record.spectral == features::SpectralStatus::kEstimated && record.hf > 0.0)
        score += scoreLfHf(record.lfHf);

    if (heartRateBpm(record) > 80.0)
        score += 1;

    return {score, stateForScore(score)};
}

} // namespace hrv::pipeline
