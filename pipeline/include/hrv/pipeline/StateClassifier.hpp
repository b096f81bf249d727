/**
 * @file StateClassifier.hpp
 * @brief Rule-based autonomic state scoring of a feature record.
 * @author MasterLaplace
 *
 * Scores stress index, RMSSD, LF/HF and heart rate against thresholds
 * from the ESC 1996 HRV guidelines and maps the total to a coarse state.
 *
 * | Feature | Condition      | Score |
 * |---------|----------------|-------|
 * | SI      | < 10           | -2    |
 * | SI      | 10 - 30        |  0    |
 * | SI      | 30 - 70        | +1    |
 * | SI      | > 70           | +2    |
 * | RMSSD   | > 35 ms        | -2    |
 * | RMSSD   | > 20 ms        | -1    |
 * | RMSSD   | < 15 ms        | +2    |
 * | LF/HF   | < 0.8          | -2    |
 * | LF/HF   | 0.8 - 1.5      |  0    |
 * | LF/HF   | 1.5 - 3.0      | +1    |
 * | LF/HF   | > 3.0          | +2    |
 * | HR      | > 80 bpm       | +1    |
 */

#pragma once

#include "hrv/core/Types.hpp"
#include "hrv/features/FeatureRecord.hpp"

#include <string_view>

namespace hrv::pipeline {

enum class AutonomicState : core::u8 {
    kRecovery,   ///< score <= -3, deep rest or sleep
    kRest,       ///< score <= -1
    kMildStress, ///< score <= 1
    kHighStress  ///< score > 1
};

[[nodiscard]] constexpr std::string_view autonomicStateName(AutonomicState state) noexcept
{
    switch (state) {
        case AutonomicState::kRecovery:   return "recovery";
        case AutonomicState::kRest:       return "rest";
        case AutonomicState::kMildStress: return "mild_stress";
        case AutonomicState::kHighStress: return "high_stress";
    }
    return "unknown";
}

struct StateAssessment {
    core::i32 score = 0;
    AutonomicState state = AutonomicState::kMildStress;
};

/**
 * @brief Heart rate in bpm, 60000 / mean RR; 0 when mean RR is 0.
 */
[[nodiscard]] core::f64 heartRateBpm(const features::FeatureRecord &record) noexcept;

/**
 * @brief Maps a total score to its state.
 */
[[nodiscard]] AutonomicState stateForScore(core::i32 score) noexcept;

/**
 * @brief Scores @p record.
 *
 * The LF/HF rules are skipped when the spectral estimate failed or the
 * HF power is zero, since the ratio is undefined in both cases.
 */
[[nodiscard]] StateAssessment scoreAutonomicState(const features::FeatureRecord &record) noexcept;

} // namespace hrv::pipeline
