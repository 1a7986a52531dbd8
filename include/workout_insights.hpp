/**
 * @file workout_insights.hpp
 * @brief Calorie estimation and recovery suggestions for finished workouts
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_INSIGHTS_HEADER_
#define APP_INCLUDE_WORKOUT_INSIGHTS_HEADER_

#include <optional>
#include <stdint.h>
#include <vector>

#include <workout_domain.hpp>

static constexpr size_t RECOVERY_MAX_SUGGESTIONS = 5;

/**
 * @brief MET based estimate for one activity segment.
 *
 * kcal = MET * weight * hours * clamp(hr / 140, 0.6, 1.6), plus 0.04 kcal per
 * step for walking and running. Returns 0 when the duration or the weight is
 * not positive.
 */
double estimate_activity_calories(ActivityType type, int64_t duration_seconds, std::optional<int> avg_heart_rate,
                                  std::optional<int64_t> steps, double weight_kg);

double estimate_workout_calories(const std::vector<WorkoutActivityEntry> &activities, double weight_kg);

/**
 * @brief Rule based recovery techniques, at most RECOVERY_MAX_SUGGESTIONS,
 * unique by title. Empty when there are no activities or no duration.
 *
 * @param id_base First technique id, following ones are incremented.
 */
std::vector<RecoveryTechnique> suggest_recovery(const std::vector<WorkoutActivityEntry> &activities,
                                                std::optional<int> avg_heart_rate, int64_t total_duration_seconds,
                                                std::optional<int64_t> total_steps, int64_t id_base);

#endif // APP_INCLUDE_WORKOUT_INSIGHTS_HEADER_
