/**
 * @file workout_domain.hpp
 * @brief Immutable records produced by the workout tracker
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_DOMAIN_HEADER_
#define APP_INCLUDE_WORKOUT_DOMAIN_HEADER_

#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

enum class ActivityType : uint8_t
{
    Walking = 0,
    Running,
    Cycling,
    Yoga,
    Weightlifting,
    Other,
};

static constexpr int ACTIVITY_TYPE_COUNT = 6;

// Only walking and running carry IMU step counts
inline bool activity_tracks_steps(ActivityType type)
{
    return type == ActivityType::Walking || type == ActivityType::Running;
}

const char *activity_type_name(ActivityType type);

/**
 * @brief Parse a case-insensitive activity name ("walking", "Running", ...).
 *
 * @return 0 on success, -EINVAL for an unknown name.
 */
int activity_type_from_name(const char *name, ActivityType *type);

struct WorkoutActivityEntry
{
    int64_t id;
    ActivityType type;
    int64_t duration_seconds;
    std::optional<int> avg_heart_rate;
    std::optional<int64_t> steps;

    bool operator==(const WorkoutActivityEntry &other) const
    {
        return id == other.id && type == other.type && duration_seconds == other.duration_seconds &&
               avg_heart_rate == other.avg_heart_rate && steps == other.steps;
    }
};

struct RecoveryTechnique
{
    int64_t id;
    std::string title;
    std::string description;

    bool operator==(const RecoveryTechnique &other) const
    {
        return id == other.id && title == other.title && description == other.description;
    }
};

struct WorkoutSession
{
    int64_t id;
    int64_t started_at_millis;
    int64_t duration_seconds;
    std::optional<int> avg_heart_rate;
    std::optional<int64_t> total_steps;
    std::vector<WorkoutActivityEntry> activities;
    std::vector<RecoveryTechnique> recovery_techniques;
    std::optional<double> calories;

    bool operator==(const WorkoutSession &other) const
    {
        return id == other.id && started_at_millis == other.started_at_millis &&
               duration_seconds == other.duration_seconds && avg_heart_rate == other.avg_heart_rate &&
               total_steps == other.total_steps && activities == other.activities &&
               recovery_techniques == other.recovery_techniques && calories == other.calories;
    }
};

// Result of the quick single-activity workout
struct WorkoutSummary
{
    int64_t duration_seconds;
    std::optional<int> avg_heart_rate;
    std::optional<int64_t> steps_delta;
};

#endif // APP_INCLUDE_WORKOUT_DOMAIN_HEADER_
