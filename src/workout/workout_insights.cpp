/**
 * @file workout_insights.cpp
 * @brief Calorie estimation and recovery suggestions for finished workouts
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <algorithm>

#include <workout_insights.hpp>

static constexpr double REFERENCE_HEART_RATE = 140.0;
static constexpr double HR_FACTOR_MIN = 0.6;
static constexpr double HR_FACTOR_MAX = 1.6;
static constexpr double KCAL_PER_STEP = 0.04;

static constexpr int LIGHT_INTENSITY_LIMIT = 140;
static constexpr int MODERATE_INTENSITY_LIMIT = 200;

static double base_met(ActivityType type)
{
    switch (type)
    {
        case ActivityType::Walking:
            return 3.5;
        case ActivityType::Running:
            return 8.0;
        case ActivityType::Cycling:
            return 6.0;
        case ActivityType::Yoga:
            return 2.5;
        case ActivityType::Weightlifting:
            return 3.5;
        case ActivityType::Other:
            return 3.0;
    }
    return 3.0;
}

double estimate_activity_calories(ActivityType type, int64_t duration_seconds, std::optional<int> avg_heart_rate,
                                  std::optional<int64_t> steps, double weight_kg)
{
    if (duration_seconds <= 0 || weight_kg <= 0.0)
    {
        return 0.0;
    }

    double hr_factor = 1.0;
    if (avg_heart_rate)
    {
        hr_factor = std::clamp(*avg_heart_rate / REFERENCE_HEART_RATE, HR_FACTOR_MIN, HR_FACTOR_MAX);
    }

    double hours = duration_seconds / 3600.0;
    double calories = base_met(type) * weight_kg * hours * hr_factor;

    if (activity_tracks_steps(type) && steps && *steps > 0)
    {
        calories += *steps * KCAL_PER_STEP;
    }

    return calories;
}

double estimate_workout_calories(const std::vector<WorkoutActivityEntry> &activities, double weight_kg)
{
    double total = 0.0;
    for (const WorkoutActivityEntry &entry : activities)
    {
        total += estimate_activity_calories(entry.type, entry.duration_seconds, entry.avg_heart_rate, entry.steps,
                                            weight_kg);
    }
    return total;
}

std::vector<RecoveryTechnique> suggest_recovery(const std::vector<WorkoutActivityEntry> &activities,
                                                std::optional<int> avg_heart_rate, int64_t total_duration_seconds,
                                                std::optional<int64_t> total_steps, int64_t id_base)
{
    std::vector<RecoveryTechnique> techniques;
    if (activities.empty() || total_duration_seconds <= 0)
    {
        return techniques;
    }

    auto has = [&activities](ActivityType type) {
        return std::any_of(activities.begin(), activities.end(),
                           [type](const WorkoutActivityEntry &entry) { return entry.type == type; });
    };

    double minutes = total_duration_seconds / 60.0;
    int64_t intensity = avg_heart_rate.value_or(0) + (int64_t)(minutes * 0.8) + total_steps.value_or(0) / 300;

    int64_t next_id = id_base;
    auto add = [&techniques, &next_id](const char *title, const char *description) {
        bool duplicate = std::any_of(techniques.begin(), techniques.end(),
                                     [title](const RecoveryTechnique &t) { return t.title == title; });
        if (!duplicate && techniques.size() < RECOVERY_MAX_SUGGESTIONS)
        {
            techniques.push_back({next_id++, title, description});
        }
    };

    add("Hydration", "Drink 300-500 ml of water in the next 15 minutes to support recovery.");

    if (intensity < LIGHT_INTENSITY_LIMIT)
    {
        add("Light Stretching",
            "Spend 5-8 minutes doing gentle full-body stretching, focusing on any tight areas.");
    }
    else if (intensity <= MODERATE_INTENSITY_LIMIT)
    {
        add("Mobility + Breathing", "Do 5 minutes of easy mobility work, then 3-5 minutes of slow nasal breathing "
                                    "to bring your heart rate down.");
    }
    else
    {
        add("Deep Recovery", "Your session was intense. Do 10-15 minutes of light walking or stretching, followed "
                             "by 5 minutes of deep breathing.");
        add("Sleep Priority", "Aim for at least 7-9 hours of sleep tonight to support full recovery.");
    }

    if (has(ActivityType::Running) || has(ActivityType::Walking))
    {
        add("Lower Body Release", "Foam roll or massage your calves, hamstrings, and quads for 1-2 minutes each.");
    }

    if (has(ActivityType::Weightlifting))
    {
        add("Muscle Relax", "Do gentle range-of-motion work for the major muscle groups you trained today.");
    }

    if (!has(ActivityType::Yoga))
    {
        add("Breathing Reset", "Lie down and do 8-10 slow breaths, 4s inhale, 6s exhale, to signal your nervous "
                               "system to relax.");
    }

    return techniques;
}
