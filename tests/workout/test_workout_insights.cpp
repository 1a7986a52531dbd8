/**
 * @file test_workout_insights.cpp
 * @brief Unit tests for calorie estimation and recovery suggestions
 */

#include <algorithm>
#include <string>

#include <zephyr/ztest.h>

#include <workout_insights.hpp>

ZTEST_SUITE(workout_insights, NULL, NULL, NULL, NULL, NULL);

static WorkoutActivityEntry make_entry(ActivityType type, int64_t seconds, std::optional<int> hr,
                                       std::optional<int64_t> steps)
{
    return WorkoutActivityEntry{1, type, seconds, hr, steps};
}

static bool has_title(const std::vector<RecoveryTechnique> &techniques, const char *title)
{
    return std::any_of(techniques.begin(), techniques.end(),
                       [title](const RecoveryTechnique &t) { return t.title == title; });
}

ZTEST(workout_insights, test_running_calories_include_steps)
{
    // 8 MET * 70 kg * 0.5 h at reference HR, plus 3000 * 0.04
    double kcal = estimate_activity_calories(ActivityType::Running, 1800, 140, 3000, 70.0);
    zassert_within(kcal, 400.0, 0.001);
}

ZTEST(workout_insights, test_heart_rate_factor_is_clamped)
{
    double high = estimate_activity_calories(ActivityType::Yoga, 3600, 280, std::nullopt, 60.0);
    zassert_within(high, 2.5 * 60.0 * 1.6, 0.001);

    double low = estimate_activity_calories(ActivityType::Yoga, 3600, 50, std::nullopt, 60.0);
    zassert_within(low, 2.5 * 60.0 * 0.6, 0.001);

    double unknown = estimate_activity_calories(ActivityType::Yoga, 3600, std::nullopt, std::nullopt, 60.0);
    zassert_within(unknown, 2.5 * 60.0, 0.001, "Missing HR uses factor 1");
}

ZTEST(workout_insights, test_steps_ignored_for_non_step_activities)
{
    double kcal = estimate_activity_calories(ActivityType::Cycling, 3600, 140, 5000, 70.0);
    zassert_within(kcal, 420.0, 0.001);
}

ZTEST(workout_insights, test_degenerate_inputs_give_zero)
{
    zassert_within(estimate_activity_calories(ActivityType::Running, 0, 150, 100, 70.0), 0.0, 0.0001);
    zassert_within(estimate_activity_calories(ActivityType::Running, 600, 150, 100, 0.0), 0.0, 0.0001);
}

ZTEST(workout_insights, test_workout_calories_sum_activities)
{
    std::vector<WorkoutActivityEntry> activities = {
        make_entry(ActivityType::Running, 1800, 140, 3000),
        make_entry(ActivityType::Cycling, 3600, 140, std::nullopt),
    };

    zassert_within(estimate_workout_calories(activities, 70.0), 820.0, 0.001);
    zassert_within(estimate_workout_calories({}, 70.0), 0.0, 0.0001);
}

ZTEST(workout_insights, test_no_recovery_for_empty_workout)
{
    zassert_true(suggest_recovery({}, 120, 600, std::nullopt, 1).empty());

    std::vector<WorkoutActivityEntry> activities = {make_entry(ActivityType::Walking, 0, std::nullopt, 0)};
    zassert_true(suggest_recovery(activities, std::nullopt, 0, 0, 1).empty());
}

ZTEST(workout_insights, test_light_walk_recovery)
{
    std::vector<WorkoutActivityEntry> activities = {make_entry(ActivityType::Walking, 600, 90, 600)};

    std::vector<RecoveryTechnique> techniques = suggest_recovery(activities, 90, 600, 600, 100);

    zassert_equal(techniques.size(), 4);
    zassert_true(techniques[0].title == "Hydration");
    zassert_true(has_title(techniques, "Light Stretching"));
    zassert_true(has_title(techniques, "Lower Body Release"));
    zassert_true(has_title(techniques, "Breathing Reset"));
    zassert_equal(techniques[0].id, 100);
    zassert_equal(techniques[3].id, 103, "Ids increase from the base");
}

ZTEST(workout_insights, test_intense_workout_is_capped)
{
    std::vector<WorkoutActivityEntry> activities = {
        make_entry(ActivityType::Running, 2400, 175, 9000),
        make_entry(ActivityType::Weightlifting, 1200, 160, std::nullopt),
    };

    std::vector<RecoveryTechnique> techniques = suggest_recovery(activities, 170, 3600, 9000, 1);

    zassert_equal(techniques.size(), RECOVERY_MAX_SUGGESTIONS);
    zassert_true(has_title(techniques, "Deep Recovery"));
    zassert_true(has_title(techniques, "Sleep Priority"));
    zassert_true(has_title(techniques, "Muscle Relax"));
    zassert_false(has_title(techniques, "Breathing Reset"), "Cap drops the last rule");
}

ZTEST(workout_insights, test_yoga_skips_breathing_reset)
{
    std::vector<WorkoutActivityEntry> activities = {make_entry(ActivityType::Yoga, 1200, 100, std::nullopt)};

    std::vector<RecoveryTechnique> techniques = suggest_recovery(activities, 100, 1200, std::nullopt, 1);

    zassert_equal(techniques.size(), 2);
    zassert_true(has_title(techniques, "Light Stretching"));
    zassert_false(has_title(techniques, "Breathing Reset"));
}
