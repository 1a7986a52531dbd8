/**
 * @file test_workout_domain.cpp
 * @brief Unit tests for activity type names
 */

#include <errno.h>

#include <zephyr/ztest.h>

#include <workout_domain.hpp>

ZTEST_SUITE(workout_domain, NULL, NULL, NULL, NULL, NULL);

ZTEST(workout_domain, test_names_parse_case_insensitive)
{
    ActivityType type = ActivityType::Other;

    zassert_ok(activity_type_from_name("running", &type));
    zassert_equal(type, ActivityType::Running);
    zassert_ok(activity_type_from_name("WEIGHTLIFTING", &type));
    zassert_equal(type, ActivityType::Weightlifting);
    zassert_equal(activity_type_from_name("swimming", &type), -EINVAL);
    zassert_equal(type, ActivityType::Weightlifting, "Unknown name leaves the output alone");
}

ZTEST(workout_domain, test_only_walking_and_running_track_steps)
{
    zassert_true(activity_tracks_steps(ActivityType::Walking));
    zassert_true(activity_tracks_steps(ActivityType::Running));
    zassert_false(activity_tracks_steps(ActivityType::Cycling));
    zassert_false(activity_tracks_steps(ActivityType::Yoga));
    zassert_false(activity_tracks_steps(ActivityType::Weightlifting));
    zassert_false(activity_tracks_steps(ActivityType::Other));
}
