/**
 * @file test_workout_tracker.cpp
 * @brief Unit tests for quick and multi-activity workout tracking
 */

#include <optional>
#include <vector>

#include <zephyr/fff.h>
#include <zephyr/kernel.h>
#include <zephyr/ztest.h>

#include <workout_tracker.hpp>

#define TRACKER_WORK_Q_STACK_SIZE 2048
#define TRACKER_WORK_Q_PRIORITY 5

static constexpr int64_t TEST_NOW_MS = 1749574850000LL;

K_THREAD_STACK_DEFINE(tracker_test_stack, TRACKER_WORK_Q_STACK_SIZE);
static struct k_work_q tracker_test_work_q;

FAKE_VALUE_FUNC(int64_t, tracker_test_clock);

class TrackerTestImu : public ImuControl
{
public:
    int startImuSession() override
    {
        starts++;
        return 0;
    }

    int stopImuSession() override
    {
        stops++;
        return 0;
    }

    int starts = 0;
    int stops = 0;
};

class TrackerTestRepository : public WorkoutRepository
{
public:
    int save(const char *user_id, const WorkoutSession &session) override
    {
        ARG_UNUSED(user_id);
        saved.push_back(session);
        return save_result;
    }

    int loadAll(const char *user_id, std::vector<WorkoutSession> &sessions) override
    {
        ARG_UNUSED(user_id);
        sessions.clear();
        return 0;
    }

    int save_result = 0;
    std::vector<WorkoutSession> saved;
};

struct workout_tracker_fixture
{
    std::optional<TelemetrySink> sink;
    std::optional<TrackerTestImu> imu;
    std::optional<TrackerTestRepository> repository;
    std::optional<WorkoutHistory> history;
    std::optional<WorkoutTracker> tracker;
};

static void *workout_tracker_setup(void)
{
    static struct workout_tracker_fixture fixture;

    k_work_queue_init(&tracker_test_work_q);
    k_work_queue_start(&tracker_test_work_q, tracker_test_stack, K_THREAD_STACK_SIZEOF(tracker_test_stack),
                       TRACKER_WORK_Q_PRIORITY, NULL);
    k_thread_name_set(&tracker_test_work_q.thread, "tracker_test_q");

    return &fixture;
}

static void workout_tracker_before(void *f)
{
    struct workout_tracker_fixture *fixture = (struct workout_tracker_fixture *)f;

    RESET_FAKE(tracker_test_clock);
    tracker_test_clock_fake.return_val = TEST_NOW_MS;

    fixture->sink.emplace();
    fixture->imu.emplace();
    fixture->repository.emplace();
    fixture->history.emplace(*fixture->repository, "tester");
    // No work queue, tests drive tick() themselves
    fixture->tracker.emplace(*fixture->sink, *fixture->imu, *fixture->history, tracker_test_clock, nullptr);
}

static void workout_tracker_after(void *f)
{
    struct workout_tracker_fixture *fixture = (struct workout_tracker_fixture *)f;

    fixture->tracker.reset();
    fixture->history.reset();
    fixture->repository.reset();
    fixture->imu.reset();
    fixture->sink.reset();
}

ZTEST_SUITE(workout_tracker, NULL, workout_tracker_setup, workout_tracker_before, workout_tracker_after, NULL);

static void tick_times(WorkoutTracker &tracker, int count)
{
    for (int i = 0; i < count; i++)
    {
        tracker.tick();
    }
}

/******************************** QUICK WORKOUT *******************************/

ZTEST_F(workout_tracker, test_quick_workout_averages_sampled_heart_rate)
{
    WorkoutTracker &tracker = *fixture->tracker;

    zassert_ok(tracker.startQuickWorkout());
    zassert_equal(fixture->imu->starts, 1, "Quick workout starts IMU");

    fixture->sink->updateHeartRate(100);
    tracker.tick();
    fixture->sink->updateHeartRate(120);
    tracker.tick();
    fixture->sink->updateHeartRate(0);
    tracker.tick();
    fixture->sink->updateHeartRate(131);
    tracker.tick();
    fixture->sink->updateSteps(250);

    WorkoutSession session;
    zassert_ok(tracker.stopQuickWorkout(&session));

    zassert_equal(session.duration_seconds, 4);
    zassert_equal(session.avg_heart_rate.value_or(-1), 117, "Zero readings are not sampled");
    zassert_equal(session.total_steps.value_or(-1), 250);
    zassert_equal(session.id, TEST_NOW_MS);
    zassert_equal(session.started_at_millis, TEST_NOW_MS - 4000);
    zassert_true(session.activities.empty());
    zassert_equal(fixture->imu->stops, 1);

    zassert_equal(fixture->history->size(), 1);
    std::optional<WorkoutSummary> summary = fixture->history->lastSummary();
    zassert_true(summary.has_value());
    zassert_equal(summary->duration_seconds, 4);
    zassert_equal(summary->steps_delta.value_or(-1), 250);
}

ZTEST_F(workout_tracker, test_quick_workout_without_telemetry)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startQuickWorkout();
    tick_times(tracker, 2);

    WorkoutSession session;
    zassert_ok(tracker.stopQuickWorkout(&session));
    zassert_false(session.avg_heart_rate.has_value());
    zassert_false(session.total_steps.has_value());
}

ZTEST_F(workout_tracker, test_stop_quick_without_start)
{
    zassert_equal(fixture->tracker->stopQuickWorkout(), -ENOENT);
    zassert_equal(fixture->history->size(), 0);
}

ZTEST_F(workout_tracker, test_quick_and_activity_are_exclusive)
{
    WorkoutTracker &tracker = *fixture->tracker;

    zassert_ok(tracker.startActivity(ActivityType::Yoga));
    zassert_equal(tracker.startQuickWorkout(), -EBUSY);

    zassert_ok(tracker.endActivity());
    zassert_equal(tracker.startQuickWorkout(), -EBUSY, "Completed activities still belong to a workout");

    tracker.cancelWorkout();
    zassert_ok(tracker.startQuickWorkout());
    zassert_equal(tracker.startActivity(ActivityType::Running), -EBUSY);
    zassert_equal(tracker.pauseActivity(), -ENOENT, "Quick workouts cannot pause");
    zassert_equal(tracker.endActivity(), -ENOENT);
    zassert_equal(tracker.endWorkout(70.0), -EBUSY);
}

ZTEST_F(workout_tracker, test_disconnect_stops_quick_workout)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startQuickWorkout();
    tick_times(tracker, 3);
    tracker.onPeripheralDisconnected();

    zassert_false(tracker.status().segment_active);
    zassert_equal(fixture->history->size(), 1);
    zassert_equal(fixture->history->sessions()[0].duration_seconds, 3);
}

ZTEST_F(workout_tracker, test_disconnect_leaves_activity_running)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Cycling);
    tracker.onPeripheralDisconnected();

    zassert_true(tracker.status().segment_active);
    zassert_equal(fixture->history->size(), 0);
}

/****************************** MULTI ACTIVITY ********************************/

ZTEST_F(workout_tracker, test_workout_aggregates_activities)
{
    WorkoutTracker &tracker = *fixture->tracker;

    zassert_ok(tracker.startActivity(ActivityType::Walking));
    zassert_equal(fixture->imu->starts, 1);
    tick_times(tracker, 3);
    fixture->sink->updateHeartRate(140);
    fixture->sink->updateSteps(1000);
    WorkoutActivityEntry walk;
    zassert_ok(tracker.endActivity(&walk));
    zassert_equal(walk.steps.value_or(-1), 1000);
    zassert_equal(fixture->imu->stops, 1);

    zassert_ok(tracker.startActivity(ActivityType::Cycling));
    zassert_equal(fixture->imu->starts, 1, "Cycling does not use IMU");
    tick_times(tracker, 2);
    fixture->sink->updateHeartRate(110);
    WorkoutActivityEntry ride;
    zassert_ok(tracker.endActivity(&ride));
    zassert_false(ride.steps.has_value(), "Cycling does not track steps");
    zassert_equal(ride.avg_heart_rate.value_or(-1), 110);

    WorkoutSession session;
    zassert_ok(tracker.endWorkout(70.0, &session));

    zassert_equal(session.activities.size(), 2);
    zassert_equal(session.duration_seconds, 5);
    zassert_equal(session.avg_heart_rate.value_or(-1), 125);
    zassert_equal(session.total_steps.value_or(-1), 1000);
    zassert_equal(session.started_at_millis, TEST_NOW_MS - 5000);
    zassert_true(session.calories.has_value());
    zassert_true(*session.calories > 0.0);
    zassert_false(session.recovery_techniques.empty());
    zassert_true(session.recovery_techniques[0].id > session.id, "Technique ids follow the session id");

    zassert_equal(fixture->history->size(), 1);
    zassert_equal(fixture->repository->saved.size(), 1);
    zassert_equal(tracker.status().completed_activities, 0);
}

ZTEST_F(workout_tracker, test_heart_rate_mean_is_rounded)
{
    WorkoutTracker &tracker = *fixture->tracker;

    fixture->sink->updateHeartRate(120);
    tracker.startActivity(ActivityType::Yoga);
    tracker.tick();
    tracker.endActivity();

    fixture->sink->updateHeartRate(125);
    tracker.startActivity(ActivityType::Other);
    tracker.tick();
    tracker.endActivity();

    WorkoutSession session;
    zassert_ok(tracker.endWorkout(70.0, &session));
    zassert_equal(session.avg_heart_rate.value_or(-1), 123, "122.5 rounds up");
    zassert_false(session.total_steps.has_value(), "No activity tracked steps");
}

ZTEST_F(workout_tracker, test_activity_without_heart_rate_is_excluded_from_mean)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Yoga);
    tracker.tick();
    tracker.endActivity();

    fixture->sink->updateHeartRate(150);
    tracker.startActivity(ActivityType::Weightlifting);
    tracker.tick();
    tracker.endActivity();

    WorkoutSession session;
    zassert_ok(tracker.endWorkout(70.0, &session));
    zassert_false(session.activities[0].avg_heart_rate.has_value());
    zassert_equal(session.avg_heart_rate.value_or(-1), 150);
}

ZTEST_F(workout_tracker, test_end_workout_closes_active_activity)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Running);
    tick_times(tracker, 4);

    WorkoutSession session;
    zassert_ok(tracker.endWorkout(70.0, &session));
    zassert_equal(session.activities.size(), 1);
    zassert_equal(session.duration_seconds, 4);
    zassert_false(tracker.status().segment_active);
}

ZTEST_F(workout_tracker, test_end_workout_without_activities)
{
    zassert_equal(fixture->tracker->endWorkout(70.0), -ENODATA);
    zassert_equal(fixture->imu->stops, 1, "IMU is stopped anyway");
    zassert_equal(fixture->history->size(), 0);
}

ZTEST_F(workout_tracker, test_pause_freezes_elapsed_time)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Walking);
    tick_times(tracker, 2);
    zassert_ok(tracker.pauseActivity());
    tick_times(tracker, 5);
    zassert_true(tracker.status().paused);
    zassert_ok(tracker.resumeActivity());
    tracker.tick();
    zassert_ok(tracker.togglePause());
    tracker.tick();
    zassert_ok(tracker.togglePause());
    tracker.tick();

    WorkoutActivityEntry entry;
    zassert_ok(tracker.endActivity(&entry));
    zassert_equal(entry.duration_seconds, 4);
}

ZTEST_F(workout_tracker, test_pause_without_activity)
{
    zassert_equal(fixture->tracker->pauseActivity(), -ENOENT);
    zassert_equal(fixture->tracker->resumeActivity(), -ENOENT);
    zassert_equal(fixture->tracker->togglePause(), -ENOENT);
}

ZTEST_F(workout_tracker, test_cancel_drops_everything)
{
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Yoga);
    tracker.endActivity();
    tracker.startActivity(ActivityType::Running);

    zassert_ok(tracker.cancelWorkout());
    zassert_false(tracker.status().segment_active);
    zassert_equal(tracker.completedActivities().size(), 0);
    zassert_equal(fixture->imu->stops, 1, "Running segment stops IMU");
    zassert_equal(tracker.endWorkout(70.0), -ENODATA);
}

ZTEST_F(workout_tracker, test_ids_stay_unique_with_frozen_clock)
{
    WorkoutTracker &tracker = *fixture->tracker;

    WorkoutActivityEntry first;
    WorkoutActivityEntry second;
    tracker.startActivity(ActivityType::Yoga);
    tracker.endActivity(&first);
    tracker.startActivity(ActivityType::Yoga);
    tracker.endActivity(&second);

    zassert_equal(first.id, TEST_NOW_MS);
    zassert_equal(second.id, TEST_NOW_MS + 1);
}

ZTEST_F(workout_tracker, test_failed_save_keeps_session)
{
    WorkoutTracker &tracker = *fixture->tracker;
    fixture->repository->save_result = -EIO;

    tracker.startActivity(ActivityType::Other);
    tracker.tick();
    zassert_ok(tracker.endWorkout(70.0));

    zassert_equal(fixture->history->size(), 1);
    zassert_equal(fixture->history->failedSaves(), 1);
}

/******************************** STEP DELTAS *********************************/

// Rebuild the manual tracker with an explicit step baseline mode
static WorkoutTracker &tracker_with_step_reset(struct workout_tracker_fixture *fixture, bool assume_step_reset)
{
    fixture->tracker.reset();
    fixture->tracker.emplace(*fixture->sink, *fixture->imu, *fixture->history, tracker_test_clock, nullptr,
                             assume_step_reset);
    return *fixture->tracker;
}

ZTEST_F(workout_tracker, test_missed_counter_reset_is_clamped)
{
    WorkoutTracker &tracker = tracker_with_step_reset(fixture, false);

    fixture->sink->updateSteps(500);
    tracker.startActivity(ActivityType::Walking);
    fixture->sink->updateSteps(120);

    WorkoutActivityEntry entry;
    zassert_ok(tracker.endActivity(&entry));
    zassert_equal(entry.steps.value_or(-1), 0, "Negative delta is clamped");
    zassert_equal(tracker.stepClampAnomalies(), 1);
}

ZTEST_F(workout_tracker, test_delta_from_live_baseline)
{
    WorkoutTracker &tracker = tracker_with_step_reset(fixture, false);

    fixture->sink->updateSteps(500);
    tracker.startActivity(ActivityType::Running);
    fixture->sink->updateSteps(820);

    WorkoutActivityEntry entry;
    zassert_ok(tracker.endActivity(&entry));
    zassert_equal(entry.steps.value_or(-1), 320);
    zassert_equal(tracker.stepClampAnomalies(), 0);
}

ZTEST_F(workout_tracker, test_baseline_is_zero_after_imu_reset)
{
    WorkoutTracker &tracker = tracker_with_step_reset(fixture, true);

    // Stale count from before start-IMU zeroed the peripheral counter
    fixture->sink->updateSteps(500);
    tracker.startActivity(ActivityType::Walking);
    fixture->sink->updateSteps(120);

    WorkoutActivityEntry entry;
    zassert_ok(tracker.endActivity(&entry));
    zassert_equal(entry.steps.value_or(-1), 120);
    zassert_equal(tracker.stepClampAnomalies(), 0);
}

ZTEST_F(workout_tracker, test_default_baseline_follows_kconfig)
{
    WorkoutTracker &tracker = *fixture->tracker;

    fixture->sink->updateSteps(500);
    tracker.startActivity(ActivityType::Running);
    fixture->sink->updateSteps(700);

    WorkoutActivityEntry entry;
    zassert_ok(tracker.endActivity(&entry));
    zassert_equal(entry.steps.value_or(-1), IS_ENABLED(CONFIG_SMARTGYM_ASSUME_IMU_STEP_RESET) ? 700 : 200);
}

/****************************** ACTIVITY LIMIT ********************************/

ZTEST_F(workout_tracker, test_workout_is_limited_to_storable_activities)
{
    WorkoutTracker &tracker = *fixture->tracker;

    for (size_t i = 0; i < WORKOUT_MAX_ACTIVITIES; i++)
    {
        zassert_ok(tracker.startActivity(ActivityType::Yoga));
        tracker.tick();
        zassert_ok(tracker.endActivity());
    }

    zassert_equal(tracker.startActivity(ActivityType::Yoga), -ENOSPC);
    zassert_false(tracker.status().segment_active);

    WorkoutSession session;
    zassert_ok(tracker.endWorkout(70.0, &session));
    zassert_equal(session.activities.size(), WORKOUT_MAX_ACTIVITIES);
    zassert_equal(fixture->repository->saved.size(), 1);
    zassert_equal(fixture->history->failedSaves(), 0);

    zassert_ok(tracker.startActivity(ActivityType::Yoga), "A new workout starts empty");
}

/****************************** PERIODIC TICK *********************************/

ZTEST_F(workout_tracker, test_work_queue_drives_ticks)
{
    // Replace the manual tracker with one that schedules its own tick
    fixture->tracker.reset();
    fixture->tracker.emplace(*fixture->sink, *fixture->imu, *fixture->history, tracker_test_clock,
                             &tracker_test_work_q);
    WorkoutTracker &tracker = *fixture->tracker;

    tracker.startActivity(ActivityType::Yoga);
    k_sleep(K_MSEC(CONFIG_SMARTGYM_TRACKER_TICK_MS * 5 + CONFIG_SMARTGYM_TRACKER_TICK_MS / 2));
    int64_t elapsed = tracker.status().elapsed_seconds;
    zassert_true(elapsed >= 4 && elapsed <= 6, "Unexpected tick count %lld", (long long)elapsed);

    tracker.endActivity();
    k_sleep(K_MSEC(CONFIG_SMARTGYM_TRACKER_TICK_MS * 3));
    zassert_false(tracker.status().segment_active);
}
