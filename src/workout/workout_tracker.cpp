/**
 * @file workout_tracker.cpp
 * @brief Turns live telemetry and activity boundaries into workout records
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE workout_tracker

#include <cmath>
#include <errno.h>

#include <zephyr/logging/log.h>

#include <workout_insights.hpp>
#include <workout_tracker.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_WORKOUT_LOG_LEVEL); // NOLINT

static constexpr uint32_t TICK_INTERVAL_MS = CONFIG_SMARTGYM_TRACKER_TICK_MS;

WorkoutTracker::WorkoutTracker(TelemetrySink &telemetry_sink, ImuControl &imu_control,
                               WorkoutHistory &workout_history, wall_clock_ms_fn_t wall_clock,
                               struct k_work_q *queue, bool assume_step_reset)
    : sink(telemetry_sink), imu(imu_control), history(workout_history),
      clock(wall_clock ? wall_clock : k_uptime_get), work_q(queue), zero_step_baseline(assume_step_reset),
      tick_work(), segment(), completed(),
      clamp_anomalies(0), last_id(0)
{
    k_mutex_init(&tracker_mutex);
    k_work_init_delayable(&tick_work.dwork, tickWorkHandler);
    tick_work.owner = this;
}

WorkoutTracker::~WorkoutTracker()
{
    struct k_work_sync sync;
    k_work_cancel_delayable_sync(&tick_work.dwork, &sync);
}

/******************************** QUICK WORKOUT *******************************/

int WorkoutTracker::startQuickWorkout()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (segment || !completed.empty())
    {
        k_mutex_unlock(&tracker_mutex);
        LOG_WRN("Quick workout refused, a workout is already running");
        return -EBUSY;
    }
    int err = beginSegment(true, ActivityType::Other);
    k_mutex_unlock(&tracker_mutex);

    if (!err)
    {
        // Start-IMU zeroes the peripheral step counter
        (void)imu.startImuSession();
        LOG_INF("Quick workout started");
    }
    return err;
}

int WorkoutTracker::stopQuickWorkout(WorkoutSession *out)
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (!segment || !segment->quick)
    {
        k_mutex_unlock(&tracker_mutex);
        return -ENOENT;
    }

    const Segment &live = *segment;
    WorkoutSummary summary = {};
    summary.duration_seconds = live.elapsed_seconds;
    if (live.hr_count > 0)
    {
        summary.avg_heart_rate = (int)(live.hr_sum / live.hr_count);
    }
    summary.steps_delta = stepDelta(live);

    int64_t now = clock();
    WorkoutSession session = {};
    session.id = nextId();
    session.started_at_millis = now - summary.duration_seconds * 1000;
    session.duration_seconds = summary.duration_seconds;
    session.avg_heart_rate = summary.avg_heart_rate;
    session.total_steps = summary.steps_delta;

    segment.reset();
    k_mutex_unlock(&tracker_mutex);

    cancelTick();
    (void)imu.stopImuSession();

    history.recordSummary(summary);
    history.append(session);

    LOG_INF("Quick workout finished: %llds", (long long)session.duration_seconds);
    if (out)
    {
        *out = session;
    }
    return 0;
}

void WorkoutTracker::onPeripheralDisconnected()
{
    int err = stopQuickWorkout();
    if (!err)
    {
        LOG_INF("Quick workout stopped, peripheral disconnected");
    }
}

/****************************** ACTIVITY SEGMENTS *****************************/

int WorkoutTracker::startActivity(ActivityType type)
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (segment)
    {
        k_mutex_unlock(&tracker_mutex);
        LOG_WRN("End the current activity before starting %s", activity_type_name(type));
        return -EBUSY;
    }
    if (completed.size() >= WORKOUT_MAX_ACTIVITIES)
    {
        k_mutex_unlock(&tracker_mutex);
        LOG_WRN("Workout already has %u activities, end it first", (unsigned)WORKOUT_MAX_ACTIVITIES);
        return -ENOSPC;
    }
    int err = beginSegment(false, type);
    k_mutex_unlock(&tracker_mutex);

    if (err)
    {
        return err;
    }
    if (activity_tracks_steps(type))
    {
        (void)imu.startImuSession();
    }
    LOG_INF("Activity %s started", activity_type_name(type));
    return 0;
}

int WorkoutTracker::pauseActivity()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    int err = 0;
    if (!segment || segment->quick)
    {
        err = -ENOENT;
    }
    else
    {
        segment->paused = true;
    }
    k_mutex_unlock(&tracker_mutex);
    return err;
}

int WorkoutTracker::resumeActivity()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    int err = 0;
    if (!segment || segment->quick)
    {
        err = -ENOENT;
    }
    else
    {
        segment->paused = false;
    }
    k_mutex_unlock(&tracker_mutex);
    return err;
}

int WorkoutTracker::togglePause()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    int err = 0;
    if (!segment || segment->quick)
    {
        err = -ENOENT;
    }
    else
    {
        segment->paused = !segment->paused;
    }
    k_mutex_unlock(&tracker_mutex);
    return err;
}

int WorkoutTracker::endActivity(WorkoutActivityEntry *out)
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (!segment || segment->quick)
    {
        k_mutex_unlock(&tracker_mutex);
        return -ENOENT;
    }

    const Segment &live = *segment;
    WorkoutActivityEntry entry = {};
    entry.id = nextId();
    entry.type = live.type;
    entry.duration_seconds = live.elapsed_seconds;
    // Values observed now, not averaged over the segment
    entry.avg_heart_rate = sink.heartRate();
    entry.steps = stepDelta(live);

    completed.push_back(entry);
    segment.reset();
    k_mutex_unlock(&tracker_mutex);

    cancelTick();
    if (activity_tracks_steps(entry.type))
    {
        (void)imu.stopImuSession();
    }

    LOG_INF("Activity %s ended after %llds", activity_type_name(entry.type), (long long)entry.duration_seconds);
    if (out)
    {
        *out = entry;
    }
    return 0;
}

int WorkoutTracker::endWorkout(double weight_kg, WorkoutSession *out)
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    bool quick_running = segment && segment->quick;
    bool activity_running = segment && !segment->quick;
    k_mutex_unlock(&tracker_mutex);

    if (quick_running)
    {
        return -EBUSY;
    }
    if (activity_running)
    {
        (void)endActivity();
    }

    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (completed.empty())
    {
        k_mutex_unlock(&tracker_mutex);
        (void)imu.stopImuSession();
        LOG_INF("Workout ended without activities");
        return -ENODATA;
    }

    std::vector<WorkoutActivityEntry> activities = std::move(completed);
    completed.clear();

    WorkoutSession session = {};
    int64_t hr_sum = 0;
    uint32_t hr_count = 0;
    int64_t steps_sum = 0;
    bool has_steps = false;

    for (const WorkoutActivityEntry &entry : activities)
    {
        session.duration_seconds += entry.duration_seconds;
        if (entry.avg_heart_rate)
        {
            hr_sum += *entry.avg_heart_rate;
            hr_count++;
        }
        if (entry.steps)
        {
            steps_sum += *entry.steps;
            has_steps = true;
        }
    }

    if (hr_count > 0)
    {
        session.avg_heart_rate = (int)std::lround((double)hr_sum / hr_count);
    }
    if (has_steps)
    {
        session.total_steps = steps_sum;
    }

    int64_t now = clock();
    session.id = nextId();
    session.started_at_millis = now - session.duration_seconds * 1000;
    session.calories = estimate_workout_calories(activities, weight_kg);
    session.recovery_techniques = suggest_recovery(activities, session.avg_heart_rate, session.duration_seconds,
                                                   session.total_steps, last_id + 1);
    if (!session.recovery_techniques.empty())
    {
        last_id = session.recovery_techniques.back().id;
    }
    session.activities = std::move(activities);
    k_mutex_unlock(&tracker_mutex);

    history.append(session);

    LOG_INF("Workout finished: %u activities, %llds", (unsigned)session.activities.size(),
            (long long)session.duration_seconds);
    if (out)
    {
        *out = session;
    }
    return 0;
}

int WorkoutTracker::cancelWorkout()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    bool imu_running = segment && (segment->quick || activity_tracks_steps(segment->type));
    segment.reset();
    completed.clear();
    k_mutex_unlock(&tracker_mutex);

    cancelTick();
    if (imu_running)
    {
        (void)imu.stopImuSession();
    }
    LOG_INF("Workout cancelled");
    return 0;
}

/************************************ TICK ************************************/

void WorkoutTracker::tick()
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (segment && !segment->paused)
    {
        segment->elapsed_seconds++;

        if (segment->quick)
        {
            std::optional<int> hr = sink.heartRate();
            if (hr && *hr > 0)
            {
                segment->hr_sum += *hr;
                segment->hr_count++;
            }
        }
    }
    k_mutex_unlock(&tracker_mutex);
}

void WorkoutTracker::tickWorkHandler(struct k_work *work)
{
    struct k_work_delayable *dwork = k_work_delayable_from_work(work);
    tracker_tick_work_t *item = CONTAINER_OF(dwork, tracker_tick_work_t, dwork);
    WorkoutTracker *self = item->owner;

    self->tick();

    k_mutex_lock(&self->tracker_mutex, K_FOREVER);
    bool active = self->segment.has_value();
    k_mutex_unlock(&self->tracker_mutex);

    if (active)
    {
        self->scheduleTick();
    }
}

void WorkoutTracker::scheduleTick()
{
    if (work_q)
    {
        k_work_schedule_for_queue(work_q, &tick_work.dwork, K_MSEC(TICK_INTERVAL_MS));
    }
}

void WorkoutTracker::cancelTick()
{
    k_work_cancel_delayable(&tick_work.dwork);
}

/********************************** QUERIES ***********************************/

TrackerStatus WorkoutTracker::status() const
{
    TrackerStatus s = {};
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    if (segment)
    {
        s.segment_active = true;
        s.quick = segment->quick;
        s.paused = segment->paused;
        s.type = segment->type;
        s.elapsed_seconds = segment->elapsed_seconds;
    }
    s.completed_activities = completed.size();
    k_mutex_unlock(&tracker_mutex);
    return s;
}

std::vector<WorkoutActivityEntry> WorkoutTracker::completedActivities() const
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    std::vector<WorkoutActivityEntry> copy = completed;
    k_mutex_unlock(&tracker_mutex);
    return copy;
}

uint32_t WorkoutTracker::stepClampAnomalies() const
{
    k_mutex_lock(&tracker_mutex, K_FOREVER);
    uint32_t count = clamp_anomalies;
    k_mutex_unlock(&tracker_mutex);
    return count;
}

/********************************** HELPERS ***********************************/

// Called with tracker_mutex held
int WorkoutTracker::beginSegment(bool quick, ActivityType type)
{
    Segment next = {};
    next.quick = quick;
    next.type = type;

    if (quick || activity_tracks_steps(type))
    {
        if (zero_step_baseline)
        {
            next.step_baseline = 0;
        }
        else
        {
            next.step_baseline = sink.cumulativeSteps().value_or(0);
        }
    }

    segment = next;
    scheduleTick();
    return 0;
}

// Called with tracker_mutex held
std::optional<int64_t> WorkoutTracker::stepDelta(const Segment &live)
{
    if (!live.step_baseline)
    {
        return std::nullopt;
    }

    std::optional<int64_t> current = sink.cumulativeSteps();
    if (!current)
    {
        return std::nullopt;
    }

    int64_t delta = *current - *live.step_baseline;
    if (delta < 0)
    {
        clamp_anomalies++;
        LOG_WRN("Step counter below baseline (%lld < %lld), missed IMU reset? Clamped to 0", (long long)*current,
                (long long)*live.step_baseline);
        delta = 0;
    }
    return delta;
}

// Called with tracker_mutex held
int64_t WorkoutTracker::nextId()
{
    int64_t now = clock();
    last_id = now > last_id ? now : last_id + 1;
    return last_id;
}
