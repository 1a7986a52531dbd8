/**
 * @file workout_tracker.hpp
 * @brief Turns live telemetry and activity boundaries into workout records
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_TRACKER_HEADER_
#define APP_INCLUDE_WORKOUT_TRACKER_HEADER_

#include <optional>
#include <stdint.h>
#include <vector>

#include <zephyr/kernel.h>

#include <gatt_transport.hpp>
#include <telemetry_sink.hpp>
#include <workout_codec.hpp>
#include <workout_domain.hpp>
#include <workout_history.hpp>

// Wall clock in Unix epoch milliseconds
typedef int64_t (*wall_clock_ms_fn_t)(void);

struct TrackerStatus
{
    bool segment_active;
    bool quick;
    bool paused;
    ActivityType type;
    int64_t elapsed_seconds;
    size_t completed_activities;
};

class WorkoutTracker;

struct tracker_tick_work_t
{
    struct k_work_delayable dwork;
    WorkoutTracker *owner;
};

/**
 * @brief Activity and workout aggregation.
 *
 * One segment is live at a time. A quick workout is a segment that always
 * tracks steps, averages heart rate over its ticks, and finalises into a
 * session without an activity breakdown. Regular segments capture heart rate
 * and steps at the instant they end and are summed by endWorkout().
 *
 * With @p assume_step_reset the step baseline is 0, as the peripheral zeroes
 * its counter on start-IMU. Otherwise it is the cumulative count at segment
 * start. A negative delta is clamped to 0 and counted in stepClampAnomalies().
 *
 * A workout holds at most WORKOUT_MAX_ACTIVITIES completed activities, the
 * number a stored record can carry.
 *
 * With a null @p work_q no periodic tick is scheduled and the owner calls
 * tick() itself.
 */
class WorkoutTracker
{
public:
    WorkoutTracker(TelemetrySink &telemetry_sink, ImuControl &imu_control, WorkoutHistory &workout_history,
                   wall_clock_ms_fn_t wall_clock, struct k_work_q *queue,
                   bool assume_step_reset = IS_ENABLED(CONFIG_SMARTGYM_ASSUME_IMU_STEP_RESET));
    ~WorkoutTracker();

    WorkoutTracker(const WorkoutTracker &) = delete;
    WorkoutTracker &operator=(const WorkoutTracker &) = delete;

    int startQuickWorkout();
    int stopQuickWorkout(WorkoutSession *out = nullptr);

    // -EBUSY while a segment is live, -ENOSPC once the workout is full
    int startActivity(ActivityType type);
    int pauseActivity();
    int resumeActivity();
    int togglePause();
    int endActivity(WorkoutActivityEntry *out = nullptr);

    /**
     * @brief Finish the multi-activity workout.
     *
     * An active segment is ended first. Returns -ENODATA, after stopping IMU,
     * when no activity was completed.
     */
    int endWorkout(double weight_kg, WorkoutSession *out = nullptr);
    int cancelWorkout();

    // Stops a running quick workout, as the link it samples is gone
    void onPeripheralDisconnected();

    // Advance the live segment by one second
    void tick();

    TrackerStatus status() const;
    std::vector<WorkoutActivityEntry> completedActivities() const;
    uint32_t stepClampAnomalies() const;

private:
    struct Segment
    {
        bool quick;
        ActivityType type;
        int64_t elapsed_seconds;
        bool paused;
        std::optional<int64_t> step_baseline;
        int64_t hr_sum;
        uint32_t hr_count;
    };

    static void tickWorkHandler(struct k_work *work);

    int beginSegment(bool quick, ActivityType type);
    std::optional<int64_t> stepDelta(const Segment &segment);
    int64_t nextId();
    void scheduleTick();
    void cancelTick();

    TelemetrySink &sink;
    ImuControl &imu;
    WorkoutHistory &history;
    wall_clock_ms_fn_t clock;
    struct k_work_q *work_q;
    bool zero_step_baseline;
    tracker_tick_work_t tick_work;

    mutable struct k_mutex tracker_mutex;
    std::optional<Segment> segment;
    std::vector<WorkoutActivityEntry> completed;
    uint32_t clamp_anomalies;
    int64_t last_id;
};

#endif // APP_INCLUDE_WORKOUT_TRACKER_HEADER_
