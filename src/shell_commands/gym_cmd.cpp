/**
 * @file gym_cmd.cpp
 * @brief Shell front end for the fitness hub
 *
 * Commands:
 *   - gym scan start|stop, gym devices, gym connect <addr> [name], gym disconnect
 *   - gym state, gym stats, gym env read|show, gym imu start|stop
 *   - gym activity start <type>|pause|resume|end
 *   - gym workout quick_start|quick_stop|end [weight_kg]|cancel
 *   - gym history, gym time <epoch>, gym perm scan|connect on|off
 */

#include <cstdlib>
#include <cstring>

#include <zephyr/kernel.h>
#include <zephyr/shell/shell.h>

#include "../bluetooth/zephyr_adapter_gate.hpp"
#include <environment_advisor.hpp>
#include <hub.hpp>
#include <wall_clock.hpp>


static bool hub_ready(const struct shell *sh)
{
    if (!hub_context().session)
    {
        shell_error(sh, "Hub not ready");
        return false;
    }
    return true;
}

static int report(const struct shell *sh, const char *what, int err)
{
    if (err)
    {
        shell_error(sh, "%s failed: %d", what, err);
        return err;
    }
    shell_print(sh, "%s requested", what);
    return 0;
}

static void print_session(const struct shell *sh, const WorkoutSession &session)
{
    shell_print(sh, "Workout %lld: %llds", (long long)session.id, (long long)session.duration_seconds);
    if (session.avg_heart_rate)
    {
        shell_print(sh, "  avg HR: %d bpm", *session.avg_heart_rate);
    }
    if (session.total_steps)
    {
        shell_print(sh, "  steps: %lld", (long long)*session.total_steps);
    }
    if (session.calories)
    {
        shell_print(sh, "  calories: %.1f kcal", *session.calories);
    }
    for (const WorkoutActivityEntry &entry : session.activities)
    {
        shell_print(sh, "  - %s %llds hr:%d steps:%lld", activity_type_name(entry.type),
                    (long long)entry.duration_seconds, entry.avg_heart_rate.value_or(-1),
                    (long long)entry.steps.value_or(-1));
    }
    for (const RecoveryTechnique &technique : session.recovery_techniques)
    {
        shell_print(sh, "  * %s: %s", technique.title.c_str(), technique.description.c_str());
    }
}

/************************************ LINK ************************************/

static int cmd_scan_start(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "Scan", hub_context().session->startScan());
}

static int cmd_scan_stop(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "Scan stop", hub_context().session->stopScan());
}

static int cmd_devices(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    std::vector<DiscoveredDevice> devices = hub_context().session->discoveredDevices();
    if (devices.empty())
    {
        shell_print(sh, "No devices found");
        return 0;
    }
    for (const DiscoveredDevice &device : devices)
    {
        shell_print(sh, "%s  %s", device.address.c_str(), device.name ? device.name->c_str() : "(unknown)");
    }
    return 0;
}

static int cmd_connect(const struct shell *sh, size_t argc, char **argv)
{
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "Connect", hub_context().session->connect(argv[1], argc > 2 ? argv[2] : nullptr));
}

static int cmd_disconnect(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "Disconnect", hub_context().session->disconnect());
}

static int cmd_state(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    const hub_context_t &hub = hub_context();
    shell_print(sh, "Link: %s", connection_state_describe(hub.session->state()).c_str());
    shell_print(sh, "Step poll: %s", hub.session->isPollActive() ? "active" : "idle");

    TelemetrySnapshot snapshot = hub.telemetry->snapshot();
    if (snapshot.heart_rate_bpm)
    {
        shell_print(sh, "HR: %d bpm", *snapshot.heart_rate_bpm);
    }
    if (snapshot.cumulative_steps)
    {
        shell_print(sh, "Steps: %lld", (long long)*snapshot.cumulative_steps);
    }

    TrackerStatus status = hub.tracker->status();
    if (status.segment_active)
    {
        shell_print(sh, "%s %s, %llds%s", status.quick ? "Quick workout" : "Activity",
                    status.quick ? "" : activity_type_name(status.type), (long long)status.elapsed_seconds,
                    status.paused ? " (paused)" : "");
    }
    shell_print(sh, "Completed activities: %u", (unsigned)status.completed_activities);
    return 0;
}

static int cmd_stats(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    const hub_context_t &hub = hub_context();
    SessionStats stats = hub.session->stats();
    for (size_t i = 0; i < NANOHR_CHAR_COUNT; i++)
    {
        shell_print(sh, "reads %-12s %u", nanohr_char_name(static_cast<NanoHrChar>(i)), stats.reads_issued[i]);
    }
    shell_print(sh, "writes         %u", stats.writes_issued);
    shell_print(sh, "poll started   %u", stats.poll_loops_started);
    shell_print(sh, "poll cancelled %u", stats.poll_loops_cancelled);
    shell_print(sh, "poll ended     %u", stats.poll_loops_terminated);
    shell_print(sh, "poll ticks     %u", stats.poll_ticks);
    shell_print(sh, "events dropped %u", stats.events_dropped);
    shell_print(sh, "devices capped %u", stats.devices_dropped);
    shell_print(sh, "step clamps    %u", hub.tracker->stepClampAnomalies());
    shell_print(sh, "failed saves   %u", hub.history->failedSaves());
    return 0;
}

/********************************* ENVIRONMENT ********************************/

static int cmd_env_read(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "Environment measurement", hub_context().session->requestEnvironmentMeasurement());
}

static int cmd_env_show(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    TelemetrySnapshot snapshot = hub_context().telemetry->snapshot();
    std::optional<EnvSuitability> assessment = environment_assess(snapshot.temperature_c, snapshot.humidity_percent);
    if (!assessment)
    {
        shell_print(sh, "No environment reading yet, run 'gym env read'");
        return 0;
    }

    shell_print(sh, "%.2f C, %.2f %%RH, feels like %.1f C", (double)*snapshot.temperature_c,
                (double)*snapshot.humidity_percent,
                (double)environment_effective_temp_c(*snapshot.temperature_c, *snapshot.humidity_percent));
    shell_print(sh, "%s: %s", env_level_name(assessment->level), assessment->summary);
    shell_print(sh, "%s", assessment->detail);
    return 0;
}

static int cmd_imu_start(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "IMU start", hub_context().session->startImuSession());
}

static int cmd_imu_stop(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    return report(sh, "IMU stop", hub_context().session->stopImuSession());
}

/********************************** ACTIVITY **********************************/

static int cmd_activity_start(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    ActivityType type;
    if (activity_type_from_name(argv[1], &type))
    {
        shell_error(sh, "Unknown activity '%s' (walking, running, cycling, yoga, weightlifting, other)", argv[1]);
        return -EINVAL;
    }

    int err = hub_context().tracker->startActivity(type);
    if (err == -EBUSY)
    {
        shell_error(sh, "End the current activity first");
        return err;
    }
    if (err == -ENOSPC)
    {
        shell_error(sh, "Workout is full (%u activities), end it first", (unsigned)WORKOUT_MAX_ACTIVITIES);
        return err;
    }
    if (err)
    {
        shell_error(sh, "Failed to start activity: %d", err);
        return err;
    }
    shell_print(sh, "%s started", activity_type_name(type));
    return 0;
}

static int cmd_activity_pause(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    int err = hub_context().tracker->togglePause();
    if (err)
    {
        shell_error(sh, "No activity running");
        return err;
    }
    shell_print(sh, "%s", hub_context().tracker->status().paused ? "Paused" : "Resumed");
    return 0;
}

static int cmd_activity_resume(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    int err = hub_context().tracker->resumeActivity();
    if (err)
    {
        shell_error(sh, "No activity running");
    }
    return err;
}

static int cmd_activity_end(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    WorkoutActivityEntry entry;
    int err = hub_context().tracker->endActivity(&entry);
    if (err)
    {
        shell_error(sh, "No activity running");
        return err;
    }
    shell_print(sh, "%s: %llds hr:%d steps:%lld", activity_type_name(entry.type), (long long)entry.duration_seconds,
                entry.avg_heart_rate.value_or(-1), (long long)entry.steps.value_or(-1));
    return 0;
}

/********************************** WORKOUT ***********************************/

static int cmd_quick_start(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    int err = hub_context().tracker->startQuickWorkout();
    if (err)
    {
        shell_error(sh, "A workout is already running");
        return err;
    }
    shell_print(sh, "Quick workout started");
    return 0;
}

static int cmd_quick_stop(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    WorkoutSession session;
    int err = hub_context().tracker->stopQuickWorkout(&session);
    if (err)
    {
        shell_error(sh, "No quick workout running");
        return err;
    }
    print_session(sh, session);
    return 0;
}

static int cmd_workout_end(const struct shell *sh, size_t argc, char **argv)
{
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    double weight_kg = CONFIG_SMARTGYM_DEFAULT_WEIGHT_KG;
    if (argc > 1)
    {
        weight_kg = strtod(argv[1], nullptr);
        if (weight_kg <= 0.0)
        {
            shell_error(sh, "Invalid weight '%s'", argv[1]);
            return -EINVAL;
        }
    }

    WorkoutSession session;
    int err = hub_context().tracker->endWorkout(weight_kg, &session);
    if (err == -ENODATA)
    {
        shell_print(sh, "No activities recorded, nothing saved");
        return 0;
    }
    if (err)
    {
        shell_error(sh, "Stop the quick workout first");
        return err;
    }
    print_session(sh, session);
    return 0;
}

static int cmd_workout_cancel(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }
    hub_context().tracker->cancelWorkout();
    shell_print(sh, "Workout discarded");
    return 0;
}

static int cmd_history(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    if (!hub_ready(sh))
    {
        return -ENODEV;
    }

    const WorkoutHistory &history = *hub_context().history;
    std::vector<WorkoutSession> sessions = history.sessions();
    shell_print(sh, "%u workouts for %s", (unsigned)sessions.size(), history.userId().c_str());
    for (const WorkoutSession &session : sessions)
    {
        print_session(sh, session);
    }

    std::optional<WorkoutSummary> summary = history.lastSummary();
    if (summary)
    {
        shell_print(sh, "Last quick workout: %llds hr:%d steps:%lld", (long long)summary->duration_seconds,
                    summary->avg_heart_rate.value_or(-1), (long long)summary->steps_delta.value_or(-1));
    }
    return 0;
}

/*********************************** SYSTEM ***********************************/

static int cmd_time(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);

    char *end = nullptr;
    unsigned long epoch = strtoul(argv[1], &end, 10);
    if (!end || *end != '\0' || epoch == 0)
    {
        shell_error(sh, "Invalid epoch '%s'", argv[1]);
        return -EINVAL;
    }

    set_current_time_from_epoch((uint32_t)epoch);
    shell_print(sh, "Clock set, now %lld ms", (long long)get_current_epoch_ms());
    return 0;
}

static int parse_on_off(const struct shell *sh, const char *arg, bool *value)
{
    if (strcmp(arg, "on") == 0)
    {
        *value = true;
        return 0;
    }
    if (strcmp(arg, "off") == 0)
    {
        *value = false;
        return 0;
    }
    shell_error(sh, "Expected on or off");
    return -EINVAL;
}

static int cmd_perm_scan(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    bool granted;
    if (!hub_ready(sh) || parse_on_off(sh, argv[1], &granted))
    {
        return -EINVAL;
    }
    hub_context().gate->setScanPermission(granted);
    return 0;
}

static int cmd_perm_connect(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    bool granted;
    if (!hub_ready(sh) || parse_on_off(sh, argv[1], &granted))
    {
        return -EINVAL;
    }
    hub_context().gate->setConnectPermission(granted);
    return 0;
}

SHELL_STATIC_SUBCMD_SET_CREATE(gym_scan_cmds,
    SHELL_CMD(start, NULL, "Scan for NanoHR peripherals", cmd_scan_start),
    SHELL_CMD(stop, NULL, "Stop scanning", cmd_scan_stop),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_env_cmds,
    SHELL_CMD(read, NULL, "Measure temperature and humidity", cmd_env_read),
    SHELL_CMD(show, NULL, "Show the workout environment assessment", cmd_env_show),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_imu_cmds,
    SHELL_CMD(start, NULL, "Start step tracking", cmd_imu_start),
    SHELL_CMD(stop, NULL, "Stop step tracking", cmd_imu_stop),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_activity_cmds,
    SHELL_CMD_ARG(start, NULL, "Start an activity <type>", cmd_activity_start, 2, 0),
    SHELL_CMD(pause, NULL, "Pause or resume the activity", cmd_activity_pause),
    SHELL_CMD(resume, NULL, "Resume the activity", cmd_activity_resume),
    SHELL_CMD(end, NULL, "End the activity", cmd_activity_end),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_workout_cmds,
    SHELL_CMD(quick_start, NULL, "Start a quick workout", cmd_quick_start),
    SHELL_CMD(quick_stop, NULL, "Stop and save the quick workout", cmd_quick_stop),
    SHELL_CMD_ARG(end, NULL, "Finish the workout [weight_kg]", cmd_workout_end, 1, 1),
    SHELL_CMD(cancel, NULL, "Discard the workout", cmd_workout_cancel),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_perm_cmds,
    SHELL_CMD_ARG(scan, NULL, "Scan consent on|off", cmd_perm_scan, 2, 0),
    SHELL_CMD_ARG(connect, NULL, "Connect consent on|off", cmd_perm_connect, 2, 0),
    SHELL_SUBCMD_SET_END
);

SHELL_STATIC_SUBCMD_SET_CREATE(gym_cmds,
    SHELL_CMD(scan, &gym_scan_cmds, "Peripheral scanning", NULL),
    SHELL_CMD(devices, NULL, "List discovered peripherals", cmd_devices),
    SHELL_CMD_ARG(connect, NULL, "Connect <addr> [name]", cmd_connect, 2, 1),
    SHELL_CMD(disconnect, NULL, "Disconnect the peripheral", cmd_disconnect),
    SHELL_CMD(state, NULL, "Show link, telemetry and workout state", cmd_state),
    SHELL_CMD(stats, NULL, "Show session counters", cmd_stats),
    SHELL_CMD(env, &gym_env_cmds, "Environment readings", NULL),
    SHELL_CMD(imu, &gym_imu_cmds, "IMU step tracking", NULL),
    SHELL_CMD(activity, &gym_activity_cmds, "Activity segments", NULL),
    SHELL_CMD(workout, &gym_workout_cmds, "Workout control", NULL),
    SHELL_CMD(history, NULL, "List saved workouts", cmd_history),
    SHELL_CMD_ARG(time, NULL, "Set the wall clock <epoch_s>", cmd_time, 2, 0),
    SHELL_CMD(perm, &gym_perm_cmds, "User consent", NULL),
    SHELL_SUBCMD_SET_END
);

SHELL_CMD_REGISTER(gym, &gym_cmds, "Fitness hub commands", NULL);
