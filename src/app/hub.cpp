/**
 * @file hub.cpp
 * @brief Owns and wires the fitness hub components
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE hub

#include <app_event_manager.h>
#include <caf/events/module_state_event.h>
#include <events/peripheral_state_event.h>
#include <events/telemetry_event.h>
#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>
#include <zephyr/settings/settings.h>

#include "../bluetooth/zephyr_adapter_gate.hpp"
#include "../bluetooth/zephyr_gatt_transport.hpp"
#include "../data/fs_workout_store.hpp"
#include <hub.hpp>
#include <storage.hpp>
#include <wall_clock.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_HUB_LOG_LEVEL); // NOLINT

/******************************** HUB WORK QUEUE ******************************/
static constexpr int hub_stack_size = CONFIG_SMARTGYM_HUB_STACK_SIZE;
static constexpr int hub_priority = CONFIG_SMARTGYM_HUB_PRIORITY;
K_THREAD_STACK_DEFINE(hub_workq_stack, hub_stack_size);
static struct k_work_q hub_work_q;

static hub_context_t context = {};

// Set while the session holds or is acquiring a link
static bool link_held = false;

const hub_context_t &hub_context()
{
    return context;
}

static enum peripheral_state_t to_event_state(const ConnectionState &state)
{
    return std::visit(overloaded{
                          [](const conn_state::Idle &) { return PERIPHERAL_STATE_IDLE; },
                          [](const conn_state::Scanning &) { return PERIPHERAL_STATE_SCANNING; },
                          [](const conn_state::Connecting &) { return PERIPHERAL_STATE_CONNECTING; },
                          [](const conn_state::Connected &) { return PERIPHERAL_STATE_CONNECTED; },
                          [](const conn_state::Disconnecting &) { return PERIPHERAL_STATE_DISCONNECTING; },
                          [](const conn_state::Error &) { return PERIPHERAL_STATE_ERROR; },
                      },
                      state);
}

// Runs on hub_work_q
static void on_connection_state(const ConnectionState *state)
{
    struct peripheral_state_event *event = new_peripheral_state_event();
    event->state = to_event_state(*state);
    event->fault = 0;
    if (const conn_state::Error *error = std::get_if<conn_state::Error>(state))
    {
        event->fault = (int)error->fault;
    }
    APP_EVENT_SUBMIT(event);

    bool had_link = link_held;
    link_held = connection_state_has_link(*state);

    // Quick workouts sample the peripheral, they end with the link
    if (had_link && !link_held && context.tracker)
    {
        context.tracker->onPeripheralDisconnected();
    }
}

static void on_telemetry(const TelemetrySnapshot *snapshot)
{
    struct telemetry_event *event = new_telemetry_event();

    event->has_heart_rate = snapshot->heart_rate_bpm.has_value();
    event->heart_rate_bpm = snapshot->heart_rate_bpm.value_or(0);
    event->has_temperature = snapshot->temperature_c.has_value();
    event->temperature_centi_c = (int32_t)(snapshot->temperature_c.value_or(0.0f) * 100.0f);
    event->has_humidity = snapshot->humidity_percent.has_value();
    event->humidity_centi_percent = (int32_t)(snapshot->humidity_percent.value_or(0.0f) * 100.0f);
    event->has_steps = snapshot->cumulative_steps.has_value();
    event->cumulative_steps = snapshot->cumulative_steps.value_or(0);

    APP_EVENT_SUBMIT(event);
}

static err_t hub_init()
{
    err_t result = err_t::NO_ERROR;

    err_t storage = storage_init();
    if (storage != err_t::NO_ERROR)
    {
        // History still works in memory, saves will be counted as failed
        LOG_ERR("Storage unavailable: %s", err_to_str(storage));
    }

    int err = bt_enable(NULL);
    if (err)
    {
        // The session reports the adapter as off on every intent
        LOG_ERR("Bluetooth init failed (err %d)", err);
        result = err_t::BLUETOOTH_ERROR;
    }
    else if (IS_ENABLED(CONFIG_BT_SETTINGS))
    {
        err = settings_load();
        if (err)
        {
            LOG_WRN("settings_load() failed (err %d)", err);
        }
    }

    k_work_queue_init(&hub_work_q);
    k_work_queue_start(&hub_work_q, hub_workq_stack, K_THREAD_STACK_SIZEOF(hub_workq_stack), hub_priority, NULL);
    k_thread_name_set(&hub_work_q.thread, "hub_wq");

    static ZephyrGattTransport transport;
    static ZephyrAdapterGate gate;
    static TelemetrySink telemetry;
    static PeripheralSession session(transport, gate, telemetry, &hub_work_q);
    static FsWorkoutStore store(workout_dir_path);
    static WorkoutHistory history(store, CONFIG_SMARTGYM_USER_ID);
    static WorkoutTracker tracker(telemetry, session, history, get_current_epoch_ms, &hub_work_q);

    telemetry.setObserver(on_telemetry);
    session.setStateObserver(on_connection_state);

    err = history.load(CONFIG_SMARTGYM_USER_ID);
    if (err)
    {
        LOG_WRN("Workout history not loaded (err %d)", err);
    }

    context.session = &session;
    context.telemetry = &telemetry;
    context.tracker = &tracker;
    context.history = &history;
    context.gate = &gate;

    LOG_INF("Hub ready, %u workouts in history for %s", (unsigned)history.size(), CONFIG_SMARTGYM_USER_ID);
    return result;
}

static bool app_event_handler(const struct app_event_header *aeh)
{
    if (is_module_state_event(aeh))
    {
        auto *event = cast_module_state_event(aeh);

        if (check_state(event, MODULE_ID(main), MODULE_STATE_READY))
        {
            err_t init = hub_init();
            if (init != err_t::NO_ERROR)
            {
                module_set_state(MODULE_STATE_ERROR);
            }
            else
            {
                module_set_state(MODULE_STATE_READY);
            }
        }
        return false;
    }
    return false;
}

APP_EVENT_LISTENER(MODULE, app_event_handler);
APP_EVENT_SUBSCRIBE_FINAL(MODULE, module_state_event);
