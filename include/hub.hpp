/**
 * @file hub.hpp
 * @brief Owns and wires the fitness hub components
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_HUB_HEADER_
#define APP_INCLUDE_HUB_HEADER_

#include <errors.hpp>
#include <peripheral_session.hpp>
#include <telemetry_sink.hpp>
#include <workout_history.hpp>
#include <workout_tracker.hpp>

class ZephyrAdapterGate;

struct hub_context_t
{
    PeripheralSession *session;
    TelemetrySink *telemetry;
    WorkoutTracker *tracker;
    WorkoutHistory *history;
    ZephyrAdapterGate *gate;
};

/**
 * @brief Components of the running hub.
 *
 * All members are null until the hub module reports MODULE_STATE_READY.
 */
const hub_context_t &hub_context();

#endif // APP_INCLUDE_HUB_HEADER_
