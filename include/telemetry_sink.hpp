/**
 * @file telemetry_sink.hpp
 * @brief Last-value-wins store for live peripheral telemetry
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_TELEMETRY_SINK_HEADER_
#define APP_INCLUDE_TELEMETRY_SINK_HEADER_

#include <optional>
#include <stdint.h>

#include <zephyr/kernel.h>

struct TelemetrySnapshot
{
    std::optional<int> heart_rate_bpm;
    std::optional<float> temperature_c;
    std::optional<float> humidity_percent;
    std::optional<int64_t> cumulative_steps;
};

typedef void (*telemetry_observer_t)(const TelemetrySnapshot *snapshot);

class TelemetrySink
{
public:
    TelemetrySink();

    void updateHeartRate(int bpm);
    void updateTemperature(float celsius);
    void updateHumidity(float percent);
    void updateSteps(int64_t cumulative_steps);

    TelemetrySnapshot snapshot() const;
    std::optional<int> heartRate() const;
    std::optional<int64_t> cumulativeSteps() const;

    // Called with a copy of the snapshot after every update, outside the lock
    void setObserver(telemetry_observer_t observer);

private:
    void publish(const TelemetrySnapshot &snapshot);

    mutable struct k_mutex sink_mutex;
    TelemetrySnapshot current;
    telemetry_observer_t observer;
};

#endif // APP_INCLUDE_TELEMETRY_SINK_HEADER_
