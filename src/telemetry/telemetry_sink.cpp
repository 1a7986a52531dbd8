/**
 * @file telemetry_sink.cpp
 * @brief Last-value-wins store for live peripheral telemetry
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <stdlib.h>

#include <zephyr/logging/log.h>

#include <telemetry_sink.hpp>

LOG_MODULE_REGISTER(telemetry_sink, CONFIG_SMARTGYM_BLUETOOTH_LOG_LEVEL);

TelemetrySink::TelemetrySink() : current(), observer(nullptr)
{
    k_mutex_init(&sink_mutex);
}

void TelemetrySink::updateHeartRate(int bpm)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    current.heart_rate_bpm = bpm;
    TelemetrySnapshot copy = current;
    k_mutex_unlock(&sink_mutex);

    LOG_DBG("Heart rate %d bpm", bpm);
    publish(copy);
}

void TelemetrySink::updateTemperature(float celsius)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    current.temperature_c = celsius;
    TelemetrySnapshot copy = current;
    k_mutex_unlock(&sink_mutex);

    LOG_DBG("Temperature %d.%02d C", (int)celsius, abs((int)(celsius * 100)) % 100);
    publish(copy);
}

void TelemetrySink::updateHumidity(float percent)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    current.humidity_percent = percent;
    TelemetrySnapshot copy = current;
    k_mutex_unlock(&sink_mutex);

    LOG_DBG("Humidity %d.%02d %%", (int)percent, abs((int)(percent * 100)) % 100);
    publish(copy);
}

void TelemetrySink::updateSteps(int64_t cumulative_steps)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    current.cumulative_steps = cumulative_steps;
    TelemetrySnapshot copy = current;
    k_mutex_unlock(&sink_mutex);

    LOG_DBG("Cumulative steps %lld", (long long)cumulative_steps);
    publish(copy);
}

TelemetrySnapshot TelemetrySink::snapshot() const
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    TelemetrySnapshot copy = current;
    k_mutex_unlock(&sink_mutex);
    return copy;
}

std::optional<int> TelemetrySink::heartRate() const
{
    return snapshot().heart_rate_bpm;
}

std::optional<int64_t> TelemetrySink::cumulativeSteps() const
{
    return snapshot().cumulative_steps;
}

void TelemetrySink::setObserver(telemetry_observer_t new_observer)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    observer = new_observer;
    k_mutex_unlock(&sink_mutex);
}

void TelemetrySink::publish(const TelemetrySnapshot &copy)
{
    k_mutex_lock(&sink_mutex, K_FOREVER);
    telemetry_observer_t cb = observer;
    k_mutex_unlock(&sink_mutex);

    if (cb)
    {
        cb(&copy);
    }
}
