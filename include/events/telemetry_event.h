#ifndef APP_INCLUDE_TELEMETRY_EVENT_H_
#define APP_INCLUDE_TELEMETRY_EVENT_H_

#include <stdbool.h>
#include <stdint.h>

#include <app_event_manager.h>

#ifdef __cplusplus
extern "C"
{
#endif

struct telemetry_event
{
    struct app_event_header header;

    bool has_heart_rate;
    bool has_temperature;
    bool has_humidity;
    bool has_steps;
    int32_t heart_rate_bpm;
    // Hundredths, as sent by the peripheral
    int32_t temperature_centi_c;
    int32_t humidity_centi_percent;
    int64_t cumulative_steps;
};

APP_EVENT_TYPE_DECLARE(telemetry_event);

#ifdef __cplusplus
}
#endif

#endif // APP_INCLUDE_TELEMETRY_EVENT_H_
