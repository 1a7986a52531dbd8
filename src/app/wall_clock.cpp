/**
 * @file wall_clock.cpp
 * @brief Unix epoch time kept from a host supplied sync point
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE wall_clock

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <wall_clock.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_WORKOUT_LOG_LEVEL); // NOLINT

// Epoch time in ms at uptime 0, from the last synchronisation
static int64_t epoch_offset_ms = (int64_t)CONFIG_SMARTGYM_DEFAULT_EPOCH_S * 1000;
static bool synced = false;
K_MUTEX_DEFINE(wall_clock_mutex);

void set_current_time_from_epoch(uint32_t new_epoch_time_s)
{
    k_mutex_lock(&wall_clock_mutex, K_FOREVER);
    epoch_offset_ms = (int64_t)new_epoch_time_s * 1000 - k_uptime_get();
    synced = true;
    k_mutex_unlock(&wall_clock_mutex);

    LOG_INF("Wall clock synced to %u", new_epoch_time_s);
}

int64_t get_current_epoch_ms(void)
{
    k_mutex_lock(&wall_clock_mutex, K_FOREVER);
    int64_t offset = epoch_offset_ms;
    k_mutex_unlock(&wall_clock_mutex);

    return offset + k_uptime_get();
}

bool wall_clock_is_synced(void)
{
    k_mutex_lock(&wall_clock_mutex, K_FOREVER);
    bool result = synced;
    k_mutex_unlock(&wall_clock_mutex);
    return result;
}
