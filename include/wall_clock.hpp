/**
 * @file wall_clock.hpp
 * @brief Unix epoch time kept from a host supplied sync point
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WALL_CLOCK_HEADER_
#define APP_INCLUDE_WALL_CLOCK_HEADER_

#include <stdint.h>

/**
 * @brief Synchronise the wall clock.
 *
 * @param[in] new_epoch_time_s Seconds since 1970-01-01 00:00:00 UTC.
 */
void set_current_time_from_epoch(uint32_t new_epoch_time_s);

/**
 * @brief Current Unix epoch time in milliseconds.
 *
 * Before the first sync the clock runs from CONFIG_SMARTGYM_DEFAULT_EPOCH_S.
 */
int64_t get_current_epoch_ms(void);

bool wall_clock_is_synced(void);

#endif // APP_INCLUDE_WALL_CLOCK_HEADER_
