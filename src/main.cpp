/**
 * @file main.cpp
 * @brief Fitness hub entry point
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE main

#include <app_event_manager.h>
#include <caf/events/module_state_event.h>
#include <zephyr/drivers/hwinfo.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_HUB_LOG_LEVEL);

struct reset_reason_t
{
    uint32_t flag;
    const char *name;
};

static const reset_reason_t reset_reasons[] = {
    {RESET_POR, "Power-On-Reset"}, {RESET_PIN, "Reset-Pin"},       {RESET_BROWNOUT, "Brownout"},
    {RESET_SOFTWARE, "Software"},  {RESET_WATCHDOG, "Watchdog"},   {RESET_DEBUG, "Debugger"},
    {RESET_CPU_LOCKUP, "CPU-Lockup"}, {RESET_LOW_POWER_WAKE, "Low-Power"},
};

static void log_reset_cause()
{
    uint32_t reset_cause;
    int ret = hwinfo_get_reset_cause(&reset_cause);
    if (ret != 0)
    {
        LOG_WRN("Failed to get reset cause (err %d)", ret);
        return;
    }

    LOG_INF("Reset cause register: 0x%08X", reset_cause);
    for (const reset_reason_t &reason : reset_reasons)
    {
        if (reset_cause & reason.flag)
        {
            LOG_INF("Reset reason: %s", reason.name);
        }
    }
    if (reset_cause == 0)
    {
        LOG_INF("Reset reason: unknown (register cleared)");
    }

    hwinfo_clear_reset_cause();
}

int main(void)
{
    log_reset_cause();

    if (app_event_manager_init() != 0)
    {
        LOG_ERR("Application Event Manager not initialized");
    }
    else
    {
        LOG_INF("Starting up");
        module_set_state(MODULE_STATE_READY);
    }

    while (1)
    {
        k_sleep(K_FOREVER);
    }
}
