/**
 * @file zephyr_adapter_gate.cpp
 * @brief Adapter state and user consent checks for the Zephyr host
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE zephyr_adapter_gate

#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/logging/log.h>

#include "zephyr_adapter_gate.hpp"

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_BLUETOOTH_LOG_LEVEL); // NOLINT

ZephyrAdapterGate::ZephyrAdapterGate()
{
    atomic_set(&scan_granted, IS_ENABLED(CONFIG_SMARTGYM_SCAN_CONSENT_DEFAULT) ? 1 : 0);
    atomic_set(&connect_granted, IS_ENABLED(CONFIG_SMARTGYM_CONNECT_CONSENT_DEFAULT) ? 1 : 0);
}

bool ZephyrAdapterGate::isAdapterPresent() const
{
    return IS_ENABLED(CONFIG_BT_CENTRAL);
}

bool ZephyrAdapterGate::isAdapterEnabled() const
{
    return bt_is_ready();
}

bool ZephyrAdapterGate::hasScanPermission() const
{
    return atomic_get(&scan_granted) != 0;
}

bool ZephyrAdapterGate::hasConnectPermission() const
{
    return atomic_get(&connect_granted) != 0;
}

void ZephyrAdapterGate::setScanPermission(bool granted)
{
    atomic_set(&scan_granted, granted ? 1 : 0);
    LOG_INF("Scan permission %s", granted ? "granted" : "revoked");
}

void ZephyrAdapterGate::setConnectPermission(bool granted)
{
    atomic_set(&connect_granted, granted ? 1 : 0);
    LOG_INF("Connect permission %s", granted ? "granted" : "revoked");
}
