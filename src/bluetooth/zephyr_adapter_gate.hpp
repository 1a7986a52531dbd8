/**
 * @file zephyr_adapter_gate.hpp
 * @brief Adapter state and user consent checks for the Zephyr host
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_SRC_BLUETOOTH_ZEPHYR_ADAPTER_GATE_HEADER_
#define APP_SRC_BLUETOOTH_ZEPHYR_ADAPTER_GATE_HEADER_

#include <zephyr/sys/atomic.h>

#include <gatt_transport.hpp>

/**
 * Scan and connect consent start from CONFIG_SMARTGYM_SCAN_CONSENT_DEFAULT and
 * CONFIG_SMARTGYM_CONNECT_CONSENT_DEFAULT and are changed from the shell.
 */
class ZephyrAdapterGate : public AdapterGate
{
public:
    ZephyrAdapterGate();

    bool isAdapterPresent() const override;
    bool isAdapterEnabled() const override;
    bool hasScanPermission() const override;
    bool hasConnectPermission() const override;

    void setScanPermission(bool granted);
    void setConnectPermission(bool granted);

private:
    atomic_t scan_granted;
    atomic_t connect_granted;
};

#endif // APP_SRC_BLUETOOTH_ZEPHYR_ADAPTER_GATE_HEADER_
