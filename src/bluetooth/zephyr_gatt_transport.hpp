/**
 * @file zephyr_gatt_transport.hpp
 * @brief GattTransport on top of the Zephyr Bluetooth host
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_SRC_BLUETOOTH_ZEPHYR_GATT_TRANSPORT_HEADER_
#define APP_SRC_BLUETOOTH_ZEPHYR_GATT_TRANSPORT_HEADER_

#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/bluetooth/conn.h>
#include <zephyr/bluetooth/gatt.h>
#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <gatt_transport.hpp>

static constexpr size_t GATT_WRITE_MAX_LEN = 20;

/**
 * @brief Central role client for a single NanoHR peripheral.
 *
 * The host delivers connection callbacks to every registered listener, so
 * only one instance may exist. Callbacks reach the TransportListener on the
 * Bluetooth RX thread.
 */
class ZephyrGattTransport : public GattTransport
{
public:
    ZephyrGattTransport();
    ~ZephyrGattTransport() override;

    ZephyrGattTransport(const ZephyrGattTransport &) = delete;
    ZephyrGattTransport &operator=(const ZephyrGattTransport &) = delete;

    void setListener(TransportListener *transport_listener) override;

    int startScan() override;
    int stopScan() override;

    int connect(const char *address) override;
    int disconnect() override;
    void close() override;
    bool isLinkUp() const override;

    int discover() override;
    int enableNotifications(NanoHrChar chr) override;
    int write(NanoHrChar chr, const uint8_t *data, size_t len) override;
    int read(NanoHrChar chr) override;

    // Host connection callbacks, routed here from BT_CONN_CB_DEFINE
    static void onConnected(struct bt_conn *conn, uint8_t err);
    static void onDisconnected(struct bt_conn *conn, uint8_t reason);
    static void onSecurityChanged(struct bt_conn *conn, bt_security_t level, enum bt_security_err err);

private:
    enum discover_state_t
    {
        DISCOVER_SERVICE,
        DISCOVER_CHARACTERISTICS,
        DISCOVER_COMPLETE,
    };

    struct read_slot_t
    {
        struct bt_gatt_read_params params;
        NanoHrChar chr;
        atomic_t busy;
    };

    struct write_slot_t
    {
        struct bt_gatt_write_params params;
        NanoHrChar chr;
        atomic_t busy;
        uint8_t data[GATT_WRITE_MAX_LEN];
    };

    struct subscribe_slot_t
    {
        struct bt_gatt_subscribe_params params;
        NanoHrChar chr;
    };

    static void deviceFound(const bt_addr_le_t *addr, int8_t rssi, uint8_t type, struct net_buf_simple *ad);
    static uint8_t discoverFunc(struct bt_conn *conn, const struct bt_gatt_attr *attr,
                                struct bt_gatt_discover_params *params);
    static uint8_t readFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_read_params *params, const void *data,
                            uint16_t length);
    static void writeFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_write_params *params);
    static uint8_t notifyFunc(struct bt_conn *conn, struct bt_gatt_subscribe_params *params, const void *data,
                              uint16_t length);
    static void subscribeFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_subscribe_params *params);

    bool isOurs(struct bt_conn *conn);
    struct bt_conn *takeConnRef();
    void resetHandles();

    TransportListener *listener;

    mutable struct k_mutex link_mutex;
    struct bt_conn *link_conn;
    atomic_t link_up;
    atomic_t closing;

    discover_state_t discovery_state;
    struct bt_gatt_discover_params discover_params;
    uint16_t value_handles[NANOHR_CHAR_COUNT];
    uint8_t resolved_mask;

    read_slot_t read_slots[NANOHR_CHAR_COUNT];
    write_slot_t write_slots[NANOHR_CHAR_COUNT];
    subscribe_slot_t subscribe_slots[NANOHR_CHAR_COUNT];
};

#endif // APP_SRC_BLUETOOTH_ZEPHYR_GATT_TRANSPORT_HEADER_
