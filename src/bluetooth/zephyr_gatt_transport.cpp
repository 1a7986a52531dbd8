/**
 * @file zephyr_gatt_transport.cpp
 * @brief GattTransport on top of the Zephyr Bluetooth host
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE zephyr_gatt_transport

#include <cstring>
#include <errno.h>

#include <zephyr/bluetooth/hci.h>
#include <zephyr/bluetooth/uuid.h>
#include <zephyr/logging/log.h>

#include "zephyr_gatt_transport.hpp"

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_BLUETOOTH_LOG_LEVEL); // NOLINT

static struct bt_uuid_128 nanohr_service_uuid = BT_UUID_INIT_128(NANOHR_SERVICE_UUID_VAL);

// Indexed by NanoHrChar
static struct bt_uuid_128 nanohr_char_uuids[NANOHR_CHAR_COUNT] = {
    BT_UUID_INIT_128(NANOHR_HR_CHAR_UUID_VAL),      BT_UUID_INIT_128(NANOHR_TEMP_CHAR_UUID_VAL),
    BT_UUID_INIT_128(NANOHR_HUM_CHAR_UUID_VAL),     BT_UUID_INIT_128(NANOHR_CONTROL_CHAR_UUID_VAL),
    BT_UUID_INIT_128(NANOHR_STEPS_CHAR_UUID_VAL),
};

static const struct bt_conn_le_create_param create_param = {
    .options = BT_CONN_LE_OPT_NONE,
    .interval = BT_GAP_SCAN_FAST_INTERVAL,
    .window = BT_GAP_SCAN_FAST_WINDOW,
    .interval_coded = 0,
    .window_coded = 0,
    .timeout = 0,
};

static const struct bt_le_conn_param conn_param = {
    .interval_min = BT_GAP_INIT_CONN_INT_MIN,
    .interval_max = BT_GAP_INIT_CONN_INT_MAX,
    .latency = 0,
    .timeout = 400,
};

static ZephyrGattTransport *instance = nullptr;

BT_CONN_CB_DEFINE(gatt_transport_conn_callbacks) = {
    .connected = ZephyrGattTransport::onConnected,
    .disconnected = ZephyrGattTransport::onDisconnected,
#if defined(CONFIG_BT_SMP)
    .security_changed = ZephyrGattTransport::onSecurityChanged,
#endif
};

struct adv_scan_result_t
{
    bool has_service;
    char name[BT_GAP_ADV_MAX_ADV_DATA_LEN + 1];
};

static bool parse_adv_field(struct bt_data *data, void *user_data)
{
    adv_scan_result_t *result = static_cast<adv_scan_result_t *>(user_data);

    switch (data->type)
    {
        case BT_DATA_UUID128_ALL:
        case BT_DATA_UUID128_SOME:
            for (size_t i = 0; i + 16 <= data->data_len; i += 16)
            {
                if (memcmp(&data->data[i], nanohr_service_uuid.val, 16) == 0)
                {
                    result->has_service = true;
                }
            }
            break;

        case BT_DATA_NAME_COMPLETE:
        case BT_DATA_NAME_SHORTENED: {
            size_t len = MIN((size_t)data->data_len, sizeof(result->name) - 1);
            memcpy(result->name, data->data, len);
            result->name[len] = '\0';
            break;
        }

        default:
            break;
    }
    return true;
}

// Accepts "AA:BB:CC:DD:EE:FF" or the "AA:BB:CC:DD:EE:FF (random)" form printed while scanning
static int parse_address(const char *address, bt_addr_le_t *addr)
{
    if (!address)
    {
        return -EINVAL;
    }

    const char *paren = strchr(address, '(');
    size_t mac_len = paren ? (size_t)(paren - address) : strlen(address);
    while (mac_len > 0 && address[mac_len - 1] == ' ')
    {
        mac_len--;
    }
    if (mac_len != BT_ADDR_STR_LEN - 1)
    {
        return -EINVAL;
    }

    char mac[BT_ADDR_STR_LEN];
    memcpy(mac, address, mac_len);
    mac[mac_len] = '\0';

    char type[12] = "random";
    if (paren)
    {
        const char *end = strchr(paren, ')');
        size_t type_len = end ? (size_t)(end - paren - 1) : 0;
        if (type_len == 0 || type_len >= sizeof(type))
        {
            return -EINVAL;
        }
        memcpy(type, paren + 1, type_len);
        type[type_len] = '\0';
    }

    return bt_addr_le_from_str(mac, type, addr) ? -EINVAL : 0;
}

ZephyrGattTransport::ZephyrGattTransport()
    : listener(nullptr), link_conn(nullptr), discovery_state(DISCOVER_COMPLETE), discover_params(), value_handles(),
      resolved_mask(0), read_slots(), write_slots(), subscribe_slots()
{
    k_mutex_init(&link_mutex);
    atomic_clear(&link_up);
    atomic_clear(&closing);

    for (size_t i = 0; i < NANOHR_CHAR_COUNT; i++)
    {
        read_slots[i].chr = static_cast<NanoHrChar>(i);
        write_slots[i].chr = static_cast<NanoHrChar>(i);
        subscribe_slots[i].chr = static_cast<NanoHrChar>(i);
    }

    instance = this;
}

ZephyrGattTransport::~ZephyrGattTransport()
{
    close();
    instance = nullptr;
}

void ZephyrGattTransport::setListener(TransportListener *transport_listener)
{
    listener = transport_listener;
}

/********************************** SCANNING **********************************/

int ZephyrGattTransport::startScan()
{
    struct bt_le_scan_param scan_param = {
        .type = BT_HCI_LE_SCAN_ACTIVE,
        .options = BT_LE_SCAN_OPT_NONE,
        .interval = 0x0010,
        .window = 0x0010,
        .timeout = 0,
        .interval_coded = 0,
        .window_coded = 0,
    };

    int err = bt_le_scan_start(&scan_param, deviceFound);
    if (err == -EALREADY)
    {
        return 0;
    }
    if (err)
    {
        LOG_ERR("Failed to start scanning: %d", err);
        return err;
    }

    LOG_INF("Scanning started");
    return 0;
}

int ZephyrGattTransport::stopScan()
{
    int err = bt_le_scan_stop();
    if (err && err != -EALREADY)
    {
        LOG_ERR("Failed to stop scan: %d", err);
        return err;
    }
    return 0;
}

void ZephyrGattTransport::deviceFound(const bt_addr_le_t *addr, int8_t rssi, uint8_t type, struct net_buf_simple *ad)
{
    ARG_UNUSED(type);

    ZephyrGattTransport *self = instance;
    if (!self || !self->listener || !ad)
    {
        return;
    }

    adv_scan_result_t result = {};
    bt_data_parse(ad, parse_adv_field, &result);
    if (!result.has_service)
    {
        return;
    }

    char addr_str[BT_ADDR_LE_STR_LEN];
    bt_addr_le_to_str(addr, addr_str, sizeof(addr_str));
    LOG_DBG("NanoHR advertiser %s, RSSI %d", addr_str, rssi);

    self->listener->onDeviceFound(addr_str, result.name[0] != '\0' ? result.name : nullptr);
}

/********************************* CONNECTION *********************************/

int ZephyrGattTransport::connect(const char *address)
{
    bt_addr_le_t addr;
    int err = parse_address(address, &addr);
    if (err)
    {
        LOG_WRN("Cannot parse address %s", address ? address : "(null)");
        return err;
    }

    k_mutex_lock(&link_mutex, K_FOREVER);
    if (link_conn)
    {
        // Previous link still winding down
        k_mutex_unlock(&link_mutex);
        return -EBUSY;
    }

    struct bt_conn *conn = nullptr;
    err = bt_conn_le_create(&addr, &create_param, &conn_param, &conn);
    if (err)
    {
        k_mutex_unlock(&link_mutex);
        LOG_ERR("Failed to create connection: %d", err);
        return err;
    }

    link_conn = conn;
    atomic_clear(&closing);
    atomic_clear(&link_up);
    resetHandles();
    k_mutex_unlock(&link_mutex);

    LOG_INF("Connection initiated to %s", address);
    return 0;
}

int ZephyrGattTransport::disconnect()
{
    struct bt_conn *conn = takeConnRef();
    if (!conn)
    {
        return -ENOTCONN;
    }

    int err = bt_conn_disconnect(conn, BT_HCI_ERR_REMOTE_USER_TERM_CONN);
    bt_conn_unref(conn);
    if (err)
    {
        LOG_ERR("Disconnect failed: %d", err);
    }
    return err;
}

void ZephyrGattTransport::close()
{
    k_mutex_lock(&link_mutex, K_FOREVER);
    if (!link_conn)
    {
        k_mutex_unlock(&link_mutex);
        return;
    }

    atomic_set(&closing, 1);
    atomic_clear(&link_up);

    int err = bt_conn_disconnect(link_conn, BT_HCI_ERR_REMOTE_USER_TERM_CONN);
    if (err)
    {
        // No disconnected callback will follow, release the link here
        LOG_DBG("Close without disconnect: %d", err);
        bt_conn_unref(link_conn);
        link_conn = nullptr;
        atomic_clear(&closing);
        resetHandles();
    }
    k_mutex_unlock(&link_mutex);
}

bool ZephyrGattTransport::isLinkUp() const
{
    return atomic_get(&link_up) != 0;
}

void ZephyrGattTransport::onConnected(struct bt_conn *conn, uint8_t err)
{
    ZephyrGattTransport *self = instance;
    if (!self || !self->isOurs(conn))
    {
        return;
    }

    if (err)
    {
        k_mutex_lock(&self->link_mutex, K_FOREVER);
        bt_conn_unref(self->link_conn);
        self->link_conn = nullptr;
        k_mutex_unlock(&self->link_mutex);

        if (atomic_cas(&self->closing, 1, 0))
        {
            return;
        }

        LOG_WRN("Connection failed (err 0x%02x)", err);
        if (self->listener)
        {
            self->listener->onConnectionChanged(err, false);
        }
        return;
    }

    atomic_set(&self->link_up, 1);
    LOG_INF("Link up");
    if (self->listener)
    {
        self->listener->onConnectionChanged(0, true);
    }
}

void ZephyrGattTransport::onDisconnected(struct bt_conn *conn, uint8_t reason)
{
    ZephyrGattTransport *self = instance;
    if (!self || !self->isOurs(conn))
    {
        return;
    }

    k_mutex_lock(&self->link_mutex, K_FOREVER);
    atomic_clear(&self->link_up);
    bt_conn_unref(self->link_conn);
    self->link_conn = nullptr;
    self->resetHandles();
    k_mutex_unlock(&self->link_mutex);

    if (atomic_cas(&self->closing, 1, 0))
    {
        LOG_DBG("Closed link released (reason 0x%02x)", reason);
        return;
    }

    LOG_INF("Disconnected (reason 0x%02x)", reason);

    // A requested or peer initiated teardown is a clean disconnect
    int status = (reason == BT_HCI_ERR_REMOTE_USER_TERM_CONN || reason == BT_HCI_ERR_LOCAL_HOST_TERM_CONN) ? 0 : reason;
    if (self->listener)
    {
        self->listener->onConnectionChanged(status, false);
    }
}

void ZephyrGattTransport::onSecurityChanged(struct bt_conn *conn, bt_security_t level, enum bt_security_err err)
{
    ZephyrGattTransport *self = instance;
    if (!self || !self->isOurs(conn))
    {
        return;
    }

    if (err == BT_SECURITY_ERR_SUCCESS)
    {
        LOG_INF("Security level %u", level);
        return;
    }

    LOG_ERR("Security failed: level %u err %d", level, err);
    if (self->listener && !atomic_get(&self->closing))
    {
        self->listener->onSecurityFailed((int)err);
    }
}

/********************************** DISCOVERY *********************************/

int ZephyrGattTransport::discover()
{
    struct bt_conn *conn = takeConnRef();
    if (!conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&link_mutex, K_FOREVER);
    memset(value_handles, 0, sizeof(value_handles));
    resolved_mask = 0;
    discovery_state = DISCOVER_SERVICE;
    k_mutex_unlock(&link_mutex);

    discover_params.uuid = &nanohr_service_uuid.uuid;
    discover_params.func = discoverFunc;
    discover_params.start_handle = BT_ATT_FIRST_ATTRIBUTE_HANDLE;
    discover_params.end_handle = BT_ATT_LAST_ATTRIBUTE_HANDLE;
    discover_params.type = BT_GATT_DISCOVER_PRIMARY;

    int err = bt_gatt_discover(conn, &discover_params);
    bt_conn_unref(conn);
    if (err)
    {
        LOG_ERR("Failed to start service discovery: %d", err);
    }
    return err;
}

uint8_t ZephyrGattTransport::discoverFunc(struct bt_conn *conn, const struct bt_gatt_attr *attr,
                                          struct bt_gatt_discover_params *params)
{
    ZephyrGattTransport *self = instance;
    if (!self || atomic_get(&self->closing))
    {
        return BT_GATT_ITER_STOP;
    }

    if (!attr)
    {
        if (self->discovery_state == DISCOVER_SERVICE)
        {
            LOG_WRN("NanoHR service not found");
            self->discovery_state = DISCOVER_COMPLETE;
            if (self->listener)
            {
                self->listener->onServicesResolved(0, false, 0);
            }
        }
        else if (self->discovery_state == DISCOVER_CHARACTERISTICS)
        {
            LOG_INF("Discovery complete, characteristic mask 0x%02x", self->resolved_mask);
            self->discovery_state = DISCOVER_COMPLETE;
            if (self->listener)
            {
                self->listener->onServicesResolved(0, true, self->resolved_mask);
            }
        }
        return BT_GATT_ITER_STOP;
    }

    if (self->discovery_state == DISCOVER_SERVICE)
    {
        const struct bt_gatt_service_val *service = (const struct bt_gatt_service_val *)attr->user_data;
        LOG_DBG("NanoHR service at handle %u", attr->handle);

        self->discovery_state = DISCOVER_CHARACTERISTICS;
        params->uuid = NULL;
        params->start_handle = attr->handle + 1;
        params->end_handle = service->end_handle;
        params->type = BT_GATT_DISCOVER_CHARACTERISTIC;

        int err = bt_gatt_discover(conn, params);
        if (err)
        {
            LOG_ERR("Failed to start characteristic discovery: %d", err);
            self->discovery_state = DISCOVER_COMPLETE;
            if (self->listener)
            {
                self->listener->onServicesResolved(err, false, 0);
            }
        }
        return BT_GATT_ITER_STOP;
    }

    if (self->discovery_state == DISCOVER_CHARACTERISTICS)
    {
        const struct bt_gatt_chrc *chrc = (const struct bt_gatt_chrc *)attr->user_data;
        for (size_t i = 0; i < NANOHR_CHAR_COUNT; i++)
        {
            if (bt_uuid_cmp(chrc->uuid, &nanohr_char_uuids[i].uuid) == 0)
            {
                NanoHrChar chr = static_cast<NanoHrChar>(i);
                self->value_handles[i] = chrc->value_handle;
                self->resolved_mask |= nanohr_char_bit(chr);
                LOG_DBG("%s at handle %u", nanohr_char_name(chr), chrc->value_handle);
                break;
            }
        }
    }
    return BT_GATT_ITER_CONTINUE;
}

/****************************** GATT OPERATIONS *******************************/

int ZephyrGattTransport::enableNotifications(NanoHrChar chr)
{
    size_t idx = (size_t)chr;
    if (idx >= NANOHR_CHAR_COUNT)
    {
        return -EINVAL;
    }

    struct bt_conn *conn = takeConnRef();
    if (!conn)
    {
        return -ENOTCONN;
    }

    uint16_t handle = value_handles[idx];
    if (handle == 0)
    {
        bt_conn_unref(conn);
        return -ENOENT;
    }

    struct bt_gatt_subscribe_params *params = &subscribe_slots[idx].params;
    memset(params, 0, sizeof(*params));
    params->notify = notifyFunc;
    params->subscribe = subscribeFunc;
    params->value = BT_GATT_CCC_NOTIFY;
    params->value_handle = handle;
    // The NanoHR firmware places each CCCD right after its value attribute
    params->ccc_handle = handle + 1;
#if defined(CONFIG_BT_SMP)
    params->min_security = BT_SECURITY_L1;
#endif

    int err = bt_gatt_subscribe(conn, params);
    bt_conn_unref(conn);
    if (err == -EALREADY)
    {
        return 0;
    }
    if (err)
    {
        LOG_ERR("Subscribe to %s failed: %d", nanohr_char_name(chr), err);
    }
    return err;
}

void ZephyrGattTransport::subscribeFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_subscribe_params *params)
{
    ARG_UNUSED(conn);
    subscribe_slot_t *slot = CONTAINER_OF(params, subscribe_slot_t, params);
    if (err)
    {
        LOG_ERR("Subscribe to %s rejected (err %u)", nanohr_char_name(slot->chr), err);
    }
    else
    {
        LOG_INF("Notifications enabled on %s", nanohr_char_name(slot->chr));
    }
}

uint8_t ZephyrGattTransport::notifyFunc(struct bt_conn *conn, struct bt_gatt_subscribe_params *params,
                                        const void *data, uint16_t length)
{
    if (!data)
    {
        params->value_handle = 0;
        return BT_GATT_ITER_STOP;
    }

    ZephyrGattTransport *self = instance;
    if (!self || atomic_get(&self->closing) || !self->isOurs(conn))
    {
        return BT_GATT_ITER_CONTINUE;
    }

    subscribe_slot_t *slot = CONTAINER_OF(params, subscribe_slot_t, params);
    if (self->listener)
    {
        self->listener->onNotification(slot->chr, static_cast<const uint8_t *>(data), length);
    }
    return BT_GATT_ITER_CONTINUE;
}

int ZephyrGattTransport::read(NanoHrChar chr)
{
    size_t idx = (size_t)chr;
    if (idx >= NANOHR_CHAR_COUNT)
    {
        return -EINVAL;
    }

    read_slot_t &slot = read_slots[idx];
    if (!atomic_cas(&slot.busy, 0, 1))
    {
        return -EBUSY;
    }

    struct bt_conn *conn = takeConnRef();
    if (!conn || value_handles[idx] == 0)
    {
        if (conn)
        {
            bt_conn_unref(conn);
        }
        atomic_clear(&slot.busy);
        return conn ? -ENOENT : -ENOTCONN;
    }

    memset(&slot.params, 0, sizeof(slot.params));
    slot.params.func = readFunc;
    slot.params.handle_count = 1;
    slot.params.single.handle = value_handles[idx];
    slot.params.single.offset = 0;

    int err = bt_gatt_read(conn, &slot.params);
    bt_conn_unref(conn);
    if (err)
    {
        atomic_clear(&slot.busy);
        LOG_ERR("Read of %s failed: %d", nanohr_char_name(chr), err);
    }
    return err;
}

uint8_t ZephyrGattTransport::readFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_read_params *params,
                                      const void *data, uint16_t length)
{
    read_slot_t *slot = CONTAINER_OF(params, read_slot_t, params);
    atomic_clear(&slot->busy);

    ZephyrGattTransport *self = instance;
    if (!self || atomic_get(&self->closing) || !self->isOurs(conn) || !self->listener)
    {
        return BT_GATT_ITER_STOP;
    }

    // NanoHR values fit a single ATT response
    self->listener->onReadComplete(slot->chr, err, static_cast<const uint8_t *>(data), data ? length : 0);
    return BT_GATT_ITER_STOP;
}

int ZephyrGattTransport::write(NanoHrChar chr, const uint8_t *data, size_t len)
{
    size_t idx = (size_t)chr;
    if (idx >= NANOHR_CHAR_COUNT || !data)
    {
        return -EINVAL;
    }

    write_slot_t &slot = write_slots[idx];
    if (len > sizeof(slot.data))
    {
        return -EMSGSIZE;
    }
    if (!atomic_cas(&slot.busy, 0, 1))
    {
        return -EBUSY;
    }

    struct bt_conn *conn = takeConnRef();
    if (!conn || value_handles[idx] == 0)
    {
        if (conn)
        {
            bt_conn_unref(conn);
        }
        atomic_clear(&slot.busy);
        return conn ? -ENOENT : -ENOTCONN;
    }

    memcpy(slot.data, data, len);
    memset(&slot.params, 0, sizeof(slot.params));
    slot.params.func = writeFunc;
    slot.params.handle = value_handles[idx];
    slot.params.offset = 0;
    slot.params.data = slot.data;
    slot.params.length = len;

    int err = bt_gatt_write(conn, &slot.params);
    bt_conn_unref(conn);
    if (err)
    {
        atomic_clear(&slot.busy);
        LOG_ERR("Write to %s failed: %d", nanohr_char_name(chr), err);
    }
    return err;
}

void ZephyrGattTransport::writeFunc(struct bt_conn *conn, uint8_t err, struct bt_gatt_write_params *params)
{
    write_slot_t *slot = CONTAINER_OF(params, write_slot_t, params);
    atomic_clear(&slot->busy);

    ZephyrGattTransport *self = instance;
    if (!self || atomic_get(&self->closing) || !self->isOurs(conn) || !self->listener)
    {
        return;
    }
    self->listener->onWriteComplete(slot->chr, err);
}

/********************************** HELPERS ***********************************/

bool ZephyrGattTransport::isOurs(struct bt_conn *conn)
{
    k_mutex_lock(&link_mutex, K_FOREVER);
    bool ours = conn && conn == link_conn;
    k_mutex_unlock(&link_mutex);
    return ours;
}

struct bt_conn *ZephyrGattTransport::takeConnRef()
{
    k_mutex_lock(&link_mutex, K_FOREVER);
    struct bt_conn *conn = link_conn ? bt_conn_ref(link_conn) : nullptr;
    k_mutex_unlock(&link_mutex);
    return conn;
}

// Called with link_mutex held
void ZephyrGattTransport::resetHandles()
{
    memset(value_handles, 0, sizeof(value_handles));
    resolved_mask = 0;
    discovery_state = DISCOVER_COMPLETE;
    for (size_t i = 0; i < NANOHR_CHAR_COUNT; i++)
    {
        atomic_clear(&read_slots[i].busy);
        atomic_clear(&write_slots[i].busy);
    }
}
