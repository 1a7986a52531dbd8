/**
 * @file peripheral_session.cpp
 * @brief Scan, connect and exchange data with one NanoHR peripheral
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE peripheral_session

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <errno.h>

#include <zephyr/logging/log.h>

#include <nanohr_codec.hpp>
#include <peripheral_session.hpp>
#include <util.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_BLUETOOTH_LOG_LEVEL); // NOLINT

static constexpr uint32_t STEP_POLL_INTERVAL_MS = CONFIG_SMARTGYM_STEP_POLL_INTERVAL_MS;
static constexpr size_t MAX_DISCOVERED_DEVICES = CONFIG_SMARTGYM_MAX_DISCOVERED_DEVICES;

PeripheralSession::PeripheralSession(GattTransport &gatt_transport, AdapterGate &adapter_gate,
                                     TelemetrySink &telemetry_sink, struct k_work_q *queue)
    : transport(gatt_transport), gate(adapter_gate), sink(telemetry_sink), work_q(queue), event_msgq(),
      event_msgq_buffer(), event_work(), poll_work(), current_state(conn_state::Idle{}), devices(), session_stats(),
      state_observer(nullptr), poll_active(ATOMIC_INIT(0)), resolved_mask(0), inflight_control_command(0),
      link_requested(false)
{
    k_mutex_init(&state_mutex);
    k_msgq_init(&event_msgq, event_msgq_buffer, sizeof(session_event_t), SESSION_EVENT_QUEUE_DEPTH);

    k_work_init(&event_work.work, eventWorkHandler);
    event_work.owner = this;
    k_work_init_delayable(&poll_work.dwork, pollWorkHandler);
    poll_work.owner = this;

    transport.setListener(this);
}

PeripheralSession::~PeripheralSession()
{
    transport.setListener(nullptr);

    struct k_work_sync sync;
    k_work_cancel_delayable_sync(&poll_work.dwork, &sync);
    k_work_cancel_sync(&event_work.work, &sync);
    k_msgq_purge(&event_msgq);
}

/********************************** INTENTS ***********************************/

int PeripheralSession::startScan()
{
    return postIntent(INTENT_START_SCAN);
}

int PeripheralSession::stopScan()
{
    return postIntent(INTENT_STOP_SCAN);
}

int PeripheralSession::connect(const char *address, const char *name)
{
    if (!address || address[0] == '\0' || strlen(address) >= SESSION_ADDRESS_MAX_LEN)
    {
        return -EINVAL;
    }

    session_event_t evt = {};
    evt.type = INTENT_CONNECT;
    util::copy_string(evt.address, sizeof(evt.address), address);
    if (name && name[0] != '\0')
    {
        evt.has_name = true;
        util::copy_string(evt.name, sizeof(evt.name), name);
    }
    return post(evt);
}

int PeripheralSession::disconnect()
{
    return postIntent(INTENT_DISCONNECT);
}

int PeripheralSession::requestEnvironmentMeasurement()
{
    return postIntent(INTENT_MEASURE_ENV);
}

int PeripheralSession::startImuSession()
{
    return postIntent(INTENT_START_IMU);
}

int PeripheralSession::stopImuSession()
{
    return postIntent(INTENT_STOP_IMU);
}

/******************************** OBSERVATION *********************************/

ConnectionState PeripheralSession::state() const
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    ConnectionState copy = current_state;
    k_mutex_unlock(&state_mutex);
    return copy;
}

std::vector<DiscoveredDevice> PeripheralSession::discoveredDevices() const
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    std::vector<DiscoveredDevice> copy = devices;
    k_mutex_unlock(&state_mutex);
    return copy;
}

SessionStats PeripheralSession::stats() const
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    SessionStats copy = session_stats;
    k_mutex_unlock(&state_mutex);
    return copy;
}

bool PeripheralSession::isPollActive() const
{
    return atomic_get(&poll_active) != 0;
}

void PeripheralSession::setStateObserver(connection_state_observer_t observer)
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    state_observer = observer;
    k_mutex_unlock(&state_mutex);
}

/***************************** TRANSPORT CALLBACKS ****************************/

void PeripheralSession::onDeviceFound(const char *address, const char *name)
{
    if (!address)
    {
        return;
    }

    session_event_t evt = {};
    evt.type = EVT_DEVICE_FOUND;
    util::copy_string(evt.address, sizeof(evt.address), address);
    if (name && name[0] != '\0')
    {
        evt.has_name = true;
        util::copy_string(evt.name, sizeof(evt.name), name);
    }
    (void)post(evt);
}

void PeripheralSession::onScanFailed(int status)
{
    session_event_t evt = {};
    evt.type = EVT_SCAN_FAILED;
    evt.status = status;
    (void)post(evt);
}

void PeripheralSession::onConnectionChanged(int status, bool connected)
{
    session_event_t evt = {};
    evt.type = EVT_CONNECTION;
    evt.status = status;
    evt.flag = connected;
    (void)post(evt);
}

void PeripheralSession::onServicesResolved(int status, bool service_found, uint8_t mask)
{
    session_event_t evt = {};
    evt.type = EVT_SERVICES;
    evt.status = status;
    evt.flag = service_found;
    evt.mask = mask;
    (void)post(evt);
}

void PeripheralSession::onSecurityFailed(int status)
{
    session_event_t evt = {};
    evt.type = EVT_SECURITY;
    evt.status = status;
    (void)post(evt);
}

void PeripheralSession::onWriteComplete(NanoHrChar chr, int status)
{
    session_event_t evt = {};
    evt.type = EVT_WRITE;
    evt.chr = chr;
    evt.status = status;
    (void)post(evt);
}

void PeripheralSession::onReadComplete(NanoHrChar chr, int status, const uint8_t *data, size_t len)
{
    session_event_t evt = {};
    evt.type = EVT_READ;
    evt.chr = chr;
    evt.status = status;
    if (data)
    {
        evt.len = (uint8_t)std::min(len, sizeof(evt.data));
        memcpy(evt.data, data, evt.len);
    }
    (void)post(evt);
}

void PeripheralSession::onNotification(NanoHrChar chr, const uint8_t *data, size_t len)
{
    if (!data)
    {
        return;
    }

    session_event_t evt = {};
    evt.type = EVT_NOTIFY;
    evt.chr = chr;
    evt.len = (uint8_t)std::min(len, sizeof(evt.data));
    memcpy(evt.data, data, evt.len);
    (void)post(evt);
}

/********************************* DISPATCH ***********************************/

int PeripheralSession::postIntent(session_event_type_t type)
{
    session_event_t evt = {};
    evt.type = type;
    return post(evt);
}

int PeripheralSession::post(session_event_t &evt)
{
    int err = k_msgq_put(&event_msgq, &evt, K_NO_WAIT);
    if (err)
    {
        k_mutex_lock(&state_mutex, K_FOREVER);
        session_stats.events_dropped++;
        k_mutex_unlock(&state_mutex);
        LOG_ERR("Session queue full, dropped event %d", evt.type);
        return err;
    }

    k_work_submit_to_queue(work_q, &event_work.work);
    return 0;
}

void PeripheralSession::eventWorkHandler(struct k_work *work)
{
    session_work_t *item = CONTAINER_OF(work, session_work_t, work);
    PeripheralSession *self = item->owner;
    session_event_t evt;

    while (k_msgq_get(&self->event_msgq, &evt, K_NO_WAIT) == 0)
    {
        self->handleEvent(evt);
    }
}

void PeripheralSession::handleEvent(const session_event_t &evt)
{
    switch (evt.type)
    {
        case INTENT_START_SCAN:
            doStartScan();
            break;
        case INTENT_STOP_SCAN:
            doStopScan();
            break;
        case INTENT_CONNECT:
            doConnect(evt);
            break;
        case INTENT_DISCONNECT:
            doDisconnect();
            break;
        case INTENT_MEASURE_ENV:
            doControlCommand(NANOHR_CMD_MEASURE_ENV);
            break;
        case INTENT_START_IMU:
            doControlCommand(NANOHR_CMD_START_IMU);
            break;
        case INTENT_STOP_IMU:
            cancelPoll();
            doControlCommand(NANOHR_CMD_STOP_IMU);
            break;
        case EVT_DEVICE_FOUND:
            handleDeviceFound(evt);
            break;
        case EVT_SCAN_FAILED:
            LOG_ERR("Scan failed: %d", evt.status);
            fail(err_t::SCAN_FAILED, evt.status, "Scan failed: " + std::to_string(evt.status));
            break;
        case EVT_CONNECTION:
            handleConnection(evt.status, evt.flag);
            break;
        case EVT_SERVICES:
            handleServices(evt.status, evt.flag, evt.mask);
            break;
        case EVT_SECURITY:
            LOG_ERR("Link security rejected: %d", evt.status);
            tearDown();
            fail(err_t::TRANSPORT_SECURITY_REJECTED, evt.status,
                 "Security rejected (" + std::to_string(evt.status) + ")");
            break;
        case EVT_WRITE:
            handleWrite(evt.chr, evt.status);
            break;
        case EVT_READ:
            handleRead(evt.chr, evt.status, evt.data, evt.len);
            break;
        case EVT_NOTIFY:
            applyValue(evt.chr, evt.data, evt.len);
            break;
    }
}

/****************************** INTENT HANDLERS *******************************/

bool PeripheralSession::adapterReady()
{
    if (!gate.isAdapterPresent())
    {
        fail(err_t::ADAPTER_UNAVAILABLE, 0, "Bluetooth not supported");
        return false;
    }
    if (!gate.isAdapterEnabled())
    {
        fail(err_t::ADAPTER_UNAVAILABLE, 0, "Bluetooth is off");
        return false;
    }
    return true;
}

void PeripheralSession::doStartScan()
{
    if (connection_state_has_link(state()))
    {
        LOG_WRN("Scan ignored while a peripheral link is held");
        return;
    }
    if (!adapterReady())
    {
        return;
    }
    if (!gate.hasScanPermission())
    {
        fail(err_t::PERMISSION_DENIED, 0, "Scan permission not granted");
        return;
    }

    k_mutex_lock(&state_mutex, K_FOREVER);
    devices.clear();
    k_mutex_unlock(&state_mutex);

    setState(conn_state::Scanning{});

    int err = transport.startScan();
    if (err)
    {
        LOG_ERR("Failed to start scanning: %d", err);
        fail(err_t::SCAN_FAILED, err, "Scan failed: " + std::to_string(err));
        return;
    }
    LOG_INF("Scanning for NanoHR peripherals");
}

void PeripheralSession::doStopScan()
{
    int err = transport.stopScan();
    if (err && err != -EALREADY)
    {
        LOG_WRN("Failed to stop scanning: %d", err);
    }

    if (std::holds_alternative<conn_state::Scanning>(state()))
    {
        setState(conn_state::Idle{});
    }
}

void PeripheralSession::doConnect(const session_event_t &evt)
{
    ConnectionState now = state();
    if (connection_state_has_link(now))
    {
        LOG_WRN("Connect to %s ignored, state is %s", evt.address, connection_state_name(now));
        return;
    }
    if (!adapterReady())
    {
        return;
    }
    if (!gate.hasConnectPermission())
    {
        fail(err_t::PERMISSION_DENIED, 0, "Connect permission not granted");
        return;
    }

    int err = transport.stopScan();
    if (err && err != -EALREADY)
    {
        LOG_WRN("Failed to stop scanning before connect: %d", err);
    }

    resolved_mask = 0;
    pending_address = evt.address;
    pending_name = evt.has_name ? std::optional<std::string>(evt.name) : std::nullopt;
    setState(conn_state::Connecting{pending_name, pending_address});

    err = transport.connect(evt.address);
    if (err == -EINVAL)
    {
        fail(err_t::DEVICE_NOT_FOUND, 0, std::string("Device not found: ") + evt.address);
        return;
    }
    if (err)
    {
        LOG_ERR("Failed to create connection: %d", err);
        fail(err_t::TRANSPORT_ERROR, err, "GATT error: " + std::to_string(err));
        return;
    }

    link_requested = true;
    LOG_INF("Connection initiated to %s", evt.address);
}

void PeripheralSession::doDisconnect()
{
    cancelPoll();

    if (!link_requested && !transport.isLinkUp())
    {
        if (!std::holds_alternative<conn_state::Idle>(state()))
        {
            setState(conn_state::Idle{});
        }
        return;
    }

    if (!gate.hasConnectPermission())
    {
        LOG_WRN("Connect permission missing, closing link directly");
        tearDown();
        setState(conn_state::Idle{});
        return;
    }

    setState(conn_state::Disconnecting{});

    int err = transport.disconnect();
    if (err)
    {
        LOG_WRN("Transport disconnect failed (%d), closing link", err);
        tearDown();
        setState(conn_state::Idle{});
    }
}

void PeripheralSession::doControlCommand(uint8_t command)
{
    if (!connection_state_is_connected(state()) || !isResolved(NanoHrChar::Control) || !transport.isLinkUp())
    {
        LOG_DBG("Command 0x%02x skipped, control channel not ready", command);
        return;
    }
    if (!gate.hasConnectPermission())
    {
        LOG_WRN("Connect permission missing for command 0x%02x", command);
        return;
    }

    int err = transport.write(NanoHrChar::Control, &command, sizeof(command));
    if (err)
    {
        LOG_ERR("Failed to write command 0x%02x: %d", command, err);
        return;
    }
    inflight_control_command = command;

    k_mutex_lock(&state_mutex, K_FOREVER);
    session_stats.writes_issued++;
    k_mutex_unlock(&state_mutex);

    if (command == NANOHR_CMD_START_IMU)
    {
        startPoll();
    }
}

/******************************* EVENT HANDLERS *******************************/

void PeripheralSession::handleDeviceFound(const session_event_t &evt)
{
    if (!std::holds_alternative<conn_state::Scanning>(state()))
    {
        LOG_DBG("Advertisement from %s after scan ended, ignoring", evt.address);
        return;
    }

    k_mutex_lock(&state_mutex, K_FOREVER);
    bool known = std::any_of(devices.begin(), devices.end(),
                             [&evt](const DiscoveredDevice &d) { return d.address == evt.address; });
    bool full = devices.size() >= MAX_DISCOVERED_DEVICES;
    if (!known && !full)
    {
        devices.push_back({evt.has_name ? std::optional<std::string>(evt.name) : std::nullopt, evt.address});
    }
    else if (!known)
    {
        session_stats.devices_dropped++;
    }
    k_mutex_unlock(&state_mutex);

    if (!known && full)
    {
        LOG_WRN("Device list full, dropping %s", evt.address);
    }
    else if (!known)
    {
        LOG_INF("Discovered %s (%s)", evt.address, evt.has_name ? evt.name : "no name");
    }
}

void PeripheralSession::handleConnection(int status, bool connected)
{
    bool disconnecting = std::holds_alternative<conn_state::Disconnecting>(state());

    if (status != 0)
    {
        LOG_ERR("Connection state change failed: status=%d connected=%d", status, connected);
        tearDown();
        if (disconnecting)
        {
            setState(conn_state::Idle{});
        }
        else
        {
            fail(err_t::TRANSPORT_ERROR, status, "GATT error: " + std::to_string(status));
        }
        return;
    }

    if (!connected)
    {
        LOG_INF("Disconnected from peripheral");
        tearDown();
        setState(conn_state::Idle{});
        return;
    }

    if (!std::holds_alternative<conn_state::Connecting>(state()))
    {
        LOG_WRN("Link up while %s, ignoring", connection_state_name(state()));
        return;
    }

    LOG_INF("Link up, resolving NanoHR service");
    int err = transport.discover();
    if (err)
    {
        LOG_ERR("Failed to start discovery: %d", err);
        tearDown();
        fail(err_t::TRANSPORT_ERROR, err, "Service discovery failed (" + std::to_string(err) + ")");
    }
}

void PeripheralSession::handleServices(int status, bool service_found, uint8_t mask)
{
    if (!std::holds_alternative<conn_state::Connecting>(state()))
    {
        LOG_WRN("Discovery result while %s, ignoring", connection_state_name(state()));
        return;
    }

    if (status != 0)
    {
        LOG_ERR("Service discovery failed: %d", status);
        tearDown();
        fail(err_t::TRANSPORT_ERROR, status, "Service discovery failed (" + std::to_string(status) + ")");
        return;
    }

    if (!service_found)
    {
        LOG_ERR("NanoHR service not found on peripheral");
        tearDown();
        fail(err_t::SERVICE_NOT_FOUND, 0, "HR service not found");
        return;
    }

    resolved_mask = mask & NANOHR_ALL_CHARS_MASK;
    setState(conn_state::Connected{pending_name, pending_address});

    if (isResolved(NanoHrChar::HeartRate))
    {
        int err = transport.enableNotifications(NanoHrChar::HeartRate);
        if (err)
        {
            LOG_ERR("Failed to subscribe to heart rate: %d", err);
        }
    }
    else
    {
        LOG_WRN("Heart rate characteristic not resolved");
    }

    LOG_INF("Services resolved, mask 0x%02x", resolved_mask);
}

void PeripheralSession::handleWrite(NanoHrChar chr, int status)
{
    uint8_t command = 0;
    if (chr == NanoHrChar::Control)
    {
        // The ack belongs to the write that was accepted by the transport
        command = inflight_control_command;
        inflight_control_command = 0;
    }

    if (status != 0)
    {
        LOG_WRN("Write to %s failed: %d", nanohr_char_name(chr), status);
        return;
    }
    if (chr != NanoHrChar::Control)
    {
        return;
    }

    switch (command)
    {
        case NANOHR_CMD_MEASURE_ENV:
            readCharacteristic(NanoHrChar::Temperature);
            break;
        case NANOHR_CMD_START_IMU:
            // Peripheral zeroes its counter on start, this read should observe 0
            readCharacteristic(NanoHrChar::Steps);
            break;
        case NANOHR_CMD_STOP_IMU:
            LOG_DBG("Stop IMU acknowledged");
            break;
        default:
            break;
    }
}

void PeripheralSession::handleRead(NanoHrChar chr, int status, const uint8_t *data, size_t len)
{
    if (status != 0)
    {
        LOG_WRN("Read of %s failed: %d", nanohr_char_name(chr), status);
        return;
    }

    applyValue(chr, data, len);

    // Humidity only after the temperature read has completed
    if (chr == NanoHrChar::Temperature)
    {
        readCharacteristic(NanoHrChar::Humidity);
    }
}

void PeripheralSession::applyValue(NanoHrChar chr, const uint8_t *data, size_t len)
{
    int err = 0;

    switch (chr)
    {
        case NanoHrChar::HeartRate:
        {
            int bpm;
            err = nanohr_decode_heart_rate(data, len, &bpm);
            if (!err)
            {
                sink.updateHeartRate(bpm);
            }
            break;
        }
        case NanoHrChar::Temperature:
        case NanoHrChar::Humidity:
        {
            float value;
            err = nanohr_decode_centi_value(data, len, &value);
            if (!err && chr == NanoHrChar::Temperature)
            {
                sink.updateTemperature(value);
            }
            else if (!err)
            {
                sink.updateHumidity(value);
            }
            break;
        }
        case NanoHrChar::Steps:
        {
            int64_t steps;
            err = nanohr_decode_steps(data, len, &steps);
            if (!err)
            {
                sink.updateSteps(steps);
            }
            break;
        }
        case NanoHrChar::Control:
            break;
    }

    if (err)
    {
        LOG_WRN("Invalid %s payload length: %u", nanohr_char_name(chr), (unsigned)len);
        LOG_HEXDUMP_DBG(data, len, "payload:");
    }
}

/********************************** HELPERS ***********************************/

void PeripheralSession::setState(const ConnectionState &next)
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    current_state = next;
    connection_state_observer_t cb = state_observer;
    k_mutex_unlock(&state_mutex);

    LOG_INF("State -> %s", connection_state_describe(next).c_str());

    if (cb)
    {
        cb(&next);
    }
}

void PeripheralSession::fail(err_t fault, int code, const std::string &message)
{
    LOG_WRN("%s: %s", err_to_str(fault), message.c_str());
    setState(connection_error(fault, code, message));
}

void PeripheralSession::tearDown()
{
    cancelPoll();
    transport.close();
    resolved_mask = 0;
    inflight_control_command = 0;
    link_requested = false;
}

bool PeripheralSession::isResolved(NanoHrChar chr) const
{
    return (resolved_mask & nanohr_char_bit(chr)) != 0;
}

void PeripheralSession::readCharacteristic(NanoHrChar chr)
{
    if (!transport.isLinkUp() || !isResolved(chr))
    {
        LOG_DBG("Read of %s skipped, not resolved", nanohr_char_name(chr));
        return;
    }
    if (!gate.hasConnectPermission())
    {
        LOG_WRN("Connect permission missing for %s read", nanohr_char_name(chr));
        return;
    }

    int err = transport.read(chr);
    if (err)
    {
        LOG_WRN("Failed to read %s: %d", nanohr_char_name(chr), err);
        return;
    }

    k_mutex_lock(&state_mutex, K_FOREVER);
    session_stats.reads_issued[to_underlying(chr)]++;
    k_mutex_unlock(&state_mutex);
}

/******************************** STEP POLLING ********************************/

void PeripheralSession::startPoll()
{
    k_mutex_lock(&state_mutex, K_FOREVER);
    if (atomic_get(&poll_active))
    {
        session_stats.poll_loops_cancelled++;
    }
    session_stats.poll_loops_started++;
    k_mutex_unlock(&state_mutex);

    k_work_cancel_delayable(&poll_work.dwork);
    atomic_set(&poll_active, 1);
    k_work_schedule_for_queue(work_q, &poll_work.dwork, K_MSEC(STEP_POLL_INTERVAL_MS));
    LOG_DBG("Step poll started");
}

void PeripheralSession::cancelPoll()
{
    if (!atomic_cas(&poll_active, 1, 0))
    {
        return;
    }

    k_work_cancel_delayable(&poll_work.dwork);

    k_mutex_lock(&state_mutex, K_FOREVER);
    session_stats.poll_loops_cancelled++;
    k_mutex_unlock(&state_mutex);
    LOG_DBG("Step poll cancelled");
}

void PeripheralSession::pollWorkHandler(struct k_work *work)
{
    struct k_work_delayable *dwork = k_work_delayable_from_work(work);
    session_poll_work_t *item = CONTAINER_OF(dwork, session_poll_work_t, dwork);
    item->owner->pollTick();
}

void PeripheralSession::pollTick()
{
    if (!atomic_get(&poll_active))
    {
        return;
    }

    if (!transport.isLinkUp() || !isResolved(NanoHrChar::Steps))
    {
        atomic_set(&poll_active, 0);
        k_mutex_lock(&state_mutex, K_FOREVER);
        session_stats.poll_loops_terminated++;
        k_mutex_unlock(&state_mutex);
        LOG_INF("Step poll stopped, link or steps characteristic lost");
        return;
    }

    k_mutex_lock(&state_mutex, K_FOREVER);
    session_stats.poll_ticks++;
    k_mutex_unlock(&state_mutex);

    readCharacteristic(NanoHrChar::Steps);
    k_work_schedule_for_queue(work_q, &poll_work.dwork, K_MSEC(STEP_POLL_INTERVAL_MS));
}
