/**
 * @file peripheral_session.hpp
 * @brief Scan, connect and exchange data with one NanoHR peripheral
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_PERIPHERAL_SESSION_HEADER_
#define APP_INCLUDE_PERIPHERAL_SESSION_HEADER_

#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <connection_state.hpp>
#include <gatt_transport.hpp>
#include <nanohr_protocol.hpp>
#include <telemetry_sink.hpp>

// Large enough for "XX:XX:XX:XX:XX:XX (random)"
static constexpr size_t SESSION_ADDRESS_MAX_LEN = 30;
static constexpr size_t SESSION_NAME_MAX_LEN = 30;
// ATT default MTU minus the opcode and handle
static constexpr size_t SESSION_EVENT_MAX_PAYLOAD = 20;
static constexpr size_t SESSION_EVENT_QUEUE_DEPTH = 16;

struct DiscoveredDevice
{
    std::optional<std::string> name;
    std::string address;
};

struct SessionStats
{
    uint32_t reads_issued[NANOHR_CHAR_COUNT];
    uint32_t writes_issued;
    uint32_t poll_loops_started;
    uint32_t poll_loops_cancelled;
    uint32_t poll_loops_terminated;
    uint32_t poll_ticks;
    uint32_t events_dropped;
    uint32_t devices_dropped;
};

typedef void (*connection_state_observer_t)(const ConnectionState *state);

class PeripheralSession;

// Work items carry a back pointer so handlers can find their session
struct session_work_t
{
    struct k_work work;
    PeripheralSession *owner;
};

struct session_poll_work_t
{
    struct k_work_delayable dwork;
    PeripheralSession *owner;
};

/**
 * @brief Owns the single link to a NanoHR peripheral.
 *
 * Public intents and transport callbacks never act directly: both are copied
 * into a message queue and executed in order on @p work_q, so at most one
 * context ever drives the transport. Intents return 0 once queued and report
 * their outcome through the connection state and the telemetry sink.
 */
class PeripheralSession : public TransportListener, public ImuControl
{
public:
    PeripheralSession(GattTransport &gatt_transport, AdapterGate &adapter_gate, TelemetrySink &telemetry_sink,
                      struct k_work_q *queue);
    ~PeripheralSession() override;

    PeripheralSession(const PeripheralSession &) = delete;
    PeripheralSession &operator=(const PeripheralSession &) = delete;

    int startScan();
    int stopScan();
    int connect(const char *address, const char *name = nullptr);
    int disconnect();
    int requestEnvironmentMeasurement();
    int startImuSession() override;
    int stopImuSession() override;

    ConnectionState state() const;
    std::vector<DiscoveredDevice> discoveredDevices() const;
    SessionStats stats() const;
    bool isPollActive() const;

    void setStateObserver(connection_state_observer_t observer);

    // TransportListener
    void onDeviceFound(const char *address, const char *name) override;
    void onScanFailed(int status) override;
    void onConnectionChanged(int status, bool connected) override;
    void onServicesResolved(int status, bool service_found, uint8_t resolved_mask) override;
    void onSecurityFailed(int status) override;
    void onWriteComplete(NanoHrChar chr, int status) override;
    void onReadComplete(NanoHrChar chr, int status, const uint8_t *data, size_t len) override;
    void onNotification(NanoHrChar chr, const uint8_t *data, size_t len) override;

private:
    enum session_event_type_t : uint8_t
    {
        INTENT_START_SCAN,
        INTENT_STOP_SCAN,
        INTENT_CONNECT,
        INTENT_DISCONNECT,
        INTENT_MEASURE_ENV,
        INTENT_START_IMU,
        INTENT_STOP_IMU,
        EVT_DEVICE_FOUND,
        EVT_SCAN_FAILED,
        EVT_CONNECTION,
        EVT_SERVICES,
        EVT_SECURITY,
        EVT_WRITE,
        EVT_READ,
        EVT_NOTIFY,
    };

    struct session_event_t
    {
        session_event_type_t type;
        NanoHrChar chr;
        bool flag;
        bool has_name;
        uint8_t mask;
        uint8_t len;
        int status;
        uint8_t data[SESSION_EVENT_MAX_PAYLOAD];
        char address[SESSION_ADDRESS_MAX_LEN];
        char name[SESSION_NAME_MAX_LEN];
    };

    static void eventWorkHandler(struct k_work *work);
    static void pollWorkHandler(struct k_work *work);

    int post(session_event_t &evt);
    int postIntent(session_event_type_t type);
    void handleEvent(const session_event_t &evt);

    void doStartScan();
    void doStopScan();
    void doConnect(const session_event_t &evt);
    void doDisconnect();
    void doControlCommand(uint8_t command);

    void handleDeviceFound(const session_event_t &evt);
    void handleConnection(int status, bool connected);
    void handleServices(int status, bool service_found, uint8_t resolved_mask);
    void handleWrite(NanoHrChar chr, int status);
    void handleRead(NanoHrChar chr, int status, const uint8_t *data, size_t len);
    void applyValue(NanoHrChar chr, const uint8_t *data, size_t len);

    bool adapterReady();
    void setState(const ConnectionState &next);
    void fail(err_t fault, int code, const std::string &message);
    void tearDown();
    bool isResolved(NanoHrChar chr) const;
    void readCharacteristic(NanoHrChar chr);

    void startPoll();
    void cancelPoll();
    void pollTick();

    GattTransport &transport;
    AdapterGate &gate;
    TelemetrySink &sink;
    struct k_work_q *work_q;

    struct k_msgq event_msgq;
    alignas(4) char event_msgq_buffer[SESSION_EVENT_QUEUE_DEPTH * sizeof(session_event_t)];
    session_work_t event_work;
    session_poll_work_t poll_work;

    mutable struct k_mutex state_mutex;
    ConnectionState current_state;
    std::vector<DiscoveredDevice> devices;
    SessionStats session_stats;
    connection_state_observer_t state_observer;
    atomic_t poll_active;

    // Only touched from work_q
    uint8_t resolved_mask;
    uint8_t inflight_control_command;
    bool link_requested;
    std::optional<std::string> pending_name;
    std::string pending_address;
};

#endif // APP_INCLUDE_PERIPHERAL_SESSION_HEADER_
