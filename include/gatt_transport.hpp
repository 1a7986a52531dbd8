/**
 * @file gatt_transport.hpp
 * @brief Radio facing seam of the peripheral session
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_GATT_TRANSPORT_HEADER_
#define APP_INCLUDE_GATT_TRANSPORT_HEADER_

#include <stddef.h>
#include <stdint.h>

#include <nanohr_protocol.hpp>

/**
 * @brief Completion and event callbacks raised by a GattTransport.
 *
 * Callbacks may run on any thread (the Bluetooth host RX thread on target).
 * Implementations must copy what they need and return quickly. A @p status of
 * 0 means success, anything else is the transport's own error code.
 */
class TransportListener
{
public:
    virtual ~TransportListener() = default;

    virtual void onDeviceFound(const char *address, const char *name) = 0;
    virtual void onScanFailed(int status) = 0;
    virtual void onConnectionChanged(int status, bool connected) = 0;
    // resolved_mask has one bit per NanoHrChar, see nanohr_char_bit()
    virtual void onServicesResolved(int status, bool service_found, uint8_t resolved_mask) = 0;
    virtual void onSecurityFailed(int status) = 0;
    virtual void onWriteComplete(NanoHrChar chr, int status) = 0;
    virtual void onReadComplete(NanoHrChar chr, int status, const uint8_t *data, size_t len) = 0;
    virtual void onNotification(NanoHrChar chr, const uint8_t *data, size_t len) = 0;
};

/**
 * @brief Asynchronous GATT central operations against one peripheral.
 *
 * Every call returns immediately. 0 means the operation was started and its
 * result arrives through the TransportListener. A negative errno means
 * nothing was started.
 */
class GattTransport
{
public:
    virtual ~GattTransport() = default;

    virtual void setListener(TransportListener *listener) = 0;

    // Scan filtered by the NanoHR service UUID
    virtual int startScan() = 0;
    virtual int stopScan() = 0;

    // -EINVAL when the address cannot be parsed
    virtual int connect(const char *address) = 0;
    // -ENOTCONN when there is no link to tear down
    virtual int disconnect() = 0;
    // Drop the link without waiting for the peer
    virtual void close() = 0;
    virtual bool isLinkUp() const = 0;

    virtual int discover() = 0;
    virtual int enableNotifications(NanoHrChar chr) = 0;
    virtual int write(NanoHrChar chr, const uint8_t *data, size_t len) = 0;
    virtual int read(NanoHrChar chr) = 0;
};

/**
 * @brief Permission and adapter checks evaluated before any transport call.
 */
class AdapterGate
{
public:
    virtual ~AdapterGate() = default;

    virtual bool isAdapterPresent() const = 0;
    virtual bool isAdapterEnabled() const = 0;
    virtual bool hasScanPermission() const = 0;
    virtual bool hasConnectPermission() const = 0;
};

/**
 * @brief Start and stop IMU step tracking on the peripheral.
 *
 * Implemented by the peripheral session, consumed by the workout tracker.
 */
class ImuControl
{
public:
    virtual ~ImuControl() = default;

    virtual int startImuSession() = 0;
    virtual int stopImuSession() = 0;
};

#endif // APP_INCLUDE_GATT_TRANSPORT_HEADER_
