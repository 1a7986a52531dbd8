/**
 * @file errors.hpp
 * @brief Module level error codes for the SmartGym hub
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#ifndef APP_INCLUDE_ERRORS_H_
#define APP_INCLUDE_ERRORS_H_

#include <stdint.h>

enum class err_t
{
    NO_ERROR = 0,
    BLUETOOTH_ERROR = -5,
    STORAGE_ERROR = -24,

    // Connection faults reported through ConnectionState::Error
    PERMISSION_DENIED = -40,
    ADAPTER_UNAVAILABLE = -41,
    TRANSPORT_SECURITY_REJECTED = -42,
    TRANSPORT_ERROR = -43,
    SERVICE_NOT_FOUND = -44,
    DEVICE_NOT_FOUND = -45,
    SCAN_FAILED = -46,
};

const char *err_to_str(err_t err);

#endif // APP_INCLUDE_ERRORS_H_
