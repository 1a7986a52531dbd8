/**
 * @file errors.cpp
 * @brief Names for module error codes
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <errors.hpp>

const char *err_to_str(err_t err)
{
    switch (err)
    {
        case err_t::NO_ERROR:
            return "NO_ERROR";
        case err_t::BLUETOOTH_ERROR:
            return "BLUETOOTH_ERROR";
        case err_t::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case err_t::ADAPTER_UNAVAILABLE:
            return "ADAPTER_UNAVAILABLE";
        case err_t::TRANSPORT_SECURITY_REJECTED:
            return "TRANSPORT_SECURITY_REJECTED";
        case err_t::TRANSPORT_ERROR:
            return "TRANSPORT_ERROR";
        case err_t::SERVICE_NOT_FOUND:
            return "SERVICE_NOT_FOUND";
        case err_t::DEVICE_NOT_FOUND:
            return "DEVICE_NOT_FOUND";
        case err_t::SCAN_FAILED:
            return "SCAN_FAILED";
        case err_t::STORAGE_ERROR:
            return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}
