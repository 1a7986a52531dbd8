/**
 * @file nanohr_protocol.hpp
 * @brief Wire contract of the NanoHR peripheral
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_NANOHR_PROTOCOL_HEADER_
#define APP_INCLUDE_NANOHR_PROTOCOL_HEADER_

#include <stddef.h>
#include <stdint.h>

// Service UUID: 12345678-1234-5678-1234-56789abcdef0
#define NANOHR_SERVICE_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef0)

// Characteristic UUIDs share the service base, last byte selects the field
#define NANOHR_HR_CHAR_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef1)
#define NANOHR_TEMP_CHAR_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef2)
#define NANOHR_HUM_CHAR_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef3)
#define NANOHR_CONTROL_CHAR_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef4)
#define NANOHR_STEPS_CHAR_UUID_VAL BT_UUID_128_ENCODE(0x12345678, 0x1234, 0x5678, 0x1234, 0x56789abcdef5)

// Standard Client Characteristic Configuration descriptor
static constexpr uint16_t NANOHR_CCCD_UUID16 = 0x2902;

enum class NanoHrChar : uint8_t
{
    HeartRate = 0,
    Temperature,
    Humidity,
    Control,
    Steps,
};

static constexpr size_t NANOHR_CHAR_COUNT = 5;

// Bit mask of resolved characteristics, indexed by NanoHrChar
static constexpr uint8_t nanohr_char_bit(NanoHrChar chr)
{
    return (uint8_t)(1U << (uint8_t)chr);
}

static constexpr uint8_t NANOHR_ALL_CHARS_MASK = (1U << NANOHR_CHAR_COUNT) - 1;

// Control channel commands, one byte each
static constexpr uint8_t NANOHR_CMD_MEASURE_ENV = 0x01;
static constexpr uint8_t NANOHR_CMD_START_IMU = 0x10;
static constexpr uint8_t NANOHR_CMD_STOP_IMU = 0x11;

const char *nanohr_char_name(NanoHrChar chr);

#endif // APP_INCLUDE_NANOHR_PROTOCOL_HEADER_
