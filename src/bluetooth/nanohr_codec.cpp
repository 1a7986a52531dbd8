/**
 * @file nanohr_codec.cpp
 * @brief Byte decoders for NanoHR characteristic values
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <errno.h>

#include <zephyr/sys/byteorder.h>

#include <nanohr_codec.hpp>
#include <nanohr_protocol.hpp>

int nanohr_decode_heart_rate(const uint8_t *data, size_t len, int *bpm)
{
    if (!data || !bpm)
    {
        return -EINVAL;
    }
    if (len < sizeof(uint8_t))
    {
        return -EMSGSIZE;
    }

    *bpm = data[0];
    return 0;
}

int nanohr_decode_centi_value(const uint8_t *data, size_t len, float *value)
{
    if (!data || !value)
    {
        return -EINVAL;
    }
    if (len < sizeof(int16_t))
    {
        return -EMSGSIZE;
    }

    int16_t raw = (int16_t)sys_get_le16(data);
    *value = raw / 100.0f;
    return 0;
}

int nanohr_decode_steps(const uint8_t *data, size_t len, int64_t *steps)
{
    if (!data || !steps)
    {
        return -EINVAL;
    }
    if (len < sizeof(uint32_t))
    {
        return -EMSGSIZE;
    }

    *steps = (int64_t)sys_get_le32(data);
    return 0;
}

const char *nanohr_char_name(NanoHrChar chr)
{
    switch (chr)
    {
        case NanoHrChar::HeartRate:
            return "heart_rate";
        case NanoHrChar::Temperature:
            return "temperature";
        case NanoHrChar::Humidity:
            return "humidity";
        case NanoHrChar::Control:
            return "control";
        case NanoHrChar::Steps:
            return "steps";
    }
    return "unknown";
}
