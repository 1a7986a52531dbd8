/**
 * @file nanohr_codec.hpp
 * @brief Byte decoders for NanoHR characteristic values
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_NANOHR_CODEC_HEADER_
#define APP_INCLUDE_NANOHR_CODEC_HEADER_

#include <stddef.h>
#include <stdint.h>

/**
 * @brief Decode a heart rate value (one unsigned byte, BPM).
 *
 * @return 0 on success, -EMSGSIZE when @p len is too short.
 */
int nanohr_decode_heart_rate(const uint8_t *data, size_t len, int *bpm);

/**
 * @brief Decode temperature or humidity: little-endian int16 scaled by 100.
 *
 * @return 0 on success, -EMSGSIZE when @p len is too short.
 */
int nanohr_decode_centi_value(const uint8_t *data, size_t len, float *value);

/**
 * @brief Decode the cumulative step counter: little-endian uint32.
 *
 * @return 0 on success, -EMSGSIZE when @p len is too short.
 */
int nanohr_decode_steps(const uint8_t *data, size_t len, int64_t *steps);

#endif // APP_INCLUDE_NANOHR_CODEC_HEADER_
