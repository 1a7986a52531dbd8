/**
 * @file test_nanohr_codec.cpp
 * @brief Unit tests for NanoHR characteristic decoding
 */

#include <errno.h>

#include <zephyr/ztest.h>

#include <nanohr_codec.hpp>
#include <nanohr_protocol.hpp>

ZTEST_SUITE(nanohr_codec, NULL, NULL, NULL, NULL, NULL);

ZTEST(nanohr_codec, test_heart_rate_is_unsigned_byte)
{
    const uint8_t data[] = {0xb4, 0xff};
    int bpm = 0;

    zassert_ok(nanohr_decode_heart_rate(data, sizeof(data), &bpm));
    zassert_equal(bpm, 180, "Trailing bytes are ignored");
    zassert_equal(nanohr_decode_heart_rate(data, 0, &bpm), -EMSGSIZE);
}

ZTEST(nanohr_codec, test_centi_value_is_signed_little_endian)
{
    float value = 0.0f;

    const uint8_t positive[] = {0x2a, 0x09};
    zassert_ok(nanohr_decode_centi_value(positive, sizeof(positive), &value));
    zassert_within(value, 23.46f, 0.001f);

    const uint8_t negative[] = {0x9c, 0xff};
    zassert_ok(nanohr_decode_centi_value(negative, sizeof(negative), &value));
    zassert_within(value, -1.0f, 0.001f);

    const uint8_t short_data[] = {0x2a};
    zassert_equal(nanohr_decode_centi_value(short_data, sizeof(short_data), &value), -EMSGSIZE);
}

ZTEST(nanohr_codec, test_steps_is_unsigned_32_bit)
{
    int64_t steps = 0;

    const uint8_t data[] = {0x10, 0x27, 0x00, 0x00};
    zassert_ok(nanohr_decode_steps(data, sizeof(data), &steps));
    zassert_equal(steps, 10000);

    const uint8_t max[] = {0xff, 0xff, 0xff, 0xff};
    zassert_ok(nanohr_decode_steps(max, sizeof(max), &steps));
    zassert_equal(steps, 4294967295LL, "Counter must not go negative");

    zassert_equal(nanohr_decode_steps(data, 3, &steps), -EMSGSIZE);
}

ZTEST(nanohr_codec, test_reference_payloads)
{
    const uint8_t temp[] = {0xe8, 0x03};
    float celsius = 0.0f;
    zassert_ok(nanohr_decode_centi_value(temp, sizeof(temp), &celsius));
    zassert_within(celsius, 10.0f, 0.001f);

    const uint8_t steps[] = {0x05, 0x00, 0x00, 0x00};
    int64_t count = 0;
    zassert_ok(nanohr_decode_steps(steps, sizeof(steps), &count));
    zassert_equal(count, 5);
}

ZTEST(nanohr_codec, test_null_arguments_are_rejected)
{
    int bpm;
    zassert_equal(nanohr_decode_heart_rate(nullptr, 1, &bpm), -EINVAL);
    zassert_equal(nanohr_decode_steps(nullptr, 4, nullptr), -EINVAL);
}

ZTEST(nanohr_codec, test_characteristic_bits)
{
    zassert_equal(nanohr_char_bit(NanoHrChar::HeartRate), 0x01);
    zassert_equal(nanohr_char_bit(NanoHrChar::Steps), 0x10);
    zassert_equal(NANOHR_ALL_CHARS_MASK, 0x1f);
    zassert_str_equal(nanohr_char_name(NanoHrChar::Control), "control");
}
