/**
 * @file test_workout_codec.cpp
 * @brief Unit tests for workout record protobuf encoding
 */

#include <string.h>
#include <string>

#include <pb_encode.h>
#include <zephyr/ztest.h>

#include <workout_codec.hpp>

struct workout_codec_fixture
{
    uint8_t buffer[WORKOUT_RECORD_MAX_SIZE];
    size_t written;
};

static void *workout_codec_setup(void)
{
    static struct workout_codec_fixture fixture;
    return &fixture;
}

static void workout_codec_before(void *f)
{
    struct workout_codec_fixture *fixture = (struct workout_codec_fixture *)f;
    memset(fixture->buffer, 0, sizeof(fixture->buffer));
    fixture->written = 0;
}

ZTEST_SUITE(workout_codec, NULL, workout_codec_setup, workout_codec_before, NULL, NULL);

static WorkoutSession make_full_session(void)
{
    WorkoutSession session = {};
    session.id = 1749574900123LL;
    session.started_at_millis = 1749574000123LL;
    session.duration_seconds = 900;
    session.avg_heart_rate = 131;
    session.total_steps = 1400;
    session.calories = 182.75;
    session.activities = {
        {1749574800000LL, ActivityType::Walking, 600, 125, 1400},
        {1749574800001LL, ActivityType::Weightlifting, 300, 137, std::nullopt},
    };
    session.recovery_techniques = {
        {1749574900124LL, "Hydration", "Drink 300-500 ml of water in the next 15 minutes to support recovery."},
        {1749574900125LL, "Muscle Relax", "Do gentle range-of-motion work for the major muscle groups."},
    };
    return session;
}

ZTEST_F(workout_codec, test_full_session_survives_encoding)
{
    WorkoutSession original = make_full_session();

    zassert_ok(workout_encode(original, fixture->buffer, sizeof(fixture->buffer), &fixture->written));
    zassert_true(fixture->written > 0);

    WorkoutSession decoded;
    zassert_ok(workout_decode(fixture->buffer, fixture->written, decoded));
    zassert_true(decoded == original);
}

ZTEST_F(workout_codec, test_absent_values_differ_from_zero)
{
    WorkoutSession original = {};
    original.id = 7;
    original.started_at_millis = 0;
    original.duration_seconds = 0;
    original.total_steps = 0;
    original.activities = {{8, ActivityType::Yoga, 0, std::nullopt, 0}};

    zassert_ok(workout_encode(original, fixture->buffer, sizeof(fixture->buffer), &fixture->written));

    WorkoutSession decoded;
    zassert_ok(workout_decode(fixture->buffer, fixture->written, decoded));

    zassert_false(decoded.avg_heart_rate.has_value());
    zassert_false(decoded.calories.has_value());
    zassert_true(decoded.total_steps.has_value(), "Zero steps must stay present");
    zassert_equal(*decoded.total_steps, 0);
    zassert_false(decoded.activities[0].avg_heart_rate.has_value());
    zassert_true(decoded.activities[0].steps.has_value());
}

ZTEST_F(workout_codec, test_long_recovery_text_is_truncated)
{
    WorkoutSession original = make_full_session();
    original.recovery_techniques[0].description = std::string(400, 'x');

    zassert_ok(workout_encode(original, fixture->buffer, sizeof(fixture->buffer), &fixture->written));

    WorkoutSession decoded;
    zassert_ok(workout_decode(fixture->buffer, fixture->written, decoded));
    zassert_true(decoded.recovery_techniques[0].description.size() < 400);
    zassert_true(decoded.recovery_techniques[0].description.size() > 0);
}

ZTEST_F(workout_codec, test_too_many_activities)
{
    WorkoutSession original = make_full_session();
    original.activities.assign(WORKOUT_MAX_ACTIVITIES + 1, original.activities[0]);

    zassert_equal(workout_encode(original, fixture->buffer, sizeof(fixture->buffer), &fixture->written), -E2BIG);
}

ZTEST_F(workout_codec, test_small_buffer)
{
    WorkoutSession original = make_full_session();

    zassert_equal(workout_encode(original, fixture->buffer, 16, &fixture->written), -ENOMEM);
    zassert_equal(workout_encode(original, nullptr, 16, &fixture->written), -EINVAL);
}

ZTEST_F(workout_codec, test_garbage_is_rejected)
{
    const uint8_t garbage[] = {0xff, 0xff, 0xff, 0xff, 0x0f, 0x12};
    WorkoutSession decoded = make_full_session();

    zassert_equal(workout_decode(garbage, sizeof(garbage), decoded), -EBADMSG);
    zassert_equal(decoded.id, make_full_session().id, "Output is untouched on failure");
}

ZTEST_F(workout_codec, test_negative_duration_is_rejected)
{
    WorkoutSession original = make_full_session();
    original.activities[1].duration_seconds = -30;

    zassert_ok(workout_encode(original, fixture->buffer, sizeof(fixture->buffer), &fixture->written));

    WorkoutSession decoded;
    zassert_equal(workout_decode(fixture->buffer, fixture->written, decoded), -EBADMSG);
}

ZTEST_F(workout_codec, test_unknown_activity_kind_is_rejected)
{
    static smartgym_messages_WorkoutRecord record;
    record = smartgym_messages_WorkoutRecord_init_zero;
    record.id = 1;
    record.duration_seconds = 60;
    record.activities_count = 1;
    record.activities[0].id = 2;
    record.activities[0].type = (smartgym_messages_ActivityKind)42;
    record.activities[0].duration_seconds = 60;

    pb_ostream_t stream = pb_ostream_from_buffer(fixture->buffer, sizeof(fixture->buffer));
    zassert_true(pb_encode(&stream, smartgym_messages_WorkoutRecord_fields, &record));

    WorkoutSession decoded;
    zassert_equal(workout_decode(fixture->buffer, stream.bytes_written, decoded), -EBADMSG);
}
