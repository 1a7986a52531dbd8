/**
 * @file workout_codec.cpp
 * @brief Protobuf encoding of finished workout sessions
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE workout_codec

#include <errno.h>
#include <string.h>

#include <pb_decode.h>
#include <pb_encode.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <util.hpp>
#include <workout_codec.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_STORE_LOG_LEVEL); // NOLINT

// A full record does not fit on the caller stacks, share one scratch copy
static smartgym_messages_WorkoutRecord scratch_record;
K_MUTEX_DEFINE(scratch_record_mutex);

static_assert(ARRAY_SIZE(scratch_record.activities) == WORKOUT_MAX_ACTIVITIES, "activity count mismatch");

static smartgym_messages_ActivityKind to_kind(ActivityType type)
{
    switch (type)
    {
        case ActivityType::Walking:
            return smartgym_messages_ActivityKind_WALKING;
        case ActivityType::Running:
            return smartgym_messages_ActivityKind_RUNNING;
        case ActivityType::Cycling:
            return smartgym_messages_ActivityKind_CYCLING;
        case ActivityType::Yoga:
            return smartgym_messages_ActivityKind_YOGA;
        case ActivityType::Weightlifting:
            return smartgym_messages_ActivityKind_WEIGHTLIFTING;
        case ActivityType::Other:
        default:
            return smartgym_messages_ActivityKind_OTHER;
    }
}

static bool from_kind(smartgym_messages_ActivityKind kind, ActivityType *type)
{
    switch (kind)
    {
        case smartgym_messages_ActivityKind_WALKING:
            *type = ActivityType::Walking;
            return true;
        case smartgym_messages_ActivityKind_RUNNING:
            *type = ActivityType::Running;
            return true;
        case smartgym_messages_ActivityKind_CYCLING:
            *type = ActivityType::Cycling;
            return true;
        case smartgym_messages_ActivityKind_YOGA:
            *type = ActivityType::Yoga;
            return true;
        case smartgym_messages_ActivityKind_WEIGHTLIFTING:
            *type = ActivityType::Weightlifting;
            return true;
        case smartgym_messages_ActivityKind_OTHER:
            *type = ActivityType::Other;
            return true;
        default:
            return false;
    }
}

int workout_encode(const WorkoutSession &session, uint8_t *buf, size_t buf_size, size_t *written)
{
    if (!buf || !written)
    {
        return -EINVAL;
    }
    if (session.activities.size() > ARRAY_SIZE(scratch_record.activities) ||
        session.recovery_techniques.size() > ARRAY_SIZE(scratch_record.recovery_techniques))
    {
        LOG_ERR("Session %lld too large to encode", (long long)session.id);
        return -E2BIG;
    }

    k_mutex_lock(&scratch_record_mutex, K_FOREVER);

    smartgym_messages_WorkoutRecord &record = scratch_record;
    record = smartgym_messages_WorkoutRecord_init_zero;

    record.id = session.id;
    record.started_at_millis = session.started_at_millis;
    record.duration_seconds = session.duration_seconds;
    record.has_avg_heart_rate = session.avg_heart_rate.has_value();
    record.avg_heart_rate = session.avg_heart_rate.value_or(0);
    record.has_total_steps = session.total_steps.has_value();
    record.total_steps = session.total_steps.value_or(0);
    record.has_calories = session.calories.has_value();
    record.calories = session.calories.value_or(0.0);

    record.activities_count = session.activities.size();
    for (size_t i = 0; i < session.activities.size(); i++)
    {
        const WorkoutActivityEntry &entry = session.activities[i];
        smartgym_messages_ActivityRecord &out = record.activities[i];
        out.id = entry.id;
        out.type = to_kind(entry.type);
        out.duration_seconds = entry.duration_seconds;
        out.has_avg_heart_rate = entry.avg_heart_rate.has_value();
        out.avg_heart_rate = entry.avg_heart_rate.value_or(0);
        out.has_steps = entry.steps.has_value();
        out.steps = entry.steps.value_or(0);
    }

    record.recovery_techniques_count = session.recovery_techniques.size();
    for (size_t i = 0; i < session.recovery_techniques.size(); i++)
    {
        const RecoveryTechnique &technique = session.recovery_techniques[i];
        smartgym_messages_RecoveryRecord &out = record.recovery_techniques[i];
        out.id = technique.id;
        util::copy_string(out.title, sizeof(out.title), technique.title.c_str());
        util::copy_string(out.description, sizeof(out.description), technique.description.c_str());
    }

    pb_ostream_t stream = pb_ostream_from_buffer(buf, buf_size);
    bool status = pb_encode(&stream, smartgym_messages_WorkoutRecord_fields, &record);
    size_t bytes = stream.bytes_written;

    k_mutex_unlock(&scratch_record_mutex);

    if (!status)
    {
        LOG_ERR("Encoding session %lld failed: %s", (long long)session.id, PB_GET_ERROR(&stream));
        return -ENOMEM;
    }

    *written = bytes;
    return 0;
}

int workout_decode(const uint8_t *buf, size_t len, WorkoutSession &session)
{
    if (!buf)
    {
        return -EINVAL;
    }

    k_mutex_lock(&scratch_record_mutex, K_FOREVER);

    smartgym_messages_WorkoutRecord &record = scratch_record;
    record = smartgym_messages_WorkoutRecord_init_zero;

    pb_istream_t stream = pb_istream_from_buffer(buf, len);
    if (!pb_decode(&stream, smartgym_messages_WorkoutRecord_fields, &record))
    {
        LOG_WRN("Decoding workout record failed: %s", PB_GET_ERROR(&stream));
        k_mutex_unlock(&scratch_record_mutex);
        return -EBADMSG;
    }

    int err = 0;
    WorkoutSession decoded = {};
    decoded.id = record.id;
    decoded.started_at_millis = record.started_at_millis;
    decoded.duration_seconds = record.duration_seconds;
    if (record.has_avg_heart_rate)
    {
        decoded.avg_heart_rate = record.avg_heart_rate;
    }
    if (record.has_total_steps)
    {
        decoded.total_steps = record.total_steps;
    }
    if (record.has_calories)
    {
        decoded.calories = record.calories;
    }
    if (decoded.duration_seconds < 0 || (decoded.total_steps && *decoded.total_steps < 0))
    {
        err = -EBADMSG;
    }

    for (pb_size_t i = 0; !err && i < record.activities_count; i++)
    {
        const smartgym_messages_ActivityRecord &in = record.activities[i];
        WorkoutActivityEntry entry = {};
        entry.id = in.id;
        entry.duration_seconds = in.duration_seconds;
        if (!from_kind(in.type, &entry.type) || in.duration_seconds < 0 || (in.has_steps && in.steps < 0))
        {
            err = -EBADMSG;
            break;
        }
        if (in.has_avg_heart_rate)
        {
            entry.avg_heart_rate = in.avg_heart_rate;
        }
        if (in.has_steps)
        {
            entry.steps = in.steps;
        }
        decoded.activities.push_back(entry);
    }

    for (pb_size_t i = 0; !err && i < record.recovery_techniques_count; i++)
    {
        const smartgym_messages_RecoveryRecord &in = record.recovery_techniques[i];
        decoded.recovery_techniques.push_back({in.id, in.title, in.description});
    }

    int64_t record_id = record.id;
    k_mutex_unlock(&scratch_record_mutex);

    if (err)
    {
        LOG_WRN("Workout record %lld rejected", (long long)record_id);
        return err;
    }

    session = std::move(decoded);
    return 0;
}
