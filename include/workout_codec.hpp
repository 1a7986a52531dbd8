/**
 * @file workout_codec.hpp
 * @brief Protobuf encoding of finished workout sessions
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_CODEC_HEADER_
#define APP_INCLUDE_WORKOUT_CODEC_HEADER_

#include <stddef.h>
#include <stdint.h>

#include <proto/workout_messages.pb.h>

#include <workout_domain.hpp>

static constexpr size_t WORKOUT_RECORD_MAX_SIZE = smartgym_messages_WorkoutRecord_size;
static constexpr size_t WORKOUT_MAX_ACTIVITIES = 16;

/**
 * @brief Encode @p session as a WorkoutRecord.
 *
 * Recovery titles and descriptions longer than the record fields are
 * truncated.
 *
 * @return 0 on success, -E2BIG when the session holds more activities or
 *         recovery techniques than a record carries, -ENOMEM when @p buf is
 *         too small, -EINVAL on null arguments.
 */
int workout_encode(const WorkoutSession &session, uint8_t *buf, size_t buf_size, size_t *written);

/**
 * @brief Decode a WorkoutRecord into @p session.
 *
 * @return 0 on success, -EBADMSG when the bytes are not a valid record or
 *         carry an unknown activity type or negative duration or steps.
 */
int workout_decode(const uint8_t *buf, size_t len, WorkoutSession &session);

#endif // APP_INCLUDE_WORKOUT_CODEC_HEADER_
