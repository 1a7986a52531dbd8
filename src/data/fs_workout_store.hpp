/**
 * @file fs_workout_store.hpp
 * @brief Workout repository keeping one protobuf file per session
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_SRC_DATA_FS_WORKOUT_STORE_HEADER_
#define APP_SRC_DATA_FS_WORKOUT_STORE_HEADER_

#include <stdint.h>

#include <zephyr/kernel.h>

#include <workout_codec.hpp>
#include <workout_repository.hpp>

/**
 * @brief Sessions live at <root>/<user_id>/<session_id>.pb
 *
 * User ids must be non-empty and free of '/'.
 */
class FsWorkoutStore : public WorkoutRepository
{
public:
    explicit FsWorkoutStore(const char *root_dir);

    int save(const char *user_id, const WorkoutSession &session) override;
    int loadAll(const char *user_id, std::vector<WorkoutSession> &sessions) override;

    // Files skipped by the last loadAll()
    uint32_t skippedRecords() const;

private:
    int userDir(const char *user_id, char *path, size_t path_size) const;
    int readRecord(const char *path, size_t size, WorkoutSession &session);

    const char *root;
    mutable struct k_mutex store_mutex;
    uint8_t record_buffer[WORKOUT_RECORD_MAX_SIZE];
    uint32_t skipped;
};

#endif // APP_SRC_DATA_FS_WORKOUT_STORE_HEADER_
