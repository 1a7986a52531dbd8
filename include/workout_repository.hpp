/**
 * @file workout_repository.hpp
 * @brief Per user persistence of finished workout sessions
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_REPOSITORY_HEADER_
#define APP_INCLUDE_WORKOUT_REPOSITORY_HEADER_

#include <vector>

#include <workout_domain.hpp>

class WorkoutRepository
{
public:
    virtual ~WorkoutRepository() = default;

    // 0 on success, negative errno otherwise
    virtual int save(const char *user_id, const WorkoutSession &session) = 0;

    /**
     * @brief Load every stored session of @p user_id ordered by start time.
     *
     * Records that fail to decode are skipped. @p sessions is replaced.
     */
    virtual int loadAll(const char *user_id, std::vector<WorkoutSession> &sessions) = 0;
};

#endif // APP_INCLUDE_WORKOUT_REPOSITORY_HEADER_
