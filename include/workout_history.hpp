/**
 * @file workout_history.hpp
 * @brief In-memory list of finished workouts backed by a repository
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_WORKOUT_HISTORY_HEADER_
#define APP_INCLUDE_WORKOUT_HISTORY_HEADER_

#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

#include <zephyr/kernel.h>

#include <workout_domain.hpp>
#include <workout_repository.hpp>

class WorkoutHistory
{
public:
    WorkoutHistory(WorkoutRepository &repository, const char *user_id);

    /**
     * @brief Replace the list with the sessions stored for @p user_id.
     *
     * A failed load leaves the list empty and returns the repository error.
     */
    int load(const char *user_id);

    // Appends locally, then saves best-effort. A failed save keeps the session.
    void append(const WorkoutSession &session);

    std::vector<WorkoutSession> sessions() const;
    size_t size() const;
    std::string userId() const;
    uint32_t failedSaves() const;

    void recordSummary(const WorkoutSummary &summary);
    std::optional<WorkoutSummary> lastSummary() const;

private:
    WorkoutRepository &repository;
    mutable struct k_mutex history_mutex;
    std::string user;
    std::vector<WorkoutSession> session_list;
    std::optional<WorkoutSummary> last_summary;
    uint32_t failed_saves;
};

#endif // APP_INCLUDE_WORKOUT_HISTORY_HEADER_
