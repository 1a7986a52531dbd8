/**
 * @file workout_history.cpp
 * @brief In-memory list of finished workouts backed by a repository
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <errno.h>

#include <zephyr/logging/log.h>

#include <workout_history.hpp>

LOG_MODULE_REGISTER(workout_history, CONFIG_SMARTGYM_WORKOUT_LOG_LEVEL);

WorkoutHistory::WorkoutHistory(WorkoutRepository &workout_repository, const char *user_id)
    : repository(workout_repository), user(user_id ? user_id : ""), session_list(), last_summary(),
      failed_saves(0)
{
    k_mutex_init(&history_mutex);
}

int WorkoutHistory::load(const char *user_id)
{
    if (!user_id || user_id[0] == '\0')
    {
        return -EINVAL;
    }

    std::vector<WorkoutSession> loaded;
    int err = repository.loadAll(user_id, loaded);
    if (err)
    {
        LOG_WRN("Failed to load history for %s: %d", user_id, err);
        loaded.clear();
    }

    k_mutex_lock(&history_mutex, K_FOREVER);
    user = user_id;
    session_list = std::move(loaded);
    size_t count = session_list.size();
    k_mutex_unlock(&history_mutex);

    LOG_INF("Loaded %u workouts for %s", (unsigned)count, user_id);
    return err;
}

void WorkoutHistory::append(const WorkoutSession &session)
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    session_list.push_back(session);
    std::string owner = user;
    k_mutex_unlock(&history_mutex);

    int err = repository.save(owner.c_str(), session);
    if (err)
    {
        k_mutex_lock(&history_mutex, K_FOREVER);
        failed_saves++;
        k_mutex_unlock(&history_mutex);
        LOG_WRN("Workout %lld kept locally, save failed: %d", (long long)session.id, err);
        return;
    }

    LOG_INF("Workout %lld saved", (long long)session.id);
}

std::vector<WorkoutSession> WorkoutHistory::sessions() const
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    std::vector<WorkoutSession> copy = session_list;
    k_mutex_unlock(&history_mutex);
    return copy;
}

size_t WorkoutHistory::size() const
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    size_t count = session_list.size();
    k_mutex_unlock(&history_mutex);
    return count;
}

std::string WorkoutHistory::userId() const
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    std::string copy = user;
    k_mutex_unlock(&history_mutex);
    return copy;
}

uint32_t WorkoutHistory::failedSaves() const
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    uint32_t count = failed_saves;
    k_mutex_unlock(&history_mutex);
    return count;
}

void WorkoutHistory::recordSummary(const WorkoutSummary &summary)
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    last_summary = summary;
    k_mutex_unlock(&history_mutex);
}

std::optional<WorkoutSummary> WorkoutHistory::lastSummary() const
{
    k_mutex_lock(&history_mutex, K_FOREVER);
    std::optional<WorkoutSummary> copy = last_summary;
    k_mutex_unlock(&history_mutex);
    return copy;
}
