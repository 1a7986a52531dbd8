/**
 * @file fs_workout_store.cpp
 * @brief Workout repository keeping one protobuf file per session
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE fs_workout_store

#include <algorithm>
#include <cstring>
#include <errno.h>

#include <zephyr/fs/fs.h>
#include <zephyr/logging/log.h>
#include <zephyr/sys/printk.h>

#include "fs_workout_store.hpp"
#include <util.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_STORE_LOG_LEVEL); // NOLINT

constexpr char record_suffix[] = ".pb";

FsWorkoutStore::FsWorkoutStore(const char *root_dir) : root(root_dir), record_buffer(), skipped(0)
{
    k_mutex_init(&store_mutex);
}

int FsWorkoutStore::userDir(const char *user_id, char *path, size_t path_size) const
{
    if (!user_id || user_id[0] == '\0' || std::strchr(user_id, '/'))
    {
        return -EINVAL;
    }

    int len = snprintk(path, path_size, "%s/%s", root, user_id);
    if (len < 0 || (size_t)len >= path_size)
    {
        return -ENAMETOOLONG;
    }
    return 0;
}

int FsWorkoutStore::save(const char *user_id, const WorkoutSession &session)
{
    char dir_path[util::max_path_length];
    int ret = userDir(user_id, dir_path, sizeof(dir_path));
    if (ret)
    {
        return ret;
    }

    char file_path[util::max_path_length];
    int len = snprintk(file_path, sizeof(file_path), "%s/%lld%s", dir_path, (long long)session.id, record_suffix);
    if (len < 0 || (size_t)len >= sizeof(file_path))
    {
        return -ENAMETOOLONG;
    }

    k_mutex_lock(&store_mutex, K_FOREVER);

    size_t written = 0;
    ret = workout_encode(session, record_buffer, sizeof(record_buffer), &written);
    if (ret)
    {
        k_mutex_unlock(&store_mutex);
        return ret;
    }

    ret = fs_mkdir(dir_path);
    if (ret != 0 && ret != -EEXIST)
    {
        LOG_ERR("Failed to create %s: %d", dir_path, ret);
        k_mutex_unlock(&store_mutex);
        return ret;
    }

    struct fs_file_t file;
    fs_file_t_init(&file);

    ret = fs_open(&file, file_path, FS_O_CREATE | FS_O_WRITE);
    if (ret != 0)
    {
        LOG_ERR("Failed to open %s: %d", file_path, ret);
        k_mutex_unlock(&store_mutex);
        return ret;
    }

    // Same id overwrites, drop any longer previous content
    ret = fs_truncate(&file, 0);
    if (ret == 0)
    {
        ssize_t wrote = fs_write(&file, record_buffer, written);
        if (wrote < 0)
        {
            ret = (int)wrote;
        }
        else if ((size_t)wrote != written)
        {
            ret = -ENOSPC;
        }
    }
    if (ret == 0)
    {
        ret = fs_sync(&file);
    }

    int close_ret = fs_close(&file);
    k_mutex_unlock(&store_mutex);

    if (ret != 0)
    {
        LOG_ERR("Failed to write %s: %d", file_path, ret);
        return ret;
    }
    if (close_ret != 0)
    {
        LOG_ERR("Failed to close %s: %d", file_path, close_ret);
        return close_ret;
    }

    LOG_DBG("Saved %s (%u bytes)", file_path, (unsigned)written);
    return 0;
}

int FsWorkoutStore::readRecord(const char *path, size_t size, WorkoutSession &session)
{
    if (size == 0 || size > sizeof(record_buffer))
    {
        return -EBADMSG;
    }

    struct fs_file_t file;
    fs_file_t_init(&file);

    int ret = fs_open(&file, path, FS_O_READ);
    if (ret != 0)
    {
        return ret;
    }

    ssize_t got = fs_read(&file, record_buffer, size);
    fs_close(&file);
    if (got < 0)
    {
        return (int)got;
    }
    if ((size_t)got != size)
    {
        return -EBADMSG;
    }

    return workout_decode(record_buffer, size, session);
}

int FsWorkoutStore::loadAll(const char *user_id, std::vector<WorkoutSession> &sessions)
{
    sessions.clear();

    char dir_path[util::max_path_length];
    int ret = userDir(user_id, dir_path, sizeof(dir_path));
    if (ret)
    {
        return ret;
    }

    k_mutex_lock(&store_mutex, K_FOREVER);
    skipped = 0;

    fs_dir_t dirp;
    static struct fs_dirent entry;
    fs_dir_t_init(&dirp);

    ret = fs_opendir(&dirp, dir_path);
    if (ret == -ENOENT)
    {
        // Nothing saved for this user yet
        k_mutex_unlock(&store_mutex);
        return 0;
    }
    if (ret != 0)
    {
        LOG_ERR("Error opening directory %s: %d", dir_path, ret);
        k_mutex_unlock(&store_mutex);
        return ret;
    }

    const size_t suffix_len = strlen(record_suffix);
    while (true)
    {
        ret = fs_readdir(&dirp, &entry);
        if (ret != 0 || entry.name[0] == '\0')
        {
            break;
        }

        size_t name_len = strlen(entry.name);
        if (entry.type != FS_DIR_ENTRY_FILE || name_len <= suffix_len ||
            std::strcmp(entry.name + name_len - suffix_len, record_suffix) != 0)
        {
            continue;
        }

        char file_path[util::max_path_length];
        int len = snprintk(file_path, sizeof(file_path), "%s/%s", dir_path, entry.name);
        if (len < 0 || (size_t)len >= sizeof(file_path))
        {
            skipped++;
            continue;
        }

        WorkoutSession session = {};
        int read_ret = readRecord(file_path, entry.size, session);
        if (read_ret != 0)
        {
            LOG_WRN("Skipping malformed record %s: %d", file_path, read_ret);
            skipped++;
            continue;
        }
        sessions.push_back(std::move(session));
    }
    fs_closedir(&dirp);

    int result = ret;
    k_mutex_unlock(&store_mutex);

    if (result != 0)
    {
        LOG_ERR("Error reading directory %s: %d", dir_path, result);
        sessions.clear();
        return result;
    }

    std::stable_sort(sessions.begin(), sessions.end(), [](const WorkoutSession &a, const WorkoutSession &b) {
        return a.started_at_millis < b.started_at_millis;
    });

    LOG_INF("Loaded %u sessions for %s", (unsigned)sessions.size(), user_id);
    return 0;
}

uint32_t FsWorkoutStore::skippedRecords() const
{
    k_mutex_lock(&store_mutex, K_FOREVER);
    uint32_t count = skipped;
    k_mutex_unlock(&store_mutex);
    return count;
}
