/**
 * @file storage.cpp
 * @brief External flash file system used for workout history
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE storage

#include <errno.h>

#include <zephyr/fs/fs.h>
#include <zephyr/fs/littlefs.h>
#include <zephyr/logging/log.h>
#include <zephyr/storage/flash_map.h>

#include <storage.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SMARTGYM_STORE_LOG_LEVEL); // NOLINT

FS_LITTLEFS_DECLARE_DEFAULT_CONFIG(littlefs_storage);
#define STORAGE_PARTITION_LABEL storage_ext
#define STORAGE_PARTITION_ID FIXED_PARTITION_ID(STORAGE_PARTITION_LABEL)
static struct fs_mount_t lfs_storage_mnt = {};

static bool mounted = false;

static err_t littlefs_flash_erase(unsigned int id)
{
    const struct flash_area *pfa;

    int rc = flash_area_open(id, &pfa);
    if (rc < 0)
    {
        LOG_ERR("Unable to find flash area %u: %d", id, rc);
        return err_t::STORAGE_ERROR;
    }

    LOG_WRN("Erasing flash area %u, %u bytes", id, (unsigned int)pfa->fa_size);
    rc = flash_area_flatten(pfa, 0, pfa->fa_size);
    flash_area_close(pfa);
    if (rc != 0)
    {
        LOG_ERR("Failed to erase flash area: %d", rc);
        return err_t::STORAGE_ERROR;
    }
    return err_t::NO_ERROR;
}

err_t storage_init()
{
    if (mounted)
    {
        return err_t::NO_ERROR;
    }

    lfs_storage_mnt.type = FS_LITTLEFS;
    lfs_storage_mnt.mnt_point = storage_mount_point;
    lfs_storage_mnt.fs_data = &littlefs_storage;
    lfs_storage_mnt.storage_dev = (void *)STORAGE_PARTITION_ID;

    if (IS_ENABLED(CONFIG_SMARTGYM_WIPE_STORAGE))
    {
        err_t err = littlefs_flash_erase(STORAGE_PARTITION_ID);
        if (err != err_t::NO_ERROR)
        {
            return err;
        }
    }

    int ret = fs_mount(&lfs_storage_mnt);
    if (ret != 0)
    {
        LOG_ERR("FS mount failed: %d", ret);
        return err_t::STORAGE_ERROR;
    }

    ret = fs_mkdir(workout_dir_path);
    if (ret != 0 && ret != -EEXIST)
    {
        LOG_ERR("Failed to create %s: %d", workout_dir_path, ret);
        return err_t::STORAGE_ERROR;
    }

    mounted = true;
    LOG_INF("File system mounted at %s", storage_mount_point);
    return err_t::NO_ERROR;
}
