/**
 * @file storage.hpp
 * @brief External flash file system used for workout history
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_STORAGE_HEADER_
#define APP_INCLUDE_STORAGE_HEADER_

#include <errors.hpp>

constexpr char storage_mount_point[] = "/lfs1";
constexpr char workout_dir_path[] = "/lfs1/workouts";

// Mount LittleFS at storage_mount_point, wiping it first when CONFIG_SMARTGYM_WIPE_STORAGE is set
err_t storage_init();

#endif // APP_INCLUDE_STORAGE_HEADER_
