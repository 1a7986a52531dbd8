/**
 * @file workout_domain.cpp
 * @brief Activity type names
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <errno.h>
#include <strings.h>

#include <workout_domain.hpp>

const char *activity_type_name(ActivityType type)
{
    switch (type)
    {
        case ActivityType::Walking:
            return "Walking";
        case ActivityType::Running:
            return "Running";
        case ActivityType::Cycling:
            return "Cycling";
        case ActivityType::Yoga:
            return "Yoga";
        case ActivityType::Weightlifting:
            return "Weightlifting";
        case ActivityType::Other:
            return "Other";
    }
    return "Unknown";
}

int activity_type_from_name(const char *name, ActivityType *type)
{
    if (!name || !type)
    {
        return -EINVAL;
    }

    for (int i = 0; i < ACTIVITY_TYPE_COUNT; i++)
    {
        ActivityType candidate = static_cast<ActivityType>(i);
        if (strcasecmp(name, activity_type_name(candidate)) == 0)
        {
            *type = candidate;
            return 0;
        }
    }
    return -EINVAL;
}
