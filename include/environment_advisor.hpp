/**
 * @file environment_advisor.hpp
 * @brief Outdoor training suitability from temperature and humidity
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_ENVIRONMENT_ADVISOR_HEADER_
#define APP_INCLUDE_ENVIRONMENT_ADVISOR_HEADER_

#include <optional>

enum class EnvLevel
{
    Excellent,
    Good,
    Caution,
    HighRisk,
    Dangerous,
};

struct EnvSuitability
{
    EnvLevel level;
    const char *summary;
    const char *detail;
};

const char *env_level_name(EnvLevel level);

/**
 * @brief Temperature used for the assessment. Applies the Rothfusz heat index
 * when it is at least 26 C and 40 %RH, otherwise returns @p temp_c.
 */
float environment_effective_temp_c(float temp_c, float humidity_percent);

// Empty unless both readings are known
std::optional<EnvSuitability> environment_assess(std::optional<float> temp_c, std::optional<float> humidity_percent);

#endif // APP_INCLUDE_ENVIRONMENT_ADVISOR_HEADER_
