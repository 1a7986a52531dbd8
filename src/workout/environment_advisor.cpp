/**
 * @file environment_advisor.cpp
 * @brief Outdoor training suitability from temperature and humidity
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <algorithm>

#include <environment_advisor.hpp>

static constexpr float HEAT_INDEX_MIN_TEMP_C = 26.0f;
static constexpr float HEAT_INDEX_MIN_HUMIDITY = 40.0f;

const char *env_level_name(EnvLevel level)
{
    switch (level)
    {
        case EnvLevel::Excellent:
            return "EXCELLENT";
        case EnvLevel::Good:
            return "GOOD";
        case EnvLevel::Caution:
            return "CAUTION";
        case EnvLevel::HighRisk:
            return "HIGH_RISK";
        case EnvLevel::Dangerous:
            return "DANGEROUS";
    }
    return "UNKNOWN";
}

float environment_effective_temp_c(float temp_c, float rh)
{
    if (temp_c < HEAT_INDEX_MIN_TEMP_C || rh < HEAT_INDEX_MIN_HUMIDITY)
    {
        return temp_c;
    }

    // Rothfusz regression works in Fahrenheit
    float t_f = temp_c * 9.0f / 5.0f + 32.0f;
    float hi_f = -42.379f + 2.04901523f * t_f + 10.14333127f * rh - 0.22475541f * t_f * rh -
                 0.00683783f * t_f * t_f - 0.05481717f * rh * rh + 0.00122874f * t_f * t_f * rh +
                 0.00085282f * t_f * rh * rh - 0.00000199f * t_f * t_f * rh * rh;

    return (hi_f - 32.0f) * 5.0f / 9.0f;
}

std::optional<EnvSuitability> environment_assess(std::optional<float> temp_c, std::optional<float> humidity_percent)
{
    if (!temp_c || !humidity_percent)
    {
        return std::nullopt;
    }

    float rh = std::clamp(*humidity_percent, 0.0f, 100.0f);
    float t = environment_effective_temp_c(*temp_c, rh);

    if (t < 10.0f)
    {
        return EnvSuitability{EnvLevel::Caution, "Cold for outdoor training",
                              "Temperatures below 10C can increase strain on joints and breathing. Warm up longer, "
                              "wear layers, and avoid very intense efforts if you're not acclimated."};
    }
    if (t <= 22.0f && rh < 75.0f)
    {
        return EnvSuitability{EnvLevel::Excellent, "Excellent conditions",
                              "Cool to mild temperatures with moderate humidity, ideal for most workouts. Still "
                              "hydrate, but you can generally train as planned."};
    }
    if (t >= 22.0f && t <= 28.0f && rh < 80.0f)
    {
        return EnvSuitability{EnvLevel::Good, "Good, but stay hydrated",
                              "Slightly warm conditions. Most people can train normally, but drink water regularly "
                              "and back off if you feel unusually fatigued or dizzy."};
    }
    if ((t >= 28.0f && t <= 32.0f) || (t >= 26.0f && rh >= 70.0f))
    {
        return EnvSuitability{EnvLevel::Caution, "Warm & humid, use caution",
                              "Heat stress starts to become significant, especially with high humidity. Shorten "
                              "intervals, take more breaks, and prefer shaded areas. Watch for signs of heat "
                              "exhaustion."};
    }
    if (t >= 32.0f && t <= 38.0f)
    {
        return EnvSuitability{EnvLevel::HighRisk, "High heat stress",
                              "These conditions can cause rapid overheating, especially during intense cardio. "
                              "Reduce intensity and duration, train very early or late in the day, and consider "
                              "moving indoors."};
    }
    if (t >= 38.0f)
    {
        return EnvSuitability{EnvLevel::Dangerous, "Dangerous conditions",
                              "Very high risk of heat illness. Strongly avoid intense outdoor workouts; keep "
                              "sessions short, low-intensity, or move your training indoors."};
    }

    return EnvSuitability{EnvLevel::Good, "Okay to train",
                          "Conditions are generally acceptable, but always listen to your body and hydrate."};
}
