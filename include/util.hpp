/**
 * @file util.hpp
 * @brief Small helpers shared across modules
 * @version 1.1
 * @date 2/6/2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_UTIL_H_
#define APP_INCLUDE_UTIL_H_

#include <cstddef>
#include <cstring>
#include <type_traits>
#include <utility>

namespace util
{
constexpr std::size_t max_path_length = CONFIG_SMARTGYM_MAX_PATH_LEN;

/**
 * @brief Bounded copy that always terminates @p dst.
 *
 * @return Number of characters copied, excluding the terminator.
 */
inline std::size_t copy_string(char *dst, std::size_t dst_size, const char *src)
{
    if (!dst || dst_size == 0)
    {
        return 0;
    }
    if (!src)
    {
        dst[0] = '\0';
        return 0;
    }

    std::size_t len = strnlen(src, dst_size - 1);
    memcpy(dst, src, len);
    dst[len] = '\0';
    return len;
}

} // namespace util

// Get value of a enum
template <typename E> constexpr typename std::underlying_type<E>::type to_underlying(E e)
{
    return static_cast<typename std::underlying_type<E>::type>(e);
}

#endif // APP_INCLUDE_UTIL_H_
