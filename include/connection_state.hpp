/**
 * @file connection_state.hpp
 * @brief Externally observable phases of the peripheral link
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_CONNECTION_STATE_HEADER_
#define APP_INCLUDE_CONNECTION_STATE_HEADER_

#include <optional>
#include <string>
#include <variant>

#include <errors.hpp>

namespace conn_state
{
struct Idle
{
};

struct Scanning
{
};

struct Connecting
{
    std::optional<std::string> name;
    std::string address;
};

struct Connected
{
    std::optional<std::string> name;
    std::string address;
};

struct Disconnecting
{
};

struct Error
{
    err_t fault;
    int code; // transport status, 0 when the fault was raised locally
    std::string message;
};
} // namespace conn_state

using ConnectionState = std::variant<conn_state::Idle, conn_state::Scanning, conn_state::Connecting,
                                     conn_state::Connected, conn_state::Disconnecting, conn_state::Error>;

// Builds a visitor out of lambdas, one per alternative
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char *connection_state_name(const ConnectionState &state);

/**
 * @brief Render the state for logs and the shell, e.g. "Connected(NanoHR, C0:11:22:33:44:55)".
 */
std::string connection_state_describe(const ConnectionState &state);

bool connection_state_is_connected(const ConnectionState &state);

/**
 * @brief Whether a transport address is currently owned by the state (Connecting or Connected).
 */
bool connection_state_has_link(const ConnectionState &state);

ConnectionState connection_error(err_t fault, int code, const std::string &message);

#endif // APP_INCLUDE_CONNECTION_STATE_HEADER_
