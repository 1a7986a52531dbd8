/**
 * @file connection_state.cpp
 * @brief Helpers over the ConnectionState variant
 * @version 1.0.0
 * @date 2025-06-02
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <connection_state.hpp>

static std::string describe_peer(const std::optional<std::string> &name, const std::string &address)
{
    return name.value_or("unknown") + ", " + address;
}

const char *connection_state_name(const ConnectionState &state)
{
    return std::visit(overloaded{
                          [](const conn_state::Idle &) { return "Idle"; },
                          [](const conn_state::Scanning &) { return "Scanning"; },
                          [](const conn_state::Connecting &) { return "Connecting"; },
                          [](const conn_state::Connected &) { return "Connected"; },
                          [](const conn_state::Disconnecting &) { return "Disconnecting"; },
                          [](const conn_state::Error &) { return "Error"; },
                      },
                      state);
}

std::string connection_state_describe(const ConnectionState &state)
{
    return std::visit(overloaded{
                          [](const conn_state::Idle &) { return std::string("Idle"); },
                          [](const conn_state::Scanning &) { return std::string("Scanning"); },
                          [](const conn_state::Connecting &s) {
                              return "Connecting(" + describe_peer(s.name, s.address) + ")";
                          },
                          [](const conn_state::Connected &s) {
                              return "Connected(" + describe_peer(s.name, s.address) + ")";
                          },
                          [](const conn_state::Disconnecting &) { return std::string("Disconnecting"); },
                          [](const conn_state::Error &s) { return "Error(" + s.message + ")"; },
                      },
                      state);
}

bool connection_state_is_connected(const ConnectionState &state)
{
    return std::holds_alternative<conn_state::Connected>(state);
}

bool connection_state_has_link(const ConnectionState &state)
{
    return std::visit(overloaded{
                          [](const conn_state::Idle &) { return false; },
                          [](const conn_state::Scanning &) { return false; },
                          [](const conn_state::Connecting &) { return true; },
                          [](const conn_state::Connected &) { return true; },
                          [](const conn_state::Disconnecting &) { return true; },
                          [](const conn_state::Error &) { return false; },
                      },
                      state);
}

ConnectionState connection_error(err_t fault, int code, const std::string &message)
{
    return conn_state::Error{fault, code, message};
}
