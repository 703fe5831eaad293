// Portico Socket Utilities - Header

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace portico::core {

/// Host and port split from a listen address
struct ListenAddress {
    std::string host = "0.0.0.0";
    uint16_t port = 0;
};

/// Accepts "3333", ":3333" and "host:3333". Port 0 binds an ephemeral port.
[[nodiscard]] bool parse_listen_address(std::string_view addr, ListenAddress& out);

/// Create a non-blocking IPv4 listening socket
/// @return fd, or -1 with error_out set
[[nodiscard]] int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                                          std::error_code& error_out);

/// Port the socket is actually bound to (resolves port 0)
[[nodiscard]] uint16_t bound_port(int fd) noexcept;

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);

void close_fd(int fd);

}  // namespace portico::core
