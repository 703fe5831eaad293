/*
 * Copyright 2025 Portico Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Portico Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>

namespace portico::core {

bool parse_listen_address(std::string_view addr, ListenAddress& out) {
    ListenAddress parsed;

    std::string_view port_str = addr;
    size_t colon = addr.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view host = addr.substr(0, colon);
        if (!host.empty()) {
            parsed.host = std::string(host == "localhost" ? "127.0.0.1" : host);
        }
        port_str = addr.substr(colon + 1);
    }

    if (port_str.empty()) {
        return false;
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port > 65535) {
        return false;
    }

    parsed.port = static_cast<uint16_t>(port);
    out = std::move(parsed);
    return true;
}

int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                            std::error_code& error_out) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error_out = std::error_code(errno, std::system_category());
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (auto ec = set_reuseaddr(fd); ec) {
        error_out = ec;
        close_fd(fd);
        return -1;
    }

    // Bind
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        error_out = std::make_error_code(std::errc::invalid_argument);
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error_out = std::error_code(errno, std::system_category());
        close_fd(fd);
        return -1;
    }

    // Listen
    if (listen(fd, backlog) < 0) {
        error_out = std::error_code(errno, std::system_category());
        close_fd(fd);
        return -1;
    }

    // Non-blocking
    if (auto ec = set_nonblocking(fd); ec) {
        error_out = ec;
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t bound_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace portico::core
