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

// Portico Adapter Server - Implementation

#include "adapter_server.hpp"

#include <fmt/format.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "simple_http.hpp"
#include "socket.hpp"

namespace portico::core {

namespace {

constexpr int kListenBacklog = 1024;
constexpr int kPollIntervalMs = 200;
constexpr size_t kMaxRequestHeaderBytes = 8192;

std::string render_response(std::string_view raw_request, bool keep_alive) {
    auto req = parse_simple_request(raw_request);
    if (!req.valid) {
        return format_simple_response(400, "text/plain", "Bad Request", false);
    }

    if (req.method != "GET") {
        return format_simple_response(405, "text/plain", "Method Not Allowed", keep_alive);
    }

    if (req.path == kHealthzPath) {
        nlohmann::json body = {{"status", "SERVING"}};
        return format_simple_response(200, "application/json", body.dump(), keep_alive);
    }

    return format_simple_response(404, "text/plain", "Not Found", keep_alive);
}

}  // namespace

std::unique_ptr<TcpAdapterServer> TcpAdapterServer::create(const control::ServerSettings& settings,
                                                           Authorizer& authorizer,
                                                           control::FatalError& error_out) {
    using control::FatalError;
    using control::StartupErrc;

    ListenAddress addr;
    if (!parse_listen_address(settings.listen_addr, addr)) {
        error_out = FatalError(StartupErrc::ServerStartFailed,
                               fmt::format("Unable to start server: invalid listen address {}",
                                           settings.listen_addr));
        return nullptr;
    }

    std::error_code ec;
    int fd = create_listening_socket(addr.host, addr.port, kListenBacklog, ec);
    if (fd < 0) {
        error_out = FatalError(StartupErrc::ServerStartFailed,
                               fmt::format("Unable to start server: {}", ec.message()));
        return nullptr;
    }

    return std::unique_ptr<TcpAdapterServer>(new TcpAdapterServer(settings, authorizer, fd));
}

TcpAdapterServer::TcpAdapterServer(control::ServerSettings settings, Authorizer& authorizer,
                                   int listen_fd)
    : settings_(std::move(settings)),
      authorizer_(authorizer),
      listen_fd_(listen_fd),
      port_(bound_port(listen_fd)) {}

TcpAdapterServer::~TcpAdapterServer() {
    close_all();
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

void TcpAdapterServer::run(ShutdownQueue& events) {
    if (started_.exchange(true)) {
        return;  // Single serving loop per server
    }

    quill::Logger* logger = logging::get_adapter_logger();
    LOG_INFO(logger, "adapter server listening on port {} (conn_max_age={}s)", port_,
             settings_.conn_max_age.count());

    std::error_code ec = serve();

    close_all();
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }

    if (ec) {
        LOG_ERROR(logger, "adapter server loop failed: {}", ec.message());
    } else {
        LOG_INFO(logger, "adapter server loop exited");
    }
    events.push(ServerTerminated{ec});
}

std::error_code TcpAdapterServer::close() {
    closing_.store(true, std::memory_order_release);
    return {};
}

std::error_code TcpAdapterServer::serve() {
    std::vector<pollfd> fds;

    while (!closing_.load(std::memory_order_acquire)) {
        fds.clear();
        fds.push_back(pollfd{listen_fd_, POLLIN, 0});
        for (const auto& conn : connections_) {
            fds.push_back(pollfd{conn.fd, POLLIN, 0});
        }

        int ready = poll(fds.data(), fds.size(), kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::error_code(errno, std::system_category());
        }

        auto now = std::chrono::steady_clock::now();
        std::vector<bool> keep(connections_.size(), true);

        for (size_t i = 0; i < connections_.size(); ++i) {
            short revents = fds[i + 1].revents;
            if (revents & (POLLERR | POLLNVAL)) {
                keep[i] = false;
            } else if (revents & (POLLIN | POLLHUP)) {
                keep[i] = handle_readable(connections_[i]);
            } else if (expired(connections_[i], now)) {
                keep[i] = false;  // Idle past max age
            }
        }

        // Compact, closing dropped connections
        size_t out = 0;
        for (size_t i = 0; i < connections_.size(); ++i) {
            if (keep[i]) {
                if (out != i) {
                    connections_[out] = std::move(connections_[i]);
                }
                ++out;
            } else {
                close_fd(connections_[i].fd);
            }
        }
        connections_.resize(out);

        if (fds[0].revents & POLLIN) {
            accept_pending();
        }

        open_connections_.store(connections_.size(), std::memory_order_relaxed);
    }

    return {};
}

void TcpAdapterServer::accept_pending() {
    while (true) {
        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            return;  // EAGAIN, or a transient accept error
        }

        if (auto ec = set_nonblocking(client_fd); ec) {
            LOG_WARNING(logging::get_adapter_logger(), "dropping connection: {}", ec.message());
            close_fd(client_fd);
            continue;
        }

        connections_.push_back(Connection{client_fd, std::chrono::steady_clock::now(), {}});
    }
}

bool TcpAdapterServer::handle_readable(Connection& conn) {
    char chunk[4096];
    while (true) {
        ssize_t n = recv(conn.fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            conn.buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;  // Peer closed
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        return false;
    }

    auto header_end = conn.buffer.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (conn.buffer.size() > kMaxRequestHeaderBytes) {
            send_all(conn.fd, format_simple_response(431, "text/plain",
                                                     "Request Header Fields Too Large"));
            return false;
        }
        return true;  // Wait for the rest of the headers
    }

    std::string request = conn.buffer.substr(0, header_end + 4);
    conn.buffer.erase(0, header_end + 4);

    // Past max age the connection gets one last response
    bool keep_alive = !expired(conn, std::chrono::steady_clock::now());
    if (!send_all(conn.fd, render_response(request, keep_alive))) {
        return false;
    }
    return keep_alive;
}

bool TcpAdapterServer::expired(const Connection& conn,
                               std::chrono::steady_clock::time_point now) const {
    if (settings_.conn_max_age <= std::chrono::seconds::zero()) {
        return false;  // No limit
    }
    return now - conn.accepted_at >= settings_.conn_max_age;
}

void TcpAdapterServer::close_all() {
    for (const auto& conn : connections_) {
        close_fd(conn.fd);
    }
    connections_.clear();
    open_connections_.store(0, std::memory_order_relaxed);
}

}  // namespace portico::core
