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

// Portico Adapter Server - Header
// Main listener of the adapter, supervised by the lifecycle controller

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../control/errors.hpp"
#include "../control/policy.hpp"
#include "authorizer.hpp"
#include "shutdown.hpp"

namespace portico::core {

inline constexpr std::string_view kHealthzPath = "/healthz";

/// Serving loop as seen by the lifecycle controller
class AdapterServer {
public:
    virtual ~AdapterServer() = default;

    /// Blocking serve loop. Posts exactly one ServerTerminated to `events` on return.
    virtual void run(ShutdownQueue& events) = 0;

    /// Request a graceful stop. Returns once the request is registered.
    [[nodiscard]] virtual std::error_code close() = 0;
};

/// TCP listener bound to listen_addr.
/// Answers GET /healthz; connections older than conn_max_age are closed after
/// their current response.
class TcpAdapterServer final : public AdapterServer {
public:
    /// Bind the listener
    /// @return server, or nullptr with error_out set (ServerStartFailed)
    [[nodiscard]] static std::unique_ptr<TcpAdapterServer> create(
        const control::ServerSettings& settings, Authorizer& authorizer,
        control::FatalError& error_out);

    ~TcpAdapterServer() override;

    // Non-copyable, non-movable
    TcpAdapterServer(const TcpAdapterServer&) = delete;
    TcpAdapterServer& operator=(const TcpAdapterServer&) = delete;

    void run(ShutdownQueue& events) override;

    /// Always succeeds. A close before run() makes run() return immediately.
    [[nodiscard]] std::error_code close() override;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const control::ServerSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] Authorizer& authorizer() const noexcept { return authorizer_; }
    [[nodiscard]] size_t connection_count() const noexcept {
        return open_connections_.load(std::memory_order_relaxed);
    }

private:
    TcpAdapterServer(control::ServerSettings settings, Authorizer& authorizer, int listen_fd);

    struct Connection {
        int fd = -1;
        std::chrono::steady_clock::time_point accepted_at;
        std::string buffer;
    };

    [[nodiscard]] std::error_code serve();
    void accept_pending();

    /// @return false when the connection must be closed
    bool handle_readable(Connection& conn);
    [[nodiscard]] bool expired(const Connection& conn,
                               std::chrono::steady_clock::time_point now) const;
    void close_all();

    control::ServerSettings settings_;
    Authorizer& authorizer_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;

    std::vector<Connection> connections_;
    std::atomic<size_t> open_connections_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> closing_{false};
};

}  // namespace portico::core
