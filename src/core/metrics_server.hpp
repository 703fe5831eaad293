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

// Portico Metrics Server - Header
// Sideband HTTP listener serving /metrics and /health on its own port

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "../control/errors.hpp"
#include "../control/metrics.hpp"
#include "../control/settings.hpp"

namespace portico::core {

inline constexpr std::string_view kMetricsPath = "/metrics";
inline constexpr std::string_view kHealthPath = "/health";
inline constexpr uint16_t kDefaultMetricsPort = 8080;

/// Lightweight metrics server for the sideband port.
/// Uses simple blocking I/O per connection (not performance-critical).
class MetricsServer {
public:
    MetricsServer(const control::SystemMetrics& metrics, std::string version);
    ~MetricsServer();

    // Non-copyable, non-movable (owns thread)
    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    /// Bind and listen on all interfaces at `port` (0 = ephemeral)
    [[nodiscard]] std::error_code bind(uint16_t port);

    /// Run accept loop on a background thread
    void start();

    /// Stop the accept loop and join the thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Actual bound port (valid after bind)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Render a response for one request (exposed for tests)
    [[nodiscard]] std::string handle_request(std::string_view raw_request) const;

private:
    void run();
    void handle_connection(int client_fd);

    const control::SystemMetrics& metrics_;
    std::string version_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

/// Metrics collector, its listener and the callbacks wired to them.
/// Member order matters: the server stops before the collector is destroyed.
struct MetricsSideband {
    std::unique_ptr<control::SystemMetrics> metrics;
    std::unique_ptr<MetricsServer> server;
    control::MetricsReporter reporter;
};

/// Start the sideband when report_metrics is set and true.
/// @return running sideband; nullptr when disabled (error_out untouched) or on a
///         fatal bind failure (error_out set)
[[nodiscard]] std::unique_ptr<MetricsSideband> start_metrics_sideband(
    const control::Settings& settings, std::string_view version, control::FatalError& error_out);

}  // namespace portico::core
