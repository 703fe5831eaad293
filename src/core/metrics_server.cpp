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

// Portico Metrics Server - Implementation
// Sideband HTTP listener serving /metrics and /health on its own port

#include "metrics_server.hpp"

#include <fmt/format.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <nlohmann/json.hpp>

#include "../control/prometheus.hpp"
#include "logging.hpp"
#include "simple_http.hpp"
#include "socket.hpp"

namespace portico::core {

MetricsServer::MetricsServer(const control::SystemMetrics& metrics, std::string version)
    : metrics_(metrics), version_(std::move(version)) {}

MetricsServer::~MetricsServer() {
    stop();
}

std::error_code MetricsServer::bind(uint16_t port) {
    if (listen_fd_ >= 0) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    std::error_code ec;
    int fd = create_listening_socket("0.0.0.0", port, 32, ec);
    if (fd < 0) {
        return ec;
    }

    listen_fd_ = fd;
    port_ = bound_port(fd);
    return {};
}

void MetricsServer::start() {
    if (listen_fd_ < 0 || running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&MetricsServer::run, this);
}

void MetricsServer::stop() {
    running_.store(false, std::memory_order_relaxed);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

void MetricsServer::run() {
    while (running_.load(std::memory_order_relaxed)) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;  // Timeout or EINTR: re-check running_
        }

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }

        // Handle connection (blocking)
        handle_connection(client_fd);
        close_fd(client_fd);
    }
}

void MetricsServer::handle_connection(int client_fd) {
    // Bound the blocking read so one slow scraper cannot stall the loop
    timeval tv{};
    tv.tv_sec = 2;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return;
    }

    char buffer[4096];
    ssize_t n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
    if (n <= 0) {
        return;
    }

    std::string response = handle_request(std::string_view(buffer, static_cast<size_t>(n)));
    send_all(client_fd, response);
}

std::string MetricsServer::handle_request(std::string_view raw_request) const {
    auto req = parse_simple_request(raw_request);
    if (!req.valid) {
        return format_simple_response(400, "text/plain", "Bad Request");
    }

    if (req.method != "GET") {
        return format_simple_response(405, "text/plain", "Method Not Allowed");
    }

    if (req.path == kMetricsPath) {
        std::string body = control::PrometheusExporter::export_metrics(metrics_.snapshot());
        return format_simple_response(200, "text/plain; version=0.0.4", body);
    }

    if (req.path == kHealthPath) {
        nlohmann::json body = {{"status", "healthy"}, {"version", version_}};
        return format_simple_response(200, "application/json", body.dump());
    }

    return format_simple_response(404, "text/plain", "Not Found");
}

std::unique_ptr<MetricsSideband> start_metrics_sideband(const control::Settings& settings,
                                                        std::string_view version,
                                                        control::FatalError& error_out) {
    namespace setting = control::setting;
    using control::FatalError;
    using control::StartupErrc;

    if (!settings.is_set(setting::kReportMetrics) || !settings.get_bool(setting::kReportMetrics)) {
        return nullptr;
    }

    int port = kDefaultMetricsPort;
    if (settings.is_set(setting::kMetricsPort)) {
        port = settings.get_int(setting::kMetricsPort);
    }
    if (port < 0 || port > 65535) {
        error_out = FatalError(StartupErrc::InvalidSetting,
                               fmt::format("metrics_port out of range (got {})", port));
        return nullptr;
    }

    auto sideband = std::make_unique<MetricsSideband>();
    sideband->metrics = std::make_unique<control::SystemMetrics>();
    sideband->server = std::make_unique<MetricsServer>(*sideband->metrics, std::string(version));

    if (auto ec = sideband->server->bind(static_cast<uint16_t>(port)); ec) {
        error_out = FatalError(StartupErrc::MetricsBindFailed,
                               fmt::format("failed to start metrics server {}", ec.message()));
        return nullptr;
    }

    sideband->server->start();
    sideband->reporter = sideband->metrics->make_reporter(sideband->server->port());

    LOG_INFO(logging::get_logger(), "Serving metrics on port {}", sideband->server->port());
    return sideband;
}

}  // namespace portico::core
