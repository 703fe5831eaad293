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

// Portico Bootstrap - Header
// Startup resolution: settings -> client, cache, backend, metrics -> authorizer -> server

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "../control/errors.hpp"
#include "../control/policy.hpp"
#include "../control/settings.hpp"
#include "../core/adapter_server.hpp"
#include "../core/authorizer.hpp"
#include "../core/metrics_server.hpp"

namespace portico::runtime {

/// Non-secret summary of the resolved startup configuration
struct ResolvedConfig {
    std::string version;
    control::ServerSettings server;
    std::chrono::seconds client_timeout{0};
    bool tls_override = false;
    bool insecure_skip_verify = false;
    bool client_certificate = false;
    control::CacheConfig cache;
    control::BackendConfig backend;
    std::optional<uint16_t> metrics_port;
};

void to_json(nlohmann::json& j, const ResolvedConfig& config);

/// Everything built during startup.
/// Member order is destruction order in reverse: server, then authorizer, then metrics.
struct Application {
    ResolvedConfig config;
    std::unique_ptr<core::MetricsSideband> metrics;
    std::unique_ptr<core::Manager> authorizer;
    std::unique_ptr<core::TcpAdapterServer> server;
};

/// Resolve every component in startup order and bind the adapter listener.
/// Stops at the first fatal condition.
/// @return application, or nullptr with error_out set
[[nodiscard]] std::unique_ptr<Application> build_application(const control::Settings& settings,
                                                             std::string_view version,
                                                             control::FatalError& error_out);

}  // namespace portico::runtime
