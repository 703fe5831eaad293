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

// Portico Bootstrap - Implementation

#include "bootstrap.hpp"

#include "../core/http_client.hpp"
#include "../core/logging.hpp"
#include "../core/system_cache.hpp"
#include "../core/tls.hpp"
#include "lifecycle.hpp"

namespace portico::runtime {

void to_json(nlohmann::json& j, const ResolvedConfig& config) {
    j = nlohmann::json{
        {"version", config.version},
        {"server", config.server},
        {"client",
         {{"timeout_seconds", config.client_timeout.count()},
          {"tls_override", config.tls_override},
          {"insecure_skip_verify", config.insecure_skip_verify},
          {"client_certificate", config.client_certificate}}},
        {"cache", config.cache},
        {"backend", config.backend},
    };

    if (config.metrics_port) {
        j["metrics"] = {{"enabled", true}, {"port", *config.metrics_port}};
    } else {
        j["metrics"] = {{"enabled", false}};
    }
}

std::unique_ptr<Application> build_application(const control::Settings& settings,
                                               std::string_view version,
                                               control::FatalError& error_out) {
    auto app = std::make_unique<Application>();
    app->config.version = version.empty() ? std::string(kUndefinedVersion) : std::string(version);
    app->config.server = control::resolve_server_settings(settings);

    auto client_config = core::build_client_config(settings, error_out);
    if (!client_config) {
        return nullptr;
    }
    app->config.client_timeout = client_config->timeout;
    if (client_config->tls) {
        app->config.tls_override = true;
        app->config.insecure_skip_verify = client_config->tls->insecure_skip_verify;
        app->config.client_certificate = client_config->tls->client_cert.has_value();
    }

    auto cache_config = control::resolve_cache_config(settings, error_out);
    if (!cache_config) {
        return nullptr;
    }
    app->config.cache = *cache_config;

    app->config.backend = control::resolve_backend_config(settings);

    app->metrics = core::start_metrics_sideband(settings, app->config.version, error_out);
    if (error_out) {
        return nullptr;
    }

    std::optional<control::MetricsReporter> reporter;
    if (app->metrics) {
        reporter = app->metrics->reporter;
        app->config.metrics_port = app->metrics->reporter.port;
    }

    app->authorizer = std::make_unique<core::Manager>(
        core::HttpClient(std::move(*client_config)), core::make_system_cache(*cache_config),
        app->config.backend, std::move(reporter));

    app->server = core::TcpAdapterServer::create(app->config.server, *app->authorizer, error_out);
    if (!app->server) {
        return nullptr;
    }

    LOG_DEBUG(logging::get_logger(), "resolved configuration: {}",
              nlohmann::json(app->config).dump());
    return app;
}

}  // namespace portico::runtime
