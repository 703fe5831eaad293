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

// Portico Authorizer - Implementation

#include "authorizer.hpp"

#include <chrono>

#include "logging.hpp"

namespace portico::core {

Manager::Manager(HttpClient client, std::unique_ptr<SystemCache> cache,
                 control::BackendConfig backend, std::optional<control::MetricsReporter> metrics)
    : client_(std::move(client)),
      cache_(std::move(cache)),
      backend_(backend),
      metrics_(std::move(metrics)) {
    quill::Logger* logger = backend_.logger ? backend_.logger : logging::get_logger();
    LOG_INFO(logger,
             "authorizer ready: client_timeout={}s, tls_override={}, cache_max={}, "
             "cached_backend={}, metrics={}",
             client_.config().timeout.count(), client_.has_tls_override(),
             cache_->config().max_size, backend_.caching_enabled, metrics_.has_value());

    cache_->start_refresh([this](const std::string& url) -> std::optional<std::string> {
        std::error_code ec;
        return fetch_remote(url, ec);
    });
}

Manager::~Manager() {
    shutdown();
}

void Manager::shutdown() {
    cache_->stop();
}

std::optional<std::string> Manager::fetch_system_config(const std::string& url,
                                                        std::error_code& error_out) {
    if (auto cached = cache_->get(url)) {
        if (metrics_ && metrics_->cache_hit_cb) {
            metrics_->cache_hit_cb();
        }
        return cached;
    }

    auto body = fetch_remote(url, error_out);
    if (body) {
        cache_->set(url, *body);
    }
    return body;
}

std::optional<std::string> Manager::fetch_remote(const std::string& url,
                                                 std::error_code& error_out) {
    auto started = std::chrono::steady_clock::now();
    auto response = client_.get(url, error_out);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (!response) {
        LOG_WARNING(logging::get_logger(), "system request failed: url={}, error={}", url,
                    error_out.message());
        return std::nullopt;
    }

    if (metrics_ && metrics_->response_cb) {
        auto parsed = parse_url(url);
        metrics_->response_cb(parsed ? parsed->host : std::string(), response->status, elapsed);
    }

    if (response->status < 200 || response->status >= 300) {
        error_out = std::make_error_code(std::errc::bad_message);
        LOG_WARNING(logging::get_logger(), "system request rejected: url={}, status={}", url,
                    response->status);
        return std::nullopt;
    }

    return std::move(response->body);
}

}  // namespace portico::core
