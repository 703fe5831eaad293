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

// Portico Authorizer - Header
// Owner of the outbound client, system cache, backend policy and metrics hooks

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/metrics.hpp"
#include "../control/policy.hpp"
#include "http_client.hpp"
#include "system_cache.hpp"

namespace portico::core {

/// Authorization component as seen by the lifecycle controller
class Authorizer {
public:
    virtual ~Authorizer() = default;

    /// Release background resources (cache refresh). Called before the server is closed.
    virtual void shutdown() = 0;
};

/// Authorizer built from the four resolved configuration objects.
/// The decision engine itself is not part of this component; it exposes the
/// cached system-configuration lookup the engine is built on.
class Manager final : public Authorizer {
public:
    Manager(HttpClient client, std::unique_ptr<SystemCache> cache, control::BackendConfig backend,
            std::optional<control::MetricsReporter> metrics);
    ~Manager() override;

    // Non-copyable, non-movable (cache thread captures this)
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void shutdown() override;

    /// Cached GET of a system configuration document.
    /// Hits invoke the cache-hit hook; misses fetch through the client and invoke the
    /// response hook with host, status and latency.
    /// @return document body, or nullopt with error_out set
    [[nodiscard]] std::optional<std::string> fetch_system_config(const std::string& url,
                                                                 std::error_code& error_out);

    [[nodiscard]] const HttpClient& client() const noexcept { return client_; }
    [[nodiscard]] const SystemCache& cache() const noexcept { return *cache_; }
    [[nodiscard]] const control::BackendConfig& backend() const noexcept { return backend_; }
    [[nodiscard]] const std::optional<control::MetricsReporter>& metrics() const noexcept {
        return metrics_;
    }

private:
    /// Uncached fetch, reporting to the response hook
    [[nodiscard]] std::optional<std::string> fetch_remote(const std::string& url,
                                                          std::error_code& error_out);

    HttpClient client_;
    std::unique_ptr<SystemCache> cache_;
    control::BackendConfig backend_;
    std::optional<control::MetricsReporter> metrics_;
};

}  // namespace portico::core
