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

// Portico Runtime Policy - Header
// Resolves settings into cache, backend and server policy objects

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "../core/logging.hpp"
#include "errors.hpp"
#include "settings.hpp"

namespace portico::control {

inline constexpr std::string_view kDefaultListenAddr = "3333";
inline constexpr std::chrono::seconds kDefaultConnMaxAge{60};

inline constexpr int kDefaultSystemCacheRetries = 1;
inline constexpr int kDefaultSystemCacheTtlSeconds = 300;
inline constexpr int kDefaultSystemCacheRefreshSeconds = 180;
inline constexpr int kDefaultSystemCacheSize = 1000;

inline constexpr std::chrono::seconds kDefaultBackendCacheFlushInterval{15};

/// System (configuration) response cache sizing and refresh policy
struct CacheConfig {
    int max_size = kDefaultSystemCacheSize;
    std::chrono::seconds ttl{kDefaultSystemCacheTtlSeconds};
    std::chrono::seconds refresh_interval{kDefaultSystemCacheRefreshSeconds};
    int refresh_retries = kDefaultSystemCacheRetries;
};

/// Behavior of the cached backend when the remote backend cannot be reached
enum class FailurePolicy {
    FailOpen,    // Let requests through on backend error
    FailClosed,  // Deny requests on backend error
};

[[nodiscard]] std::string_view to_string(FailurePolicy policy) noexcept;

/// Backend caching policy.
/// When caching is disabled only `logger` is meaningful.
struct BackendConfig {
    bool caching_enabled = false;
    std::chrono::seconds flush_interval{0};
    FailurePolicy policy = FailurePolicy::FailClosed;
    quill::Logger* logger = nullptr;
};

/// Adapter server listen address and connection max age
struct ServerSettings {
    std::string listen_addr{kDefaultListenAddr};
    std::chrono::seconds conn_max_age{kDefaultConnMaxAge};
};

/// Resolve cache sizing. Each field falls back to its default independently.
/// Negative values are rejected (error_out set, nullopt returned).
[[nodiscard]] std::optional<CacheConfig> resolve_cache_config(const Settings& settings,
                                                              FatalError& error_out);

/// Resolve backend caching policy (no fatal paths)
[[nodiscard]] BackendConfig resolve_backend_config(const Settings& settings);

/// FailClosed unless backend_cache_policy_fail_closed is present and false
[[nodiscard]] FailurePolicy resolve_failure_policy(const Settings& settings);

[[nodiscard]] ServerSettings resolve_server_settings(const Settings& settings);

inline void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{{"max_size", c.max_size},
                       {"ttl_seconds", c.ttl.count()},
                       {"refresh_interval_seconds", c.refresh_interval.count()},
                       {"refresh_retries", c.refresh_retries}};
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    if (!b.caching_enabled) {
        j = nlohmann::json{{"caching_enabled", false}};
        return;
    }
    j = nlohmann::json{{"caching_enabled", true},
                       {"flush_interval_seconds", b.flush_interval.count()},
                       {"policy", std::string(to_string(b.policy))}};
}

inline void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{{"listen_addr", s.listen_addr},
                       {"conn_max_age_seconds", s.conn_max_age.count()}};
}

}  // namespace portico::control
