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

// Portico Runtime Policy - Implementation

#include "policy.hpp"

#include <fmt/format.h>

namespace portico::control {

namespace {

// Overrides `value` when `name` is set; rejects negatives
bool resolve_non_negative(const Settings& settings, std::string_view name, int& value,
                          FatalError& error_out) {
    if (!settings.is_set(name)) {
        return true;
    }

    int parsed = settings.get_int(name);
    if (parsed < 0) {
        error_out = FatalError(StartupErrc::InvalidSetting,
                               fmt::format("{} must not be negative (got {})", name, parsed));
        return false;
    }

    value = parsed;
    return true;
}

}  // namespace

std::string_view to_string(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::FailOpen:
            return "open";
        case FailurePolicy::FailClosed:
            return "closed";
    }
    return "closed";
}

std::optional<CacheConfig> resolve_cache_config(const Settings& settings, FatalError& error_out) {
    int ttl = kDefaultSystemCacheTtlSeconds;
    int refresh = kDefaultSystemCacheRefreshSeconds;
    int max_size = kDefaultSystemCacheSize;
    int retries = kDefaultSystemCacheRetries;

    if (!resolve_non_negative(settings, setting::kCacheTtlSeconds, ttl, error_out) ||
        !resolve_non_negative(settings, setting::kCacheRefreshSeconds, refresh, error_out) ||
        !resolve_non_negative(settings, setting::kCacheEntriesMax, max_size, error_out) ||
        !resolve_non_negative(settings, setting::kCacheRefreshRetries, retries, error_out)) {
        return std::nullopt;
    }

    CacheConfig config;
    config.max_size = max_size;
    config.ttl = std::chrono::seconds(ttl);
    config.refresh_interval = std::chrono::seconds(refresh);
    config.refresh_retries = retries;
    return config;
}

FailurePolicy resolve_failure_policy(const Settings& settings) {
    quill::Logger* logger = logging::get_logger();

    if (settings.is_set(setting::kBackendCachePolicyFailClosed) &&
        !settings.get_bool(setting::kBackendCachePolicyFailClosed)) {
        LOG_INFO(logger, "backend cache fail policy set to open");
        return FailurePolicy::FailOpen;
    }

    LOG_INFO(logger, "backend cache fail policy set to closed");
    return FailurePolicy::FailClosed;
}

BackendConfig resolve_backend_config(const Settings& settings) {
    quill::Logger* logger = logging::get_logger();

    BackendConfig config;
    config.logger = logger;

    if (!settings.get_bool(setting::kUseCachedBackend)) {
        return config;
    }

    auto interval =
        std::chrono::seconds(settings.get_int(setting::kBackendCacheFlushIntervalSeconds));
    if (interval == std::chrono::seconds::zero()) {
        interval = kDefaultBackendCacheFlushInterval;
    }

    LOG_INFO(logger, "backend cache set to flush at {}s intervals", interval.count());

    config.caching_enabled = true;
    config.flush_interval = interval;
    config.policy = resolve_failure_policy(settings);
    return config;
}

ServerSettings resolve_server_settings(const Settings& settings) {
    ServerSettings out;

    if (settings.is_set(setting::kListenAddr)) {
        out.listen_addr = settings.get_string(setting::kListenAddr);
    }

    if (settings.is_set(setting::kGrpcConnMaxSeconds)) {
        out.conn_max_age = std::chrono::seconds(settings.get_int(setting::kGrpcConnMaxSeconds));
    }

    return out;
}

}  // namespace portico::control
