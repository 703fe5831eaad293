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

// Portico Settings - Header
// Immutable key/value settings bound once from the process environment

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace portico::control {

/// Setting names bound at startup. The environment variable is the upper-case spelling.
namespace setting {
inline constexpr std::string_view kLogLevel = "log_level";
inline constexpr std::string_view kLogJson = "log_json";
inline constexpr std::string_view kLogGrpc = "log_grpc";
inline constexpr std::string_view kListenAddr = "listen_addr";
inline constexpr std::string_view kReportMetrics = "report_metrics";
inline constexpr std::string_view kMetricsPort = "metrics_port";

inline constexpr std::string_view kCacheTtlSeconds = "cache_ttl_seconds";
inline constexpr std::string_view kCacheRefreshSeconds = "cache_refresh_seconds";
inline constexpr std::string_view kCacheEntriesMax = "cache_entries_max";
inline constexpr std::string_view kCacheRefreshRetries = "cache_refresh_retries";

inline constexpr std::string_view kClientTimeoutSeconds = "client_timeout_seconds";
inline constexpr std::string_view kAllowInsecureConn = "allow_insecure_conn";
inline constexpr std::string_view kRootCa = "root_ca";
inline constexpr std::string_view kClientCert = "client_cert";
inline constexpr std::string_view kClientKey = "client_key";

inline constexpr std::string_view kGrpcConnMaxSeconds = "grpc_conn_max_seconds";

inline constexpr std::string_view kUseCachedBackend = "use_cached_backend";
inline constexpr std::string_view kBackendCacheFlushIntervalSeconds =
    "backend_cache_flush_interval_seconds";
inline constexpr std::string_view kBackendCachePolicyFailClosed =
    "backend_cache_policy_fail_closed";

inline constexpr std::array<std::string_view, 19> kAll = {
    kLogLevel,
    kLogJson,
    kLogGrpc,
    kListenAddr,
    kReportMetrics,
    kMetricsPort,
    kCacheTtlSeconds,
    kCacheRefreshSeconds,
    kCacheEntriesMax,
    kCacheRefreshRetries,
    kClientTimeoutSeconds,
    kAllowInsecureConn,
    kRootCa,
    kClientCert,
    kClientKey,
    kGrpcConnMaxSeconds,
    kUseCachedBackend,
    kBackendCacheFlushIntervalSeconds,
    kBackendCachePolicyFailClosed,
};
}  // namespace setting

/// Read-only settings store.
/// A key is either absent (callers fall back to their default) or present with a raw
/// string value. Typed getters return the zero value for absent or unparsable input.
class Settings {
public:
    using Values = std::unordered_map<std::string, std::string>;

    Settings() = default;
    explicit Settings(Values values) : values_(std::move(values)) {}

    /// Bind every name in setting::kAll from its upper-case environment variable.
    /// A variable that exists with an empty value counts as set.
    [[nodiscard]] static Settings from_environment();

    [[nodiscard]] bool is_set(std::string_view name) const;

    [[nodiscard]] std::string get_string(std::string_view name) const;

    /// Decimal integer with optional sign; 0 when absent or malformed
    [[nodiscard]] int get_int(std::string_view name) const;

    /// 1/t/T/TRUE/true/True and 0/f/F/FALSE/false/False; false otherwise
    [[nodiscard]] bool get_bool(std::string_view name) const;

private:
    [[nodiscard]] const std::string* find(std::string_view name) const;

    Values values_;
};

/// Parse helpers shared with tests
[[nodiscard]] bool parse_bool(std::string_view raw, bool& out) noexcept;
[[nodiscard]] bool parse_int(std::string_view raw, int& out) noexcept;

}  // namespace portico::control
