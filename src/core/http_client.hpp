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

// Portico HTTP Client - Header
// Outbound HTTP(S) client built from a resolved ClientConfig

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "tls.hpp"

namespace portico::core {

/// Outbound HTTP error category (wraps httplib::Error)
class HttpErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "http";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const HttpErrorCategory& http_category() noexcept;

/// Split absolute URL
struct ParsedUrl {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;  // includes query, "/" when empty
};

/// Parse "scheme://host[:port][/path]"; nullopt for anything else
[[nodiscard]] std::optional<ParsedUrl> parse_url(std::string_view url);

struct HttpResponse {
    int status = 0;
    std::string body;
};

/// HTTP client owning its configuration (timeout and optional TLS override).
/// Without a TLS override, https requests use the platform default trust roots
/// and verify the server certificate.
class HttpClient {
public:
    explicit HttpClient(ClientConfig config) : config_(std::move(config)) {}

    // Movable but not copyable (owns OpenSSL objects)
    HttpClient(HttpClient&&) = default;
    HttpClient& operator=(HttpClient&&) = default;
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Blocking GET
    /// @return response (any status), or nullopt with error_out set on transport failure
    [[nodiscard]] std::optional<HttpResponse> get(std::string_view url,
                                                  std::error_code& error_out) const;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    /// True when an explicit TLS configuration replaces the default transport
    [[nodiscard]] bool has_tls_override() const noexcept { return config_.tls.has_value(); }

private:
    ClientConfig config_;
};

}  // namespace portico::core
