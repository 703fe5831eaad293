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

// Portico HTTP Client - Implementation

#include "http_client.hpp"

#include <httplib.h>

#include <charconv>

namespace portico::core {

std::string HttpErrorCategory::message(int ev) const {
    return httplib::to_string(static_cast<httplib::Error>(ev));
}

const HttpErrorCategory& http_category() noexcept {
    static HttpErrorCategory instance;
    return instance;
}

std::optional<ParsedUrl> parse_url(std::string_view url) {
    ParsedUrl out;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    out.scheme = std::string(url.substr(0, scheme_end));
    if (out.scheme != "http" && out.scheme != "https") {
        return std::nullopt;
    }
    out.port = out.scheme == "https" ? 443 : 80;

    std::string_view rest = url.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        out.path = "/";
    } else {
        out.path = std::string(rest.substr(path_start));
        if (out.path.front() == '?') {
            out.path.insert(out.path.begin(), '/');
        }
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view port_str = authority.substr(colon + 1);
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    out.host = std::string(authority);
    return out;
}

namespace {

template <typename ClientT>
void apply_timeouts(ClientT& client, std::chrono::seconds timeout) {
    if (timeout <= std::chrono::seconds::zero()) {
        return;  // No client timeout: keep the library defaults
    }
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
}

std::optional<HttpResponse> to_response(httplib::Result res, std::error_code& error_out) {
    if (!res) {
        error_out = std::error_code(static_cast<int>(res.error()), http_category());
        return std::nullopt;
    }
    return HttpResponse{res->status, std::move(res->body)};
}

}  // namespace

std::optional<HttpResponse> HttpClient::get(std::string_view url,
                                            std::error_code& error_out) const {
    auto parsed = parse_url(url);
    if (!parsed) {
        error_out = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    if (parsed->scheme == "http") {
        httplib::Client client(parsed->host, parsed->port);
        apply_timeouts(client, config_.timeout);
        return to_response(client.Get(parsed->path), error_out);
    }

    if (!config_.tls) {
        // Platform default transport
        httplib::SSLClient client(parsed->host, parsed->port);
        apply_timeouts(client, config_.timeout);
        return to_response(client.Get(parsed->path), error_out);
    }

    const TlsMaterial& tls = *config_.tls;
    X509* cert = tls.client_cert ? tls.client_cert->certificate.get() : nullptr;
    EVP_PKEY* key = tls.client_cert ? tls.client_cert->private_key.get() : nullptr;

    // SSLClient copies references to cert/key into its own SSL_CTX
    httplib::SSLClient client(parsed->host, parsed->port, cert, key);
    if (!client.is_valid()) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    if (tls.trust_store) {
        // The SSL_CTX takes ownership of the store it is given
        X509_STORE_up_ref(tls.trust_store.get());
        client.set_ca_cert_store(tls.trust_store.get());
    }
    client.enable_server_certificate_verification(!tls.insecure_skip_verify);
    apply_timeouts(client, config_.timeout);

    return to_response(client.Get(parsed->path), error_out);
}

}  // namespace portico::core
