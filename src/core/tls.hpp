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

// Portico TLS - Header
// Outbound client TLS material: trust store, client certificate, verification mode

#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/errors.hpp"
#include "../control/settings.hpp"

namespace portico::core {

inline constexpr std::chrono::seconds kDefaultClientTimeout{10};

/// TLS error category for std::error_code
class TlsErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "tls";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get TLS error category instance
[[nodiscard]] const TlsErrorCategory& tls_category() noexcept;

/// Create error_code from current OpenSSL error queue
[[nodiscard]] std::error_code make_tls_error() noexcept;

/// X509_STORE deleter for std::unique_ptr
struct X509StoreDeleter {
    void operator()(X509_STORE* store) const noexcept {
        if (store) {
            X509_STORE_free(store);
        }
    }
};

/// X509 deleter for std::unique_ptr
struct X509Deleter {
    void operator()(X509* cert) const noexcept {
        if (cert) {
            X509_free(cert);
        }
    }
};

/// EVP_PKEY deleter for std::unique_ptr
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

/// Unique pointer types for OpenSSL objects
using X509StorePtr = std::unique_ptr<X509_STORE, X509StoreDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// Client certificate and matching private key
struct ClientCertificate {
    X509Ptr certificate;
    EvpPkeyPtr private_key;
};

/// Explicit TLS override for the outbound client
struct TlsMaterial {
    bool insecure_skip_verify = false;
    X509StorePtr trust_store;                      // null = platform default roots
    std::optional<ClientCertificate> client_cert;  // mutual TLS
};

/// Outbound HTTP client configuration.
/// `tls` is absent unless at least one TLS setting actually applied.
struct ClientConfig {
    std::chrono::seconds timeout = kDefaultClientTimeout;
    std::optional<TlsMaterial> tls;
};

/// Load the platform default trust store
/// @return store, or nullopt with error_out set
[[nodiscard]] std::optional<X509StorePtr> load_system_trust_store(std::error_code& error_out);

/// Parse every PEM certificate in `pem` and add it to `store`
/// @return number of certificates parsed
[[nodiscard]] std::size_t append_certs_from_pem(X509_STORE* store, std::string_view pem);

/// Load a PEM certificate and PEM private key, verifying they match
[[nodiscard]] std::optional<ClientCertificate> load_key_pair(const std::string& cert_path,
                                                             const std::string& key_path,
                                                             std::error_code& error_out);

/// Source of the base trust pool a root CA is appended to
using TrustStoreLoader = std::function<std::optional<X509StorePtr>(std::error_code&)>;

/// Resolve client_timeout_seconds, allow_insecure_conn, root_ca, client_cert and
/// client_key into a client configuration. Later steps layer onto earlier ones.
/// @return configuration, or nullopt with error_out describing the fatal condition
[[nodiscard]] std::optional<ClientConfig> build_client_config(
    const control::Settings& settings, control::FatalError& error_out,
    const TrustStoreLoader& load_trust_store = load_system_trust_store);

/// Initialize OpenSSL library (call once at startup)
void initialize_openssl() noexcept;

/// Cleanup OpenSSL library (call once at shutdown)
void cleanup_openssl() noexcept;

}  // namespace portico::core
