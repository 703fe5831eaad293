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

// Portico TLS - Implementation
// Outbound client TLS material: trust store, client certificate, verification mode

#include "tls.hpp"

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cerrno>
#include <fstream>
#include <sstream>

#include "logging.hpp"

namespace portico::core {

// ============================
// Error Handling
// ============================

std::string TlsErrorCategory::message(int ev) const {
    char buf[256];
    ERR_error_string_n(static_cast<unsigned long>(ev), buf, sizeof(buf));
    return std::string(buf);
}

const TlsErrorCategory& tls_category() noexcept {
    static TlsErrorCategory instance;
    return instance;
}

std::error_code make_tls_error() noexcept {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        // No error in queue - return generic TLS error
        return std::error_code(1, tls_category());
    }
    return std::error_code(static_cast<int>(err), tls_category());
}

// ============================
// Trust Store
// ============================

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept {
        if (bio) {
            BIO_free(bio);
        }
    }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::optional<std::string> read_file(const std::string& path, std::error_code& error_out) {
    std::ifstream file{path, std::ios::binary};
    if (!file.is_open()) {
        error_out = std::error_code(errno ? errno : ENOENT, std::generic_category());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error_out = std::error_code(EIO, std::generic_category());
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace

std::optional<X509StorePtr> load_system_trust_store(std::error_code& error_out) {
    X509StorePtr store(X509_STORE_new());
    if (!store) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    if (X509_STORE_set_default_paths(store.get()) != 1) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    return store;
}

std::size_t append_certs_from_pem(X509_STORE* store, std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return 0;
    }

    std::size_t parsed = 0;
    while (X509Ptr cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)}) {
        // Duplicates are not an error; the store keeps one copy
        X509_STORE_add_cert(store, cert.get());
        ++parsed;
    }

    // PEM_read_bio_X509 leaves "no start line" in the queue at end of input
    ERR_clear_error();
    return parsed;
}

std::optional<ClientCertificate> load_key_pair(const std::string& cert_path,
                                               const std::string& key_path,
                                               std::error_code& error_out) {
    ERR_clear_error();

    BioPtr cert_bio(BIO_new_file(cert_path.c_str(), "r"));
    if (!cert_bio) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    X509Ptr cert(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    BioPtr key_bio(BIO_new_file(key_path.c_str(), "r"));
    if (!key_bio) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    EvpPkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    // Verify private key matches certificate
    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    return ClientCertificate{std::move(cert), std::move(key)};
}

// ============================
// Client Configuration
// ============================

std::optional<ClientConfig> build_client_config(const control::Settings& settings,
                                                control::FatalError& error_out,
                                                const TrustStoreLoader& load_trust_store) {
    namespace setting = control::setting;
    using control::FatalError;
    using control::StartupErrc;

    quill::Logger* logger = logging::get_logger();

    ClientConfig config;
    if (settings.is_set(setting::kClientTimeoutSeconds)) {
        config.timeout = std::chrono::seconds(settings.get_int(setting::kClientTimeoutSeconds));
    }

    // Populated unconditionally; only attached when something marked it in use
    TlsMaterial tls;
    bool use_tls_config = false;

    if (settings.is_set(setting::kAllowInsecureConn)) {
        tls.insecure_skip_verify = settings.get_bool(setting::kAllowInsecureConn);
        use_tls_config = true;
    }

    if (settings.is_set(setting::kRootCa)) {
        std::string root_ca_path = settings.get_string(setting::kRootCa);
        if (!root_ca_path.empty()) {
            std::error_code ec;
            auto pool = load_trust_store(ec);
            if (!pool) {
                LOG_ERROR(logger,
                          "failed to read system certificates {}, trying to read CA certs anyway",
                          ec.message());
                pool = X509StorePtr(X509_STORE_new());
                if (!*pool) {
                    error_out = FatalError(StartupErrc::RootCaUnreadable,
                                           fmt::format("failed to allocate certificate pool - {}",
                                                       make_tls_error().message()));
                    return std::nullopt;
                }
            }

            auto pem = read_file(root_ca_path, ec);
            if (!pem) {
                error_out = FatalError(
                    StartupErrc::RootCaUnreadable,
                    fmt::format("failed to read root CA file {} - {}", root_ca_path, ec.message()));
                return std::nullopt;
            }

            if (append_certs_from_pem(pool->get(), *pem) == 0) {
                error_out = FatalError(
                    StartupErrc::RootCaUnparsable,
                    fmt::format("failed to parse root CA certificates from {}", root_ca_path));
                return std::nullopt;
            }

            tls.trust_store = std::move(*pool);
            use_tls_config = true;
        }
    }

    std::string cert_path = settings.get_string(setting::kClientCert);
    std::string key_path = settings.get_string(setting::kClientKey);
    if (!cert_path.empty()) {
        if (!settings.is_set(setting::kClientKey)) {
            error_out = FatalError(
                StartupErrc::ClientCertKeyMismatch,
                "both client_cert and client_key must be provided if you set any of them");
            return std::nullopt;
        }

        if (key_path.empty()) {
            error_out = FatalError(StartupErrc::ClientKeyEmpty, "empty client_key path");
            return std::nullopt;
        }

        std::error_code ec;
        auto pair = load_key_pair(cert_path, key_path, ec);
        if (!pair) {
            error_out = FatalError(StartupErrc::ClientKeyPairInvalid,
                                   fmt::format("error creating X509 key pair from {} and {} - {}",
                                               cert_path, key_path, ec.message()));
            return std::nullopt;
        }

        tls.client_cert = std::move(*pair);
        use_tls_config = true;
    } else if (!key_path.empty()) {
        // Key without certificate is the same partial pair
        error_out = FatalError(
            StartupErrc::ClientCertKeyMismatch,
            "both client_cert and client_key must be provided if you set any of them");
        return std::nullopt;
    }

    if (use_tls_config) {
        LOG_DEBUG(logger, "outbound client TLS override: insecure_skip_verify={}, custom_roots={}, "
                          "client_cert={}",
                  tls.insecure_skip_verify, tls.trust_store != nullptr,
                  tls.client_cert.has_value());
        config.tls = std::move(tls);
    }

    return config;
}

// ============================
// OpenSSL Initialization
// ============================

void initialize_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-initializes, but we call this for compatibility
    OPENSSL_init_ssl(0, nullptr);
}

void cleanup_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-cleans up, but we call this for completeness
    EVP_cleanup();
}

}  // namespace portico::core
