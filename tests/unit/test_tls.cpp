// Portico TLS Tests
// Unit tests for outbound client TLS resolution and OpenSSL helpers

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <unistd.h>

#include "../../src/control/errors.hpp"
#include "../../src/control/settings.hpp"
#include "../../src/core/tls.hpp"

using namespace portico::core;
using portico::control::FatalError;
using portico::control::Settings;
using portico::control::StartupErrc;

namespace {

// Self-signed certificate and key written as PEM files under a scratch directory
struct PemFixture {
    std::filesystem::path dir;
    std::string cert_path;
    std::string key_path;
    std::string other_key_path;  // key that does not match cert_path
    std::string garbage_path;

    PemFixture() {
        dir = std::filesystem::temp_directory_path() /
              ("portico_tls_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir);

        cert_path = (dir / "cert.pem").string();
        key_path = (dir / "key.pem").string();
        other_key_path = (dir / "other_key.pem").string();
        garbage_path = (dir / "garbage.pem").string();

        EvpPkeyPtr key(EVP_RSA_gen(2048));
        EvpPkeyPtr other_key(EVP_RSA_gen(2048));
        X509Ptr cert(make_self_signed(key.get()));

        write_key(key_path, key.get());
        write_key(other_key_path, other_key.get());
        write_cert(cert_path, cert.get());

        std::ofstream(garbage_path) << "this is not a certificate\n";
    }

    ~PemFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    static X509* make_self_signed(EVP_PKEY* key) {
        X509* cert = X509_new();
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 60L * 60 * 24);
        X509_set_pubkey(cert, key);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("portico-test"), -1, -1,
                                   0);
        X509_set_issuer_name(cert, name);
        X509_sign(cert, key, EVP_sha256());
        return cert;
    }

    static void write_key(const std::string& path, EVP_PKEY* key) {
        FILE* f = fopen(path.c_str(), "w");
        PEM_write_PrivateKey(f, key, nullptr, nullptr, 0, nullptr, nullptr);
        fclose(f);
    }

    static void write_cert(const std::string& path, X509* cert) {
        FILE* f = fopen(path.c_str(), "w");
        PEM_write_X509(f, cert);
        fclose(f);
    }
};

std::string read_all(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

// ============================
// Defaults
// ============================

TEST_CASE("Client config without TLS settings", "[tls][client]") {
    FatalError error;
    auto config = build_client_config(Settings{}, error);

    REQUIRE(config.has_value());
    REQUIRE_FALSE(error);
    REQUIRE(config->timeout == std::chrono::seconds(10));
    REQUIRE_FALSE(config->tls.has_value());
}

TEST_CASE("Client timeout override", "[tls][client]") {
    FatalError error;
    auto config = build_client_config(Settings(Settings::Values{{"client_timeout_seconds", "3"}}),
                                      error);

    REQUIRE(config.has_value());
    REQUIRE(config->timeout == std::chrono::seconds(3));
    REQUIRE_FALSE(config->tls.has_value());
}

// ============================
// Insecure Mode
// ============================

TEST_CASE("Insecure flag activates the TLS override", "[tls][insecure]") {
    SECTION("Explicit false still attaches TLS material") {
        FatalError error;
        auto config =
            build_client_config(Settings(Settings::Values{{"allow_insecure_conn", "false"}}), error);

        REQUIRE(config.has_value());
        REQUIRE(config->tls.has_value());
        REQUIRE_FALSE(config->tls->insecure_skip_verify);
        REQUIRE(config->tls->trust_store == nullptr);
        REQUIRE_FALSE(config->tls->client_cert.has_value());
    }

    SECTION("Insecure with empty root_ca leaves the trust pool alone") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"allow_insecure_conn", "true"}, {"root_ca", ""}}), error);

        REQUIRE(config.has_value());
        REQUIRE(config->tls.has_value());
        REQUIRE(config->tls->insecure_skip_verify);
        REQUIRE(config->tls->trust_store == nullptr);
    }

    SECTION("Empty root_ca alone is a no-op") {
        FatalError error;
        auto config = build_client_config(Settings(Settings::Values{{"root_ca", ""}}), error);

        REQUIRE(config.has_value());
        REQUIRE_FALSE(config->tls.has_value());
    }
}

// ============================
// Root CA
// ============================

TEST_CASE("Root CA loading", "[tls][root_ca]") {
    PemFixture pem;

    SECTION("Unreadable file is fatal") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"root_ca", "/nonexistent/portico/ca.pem"}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::RootCaUnreadable);
        REQUIRE(error.message.find("failed to read root CA file /nonexistent/portico/ca.pem") !=
                std::string::npos);
    }

    SECTION("Unparsable file is fatal") {
        FatalError error;
        auto config =
            build_client_config(Settings(Settings::Values{{"root_ca", pem.garbage_path}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::RootCaUnparsable);
        REQUIRE(error.message == "failed to parse root CA certificates from " + pem.garbage_path);
    }

    SECTION("Valid CA is appended to the pool") {
        FatalError error;
        auto config =
            build_client_config(Settings(Settings::Values{{"root_ca", pem.cert_path}}), error);

        REQUIRE(config.has_value());
        REQUIRE_FALSE(error);
        REQUIRE(config->tls.has_value());
        REQUIRE(config->tls->trust_store != nullptr);
        REQUIRE_FALSE(config->tls->insecure_skip_verify);
    }

    SECTION("Unavailable system pool falls back to an empty one") {
        int loader_calls = 0;
        auto failing_loader = [&loader_calls](std::error_code& ec) -> std::optional<X509StorePtr> {
            ++loader_calls;
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return std::nullopt;
        };

        FatalError error;
        auto config = build_client_config(Settings(Settings::Values{{"root_ca", pem.cert_path}}),
                                          error, failing_loader);

        REQUIRE(loader_calls == 1);
        REQUIRE(config.has_value());
        REQUIRE_FALSE(error);
        REQUIRE(config->tls.has_value());
        REQUIRE(config->tls->trust_store != nullptr);

        // Only the root CA is in the fallback pool
        auto* objects = X509_STORE_get0_objects(config->tls->trust_store.get());
        REQUIRE(sk_X509_OBJECT_num(objects) == 1);
    }

    SECTION("append_certs_from_pem counts every certificate") {
        X509StorePtr store(X509_STORE_new());
        std::string one = read_all(pem.cert_path);

        REQUIRE(append_certs_from_pem(store.get(), one) == 1);
        REQUIRE(append_certs_from_pem(store.get(), "garbage") == 0);
    }
}

// ============================
// Client Certificate
// ============================

TEST_CASE("Client certificate pairing", "[tls][client_cert]") {
    PemFixture pem;

    SECTION("Certificate without key is fatal") {
        FatalError error;
        auto config =
            build_client_config(Settings(Settings::Values{{"client_cert", pem.cert_path}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::ClientCertKeyMismatch);
        REQUIRE(error.message ==
                "both client_cert and client_key must be provided if you set any of them");
    }

    SECTION("Certificate with empty key path is fatal") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"client_cert", pem.cert_path}, {"client_key", ""}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::ClientKeyEmpty);
        REQUIRE(error.message == "empty client_key path");
    }

    SECTION("Key without certificate is fatal") {
        FatalError error;
        auto config =
            build_client_config(Settings(Settings::Values{{"client_key", pem.key_path}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::ClientCertKeyMismatch);
    }

    SECTION("Empty client_cert is a no-op") {
        FatalError error;
        auto config = build_client_config(Settings(Settings::Values{{"client_cert", ""}}), error);

        REQUIRE(config.has_value());
        REQUIRE_FALSE(error);
        REQUIRE_FALSE(config->tls.has_value());
    }

    SECTION("Empty client_cert and client_key are a no-op") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"client_cert", ""}, {"client_key", ""}}), error);

        REQUIRE(config.has_value());
        REQUIRE_FALSE(config->tls.has_value());
    }

    SECTION("Empty client_cert with a key is fatal") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"client_cert", ""}, {"client_key", pem.key_path}}), error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::ClientCertKeyMismatch);
    }

    SECTION("Mismatched pair is fatal") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"client_cert", pem.cert_path},
                                      {"client_key", pem.other_key_path}}),
            error);

        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.code == StartupErrc::ClientKeyPairInvalid);
        REQUIRE(error.message.find("error creating X509 key pair from") != std::string::npos);
    }

    SECTION("Matching pair attaches the client certificate") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"client_cert", pem.cert_path},
                                      {"client_key", pem.key_path}}),
            error);

        REQUIRE(config.has_value());
        REQUIRE(config->tls.has_value());
        REQUIRE(config->tls->client_cert.has_value());
        REQUIRE(config->tls->client_cert->certificate != nullptr);
        REQUIRE(config->tls->client_cert->private_key != nullptr);
        REQUIRE(config->tls->trust_store == nullptr);
    }

    SECTION("Layers combine: insecure, root CA and client certificate") {
        FatalError error;
        auto config = build_client_config(
            Settings(Settings::Values{{"allow_insecure_conn", "true"},
                                      {"root_ca", pem.cert_path},
                                      {"client_cert", pem.cert_path},
                                      {"client_key", pem.key_path}}),
            error);

        REQUIRE(config.has_value());
        REQUIRE(config->tls->insecure_skip_verify);
        REQUIRE(config->tls->trust_store != nullptr);
        REQUIRE(config->tls->client_cert.has_value());
    }
}

// ============================
// Error Handling
// ============================

TEST_CASE("Startup error category", "[tls][error]") {
    auto ec = make_error_code(StartupErrc::RootCaUnreadable);
    REQUIRE(std::string(ec.category().name()) == "portico.startup");
    REQUIRE_FALSE(ec.message().empty());

    FatalError none;
    REQUIRE_FALSE(none);
}

TEST_CASE("TLS error category", "[tls][error]") {
    REQUIRE(std::string(tls_category().name()) == "tls");
}
