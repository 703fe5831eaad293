// Portico Adapter Server Tests
// Listener binding, /healthz probe, connection max age and termination reporting

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <variant>

#include "../../src/core/adapter_server.hpp"
#include "../../src/core/socket.hpp"

using namespace portico::core;
using portico::control::FatalError;
using portico::control::ServerSettings;
using portico::control::StartupErrc;

namespace {

class NoopAuthorizer : public Authorizer {
public:
    void shutdown() override {}
};

int connect_loopback(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }

    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

// Send one request and read until the full response body arrived
std::string round_trip(int fd, const std::string& request) {
    send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string response;
    char buffer[1024];
    while (true) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            break;
        }
        response.append(buffer, static_cast<size_t>(n));

        auto header_end = response.find("\r\n\r\n");
        auto length_pos = response.find("Content-Length: ");
        if (header_end != std::string::npos && length_pos != std::string::npos) {
            size_t length = std::stoul(response.substr(length_pos + 16));
            if (response.size() >= header_end + 4 + length) {
                break;
            }
        }
    }
    return response;
}

ServerSettings loopback_settings(std::chrono::seconds max_age = std::chrono::seconds(60)) {
    ServerSettings settings;
    settings.listen_addr = "127.0.0.1:0";
    settings.conn_max_age = max_age;
    return settings;
}

}  // namespace

// ============================
// Creation
// ============================

TEST_CASE("Adapter server creation", "[adapter_server][create]") {
    NoopAuthorizer authorizer;

    SECTION("Binds an ephemeral port") {
        FatalError error;
        auto server = TcpAdapterServer::create(loopback_settings(), authorizer, error);

        REQUIRE(server != nullptr);
        REQUIRE_FALSE(error);
        REQUIRE(server->port() != 0);
        REQUIRE(&server->authorizer() == &authorizer);
    }

    SECTION("Invalid listen address is fatal") {
        ServerSettings settings;
        settings.listen_addr = "not-a-port";

        FatalError error;
        auto server = TcpAdapterServer::create(settings, authorizer, error);

        REQUIRE(server == nullptr);
        REQUIRE(error.code == StartupErrc::ServerStartFailed);
        REQUIRE(error.message.find("Unable to start server") == 0);
    }

    SECTION("Port in use is fatal") {
        std::error_code ec;
        int holder = create_listening_socket("127.0.0.1", 0, 8, ec);
        REQUIRE(holder >= 0);

        ServerSettings settings;
        settings.listen_addr = "127.0.0.1:" + std::to_string(bound_port(holder));

        FatalError error;
        auto server = TcpAdapterServer::create(settings, authorizer, error);

        REQUIRE(server == nullptr);
        REQUIRE(error.code == StartupErrc::ServerStartFailed);

        close_fd(holder);
    }
}

// ============================
// Serving
// ============================

TEST_CASE("Adapter server serving loop", "[adapter_server][run]") {
    NoopAuthorizer authorizer;
    FatalError error;
    auto server = TcpAdapterServer::create(loopback_settings(), authorizer, error);
    REQUIRE(server != nullptr);

    ShutdownQueue events;
    std::thread runner([&] { server->run(events); });

    int fd = connect_loopback(server->port());
    REQUIRE(fd >= 0);

    SECTION("Answers the health probe on a kept-alive connection") {
        auto first = round_trip(fd, "GET /healthz HTTP/1.1\r\nHost: x\r\n\r\n");
        REQUIRE(first.find("HTTP/1.1 200") == 0);
        REQUIRE(first.find("Connection: keep-alive") != std::string::npos);
        REQUIRE(first.find("\"status\":\"SERVING\"") != std::string::npos);

        auto second = round_trip(fd, "GET /healthz HTTP/1.1\r\nHost: x\r\n\r\n");
        REQUIRE(second.find("HTTP/1.1 200") == 0);
    }

    SECTION("Unknown path is 404") {
        auto response = round_trip(fd, "GET /v1/authorize HTTP/1.1\r\n\r\n");
        REQUIRE(response.find("HTTP/1.1 404") == 0);
    }

    SECTION("Non-GET is 405") {
        auto response = round_trip(fd, "POST /healthz HTTP/1.1\r\n\r\n");
        REQUIRE(response.find("HTTP/1.1 405") == 0);
    }

    close(fd);

    REQUIRE_FALSE(server->close());
    REQUIRE_FALSE(server->close());  // Idempotent
    runner.join();

    auto event = events.try_pop();
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<ServerTerminated>(*event));
    REQUIRE_FALSE(std::get<ServerTerminated>(*event).error);
    REQUIRE_FALSE(events.try_pop().has_value());
}

TEST_CASE("Adapter server enforces connection max age", "[adapter_server][keepalive]") {
    NoopAuthorizer authorizer;
    FatalError error;
    auto server =
        TcpAdapterServer::create(loopback_settings(std::chrono::seconds(1)), authorizer, error);
    REQUIRE(server != nullptr);

    ShutdownQueue events;
    std::thread runner([&] { server->run(events); });

    int fd = connect_loopback(server->port());
    REQUIRE(fd >= 0);

    auto fresh = round_trip(fd, "GET /healthz HTTP/1.1\r\n\r\n");
    REQUIRE(fresh.find("Connection: keep-alive") != std::string::npos);

    REQUIRE(server->connection_count() == 1);

    // Idle past max age: the server closes its side
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    char byte;
    REQUIRE(recv(fd, &byte, 1, 0) == 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (server->connection_count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(server->connection_count() == 0);

    close(fd);
    REQUIRE_FALSE(server->close());
    runner.join();
}

TEST_CASE("Adapter server closed before run exits immediately", "[adapter_server][close]") {
    NoopAuthorizer authorizer;
    FatalError error;
    auto server = TcpAdapterServer::create(loopback_settings(), authorizer, error);
    REQUIRE(server != nullptr);

    REQUIRE_FALSE(server->close());

    ShutdownQueue events;
    server->run(events);

    REQUIRE(events.size() == 1);
    REQUIRE_FALSE(std::get<ServerTerminated>(events.wait()).error);
}
