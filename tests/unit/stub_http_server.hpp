// Portico Unit Tests - Stub HTTP upstream
// Loopback listener answering every request with a fixed status and body

#pragma once

#include <poll.h>
#include <sys/socket.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <system_error>
#include <thread>

#include "../../src/core/simple_http.hpp"
#include "../../src/core/socket.hpp"

namespace portico::testing {

class StubHttpServer {
public:
    StubHttpServer(int status, std::string body) : status_(status), body_(std::move(body)) {
        std::error_code ec;
        fd_ = core::create_listening_socket("127.0.0.1", 0, 16, ec);
        port_ = fd_ >= 0 ? core::bound_port(fd_) : 0;
        if (fd_ >= 0) {
            thread_ = std::thread([this] { serve(); });
        }
    }

    ~StubHttpServer() {
        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
        if (fd_ >= 0) {
            core::close_fd(fd_);
        }
    }

    StubHttpServer(const StubHttpServer&) = delete;
    StubHttpServer& operator=(const StubHttpServer&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] int requests() const noexcept { return requests_.load(); }

    [[nodiscard]] std::string url(const std::string& path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    void serve() {
        while (running_.load()) {
            pollfd pfd{fd_, POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0) {
                continue;
            }

            int client = accept(fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }

            // Read until the end of the request headers
            std::string request;
            char buffer[2048];
            while (request.find("\r\n\r\n") == std::string::npos) {
                pollfd cfd{client, POLLIN, 0};
                if (poll(&cfd, 1, 1000) <= 0) {
                    break;
                }
                ssize_t n = recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buffer, static_cast<size_t>(n));
            }

            requests_.fetch_add(1);
            core::send_all(client, core::format_simple_response(status_, "text/plain", body_));
            core::close_fd(client);
        }
    }

    int status_;
    std::string body_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<int> requests_{0};
    std::thread thread_;
};

}  // namespace portico::testing
