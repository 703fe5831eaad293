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

// Portico Lifecycle Controller - Implementation

#include "lifecycle.hpp"

#include <fmt/format.h>

#include <variant>

#include "../core/logging.hpp"

namespace portico::runtime {

std::string_view to_string(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Starting:
            return "starting";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::ShuttingDown:
            return "shutting_down";
        case LifecycleState::Stopped:
            return "stopped";
        case LifecycleState::Fatal:
            return "fatal";
    }
    return "unknown";
}

LifecycleController::LifecycleController(core::Authorizer& authorizer,
                                         core::AdapterServer& server, core::ShutdownQueue& events,
                                         std::string version)
    : authorizer_(authorizer),
      server_(server),
      events_(events),
      version_(version.empty() ? std::string(kUndefinedVersion) : std::move(version)) {}

LifecycleController::~LifecycleController() {
    join_server();
}

control::FatalError LifecycleController::run() {
    if (state() != LifecycleState::Starting) {
        return control::FatalError(control::StartupErrc::ServerStartFailed,
                                   "lifecycle controller already ran");
    }

    server_thread_ = std::thread([this] {
        LOG_INFO(logging::get_logger(), "Starting server version {}", version_);
        server_.run(events_);
    });
    transition(LifecycleState::Running);

    control::FatalError error;
    while (true) {
        core::ShutdownEvent event = events_.wait();

        bool done = std::visit([&](const auto& ev) { return handle(ev, error); }, event);
        if (!done) {
            continue;
        }

        if (error) {
            transition(LifecycleState::Fatal);
            return error;
        }

        join_server();
        transition(LifecycleState::Stopped);
        return {};
    }
}

bool LifecycleController::handle(const core::OsSignal& signal, control::FatalError& error_out) {
    transition(LifecycleState::ShuttingDown);
    ++shutdown_attempts_;

    LOG_INFO(logging::get_logger(), "{} received. Attempting graceful shutdown",
             core::signal_name(signal.signo));

    authorizer_.shutdown();

    if (auto ec = server_.close(); ec) {
        error_out = control::FatalError(
            control::StartupErrc::ServerCloseFailed,
            fmt::format("Error calling graceful shutdown: {}", ec.message()));
        return true;
    }

    return false;  // Wait for the server to report termination
}

bool LifecycleController::handle(const core::ServerTerminated& terminated,
                                 control::FatalError& error_out) {
    if (terminated.error) {
        error_out = control::FatalError(
            control::StartupErrc::ServerTerminated,
            fmt::format("adapter server has shut down: err {}", terminated.error.message()));
        return true;
    }

    LOG_INFO(logging::get_logger(), "adapter server has shut down gracefully");
    return true;
}

void LifecycleController::transition(LifecycleState next) noexcept {
    state_.store(next, std::memory_order_release);
}

void LifecycleController::join_server() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}  // namespace portico::runtime
