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

// Portico Lifecycle Controller - Header
// Runs the adapter server and reconciles the two shutdown triggers

#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>

#include "../control/errors.hpp"
#include "../core/adapter_server.hpp"
#include "../core/authorizer.hpp"
#include "../core/shutdown.hpp"

namespace portico::runtime {

inline constexpr std::string_view kUndefinedVersion = "undefined";

enum class LifecycleState {
    Starting,
    Running,
    ShuttingDown,
    Stopped,
    Fatal,
};

[[nodiscard]] std::string_view to_string(LifecycleState state) noexcept;

/// Supervises one adapter server run.
///
/// run() launches the serving loop on a background thread, then consumes
/// shutdown events one at a time:
///   - OsSignal: authorizer shutdown, then server close. A close error is fatal;
///     otherwise the controller keeps waiting for the server to terminate.
///     A repeated signal repeats the sequence.
///   - ServerTerminated: an error is fatal; a clean exit stops the controller.
class LifecycleController {
public:
    LifecycleController(core::Authorizer& authorizer, core::AdapterServer& server,
                        core::ShutdownQueue& events, std::string version);

    /// Joins the server thread
    ~LifecycleController();

    // Non-copyable, non-movable (owns thread)
    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /// Block until a terminal transition.
    /// @return empty FatalError on clean stop
    [[nodiscard]] control::FatalError run();

    [[nodiscard]] LifecycleState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Number of signal-triggered shutdown sequences executed
    [[nodiscard]] size_t shutdown_attempts() const noexcept { return shutdown_attempts_; }

    [[nodiscard]] const std::string& version() const noexcept { return version_; }

private:
    /// @return true when the event ends the run (error_out set on fatal)
    bool handle(const core::OsSignal& signal, control::FatalError& error_out);
    bool handle(const core::ServerTerminated& terminated, control::FatalError& error_out);

    void transition(LifecycleState next) noexcept;
    void join_server();

    core::Authorizer& authorizer_;
    core::AdapterServer& server_;
    core::ShutdownQueue& events_;
    std::string version_;

    std::atomic<LifecycleState> state_{LifecycleState::Starting};
    size_t shutdown_attempts_ = 0;
    std::thread server_thread_;
};

}  // namespace portico::runtime
