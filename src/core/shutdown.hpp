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

// Portico Shutdown Events - Header
// Shutdown event queue and the OS signal producer feeding it

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <variant>

namespace portico::core {

/// SIGINT or SIGTERM delivered to the process
struct OsSignal {
    int signo = 0;
};

/// Adapter server's serving loop returned. Empty error = clean exit.
struct ServerTerminated {
    std::error_code error;
};

using ShutdownEvent = std::variant<OsSignal, ServerTerminated>;

/// "SIGINT", "SIGTERM", or "signal N"
[[nodiscard]] std::string signal_name(int signo);

/// Multi-producer, single-consumer blocking queue of shutdown events.
/// Producers are the signal watcher and the adapter server thread.
class ShutdownQueue {
public:
    ShutdownQueue() = default;

    // Non-copyable, non-movable (shared by producer threads)
    ShutdownQueue(const ShutdownQueue&) = delete;
    ShutdownQueue& operator=(const ShutdownQueue&) = delete;

    void push(ShutdownEvent event);

    /// Block until an event is available
    [[nodiscard]] ShutdownEvent wait();

    /// Non-blocking pop
    [[nodiscard]] std::optional<ShutdownEvent> try_pop();

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ShutdownEvent> events_;
};

/// Block SIGINT and SIGTERM in the calling thread. Call from main() before any other
/// thread exists so every thread inherits the mask and only the watcher consumes them.
[[nodiscard]] std::error_code block_shutdown_signals() noexcept;

/// Background thread turning SIGINT/SIGTERM into OsSignal events
class SignalWatcher {
public:
    explicit SignalWatcher(ShutdownQueue& queue) : queue_(queue) {}
    ~SignalWatcher();

    // Non-copyable, non-movable (owns thread)
    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Start watching (signals must already be blocked)
    void start();

    /// Stop watching and join the thread
    void stop();

private:
    void watch_loop();

    ShutdownQueue& queue_;
    std::unique_ptr<std::thread> watch_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace portico::core
