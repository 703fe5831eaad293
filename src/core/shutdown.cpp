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

// Portico Shutdown Events - Implementation

#include "shutdown.hpp"

#include <pthread.h>

#include <cerrno>
#include <csignal>
#include <ctime>

namespace portico::core {

std::string signal_name(int signo) {
    switch (signo) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal " + std::to_string(signo);
    }
}

// ============================
// Event Queue
// ============================

void ShutdownQueue::push(ShutdownEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

ShutdownEvent ShutdownQueue::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });

    ShutdownEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ShutdownEvent> ShutdownQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }

    ShutdownEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t ShutdownQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ============================
// Signal Watcher
// ============================

namespace {

sigset_t shutdown_signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

}  // namespace

std::error_code block_shutdown_signals() noexcept {
    sigset_t set = shutdown_signal_set();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        return std::error_code(rc, std::system_category());
    }
    return {};
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    watch_thread_ = std::make_unique<std::thread>(&SignalWatcher::watch_loop, this);
}

void SignalWatcher::stop() {
    if (!running_.exchange(false)) {
        return;  // Not running
    }

    if (watch_thread_ && watch_thread_->joinable()) {
        watch_thread_->join();
    }
}

void SignalWatcher::watch_loop() {
    const sigset_t set = shutdown_signal_set();

    // Short timed waits so stop() is observed without a wake-up signal
    const timespec timeout{0, 200'000'000};

    while (running_.load(std::memory_order_relaxed)) {
        int signo = sigtimedwait(&set, nullptr, &timeout);
        if (signo < 0) {
            continue;  // EAGAIN (timeout) or EINTR
        }
        queue_.push(OsSignal{signo});
    }
}

}  // namespace portico::core
