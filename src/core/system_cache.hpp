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

// Portico System Cache - Header
// TTL cache of system configuration documents with background refresh

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "../control/policy.hpp"

namespace portico::core {

/// One-shot stop signal owned by the cache; fired on authorizer shutdown
class StopSignal {
public:
    void fire() noexcept { fired_.store(true, std::memory_order_release); }

    [[nodiscard]] bool fired() const noexcept { return fired_.load(std::memory_order_acquire); }

    /// Sleep up to `duration`, returning early (true) once fired
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> fired_{false};
};

/// Re-fetches the document for `key`; nullopt on failure
using CacheFetcher = std::function<std::optional<std::string>(const std::string& key)>;

/// System configuration cache.
/// Entries expire `ttl` after their last successful store. A background thread
/// re-fetches every entry each `refresh_interval`, retrying a failed fetch
/// `refresh_retries` more times. At `max_size` the oldest insertion is evicted.
class SystemCache {
public:
    SystemCache(control::CacheConfig config, std::unique_ptr<StopSignal> stop);
    ~SystemCache();

    // Non-copyable, non-movable (owns thread)
    SystemCache(const SystemCache&) = delete;
    SystemCache& operator=(const SystemCache&) = delete;
    SystemCache(SystemCache&&) = delete;
    SystemCache& operator=(SystemCache&&) = delete;

    /// Unexpired value for `key`
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

    void set(const std::string& key, std::string value);

    /// Start the background refresh thread
    void start_refresh(CacheFetcher fetcher);

    /// Fire the stop signal and join the refresh thread
    void stop();

    /// Refresh every entry once (called by the refresh thread)
    /// @return number of entries refreshed successfully
    size_t refresh_all();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] const control::CacheConfig& config() const noexcept { return config_; }
    [[nodiscard]] const StopSignal& stop_signal() const noexcept { return *stop_; }

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
        uint64_t inserted_seq = 0;
    };

    void refresh_loop();
    void evict_oldest_locked();

    control::CacheConfig config_;
    std::unique_ptr<StopSignal> stop_;
    CacheFetcher fetcher_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_seq_ = 0;

    std::unique_ptr<std::thread> refresh_thread_;
};

/// Construct the cache with a freshly allocated stop signal
[[nodiscard]] std::unique_ptr<SystemCache> make_system_cache(const control::CacheConfig& config);

}  // namespace portico::core
