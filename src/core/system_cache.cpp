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

// Portico System Cache - Implementation

#include "system_cache.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "logging.hpp"

namespace portico::core {

bool StopSignal::wait_for(std::chrono::milliseconds duration) const {
    constexpr auto kSlice = std::chrono::milliseconds(100);

    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!fired()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kSlice, remaining));
    }
    return true;
}

SystemCache::SystemCache(control::CacheConfig config, std::unique_ptr<StopSignal> stop)
    : config_(config), stop_(std::move(stop)) {}

SystemCache::~SystemCache() {
    stop();
}

std::optional<std::string> SystemCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= it->second.expires_at) {
        return std::nullopt;
    }
    return it->second.value;
}

void SystemCache::set(const std::string& key, std::string value) {
    if (config_.max_size <= 0) {
        return;  // Zero-sized cache stores nothing
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto expires_at = std::chrono::steady_clock::now() + config_.ttl;

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.value = std::move(value);
        it->second.expires_at = expires_at;
        return;
    }

    while (entries_.size() >= static_cast<size_t>(config_.max_size)) {
        evict_oldest_locked();
    }
    entries_.emplace(key, Entry{std::move(value), expires_at, next_seq_++});
}

void SystemCache::evict_oldest_locked() {
    auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                   [](const auto& a, const auto& b) {
                                       return a.second.inserted_seq < b.second.inserted_seq;
                                   });
    if (oldest != entries_.end()) {
        entries_.erase(oldest);
    }
}

size_t SystemCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SystemCache::start_refresh(CacheFetcher fetcher) {
    if (refresh_thread_ || stop_->fired()) {
        return;  // Already running or already stopped
    }

    fetcher_ = std::move(fetcher);
    refresh_thread_ = std::make_unique<std::thread>(&SystemCache::refresh_loop, this);
}

void SystemCache::stop() {
    stop_->fire();

    if (refresh_thread_ && refresh_thread_->joinable()) {
        refresh_thread_->join();
    }
}

void SystemCache::refresh_loop() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.refresh_interval);
    if (interval <= std::chrono::milliseconds::zero()) {
        interval = std::chrono::seconds(control::kDefaultSystemCacheRefreshSeconds);
    }

    while (!stop_->wait_for(interval)) {
        refresh_all();
    }
}

size_t SystemCache::refresh_all() {
    if (!fetcher_) {
        return 0;
    }

    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keys.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            keys.push_back(key);
        }
    }

    quill::Logger* logger = logging::get_logger();
    size_t refreshed = 0;

    for (const auto& key : keys) {
        if (stop_->fired()) {
            break;
        }

        std::optional<std::string> value;
        const int64_t max_attempts = static_cast<int64_t>(config_.refresh_retries) + 1;
        int64_t attempts = 0;
        while (!value && attempts < max_attempts && !stop_->fired()) {
            value = fetcher_(key);
            ++attempts;
        }

        if (!value) {
            LOG_WARNING(logger, "system cache refresh failed after {} attempts: key={}", attempts,
                        key);
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            continue;  // Evicted while fetching
        }
        it->second.value = std::move(*value);
        it->second.expires_at = std::chrono::steady_clock::now() + config_.ttl;
        ++refreshed;
    }

    return refreshed;
}

std::unique_ptr<SystemCache> make_system_cache(const control::CacheConfig& config) {
    return std::make_unique<SystemCache>(config, std::make_unique<StopSignal>());
}

}  // namespace portico::core
