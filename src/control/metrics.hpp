// Portico Metrics - Header
// Counters fed by the authorizer's response and cache-hit callbacks

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portico::control {

/// Invoked for every upstream (system) response: host, HTTP status, latency
using ResponseCallback =
    std::function<void(std::string_view host, int status, std::chrono::microseconds latency)>;

/// Invoked whenever the system cache answers without an upstream call
using CacheHitCallback = std::function<void()>;

/// Metrics hooks handed to the authorizer.
/// Only exists when metrics reporting is enabled; absence means no hooks at all.
struct MetricsReporter {
    uint16_t port = 0;
    ResponseCallback response_cb;
    CacheHitCallback cache_hit_cb;
};

/// Per-host response counters at a point in time
struct HostResponseSnapshot {
    std::string host;
    int status = 0;
    uint64_t count = 0;
};

struct HostLatencySnapshot {
    std::string host;
    uint64_t total_latency_us = 0;
    uint64_t observations = 0;
};

/// Metrics snapshot at a point in time
struct MetricsSnapshot {
    std::vector<HostResponseSnapshot> responses;  // sorted by host, then status
    std::vector<HostLatencySnapshot> latencies;   // sorted by host
    uint64_t cache_hits = 0;
};

/// Process-wide collector (thread-safe).
/// Cache hits are lock-free; labelled response counters take a mutex.
class SystemMetrics {
public:
    SystemMetrics() = default;
    ~SystemMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    SystemMetrics(const SystemMetrics&) = delete;
    SystemMetrics& operator=(const SystemMetrics&) = delete;
    SystemMetrics(SystemMetrics&&) = delete;
    SystemMetrics& operator=(SystemMetrics&&) = delete;

    /// Record a response from `host`
    void record_response(std::string_view host, int status, std::chrono::microseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[{std::string(host), status}] += 1;

        auto& latency_entry = latencies_[std::string(host)];
        latency_entry.first += static_cast<uint64_t>(latency.count());
        latency_entry.second += 1;
    }

    /// Record a cache hit
    void record_cache_hit() noexcept {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] MetricsSnapshot snapshot() const {
        MetricsSnapshot snap;
        snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex_);
        snap.responses.reserve(responses_.size());
        for (const auto& [key, count] : responses_) {
            snap.responses.push_back({key.first, key.second, count});
        }
        snap.latencies.reserve(latencies_.size());
        for (const auto& [host, entry] : latencies_) {
            snap.latencies.push_back({host, entry.first, entry.second});
        }
        return snap;
    }

    /// Build the reporter whose callbacks write into this collector.
    /// The collector must outlive every copy of the callbacks.
    [[nodiscard]] MetricsReporter make_reporter(uint16_t port) {
        MetricsReporter reporter;
        reporter.port = port;
        reporter.response_cb = [this](std::string_view host, int status,
                                      std::chrono::microseconds latency) {
            record_response(host, status, latency);
        };
        reporter.cache_hit_cb = [this]() { record_cache_hit(); };
        return reporter;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, int>, uint64_t> responses_;
    std::map<std::string, std::pair<uint64_t, uint64_t>> latencies_;  // total us, count
    std::atomic<uint64_t> cache_hits_{0};
};

}  // namespace portico::control
