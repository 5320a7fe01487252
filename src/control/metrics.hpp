/*
 * Copyright 2025 Eden Contributors
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

// Eden Metrics - Header
// Process-wide request counters updated lock-free from every worker; the
// per-service series live in a sharded map

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "../core/containers.hpp"

namespace eden::control {

/// Upper bounds of the latency histogram buckets (microseconds)
/// 100ms, 500ms and 1s are the latency objectives dashboards alert on.
inline constexpr std::array<uint64_t, 11> kLatencyBucketsUs = {
    5000, 10000, 25000, 50000, 100000, 250000, 500000, 1000000, 2500000, 5000000, 10000000};

/// Requests of one (service, method, status) combination
struct RequestSeries {
    std::string service;  // "gateway" for built-in endpoints, "none" when no route matched
    std::string method;
    uint16_t status = 0;
    uint64_t count = 0;
};

/// Point-in-time copy of the counters
struct MetricsSnapshot {
    // Request metrics
    uint64_t total_requests = 0;
    uint64_t rate_limited = 0;
    uint64_t upstream_timeouts = 0;
    uint64_t upstream_unreachable = 0;
    uint64_t no_healthy_instance = 0;
    uint64_t cancelled = 0;
    uint64_t active_requests = 0;

    // Connection metrics
    uint64_t active_connections = 0;
    uint64_t total_connections = 0;
    uint64_t rejected_connections = 0;

    // Latency metrics (microseconds)
    uint64_t total_latency_us = 0;
    uint64_t min_latency_us = 0;
    uint64_t max_latency_us = 0;

    // Per-bucket counts (not cumulative); the extra last slot is +Inf
    std::array<uint64_t, kLatencyBucketsUs.size() + 1> latency_buckets{};

    std::chrono::milliseconds uptime{0};

    // HTTP status code counters
    uint64_t status_2xx = 0;
    uint64_t status_3xx = 0;
    uint64_t status_4xx = 0;
    uint64_t status_5xx = 0;

    [[nodiscard]] double avg_latency_us() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_latency_us) / static_cast<double>(total_requests);
    }
};

/// Gateway metrics collector (atomics, relaxed ordering)
class GatewayMetrics {
public:
    GatewayMetrics() : start_time_(std::chrono::steady_clock::now()) {}

    // Non-copyable, non-movable (std::atomic is not movable)
    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;

    /// Record a finished request with its status and latency
    void record_request(uint16_t status_code, std::chrono::microseconds latency) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        record_status_code(status_code);
        record_latency(latency);
    }

    void record_rate_limited() noexcept { rate_limited_.fetch_add(1, std::memory_order_relaxed); }

    void record_upstream_timeout() noexcept {
        upstream_timeouts_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_upstream_unreachable() noexcept {
        upstream_unreachable_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_no_healthy_instance() noexcept {
        no_healthy_instance_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_cancelled() noexcept { cancelled_.fetch_add(1, std::memory_order_relaxed); }

    /// Bracket one request being handled
    void record_request_start() noexcept {
        active_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_request_end() noexcept {
        active_requests_.fetch_sub(1, std::memory_order_relaxed);
    }

    /// Count a finished request under its service, method and status
    void record_service_request(std::string_view service, std::string_view method,
                                uint16_t status) {
        std::string key;
        key.reserve(service.size() + method.size() + 8);
        key.append(service).append(1, '\x1f').append(method).append(1, '\x1f');
        key += std::to_string(status);

        series_.upsert(
            key,
            [&] { return RequestSeries{std::string(service), std::string(method), status, 0}; },
            [](RequestSeries& series) { ++series.count; });
    }

    /// All request series, ordered by service, method, status
    [[nodiscard]] std::vector<RequestSeries> request_series() const {
        std::vector<RequestSeries> result;
        series_.for_each([&result](const std::string&, const RequestSeries& series) {
            result.push_back(series);
        });
        std::sort(result.begin(), result.end(), [](const RequestSeries& a, const RequestSeries& b) {
            return std::tie(a.service, a.method, a.status) < std::tie(b.service, b.method, b.status);
        });
        return result;
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }

    /// Record a new connection
    void record_connection() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Record a closed connection
    void record_connection_close() noexcept {
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    /// Record a connection refused because the worker queue was full
    void record_connection_rejected() noexcept {
        rejected_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;

        snap.total_requests = total_requests_.load(std::memory_order_relaxed);
        snap.rate_limited = rate_limited_.load(std::memory_order_relaxed);
        snap.upstream_timeouts = upstream_timeouts_.load(std::memory_order_relaxed);
        snap.upstream_unreachable = upstream_unreachable_.load(std::memory_order_relaxed);
        snap.no_healthy_instance = no_healthy_instance_.load(std::memory_order_relaxed);
        snap.cancelled = cancelled_.load(std::memory_order_relaxed);
        snap.active_requests = active_requests_.load(std::memory_order_relaxed);

        snap.active_connections = active_connections_.load(std::memory_order_relaxed);
        snap.total_connections = total_connections_.load(std::memory_order_relaxed);
        snap.rejected_connections = rejected_connections_.load(std::memory_order_relaxed);

        snap.total_latency_us = total_latency_us_.load(std::memory_order_relaxed);
        snap.min_latency_us = min_latency_us_.load(std::memory_order_relaxed);
        snap.max_latency_us = max_latency_us_.load(std::memory_order_relaxed);
        for (size_t i = 0; i < latency_buckets_.size(); ++i) {
            snap.latency_buckets[i] = latency_buckets_[i].load(std::memory_order_relaxed);
        }
        snap.uptime = uptime();

        snap.status_2xx = status_2xx_.load(std::memory_order_relaxed);
        snap.status_3xx = status_3xx_.load(std::memory_order_relaxed);
        snap.status_4xx = status_4xx_.load(std::memory_order_relaxed);
        snap.status_5xx = status_5xx_.load(std::memory_order_relaxed);

        return snap;
    }

private:
    void record_status_code(uint16_t status_code) noexcept {
        if (status_code >= 200 && status_code < 300) {
            status_2xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 300 && status_code < 400) {
            status_3xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 400 && status_code < 500) {
            status_4xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 500 && status_code < 600) {
            status_5xx_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void record_latency(std::chrono::microseconds latency) noexcept {
        uint64_t latency_us = static_cast<uint64_t>(latency.count());

        total_latency_us_.fetch_add(latency_us, std::memory_order_relaxed);

        auto bucket = std::lower_bound(kLatencyBucketsUs.begin(), kLatencyBucketsUs.end(), latency_us);
        latency_buckets_[static_cast<size_t>(bucket - kLatencyBucketsUs.begin())].fetch_add(
            1, std::memory_order_relaxed);

        // Zero means "no sample yet"
        uint64_t current_min = min_latency_us_.load(std::memory_order_relaxed);
        while (latency_us < current_min || current_min == 0) {
            if (min_latency_us_.compare_exchange_weak(current_min, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }

        uint64_t current_max = max_latency_us_.load(std::memory_order_relaxed);
        while (latency_us > current_max) {
            if (max_latency_us_.compare_exchange_weak(current_max, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }
    }

    // Request counters
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> upstream_timeouts_{0};
    std::atomic<uint64_t> upstream_unreachable_{0};
    std::atomic<uint64_t> no_healthy_instance_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> active_requests_{0};

    // Connection counters
    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> total_connections_{0};
    std::atomic<uint64_t> rejected_connections_{0};

    // Latency
    std::atomic<uint64_t> total_latency_us_{0};
    std::atomic<uint64_t> min_latency_us_{0};
    std::atomic<uint64_t> max_latency_us_{0};
    std::array<std::atomic<uint64_t>, kLatencyBucketsUs.size() + 1> latency_buckets_{};

    // Status classes
    std::atomic<uint64_t> status_2xx_{0};
    std::atomic<uint64_t> status_3xx_{0};
    std::atomic<uint64_t> status_4xx_{0};
    std::atomic<uint64_t> status_5xx_{0};

    std::chrono::steady_clock::time_point start_time_;
    core::ShardedMap<std::string, RequestSeries> series_;
};

}  // namespace eden::control
