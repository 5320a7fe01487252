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

// Eden Prometheus Exporter - Header
// Formats metrics in Prometheus text exposition format

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"

namespace eden::control {

/// Registry gauges sampled at scrape time
struct RegistryStats {
    struct ServiceInstances {
        std::string service;
        uint64_t healthy = 0;
        uint64_t unhealthy = 0;
        uint64_t unknown = 0;
    };

    uint64_t routes = 0;
    uint64_t rate_limit_keys = 0;
    uint64_t middlewares = 0;
    std::vector<ServiceInstances> services;
};

/// Prometheus metric types
enum class PrometheusType {
    Counter,   // Monotonically increasing counter
    Gauge,     // Value that can go up or down
    Histogram  // Observations in cumulative buckets
};

/// Prometheus exporter
class PrometheusExporter {
public:
    /// Export request metrics in Prometheus text format
    [[nodiscard]] static std::string export_metrics(const MetricsSnapshot& metrics,
                                                    std::string_view namespace_prefix = "eden") {
        Writer out(namespace_prefix);

        out.metric("requests_total", "Total number of proxied and gateway requests",
                   PrometheusType::Counter, metrics.total_requests);

        out.metric("rate_limited_total", "Requests rejected by the rate limiter",
                   PrometheusType::Counter, metrics.rate_limited);

        out.metric("upstream_errors_total", "Failed upstream calls by reason",
                   PrometheusType::Counter, metrics.upstream_timeouts, {{"reason", "timeout"}});
        out.metric("upstream_errors_total", "Failed upstream calls by reason",
                   PrometheusType::Counter, metrics.upstream_unreachable,
                   {{"reason", "unreachable"}});
        out.metric("upstream_errors_total", "Failed upstream calls by reason",
                   PrometheusType::Counter, metrics.no_healthy_instance,
                   {{"reason", "no_healthy_instance"}});

        out.metric("requests_cancelled_total", "Requests abandoned by the client",
                   PrometheusType::Counter, metrics.cancelled);

        out.metric("requests_active", "Requests currently being handled", PrometheusType::Gauge,
                   metrics.active_requests);
        out.metric("uptime_seconds", "Seconds since the gateway started", PrometheusType::Gauge,
                   std::chrono::duration_cast<std::chrono::seconds>(metrics.uptime).count());

        // Connection metrics
        out.metric("connections_active", "Current number of active connections",
                   PrometheusType::Gauge, metrics.active_connections);
        out.metric("connections_total", "Total number of connections", PrometheusType::Counter,
                   metrics.total_connections);
        out.metric("connections_rejected_total", "Connections refused with a full worker queue",
                   PrometheusType::Counter, metrics.rejected_connections);

        // Latency metrics (microseconds)
        out.metric("latency_microseconds_total", "Total latency in microseconds",
                   PrometheusType::Counter, metrics.total_latency_us);
        out.metric("latency_microseconds_min", "Minimum latency in microseconds",
                   PrometheusType::Gauge, metrics.min_latency_us);
        out.metric("latency_microseconds_max", "Maximum latency in microseconds",
                   PrometheusType::Gauge, metrics.max_latency_us);
        out.metric("latency_microseconds_avg", "Average latency in microseconds",
                   PrometheusType::Gauge, metrics.avg_latency_us());

        out.histogram("request_duration_seconds", "Request latency in seconds",
                      metrics.latency_buckets,
                      static_cast<double>(metrics.total_latency_us) / 1e6,
                      metrics.total_requests);

        // HTTP status code metrics
        out.metric("http_responses_total", "Total HTTP responses by status class",
                   PrometheusType::Counter, metrics.status_2xx, {{"code", "2xx"}});
        out.metric("http_responses_total", "Total HTTP responses by status class",
                   PrometheusType::Counter, metrics.status_3xx, {{"code", "3xx"}});
        out.metric("http_responses_total", "Total HTTP responses by status class",
                   PrometheusType::Counter, metrics.status_4xx, {{"code", "4xx"}});
        out.metric("http_responses_total", "Total HTTP responses by status class",
                   PrometheusType::Counter, metrics.status_5xx, {{"code", "5xx"}});

        return out.str();
    }

    /// Export per-service request counters
    [[nodiscard]] static std::string export_request_series(
        const std::vector<RequestSeries>& series, std::string_view namespace_prefix = "eden") {
        Writer out(namespace_prefix);
        for (const auto& s : series) {
            out.metric("service_requests_total", "Requests by service, method and status",
                       PrometheusType::Counter, s.count,
                       {{"service", s.service}, {"method", s.method},
                        {"status", std::to_string(s.status)}});
        }
        return out.str();
    }

    /// Export registry gauges
    [[nodiscard]] static std::string export_registry_metrics(
        const RegistryStats& stats, std::string_view namespace_prefix = "eden") {
        Writer out(namespace_prefix);

        out.metric("routes_registered", "Routes in the route registry", PrometheusType::Gauge,
                   stats.routes);
        out.metric("rate_limit_keys", "Caller keys tracked by the rate limiter",
                   PrometheusType::Gauge, stats.rate_limit_keys);
        out.metric("middlewares", "Middlewares in the chain", PrometheusType::Gauge,
                   stats.middlewares);

        for (const auto& service : stats.services) {
            out.metric("service_instances", "Registered instances by service and health",
                       PrometheusType::Gauge, service.healthy,
                       {{"service", service.service}, {"health", "healthy"}});
            out.metric("service_instances", "Registered instances by service and health",
                       PrometheusType::Gauge, service.unhealthy,
                       {{"service", service.service}, {"health", "unhealthy"}});
            out.metric("service_instances", "Registered instances by service and health",
                       PrometheusType::Gauge, service.unknown,
                       {{"service", service.service}, {"health", "unknown"}});
        }

        return out.str();
    }

private:
    /// Label for Prometheus metrics
    struct Label {
        std::string name;
        std::string value;
    };

    /// Accumulates one exposition; HELP/TYPE are written once per metric family
    class Writer {
    public:
        explicit Writer(std::string_view namespace_prefix) : prefix_(namespace_prefix) {}

        template <typename T>
        void metric(std::string_view metric_name, std::string_view help, PrometheusType type,
                    T value, const std::vector<Label>& labels = {}) {
            std::string full_name = prefix_ + "_" + std::string(metric_name);

            header(full_name, help, type);
            sample(full_name, labels, value);
        }

        /// Histogram family: cumulative _bucket lines, then _sum and _count
        /// @param buckets Per-bucket counts matching kLatencyBucketsUs plus a final +Inf slot
        void histogram(std::string_view metric_name, std::string_view help,
                       const std::array<uint64_t, kLatencyBucketsUs.size() + 1>& buckets,
                       double sum, uint64_t count) {
            std::string full_name = prefix_ + "_" + std::string(metric_name);
            header(full_name, help, PrometheusType::Histogram);

            uint64_t cumulative = 0;
            for (size_t i = 0; i < kLatencyBucketsUs.size(); ++i) {
                cumulative += buckets[i];
                std::ostringstream le;
                le << static_cast<double>(kLatencyBucketsUs[i]) / 1e6;
                sample(full_name + "_bucket", {{"le", le.str()}}, cumulative);
            }
            cumulative += buckets.back();
            sample(full_name + "_bucket", {{"le", "+Inf"}}, cumulative);
            sample(full_name + "_sum", {}, sum);
            sample(full_name + "_count", {}, count);
        }

        [[nodiscard]] std::string str() const { return out_.str(); }

    private:
        void header(const std::string& full_name, std::string_view help, PrometheusType type) {
            if (full_name == last_metric_) {
                return;
            }
            out_ << "# HELP " << full_name << " " << help << "\n";
            out_ << "# TYPE " << full_name << " ";
            switch (type) {
                case PrometheusType::Counter:
                    out_ << "counter";
                    break;
                case PrometheusType::Gauge:
                    out_ << "gauge";
                    break;
                case PrometheusType::Histogram:
                    out_ << "histogram";
                    break;
            }
            out_ << "\n";
            last_metric_ = full_name;
        }

        template <typename T>
        void sample(const std::string& name, const std::vector<Label>& labels, T value) {
            out_ << name;
            if (!labels.empty()) {
                out_ << "{";
                for (size_t i = 0; i < labels.size(); ++i) {
                    out_ << labels[i].name << "=\"" << escape(labels[i].value) << "\"";
                    if (i < labels.size() - 1) {
                        out_ << ",";
                    }
                }
                out_ << "}";
            }
            out_ << " " << value << "\n";
        }

        static std::string escape(std::string_view value) {
            std::string escaped;
            escaped.reserve(value.size());
            for (char c : value) {
                if (c == '\\' || c == '"') {
                    escaped += '\\';
                    escaped += c;
                } else if (c == '\n') {
                    escaped += "\\n";
                } else {
                    escaped += c;
                }
            }
            return escaped;
        }

        std::string prefix_;
        std::string last_metric_;
        std::ostringstream out_;
    };
};

}  // namespace eden::control
