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

// Eden Gateway Endpoints - Header
// Built-in JSON endpoints served by the gateway itself (/health, /, /services)

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/metrics.hpp"
#include "../http/http.hpp"
#include "route_registry.hpp"
#include "service_registry.hpp"
#include "upstream_client.hpp"

namespace eden::gateway {

/// JSON response with Content-Type set
[[nodiscard]] http::Response json_response(http::StatusCode status, const nlohmann::json& body);

/// Milliseconds since the Unix epoch
[[nodiscard]] int64_t unix_millis(std::chrono::system_clock::time_point tp);

/// Gateway self-description endpoints, computed from registry state
class GatewayEndpoints {
public:
    GatewayEndpoints(const RouteRegistry& routes, const ServiceRegistry& services,
                     std::string version = "1.0.0");

    /// Check services without registered instances by calling GET <target>/health
    /// (without a client their status stays "unknown")
    void set_target_checks(UpstreamClient* upstream, std::chrono::milliseconds timeout);

    /// Source of the counters reported by /health/details (nullable)
    void set_metrics(const control::GatewayMetrics* metrics) noexcept { metrics_ = metrics; }

    /// Response for GET/HEAD on a built-in path, nullopt for anything else
    [[nodiscard]] std::optional<http::Response> handle(const http::Request& request) const;

    /// {"service","status","timestamp","version"}
    [[nodiscard]] nlohmann::json health() const;

    /// {"name","version","description","services","status"}
    [[nodiscard]] nlohmann::json info() const;

    /// {"services":[...],"total":n}
    [[nodiscard]] nlohmann::json services() const;

    /// {"overall_status","healthy_services","total_services","services","timestamp"}
    [[nodiscard]] nlohmann::json services_health() const;

    /// health() plus {"metrics":{"active_requests","total_requests","uptime_ms"}}
    [[nodiscard]] nlohmann::json health_details() const;

private:
    /// Live check of a route's static target, filling status/http_status/error
    void check_target(const Route& route, nlohmann::json& entry) const;

    /// First route of each service, in registration order
    [[nodiscard]] std::vector<Route> service_routes() const;

    const RouteRegistry& routes_;
    const ServiceRegistry& services_;
    std::string version_;
    UpstreamClient* upstream_ = nullptr;
    std::chrono::milliseconds check_timeout_{5000};
    const control::GatewayMetrics* metrics_ = nullptr;
};

}  // namespace eden::gateway
