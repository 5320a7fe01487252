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

// Eden Gateway Endpoints - Implementation

#include "endpoints.hpp"

#include <fmt/format.h>

#include "../core/containers.hpp"
#include "../core/logging.hpp"

namespace eden::gateway {

http::Response json_response(http::StatusCode status, const nlohmann::json& body) {
    http::Response response;
    response.status = status;
    response.set_content_type("application/json");
    response.body = body.dump();
    return response;
}

int64_t unix_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

GatewayEndpoints::GatewayEndpoints(const RouteRegistry& routes, const ServiceRegistry& services,
                                   std::string version)
    : routes_(routes), services_(services), version_(std::move(version)) {}

void GatewayEndpoints::set_target_checks(UpstreamClient* upstream,
                                         std::chrono::milliseconds timeout) {
    upstream_ = upstream;
    check_timeout_ = timeout;
}

std::optional<http::Response> GatewayEndpoints::handle(const http::Request& request) const {
    if (request.method != http::Method::GET && request.method != http::Method::HEAD) {
        return std::nullopt;
    }

    std::optional<http::Response> response;
    if (request.path == "/health") {
        response = json_response(http::StatusCode::OK, health());
    } else if (request.path == "/health/details") {
        response = json_response(http::StatusCode::OK, health_details());
    } else if (request.path == "/") {
        response = json_response(http::StatusCode::OK, info());
    } else if (request.path == "/services") {
        response = json_response(http::StatusCode::OK, services());
    } else if (request.path == "/services/health") {
        response = json_response(http::StatusCode::OK, services_health());
    }

    if (response && request.method == http::Method::HEAD) {
        response->set_header("Content-Length", std::to_string(response->body.size()));
        response->body.clear();
    }
    return response;
}

nlohmann::json GatewayEndpoints::health() const {
    return nlohmann::json{{"service", "api-gateway"},
                          {"status", "healthy"},
                          {"timestamp", unix_millis(std::chrono::system_clock::now())},
                          {"version", version_}};
}

nlohmann::json GatewayEndpoints::health_details() const {
    auto details = health();
    nlohmann::json metrics{{"active_requests", 0}, {"total_requests", 0}, {"uptime_ms", 0}};
    if (metrics_ != nullptr) {
        auto snapshot = metrics_->snapshot();
        metrics["active_requests"] = snapshot.active_requests;
        metrics["total_requests"] = snapshot.total_requests;
        metrics["uptime_ms"] = snapshot.uptime.count();
    }
    details["metrics"] = std::move(metrics);
    return details;
}

nlohmann::json GatewayEndpoints::info() const {
    auto names = nlohmann::json::array();
    for (const auto& route : service_routes()) {
        names.push_back(route.service_name);
    }

    return nlohmann::json{{"name", "Eden API Gateway"},
                          {"version", version_},
                          {"description", "Request routing gateway for the Eden platform services"},
                          {"services", std::move(names)},
                          {"status", "running"}};
}

std::vector<Route> GatewayEndpoints::service_routes() const {
    std::vector<Route> result;
    core::fast_set<std::string> seen;
    for (auto& route : routes_.get_routes()) {
        if (seen.insert(route.service_name).second) {
            result.push_back(std::move(route));
        }
    }
    return result;
}

nlohmann::json GatewayEndpoints::services() const {
    auto list = nlohmann::json::array();

    for (const auto& route : service_routes()) {
        auto instances = services_.get_instances(route.service_name);
        size_t healthy = 0;
        for (const auto& inst : instances) {
            if (inst.health == HealthStatus::Healthy) {
                ++healthy;
            }
        }

        list.push_back({{"name", route.service_name},
                        {"url", route.target},
                        {"health_endpoint", route.target + "/health"},
                        {"api_prefix", route.path_prefix},
                        {"instances", instances.size()},
                        {"healthy_instances", healthy}});
    }

    size_t total = list.size();
    return nlohmann::json{{"services", std::move(list)}, {"total", total}};
}

nlohmann::json GatewayEndpoints::services_health() const {
    auto list = nlohmann::json::array();
    size_t healthy_services = 0;

    for (const auto& route : service_routes()) {
        auto instances = services_.get_instances(route.service_name);
        size_t healthy = 0;
        for (const auto& inst : instances) {
            if (inst.health == HealthStatus::Healthy) {
                ++healthy;
            }
        }

        nlohmann::json entry{{"service", route.service_name},
                             {"status", healthy > 0 ? "healthy" : "unhealthy"},
                             {"healthy_instances", healthy},
                             {"total_instances", instances.size()},
                             {"url", route.target}};

        // No instances: only the static target can tell
        if (instances.empty()) {
            if (upstream_ != nullptr) {
                check_target(route, entry);
            } else {
                entry["status"] = "unknown";
            }
        }

        if (entry["status"] == "healthy") {
            ++healthy_services;
        }
        list.push_back(std::move(entry));
    }

    size_t total = list.size();
    return nlohmann::json{{"overall_status", healthy_services == total ? "healthy" : "degraded"},
                          {"healthy_services", healthy_services},
                          {"total_services", total},
                          {"services", std::move(list)},
                          {"timestamp", unix_millis(std::chrono::system_clock::now())}};
}

void GatewayEndpoints::check_target(const Route& route, nlohmann::json& entry) const {
    auto url = parse_upstream_url(route.target);
    if (!url) {
        entry["status"] = "error";
        entry["error"] = fmt::format("invalid target '{}'", route.target);
        return;
    }

    UpstreamRequest request;
    request.origin = url->origin();
    request.method = "GET";
    request.target = url->base_path + "/health";
    request.headers.emplace_back("Accept", "application/json");
    request.timeout = check_timeout_;
    request.connect_timeout = check_timeout_;

    auto result = upstream_->send(request, nullptr);
    switch (result.outcome) {
        case UpstreamOutcome::Ok: {
            uint16_t code = result.response.status_code();
            entry["status"] = (code >= 200 && code < 300) ? "healthy" : "unhealthy";
            entry["http_status"] = code;
            return;
        }
        case UpstreamOutcome::Timeout:
            entry["status"] = "timeout";
            entry["error"] = "Health check timeout";
            break;
        case UpstreamOutcome::Unreachable:
        case UpstreamOutcome::Cancelled:
            entry["status"] = "error";
            entry["error"] = result.error_detail.empty() ? "unreachable" : result.error_detail;
            break;
    }
    LOG_DEBUG(logging::get_logger(), "Health check of {} at {}: {}", route.service_name,
              route.target, entry["error"].get<std::string>());
}

}  // namespace eden::gateway
