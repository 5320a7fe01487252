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

// Eden Admin Server - Implementation

#include "admin_server.hpp"

#include <fmt/format.h>

#include "../control/prometheus.hpp"
#include "../gateway/endpoints.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

namespace eden::core {

namespace {

constexpr std::string_view kRoutesPath = "/admin/routes";
constexpr std::string_view kInstancesPath = "/admin/instances";
constexpr std::string_view kInstancesPrefix = "/admin/instances/";
constexpr std::string_view kHealthSuffix = "/health";
constexpr std::string_view kRateLimitsPrefix = "/admin/rate-limits/";

http::Response error_response(http::StatusCode status, std::string_view message) {
    return gateway::json_response(status, nlohmann::json{{"error", std::string(message)}});
}

http::Response status_response(const Status& status) {
    return error_response(static_cast<http::StatusCode>(to_http_status(status.kind())),
                          status.message());
}

/// Parse a JSON object body into T; nullopt with an error response on failure
template <typename T>
std::optional<T> parse_body(const http::Request& request, http::Response& error) {
    try {
        auto json = nlohmann::json::parse(request.body);
        if (!json.is_object()) {
            error = error_response(http::StatusCode::BadRequest, "request body must be a JSON object");
            return std::nullopt;
        }
        return json.get<T>();
    } catch (const nlohmann::json::exception& e) {
        error = error_response(http::StatusCode::BadRequest,
                               fmt::format("invalid request body: {}", e.what()));
        return std::nullopt;
    }
}

}  // namespace

nlohmann::json route_to_json(const gateway::Route& route) {
    nlohmann::json j{{"id", route.id},
                     {"service", route.service_name},
                     {"path", route.path_prefix},
                     {"target", route.target},
                     {"methods", route.methods},
                     {"metadata", route.metadata},
                     {"created_at", gateway::unix_millis(route.created_at)}};
    if (route.rewrite_prefix) {
        j["rewrite_prefix"] = *route.rewrite_prefix;
    }
    return j;
}

nlohmann::json instance_to_json(const gateway::ServiceInstance& instance) {
    return nlohmann::json{{"id", instance.id},
                          {"service", instance.service_name},
                          {"address", instance.address},
                          {"port", instance.port},
                          {"url", instance.url()},
                          {"health", std::string(gateway::to_string(instance.health))},
                          {"metadata", instance.metadata},
                          {"registered_at", gateway::unix_millis(instance.registered_at)},
                          {"last_seen", gateway::unix_millis(instance.last_seen)}};
}

AdminServer::AdminServer(const control::Config& config, gateway::GatewayComponents& gateway)
    : version_(config.version),
      gateway_(gateway),
      pool_(config.admin.worker_threads, 256, "admin"),
      listener_(ListenerConfig{.name = "admin",
                               .address = config.admin.listen_address,
                               .port = static_cast<uint16_t>(config.admin.listen_port),
                               .backlog = 32,
                               .limits = {config.server.max_header_size, config.server.max_request_size},
                               .idle_timeout = std::chrono::milliseconds(config.server.idle_timeout)},
                [this](http::Request request, const CancellationToken&) -> std::optional<http::Response> {
                    return handle(request);
                },
                &pool_) {}

AdminServer::~AdminServer() {
    // Idle keep-alive connections are closed by stop(); workers then drain
    listener_.stop();
    pool_.shutdown();
}

http::Response AdminServer::handle(const http::Request& request) {
    const auto method = request.method;
    const std::string_view path = request.path;

    if (path == "/health" && method == http::Method::GET) {
        return gateway::json_response(
            http::StatusCode::OK,
            nlohmann::json{{"status", "healthy"},
                           {"version", version_},
                           {"timestamp", gateway::unix_millis(std::chrono::system_clock::now())}});
    }

    if (path == "/metrics" && method == http::Method::GET) {
        return handle_metrics();
    }

    if (path == kRoutesPath) {
        switch (method) {
            case http::Method::GET:
                return list_routes();
            case http::Method::POST:
                return create_route(request);
            case http::Method::DELETE:
                return delete_route(request);
            default:
                break;
        }
        return error_response(http::StatusCode::MethodNotAllowed, "Method not allowed");
    }

    if (path == kInstancesPath) {
        switch (method) {
            case http::Method::GET:
                return list_instances(request);
            case http::Method::POST:
                return create_instance(request);
            default:
                break;
        }
        return error_response(http::StatusCode::MethodNotAllowed, "Method not allowed");
    }

    if (path.starts_with(kInstancesPrefix)) {
        std::string_view rest = path.substr(kInstancesPrefix.size());

        if (rest.ends_with(kHealthSuffix)) {
            std::string_view id = rest.substr(0, rest.size() - kHealthSuffix.size());
            if (!id.empty() && id.find('/') == std::string_view::npos) {
                if (method != http::Method::PUT) {
                    return error_response(http::StatusCode::MethodNotAllowed, "Method not allowed");
                }
                return update_health(http::url_decode(id), request);
            }
        }

        if (!rest.empty() && rest.find('/') == std::string_view::npos) {
            if (method != http::Method::DELETE) {
                return error_response(http::StatusCode::MethodNotAllowed, "Method not allowed");
            }
            return delete_instance(http::url_decode(rest));
        }
    }

    if (path == "/admin/middlewares" && method == http::Method::GET) {
        return list_middlewares();
    }

    if (path.starts_with(kRateLimitsPrefix) && path.size() > kRateLimitsPrefix.size() &&
        method == http::Method::GET) {
        return rate_limit_status(http::url_decode(path.substr(kRateLimitsPrefix.size())));
    }

    return error_response(http::StatusCode::NotFound, "Endpoint not found");
}

http::Response AdminServer::handle_metrics() const {
    control::RegistryStats stats;
    stats.routes = gateway_.routes->size();
    stats.rate_limit_keys = gateway_.rate_limiter->key_count();
    stats.middlewares = gateway_.middleware->size();

    for (const auto& service : gateway_.services->list_services()) {
        control::RegistryStats::ServiceInstances counts;
        counts.service = service;
        for (const auto& inst : gateway_.services->get_instances(service)) {
            switch (inst.health) {
                case gateway::HealthStatus::Healthy:
                    ++counts.healthy;
                    break;
                case gateway::HealthStatus::Unhealthy:
                    ++counts.unhealthy;
                    break;
                case gateway::HealthStatus::Unknown:
                    ++counts.unknown;
                    break;
            }
        }
        stats.services.push_back(std::move(counts));
    }

    http::Response response;
    response.set_content_type("text/plain; version=0.0.4");
    response.body = control::PrometheusExporter::export_metrics(gateway_.metrics->snapshot());
    response.body += control::PrometheusExporter::export_request_series(
        gateway_.metrics->request_series());
    response.body += control::PrometheusExporter::export_registry_metrics(stats);
    return response;
}

http::Response AdminServer::list_routes() const {
    auto routes = nlohmann::json::array();
    for (const auto& route : gateway_.routes->get_routes()) {
        routes.push_back(route_to_json(route));
    }
    size_t total = routes.size();
    return gateway::json_response(http::StatusCode::OK,
                                  nlohmann::json{{"routes", std::move(routes)}, {"total", total}});
}

http::Response AdminServer::create_route(const http::Request& request) {
    http::Response error;
    auto config = parse_body<control::RouteConfig>(request, error);
    if (!config) {
        return error;
    }

    auto status = gateway_.routes->register_route(gateway::build_route(*config));
    if (!status.ok()) {
        LOG_WARNING(logging::get_logger(), "Admin route registration rejected: {}",
                    status.message());
        return status_response(status);
    }

    auto prefix = std::string(trim(config->path));
    LOG_INFO(logging::get_logger(), "Route registered: service={}, path={}", config->service,
             prefix);

    auto route = gateway_.routes->find_route(prefix);
    if (!route) {
        // Deregistered concurrently
        return error_response(http::StatusCode::NotFound,
                              fmt::format("route with path '{}' not found", prefix));
    }
    return gateway::json_response(http::StatusCode::Created, route_to_json(*route));
}

http::Response AdminServer::delete_route(const http::Request& request) {
    auto prefix = http::query_param(request.query, "path");
    if (!prefix || is_blank(*prefix)) {
        return error_response(http::StatusCode::BadRequest, "path query parameter is required");
    }

    auto status = gateway_.routes->deregister_route(trim(*prefix));
    if (!status.ok()) {
        return status_response(status);
    }

    LOG_INFO(logging::get_logger(), "Route deregistered: path={}", *prefix);
    return gateway::json_response(http::StatusCode::OK,
                                  nlohmann::json{{"status", "deregistered"}, {"path", std::string(trim(*prefix))}});
}

http::Response AdminServer::list_instances(const http::Request& request) const {
    auto instances = nlohmann::json::array();

    if (auto service = http::query_param(request.query, "service")) {
        for (const auto& inst : gateway_.services->get_instances(*service)) {
            instances.push_back(instance_to_json(inst));
        }
    } else {
        for (const auto& name : gateway_.services->list_services()) {
            for (const auto& inst : gateway_.services->get_instances(name)) {
                instances.push_back(instance_to_json(inst));
            }
        }
    }

    size_t total = instances.size();
    return gateway::json_response(
        http::StatusCode::OK, nlohmann::json{{"instances", std::move(instances)}, {"total", total}});
}

http::Response AdminServer::create_instance(const http::Request& request) {
    http::Response error;
    auto config = parse_body<control::InstanceConfig>(request, error);
    if (!config) {
        return error;
    }

    if (is_blank(config->id)) {
        config->id = logging::generate_uuid();
    }
    if (!gateway::parse_health_status(config->health)) {
        return error_response(http::StatusCode::BadRequest,
                              fmt::format("invalid health value '{}'", config->health));
    }

    auto instance = gateway::build_instance(*config);
    auto status = gateway_.services->register_instance(instance);
    if (!status.ok()) {
        LOG_WARNING(logging::get_logger(), "Admin instance registration rejected: {}",
                    status.message());
        return status_response(status);
    }

    auto registered = gateway_.services->get_instance(trim(config->id));
    if (!registered) {
        return error_response(http::StatusCode::NotFound,
                              fmt::format("instance '{}' not found", config->id));
    }
    return gateway::json_response(http::StatusCode::Created, instance_to_json(*registered));
}

http::Response AdminServer::delete_instance(std::string_view id) {
    auto status = gateway_.services->deregister_instance(id);
    if (!status.ok()) {
        return status_response(status);
    }
    return gateway::json_response(http::StatusCode::OK,
                                  nlohmann::json{{"status", "deregistered"}, {"id", std::string(id)}});
}

http::Response AdminServer::update_health(std::string_view id, const http::Request& request) {
    std::string value;
    try {
        auto json = nlohmann::json::parse(request.body);
        if (!json.is_object() || !json.contains("health") || !json.at("health").is_string()) {
            return error_response(http::StatusCode::BadRequest, "health is required");
        }
        value = json.at("health").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return error_response(http::StatusCode::BadRequest,
                              fmt::format("invalid request body: {}", e.what()));
    }

    auto health = gateway::parse_health_status(value);
    if (!health) {
        return error_response(http::StatusCode::BadRequest,
                              fmt::format("invalid health value '{}'", value));
    }

    auto status = gateway_.services->update_instance_health(id, *health);
    if (!status.ok()) {
        return status_response(status);
    }
    return gateway::json_response(
        http::StatusCode::OK, nlohmann::json{{"id", std::string(id)},
                                                     {"health", std::string(gateway::to_string(*health))}});
}

http::Response AdminServer::list_middlewares() const {
    auto list = nlohmann::json::array();
    for (const auto& mw : gateway_.middleware->get_middlewares()) {
        list.push_back({{"name", mw.name}, {"priority", mw.priority}});
    }
    return gateway::json_response(http::StatusCode::OK, nlohmann::json{{"middlewares", std::move(list)}});
}

http::Response AdminServer::rate_limit_status(std::string_view key) {
    auto status = gateway_.rate_limiter->status(key);
    return gateway::json_response(
        http::StatusCode::OK,
        nlohmann::json{{"key", std::string(key)},
                       {"limit", status.limit},
                       {"remaining", status.remaining},
                       {"reset_at", gateway::unix_millis(status.reset_at)}});
}

}  // namespace eden::core
