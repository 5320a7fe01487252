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

// Eden Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace eden::gateway {

Route build_route(const control::RouteConfig& config) {
    Route route;
    route.id = config.id;
    route.service_name = config.service;
    route.path_prefix = config.path;
    route.target = config.target;
    route.methods = config.methods;
    route.rewrite_prefix = config.rewrite_prefix;
    route.metadata = config.metadata;
    return route;
}

ServiceInstance build_instance(const control::InstanceConfig& config) {
    ServiceInstance instance;
    instance.id = config.id;
    instance.service_name = config.service;
    instance.address = config.address;
    instance.port = config.port;
    instance.health = parse_health_status(config.health).value_or(HealthStatus::Unknown);
    instance.metadata = config.metadata;
    return instance;
}

LoadBalancingStrategy parse_strategy(std::string_view name) noexcept {
    if (core::iequals(name, "random")) {
        return LoadBalancingStrategy::Random;
    }
    return LoadBalancingStrategy::RoundRobin;
}

CorsConfig build_cors_config(const control::CorsConfig& config) {
    CorsConfig cors;
    cors.enabled = config.enabled;
    cors.allowed_origins = config.allowed_origins;
    cors.allowed_methods = config.allowed_methods;
    cors.allowed_headers = config.allowed_headers;
    cors.allow_credentials = config.allow_credentials;
    cors.max_age = static_cast<int>(config.max_age);
    return cors;
}

DispatcherConfig build_dispatcher_config(const control::Config& config) {
    DispatcherConfig dispatcher;
    dispatcher.timeout = std::chrono::milliseconds(config.proxy.timeout_ms);
    dispatcher.connect_timeout = std::chrono::milliseconds(config.proxy.connect_timeout_ms);
    dispatcher.target_check_timeout = std::chrono::milliseconds(config.health_check.timeout_ms);
    dispatcher.hop_by_hop_headers = config.proxy.hop_by_hop_headers;
    dispatcher.response_hop_by_hop_headers = config.proxy.response_hop_by_hop_headers;
    dispatcher.rate_limit_enabled = config.rate_limit.enabled;
    dispatcher.rate_limit_key_header = config.rate_limit.key_header;
    dispatcher.rate_limit_excluded_paths = config.rate_limit.excluded_paths;
    dispatcher.version = config.version;
    return dispatcher;
}

std::unique_ptr<MiddlewareChain> build_middleware_chain(const control::Config& config) {
    auto chain = std::make_unique<MiddlewareChain>();
    if (config.middleware.request_id) {
        chain->add_middleware(make_request_id_middleware());
    }
    if (config.middleware.forwarded_headers) {
        chain->add_middleware(make_forwarded_headers_middleware());
    }
    return chain;
}

std::unique_ptr<GatewayComponents> build_gateway(const control::Config& config,
                                                 std::unique_ptr<UpstreamClient> upstream) {
    auto* logger = logging::get_logger();
    auto gw = std::make_unique<GatewayComponents>();

    gw->routes = std::make_unique<RouteRegistry>();
    gw->services = std::make_unique<ServiceRegistry>();

    auto strategy = parse_strategy(config.proxy.load_balancing);
    gw->balancer = std::make_unique<LoadBalancer>(*gw->services, make_policy(strategy));

    RateLimitConfig limits;
    limits.limit = config.rate_limit.limit;
    limits.window = std::chrono::milliseconds(config.rate_limit.window_ms);
    for (const auto& path_limit : config.rate_limit.path_limits) {
        limits.path_limits.push_back(PathLimit{path_limit.path, path_limit.limit,
                                               std::chrono::milliseconds(path_limit.window_ms)});
    }
    limits.allowlist = config.rate_limit.allowlist;
    limits.denylist = config.rate_limit.denylist;
    limits.cleanup_interval = std::chrono::milliseconds(config.rate_limit.cleanup_interval_ms);
    gw->rate_limiter = std::make_unique<RateLimiter>(limits);

    gw->middleware = build_middleware_chain(config);
    gw->upstream = upstream ? std::move(upstream) : std::make_unique<HttpUpstreamClient>();
    gw->metrics = std::make_unique<control::GatewayMetrics>();

    for (const auto& route_config : config.routes) {
        auto status = gw->routes->register_route(build_route(route_config));
        if (!status.ok()) {
            LOG_WARNING(logger, "Skipping configured route {}: {}", route_config.path,
                        status.message());
        }
    }

    for (const auto& instance_config : config.instances) {
        auto status = gw->services->register_instance(build_instance(instance_config));
        if (!status.ok()) {
            LOG_WARNING(logger, "Skipping configured instance {}: {}", instance_config.id,
                        status.message());
        }
    }

    gw->dispatcher = std::make_unique<Dispatcher>(
        DispatcherDeps{*gw->routes, *gw->services, *gw->balancer, *gw->rate_limiter,
                       *gw->middleware, *gw->upstream, *gw->metrics},
        CorsPolicy(build_cors_config(config.cors)), build_dispatcher_config(config));

    LOG_INFO(logger, "Gateway built: routes={}, instances={}, load_balancing={}",
             gw->routes->size(), gw->services->size(), gw->balancer->policy_name());
    return gw;
}

}  // namespace eden::gateway
