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

// Eden Gateway Component Factory - Header
// Builds the registries, policies and dispatcher from configuration

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "cors.hpp"
#include "dispatcher.hpp"
#include "load_balancer.hpp"
#include "middleware.hpp"
#include "rate_limit.hpp"
#include "route_registry.hpp"
#include "service_registry.hpp"
#include "upstream_client.hpp"

namespace eden::gateway {

/// Everything one gateway process shares across its workers
/// Members are declared in dependency order; the dispatcher is destroyed first.
struct GatewayComponents {
    std::unique_ptr<RouteRegistry> routes;
    std::unique_ptr<ServiceRegistry> services;
    std::unique_ptr<LoadBalancer> balancer;
    std::unique_ptr<RateLimiter> rate_limiter;
    std::unique_ptr<MiddlewareChain> middleware;
    std::unique_ptr<UpstreamClient> upstream;
    std::unique_ptr<control::GatewayMetrics> metrics;
    std::unique_ptr<Dispatcher> dispatcher;
};

/// Route from its config entry (methods upper-cased by the registry)
[[nodiscard]] Route build_route(const control::RouteConfig& config);

/// Instance from its config entry (unrecognized health becomes Unknown)
[[nodiscard]] ServiceInstance build_instance(const control::InstanceConfig& config);

[[nodiscard]] LoadBalancingStrategy parse_strategy(std::string_view name) noexcept;

[[nodiscard]] CorsConfig build_cors_config(const control::CorsConfig& config);

[[nodiscard]] DispatcherConfig build_dispatcher_config(const control::Config& config);

/// Build middleware chain from configuration
[[nodiscard]] std::unique_ptr<MiddlewareChain> build_middleware_chain(const control::Config& config);

/// Build all components and seed the registries with configured routes and instances
/// @param upstream Client to forward with (an HttpUpstreamClient when null)
[[nodiscard]] std::unique_ptr<GatewayComponents> build_gateway(
    const control::Config& config, std::unique_ptr<UpstreamClient> upstream = nullptr);

}  // namespace eden::gateway
