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

// Eden Request Dispatcher - Header
// Per-request pipeline: CORS preflight, route match, middleware, rate limit,
// instance selection, upstream forward and response mapping

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/metrics.hpp"
#include "../core/cancellation.hpp"
#include "../http/http.hpp"
#include "cors.hpp"
#include "endpoints.hpp"
#include "load_balancer.hpp"
#include "middleware.hpp"
#include "rate_limit.hpp"
#include "route_registry.hpp"
#include "service_registry.hpp"
#include "upstream_client.hpp"

namespace eden::gateway {

/// Dispatcher settings (derived from the proxy and rate_limit config sections)
struct DispatcherConfig {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{5000};
    // GET <target>/health for services without instances (/services/health)
    std::chrono::milliseconds target_check_timeout{5000};

    // Stripped from the forwarded request (Content-Length and Transfer-Encoding always are)
    std::vector<std::string> hop_by_hop_headers = {"Host", "Connection", "Upgrade",
                                                   "Proxy-Connection"};
    // Stripped from the relayed response (Content-Length always is)
    std::vector<std::string> response_hop_by_hop_headers = {"Host", "Connection", "Upgrade",
                                                            "Proxy-Connection",
                                                            "Transfer-Encoding"};

    bool rate_limit_enabled = true;
    std::string rate_limit_key_header = "X-User-ID";
    std::vector<std::string> rate_limit_excluded_paths = {"/health", "/metrics"};

    std::string version = "1.0.0";
};

/// Collaborators the dispatcher reads from; all must outlive it
struct DispatcherDeps {
    RouteRegistry& routes;
    ServiceRegistry& services;
    LoadBalancer& balancer;
    RateLimiter& rate_limiter;
    MiddlewareChain& middleware;
    UpstreamClient& upstream;
    control::GatewayMetrics& metrics;
};

/// Request dispatcher
///
/// Thread-safe: every call works on its own request and context, and all
/// shared state lives in the (internally synchronized) registries.
class Dispatcher {
public:
    Dispatcher(DispatcherDeps deps, CorsPolicy cors, DispatcherConfig config = {});

    // Non-copyable, non-movable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Produce the response for one request
    /// @param cancel Fires when the client has gone away
    /// @return nullopt when the request was cancelled and nothing must be written
    [[nodiscard]] std::optional<http::Response> dispatch(http::Request request,
                                                         const core::CancellationToken* cancel = nullptr);

    /// Path sent upstream for a matched route (rewrite applied, no query)
    [[nodiscard]] static std::string build_upstream_path(const Route& route,
                                                         std::string_view base_path,
                                                         std::string_view request_path);

    /// Rate limit key for a request (configured header, else client ip)
    [[nodiscard]] std::string rate_limit_key(const http::Request& request) const;

    [[nodiscard]] const DispatcherConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool rate_limit_excluded(std::string_view path) const;

    /// Headers to forward upstream
    [[nodiscard]] http::HeaderList forward_headers(const http::Request& request) const;

    /// Upstream response with hop-by-hop headers removed
    /// @param head Keep the upstream Content-Length (a HEAD reply has no body to measure)
    [[nodiscard]] http::Response relay_response(http::Response upstream, bool head) const;

    /// Forward to the selected target and map the outcome
    [[nodiscard]] std::optional<http::Response> forward(const http::Request& request,
                                                        const RequestContext& ctx,
                                                        const Route& route, const std::string& target,
                                                        const core::CancellationToken* cancel);

    /// Headers common to every response, metrics and the access log line
    /// @param service Metrics label ("gateway" for built-ins, "none" when unrouted)
    void finish(const http::Request& request, const RequestContext& ctx,
                const std::optional<RateLimitStatus>& limit, std::string_view service,
                http::Response& response) const;

    DispatcherDeps deps_;
    CorsPolicy cors_;
    DispatcherConfig config_;
    GatewayEndpoints endpoints_;
};

}  // namespace eden::gateway
