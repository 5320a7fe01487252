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

// Eden Request Dispatcher - Implementation

#include "dispatcher.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../core/logging.hpp"
#include "../core/status.hpp"
#include "../core/string_utils.hpp"

namespace eden::gateway {

namespace {

constexpr std::string_view kVia = "1.1 eden-gateway";

bool in_list(const std::vector<std::string>& names, std::string_view name) {
    return std::any_of(names.begin(), names.end(),
                       [name](const std::string& n) { return core::iequals(n, name); });
}

/// JSON error response whose status follows the error kind
http::Response error_response(const core::Status& status, const nlohmann::json& body) {
    return json_response(static_cast<http::StatusCode>(core::to_http_status(status.kind())), body);
}

http::Response service_error(const core::Status& status, std::string_view error,
                             std::string_view service) {
    return error_response(status, nlohmann::json{{"error", std::string(error)},
                                                 {"message", status.message()},
                                                 {"service", std::string(service)}});
}

/// Keeps the active request gauge accurate on every return path
class ActiveRequest {
public:
    explicit ActiveRequest(control::GatewayMetrics& metrics) : metrics_(metrics) {
        metrics_.record_request_start();
    }
    ~ActiveRequest() { metrics_.record_request_end(); }

    ActiveRequest(const ActiveRequest&) = delete;
    ActiveRequest& operator=(const ActiveRequest&) = delete;

private:
    control::GatewayMetrics& metrics_;
};

int64_t seconds_until(std::chrono::system_clock::time_point when) {
    auto remaining = std::chrono::ceil<std::chrono::seconds>(when - std::chrono::system_clock::now());
    return std::max<int64_t>(1, remaining.count());
}

}  // namespace

Dispatcher::Dispatcher(DispatcherDeps deps, CorsPolicy cors, DispatcherConfig config)
    : deps_(deps),
      cors_(std::move(cors)),
      config_(std::move(config)),
      endpoints_(deps_.routes, deps_.services, config_.version) {
    endpoints_.set_target_checks(&deps_.upstream, config_.target_check_timeout);
    endpoints_.set_metrics(&deps_.metrics);
}

std::string Dispatcher::build_upstream_path(const Route& route, std::string_view base_path,
                                            std::string_view request_path) {
    std::string path(base_path);

    if (!route.rewrite_prefix) {
        path += request_path;
    } else {
        std::string_view remainder = request_path.substr(
            std::min(route.path_prefix.size(), request_path.size()));
        const std::string& rewrite = *route.rewrite_prefix;
        path += rewrite;
        if (!remainder.empty() && remainder.front() != '/' &&
            (rewrite.empty() || rewrite.back() != '/')) {
            path += '/';
        }
        path += remainder;
    }

    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return path;
}

std::string Dispatcher::rate_limit_key(const http::Request& request) const {
    if (!config_.rate_limit_key_header.empty()) {
        auto value = core::trim(request.get_header(config_.rate_limit_key_header));
        if (!value.empty()) {
            return std::string(value);
        }
    }
    return request.client_ip;
}

bool Dispatcher::rate_limit_excluded(std::string_view path) const {
    for (const auto& excluded : config_.rate_limit_excluded_paths) {
        if (path == excluded) {
            return true;
        }
        if (path.size() > excluded.size() && path.starts_with(excluded) &&
            (excluded.ends_with('/') || path[excluded.size()] == '/')) {
            return true;
        }
    }
    return false;
}

http::HeaderList Dispatcher::forward_headers(const http::Request& request) const {
    // Headers named in Connection are hop-by-hop for this message only
    std::vector<std::string> connection_tokens;
    if (const auto* connection = request.find_header("Connection")) {
        connection_tokens = core::split_list(*connection, ',');
    }

    http::HeaderList headers;
    headers.reserve(request.headers.size() + 1);
    for (const auto& [name, value] : request.headers) {
        if (in_list(config_.hop_by_hop_headers, name) || in_list(connection_tokens, name) ||
            core::iequals(name, "Content-Length") || core::iequals(name, "Transfer-Encoding")) {
            continue;
        }
        headers.emplace_back(name, value);
    }
    headers.emplace_back("Via", std::string(kVia));
    return headers;
}

http::Response Dispatcher::relay_response(http::Response upstream, bool head) const {
    http::Response response;
    response.status = upstream.status;
    response.body = std::move(upstream.body);

    response.headers.reserve(upstream.headers.size());
    for (auto& [name, value] : upstream.headers) {
        if (in_list(config_.response_hop_by_hop_headers, name) ||
            (!head && core::iequals(name, "Content-Length"))) {
            continue;
        }
        response.headers.emplace_back(std::move(name), std::move(value));
    }
    return response;
}

std::optional<http::Response> Dispatcher::dispatch(http::Request request,
                                                   const core::CancellationToken* cancel) {
    ActiveRequest active(deps_.metrics);
    RequestContext ctx;
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.client_ip = request.client_ip;
    std::optional<RateLimitStatus> limit;
    std::string_view service = "gateway";

    auto done = [&](http::Response response) -> std::optional<http::Response> {
        finish(request, ctx, limit, service, response);
        return response;
    };

    // 1. CORS preflight never reaches a route
    if (cors_.enabled() && CorsPolicy::is_preflight(request)) {
        return done(cors_.preflight_response(request));
    }

    // 2. Gateway's own endpoints
    if (auto builtin = endpoints_.handle(request)) {
        return done(std::move(*builtin));
    }

    // 3. Route match
    auto route = deps_.routes.find_route(request.path);
    if (!route) {
        service = "none";
        return done(error_response(core::not_found_error("Endpoint not found"),
                                   nlohmann::json{{"error", "Endpoint not found"}, {"path", request.path}}));
    }
    ctx.route = &*route;
    service = route->service_name;

    // 4. Method check
    if (!route->allows_method(request.method_string())) {
        auto response = error_response(
            core::Status::error(core::ErrorKind::MethodNotAllowed, "Method not allowed"),
            nlohmann::json{{"error", "Method not allowed"}, {"method", std::string(request.method_string())}});
        if (!route->methods.empty()) {
            response.set_header("Allow", core::join(route->methods, ", "));
        }
        return done(std::move(response));
    }

    // 5. Middleware chain
    switch (deps_.middleware.run(ctx, request)) {
        case MiddlewareResult::Continue:
            break;
        case MiddlewareResult::Stop:
            return done(std::move(ctx.response));
        case MiddlewareResult::Error:
            return done(json_response(static_cast<http::StatusCode>(ctx.error_status),
                                      nlohmann::json{{"error", ctx.error_message}}));
    }

    // 6. Rate limit (allowlisted clients carry no quota headers)
    if (config_.rate_limit_enabled && !rate_limit_excluded(request.path)) {
        std::string key = rate_limit_key(request);
        auto result = deps_.rate_limiter.check(key, request.client_ip, request.path);
        if (result.decision != RateLimitDecision::Allowlisted) {
            limit = result.status;
        }

        if (!result.admitted()) {
            deps_.metrics.record_rate_limited();
            int64_t retry_after = seconds_until(result.status.reset_at);
            LOG_WARNING(logging::get_logger(),
                        "Rate limit exceeded: key={}, path={}, decision={}, correlation_id={}",
                        result.window_key, request.path, to_string(result.decision),
                        ctx.correlation_id);

            auto response = error_response(
                core::Status::error(core::ErrorKind::RateLimited, "Rate limit exceeded"),
                nlohmann::json{{"error", "Rate limit exceeded"},
                               {"message", "Too many requests, please try again later"},
                               {"retry_after", retry_after}});
            response.set_header("Retry-After", std::to_string(retry_after));
            return done(std::move(response));
        }
    }

    // 7. Instance selection
    auto target = deps_.balancer.select_target(*route);
    if (!target) {
        deps_.metrics.record_no_healthy_instance();
        LOG_UPSTREAM(logging::get_logger(), "no healthy instance", route->service_name, "-",
                     ctx.correlation_id);
        return done(service_error(core::Status::error(core::ErrorKind::Unavailable,
                                                      "No healthy instance available"),
                                  "Service unavailable", route->service_name));
    }

    // 8. Forward
    auto response = forward(request, ctx, *route, *target, cancel);
    if (!response) {
        return std::nullopt;
    }
    return done(std::move(*response));
}

std::optional<http::Response> Dispatcher::forward(const http::Request& request,
                                                  const RequestContext& ctx, const Route& route,
                                                  const std::string& target,
                                                  const core::CancellationToken* cancel) {
    auto url = parse_upstream_url(target);
    if (!url) {
        LOG_ERROR_CTX(logging::get_logger(), "Invalid upstream target", ctx.correlation_id,
                      "BAD_TARGET", target);
        return service_error(core::Status::error(core::ErrorKind::UpstreamUnreachable,
                                                 "The service could not be reached"),
                             "Service error", route.service_name);
    }

    UpstreamRequest outbound;
    outbound.origin = url->origin();
    outbound.method = std::string(request.method_string());
    outbound.target = build_upstream_path(route, url->base_path, request.path);
    if (!request.query.empty()) {
        outbound.target += '?';
        outbound.target += request.query;
    }
    outbound.headers = forward_headers(request);
    outbound.body = request.body;
    outbound.timeout = config_.timeout;
    outbound.connect_timeout = config_.connect_timeout;

    LOG_DEBUG(logging::get_logger(), "Forwarding {} {} to {}{} correlation_id={}",
              outbound.method, request.path, outbound.origin, outbound.target, ctx.correlation_id);

    auto result = deps_.upstream.send(outbound, cancel);

    switch (result.outcome) {
        case UpstreamOutcome::Ok:
            return relay_response(std::move(result.response), request.method == http::Method::HEAD);

        case UpstreamOutcome::Cancelled:
            deps_.metrics.record_cancelled();
            LOG_UPSTREAM(logging::get_logger(), "cancelled", route.service_name, target,
                         ctx.correlation_id);
            return std::nullopt;

        case UpstreamOutcome::Timeout:
            deps_.metrics.record_upstream_timeout();
            LOG_ERROR_CTX(logging::get_logger(), "Upstream timeout", ctx.correlation_id,
                          "UPSTREAM_TIMEOUT", fmt::format("{} {}", target, result.error_detail));
            return service_error(
                core::Status::error(core::ErrorKind::UpstreamTimeout,
                                    "The service did not respond within the timeout period"),
                "Service timeout", route.service_name);

        case UpstreamOutcome::Unreachable:
            break;
    }

    deps_.metrics.record_upstream_unreachable();
    LOG_ERROR_CTX(logging::get_logger(), "Upstream unreachable", ctx.correlation_id,
                  "UPSTREAM_UNREACHABLE", fmt::format("{} {}", target, result.error_detail));
    return service_error(core::Status::error(core::ErrorKind::UpstreamUnreachable,
                                             "The service could not be reached"),
                         "Service error", route.service_name);
}

void Dispatcher::finish(const http::Request& request, const RequestContext& ctx,
                        const std::optional<RateLimitStatus>& limit, std::string_view service,
                        http::Response& response) const {
    auto request_id = request.get_header("X-Request-ID");
    response.set_header("X-Request-ID", request_id.empty() ? std::string_view(ctx.correlation_id)
                                                           : request_id);
    response.set_header("Via", kVia);

    if (limit) {
        response.set_header("X-RateLimit-Limit", std::to_string(limit->limit));
        response.set_header("X-RateLimit-Remaining", std::to_string(limit->remaining));
        response.set_header(
            "X-RateLimit-Reset",
            std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                               limit->reset_at.time_since_epoch())
                               .count()));
    }

    if (cors_.enabled()) {
        cors_.apply(request, response);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - ctx.start_time);
    deps_.metrics.record_request(response.status_code(), elapsed);
    deps_.metrics.record_service_request(service, request.method_string(), response.status_code());

    LOG_REQUEST(logging::get_logger(), request.method_string(), request.path,
                response.status_code(), elapsed.count(), request.client_ip, ctx.correlation_id);
}

}  // namespace eden::gateway
