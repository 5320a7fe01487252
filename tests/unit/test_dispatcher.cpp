// Eden Request Dispatcher Tests
// End-to-end through the dispatcher with an in-process upstream

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <mutex>
#include <stdexcept>

#include "../../src/core/status.hpp"
#include "../../src/gateway/factory.hpp"

using namespace eden::gateway;
using namespace eden::http;
using eden::control::Config;

namespace {

/// Records every outbound call and answers with a scripted result
class FakeUpstream : public UpstreamClient {
public:
    UpstreamResult send(const UpstreamRequest& request,
                        const eden::core::CancellationToken* cancel) override {
        std::lock_guard lock(mutex_);
        calls_.push_back(request);
        if (cancel && cancel->is_cancelled()) {
            return UpstreamResult{UpstreamOutcome::Cancelled, {}, "client disconnected"};
        }
        return next_;
    }

    void respond(uint16_t status, std::string body, HeaderList headers = {}) {
        std::lock_guard lock(mutex_);
        next_ = UpstreamResult{};
        next_.outcome = UpstreamOutcome::Ok;
        next_.response.status = static_cast<StatusCode>(status);
        next_.response.body = std::move(body);
        next_.response.headers = std::move(headers);
    }

    void fail(UpstreamOutcome outcome) {
        std::lock_guard lock(mutex_);
        next_ = UpstreamResult{outcome, {}, "scripted failure"};
    }

    [[nodiscard]] std::vector<UpstreamRequest> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    UpstreamResult next_{UpstreamOutcome::Ok, {}, {}};
    std::vector<UpstreamRequest> calls_;
};

Config test_config() {
    Config config;

    eden::control::RouteConfig vault;
    vault.service = "vault";
    vault.path = "/api/v1/vault";
    vault.target = "http://vault:8080";
    vault.rewrite_prefix = "/api/v1";
    config.routes.push_back(vault);

    eden::control::RouteConfig flow;
    flow.service = "flow";
    flow.path = "/api/v1/flow";
    flow.target = "http://flow:8080/base";
    flow.methods = {"GET"};
    config.routes.push_back(flow);

    config.rate_limit.limit = 3;
    config.rate_limit.window_ms = 60000;
    return config;
}

Request make_request(Method method, std::string path, std::string query = {}) {
    Request request;
    request.method = method;
    request.method_name = std::string(to_string(method));
    request.path = std::move(path);
    request.query = std::move(query);
    request.uri = request.query.empty() ? request.path : request.path + "?" + request.query;
    request.client_ip = "192.168.1.10";
    request.add_header("Host", "gateway.local");
    return request;
}

const std::string* header_value(const HeaderList& headers, std::string_view name) {
    for (const auto& [n, v] : headers) {
        if (header_name_equals(n, name)) {
            return &v;
        }
    }
    return nullptr;
}

struct Harness {
    explicit Harness(Config config = test_config()) {
        auto fake = std::make_unique<FakeUpstream>();
        upstream = fake.get();
        gateway = build_gateway(config, std::move(fake));
    }

    std::optional<Response> dispatch(Request request) {
        return gateway->dispatcher->dispatch(std::move(request));
    }

    FakeUpstream* upstream = nullptr;
    std::unique_ptr<GatewayComponents> gateway;
};

}  // namespace

TEST_CASE("Proxied request is rewritten and forwarded", "[gateway][dispatcher]") {
    Harness h;
    h.upstream->respond(200, R"({"secrets":[]})", {{"Content-Type", "application/json"},
                                                   {"Connection", "keep-alive"},
                                                   {"Transfer-Encoding", "chunked"},
                                                   {"X-Backend", "vault-1"}});

    auto request = make_request(Method::GET, "/api/v1/vault/secrets", "limit=10&sort=asc");
    request.add_header("X-User-ID", "alice");
    request.add_header("X-Custom", "kept");
    request.add_header("Connection", "keep-alive, X-Hop");
    request.add_header("X-Hop", "dropped");
    request.add_header("Content-Length", "0");

    auto response = h.dispatch(request);
    REQUIRE(response.has_value());
    REQUIRE(response->status == StatusCode::OK);
    REQUIRE(response->body == R"({"secrets":[]})");

    // Response headers
    REQUIRE(response->get_header("X-Backend") == "vault-1");
    REQUIRE(response->get_header("Content-Type") == "application/json");
    REQUIRE_FALSE(response->has_header("Connection"));
    REQUIRE_FALSE(response->has_header("Transfer-Encoding"));
    REQUIRE(response->get_header("Via") == "1.1 eden-gateway");
    REQUIRE_FALSE(response->get_header("X-Request-ID").empty());
    REQUIRE(response->get_header("X-RateLimit-Limit") == "3");
    REQUIRE(response->get_header("X-RateLimit-Remaining") == "2");
    REQUIRE_FALSE(response->get_header("X-RateLimit-Reset").empty());

    // Outbound request
    auto calls = h.upstream->calls();
    REQUIRE(calls.size() == 1);
    const auto& out = calls[0];
    REQUIRE(out.origin == "http://vault:8080");
    REQUIRE(out.method == "GET");
    REQUIRE(out.target == "/api/v1/secrets?limit=10&sort=asc");
    REQUIRE(out.timeout == std::chrono::milliseconds(30000));

    REQUIRE(*header_value(out.headers, "X-User-ID") == "alice");
    REQUIRE(*header_value(out.headers, "X-Custom") == "kept");
    REQUIRE(*header_value(out.headers, "X-Forwarded-For") == "192.168.1.10");
    REQUIRE(*header_value(out.headers, "X-Forwarded-Host") == "gateway.local");
    REQUIRE(header_value(out.headers, "X-Request-ID") != nullptr);
    REQUIRE(header_value(out.headers, "Host") == nullptr);
    REQUIRE(header_value(out.headers, "Connection") == nullptr);
    REQUIRE(header_value(out.headers, "X-Hop") == nullptr);
    REQUIRE(header_value(out.headers, "Content-Length") == nullptr);

    // The id sent upstream is the one returned to the client
    REQUIRE(*header_value(out.headers, "X-Request-ID") == response->get_header("X-Request-ID"));
}

TEST_CASE("Client request id is propagated", "[gateway][dispatcher]") {
    Harness h;
    auto request = make_request(Method::GET, "/api/v1/vault/secrets");
    request.add_header("X-Request-ID", "client-supplied");

    auto response = h.dispatch(request);
    REQUIRE(response->get_header("X-Request-ID") == "client-supplied");
    REQUIRE(*header_value(h.upstream->calls()[0].headers, "X-Request-ID") == "client-supplied");
}

TEST_CASE("Path without rewrite keeps the full path", "[gateway][dispatcher]") {
    Harness h;
    auto response = h.dispatch(make_request(Method::GET, "/api/v1/flow/runs/7"));
    REQUIRE(response->status == StatusCode::OK);

    auto calls = h.upstream->calls();
    REQUIRE(calls[0].origin == "http://flow:8080");
    REQUIRE(calls[0].target == "/base/api/v1/flow/runs/7");
}

TEST_CASE("Upstream path construction", "[gateway][dispatcher]") {
    Route route;
    route.path_prefix = "/api/v1/vault";

    REQUIRE(Dispatcher::build_upstream_path(route, "", "/api/v1/vault/secrets") == "/api/v1/vault/secrets");

    route.rewrite_prefix = "/api/v1";
    REQUIRE(Dispatcher::build_upstream_path(route, "", "/api/v1/vault/secrets") == "/api/v1/secrets");
    REQUIRE(Dispatcher::build_upstream_path(route, "", "/api/v1/vault") == "/api/v1");
    REQUIRE(Dispatcher::build_upstream_path(route, "/svc", "/api/v1/vault/a") == "/svc/api/v1/a");

    route.rewrite_prefix = "";
    REQUIRE(Dispatcher::build_upstream_path(route, "", "/api/v1/vault") == "/");
    REQUIRE(Dispatcher::build_upstream_path(route, "", "/api/v1/vault/x") == "/x");
}

TEST_CASE("Unknown path is 404", "[gateway][dispatcher]") {
    Harness h;
    auto response = h.dispatch(make_request(Method::GET, "/api/v2/unknown"));

    REQUIRE(response->status == StatusCode::NotFound);
    auto body = nlohmann::json::parse(response->body);
    REQUIRE(body["error"] == "Endpoint not found");
    REQUIRE(response->get_header("Content-Type") == "application/json");
    REQUIRE(h.upstream->calls().empty());
}

TEST_CASE("Disallowed method is 405", "[gateway][dispatcher]") {
    Harness h;
    auto response = h.dispatch(make_request(Method::DELETE, "/api/v1/flow/runs/7"));

    REQUIRE(response->status == StatusCode::MethodNotAllowed);
    auto body = nlohmann::json::parse(response->body);
    REQUIRE(body["error"] == "Method not allowed");
    REQUIRE(body["method"] == "DELETE");
    REQUIRE(response->get_header("Allow") == "GET");
    REQUIRE(h.upstream->calls().empty());
}

TEST_CASE("Rate limit rejects after the quota", "[gateway][dispatcher]") {
    Harness h;

    for (int i = 0; i < 3; ++i) {
        auto request = make_request(Method::GET, "/api/v1/vault/secrets");
        request.add_header("X-User-ID", "alice");
        REQUIRE(h.dispatch(request)->status == StatusCode::OK);
    }

    auto request = make_request(Method::GET, "/api/v1/vault/secrets");
    request.add_header("X-User-ID", "alice");
    auto rejected = h.dispatch(request);

    REQUIRE(rejected->status == StatusCode::TooManyRequests);
    auto body = nlohmann::json::parse(rejected->body);
    REQUIRE(body["error"] == "Rate limit exceeded");
    REQUIRE(body["message"] == "Too many requests, please try again later");
    REQUIRE(body["retry_after"].get<int64_t>() >= 1);
    REQUIRE_FALSE(rejected->get_header("Retry-After").empty());
    REQUIRE(rejected->get_header("X-RateLimit-Remaining") == "0");
    REQUIRE(h.upstream->calls().size() == 3);
    REQUIRE(h.gateway->metrics->snapshot().rate_limited == 1);

    SECTION("Other callers are unaffected") {
        auto other = make_request(Method::GET, "/api/v1/vault/secrets");
        other.add_header("X-User-ID", "bob");
        REQUIRE(h.dispatch(other)->status == StatusCode::OK);
    }

    SECTION("Client ip is the key without the identity header") {
        auto anonymous = make_request(Method::GET, "/api/v1/vault/secrets");
        REQUIRE(h.gateway->dispatcher->rate_limit_key(anonymous) == "192.168.1.10");
        REQUIRE(h.dispatch(anonymous)->status == StatusCode::OK);
    }
}

TEST_CASE("Gateway health is never rate limited", "[gateway][dispatcher]") {
    auto config = test_config();
    config.rate_limit.limit = 1;
    Harness h(config);

    for (int i = 0; i < 5; ++i) {
        auto response = h.dispatch(make_request(Method::GET, "/health"));
        REQUIRE(response->status == StatusCode::OK);
        REQUIRE_FALSE(response->has_header("X-RateLimit-Limit"));
    }
}

TEST_CASE("No healthy instance is 503", "[gateway][dispatcher]") {
    Harness h;
    ServiceInstance down;
    down.id = "vault-1";
    down.service_name = "vault";
    down.address = "10.0.0.5";
    down.port = 8080;
    down.health = HealthStatus::Unhealthy;
    REQUIRE(h.gateway->services->register_instance(down).ok());

    auto response = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
    REQUIRE(response->status == StatusCode::ServiceUnavailable);
    auto body = nlohmann::json::parse(response->body);
    REQUIRE(body["error"] == "Service unavailable");
    REQUIRE(body["service"] == "vault");
    REQUIRE(h.upstream->calls().empty());

    SECTION("Healthy instance is used once it recovers") {
        REQUIRE(h.gateway->services->update_instance_health("vault-1", HealthStatus::Healthy).ok());
        REQUIRE(h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"))->status == StatusCode::OK);
        REQUIRE(h.upstream->calls()[0].origin == "http://10.0.0.5:8080");
    }
}

TEST_CASE("Upstream failures map to gateway errors", "[gateway][dispatcher]") {
    Harness h;

    SECTION("Timeout is 504") {
        h.upstream->fail(UpstreamOutcome::Timeout);
        auto response = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE(response->status == StatusCode::GatewayTimeout);
        auto body = nlohmann::json::parse(response->body);
        REQUIRE(body["error"] == "Service timeout");
        REQUIRE(body["message"] == "The service did not respond within the timeout period");
        REQUIRE(body["service"] == "vault");
        REQUIRE(h.gateway->metrics->snapshot().upstream_timeouts == 1);
    }

    SECTION("Unreachable is 502") {
        h.upstream->fail(UpstreamOutcome::Unreachable);
        auto response = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE(response->status == StatusCode::BadGateway);
        auto body = nlohmann::json::parse(response->body);
        REQUIRE(body["error"] == "Service error");
        REQUIRE(body["service"] == "vault");
        REQUIRE(h.gateway->metrics->snapshot().upstream_unreachable == 1);
    }

    SECTION("Backend errors are relayed verbatim") {
        h.upstream->respond(500, "backend exploded", {{"Content-Type", "text/plain"}});
        auto response = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE(response->status_code() == 500);
        REQUIRE(response->body == "backend exploded");
    }

    REQUIRE(h.upstream->calls().size() == 1);
}

TEST_CASE("Cancelled request produces no response", "[gateway][dispatcher]") {
    Harness h;
    eden::core::CancellationToken token;
    token.cancel();

    auto response = h.gateway->dispatcher->dispatch(make_request(Method::GET, "/api/v1/vault/secrets"), &token);
    REQUIRE_FALSE(response.has_value());
    REQUIRE(h.gateway->metrics->snapshot().cancelled == 1);
}

TEST_CASE("CORS preflight is answered by the gateway", "[gateway][dispatcher]") {
    Harness h;
    auto request = make_request(Method::OPTIONS, "/api/v1/vault/secrets");
    request.add_header("Origin", "https://app.example.com");
    request.add_header("Access-Control-Request-Method", "POST");

    auto response = h.dispatch(request);
    REQUIRE(response->status == StatusCode::OK);
    REQUIRE(response->get_header("Access-Control-Allow-Origin") == "*");
    REQUIRE(response->has_header("Access-Control-Allow-Methods"));
    REQUIRE(h.upstream->calls().empty());

    SECTION("Even for unregistered paths") {
        request.path = "/not/registered";
        REQUIRE(h.dispatch(request)->status == StatusCode::OK);
    }
}

TEST_CASE("Middleware outcomes in the pipeline", "[gateway][dispatcher]") {
    Harness h;

    SECTION("Error aborts before the upstream call") {
        h.gateway->middleware->add_middleware(Middleware{"auth", 5, [](RequestContext& ctx, Request& request) {
            if (request.get_header("Authorization").empty()) {
                ctx.set_error("Unauthorized", 401);
                return MiddlewareResult::Error;
            }
            return MiddlewareResult::Continue;
        }});

        auto response = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE(response->status_code() == 401);
        REQUIRE(nlohmann::json::parse(response->body)["error"] == "Unauthorized");
        REQUIRE(h.upstream->calls().empty());
    }

    SECTION("Throwing middleware is a 500 and the next request still works") {
        h.gateway->middleware->add_middleware(Middleware{"flaky", 5, [](RequestContext&, Request& request) {
            if (request.has_header("X-Explode")) {
                throw std::runtime_error("boom");
            }
            return MiddlewareResult::Continue;
        }});

        auto bad = make_request(Method::GET, "/api/v1/vault/secrets");
        bad.add_header("X-Explode", "1");
        REQUIRE(h.dispatch(bad)->status_code() == 500);
        REQUIRE(h.gateway->routes->size() == 2);

        REQUIRE(h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"))->status == StatusCode::OK);
    }

    SECTION("Middleware sees the matched route") {
        std::string seen;
        h.gateway->middleware->add_middleware(Middleware{"peek", 5, [&seen](RequestContext& ctx, Request&) {
            seen = ctx.route ? ctx.route->service_name : "";
            return MiddlewareResult::Continue;
        }});
        (void)h.dispatch(make_request(Method::GET, "/api/v1/flow/runs"));
        REQUIRE(seen == "flow");
    }
}

TEST_CASE("Every request is counted", "[gateway][dispatcher]") {
    Harness h;
    (void)h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
    (void)h.dispatch(make_request(Method::GET, "/nowhere"));

    auto snapshot = h.gateway->metrics->snapshot();
    REQUIRE(snapshot.total_requests == 2);
    REQUIRE(snapshot.status_2xx == 1);
    REQUIRE(snapshot.status_4xx == 1);
}

TEST_CASE("Upgrade and Proxy-Connection never reach the upstream", "[gateway][dispatcher]") {
    Harness h;
    auto request = make_request(Method::GET, "/api/v1/vault/secrets");
    request.add_header("Upgrade", "websocket");
    request.add_header("Proxy-Connection", "keep-alive");
    request.add_header("X-Custom", "kept");

    REQUIRE(h.dispatch(request)->status == StatusCode::OK);

    const auto& out = h.upstream->calls().at(0);
    REQUIRE(header_value(out.headers, "Upgrade") == nullptr);
    REQUIRE(header_value(out.headers, "Proxy-Connection") == nullptr);
    REQUIRE(*header_value(out.headers, "X-Custom") == "kept");
}

TEST_CASE("Plain OPTIONS is routed like any other method", "[gateway][dispatcher]") {
    Harness h;

    SECTION("Route without OPTIONS answers 405") {
        auto request = make_request(Method::OPTIONS, "/api/v1/flow/runs");
        request.add_header("Origin", "https://app.example.com");

        auto response = h.dispatch(request);
        REQUIRE(response->status == StatusCode::MethodNotAllowed);
        REQUIRE(response->get_header("Allow") == "GET");
        REQUIRE(nlohmann::json::parse(response->body)["method"] == "OPTIONS");
        REQUIRE(h.upstream->calls().empty());
    }

    SECTION("Route allowing every method forwards it") {
        auto response = h.dispatch(make_request(Method::OPTIONS, "/api/v1/vault/secrets"));
        REQUIRE(response->status == StatusCode::OK);
        REQUIRE(h.upstream->calls().at(0).method == "OPTIONS");
    }
}

TEST_CASE("Path quotas and client lists in the pipeline", "[gateway][dispatcher]") {
    auto config = test_config();
    config.rate_limit.path_limits = {{"/api/v1/flow", 1, 60000}};
    config.rate_limit.allowlist = {"192.168.1.50"};
    config.rate_limit.denylist = {"192.168.1.99"};
    Harness h(config);

    SECTION("Path quota applies only under its prefix") {
        auto first = h.dispatch(make_request(Method::GET, "/api/v1/flow/runs"));
        REQUIRE(first->status == StatusCode::OK);
        REQUIRE(first->get_header("X-RateLimit-Limit") == "1");
        REQUIRE(first->get_header("X-RateLimit-Remaining") == "0");

        auto second = h.dispatch(make_request(Method::GET, "/api/v1/flow/runs"));
        REQUIRE(second->status == StatusCode::TooManyRequests);
        REQUIRE(second->status_code() == eden::core::to_http_status(eden::core::ErrorKind::RateLimited));

        // Default quota for the same caller is separate
        auto vault = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE(vault->status == StatusCode::OK);
        REQUIRE(vault->get_header("X-RateLimit-Limit") == "3");
    }

    SECTION("Allowlisted client is forwarded without quota headers") {
        for (int i = 0; i < 5; ++i) {
            auto request = make_request(Method::GET, "/api/v1/flow/runs");
            request.client_ip = "192.168.1.50";
            auto response = h.dispatch(request);
            REQUIRE(response->status == StatusCode::OK);
            REQUIRE_FALSE(response->has_header("X-RateLimit-Limit"));
        }
        REQUIRE(h.upstream->calls().size() == 5);
    }

    SECTION("Denylisted client is rejected with the full window as Retry-After") {
        auto request = make_request(Method::GET, "/api/v1/vault/secrets");
        request.client_ip = "192.168.1.99";
        auto response = h.dispatch(request);
        REQUIRE(response->status == StatusCode::TooManyRequests);
        REQUIRE(response->get_header("Retry-After") == "60");
        REQUIRE(response->get_header("X-RateLimit-Remaining") == "0");
        REQUIRE(h.upstream->calls().empty());
        REQUIRE(h.gateway->metrics->snapshot().rate_limited == 1);
    }
}

TEST_CASE("Gateway errors follow the error taxonomy", "[gateway][dispatcher]") {
    using eden::core::ErrorKind;
    using eden::core::to_http_status;
    Harness h;

    REQUIRE(h.dispatch(make_request(Method::GET, "/nowhere"))->status_code() ==
            to_http_status(ErrorKind::NotFound));
    REQUIRE(h.dispatch(make_request(Method::POST, "/api/v1/flow/runs"))->status_code() ==
            to_http_status(ErrorKind::MethodNotAllowed));

    h.upstream->fail(UpstreamOutcome::Timeout);
    REQUIRE(h.dispatch(make_request(Method::GET, "/api/v1/flow/runs"))->status_code() ==
            to_http_status(ErrorKind::UpstreamTimeout));

    h.upstream->fail(UpstreamOutcome::Unreachable);
    REQUIRE(h.dispatch(make_request(Method::GET, "/api/v1/flow/runs"))->status_code() ==
            to_http_status(ErrorKind::UpstreamUnreachable));

    ServiceInstance down;
    down.id = "vault-1";
    down.service_name = "vault";
    down.address = "10.0.0.5";
    down.port = 8080;
    down.health = HealthStatus::Unhealthy;
    REQUIRE(h.gateway->services->register_instance(down).ok());
    auto unavailable = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
    REQUIRE(unavailable->status_code() == to_http_status(ErrorKind::Unavailable));
    REQUIRE(nlohmann::json::parse(unavailable->body)["message"] == "No healthy instance available");
}

TEST_CASE("HEAD relays the upstream Content-Length", "[gateway][dispatcher]") {
    Harness h;
    h.upstream->respond(200, "", {{"Content-Type", "application/json"}, {"Content-Length", "512"}});

    auto head = h.dispatch(make_request(Method::HEAD, "/api/v1/vault/secrets"));
    REQUIRE(head->status == StatusCode::OK);
    REQUIRE(head->body.empty());
    REQUIRE(head->get_header("Content-Length") == "512");
    REQUIRE(serialize_response(*head, true).find("Content-Length: 512\r\n") != std::string::npos);

    SECTION("GET recomputes the length from the relayed body") {
        h.upstream->respond(200, "{}", {{"Content-Length", "512"}});
        auto get = h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
        REQUIRE_FALSE(get->has_header("Content-Length"));
        REQUIRE(serialize_response(*get, true).find("Content-Length: 2\r\n") != std::string::npos);
    }
}

TEST_CASE("Requests are counted per service", "[gateway][dispatcher]") {
    Harness h;
    (void)h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
    (void)h.dispatch(make_request(Method::GET, "/api/v1/vault/secrets"));
    (void)h.dispatch(make_request(Method::DELETE, "/api/v1/flow/runs"));
    (void)h.dispatch(make_request(Method::GET, "/nowhere"));
    (void)h.dispatch(make_request(Method::GET, "/health"));

    auto series = h.gateway->metrics->request_series();
    auto count_of = [&series](std::string_view service, std::string_view method, uint16_t status) {
        for (const auto& s : series) {
            if (s.service == service && s.method == method && s.status == status) {
                return s.count;
            }
        }
        return uint64_t{0};
    };

    REQUIRE(count_of("vault", "GET", 200) == 2);
    REQUIRE(count_of("flow", "DELETE", 405) == 1);
    REQUIRE(count_of("none", "GET", 404) == 1);
    REQUIRE(count_of("gateway", "GET", 200) == 1);
    REQUIRE(h.gateway->metrics->snapshot().active_requests == 0);

    auto details = nlohmann::json::parse(h.dispatch(make_request(Method::GET, "/health/details"))->body);
    REQUIRE(details["metrics"]["total_requests"] == 5);
    REQUIRE(details["metrics"]["active_requests"] == 1);
}
