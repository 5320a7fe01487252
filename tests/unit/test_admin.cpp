// Eden Admin API Tests
// Exercises AdminServer::handle directly (no socket)

#include <catch2/catch_test_macros.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <thread>

#include "../../src/core/admin_server.hpp"

using namespace eden;
using namespace eden::http;

namespace {

class NullUpstream : public gateway::UpstreamClient {
public:
    gateway::UpstreamResult send(const gateway::UpstreamRequest&,
                                 const core::CancellationToken*) override {
        return gateway::UpstreamResult{gateway::UpstreamOutcome::Ok, {}, {}};
    }
};

control::Config admin_config() {
    control::Config config;
    config.admin.listen_port = 0;
    config.version = "9.9.9";

    control::RouteConfig vault;
    vault.service = "vault";
    vault.path = "/api/v1/vault";
    vault.target = "http://vault:8080";
    config.routes.push_back(vault);

    control::InstanceConfig inst;
    inst.id = "vault-1";
    inst.service = "vault";
    inst.address = "10.0.0.5";
    inst.port = 8080;
    inst.health = "healthy";
    config.instances.push_back(inst);
    return config;
}

Request make_request(Method method, std::string path, std::string body = {},
                     std::string query = {}) {
    Request request;
    request.method = method;
    request.method_name = std::string(to_string(method));
    request.path = std::move(path);
    request.query = std::move(query);
    request.body = std::move(body);
    return request;
}

struct AdminHarness {
    AdminHarness()
        : config(admin_config()),
          gateway(gateway::build_gateway(config, std::make_unique<NullUpstream>())),
          admin(config, *gateway) {}

    Response call(Method method, std::string path, std::string body = {}, std::string query = {}) {
        return admin.handle(make_request(method, std::move(path), std::move(body), std::move(query)));
    }

    control::Config config;
    std::unique_ptr<gateway::GatewayComponents> gateway;
    core::AdminServer admin;
};

nlohmann::json body_of(const Response& response) {
    return nlohmann::json::parse(response.body);
}

}  // namespace

TEST_CASE("Admin health", "[admin]") {
    AdminHarness h;
    auto response = h.call(Method::GET, "/health");

    REQUIRE(response.status == StatusCode::OK);
    REQUIRE(body_of(response)["status"] == "healthy");
    REQUIRE(body_of(response)["version"] == "9.9.9");
}

TEST_CASE("Admin route management", "[admin]") {
    AdminHarness h;

    SECTION("List seeded routes") {
        auto body = body_of(h.call(Method::GET, "/admin/routes"));
        REQUIRE(body["total"] == 1);
        REQUIRE(body["routes"][0]["service"] == "vault");
        REQUIRE(body["routes"][0]["path"] == "/api/v1/vault");
        REQUIRE_FALSE(body["routes"][0]["id"].get<std::string>().empty());
    }

    SECTION("Register a route") {
        auto response = h.call(Method::POST, "/admin/routes",
                               R"({"service":"flow","path":"/api/v1/flow","target":"http://flow:8080",)"
                               R"("methods":["get","post"],"rewrite_prefix":"/v1"})");
        REQUIRE(response.status == StatusCode::Created);
        auto body = body_of(response);
        REQUIRE(body["service"] == "flow");
        REQUIRE(body["methods"] == nlohmann::json::array({"GET", "POST"}));
        REQUIRE(body["rewrite_prefix"] == "/v1");
        REQUIRE(h.gateway->routes->find_route("/api/v1/flow/runs").has_value());
    }

    SECTION("Duplicate prefix is a conflict") {
        auto response = h.call(Method::POST, "/admin/routes",
                               R"({"service":"other","path":"/api/v1/vault","target":"http://x:1"})");
        REQUIRE(response.status == StatusCode::Conflict);
        REQUIRE(body_of(response).contains("error"));
    }

    SECTION("Missing fields are rejected") {
        auto response = h.call(Method::POST, "/admin/routes", R"({"path":"/api/v1/x","target":"http://x:1"})");
        REQUIRE(response.status == StatusCode::BadRequest);
        REQUIRE(body_of(response)["error"] == "service name is required");
    }

    SECTION("Malformed JSON is rejected") {
        REQUIRE(h.call(Method::POST, "/admin/routes", "{not json").status == StatusCode::BadRequest);
        REQUIRE(h.call(Method::POST, "/admin/routes", "[1,2]").status == StatusCode::BadRequest);
    }

    SECTION("Deregister a route") {
        auto response = h.call(Method::DELETE, "/admin/routes", {}, "path=%2Fapi%2Fv1%2Fvault");
        REQUIRE(response.status == StatusCode::OK);
        REQUIRE(body_of(response)["status"] == "deregistered");
        REQUIRE(h.gateway->routes->size() == 0);

        REQUIRE(h.call(Method::DELETE, "/admin/routes", {}, "path=/api/v1/vault").status ==
                StatusCode::NotFound);
        REQUIRE(h.call(Method::DELETE, "/admin/routes").status == StatusCode::BadRequest);
    }

    SECTION("Unsupported method") {
        REQUIRE(h.call(Method::PATCH, "/admin/routes").status == StatusCode::MethodNotAllowed);
    }
}

TEST_CASE("Admin instance management", "[admin]") {
    AdminHarness h;

    SECTION("List instances") {
        auto body = body_of(h.call(Method::GET, "/admin/instances"));
        REQUIRE(body["total"] == 1);
        REQUIRE(body["instances"][0]["id"] == "vault-1");
        REQUIRE(body["instances"][0]["url"] == "http://10.0.0.5:8080");
        REQUIRE(body["instances"][0]["health"] == "healthy");

        auto filtered = body_of(h.call(Method::GET, "/admin/instances", {}, "service=flow"));
        REQUIRE(filtered["total"] == 0);
    }

    SECTION("Register with a generated id") {
        auto response = h.call(Method::POST, "/admin/instances",
                               R"({"service":"flow","address":"10.0.0.9","port":9000})");
        REQUIRE(response.status == StatusCode::Created);
        auto body = body_of(response);
        REQUIRE(body["id"].get<std::string>().size() == 36);
        REQUIRE(body["health"] == "unknown");
        REQUIRE(h.gateway->services->get_instances("flow").size() == 1);
    }

    SECTION("Invalid port and health are rejected") {
        REQUIRE(h.call(Method::POST, "/admin/instances",
                       R"({"id":"f1","service":"flow","address":"10.0.0.9","port":0})")
                    .status == StatusCode::BadRequest);
        REQUIRE(h.call(Method::POST, "/admin/instances",
                       R"({"id":"f1","service":"flow","address":"10.0.0.9","port":9000,"health":"meh"})")
                    .status == StatusCode::BadRequest);
    }

    SECTION("Duplicate id is a conflict") {
        REQUIRE(h.call(Method::POST, "/admin/instances",
                       R"({"id":"vault-1","service":"vault","address":"10.0.0.6","port":8080})")
                    .status == StatusCode::Conflict);
    }

    SECTION("Health update") {
        auto response = h.call(Method::PUT, "/admin/instances/vault-1/health", R"({"health":"unhealthy"})");
        REQUIRE(response.status == StatusCode::OK);
        REQUIRE(body_of(response)["health"] == "unhealthy");
        REQUIRE(h.gateway->services->get_instance("vault-1")->health == gateway::HealthStatus::Unhealthy);

        REQUIRE(h.call(Method::PUT, "/admin/instances/missing/health", R"({"health":"healthy"})").status ==
                StatusCode::NotFound);
        REQUIRE(h.call(Method::PUT, "/admin/instances/vault-1/health", R"({"health":"sick"})").status ==
                StatusCode::BadRequest);
        REQUIRE(h.call(Method::PUT, "/admin/instances/vault-1/health", R"({})").status ==
                StatusCode::BadRequest);
        REQUIRE(h.call(Method::GET, "/admin/instances/vault-1/health").status ==
                StatusCode::MethodNotAllowed);
    }

    SECTION("Deregister") {
        REQUIRE(h.call(Method::DELETE, "/admin/instances/vault-1").status == StatusCode::OK);
        REQUIRE(h.gateway->services->size() == 0);
        // Idempotent
        REQUIRE(h.call(Method::DELETE, "/admin/instances/vault-1").status == StatusCode::OK);
    }
}

TEST_CASE("Admin middleware listing", "[admin]") {
    AdminHarness h;
    auto body = body_of(h.call(Method::GET, "/admin/middlewares"));

    REQUIRE(body["middlewares"].size() == 2);
    REQUIRE(body["middlewares"][0]["name"] == "request-id");
    REQUIRE(body["middlewares"][0]["priority"] == 10);
    REQUIRE(body["middlewares"][1]["name"] == "forwarded-headers");
}

TEST_CASE("Admin rate limit status", "[admin]") {
    AdminHarness h;
    REQUIRE(h.gateway->rate_limiter->allow("alice"));
    REQUIRE(h.gateway->rate_limiter->allow("alice"));

    auto body = body_of(h.call(Method::GET, "/admin/rate-limits/alice"));
    REQUIRE(body["key"] == "alice");
    REQUIRE(body["limit"] == 100);
    REQUIRE(body["remaining"] == 98);
    REQUIRE(body["reset_at"].get<int64_t>() > 0);
}

TEST_CASE("Admin metrics exposition", "[admin]") {
    AdminHarness h;
    h.gateway->metrics->record_request(200, std::chrono::microseconds(150));

    auto response = h.call(Method::GET, "/metrics");
    REQUIRE(response.status == StatusCode::OK);
    REQUIRE(response.get_header("Content-Type") == "text/plain; version=0.0.4");
    REQUIRE(response.body.find("eden_requests_total 1") != std::string::npos);
    REQUIRE(response.body.find("eden_routes_registered 1") != std::string::npos);
    REQUIRE(response.body.find(R"(eden_service_instances{service="vault",health="healthy"} 1)") !=
            std::string::npos);
    REQUIRE(response.body.find(R"(eden_request_duration_seconds_bucket{le="0.005"} 1)") !=
            std::string::npos);

    SECTION("Per-service counters recorded by the dispatcher") {
        Request request = make_request(Method::GET, "/api/v1/vault/keys");
        request.client_ip = "10.1.1.1";
        (void)h.gateway->dispatcher->dispatch(request);

        auto scraped = h.call(Method::GET, "/metrics");
        REQUIRE(scraped.body.find(
                    R"(eden_service_requests_total{service="vault",method="GET",status="200"} 1)") !=
                std::string::npos);
    }
}

TEST_CASE("Admin listener serves clients concurrently", "[admin]") {
    AdminHarness h;
    REQUIRE_FALSE(h.admin.start());
    std::thread runner([&h] { h.admin.run(); });

    // First client keeps its connection open after the response
    httplib::Client lingering("127.0.0.1", h.admin.port());
    lingering.set_keep_alive(true);
    auto first = lingering.Get("/health");
    REQUIRE(first);
    REQUIRE(first->status == 200);

    httplib::Client second("127.0.0.1", h.admin.port());
    second.set_read_timeout(2, 0);
    auto started = std::chrono::steady_clock::now();
    auto res = second.Get("/admin/routes");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));

    h.admin.stop();
    runner.join();
}

TEST_CASE("Unknown admin path", "[admin]") {
    AdminHarness h;
    auto response = h.call(Method::GET, "/admin/nothing");
    REQUIRE(response.status == StatusCode::NotFound);
    REQUIRE(body_of(response)["error"] == "Endpoint not found");
}
