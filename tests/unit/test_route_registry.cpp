// Eden Route Registry Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/gateway/route_registry.hpp"

using namespace eden::gateway;
using eden::core::ErrorKind;

namespace {

Route make_route(std::string service, std::string prefix, std::string target) {
    Route route;
    route.service_name = std::move(service);
    route.path_prefix = std::move(prefix);
    route.target = std::move(target);
    return route;
}

}  // namespace

TEST_CASE("Route registration validates required fields", "[gateway][routes]") {
    RouteRegistry registry;

    SECTION("Missing service name") {
        auto status = registry.register_route(make_route("", "/api/v1/vault", "http://vault:8080"));
        REQUIRE(status.kind() == ErrorKind::Validation);
        REQUIRE(status.message().find("service name") != std::string::npos);
    }

    SECTION("Missing path") {
        auto status = registry.register_route(make_route("vault", "", "http://vault:8080"));
        REQUIRE(status.kind() == ErrorKind::Validation);
        REQUIRE(status.message().find("path") != std::string::npos);
    }

    SECTION("Missing target") {
        auto status = registry.register_route(make_route("vault", "/api/v1/vault", ""));
        REQUIRE(status.kind() == ErrorKind::Validation);
        REQUIRE(status.message().find("target") != std::string::npos);
    }

    SECTION("Whitespace-only counts as empty") {
        auto status = registry.register_route(make_route("   ", "/api/v1/vault", "http://vault:8080"));
        REQUIRE(status.kind() == ErrorKind::Validation);
    }

    REQUIRE(registry.size() == 0);
}

TEST_CASE("Registered route is retrievable", "[gateway][routes]") {
    RouteRegistry registry;

    auto route = make_route("vault", "/api/v1/vault", "http://vault:8080");
    route.methods = {"get", " post "};
    REQUIRE(registry.register_route(route).ok());

    auto routes = registry.get_routes();
    REQUIRE(routes.size() == 1);
    REQUIRE(routes[0].service_name == "vault");
    REQUIRE(routes[0].target == "http://vault:8080");
    REQUIRE_FALSE(routes[0].id.empty());
    REQUIRE(routes[0].methods == std::vector<std::string>{"GET", "POST"});
    REQUIRE(routes[0].allows_method("get"));
    REQUIRE_FALSE(routes[0].allows_method("DELETE"));
}

TEST_CASE("Duplicate path prefix is rejected", "[gateway][routes]") {
    RouteRegistry registry;

    REQUIRE(registry.register_route(make_route("vault", "/api/v1/vault", "http://vault:8080")).ok());
    auto status = registry.register_route(make_route("other", "/api/v1/vault", "http://other:8080"));

    REQUIRE(status.kind() == ErrorKind::Conflict);
    REQUIRE(status.message().find("already registered") != std::string::npos);

    auto routes = registry.get_routes();
    REQUIRE(routes.size() == 1);
    REQUIRE(routes[0].service_name == "vault");
}

TEST_CASE("Routes are listed in registration order", "[gateway][routes]") {
    RouteRegistry registry;
    const std::vector<std::string> names = {"vault", "flow", "task", "monitor", "sync", "insight", "hub"};
    for (const auto& name : names) {
        REQUIRE(registry.register_route(make_route(name, "/api/v1/" + name, "http://" + name + ":8080")).ok());
    }

    auto routes = registry.get_routes();
    REQUIRE(routes.size() == names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        REQUIRE(routes[i].service_name == names[i]);
    }
}

TEST_CASE("Longest segment-aware prefix match", "[gateway][routes]") {
    RouteRegistry registry;
    REQUIRE(registry.register_route(make_route("api", "/api", "http://api:8080")).ok());
    REQUIRE(registry.register_route(make_route("vault", "/api/v1/vault", "http://vault:8080")).ok());
    REQUIRE(registry.register_route(make_route("static", "/static/", "http://cdn:8080")).ok());

    SECTION("Exact prefix") {
        auto route = registry.find_route("/api/v1/vault");
        REQUIRE(route.has_value());
        REQUIRE(route->service_name == "vault");
    }

    SECTION("Nested path under prefix") {
        auto route = registry.find_route("/api/v1/vault/secrets/42");
        REQUIRE(route.has_value());
        REQUIRE(route->service_name == "vault");
    }

    SECTION("Sibling with common string prefix falls back to shorter route") {
        auto route = registry.find_route("/api/v1/vaultx");
        REQUIRE(route.has_value());
        REQUIRE(route->service_name == "api");
    }

    SECTION("Trailing-slash prefix") {
        auto route = registry.find_route("/static/css/site.css");
        REQUIRE(route.has_value());
        REQUIRE(route->service_name == "static");
    }

    SECTION("No match") {
        REQUIRE_FALSE(registry.find_route("/unknown/path").has_value());
        REQUIRE_FALSE(registry.find_route("/apix").has_value());
    }
}

TEST_CASE("Route prefix matching", "[gateway][routes]") {
    auto route = make_route("vault", "/api/v1/vault", "http://vault:8080");
    REQUIRE(route.matches("/api/v1/vault"));
    REQUIRE(route.matches("/api/v1/vault/"));
    REQUIRE(route.matches("/api/v1/vault/x"));
    REQUIRE_FALSE(route.matches("/api/v1/vaultx"));
    REQUIRE_FALSE(route.matches("/api/v1"));
}

TEST_CASE("Route deregistration", "[gateway][routes]") {
    RouteRegistry registry;
    REQUIRE(registry.register_route(make_route("vault", "/api/v1/vault", "http://vault:8080")).ok());

    REQUIRE(registry.deregister_route("/api/v1/vault").ok());
    REQUIRE(registry.size() == 0);
    REQUIRE_FALSE(registry.find_route("/api/v1/vault/x").has_value());

    auto status = registry.deregister_route("/api/v1/vault");
    REQUIRE(status.kind() == ErrorKind::NotFound);

    // Prefix can be registered again once removed
    REQUIRE(registry.register_route(make_route("vault", "/api/v1/vault", "http://vault:9090")).ok());
}
