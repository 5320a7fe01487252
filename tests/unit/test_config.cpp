// Eden Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace eden::control;

namespace {

bool has_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Config valid_config() {
    Config config;
    RouteConfig route;
    route.service = "vault";
    route.path = "/api/v1/vault";
    route.target = "http://vault:8080";
    config.routes.push_back(route);
    return config;
}

}  // namespace

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config = valid_config();
    config.version = "1.0";
    config.server.listen_port = 8080;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"version\"") != std::string::npos);
    REQUIRE((json.find("\"listen_port\": 8080") != std::string::npos ||
             json.find("\"listen_port\":8080") != std::string::npos));
    REQUIRE(json.find("\"/api/v1/vault\"") != std::string::npos);
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "1.0",
        "server": {
            "worker_threads": 2,
            "listen_port": 9000
        },
        "routes": [
            {"service": "flow", "path": "/api/v1/flow", "target": "http://flow:8080/base",
             "methods": ["GET"], "rewrite_prefix": "/v1"}
        ],
        "instances": [
            {"id": "flow-1", "service": "flow", "address": "10.0.0.2", "port": 8081, "health": "healthy"}
        ],
        "rate_limit": {"limit": 5}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.version == "1.0");
    REQUIRE(config.server.worker_threads == 2);
    REQUIRE(config.server.listen_port == 9000);
    REQUIRE(config.routes.size() == 1);
    REQUIRE(config.routes[0].rewrite_prefix == "/v1");
    REQUIRE(config.instances[0].port == 8081);

    // Omitted fields keep their defaults
    REQUIRE(config.rate_limit.limit == 5);
    REQUIRE(config.rate_limit.window_ms == 60000);
    REQUIRE(config.rate_limit.key_header == "X-User-ID");
    REQUIRE(config.proxy.timeout_ms == 30000);
    REQUIRE(config.admin.listen_port == 9090);
    REQUIRE(config.cors.enabled);
}

TEST_CASE("Config parse errors", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"server": {"listen_port": "eighty"}})").has_value());
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    auto validation = ConfigLoader::validate(valid_config());
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Config validation - no routes is a warning", "[control][config]") {
    auto validation = ConfigLoader::validate(Config{});
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(has_message(validation.warnings, "No routes configured"));
}

TEST_CASE("Config validation - route errors", "[control][config]") {
    Config config = valid_config();

    SECTION("Blank fields") {
        config.routes[0].service = " ";
        config.routes[0].target = "";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "service name is required"));
        REQUIRE(has_message(validation.errors, "target is required"));
    }

    SECTION("Path must be absolute") {
        config.routes[0].path = "api/v1/vault";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "must start with '/'"));
    }

    SECTION("Bad target URL") {
        config.routes[0].target = "vault:8080";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "invalid target URL"));
    }

    SECTION("Duplicate prefix") {
        config.routes.push_back(config.routes[0]);
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "already registered"));
    }

    SECTION("Unknown method with suggestion") {
        config.routes[0].methods = {"GTE"};
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "unknown method 'GTE'"));
        REQUIRE(has_message(validation.errors, "did you mean 'GET'?"));
    }

    SECTION("Lower-case methods are accepted") {
        config.routes[0].methods = {"get", "post"};
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - instance errors", "[control][config]") {
    Config config = valid_config();
    InstanceConfig inst;
    inst.id = "vault-1";
    inst.service = "vault";
    inst.address = "10.0.0.1";
    inst.port = 8080;
    config.instances.push_back(inst);
    REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());

    SECTION("Port range") {
        config.instances[0].port = 70000;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "port must be between 1 and 65535"));
    }

    SECTION("Health value") {
        config.instances[0].health = "helthy";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "unknown health 'helthy'"));
        REQUIRE(has_message(validation.errors, "did you mean 'healthy'?"));
    }

    SECTION("Duplicate id") {
        config.instances.push_back(inst);
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "duplicate instance id"));
    }
}

TEST_CASE("Config validation - listeners and proxy", "[control][config]") {
    Config config = valid_config();

    SECTION("Invalid listen port") {
        config.server.listen_port = 0;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "listen_port must be > 0"));
    }

    SECTION("Ports above 65535 are rejected, not wrapped") {
        auto parsed = ConfigLoader::load_from_json(
            R"({"server": {"listen_port": 70000}, "admin": {"listen_port": 65536}})");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->server.listen_port == 70000);
        REQUIRE(parsed->admin.listen_port == 65536);

        parsed->routes = config.routes;
        auto validation = ConfigLoader::validate(*parsed);
        REQUIRE(has_message(validation.errors, "Server listen_port 70000 is out of range (1-65535)"));
        REQUIRE(has_message(validation.errors, "Admin listen_port 65536 is out of range (1-65535)"));
        // 70000 would wrap to 4464 and 65536 to 0; neither clash must be reported instead
        REQUIRE_FALSE(has_message(validation.errors, "must differ"));
    }

    SECTION("Highest port is accepted") {
        config.server.listen_port = 65535;
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Admin needs worker threads") {
        config.admin.worker_threads = 0;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Admin worker_threads must be > 0"));
    }

    SECTION("Admin port clash") {
        config.admin.listen_port = config.server.listen_port;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "must differ"));
    }

    SECTION("Disabled admin is not validated") {
        config.admin.enabled = false;
        config.admin.listen_port = 0;
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Invalid load balancing strategy") {
        config.proxy.load_balancing = "round-robin";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "Unknown load_balancing strategy"));
        REQUIRE(has_message(validation.errors, "round_robin"));
    }

    SECTION("Zero timeout") {
        config.proxy.timeout_ms = 0;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "timeout_ms must be > 0"));
    }

    SECTION("Zero rate limit") {
        config.rate_limit.limit = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
        config.rate_limit.enabled = false;
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Unknown log level is only a warning") {
        config.logging.level = "verbose";
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "Unknown log level 'verbose'"));
    }
}

TEST_CASE("Rate limit path quotas and client lists", "[control][config]") {
    const char* json = R"({
        "rate_limit": {
            "limit": 100,
            "path_limits": [
                {"path": "/api/v1/auth", "limit": 20},
                {"path": "/api/v1/vault", "limit": 50, "window_ms": 30000}
            ],
            "allowlist": ["10.0.0.1"],
            "denylist": ["10.0.0.66"],
            "cleanup_interval_ms": 5000
        }
    })";

    auto parsed = ConfigLoader::load_from_json(json);
    REQUIRE(parsed.has_value());
    const auto& limits = parsed->rate_limit;
    REQUIRE(limits.path_limits.size() == 2);
    REQUIRE(limits.path_limits[0].path == "/api/v1/auth");
    REQUIRE(limits.path_limits[0].limit == 20);
    REQUIRE(limits.path_limits[0].window_ms == 60000);
    REQUIRE(limits.path_limits[1].window_ms == 30000);
    REQUIRE(limits.allowlist == std::vector<std::string>{"10.0.0.1"});
    REQUIRE(limits.denylist == std::vector<std::string>{"10.0.0.66"});
    REQUIRE(limits.cleanup_interval_ms == 5000);

    Config config = valid_config();

    SECTION("Path quota errors") {
        config.rate_limit.path_limits = {{"api/v1/auth", 0, 0}};
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "rate_limit.path_limits[0]: path must start with '/'"));
        REQUIRE(has_message(validation.errors, "rate_limit.path_limits[0]: limit must be > 0"));
        REQUIRE(has_message(validation.errors, "rate_limit.path_limits[0]: window_ms must be > 0"));
    }

    SECTION("Client in both lists is a warning") {
        config.rate_limit.allowlist = {"10.0.0.5"};
        config.rate_limit.denylist = {"10.0.0.5"};
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "10.0.0.5 is in both allowlist and denylist"));
    }
}

TEST_CASE("Default configuration", "[control][config]") {
    auto config = ConfigLoader::default_config();

    REQUIRE(config.routes.size() == 7);
    REQUIRE(config.routes[0].service == "vault");
    REQUIRE(config.routes[0].path == "/api/v1/vault");
    REQUIRE(config.routes[0].target == "http://vault:8080");
    REQUIRE(config.routes[0].rewrite_prefix == "/api/v1");
    REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
}

TEST_CASE("Environment overrides", "[control][config]") {
    REQUIRE(ConfigLoader::env_var_for_service("vault") == "VAULT_SERVICE_URL");
    REQUIRE(ConfigLoader::env_var_for_service("task-runner") == "TASK_RUNNER_SERVICE_URL");

    auto config = ConfigLoader::default_config();
    auto lookup = [](const std::string& name) -> std::optional<std::string> {
        if (name == "VAULT_SERVICE_URL") {
            return " http://10.1.1.1:9000 ";
        }
        if (name == "FLOW_SERVICE_URL") {
            return "";
        }
        return std::nullopt;
    };

    REQUIRE(ConfigLoader::apply_env_overrides(config, lookup) == 1);
    REQUIRE(config.routes[0].target == "http://10.1.1.1:9000");
    REQUIRE(config.routes[1].target == "http://flow:8080");
}

TEST_CASE("Config file operations", "[control][config]") {
    std::string temp_path = "/tmp/eden_test_config.json";
    {
        std::ofstream out(temp_path);
        out << ConfigLoader::to_json(valid_config());
    }

    auto maybe_config = ConfigLoader::load_from_file(temp_path);
    REQUIRE(maybe_config.has_value());
    REQUIRE(maybe_config->routes.size() == 1);
    REQUIRE(maybe_config->routes[0].service == "vault");

    std::filesystem::remove(temp_path);

    REQUIRE_FALSE(ConfigLoader::load_from_file("/tmp/eden_missing_config.json").has_value());
}
