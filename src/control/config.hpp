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

// Eden Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eden::control {

/// Front-end listener configuration
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint32_t listen_port = 8080;  // Read wide so validate() can reject > 65535
    uint32_t worker_threads = 0;  // 0 = auto-detect CPU count
    uint32_t backlog = 128;

    // Limits
    uint32_t max_request_size = 1048576;  // 1MB
    uint32_t max_header_size = 8192;      // 8KB

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;
    uint32_t idle_timeout = 30000;
    uint32_t shutdown_timeout = 5000;
};

/// Admin API listener (internal port)
struct AdminConfig {
    bool enabled = true;
    std::string listen_address = "127.0.0.1";
    uint32_t listen_port = 9090;
    uint32_t worker_threads = 2;
};

/// Static route
struct RouteConfig {
    std::string id;  // Generated when empty
    std::string service;
    std::string path;
    std::string target;
    std::vector<std::string> methods;  // Empty = all methods
    std::optional<std::string> rewrite_prefix;
    std::map<std::string, std::string> metadata;
};

/// Initial service instance
struct InstanceConfig {
    std::string id;
    std::string service;
    std::string address;
    int32_t port = 0;
    std::string health = "unknown";  // healthy, unhealthy, unknown
    std::map<std::string, std::string> metadata;
};

/// Reverse proxy behaviour
struct ProxyConfig {
    uint32_t timeout_ms = 30000;  // Whole outbound call
    uint32_t connect_timeout_ms = 5000;
    std::string load_balancing = "round_robin";  // round_robin, random
    std::vector<std::string> hop_by_hop_headers = {"Host", "Connection", "Upgrade",
                                                   "Proxy-Connection"};
    std::vector<std::string> response_hop_by_hop_headers = {"Host", "Connection", "Upgrade",
                                                            "Proxy-Connection",
                                                            "Transfer-Encoding"};
};

/// Stricter (or looser) quota for requests under a path prefix
struct PathLimitConfig {
    std::string path;
    uint32_t limit = 0;
    uint32_t window_ms = 60000;
};

/// Rate limiting configuration
struct RateLimitConfig {
    bool enabled = true;
    uint32_t limit = 100;       // Requests per window
    uint32_t window_ms = 60000;
    std::string key_header = "X-User-ID";  // Falls back to client ip when absent
    std::vector<std::string> excluded_paths = {"/health", "/metrics"};
    std::vector<PathLimitConfig> path_limits;  // Longest matching prefix wins
    std::vector<std::string> allowlist;        // Client ips never limited
    std::vector<std::string> denylist;         // Client ips always rejected
    uint32_t cleanup_interval_ms = 60000;      // Sweep of elapsed windows
};

/// CORS configuration
struct CorsConfig {
    bool enabled = true;
    std::vector<std::string> allowed_origins = {"*"};
    std::vector<std::string> allowed_methods = {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
    std::vector<std::string> allowed_headers = {"*"};
    bool allow_credentials = false;
    uint32_t max_age = 86400;
};

/// Built-in middlewares
struct MiddlewareConfig {
    bool request_id = true;
    bool forwarded_headers = true;
};

/// Active health probing of registered instances
struct HealthCheckConfig {
    bool enabled = false;
    uint32_t interval_ms = 30000;
    uint32_t timeout_ms = 5000;
    std::string path = "/health";
    uint32_t unhealthy_threshold = 1;
    uint32_t healthy_threshold = 1;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text
    std::string output = "stdout";  // "stdout" or a log directory (gateway.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Eden gateway configuration
struct Config {
    ServerConfig server;
    AdminConfig admin;
    std::vector<RouteConfig> routes;
    std::vector<InstanceConfig> instances;

    ProxyConfig proxy;
    RateLimitConfig rate_limit;
    CorsConfig cors;
    MiddlewareConfig middleware;
    HealthCheckConfig health_check;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0.0";
};

// All config types use custom from_json/to_json so partial configs get defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", 8080u);
    s.worker_threads = j.value("worker_threads", 0u);
    s.backlog = j.value("backlog", 128u);
    s.max_request_size = j.value("max_request_size", 1048576u);
    s.max_header_size = j.value("max_header_size", 8192u);
    s.read_timeout = j.value("read_timeout", 60000u);
    s.idle_timeout = j.value("idle_timeout", 30000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 5000u);
}

inline void from_json(const nlohmann::json& j, AdminConfig& a) {
    a.enabled = j.value("enabled", true);
    a.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    a.listen_port = j.value("listen_port", 9090u);
    a.worker_threads = j.value("worker_threads", 2u);
}

inline void from_json(const nlohmann::json& j, RouteConfig& r) {
    r.id = j.value("id", std::string());
    r.service = j.value("service", std::string());
    r.path = j.value("path", std::string());
    r.target = j.value("target", std::string());
    r.methods = j.value("methods", std::vector<std::string>());

    // Complex optional fields: contains() + get_to()
    if (j.contains("rewrite_prefix") && !j.at("rewrite_prefix").is_null()) {
        r.rewrite_prefix = j.at("rewrite_prefix").get<std::string>();
    }
    if (j.contains("metadata")) {
        j.at("metadata").get_to(r.metadata);
    }
}

inline void from_json(const nlohmann::json& j, InstanceConfig& i) {
    i.id = j.value("id", std::string());
    i.service = j.value("service", std::string());
    i.address = j.value("address", std::string());
    i.port = j.value("port", 0);
    i.health = j.value("health", std::string("unknown"));
    if (j.contains("metadata")) {
        j.at("metadata").get_to(i.metadata);
    }
}

inline void from_json(const nlohmann::json& j, ProxyConfig& p) {
    ProxyConfig defaults;
    p.timeout_ms = j.value("timeout_ms", 30000u);
    p.connect_timeout_ms = j.value("connect_timeout_ms", 5000u);
    p.load_balancing = j.value("load_balancing", std::string("round_robin"));
    p.hop_by_hop_headers = j.value("hop_by_hop_headers", defaults.hop_by_hop_headers);
    p.response_hop_by_hop_headers =
        j.value("response_hop_by_hop_headers", defaults.response_hop_by_hop_headers);
}

inline void from_json(const nlohmann::json& j, PathLimitConfig& p) {
    p.path = j.value("path", std::string());
    p.limit = j.value("limit", 0u);
    p.window_ms = j.value("window_ms", 60000u);
}

inline void from_json(const nlohmann::json& j, RateLimitConfig& r) {
    r.enabled = j.value("enabled", true);
    r.limit = j.value("limit", 100u);
    r.window_ms = j.value("window_ms", 60000u);
    r.key_header = j.value("key_header", std::string("X-User-ID"));
    r.excluded_paths =
        j.value("excluded_paths", std::vector<std::string>{"/health", "/metrics"});
    if (j.contains("path_limits")) {
        j.at("path_limits").get_to(r.path_limits);
    }
    r.allowlist = j.value("allowlist", std::vector<std::string>());
    r.denylist = j.value("denylist", std::vector<std::string>());
    r.cleanup_interval_ms = j.value("cleanup_interval_ms", 60000u);
}

inline void from_json(const nlohmann::json& j, CorsConfig& c) {
    CorsConfig defaults;
    c.enabled = j.value("enabled", true);
    c.allowed_origins = j.value("allowed_origins", defaults.allowed_origins);
    c.allowed_methods = j.value("allowed_methods", defaults.allowed_methods);
    c.allowed_headers = j.value("allowed_headers", defaults.allowed_headers);
    c.allow_credentials = j.value("allow_credentials", false);
    c.max_age = j.value("max_age", 86400u);
}

inline void from_json(const nlohmann::json& j, MiddlewareConfig& m) {
    m.request_id = j.value("request_id", true);
    m.forwarded_headers = j.value("forwarded_headers", true);
}

inline void from_json(const nlohmann::json& j, HealthCheckConfig& h) {
    h.enabled = j.value("enabled", false);
    h.interval_ms = j.value("interval_ms", 30000u);
    h.timeout_ms = j.value("timeout_ms", 5000u);
    h.path = j.value("path", std::string("/health"));
    h.unhealthy_threshold = j.value("unhealthy_threshold", 1u);
    h.healthy_threshold = j.value("healthy_threshold", 1u);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() rather than value() for nested structs
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("admin")) {
        j.at("admin").get_to(c.admin);
    }
    if (j.contains("routes")) {
        j.at("routes").get_to(c.routes);
    }
    if (j.contains("instances")) {
        j.at("instances").get_to(c.instances);
    }
    if (j.contains("proxy")) {
        j.at("proxy").get_to(c.proxy);
    }
    if (j.contains("rate_limit")) {
        j.at("rate_limit").get_to(c.rate_limit);
    }
    if (j.contains("cors")) {
        j.at("cors").get_to(c.cors);
    }
    if (j.contains("middleware")) {
        j.at("middleware").get_to(c.middleware);
    }
    if (j.contains("health_check")) {
        j.at("health_check").get_to(c.health_check);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"worker_threads", s.worker_threads},
                       {"backlog", s.backlog},
                       {"max_request_size", s.max_request_size},
                       {"max_header_size", s.max_header_size},
                       {"read_timeout", s.read_timeout},
                       {"idle_timeout", s.idle_timeout},
                       {"shutdown_timeout", s.shutdown_timeout}};
}

inline void to_json(nlohmann::json& j, const AdminConfig& a) {
    j = nlohmann::json{{"enabled", a.enabled},
                       {"listen_address", a.listen_address},
                       {"listen_port", a.listen_port},
                       {"worker_threads", a.worker_threads}};
}

inline void to_json(nlohmann::json& j, const RouteConfig& r) {
    j["id"] = r.id;
    j["service"] = r.service;
    j["path"] = r.path;
    j["target"] = r.target;
    j["methods"] = r.methods;
    if (r.rewrite_prefix) {
        j["rewrite_prefix"] = *r.rewrite_prefix;
    }
    j["metadata"] = r.metadata;
}

inline void to_json(nlohmann::json& j, const InstanceConfig& i) {
    j = nlohmann::json{{"id", i.id},           {"service", i.service}, {"address", i.address},
                       {"port", i.port},       {"health", i.health},   {"metadata", i.metadata}};
}

inline void to_json(nlohmann::json& j, const ProxyConfig& p) {
    j = nlohmann::json{{"timeout_ms", p.timeout_ms},
                       {"connect_timeout_ms", p.connect_timeout_ms},
                       {"load_balancing", p.load_balancing},
                       {"hop_by_hop_headers", p.hop_by_hop_headers},
                       {"response_hop_by_hop_headers", p.response_hop_by_hop_headers}};
}

inline void to_json(nlohmann::json& j, const PathLimitConfig& p) {
    j = nlohmann::json{{"path", p.path}, {"limit", p.limit}, {"window_ms", p.window_ms}};
}

inline void to_json(nlohmann::json& j, const RateLimitConfig& r) {
    j = nlohmann::json{{"enabled", r.enabled},
                       {"limit", r.limit},
                       {"window_ms", r.window_ms},
                       {"key_header", r.key_header},
                       {"excluded_paths", r.excluded_paths},
                       {"path_limits", r.path_limits},
                       {"allowlist", r.allowlist},
                       {"denylist", r.denylist},
                       {"cleanup_interval_ms", r.cleanup_interval_ms}};
}

inline void to_json(nlohmann::json& j, const CorsConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"allowed_origins", c.allowed_origins},
                       {"allowed_methods", c.allowed_methods},
                       {"allowed_headers", c.allowed_headers},
                       {"allow_credentials", c.allow_credentials},
                       {"max_age", c.max_age}};
}

inline void to_json(nlohmann::json& j, const MiddlewareConfig& m) {
    j = nlohmann::json{{"request_id", m.request_id}, {"forwarded_headers", m.forwarded_headers}};
}

inline void to_json(nlohmann::json& j, const HealthCheckConfig& h) {
    j = nlohmann::json{{"enabled", h.enabled},
                       {"interval_ms", h.interval_ms},
                       {"timeout_ms", h.timeout_ms},
                       {"path", h.path},
                       {"unhealthy_threshold", h.unhealthy_threshold},
                       {"healthy_threshold", h.healthy_threshold}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["admin"] = c.admin;
    j["routes"] = c.routes;
    j["instances"] = c.instances;
    j["proxy"] = c.proxy;
    j["rate_limit"] = c.rate_limit;
    j["cors"] = c.cors;
    j["middleware"] = c.middleware;
    j["health_check"] = c.health_check;
    j["logging"] = c.logging;
    j["version"] = c.version;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Environment lookup used for overrides (returns nullopt when unset)
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    /// Parse and validation errors are logged; nullopt on failure.
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);

    /// Built-in configuration: the seven Eden services at http://<name>:8080
    [[nodiscard]] static Config default_config();

    /// Replace each route target with <SERVICE>_SERVICE_URL when set
    /// @return number of routes overridden
    static size_t apply_env_overrides(Config& config, const EnvLookup& lookup = {});

    /// "vault" -> "VAULT_SERVICE_URL", "task-runner" -> "TASK_RUNNER_SERVICE_URL"
    [[nodiscard]] static std::string env_var_for_service(std::string_view service);
};

}  // namespace eden::control
