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

// Eden Configuration - Implementation

#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../gateway/service_registry.hpp"
#include "../gateway/upstream_client.hpp"

namespace eden::control {

namespace {

const std::vector<std::string> kLoadBalancingStrategies = {"round_robin", "random"};
const std::vector<std::string> kLogLevels = {"debug", "info", "warning", "error"};
const std::vector<std::string> kLogFormats = {"text", "json"};
const std::vector<std::string> kHealthValues = {"healthy", "unhealthy", "unknown"};
const std::vector<std::string> kHttpMethods = {"GET",     "POST",    "PUT",   "DELETE", "HEAD",
                                               "OPTIONS", "PATCH",   "TRACE", "CONNECT"};

constexpr uint32_t kMaxPort = 65535;

const std::vector<std::string> kEdenServices = {"vault", "flow",    "task", "monitor",
                                                "sync",  "insight", "hub"};

/// " (did you mean 'x'?)" or empty
std::string suggestion(std::string_view value, const std::vector<std::string>& candidates) {
    auto similar = core::find_similar_strings(value, candidates);
    if (similar.empty()) {
        return {};
    }
    return fmt::format(" (did you mean '{}'?)", similar.front());
}

void validate_routes(const Config& config, ValidationResult& result) {
    if (config.routes.empty()) {
        result.add_warning("No routes configured");
    }

    std::set<std::string> seen_paths;
    for (size_t i = 0; i < config.routes.size(); ++i) {
        const auto& route = config.routes[i];
        std::string context = fmt::format("Route #{} ('{}')", i, route.path);

        if (core::is_blank(route.service)) {
            result.add_error(context + ": service name is required");
        }
        if (core::is_blank(route.path)) {
            result.add_error(context + ": path is required");
        } else if (!core::trim(route.path).starts_with('/')) {
            result.add_error(context + ": path must start with '/'");
        }
        if (core::is_blank(route.target)) {
            result.add_error(context + ": target is required");
        } else if (!gateway::parse_upstream_url(route.target)) {
            result.add_error(fmt::format("{}: invalid target URL '{}'", context, route.target));
        }

        if (!core::is_blank(route.path) &&
            !seen_paths.insert(std::string(core::trim(route.path))).second) {
            result.add_error(context + ": path already registered by an earlier route");
        }

        for (const auto& method : route.methods) {
            auto upper = core::to_upper(core::trim(method));
            if (std::find(kHttpMethods.begin(), kHttpMethods.end(), upper) == kHttpMethods.end()) {
                result.add_error(fmt::format("{}: unknown method '{}'{}", context, method,
                                             suggestion(upper, kHttpMethods)));
            }
        }

        if (route.rewrite_prefix && !route.rewrite_prefix->empty() &&
            !route.rewrite_prefix->starts_with('/')) {
            result.add_error(context + ": rewrite_prefix must start with '/'");
        }
    }
}

void validate_instances(const Config& config, ValidationResult& result) {
    std::set<std::string> seen_ids;
    for (size_t i = 0; i < config.instances.size(); ++i) {
        const auto& instance = config.instances[i];
        std::string context = fmt::format("Instance #{} ('{}')", i, instance.id);

        if (core::is_blank(instance.service)) {
            result.add_error(context + ": service name is required");
        }
        if (core::is_blank(instance.address)) {
            result.add_error(context + ": address is required");
        }
        if (instance.port < 1 || instance.port > 65535) {
            result.add_error(context + ": port must be between 1 and 65535");
        }
        if (!gateway::parse_health_status(instance.health)) {
            result.add_error(fmt::format("{}: unknown health '{}'{}", context, instance.health,
                                         suggestion(core::to_lower(instance.health), kHealthValues)));
        }
        if (!instance.id.empty() && !seen_ids.insert(instance.id).second) {
            result.add_error(fmt::format("{}: duplicate instance id", context));
        }
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        LOG_ERROR(logging::get_logger(), "Cannot open configuration file {}", path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(logging::get_logger(), "JSON parsing error: {}", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        LOG_WARNING(logging::get_logger(), "Config warning: {}", warning);
    }
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            LOG_ERROR(logging::get_logger(), "Config error: {}", error);
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    } else if (config.server.listen_port > kMaxPort) {
        result.add_error(fmt::format("Server listen_port {} is out of range (1-65535)",
                                     config.server.listen_port));
    }
    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }
    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }
    if (config.server.backlog == 0) {
        result.add_warning("Server backlog is 0, the kernel default will be used");
    }

    // Admin
    if (config.admin.enabled) {
        if (config.admin.listen_port == 0) {
            result.add_error("Admin listen_port must be > 0");
        } else if (config.admin.listen_port > kMaxPort) {
            result.add_error(fmt::format("Admin listen_port {} is out of range (1-65535)",
                                         config.admin.listen_port));
        } else if (config.admin.listen_port == config.server.listen_port) {
            result.add_error("Admin listen_port must differ from server listen_port");
        }
        if (config.admin.worker_threads == 0) {
            result.add_error("Admin worker_threads must be > 0");
        }
        if (config.admin.listen_address == "0.0.0.0") {
            result.add_warning("Admin API is bound to all interfaces");
        }
    }

    validate_routes(config, result);
    validate_instances(config, result);

    // Proxy
    if (config.proxy.timeout_ms == 0) {
        result.add_error("Proxy timeout_ms must be > 0");
    }
    if (config.proxy.connect_timeout_ms == 0) {
        result.add_error("Proxy connect_timeout_ms must be > 0");
    }
    if (std::find(kLoadBalancingStrategies.begin(), kLoadBalancingStrategies.end(),
                  config.proxy.load_balancing) == kLoadBalancingStrategies.end()) {
        result.add_error(fmt::format("Unknown load_balancing strategy '{}'{}",
                                     config.proxy.load_balancing,
                                     suggestion(config.proxy.load_balancing,
                                                kLoadBalancingStrategies)));
    }

    // Rate limit
    if (config.rate_limit.enabled) {
        if (config.rate_limit.limit == 0) {
            result.add_error("Rate limit 'limit' must be > 0");
        }
        if (config.rate_limit.window_ms == 0) {
            result.add_error("Rate limit window_ms must be > 0");
        }
        if (core::is_blank(config.rate_limit.key_header)) {
            result.add_warning("Rate limit key_header is empty, limiting by client ip only");
        }
        for (size_t i = 0; i < config.rate_limit.path_limits.size(); ++i) {
            const auto& path_limit = config.rate_limit.path_limits[i];
            std::string context = fmt::format("rate_limit.path_limits[{}]", i);
            if (path_limit.path.empty() || path_limit.path.front() != '/') {
                result.add_error(context + ": path must start with '/'");
            }
            if (path_limit.limit == 0) {
                result.add_error(context + ": limit must be > 0");
            }
            if (path_limit.window_ms == 0) {
                result.add_error(context + ": window_ms must be > 0");
            }
        }
        for (const auto& ip : config.rate_limit.denylist) {
            if (std::find(config.rate_limit.allowlist.begin(), config.rate_limit.allowlist.end(),
                          ip) != config.rate_limit.allowlist.end()) {
                result.add_warning(fmt::format(
                    "Rate limit: {} is in both allowlist and denylist, the denylist wins", ip));
            }
        }
    }

    // CORS
    if (config.cors.enabled && config.cors.allow_credentials) {
        for (const auto& origin : config.cors.allowed_origins) {
            if (origin == "*") {
                result.add_warning(
                    "CORS allow_credentials with wildcard origin: the request origin is echoed");
                break;
            }
        }
    }

    // Health checks
    if (config.health_check.enabled) {
        if (config.health_check.interval_ms == 0) {
            result.add_error("Health check interval_ms must be > 0");
        }
        if (config.health_check.timeout_ms == 0) {
            result.add_error("Health check timeout_ms must be > 0");
        }
        if (config.health_check.unhealthy_threshold == 0 ||
            config.health_check.healthy_threshold == 0) {
            result.add_error("Health check thresholds must be >= 1");
        }
        if (!config.health_check.path.starts_with('/')) {
            result.add_error("Health check path must start with '/'");
        }
    }

    // Logging (unknown level falls back to info)
    auto level = core::to_lower(config.logging.level);
    if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
        result.add_warning(fmt::format("Unknown log level '{}'{}, using 'info'",
                                       config.logging.level, suggestion(level, kLogLevels)));
    }
    if (std::find(kLogFormats.begin(), kLogFormats.end(), config.logging.format) ==
        kLogFormats.end()) {
        result.add_warning(fmt::format("Unknown log format '{}'{}, using 'text'",
                                       config.logging.format,
                                       suggestion(config.logging.format, kLogFormats)));
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

Config ConfigLoader::default_config() {
    Config config;

    for (const auto& name : kEdenServices) {
        RouteConfig route;
        route.service = name;
        route.path = fmt::format("/api/v1/{}", name);
        route.target = fmt::format("http://{}:8080", name);
        route.rewrite_prefix = "/api/v1";
        config.routes.push_back(std::move(route));
    }

    return config;
}

std::string ConfigLoader::env_var_for_service(std::string_view service) {
    std::string name = core::to_upper(core::trim(service));
    for (auto& c : name) {
        if (c == '-' || c == '.') {
            c = '_';
        }
    }
    return name + "_SERVICE_URL";
}

size_t ConfigLoader::apply_env_overrides(Config& config, const EnvLookup& lookup) {
    EnvLookup env = lookup ? lookup : [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };

    size_t overridden = 0;
    for (auto& route : config.routes) {
        auto value = env(env_var_for_service(route.service));
        if (value && !core::is_blank(*value)) {
            LOG_INFO(logging::get_logger(), "Route {} target overridden from environment: {}",
                     route.path, *value);
            route.target = std::string(core::trim(*value));
            ++overridden;
        }
    }
    return overridden;
}

}  // namespace eden::control
