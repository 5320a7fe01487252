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

// Eden Route Registry - Header
// Path-prefix routes to logical backend services

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../core/status.hpp"

namespace eden::gateway {

/// Route definition
struct Route {
    std::string id;              // Generated when empty
    std::string service_name;    // Logical backend service (e.g. "vault")
    std::string path_prefix;     // e.g. "/api/v1/vault"
    std::string target;          // Static base URL, used when the service has no instances
    std::vector<std::string> methods;  // Upper-case verbs, empty = all methods

    // When set, the matched prefix is replaced by this before forwarding
    std::optional<std::string> rewrite_prefix;

    std::map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point created_at{};

    /// True if methods is empty or contains method (case-insensitive)
    [[nodiscard]] bool allows_method(std::string_view method) const noexcept;

    /// True if this route's prefix matches path on a segment boundary
    [[nodiscard]] bool matches(std::string_view path) const noexcept;
};

/// Route registry
///
/// Routes are keyed by path prefix in a sharded map. Lookups try every
/// segment-boundary prefix of the request path, longest first, so a match
/// touches only the shards of its candidate prefixes.
class RouteRegistry {
public:
    RouteRegistry() = default;

    // Non-copyable, non-movable
    RouteRegistry(const RouteRegistry&) = delete;
    RouteRegistry& operator=(const RouteRegistry&) = delete;

    /// Register a route
    /// Fails with Validation when service name, path or target is blank,
    /// Conflict when the prefix is already registered.
    [[nodiscard]] core::Status register_route(Route route);

    /// Remove the route registered under path_prefix (NotFound when absent)
    [[nodiscard]] core::Status deregister_route(std::string_view path_prefix);

    /// All routes in registration order
    [[nodiscard]] std::vector<Route> get_routes() const;

    /// Longest-prefix match for a request path
    [[nodiscard]] std::optional<Route> find_route(std::string_view path) const;

    [[nodiscard]] size_t size() const { return routes_.size(); }

private:
    struct Entry {
        uint64_t sequence = 0;
        Route route;
    };

    core::ShardedMap<std::string, Entry> routes_;
    std::atomic<uint64_t> next_sequence_{0};
};

}  // namespace eden::gateway
