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

// Eden Service Registry - Header
// Live backend instances per service name, with health state

#pragma once

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

/// Instance health
enum class HealthStatus : uint8_t { Healthy, Unhealthy, Unknown };

[[nodiscard]] std::string_view to_string(HealthStatus status) noexcept;

/// Parse "healthy" / "unhealthy" / "unknown" (case-insensitive)
[[nodiscard]] std::optional<HealthStatus> parse_health_status(std::string_view str) noexcept;

/// One addressable deployment of a backend service
struct ServiceInstance {
    std::string id;
    std::string service_name;
    std::string address;
    int32_t port = 0;  // Validated to 1..65535 on registration
    HealthStatus health = HealthStatus::Unknown;
    std::map<std::string, std::string> metadata;

    std::chrono::system_clock::time_point registered_at{};
    std::chrono::system_clock::time_point last_seen{};

    /// Base URL ("http://address:port")
    [[nodiscard]] std::string url() const;
};

/// Service registry
///
/// Two sharded maps: instance id -> service name, and service name -> instances
/// in registration order. Mutations lock the id shard first and then the
/// service shard, so every operation on one id is serialized.
class ServiceRegistry {
public:
    ServiceRegistry() = default;

    // Non-copyable, non-movable
    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// Register an instance with whatever health it carries
    /// Fails with Validation on missing fields, Conflict on a duplicate id.
    [[nodiscard]] core::Status register_instance(ServiceInstance instance);

    /// Remove an instance (succeeds when absent)
    core::Status deregister_instance(std::string_view id);

    /// Set health and refresh last_seen (NotFound for unknown ids)
    [[nodiscard]] core::Status update_instance_health(std::string_view id, HealthStatus health);

    /// All instances of a service in registration order, any health
    [[nodiscard]] std::vector<ServiceInstance> get_instances(std::string_view service_name) const;

    [[nodiscard]] std::optional<ServiceInstance> get_instance(std::string_view id) const;

    /// Service names with at least one instance, sorted
    [[nodiscard]] std::vector<std::string> list_services() const;

    /// Total number of instances
    [[nodiscard]] size_t size() const { return index_.size(); }

private:
    using InstanceList = std::vector<ServiceInstance>;

    core::ShardedMap<std::string, std::string> index_;      // id -> service name
    core::ShardedMap<std::string, InstanceList> services_;  // service name -> instances
};

}  // namespace eden::gateway
