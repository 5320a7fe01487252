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

// Eden Load Balancer - Header
// Health-aware instance selection over the Service Registry

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "route_registry.hpp"
#include "service_registry.hpp"

namespace eden::gateway {

/// Load balancing strategy
enum class LoadBalancingStrategy : uint8_t {
    RoundRobin,  // Per-service cursor
    Random       // Uniform choice
};

[[nodiscard]] std::string_view to_string(LoadBalancingStrategy strategy) noexcept;

/// Policy interface: pick one of the healthy candidates of a service
class LoadBalancingPolicy {
public:
    virtual ~LoadBalancingPolicy() = default;

    /// @param candidates Healthy instances only, never empty
    [[nodiscard]] virtual size_t select(std::string_view service_name,
                                        const std::vector<ServiceInstance>& candidates) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Round-robin with one cursor per service name
class RoundRobinPolicy : public LoadBalancingPolicy {
public:
    size_t select(std::string_view service_name,
                  const std::vector<ServiceInstance>& candidates) override;
    std::string_view name() const noexcept override { return "round_robin"; }

private:
    using Cursor = std::unique_ptr<std::atomic<uint64_t>>;
    core::ShardedMap<std::string, Cursor> cursors_;
};

/// Uniformly random choice
class RandomPolicy : public LoadBalancingPolicy {
public:
    size_t select(std::string_view service_name,
                  const std::vector<ServiceInstance>& candidates) override;
    std::string_view name() const noexcept override { return "random"; }
};

[[nodiscard]] std::unique_ptr<LoadBalancingPolicy> make_policy(LoadBalancingStrategy strategy);

/// Load balancer
/// Stateless coordinator over the registry; only the policy keeps state.
class LoadBalancer {
public:
    explicit LoadBalancer(const ServiceRegistry& registry,
                          std::unique_ptr<LoadBalancingPolicy> policy = nullptr);

    /// Pick a healthy instance of service_name
    /// Returns nullopt when no instance is Healthy (even if Unhealthy ones exist)
    [[nodiscard]] std::optional<ServiceInstance> select_instance(std::string_view service_name);

    /// Upstream base URL for a route
    /// Selected healthy instance URL, the route's static target when the service has
    /// no instances at all, or nullopt when instances exist but none is healthy.
    [[nodiscard]] std::optional<std::string> select_target(const Route& route);

    [[nodiscard]] std::string_view policy_name() const noexcept { return policy_->name(); }

private:
    std::optional<ServiceInstance> pick(std::string_view service_name,
                                        std::vector<ServiceInstance> instances);

    const ServiceRegistry& registry_;
    std::unique_ptr<LoadBalancingPolicy> policy_;
};

}  // namespace eden::gateway
