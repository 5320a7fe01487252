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

// Eden Load Balancer - Implementation

#include "load_balancer.hpp"

#include <random>

namespace eden::gateway {

std::string_view to_string(LoadBalancingStrategy strategy) noexcept {
    switch (strategy) {
        case LoadBalancingStrategy::RoundRobin:
            return "round_robin";
        case LoadBalancingStrategy::Random:
            return "random";
    }
    return "round_robin";
}

size_t RoundRobinPolicy::select(std::string_view service_name,
                                const std::vector<ServiceInstance>& candidates) {
    std::string key(service_name);
    uint64_t ticket = 0;

    // Fast path: cursor exists, shared lock only
    bool found = cursors_.read(key, [&ticket](const Cursor& cursor) {
        ticket = cursor->fetch_add(1, std::memory_order_relaxed);
    });

    if (!found) {
        ticket = cursors_.upsert(
            key, [] { return std::make_unique<std::atomic<uint64_t>>(0); },
            [](Cursor& cursor) { return cursor->fetch_add(1, std::memory_order_relaxed); });
    }

    return static_cast<size_t>(ticket % candidates.size());
}

size_t RandomPolicy::select(std::string_view service_name,
                            const std::vector<ServiceInstance>& candidates) {
    (void)service_name;  // Unused

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return dist(rng);
}

std::unique_ptr<LoadBalancingPolicy> make_policy(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::Random:
            return std::make_unique<RandomPolicy>();
        case LoadBalancingStrategy::RoundRobin:
            break;
    }
    return std::make_unique<RoundRobinPolicy>();
}

LoadBalancer::LoadBalancer(const ServiceRegistry& registry,
                           std::unique_ptr<LoadBalancingPolicy> policy)
    : registry_(registry), policy_(policy ? std::move(policy) : std::make_unique<RoundRobinPolicy>()) {}

std::optional<ServiceInstance> LoadBalancer::select_instance(std::string_view service_name) {
    return pick(service_name, registry_.get_instances(service_name));
}

std::optional<std::string> LoadBalancer::select_target(const Route& route) {
    auto instances = registry_.get_instances(route.service_name);

    // Static fallback only for services that never registered an instance
    if (instances.empty()) {
        return route.target;
    }

    if (auto instance = pick(route.service_name, std::move(instances))) {
        return instance->url();
    }
    return std::nullopt;
}

std::optional<ServiceInstance> LoadBalancer::pick(std::string_view service_name,
                                                  std::vector<ServiceInstance> instances) {
    std::vector<ServiceInstance> healthy;
    healthy.reserve(instances.size());
    for (auto& inst : instances) {
        if (inst.health == HealthStatus::Healthy) {
            healthy.push_back(std::move(inst));
        }
    }

    if (healthy.empty()) {
        return std::nullopt;
    }

    size_t index = policy_->select(service_name, healthy);
    return std::move(healthy[index]);
}

}  // namespace eden::gateway
