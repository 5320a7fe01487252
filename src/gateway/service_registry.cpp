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

// Eden Service Registry - Implementation

#include "service_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace eden::gateway {

std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Unhealthy:
            return "unhealthy";
        case HealthStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

std::optional<HealthStatus> parse_health_status(std::string_view str) noexcept {
    auto value = core::trim(str);
    if (core::iequals(value, "healthy")) {
        return HealthStatus::Healthy;
    }
    if (core::iequals(value, "unhealthy")) {
        return HealthStatus::Unhealthy;
    }
    if (core::iequals(value, "unknown")) {
        return HealthStatus::Unknown;
    }
    return std::nullopt;
}

std::string ServiceInstance::url() const {
    return fmt::format("http://{}:{}", address, port);
}

core::Status ServiceRegistry::register_instance(ServiceInstance instance) {
    instance.id = std::string(core::trim(instance.id));
    instance.service_name = std::string(core::trim(instance.service_name));
    instance.address = std::string(core::trim(instance.address));

    if (instance.id.empty()) {
        return core::validation_error("instance id is required");
    }
    if (instance.service_name.empty()) {
        return core::validation_error("service name is required");
    }
    if (instance.address.empty()) {
        return core::validation_error("address is required");
    }
    if (instance.port < 1 || instance.port > 65535) {
        return core::validation_error("port must be between 1 and 65535");
    }

    auto now = std::chrono::system_clock::now();
    instance.registered_at = now;
    instance.last_seen = now;

    std::string id = instance.id;
    std::string service = instance.service_name;

    bool registered = index_.upsert(
        id, [] { return std::string{}; },
        [&](std::string& owner) {
            if (!owner.empty()) {
                return false;
            }
            owner = service;
            services_.upsert(
                service, [] { return InstanceList{}; },
                [&](InstanceList& list) { list.push_back(std::move(instance)); });
            return true;
        });

    if (!registered) {
        return core::conflict_error(fmt::format("instance '{}' already registered", id));
    }

    LOG_INFO(logging::get_logger(), "Instance registered: id={}, service={}", id, service);
    return core::Status::ok_status();
}

core::Status ServiceRegistry::deregister_instance(std::string_view id) {
    std::string key(core::trim(id));

    bool removed = index_.erase(key, [&](std::string& service) {
        services_.erase_if(service, [&](InstanceList& list) {
            std::erase_if(list, [&](const ServiceInstance& inst) { return inst.id == key; });
            return list.empty();
        });
    });

    if (removed) {
        LOG_INFO(logging::get_logger(), "Instance deregistered: id={}", key);
    }
    return core::Status::ok_status();
}

core::Status ServiceRegistry::update_instance_health(std::string_view id, HealthStatus health) {
    std::string key(id);
    std::optional<HealthStatus> previous;

    // Shared lock on the id shard keeps (de)registration of this id out
    index_.read(key, [&](const std::string& service) {
        services_.update(service, [&](InstanceList& list) {
            for (auto& inst : list) {
                if (inst.id == key) {
                    previous = inst.health;
                    inst.health = health;
                    inst.last_seen = std::chrono::system_clock::now();
                    return;
                }
            }
        });
    });

    if (!previous) {
        return core::not_found_error(fmt::format("instance '{}' not found", key));
    }

    if (*previous != health) {
        LOG_INFO(logging::get_logger(), "Instance health changed: id={}, {} -> {}", key,
                 to_string(*previous), to_string(health));
    }
    return core::Status::ok_status();
}

std::vector<ServiceInstance> ServiceRegistry::get_instances(std::string_view service_name) const {
    InstanceList result;
    services_.read(std::string(service_name), [&result](const InstanceList& list) { result = list; });
    return result;
}

std::optional<ServiceInstance> ServiceRegistry::get_instance(std::string_view id) const {
    std::string key(id);
    std::optional<ServiceInstance> result;

    index_.read(key, [&](const std::string& service) {
        services_.read(service, [&](const InstanceList& list) {
            auto it = std::find_if(list.begin(), list.end(),
                                   [&](const ServiceInstance& inst) { return inst.id == key; });
            if (it != list.end()) {
                result = *it;
            }
        });
    });

    return result;
}

std::vector<std::string> ServiceRegistry::list_services() const {
    std::vector<std::string> names;
    services_.for_each([&names](const std::string& name, const InstanceList& list) {
        if (!list.empty()) {
            names.push_back(name);
        }
    });
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace eden::gateway
