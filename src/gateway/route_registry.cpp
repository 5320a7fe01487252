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

// Eden Route Registry - Implementation

#include "route_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace eden::gateway {

bool Route::allows_method(std::string_view method) const noexcept {
    if (methods.empty()) {
        return true;
    }
    return std::any_of(methods.begin(), methods.end(),
                       [method](const std::string& m) { return core::iequals(m, method); });
}

bool Route::matches(std::string_view path) const noexcept {
    if (!path.starts_with(path_prefix)) {
        return false;
    }
    if (path.size() == path_prefix.size() || path_prefix.ends_with('/')) {
        return true;
    }
    return path[path_prefix.size()] == '/';
}

core::Status RouteRegistry::register_route(Route route) {
    route.service_name = std::string(core::trim(route.service_name));
    route.path_prefix = std::string(core::trim(route.path_prefix));
    route.target = std::string(core::trim(route.target));

    if (route.service_name.empty()) {
        return core::validation_error("service name is required");
    }
    if (route.path_prefix.empty()) {
        return core::validation_error("path is required");
    }
    if (route.target.empty()) {
        return core::validation_error("target is required");
    }

    for (auto& method : route.methods) {
        method = core::to_upper(core::trim(method));
    }
    std::erase_if(route.methods, [](const std::string& m) { return m.empty(); });

    if (route.id.empty()) {
        route.id = logging::generate_uuid();
    }
    route.created_at = std::chrono::system_clock::now();

    std::string prefix = route.path_prefix;
    Entry entry{next_sequence_.fetch_add(1, std::memory_order_relaxed), std::move(route)};
    if (!routes_.insert(prefix, std::move(entry))) {
        return core::conflict_error(fmt::format("route with path '{}' already registered", prefix));
    }

    LOG_DEBUG(logging::get_logger(), "Route registered: {}", prefix);
    return core::Status::ok_status();
}

core::Status RouteRegistry::deregister_route(std::string_view path_prefix) {
    std::string prefix(core::trim(path_prefix));
    if (!routes_.erase(prefix)) {
        return core::not_found_error(fmt::format("route with path '{}' not found", prefix));
    }

    LOG_DEBUG(logging::get_logger(), "Route deregistered: {}", prefix);
    return core::Status::ok_status();
}

std::vector<Route> RouteRegistry::get_routes() const {
    std::vector<std::pair<uint64_t, Route>> ordered;
    routes_.for_each([&ordered](const std::string&, const Entry& entry) {
        ordered.emplace_back(entry.sequence, entry.route);
    });

    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Route> result;
    result.reserve(ordered.size());
    for (auto& [sequence, route] : ordered) {
        result.push_back(std::move(route));
    }
    return result;
}

std::optional<Route> RouteRegistry::find_route(std::string_view path) const {
    if (path.empty()) {
        return std::nullopt;
    }

    std::optional<Route> found;
    auto try_prefix = [&](std::string_view candidate) {
        return routes_.read(std::string(candidate),
                            [&found](const Entry& entry) { found = entry.route; });
    };

    // Whole path first, then each prefix ending at a '/', with and without it
    if (try_prefix(path)) {
        return found;
    }
    for (size_t pos = path.rfind('/'); pos != std::string_view::npos;
         pos = pos == 0 ? std::string_view::npos : path.rfind('/', pos - 1)) {
        if (pos + 1 < path.size() && try_prefix(path.substr(0, pos + 1))) {
            return found;
        }
        if (pos > 0 && try_prefix(path.substr(0, pos))) {
            return found;
        }
    }

    return std::nullopt;
}

}  // namespace eden::gateway
