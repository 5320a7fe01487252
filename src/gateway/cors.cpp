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

// Eden CORS - Implementation

#include "cors.hpp"

#include <algorithm>

#include "../core/string_utils.hpp"

namespace eden::gateway {

namespace {

bool contains_wildcard(const std::vector<std::string>& values) {
    return std::find(values.begin(), values.end(), "*") != values.end();
}

}  // namespace

bool CorsPolicy::is_preflight(const http::Request& request) noexcept {
    return request.method == http::Method::OPTIONS && request.has_header("Origin") &&
           request.has_header("Access-Control-Request-Method");
}

bool CorsPolicy::origin_allowed(std::string_view origin) const noexcept {
    if (origin.empty()) {
        return false;
    }
    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            return true;
        }
    }
    return false;
}

std::string CorsPolicy::allow_origin_value(std::string_view origin) const {
    if (!origin_allowed(origin)) {
        return {};
    }
    // Credentialed responses may not use the wildcard
    if (contains_wildcard(config_.allowed_origins) && !config_.allow_credentials) {
        return "*";
    }
    return std::string(origin);
}

http::Response CorsPolicy::preflight_response(const http::Request& request) const {
    http::Response response;
    response.status = http::StatusCode::OK;

    auto origin = allow_origin_value(request.get_header("Origin"));
    if (!origin.empty()) {
        response.set_header("Access-Control-Allow-Origin", origin);
        if (origin != "*") {
            response.set_header("Vary", "Origin");
        }
    }

    response.set_header("Access-Control-Allow-Methods", core::join(config_.allowed_methods, ", "));

    if (contains_wildcard(config_.allowed_headers)) {
        auto requested = request.get_header("Access-Control-Request-Headers");
        response.set_header("Access-Control-Allow-Headers", requested.empty() ? "*" : requested);
    } else {
        response.set_header("Access-Control-Allow-Headers", core::join(config_.allowed_headers, ", "));
    }

    if (config_.allow_credentials) {
        response.set_header("Access-Control-Allow-Credentials", "true");
    }

    response.set_header("Access-Control-Max-Age", std::to_string(config_.max_age));
    return response;
}

void CorsPolicy::apply(const http::Request& request, http::Response& response) const {
    if (!config_.enabled) {
        return;
    }

    auto origin = allow_origin_value(request.get_header("Origin"));
    if (origin.empty()) {
        return;
    }

    response.set_header("Access-Control-Allow-Origin", origin);
    if (origin != "*") {
        response.set_header("Vary", "Origin");
    }
    if (config_.allow_credentials) {
        response.set_header("Access-Control-Allow-Credentials", "true");
    }
}

}  // namespace eden::gateway
