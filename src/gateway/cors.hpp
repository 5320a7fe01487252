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

// Eden CORS - Header
// Preflight detection and CORS response headers

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"

namespace eden::gateway {

/// CORS configuration
struct CorsConfig {
    bool enabled = true;
    std::vector<std::string> allowed_origins{"*"};
    std::vector<std::string> allowed_methods{"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
    std::vector<std::string> allowed_headers{"*"};
    bool allow_credentials = false;
    int max_age = 86400;
};

/// CORS policy
class CorsPolicy {
public:
    CorsPolicy() = default;
    explicit CorsPolicy(CorsConfig config) : config_(std::move(config)) {}

    /// OPTIONS carrying both Origin and Access-Control-Request-Method
    [[nodiscard]] static bool is_preflight(const http::Request& request) noexcept;

    [[nodiscard]] bool enabled() const noexcept { return config_.enabled; }

    /// Exact match (case-sensitive per RFC 6454) or wildcard
    [[nodiscard]] bool origin_allowed(std::string_view origin) const noexcept;

    /// 200 response answering a preflight
    [[nodiscard]] http::Response preflight_response(const http::Request& request) const;

    /// Add Access-Control-Allow-Origin (and Vary) to a normal response
    void apply(const http::Request& request, http::Response& response) const;

    [[nodiscard]] const CorsConfig& config() const noexcept { return config_; }

private:
    /// Value for Access-Control-Allow-Origin, empty when the origin is not allowed
    [[nodiscard]] std::string allow_origin_value(std::string_view origin) const;

    CorsConfig config_;
};

}  // namespace eden::gateway
