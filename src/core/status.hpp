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

// Eden Status - Header
// Error taxonomy shared by registries, dispatcher and admin API

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace eden::core {

/// Error kinds (each maps to exactly one HTTP status)
enum class ErrorKind : uint8_t {
    None,
    Validation,           // 400 - missing/malformed input
    NotFound,             // 404 - unknown route, unknown instance id
    MethodNotAllowed,     // 405
    Conflict,             // 409 - duplicate route prefix or instance id
    RateLimited,          // 429
    Internal,             // 500
    UpstreamUnreachable,  // 502 - connection refused, DNS failure
    Unavailable,          // 503 - no healthy backend instance
    UpstreamTimeout       // 504
};

/// Result of an operation that can fail with a message
class Status {
public:
    Status() = default;

    [[nodiscard]] static Status ok_status() { return Status{}; }

    [[nodiscard]] static Status error(ErrorKind kind, std::string message) {
        Status s;
        s.kind_ = kind;
        s.message_ = std::move(message);
        return s;
    }

    [[nodiscard]] bool ok() const noexcept { return kind_ == ErrorKind::None; }
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_ = ErrorKind::None;
    std::string message_;
};

// Shorthand constructors

[[nodiscard]] inline Status validation_error(std::string message) {
    return Status::error(ErrorKind::Validation, std::move(message));
}

[[nodiscard]] inline Status conflict_error(std::string message) {
    return Status::error(ErrorKind::Conflict, std::move(message));
}

[[nodiscard]] inline Status not_found_error(std::string message) {
    return Status::error(ErrorKind::NotFound, std::move(message));
}

/// HTTP status code for an error kind (200 for None)
[[nodiscard]] constexpr uint16_t to_http_status(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:
            return 200;
        case ErrorKind::Validation:
            return 400;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::MethodNotAllowed:
            return 405;
        case ErrorKind::Conflict:
            return 409;
        case ErrorKind::RateLimited:
            return 429;
        case ErrorKind::Internal:
            return 500;
        case ErrorKind::UpstreamUnreachable:
            return 502;
        case ErrorKind::Unavailable:
            return 503;
        case ErrorKind::UpstreamTimeout:
            return 504;
    }
    return 500;
}

/// Stable name for logs ("validation", "conflict", ...)
[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::MethodNotAllowed:
            return "method_not_allowed";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::RateLimited:
            return "rate_limited";
        case ErrorKind::Internal:
            return "internal";
        case ErrorKind::UpstreamUnreachable:
            return "upstream_unreachable";
        case ErrorKind::Unavailable:
            return "unavailable";
        case ErrorKind::UpstreamTimeout:
            return "upstream_timeout";
    }
    return "unknown";
}

}  // namespace eden::core
