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

// Eden HTTP Protocol - Header
// Owned HTTP value types shared by the listener, middleware chain and dispatcher

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eden::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes
/// Upstream responses may carry codes outside this list; they are relayed as-is.
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    NotModified = 304,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    Conflict = 409,
    PayloadTooLarge = 413,
    URITooLong = 414,
    RequestHeaderFieldsTooLarge = 431,
    TooManyRequests = 429,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// Header list in arrival order (duplicates allowed)
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// HTTP request
/// Owns all of its data so it can be handed between threads and rewritten by middleware.
struct Request {
    Method method = Method::UNKNOWN;
    std::string method_name;  // Verb as received (set for UNKNOWN methods too)
    Version version = Version::HTTP_1_1;

    std::string uri;
    std::string path;   // URI without query string
    std::string query;  // Query string without '?' (if present)

    HeaderList headers;
    std::string body;

    // Filled by the listener
    std::string client_ip;

    /// Verb as a string (method_name when set, otherwise derived from method)
    [[nodiscard]] std::string_view method_string() const noexcept;

    // Helper: Find first header value by name (case-insensitive)
    [[nodiscard]] const std::string* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Replace every header with this name by a single value
    void set_header(std::string_view name, std::string_view value);

    void add_header(std::string_view name, std::string_view value);

    /// Remove all headers with this name, returns number removed
    size_t remove_header(std::string_view name);

    // Content-Length helper
    [[nodiscard]] size_t content_length() const noexcept;

    // Connection: keep-alive helper
    [[nodiscard]] bool keep_alive() const noexcept;
};

/// HTTP response
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    HeaderList headers;
    std::string body;

    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }

    [[nodiscard]] const std::string* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    void set_header(std::string_view name, std::string_view value);

    void add_header(std::string_view name, std::string_view value);

    size_t remove_header(std::string_view name);

    void set_content_type(std::string_view content_type);
};

/// Serialize a response for the wire (status line, headers, Content-Length, body)
/// Any Content-Length or Transfer-Encoding already present is replaced.
[[nodiscard]] std::string serialize_response(const Response& response, bool keep_alive);

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert status code to reason phrase (falls back to the class name for unlisted codes)
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Decode %XX escapes and '+' (malformed escapes are kept literally)
[[nodiscard]] std::string url_decode(std::string_view value);

/// Decoded value of the first name=value pair in a query string
[[nodiscard]] std::optional<std::string> query_param(std::string_view query, std::string_view name);

}  // namespace eden::http
