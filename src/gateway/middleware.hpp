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

// Eden Middleware - Header
// Priority-ordered request interceptors run before dispatch

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"
#include "route_registry.hpp"

namespace eden::gateway {

/// Request context (passed through middleware chain)
struct RequestContext {
    std::string correlation_id;

    // Connection info
    std::string client_ip;

    // Routing (set once the route is matched)
    const Route* route = nullptr;

    // Metadata (for middleware communication)
    eden::core::fast_map<std::string, std::string> metadata;

    // Timing
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    // Error handling
    bool has_error = false;
    uint16_t error_status = 500;
    std::string error_message;

    // Filled by a middleware that returns Stop
    http::Response response;

    /// Helper: Set error (status defaults to 500)
    void set_error(std::string message, uint16_t status = 500) {
        has_error = true;
        error_status = status;
        error_message = std::move(message);
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Middleware produced ctx.response itself
    Error      // Error occurred (ctx.error_status / ctx.error_message)
};

/// Middleware handler: may rewrite the request in place or short-circuit
using MiddlewareHandler = std::function<MiddlewareResult(RequestContext&, http::Request&)>;

/// Named interceptor
struct Middleware {
    std::string name;
    int32_t priority = 0;  // Lower runs earlier
    MiddlewareHandler handler;
};

/// Middleware chain
///
/// Dispatch reads an immutable snapshot of the ordered list. Writers build a
/// new sorted list and publish it, so adding a middleware never blocks a
/// request in flight.
class MiddlewareChain {
public:
    MiddlewareChain();

    // Non-copyable, non-movable
    MiddlewareChain(const MiddlewareChain&) = delete;
    MiddlewareChain& operator=(const MiddlewareChain&) = delete;

    /// Append and re-sort ascending by priority (stable: ties keep insertion order)
    void add_middleware(Middleware middleware);

    /// Middlewares in execution order
    [[nodiscard]] std::vector<Middleware> get_middlewares() const;

    /// Run every handler in order, stopping at the first Stop or Error
    /// A handler that throws yields Error with status 500.
    [[nodiscard]] MiddlewareResult run(RequestContext& ctx, http::Request& request) const;

    [[nodiscard]] size_t size() const { return chain_.load()->size(); }

private:
    using Snapshot = std::shared_ptr<const std::vector<Middleware>>;

    std::mutex write_mutex_;
    std::atomic<Snapshot> chain_;
};

// Built-in middlewares

/// Sets X-Request-ID to the correlation id unless the client sent one (priority 10)
[[nodiscard]] Middleware make_request_id_middleware(int32_t priority = 10);

/// Appends the client ip to X-Forwarded-For and sets X-Forwarded-Proto/-Host (priority 20)
[[nodiscard]] Middleware make_forwarded_headers_middleware(int32_t priority = 20);

}  // namespace eden::gateway
