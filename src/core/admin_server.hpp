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

// Eden Admin Server - Header
// Internal HTTP API (metrics, route and instance registration) on a separate port,
// NOT exposed to the public internet

#pragma once

#include <atomic>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../gateway/factory.hpp"
#include "http_listener.hpp"
#include "worker_pool.hpp"

namespace eden::core {

/// Admin server
/// Blocking I/O with a small worker pool of its own, so one keep-alive
/// client cannot hold the accept thread.
class AdminServer {
public:
    AdminServer(const control::Config& config, gateway::GatewayComponents& gateway);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Bind and listen on admin.listen_address:admin.listen_port
    [[nodiscard]] std::error_code start() { return listener_.start(); }

    /// Serve until stop() (blocking, call in separate thread)
    void run() { listener_.run(); }

    void stop() { listener_.stop(); }

    [[nodiscard]] bool is_running() const noexcept { return listener_.is_running(); }

    [[nodiscard]] uint16_t port() const noexcept { return listener_.port(); }

    /// Route one admin request
    [[nodiscard]] http::Response handle(const http::Request& request);

private:
    http::Response handle_metrics() const;

    http::Response list_routes() const;
    http::Response create_route(const http::Request& request);
    http::Response delete_route(const http::Request& request);

    http::Response list_instances(const http::Request& request) const;
    http::Response create_instance(const http::Request& request);
    http::Response delete_instance(std::string_view id);
    http::Response update_health(std::string_view id, const http::Request& request);

    http::Response list_middlewares() const;
    http::Response rate_limit_status(std::string_view key);

    std::string version_;
    gateway::GatewayComponents& gateway_;
    WorkerPool pool_;
    HttpListener listener_;
};

/// JSON views of registry entries (timestamps in epoch milliseconds)
[[nodiscard]] nlohmann::json route_to_json(const gateway::Route& route);
[[nodiscard]] nlohmann::json instance_to_json(const gateway::ServiceInstance& instance);

}  // namespace eden::core
