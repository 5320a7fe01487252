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

// Eden HTTP Listener - Header
// Blocking accept loop; each connection is served (keep-alive, llhttp) on a
// worker pool thread or inline on the accept thread

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "../control/metrics.hpp"
#include "../http/http.hpp"
#include "../http/parser.hpp"
#include "cancellation.hpp"
#include "containers.hpp"
#include "worker_pool.hpp"

namespace eden::core {

/// Listener settings
struct ListenerConfig {
    std::string name = "gateway";
    std::string address = "0.0.0.0";
    uint16_t port = 8080;  // 0 = ephemeral (see HttpListener::port())
    int backlog = 128;
    http::ParserLimits limits;
    std::chrono::milliseconds idle_timeout{30000};
};

/// Produces the response for one parsed request
/// Returning nullopt closes the connection without writing anything.
using RequestHandler =
    std::function<std::optional<http::Response>(http::Request, const CancellationToken&)>;

/// HTTP/1.1 listener
class HttpListener {
public:
    /// @param pool Serve connections on this pool (nullptr = inline on the accept thread)
    /// @param metrics Connection counters (nullable)
    HttpListener(ListenerConfig config, RequestHandler handler, WorkerPool* pool = nullptr,
                 control::GatewayMetrics* metrics = nullptr);
    ~HttpListener();

    // Non-copyable, non-movable (queued tasks capture this)
    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    /// Bind and listen
    [[nodiscard]] std::error_code start();

    /// Accept until stop() (blocking, call in its own thread)
    void run();

    /// Stop accepting and close idle keep-alive connections
    /// Requests already being handled finish and are answered with Connection: close.
    void stop();

    /// Cancel every request still being handled and close its connection
    /// Used once the graceful drain has run out of time.
    void abort_inflight();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Bound port (resolves port 0 after start())
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

    [[nodiscard]] size_t open_connections() const;

private:
    void serve_connection(int fd, const std::string& client_ip);

    /// Mark fd idle (blocked waiting for a new request) or busy
    void set_idle(int fd, bool idle);
    void untrack(int fd);

    /// Write a minimal JSON error and report whether it was sent
    bool send_error(int fd, http::StatusCode status, std::string_view error);

    ListenerConfig config_;
    RequestHandler handler_;
    WorkerPool* pool_;
    control::GatewayMetrics* metrics_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> aborted_{false};

    // fd -> idle
    mutable std::mutex connections_mutex_;
    fast_map<int, bool> connections_;
};

}  // namespace eden::core
