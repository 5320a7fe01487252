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

// Eden Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include "../control/health.hpp"
#include "../core/admin_server.hpp"
#include "../core/http_listener.hpp"
#include "../core/logging.hpp"
#include "../core/worker_pool.hpp"
#include "../gateway/factory.hpp"

namespace eden::runtime {

std::atomic<bool> g_shutdown_requested{false};

namespace {

constexpr auto kShutdownPoll = std::chrono::milliseconds(100);

core::ListenerConfig gateway_listener_config(const control::Config& config) {
    core::ListenerConfig listener;
    listener.name = "gateway";
    listener.address = config.server.listen_address;
    listener.port = static_cast<uint16_t>(config.server.listen_port);
    listener.backlog = static_cast<int>(config.server.backlog);
    listener.limits.max_header_size = config.server.max_header_size;
    listener.limits.max_body_size = config.server.max_request_size;
    listener.idle_timeout = std::chrono::milliseconds(config.server.idle_timeout);
    return listener;
}

/// Wait for open connections to finish, bounded by timeout
/// @return false if connections were still open at the deadline
bool drain_connections(const core::HttpListener& listener, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (listener.open_connections() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (size_t left = listener.open_connections(); left > 0) {
        LOG_WARNING(logging::get_logger(), "Shutdown timeout reached with {} open connections",
                    left);
        return false;
    }
    return true;
}

}  // namespace

std::error_code run_gateway(const control::Config& config) {
    auto* logger = logging::get_logger();

    auto gateway = gateway::build_gateway(config);

    size_t workers = config.server.worker_threads;
    if (workers == 0) {
        workers = core::get_cpu_count();
    }
    core::WorkerPool pool(workers, 4096, "gateway");

    auto& dispatcher = *gateway->dispatcher;
    core::HttpListener listener(
        gateway_listener_config(config),
        [&dispatcher](http::Request request, const core::CancellationToken& cancel) {
            return dispatcher.dispatch(std::move(request), &cancel);
        },
        &pool, gateway->metrics.get());

    if (auto ec = listener.start(); ec) {
        LOG_ERROR(logger, "Failed to start gateway listener on {}:{}: {}",
                  config.server.listen_address, config.server.listen_port, ec.message());
        return ec;
    }

    std::unique_ptr<core::AdminServer> admin;
    if (config.admin.enabled) {
        admin = std::make_unique<core::AdminServer>(config, *gateway);
        if (auto ec = admin->start(); ec) {
            LOG_ERROR(logger, "Failed to start admin server on {}:{}: {}",
                      config.admin.listen_address, config.admin.listen_port, ec.message());
            listener.stop();
            return ec;
        }
    }

    std::unique_ptr<control::HealthProber> prober;
    if (config.health_check.enabled) {
        prober = std::make_unique<control::HealthProber>(*gateway->services, config.health_check);
        prober->start();
    }

    std::thread accept_thread([&listener]() { listener.run(); });
    std::thread admin_thread;
    if (admin) {
        admin_thread = std::thread([&admin]() { admin->run(); });
    }

    LOG_INFO(logger, "Eden gateway {} running: workers={}, routes={}, admin={}", config.version,
             workers, gateway->routes->size(), config.admin.enabled ? "enabled" : "disabled");

    while (!g_shutdown_requested.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(kShutdownPoll);
    }

    LOG_INFO(logger, "Shutdown requested, draining connections");

    listener.stop();
    if (admin) {
        admin->stop();
    }
    accept_thread.join();
    if (admin_thread.joinable()) {
        admin_thread.join();
    }

    if (prober) {
        prober->stop();
    }

    if (!drain_connections(listener, std::chrono::milliseconds(config.server.shutdown_timeout))) {
        // Cancels pending upstream calls so workers can be joined
        listener.abort_inflight();
    }
    pool.shutdown();

    auto snapshot = gateway->metrics->snapshot();
    LOG_INFO(logger, "Eden gateway stopped: requests={}, connections={}",
             snapshot.total_requests, snapshot.total_connections);
    return {};
}

}  // namespace eden::runtime
