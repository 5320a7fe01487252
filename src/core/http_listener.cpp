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

// Eden HTTP Listener - Implementation

#include "http_listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <exception>

#include <fmt/format.h>

#include "logging.hpp"
#include "socket.hpp"

namespace eden::core {

namespace {

constexpr size_t kReadChunk = 16 * 1024;

std::string peer_address(const sockaddr_in& addr) {
    std::array<char, INET_ADDRSTRLEN> buf{};
    if (inet_ntop(AF_INET, &addr.sin_addr, buf.data(), buf.size()) == nullptr) {
        return {};
    }
    return std::string(buf.data());
}

}  // namespace

HttpListener::HttpListener(ListenerConfig config, RequestHandler handler, WorkerPool* pool,
                           control::GatewayMetrics* metrics)
    : config_(std::move(config)), handler_(std::move(handler)), pool_(pool), metrics_(metrics) {}

HttpListener::~HttpListener() {
    stop();
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

std::error_code HttpListener::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    std::error_code ec;
    listen_fd_ = create_listening_socket(config_.address, config_.port, config_.backlog, ec);
    if (listen_fd_ < 0) {
        return ec;
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_.store(true, std::memory_order_relaxed);
    LOG_INFO(logging::get_logger(), "{} listener on {}:{}", config_.name, config_.address,
             bound_port_);
    return {};
}

void HttpListener::stop() {
    if (!running_.exchange(false, std::memory_order_relaxed)) {
        return;
    }

    // Unblocks accept()
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
    }

    std::lock_guard lock(connections_mutex_);
    for (const auto& [fd, idle] : connections_) {
        if (idle) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
}

void HttpListener::abort_inflight() {
    stop();
    aborted_.store(true, std::memory_order_relaxed);

    std::lock_guard lock(connections_mutex_);
    if (!connections_.empty()) {
        LOG_WARNING(logging::get_logger(), "{} aborting {} in-flight connections", config_.name,
                    connections_.size());
    }
    for (const auto& [fd, idle] : connections_) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

size_t HttpListener::open_connections() const {
    std::lock_guard lock(connections_mutex_);
    return connections_.size();
}

void HttpListener::run() {
    auto* logger = logging::get_logger();

    while (running_.load(std::memory_order_relaxed)) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_.load(std::memory_order_relaxed)) {
                break;
            }
            LOG_WARNING(logger, "{} accept failed: {}", config_.name,
                        std::error_code(errno, std::system_category()).message());
            continue;
        }

        std::string client_ip = peer_address(client_addr);

        {
            std::lock_guard lock(connections_mutex_);
            connections_[client_fd] = false;
        }

        if (pool_ == nullptr) {
            serve_connection(client_fd, client_ip);
            continue;
        }

        bool queued = pool_->submit([this, client_fd, client_ip]() {
            serve_connection(client_fd, client_ip);
        });
        if (!queued) {
            if (metrics_) {
                metrics_->record_connection_rejected();
            }
            LOG_WARNING(logger, "{} worker queue full, rejecting {}", config_.name, client_ip);
            (void)send_error(client_fd, http::StatusCode::ServiceUnavailable, "Server overloaded");
            untrack(client_fd);
            close_fd(client_fd);
        }
    }

    LOG_INFO(logger, "{} listener stopped", config_.name);
}

void HttpListener::set_idle(int fd, bool idle) {
    std::lock_guard lock(connections_mutex_);
    auto it = connections_.find(fd);
    if (it != connections_.end()) {
        it->second = idle;
    }
    // Raced with stop(): don't block in recv() for a whole idle timeout
    if (idle && !running_.load(std::memory_order_relaxed)) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void HttpListener::untrack(int fd) {
    std::lock_guard lock(connections_mutex_);
    connections_.erase(fd);
}

bool HttpListener::send_error(int fd, http::StatusCode status, std::string_view error) {
    http::Response response;
    response.status = status;
    response.set_content_type("application/json");
    response.body = fmt::format(R"({{"error":"{}"}})", error);
    return !send_all(fd, http::serialize_response(response, false));
}

void HttpListener::serve_connection(int fd, const std::string& client_ip) {
    auto* logger = logging::get_logger();
    if (metrics_) {
        metrics_->record_connection();
    }

    if (auto ec = set_recv_timeout(fd, config_.idle_timeout); ec) {
        LOG_WARNING(logger, "{} failed to set idle timeout: {}", config_.name, ec.message());
    }

    http::Parser parser(config_.limits);
    std::string buffer;
    std::array<char, kReadChunk> chunk{};
    bool open = true;

    while (open && running_.load(std::memory_order_relaxed)) {
        http::Request request;
        parser.reset();
        http::ParseResult result = http::ParseResult::Incomplete;

        while (true) {
            if (!buffer.empty()) {
                auto [parsed, consumed] =
                    parser.parse_request(std::span<const char>(buffer.data(), buffer.size()), request);
                buffer.erase(0, consumed);
                result = parsed;
                if (result != http::ParseResult::Incomplete) {
                    break;
                }
            }

            set_idle(fd, !parser.in_progress());
            ssize_t n = recv(fd, chunk.data(), chunk.size(), 0);
            if (n > 0) {
                buffer.append(chunk.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && parser.in_progress()) {
                LOG_DEBUG(logger, "{} read failed mid-request from {}: {}", config_.name,
                          client_ip, std::error_code(errno, std::system_category()).message());
            }
            // Peer closed, idle timeout, or reset
            open = false;
            break;
        }
        if (!open) {
            break;
        }
        set_idle(fd, false);

        if (result == http::ParseResult::TooLarge) {
            LOG_WARNING(logger, "{} request too large from {}", config_.name, client_ip);
            (void)send_error(fd, http::StatusCode::PayloadTooLarge, "Request too large");
            break;
        }
        if (result == http::ParseResult::Error) {
            LOG_DEBUG(logger, "{} malformed request from {}: {}", config_.name, client_ip,
                      parser.error_message());
            (void)send_error(fd, http::StatusCode::BadRequest, "Bad request");
            break;
        }

        request.client_ip = client_ip;
        bool keep_alive = request.keep_alive();

        CancellationToken cancel([this, fd]() {
            return aborted_.load(std::memory_order_relaxed) || peer_hung_up(fd);
        });
        std::optional<http::Response> response;
        try {
            response = handler_(std::move(request), cancel);
        } catch (const std::exception& e) {
            LOG_ERROR(logger, "{} handler failed: {}", config_.name, e.what());
            (void)send_error(fd, http::StatusCode::InternalServerError, "Internal server error");
            break;
        }

        if (!response) {
            break;
        }

        keep_alive = keep_alive && running_.load(std::memory_order_relaxed);
        if (auto ec = send_all(fd, http::serialize_response(*response, keep_alive)); ec) {
            LOG_DEBUG(logger, "{} write to {} failed: {}", config_.name, client_ip, ec.message());
            break;
        }
        open = keep_alive;
    }

    untrack(fd);
    close_fd(fd);
    if (metrics_) {
        metrics_->record_connection_close();
    }
}

}  // namespace eden::core
