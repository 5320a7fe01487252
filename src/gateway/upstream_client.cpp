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

// Eden Upstream Client - Implementation

#include "upstream_client.hpp"

#include <algorithm>
#include <charconv>
#include <exception>

#include <fmt/format.h>
#include <httplib.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace eden::gateway {

// URL parsing

std::string UpstreamUrl::origin() const {
    return fmt::format("{}://{}:{}", scheme, host, port);
}

std::optional<UpstreamUrl> parse_upstream_url(std::string_view url) {
    url = core::trim(url);

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    UpstreamUrl result;
    result.scheme = core::to_lower(url.substr(0, scheme_end));
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }
    result.port = result.scheme == "https" ? 443 : 80;

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        auto path = rest.substr(path_start);
        while (path.ends_with('/')) {
            path.remove_suffix(1);
        }
        result.base_path = std::string(path);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        uint32_t port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    result.host = std::string(authority);
    return result;
}

std::string_view to_string(UpstreamOutcome outcome) noexcept {
    switch (outcome) {
        case UpstreamOutcome::Ok:
            return "ok";
        case UpstreamOutcome::Timeout:
            return "timeout";
        case UpstreamOutcome::Unreachable:
            return "unreachable";
        case UpstreamOutcome::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

// HttpUpstreamClient

HttpUpstreamClient::HttpUpstreamClient(std::chrono::milliseconds watchdog_interval)
    : watchdog_interval_(watchdog_interval), watchdog_(&HttpUpstreamClient::watchdog_loop, this) {}

HttpUpstreamClient::~HttpUpstreamClient() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }
}

size_t HttpUpstreamClient::inflight() const {
    std::lock_guard lock(mutex_);
    return inflight_.size();
}

HttpUpstreamClient::InflightList::iterator HttpUpstreamClient::track(
    httplib::Client* client, const core::CancellationToken* cancel,
    std::chrono::steady_clock::time_point deadline) {
    std::lock_guard lock(mutex_);
    return inflight_.insert(inflight_.end(), Inflight{client, cancel, deadline, AbortReason::None});
}

HttpUpstreamClient::AbortReason HttpUpstreamClient::untrack(InflightList::iterator it) {
    // After this returns the watchdog can no longer touch the client
    std::lock_guard lock(mutex_);
    auto reason = it->reason;
    inflight_.erase(it);
    return reason;
}

void HttpUpstreamClient::watchdog_loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        cv_.wait_for(lock, watchdog_interval_, [this] { return stopping_; });
        if (stopping_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        for (auto& call : inflight_) {
            if (call.reason == AbortReason::None) {
                if (now >= call.deadline) {
                    call.reason = AbortReason::Deadline;
                } else if (call.cancel && call.cancel->is_cancelled()) {
                    call.reason = AbortReason::Cancelled;
                }
            }
            // Repeated each tick: stop() before the socket exists has no effect
            if (call.reason != AbortReason::None) {
                call.client->stop();
            }
        }
    }
}

UpstreamResult HttpUpstreamClient::send(const UpstreamRequest& request,
                                        const core::CancellationToken* cancel) {
    UpstreamResult result;

    if (cancel && cancel->is_cancelled()) {
        result.outcome = UpstreamOutcome::Cancelled;
        result.error_detail = "client disconnected";
        return result;
    }

    try {
        httplib::Client client(request.origin);
        if (!client.is_valid()) {
            result.outcome = UpstreamOutcome::Unreachable;
            result.error_detail = fmt::format("unsupported upstream '{}'", request.origin);
            return result;
        }

        auto connect_timeout = std::min(request.connect_timeout, request.timeout);
        client.set_connection_timeout(connect_timeout);
        client.set_read_timeout(request.timeout);
        client.set_write_timeout(request.timeout);
        client.set_keep_alive(false);
        client.set_decompress(false);
        client.set_url_encode(false);

        httplib::Request outbound;
        outbound.method = request.method;
        outbound.path = request.target;
        outbound.body = request.body;
        for (const auto& [name, value] : request.headers) {
            outbound.headers.emplace(name, value);
        }

        // Untracks on every exit path so the watchdog never sees a dead client
        struct Tracked {
            HttpUpstreamClient& owner;
            InflightList::iterator it;
            bool released = false;

            AbortReason release() {
                released = true;
                return owner.untrack(it);
            }
            ~Tracked() {
                if (!released) {
                    owner.untrack(it);
                }
            }
        };

        auto started = std::chrono::steady_clock::now();
        Tracked tracked{*this, track(&client, cancel, started + request.timeout)};
        auto response = client.send(outbound);
        auto reason = tracked.release();
        auto elapsed = std::chrono::steady_clock::now() - started;

        if (response) {
            result.outcome = UpstreamOutcome::Ok;
            result.response.status = static_cast<http::StatusCode>(response->status);
            for (const auto& [name, value] : response->headers) {
                result.response.headers.emplace_back(name, value);
            }
            result.response.body = std::move(response->body);
            return result;
        }

        auto error = response.error();
        result.error_detail = httplib::to_string(error);

        if (reason == AbortReason::Cancelled || error == httplib::Error::Canceled) {
            result.outcome = UpstreamOutcome::Cancelled;
        } else if (reason == AbortReason::Deadline || elapsed >= request.timeout) {
            result.outcome = UpstreamOutcome::Timeout;
        } else {
            result.outcome = UpstreamOutcome::Unreachable;
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR(logging::get_logger(), "Upstream call to {} failed: {}", request.origin, e.what());
        result.outcome = UpstreamOutcome::Unreachable;
        result.error_detail = e.what();
        return result;
    }
}

}  // namespace eden::gateway
