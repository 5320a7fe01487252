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

// Eden Upstream Client - Header
// Outbound proxied calls with a bounded deadline and client-disconnect cancellation

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "../core/cancellation.hpp"
#include "../http/http.hpp"

namespace httplib {
class Client;
}

namespace eden::gateway {

/// Parsed upstream base URL ("http://host:port/base")
struct UpstreamUrl {
    std::string scheme;     // "http" or "https"
    std::string host;
    uint16_t port = 80;
    std::string base_path;  // Without trailing '/', may be empty

    /// "scheme://host:port"
    [[nodiscard]] std::string origin() const;
};

/// Parse a base URL; nullopt when scheme or host is missing or the port is invalid
[[nodiscard]] std::optional<UpstreamUrl> parse_upstream_url(std::string_view url);

/// Outbound request (already filtered and rewritten by the dispatcher)
struct UpstreamRequest {
    std::string origin;  // "http://host:port"
    std::string method;
    std::string target;  // Path plus "?query"
    http::HeaderList headers;
    std::string body;

    std::chrono::milliseconds timeout{30000};          // Whole call
    std::chrono::milliseconds connect_timeout{5000};
};

/// How an outbound call ended
enum class UpstreamOutcome : uint8_t {
    Ok,           // Backend answered (any status)
    Timeout,      // Deadline exceeded
    Unreachable,  // Connection refused, DNS failure, reset
    Cancelled     // Client went away
};

[[nodiscard]] std::string_view to_string(UpstreamOutcome outcome) noexcept;

struct UpstreamResult {
    UpstreamOutcome outcome = UpstreamOutcome::Unreachable;
    http::Response response;  // Valid when outcome == Ok
    std::string error_detail;
};

/// Upstream client interface (the dispatcher's only network dependency)
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    /// Perform one call; never throws
    /// @param cancel Optional token checked while the call is in flight
    [[nodiscard]] virtual UpstreamResult send(const UpstreamRequest& request,
                                              const core::CancellationToken* cancel) = 0;
};

/// cpp-httplib backed client
///
/// One connection per call. A watchdog thread aborts calls whose deadline has
/// passed or whose cancellation token fired, so no outbound call outlives
/// its request.
class HttpUpstreamClient : public UpstreamClient {
public:
    explicit HttpUpstreamClient(std::chrono::milliseconds watchdog_interval = std::chrono::milliseconds(20));
    ~HttpUpstreamClient() override;

    // Non-copyable, non-movable (watchdog thread captures this)
    HttpUpstreamClient(const HttpUpstreamClient&) = delete;
    HttpUpstreamClient& operator=(const HttpUpstreamClient&) = delete;

    UpstreamResult send(const UpstreamRequest& request,
                        const core::CancellationToken* cancel) override;

    /// Calls currently in flight
    [[nodiscard]] size_t inflight() const;

private:
    enum class AbortReason : uint8_t { None, Deadline, Cancelled };

    struct Inflight {
        httplib::Client* client = nullptr;
        const core::CancellationToken* cancel = nullptr;
        std::chrono::steady_clock::time_point deadline;
        AbortReason reason = AbortReason::None;
    };

    using InflightList = std::list<Inflight>;

    InflightList::iterator track(httplib::Client* client, const core::CancellationToken* cancel,
                                 std::chrono::steady_clock::time_point deadline);
    AbortReason untrack(InflightList::iterator it);

    void watchdog_loop();

    std::chrono::milliseconds watchdog_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    InflightList inflight_;
    bool stopping_ = false;
    std::thread watchdog_;
};

}  // namespace eden::gateway
