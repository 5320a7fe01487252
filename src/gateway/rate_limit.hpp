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

// Eden Rate Limiting - Header
// Per-key fixed-window counters in a sharded map

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"

namespace eden::gateway {

/// Quota for requests whose path falls under prefix
struct PathLimit {
    std::string prefix;
    uint64_t limit = 0;
    std::chrono::milliseconds window{60000};
};

/// Rate limiter defaults applied to every new key
struct RateLimitConfig {
    uint64_t limit = 100;                       // Requests per window (clamped to >= 1)
    std::chrono::milliseconds window{60000};    // Window length
    std::vector<PathLimit> path_limits;         // Longest matching prefix wins
    std::vector<std::string> allowlist;         // Client ips admitted without counting
    std::vector<std::string> denylist;          // Client ips always rejected
    std::chrono::milliseconds cleanup_interval{60000};  // 0 = never sweep
};

/// Snapshot of one key's state
struct RateLimitStatus {
    uint64_t limit = 0;
    uint64_t remaining = 0;
    std::chrono::system_clock::time_point reset_at{};
};

enum class RateLimitDecision : uint8_t {
    Admitted,
    Limited,      // Quota exhausted for this window
    Allowlisted,  // Not counted
    Denylisted    // Rejected without counting
};

[[nodiscard]] std::string_view to_string(RateLimitDecision decision) noexcept;

/// Outcome of one check()
struct RateLimitResult {
    RateLimitDecision decision = RateLimitDecision::Admitted;
    RateLimitStatus status;    // Unset for allowlisted clients
    std::string window_key;    // Key the request was counted under

    [[nodiscard]] bool admitted() const noexcept {
        return decision == RateLimitDecision::Admitted ||
               decision == RateLimitDecision::Allowlisted;
    }
};

/// Fixed-window counter for one key
/// The whole window resets at once when it elapses.
class FixedWindow {
public:
    using Clock = std::chrono::system_clock;

    FixedWindow(uint64_t limit, std::chrono::milliseconds window, Clock::time_point now);

    // Non-copyable, non-movable (mutex)
    FixedWindow(const FixedWindow&) = delete;
    FixedWindow& operator=(const FixedWindow&) = delete;

    /// Consume one request if any remain in the current window
    /// @return true if admitted (decrement committed), false with state unchanged
    [[nodiscard]] bool allow(Clock::time_point now);

    /// Current state without mutating it (an elapsed window reports a full quota)
    [[nodiscard]] RateLimitStatus status(Clock::time_point now) const;

    /// Restore the full quota and start a new window
    void reset(Clock::time_point now);

    /// The current window has run out (the next request starts a fresh one)
    [[nodiscard]] bool elapsed(Clock::time_point now) const;

private:
    const uint64_t limit_;
    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    uint64_t remaining_;
    Clock::time_point reset_at_;
};

/// Rate limiter with one fixed window per caller key
///
/// Keys are created lazily on first allow(), check() or status(). Windows that
/// have elapsed are swept every cleanup_interval; a swept key behaves exactly
/// like one that was never seen.
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config = {});

    // Non-copyable, non-movable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Get (creating if absent) the window for a key
    [[nodiscard]] std::shared_ptr<FixedWindow> get_rate_limiter(std::string_view key);

    /// Check and consume one request for key
    [[nodiscard]] bool allow(std::string_view key);

    /// Full decision for a request: allow/deny lists, then the path quota
    /// (or the default quota) counted under key
    [[nodiscard]] RateLimitResult check(std::string_view key, std::string_view client_ip,
                                        std::string_view path);

    /// Path quota covering path, nullptr when the default applies
    [[nodiscard]] const PathLimit* match_path_limit(std::string_view path) const;

    /// Drop every window that has elapsed
    /// @return number of keys removed
    size_t sweep_expired();

    /// Quota for key without consuming
    [[nodiscard]] RateLimitStatus status(std::string_view key);

    /// Reset rate limit for a specific key (no-op for unknown keys)
    void reset(std::string_view key);

    /// Clear all windows
    void clear();

    /// Get number of tracked keys
    [[nodiscard]] size_t key_count() const { return windows_.size(); }

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    /// Count one request under key with the given quota
    RateLimitResult consume(const std::string& key, uint64_t limit,
                            std::chrono::milliseconds window, FixedWindow::Clock::time_point now);

    void maybe_sweep(FixedWindow::Clock::time_point now);

    RateLimitConfig config_;
    core::fast_set<std::string> allowlist_;
    core::fast_set<std::string> denylist_;
    core::ShardedMap<std::string, std::shared_ptr<FixedWindow>> windows_;
    std::atomic<int64_t> next_sweep_ms_{0};
};

}  // namespace eden::gateway
