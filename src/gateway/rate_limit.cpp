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

// Eden Rate Limiting - Implementation

#include "rate_limit.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace eden::gateway {

// FixedWindow implementation

FixedWindow::FixedWindow(uint64_t limit, std::chrono::milliseconds window, Clock::time_point now)
    : limit_(std::max<uint64_t>(limit, 1))
    , window_(window)
    , remaining_(limit_)
    , reset_at_(now + window) {}

bool FixedWindow::allow(Clock::time_point now) {
    std::lock_guard lock(mutex_);

    if (now >= reset_at_) {
        remaining_ = limit_;
        reset_at_ = now + window_;
    }

    if (remaining_ == 0) {
        return false;
    }

    --remaining_;
    return true;
}

RateLimitStatus FixedWindow::status(Clock::time_point now) const {
    std::lock_guard lock(mutex_);

    if (now >= reset_at_) {
        return RateLimitStatus{limit_, limit_, now + window_};
    }
    return RateLimitStatus{limit_, remaining_, reset_at_};
}

void FixedWindow::reset(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    remaining_ = limit_;
    reset_at_ = now + window_;
}

bool FixedWindow::elapsed(Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    return now >= reset_at_;
}

std::string_view to_string(RateLimitDecision decision) noexcept {
    switch (decision) {
        case RateLimitDecision::Admitted:
            return "admitted";
        case RateLimitDecision::Limited:
            return "limited";
        case RateLimitDecision::Allowlisted:
            return "allowlisted";
        case RateLimitDecision::Denylisted:
            return "denylisted";
    }
    return "unknown";
}

// RateLimiter implementation

namespace {

int64_t epoch_millis(FixedWindow::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// "/api/v1/auth" covers "/api/v1/auth" and "/api/v1/auth/login", not "/api/v1/authz"
bool covers(std::string_view prefix, std::string_view path) {
    if (!path.starts_with(prefix)) {
        return false;
    }
    return path.size() == prefix.size() || prefix.ends_with('/') || path[prefix.size()] == '/';
}

}  // namespace

RateLimiter::RateLimiter(RateLimitConfig config) : config_(std::move(config)) {
    config_.limit = std::max<uint64_t>(config_.limit, 1);
    if (config_.window.count() <= 0) {
        config_.window = std::chrono::milliseconds(60000);
    }
    for (auto& path_limit : config_.path_limits) {
        path_limit.limit = std::max<uint64_t>(path_limit.limit, 1);
        if (path_limit.window.count() <= 0) {
            path_limit.window = config_.window;
        }
    }
    allowlist_.insert(config_.allowlist.begin(), config_.allowlist.end());
    denylist_.insert(config_.denylist.begin(), config_.denylist.end());

    if (config_.cleanup_interval.count() > 0) {
        next_sweep_ms_.store(epoch_millis(FixedWindow::Clock::now()) + config_.cleanup_interval.count(),
                             std::memory_order_relaxed);
    }
}

std::shared_ptr<FixedWindow> RateLimiter::get_rate_limiter(std::string_view key) {
    std::string key_str{key};
    std::shared_ptr<FixedWindow> window;

    // Existing key: shared lock only
    windows_.read(key_str, [&window](const std::shared_ptr<FixedWindow>& w) { window = w; });
    if (window) {
        return window;
    }

    return windows_.upsert(
        key_str,
        [this] {
            return std::make_shared<FixedWindow>(config_.limit, config_.window,
                                                 FixedWindow::Clock::now());
        },
        [](std::shared_ptr<FixedWindow>& w) { return w; });
}

RateLimitResult RateLimiter::consume(const std::string& key, uint64_t limit,
                                     std::chrono::milliseconds window,
                                     FixedWindow::Clock::time_point now) {
    RateLimitResult result;
    result.window_key = key;

    // Decide while holding the shard lock so a concurrent sweep cannot retire
    // the window between lookup and decrement
    bool admitted = false;
    auto decide = [&](const std::shared_ptr<FixedWindow>& w) {
        admitted = w->allow(now);
        result.status = w->status(now);
    };

    if (!windows_.read(key, decide)) {
        windows_.upsert(
            key, [&] { return std::make_shared<FixedWindow>(limit, window, now); },
            [&](std::shared_ptr<FixedWindow>& w) { decide(w); });
    }

    result.decision = admitted ? RateLimitDecision::Admitted : RateLimitDecision::Limited;
    maybe_sweep(now);
    return result;
}

bool RateLimiter::allow(std::string_view key) {
    return consume(std::string(key), config_.limit, config_.window, FixedWindow::Clock::now())
        .admitted();
}

RateLimitResult RateLimiter::check(std::string_view key, std::string_view client_ip,
                                   std::string_view path) {
    auto now = FixedWindow::Clock::now();

    if (!client_ip.empty() && denylist_.contains(std::string(client_ip))) {
        RateLimitResult result;
        result.decision = RateLimitDecision::Denylisted;
        result.status = RateLimitStatus{0, 0, now + config_.window};
        return result;
    }
    if (!client_ip.empty() && allowlist_.contains(std::string(client_ip))) {
        RateLimitResult result;
        result.decision = RateLimitDecision::Allowlisted;
        return result;
    }

    if (const auto* path_limit = match_path_limit(path)) {
        return consume(fmt::format("{}|{}", key, path_limit->prefix), path_limit->limit,
                       path_limit->window, now);
    }
    return consume(std::string(key), config_.limit, config_.window, now);
}

const PathLimit* RateLimiter::match_path_limit(std::string_view path) const {
    const PathLimit* best = nullptr;
    for (const auto& path_limit : config_.path_limits) {
        if (covers(path_limit.prefix, path) &&
            (best == nullptr || path_limit.prefix.size() > best->prefix.size())) {
            best = &path_limit;
        }
    }
    return best;
}

RateLimitStatus RateLimiter::status(std::string_view key) {
    return get_rate_limiter(key)->status(FixedWindow::Clock::now());
}

void RateLimiter::reset(std::string_view key) {
    std::shared_ptr<FixedWindow> window;
    windows_.read(std::string(key), [&window](const std::shared_ptr<FixedWindow>& w) { window = w; });
    if (window) {
        window->reset(FixedWindow::Clock::now());
    }
}

void RateLimiter::clear() {
    windows_.clear();
}

size_t RateLimiter::sweep_expired() {
    auto now = FixedWindow::Clock::now();
    return windows_.remove_if([now](const std::string&, const std::shared_ptr<FixedWindow>& w) {
        return w->elapsed(now);
    });
}

void RateLimiter::maybe_sweep(FixedWindow::Clock::time_point now) {
    if (config_.cleanup_interval.count() <= 0) {
        return;
    }

    int64_t now_ms = epoch_millis(now);
    int64_t due = next_sweep_ms_.load(std::memory_order_relaxed);
    if (now_ms < due) {
        return;
    }
    // One caller wins the sweep for this interval
    if (!next_sweep_ms_.compare_exchange_strong(due, now_ms + config_.cleanup_interval.count(),
                                                std::memory_order_relaxed)) {
        return;
    }

    size_t removed = sweep_expired();
    if (removed > 0) {
        LOG_DEBUG(logging::get_logger(), "Rate limiter swept {} expired windows", removed);
    }
}

}  // namespace eden::gateway
