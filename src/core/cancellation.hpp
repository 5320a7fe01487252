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

// Eden Cancellation - Header
// Cooperative cancellation flag shared between a client connection and its
// outbound proxied call

#pragma once

#include <atomic>
#include <functional>
#include <utility>

namespace eden::core {

/// Cancellation token
///
/// Either set explicitly via cancel(), or discovered by an optional check
/// (e.g. "has the client socket hung up?"). Once observed, the cancelled
/// state is sticky.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> check) : check_(std::move(check)) {}

    // Non-copyable, non-movable (shared by reference across threads)
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        if (check_ && check_()) {
            cancelled_.store(true, std::memory_order_release);
            return true;
        }
        return false;
    }

private:
    mutable std::atomic<bool> cancelled_{false};
    std::function<bool()> check_;
};

}  // namespace eden::core
