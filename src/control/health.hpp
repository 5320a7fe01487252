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

// Eden Health Prober - Header
// Background probing of registered instances; reports only via UpdateInstanceHealth

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "../core/containers.hpp"
#include "../gateway/service_registry.hpp"
#include "config.hpp"

namespace eden::control {

/// Outcome of one check
struct CheckResult {
    bool success = false;
    std::chrono::milliseconds latency{0};
    std::string error;
};

/// Check function (replaceable in tests)
using CheckFunction = std::function<CheckResult(const gateway::ServiceInstance&)>;

/// Health prober
///
/// Every interval it checks each registered instance and flips the instance's
/// health only after the configured number of consecutive failures or
/// successes. The Service Registry itself never checks.
class HealthProber {
public:
    HealthProber(gateway::ServiceRegistry& registry, HealthCheckConfig config,
                 CheckFunction check = {});
    ~HealthProber();

    // Non-copyable, non-movable
    HealthProber(const HealthProber&) = delete;
    HealthProber& operator=(const HealthProber&) = delete;

    /// Start the probing thread
    void start();

    /// Stop and join the probing thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /// Check every instance once
    /// @return number of health transitions applied
    size_t run_once();

    /// GET http://address:port<path>; 2xx is healthy
    [[nodiscard]] CheckResult check_instance(const gateway::ServiceInstance& instance) const;

private:
    struct Streak {
        uint32_t failures = 0;
        uint32_t successes = 0;
    };

    void loop();

    gateway::ServiceRegistry& registry_;
    HealthCheckConfig config_;
    CheckFunction check_;

    std::mutex streak_mutex_;
    core::fast_map<std::string, Streak> streaks_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread thread_;
};

}  // namespace eden::control
