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

// Eden Health Prober - Implementation

#include "health.hpp"

#include <exception>
#include <optional>

#include <fmt/format.h>
#include <httplib.h>

#include "../core/logging.hpp"

namespace eden::control {

HealthProber::HealthProber(gateway::ServiceRegistry& registry, HealthCheckConfig config,
                           CheckFunction check)
    : registry_(registry), config_(std::move(config)), check_(std::move(check)) {
    if (!check_) {
        check_ = [this](const gateway::ServiceInstance& instance) { return check_instance(instance); };
    }
}

HealthProber::~HealthProber() {
    stop();
}

void HealthProber::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&HealthProber::loop, this);

    LOG_INFO(logging::get_logger(), "Health prober started: interval={}ms, path={}",
             config_.interval_ms, config_.path);
}

void HealthProber::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool HealthProber::is_running() const noexcept {
    std::lock_guard lock(mutex_);
    return running_;
}

void HealthProber::loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        lock.unlock();
        run_once();
        lock.lock();

        cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                     [this] { return !running_; });
    }
}

size_t HealthProber::run_once() {
    size_t transitions = 0;
    core::fast_set<std::string> live_ids;

    for (const auto& service : registry_.list_services()) {
        for (const auto& instance : registry_.get_instances(service)) {
            live_ids.insert(instance.id);

            auto result = check_(instance);

            std::optional<gateway::HealthStatus> next;
            {
                std::lock_guard lock(streak_mutex_);
                auto& streak = streaks_[instance.id];
                if (result.success) {
                    streak.failures = 0;
                    ++streak.successes;
                    if (instance.health != gateway::HealthStatus::Healthy &&
                        streak.successes >= config_.healthy_threshold) {
                        next = gateway::HealthStatus::Healthy;
                    }
                } else {
                    streak.successes = 0;
                    ++streak.failures;
                    if (instance.health != gateway::HealthStatus::Unhealthy &&
                        streak.failures >= config_.unhealthy_threshold) {
                        next = gateway::HealthStatus::Unhealthy;
                    }
                }
            }

            if (!result.success) {
                LOG_DEBUG(logging::get_logger(), "Health check failed: id={}, error={}",
                          instance.id, result.error);
            }

            if (next) {
                // Instance may have been deregistered while probing
                auto status = registry_.update_instance_health(instance.id, *next);
                if (status.ok()) {
                    ++transitions;
                }
            }
        }
    }

    // Forget streaks of deregistered instances
    std::lock_guard lock(streak_mutex_);
    for (auto it = streaks_.begin(); it != streaks_.end();) {
        if (!live_ids.contains(it->first)) {
            it = streaks_.erase(it);
        } else {
            ++it;
        }
    }

    return transitions;
}

CheckResult HealthProber::check_instance(const gateway::ServiceInstance& instance) const {
    CheckResult result;
    auto start = std::chrono::steady_clock::now();

    try {
        httplib::Client client(instance.address, instance.port);
        client.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

        auto res = client.Get(config_.path);
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!res) {
            result.error = httplib::to_string(res.error());
        } else if (res->status < 200 || res->status >= 300) {
            result.error = fmt::format("status {}", res->status);
        } else {
            result.success = true;
        }
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}

}  // namespace eden::control
