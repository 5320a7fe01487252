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

// Eden Worker Pool - Implementation

#include "worker_pool.hpp"

#include <exception>

#include "logging.hpp"

namespace eden::core {

uint32_t get_cpu_count() {
    uint32_t count = std::thread::hardware_concurrency();
    return count == 0 ? 1 : count;
}

WorkerPool::WorkerPool(size_t threads, size_t max_queue, std::string name)
    : name_(std::move(name)), max_queue_(max_queue) {
    if (threads == 0) {
        threads = get_cpu_count();
    }

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || tasks_.size() >= max_queue_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t WorkerPool::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(logging::get_logger(), "Unhandled exception in {} task: {}", name_,
                      e.what());
        }
    }
}

}  // namespace eden::core
