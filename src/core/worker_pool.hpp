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

// Eden Worker Pool - Header
// Fixed-size thread pool running one task per accepted connection

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace eden::core {

/// Get number of available CPU cores (at least 1)
[[nodiscard]] uint32_t get_cpu_count();

/// Fixed-size worker pool with a bounded FIFO task queue
class WorkerPool {
public:
    using Task = std::function<void()>;

    /// @param threads Worker count (0 = CPU count)
    /// @param max_queue Pending tasks allowed before submit() refuses work
    explicit WorkerPool(size_t threads, size_t max_queue = 4096, std::string name = "worker");
    ~WorkerPool();

    // Non-copyable, non-movable (threads capture this)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task
    /// @return false if the pool is shutting down or the queue is full
    [[nodiscard]] bool submit(Task task);

    /// Stop accepting work, run what is queued, join all workers
    void shutdown();

    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

    /// Tasks queued but not yet started
    [[nodiscard]] size_t pending() const;

private:
    void worker_loop();

    std::string name_;
    size_t max_queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
};

}  // namespace eden::core
