// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file worker_pool.hpp
/// @brief Fixed-size thread pool running transport sends
///
/// Several batches may be in flight at once, one per worker. Producers never
/// run on these threads.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pubbatch {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    /// Stop accepting tasks, run everything already queued, join the workers
    void stop();

    /// Queue a task
    /// @return false if the pool is not running
    bool post(Task task);

    size_t threads() const { return thread_count_; }

private:
    void worker_loop();

    size_t thread_count_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool accepting_ = false;
    std::vector<std::thread> workers_;
};

}  // namespace pubbatch
