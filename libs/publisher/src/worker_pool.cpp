// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/worker_pool.hpp"

#include <glog/logging.h>

namespace pubbatch {

WorkerPool::WorkerPool(size_t threads)
    : thread_count_(threads > 0 ? threads : 1) {
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accepting_) {
        return;
    }
    accepting_ = true;
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    VLOG(1) << "WorkerPool started with " << thread_count_ << " threads";
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

bool WorkerPool::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !accepting_ || !queue_.empty(); });

            // Drain the queue before exiting
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

}  // namespace pubbatch
