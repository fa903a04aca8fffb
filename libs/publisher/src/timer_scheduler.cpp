// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/timer_scheduler.hpp"

#include <glog/logging.h>

namespace pubbatch {

TimerScheduler::~TimerScheduler() {
    stop();
}

void TimerScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&TimerScheduler::run_loop, this);
}

void TimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!entries_.empty()) {
        VLOG(1) << "TimerScheduler stopped, discarding " << entries_.size() << " entries";
    }
    entries_.clear();
    deadlines_.clear();
}

TimerScheduler::TimerId TimerScheduler::schedule_at(Clock::time_point deadline, Task task) {
    TimerId id;
    bool earliest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        entries_.emplace(Key{deadline, id}, std::move(task));
        deadlines_.emplace(id, deadline);
        earliest = entries_.begin()->first.second == id;
    }

    // Only a new head changes how long the loop has to sleep
    if (earliest) {
        cv_.notify_one();
    }
    return id;
}

TimerScheduler::TimerId TimerScheduler::schedule_after(std::chrono::milliseconds delay,
                                                       Task task) {
    return schedule_at(Clock::now() + delay, std::move(task));
}

bool TimerScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return false;
    }
    entries_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimerScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !entries_.empty(); });
            continue;
        }

        auto head = entries_.begin();
        Clock::time_point deadline = head->first.first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Task task = std::move(head->second);
        deadlines_.erase(head->first.second);
        entries_.erase(head);

        lock.unlock();
        task();
        lock.lock();
    }
}

}  // namespace pubbatch
