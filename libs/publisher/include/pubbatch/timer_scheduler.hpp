// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file timer_scheduler.hpp
/// @brief Single-thread deadline scheduler with cancellable entries
///
/// Runs flush deadlines and retry backoffs. Tasks execute on the scheduler
/// thread without the scheduler lock held, so a task may schedule or cancel
/// other entries. Tasks must be short; blocking work belongs on a WorkerPool.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace pubbatch {

class TimerScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    TimerScheduler() = default;
    ~TimerScheduler();

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    /// Start the scheduler thread
    void start();

    /// Stop the scheduler thread; entries not yet due are discarded
    void stop();

    /// Run task at deadline
    /// @return Id usable with cancel()
    TimerId schedule_at(Clock::time_point deadline, Task task);

    /// Run task after delay
    TimerId schedule_after(std::chrono::milliseconds delay, Task task);

    /// Remove an entry that has not started yet
    /// @return true if the entry was removed, false if it already ran,
    ///         is running, or never existed
    bool cancel(TimerId id);

    /// Number of entries waiting for their deadline
    size_t pending() const;

private:
    void run_loop();

    using Key = std::pair<Clock::time_point, TimerId>;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Task> entries_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace pubbatch
