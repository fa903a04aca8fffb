// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file flush_timer.hpp
/// @brief Delay threshold: one deadline per batch
///
/// Armed when the first message lands in an empty batch, for
/// created_at + max_delay, and tagged with that batch's id. The fire
/// callback receives the id so the owner can ignore a deadline whose batch
/// was already flushed by a count/byte threshold.
///
/// Not thread-safe: arm(), disarm() and fired() are called under the owner's
/// accumulation mutex. The fire callback runs on the TimerScheduler thread.

#include "pubbatch/timer_scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace pubbatch {

class FlushTimer {
public:
    using FireCallback = std::function<void(uint64_t batch_id)>;

    FlushTimer(TimerScheduler& scheduler, std::chrono::milliseconds max_delay,
               FireCallback on_fire);

    /// Arm for batch_id, firing at created_at + max_delay
    void arm(uint64_t batch_id, std::chrono::steady_clock::time_point created_at);

    /// Cancel the armed deadline, if any
    void disarm();

    /// Acknowledge a fire for batch_id
    /// @return true if batch_id was the armed batch
    bool fired(uint64_t batch_id);

    bool armed() const { return armed_batch_.has_value(); }
    std::optional<uint64_t> armed_batch() const { return armed_batch_; }

private:
    TimerScheduler& scheduler_;
    std::chrono::milliseconds max_delay_;
    FireCallback on_fire_;

    std::optional<uint64_t> armed_batch_;
    TimerScheduler::TimerId timer_id_ = 0;
};

}  // namespace pubbatch
