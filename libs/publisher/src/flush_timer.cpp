// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/flush_timer.hpp"

#include <glog/logging.h>

#include <utility>

namespace pubbatch {

FlushTimer::FlushTimer(TimerScheduler& scheduler, std::chrono::milliseconds max_delay,
                       FireCallback on_fire)
    : scheduler_(scheduler)
    , max_delay_(max_delay)
    , on_fire_(std::move(on_fire)) {
}

void FlushTimer::arm(uint64_t batch_id, std::chrono::steady_clock::time_point created_at) {
    disarm();

    armed_batch_ = batch_id;
    timer_id_ = scheduler_.schedule_at(created_at + max_delay_, [this, batch_id] {
        on_fire_(batch_id);
    });
    VLOG(2) << "Flush timer armed for batch " << batch_id;
}

void FlushTimer::disarm() {
    if (!armed_batch_) {
        return;
    }

    // A lost race is fine: the fire callback sees a stale batch id
    scheduler_.cancel(timer_id_);
    armed_batch_.reset();
    timer_id_ = 0;
}

bool FlushTimer::fired(uint64_t batch_id) {
    if (!armed_batch_ || *armed_batch_ != batch_id) {
        return false;
    }
    armed_batch_.reset();
    timer_id_ = 0;
    return true;
}

}  // namespace pubbatch
