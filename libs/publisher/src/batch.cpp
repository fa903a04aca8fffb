// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/batch.hpp"

#include <string>
#include <utility>

namespace pubbatch {

// ============================================================================
// Thresholds
// ============================================================================

void Thresholds::validate() const {
    if (max_count < 1) {
        throw ConfigError("message count threshold must be >= 1");
    }
    if (max_delay.count() <= 0) {
        throw ConfigError("delay threshold must be > 0");
    }
    if (max_delay > kMaxDelayLimit) {
        throw ConfigError("delay threshold must be <= " +
                          std::to_string(kMaxDelayLimit.count()) + "ms");
    }
    if (max_bytes == 0) {
        throw ConfigError("request byte threshold must be > 0");
    }
}

// ============================================================================
// Batch
// ============================================================================

Batch::Batch(uint64_t id)
    : id_(id) {
}

void Batch::append(Message message) {
    if (messages_.empty()) {
        created_at_ = std::chrono::steady_clock::now();
    }
    total_byte_size_ += message.byte_size();
    messages_.push_back(std::move(message));
}

// ============================================================================
// BatchAccumulator
// ============================================================================

BatchAccumulator::BatchAccumulator(const Thresholds& thresholds)
    : thresholds_(thresholds)
    , current_(std::make_unique<Batch>(next_id_++)) {
    thresholds_.validate();
}

AppendResult BatchAccumulator::append(Message message) {
    current_->append(std::move(message));

    if (current_->message_count() >= thresholds_.max_count) {
        return AppendResult::CountReached;
    }
    if (current_->total_byte_size() >= thresholds_.max_bytes) {
        return AppendResult::BytesReached;
    }
    return AppendResult::Accepted;
}

std::unique_ptr<Batch> BatchAccumulator::take() {
    auto batch = std::move(current_);
    current_ = std::make_unique<Batch>(next_id_++);
    return batch;
}

}  // namespace pubbatch
