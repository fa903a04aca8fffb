// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch.hpp
/// @brief Batch accumulation against count and byte thresholds
///
/// BatchAccumulator owns the single "current" batch. It evaluates the count
/// and byte thresholds synchronously on every append; the delay threshold
/// belongs to FlushTimer since it must fire even when no message arrives.
///
/// BatchAccumulator is not thread-safe. BatchPublisher serializes all access
/// under its accumulation mutex.

#include "pubbatch/message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace pubbatch {

/// Flush thresholds (immutable snapshot)
struct Thresholds {
    /// Flush once the batch holds this many serialized bytes
    size_t max_bytes = 1000000;

    /// Flush once the first message of the batch is this old
    std::chrono::milliseconds max_delay{5000};

    /// Flush once the batch holds this many messages
    size_t max_count = 100;

    /// Longest accepted max_delay; keeps created_at + max_delay representable
    static constexpr std::chrono::milliseconds kMaxDelayLimit{24 * 60 * 60 * 1000};

    /// @throws ConfigError unless max_count >= 1, max_bytes > 0 and
    ///         0 < max_delay <= kMaxDelayLimit
    void validate() const;
};

/// Ordered group of messages sent in one transport call
class Batch {
public:
    explicit Batch(uint64_t id);

    uint64_t id() const { return id_; }
    const std::vector<Message>& messages() const { return messages_; }
    size_t message_count() const { return messages_.size(); }
    size_t total_byte_size() const { return total_byte_size_; }
    bool empty() const { return messages_.empty(); }

    /// Time the first message was appended (epoch if empty)
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }

    /// Append preserving insertion order
    void append(Message message);

private:
    uint64_t id_;
    std::vector<Message> messages_;
    size_t total_byte_size_ = 0;
    std::chrono::steady_clock::time_point created_at_{};
};

/// Outcome of BatchAccumulator::append()
enum class AppendResult {
    Accepted,      ///< Below every threshold
    CountReached,  ///< message_count >= max_count
    BytesReached   ///< total_byte_size >= max_bytes
};

inline bool is_full(AppendResult result) {
    return result != AppendResult::Accepted;
}

/// Holds the current batch and decides when it is full
class BatchAccumulator {
public:
    explicit BatchAccumulator(const Thresholds& thresholds);

    /// Append to the current batch and evaluate count/byte thresholds.
    ///
    /// A message larger than max_bytes is still appended; it reports
    /// BytesReached and ends up alone in its batch.
    AppendResult append(Message message);

    /// Hand out the current batch and install a fresh empty one
    std::unique_ptr<Batch> take();

    const Batch& current() const { return *current_; }
    bool empty() const { return current_->empty(); }

    const Thresholds& thresholds() const { return thresholds_; }

private:
    Thresholds thresholds_;
    uint64_t next_id_ = 1;
    std::unique_ptr<Batch> current_;
};

}  // namespace pubbatch
