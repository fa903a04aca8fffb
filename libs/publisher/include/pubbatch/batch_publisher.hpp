// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_publisher.hpp
/// @brief Batching publisher: accumulate, flush, send, retry, drain
///
/// BatchPublisher owns exactly one current batch. publish() validates the
/// message and appends it under the accumulation mutex; a count or byte
/// threshold trip flushes synchronously from that call. FlushTimer covers
/// the delay threshold. A flush swaps in a fresh batch before the old one is
/// handed to a worker thread, so producers never wait on the network.
///
/// Per-batch state machine:
///   Accumulating -> Flushing(attempt = 1..max_attempts) -> Acknowledged | Dropped
///
/// Data flow:
///   publish() -> MessageBuilder -> BatchAccumulator -> WorkerPool -> PublishTransport
///                                        ^                   |
///                                   FlushTimer        TimerScheduler (backoff)

#include "pubbatch/batch.hpp"
#include "pubbatch/flush_timer.hpp"
#include "pubbatch/message.hpp"
#include "pubbatch/publish_transport.hpp"
#include "pubbatch/retry_policy.hpp"
#include "pubbatch/timer_scheduler.hpp"
#include "pubbatch/worker_pool.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pubbatch {

/// Configuration for the batching publisher
struct PublisherOptions {
    Thresholds thresholds;
    RetryPolicy retry;

    /// Attributes added to every published message; validated once by start()
    nlohmann::json static_attributes = nlohmann::json::object();

    /// Concurrent transport sends
    size_t worker_threads = 4;

    /// Added to the retry policy's total backoff to bound shutdown()
    std::chrono::milliseconds shutdown_grace{10000};
};

/// Why a batch left the Accumulating state
enum class FlushReason : uint8_t {
    Count,
    Bytes,
    Delay,
    Explicit,
    Shutdown
};

const char* to_string(FlushReason reason);

/// Reported once for every batch that will never be delivered
struct DroppedBatch {
    uint64_t batch_id = 0;
    size_t message_count = 0;
    uint32_t attempts = 0;
    std::string reason;
};

using DroppedBatchCallback = std::function<void(const DroppedBatch&)>;

/// Aggregate outcome of shutdown()
struct ShutdownResult {
    uint64_t dropped_messages = 0;
    uint64_t dropped_batches = 0;

    /// Drain bound elapsed before every batch resolved. Diagnostic only:
    /// sends already on the wire still count as delivered if they succeed.
    bool timed_out = false;

    /// Every message handed to publish() was delivered
    bool ok() const { return dropped_messages == 0; }
};

/// Statistics for the batching publisher
struct PublisherStats {
    uint64_t messages_accepted = 0;
    uint64_t messages_rejected = 0;  ///< publish() after shutdown began
    uint64_t batches_flushed = 0;
    uint64_t flushes_by_count = 0;
    uint64_t flushes_by_bytes = 0;
    uint64_t flushes_by_delay = 0;
    uint64_t flushes_explicit = 0;
    uint64_t flushes_on_shutdown = 0;
    uint64_t batches_acknowledged = 0;
    uint64_t batches_dropped = 0;
    uint64_t messages_delivered = 0;
    uint64_t messages_dropped = 0;
    uint64_t retries = 0;
};

/// Client-side batching publisher.
///
/// Thread-safe for concurrent publish() calls.
///
/// Example:
/// @code
///   PublisherOptions options;
///   options.thresholds.max_count = 100;
///   options.static_attributes = {{"origin", "edge"}};
///
///   BatchPublisher publisher(std::make_unique<MqttPublishTransport>(mqtt), options);
///   publisher.on_batch_dropped([](const DroppedBatch& d) { ... });
///   publisher.start();              // throws ValidationError on bad attributes
///   publisher.publish(event.dump());
///   auto result = publisher.shutdown();
/// @endcode
class BatchPublisher {
public:
    /// @throws ConfigError on invalid thresholds or retry policy
    BatchPublisher(std::unique_ptr<PublishTransport> transport,
                   const PublisherOptions& options = {});

    ~BatchPublisher();

    BatchPublisher(const BatchPublisher&) = delete;
    BatchPublisher& operator=(const BatchPublisher&) = delete;

    /// Validate static attributes, start the transport and worker threads.
    /// @throws ValidationError if static attributes are not string:string;
    ///         the publisher then never accepts a message
    /// @return false if the transport failed to start
    bool start();

    /// Drain and stop. Flushes the current batch even below every threshold,
    /// then waits for all in-flight batches (including retries) to resolve.
    /// Waits at most retry.total_backoff() + shutdown_grace.
    ShutdownResult shutdown();

    /// Register the dropped-batch reporter. Call before start().
    void on_batch_dropped(DroppedBatchCallback callback);

    /// @name Message ingestion
    /// Static attributes are added to every message; a per-message attribute
    /// with the same key takes precedence. publish(Message) sends the message
    /// as built.
    /// @return true if accepted, false if the publisher is not running
    /// @throws ValidationError on non-string attributes (never queued)
    /// @{
    bool publish(std::string payload);
    bool publish(std::string payload, const nlohmann::json& attributes);
    bool publish(Message message);
    /// @}

    /// Flush the current batch now if it holds any message
    void flush();

    bool running() const;

    /// Batches handed to the transport and not yet resolved
    size_t in_flight() const;

    PublisherStats stats() const;

    /// @name Transport passthrough for periodic status logging
    /// @{
    TransportStats transport_stats() const { return transport_->stats(); }
    bool transport_healthy() const { return transport_->healthy(); }
    /// @}

private:
    enum class State : uint8_t {
        Created,
        Running,
        Draining,
        Stopped
    };

    /// A batch owned by the dispatch path until acknowledged or dropped
    struct PendingDispatch {
        std::unique_ptr<const Batch> batch;
        FlushReason reason = FlushReason::Explicit;
        uint32_t attempt = 0;
    };

    using PendingPtr = std::shared_ptr<PendingDispatch>;

    /// Claim the current batch for flushing; caller holds mutex_
    PendingPtr claim_locked(FlushReason reason);

    void dispatch(PendingPtr pending);
    void attempt_send(PendingPtr pending);
    void schedule_retry(PendingPtr pending, const SendResult& result);
    void on_retry_due(PendingPtr pending);
    void on_flush_deadline(uint64_t batch_id);

    void complete(const PendingPtr& pending);
    void drop(const PendingPtr& pending, const std::string& reason);
    void abandon_retries();

    PublisherOptions options_;
    std::unique_ptr<PublishTransport> transport_;
    DroppedBatchCallback on_dropped_;

    // Executors (declared before users so they outlive FlushTimer)
    TimerScheduler scheduler_;
    WorkerPool workers_;

    // Accumulation: guarded by mutex_
    mutable std::mutex mutex_;
    State state_ = State::Created;
    BatchAccumulator accumulator_;
    FlushTimer flush_timer_;
    Attributes static_attributes_;

    // Dispatch: guarded by dispatch_mutex_ (lock order: mutex_ -> dispatch_mutex_)
    mutable std::mutex dispatch_mutex_;
    std::condition_variable drained_cv_;
    std::unordered_map<uint64_t, PendingPtr> in_flight_;
    std::unordered_map<uint64_t, TimerScheduler::TimerId> retry_timers_;
    bool abandon_retries_ = false;

    // Stats
    mutable std::mutex stats_mutex_;
    PublisherStats stats_;
};

}  // namespace pubbatch
