// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/batch_publisher.hpp"

#include <glog/logging.h>

#include <exception>
#include <utility>
#include <vector>

namespace pubbatch {

const char* to_string(FlushReason reason) {
    switch (reason) {
        case FlushReason::Count: return "count";
        case FlushReason::Bytes: return "bytes";
        case FlushReason::Delay: return "delay";
        case FlushReason::Explicit: return "explicit";
        case FlushReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

BatchPublisher::BatchPublisher(std::unique_ptr<PublishTransport> transport,
                               const PublisherOptions& options)
    : options_(options)
    , transport_(std::move(transport))
    , workers_(options.worker_threads)
    , accumulator_(options.thresholds)
    , flush_timer_(scheduler_, options.thresholds.max_delay,
                   [this](uint64_t batch_id) { on_flush_deadline(batch_id); }) {
    if (!transport_) {
        throw ConfigError("BatchPublisher requires a transport");
    }
    options_.retry.validate();
}

BatchPublisher::~BatchPublisher() {
    if (running()) {
        shutdown();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BatchPublisher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Running) {
        return true;
    }
    if (state_ != State::Created) {
        LOG(ERROR) << "BatchPublisher: cannot restart after shutdown";
        return false;
    }

    // Self-test: the static attributes must build a message before the
    // first real event flows
    try {
        Message probe = MessageBuilder::build("", options_.static_attributes);
        static_attributes_ = probe.attributes();
    } catch (const ValidationError& e) {
        LOG(ERROR) << "BatchPublisher: make sure the attributes are string:string pairs ("
                   << e.what() << ")";
        state_ = State::Stopped;
        throw;
    }

    if (!transport_->start()) {
        LOG(ERROR) << "BatchPublisher: Failed to start transport " << transport_->name();
        return false;
    }

    scheduler_.start();
    workers_.start();
    state_ = State::Running;

    const Thresholds& t = accumulator_.thresholds();
    LOG(INFO) << "BatchPublisher started"
              << " (transport=" << transport_->name()
              << ", max_count=" << t.max_count
              << ", max_bytes=" << t.max_bytes
              << ", max_delay=" << t.max_delay.count() << "ms"
              << ", max_attempts=" << options_.retry.max_attempts
              << ", workers=" << workers_.threads() << ")";
    return true;
}

ShutdownResult BatchPublisher::shutdown() {
    PendingPtr pending;
    PublisherStats before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Running) {
            if (state_ == State::Created) {
                state_ = State::Stopped;
            }
            return {};
        }
        state_ = State::Draining;
        before = stats();

        // Flush whatever is buffered, even below every threshold
        pending = claim_locked(FlushReason::Shutdown);
        flush_timer_.disarm();
    }
    if (pending) {
        dispatch(std::move(pending));
    }

    const auto bound = options_.retry.total_backoff() + options_.shutdown_grace;
    if (!transport_->healthy()) {
        LOG(WARNING) << "BatchPublisher: transport " << transport_->name()
                     << " is not healthy, in-flight batches may exhaust their retries";
    }
    LOG(INFO) << "BatchPublisher draining " << in_flight() << " in-flight batch(es), waiting up to "
              << bound.count() << "ms";

    ShutdownResult result;
    {
        std::unique_lock<std::mutex> lock(dispatch_mutex_);
        result.timed_out = !drained_cv_.wait_for(lock, bound, [this] {
            return in_flight_.empty();
        });
    }

    if (result.timed_out) {
        LOG(WARNING) << "BatchPublisher: drain bound of " << bound.count()
                     << "ms exceeded, abandoning pending retries";
        abandon_retries();
    }

    // No new deadlines fire after this; workers then finish sends already started
    scheduler_.stop();
    workers_.stop();
    transport_->stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Stopped;
    }

    PublisherStats after = stats();
    result.dropped_messages = after.messages_dropped - before.messages_dropped;
    result.dropped_batches = after.batches_dropped - before.batches_dropped;

    LOG(INFO) << "BatchPublisher stopped. Stats:"
              << " accepted=" << after.messages_accepted
              << " delivered=" << after.messages_delivered
              << " dropped=" << after.messages_dropped
              << " batches=" << after.batches_flushed
              << " (count=" << after.flushes_by_count
              << ", bytes=" << after.flushes_by_bytes
              << ", delay=" << after.flushes_by_delay
              << ", explicit=" << after.flushes_explicit
              << ", shutdown=" << after.flushes_on_shutdown << ")"
              << " retries=" << after.retries;

    TransportStats sent = transport_->stats();
    LOG(INFO) << "Transport " << transport_->name() << " stats:"
              << " batches=" << sent.batches_sent
              << " failed=" << sent.batches_failed
              << " messages=" << sent.messages_sent
              << " bytes=" << sent.bytes_sent;
    if (result.timed_out && result.ok()) {
        LOG(INFO) << "BatchPublisher: sends still running at the drain bound all succeeded";
    }
    return result;
}

void BatchPublisher::on_batch_dropped(DroppedBatchCallback callback) {
    on_dropped_ = std::move(callback);
}

// ============================================================================
// Ingestion
// ============================================================================

bool BatchPublisher::publish(std::string payload) {
    Attributes attributes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attributes = static_attributes_;
    }
    return publish(MessageBuilder::build(std::move(payload), std::move(attributes)));
}

bool BatchPublisher::publish(std::string payload, const nlohmann::json& attributes) {
    Attributes merged = MessageBuilder::to_attributes(attributes);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Per-message values win over static ones
        merged.insert(static_attributes_.begin(), static_attributes_.end());
    }
    return publish(MessageBuilder::build(std::move(payload), std::move(merged)));
}

bool BatchPublisher::publish(Message message) {
    PendingPtr pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Running) {
            LOG_EVERY_N(WARNING, 100) << "BatchPublisher not running, rejecting message";
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.messages_rejected++;
            return false;
        }

        bool first = accumulator_.empty();
        AppendResult result = accumulator_.append(std::move(message));
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.messages_accepted++;
        }

        if (is_full(result)) {
            pending = claim_locked(result == AppendResult::CountReached ? FlushReason::Count
                                                                        : FlushReason::Bytes);
        } else if (first) {
            const Batch& batch = accumulator_.current();
            flush_timer_.arm(batch.id(), batch.created_at());
        }
    }

    if (pending) {
        dispatch(std::move(pending));
    }
    return true;
}

void BatchPublisher::flush() {
    PendingPtr pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Running) {
            return;
        }
        pending = claim_locked(FlushReason::Explicit);
    }
    if (pending) {
        dispatch(std::move(pending));
    }
}

bool BatchPublisher::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::Running;
}

size_t BatchPublisher::in_flight() const {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    return in_flight_.size();
}

PublisherStats BatchPublisher::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// Flushing
// ============================================================================

BatchPublisher::PendingPtr BatchPublisher::claim_locked(FlushReason reason) {
    if (accumulator_.empty()) {
        return nullptr;
    }

    flush_timer_.disarm();

    auto pending = std::make_shared<PendingDispatch>();
    pending->batch = accumulator_.take();
    pending->reason = reason;

    // Registered before mutex_ is released so shutdown() never misses it
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        in_flight_.emplace(pending->batch->id(), pending);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.batches_flushed++;
        switch (reason) {
            case FlushReason::Count: stats_.flushes_by_count++; break;
            case FlushReason::Bytes: stats_.flushes_by_bytes++; break;
            case FlushReason::Delay: stats_.flushes_by_delay++; break;
            case FlushReason::Explicit: stats_.flushes_explicit++; break;
            case FlushReason::Shutdown: stats_.flushes_on_shutdown++; break;
        }
    }

    VLOG(1) << "Flushing batch " << pending->batch->id()
            << " (" << pending->batch->message_count() << " messages, "
            << pending->batch->total_byte_size() << " bytes, reason=" << to_string(reason) << ")";
    return pending;
}

void BatchPublisher::on_flush_deadline(uint64_t batch_id) {
    PendingPtr pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Stale deadline: the batch already left through a threshold flush
        if (!flush_timer_.fired(batch_id) || state_ != State::Running) {
            return;
        }
        if (accumulator_.current().id() != batch_id) {
            return;
        }
        pending = claim_locked(FlushReason::Delay);
    }
    if (pending) {
        dispatch(std::move(pending));
    }
}

// ============================================================================
// Dispatch
// ============================================================================

void BatchPublisher::dispatch(PendingPtr pending) {
    if (!workers_.post([this, pending] { attempt_send(pending); })) {
        drop(pending, "publisher stopped before send");
    }
}

void BatchPublisher::attempt_send(PendingPtr pending) {
    bool abandoned;
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        abandoned = abandon_retries_ && pending->attempt > 0;
    }
    if (abandoned) {
        drop(pending, "shutdown deadline exceeded before retry");
        return;
    }

    pending->attempt++;
    const Batch& batch = *pending->batch;

    SendResult result;
    try {
        result = transport_->send(batch, pending->attempt);
    } catch (const std::exception& e) {
        result = SendResult::fatal(std::string("transport error: ") + e.what());
    }

    VLOG(1) << "Batch " << batch.id() << " attempt " << pending->attempt << " -> "
            << to_string(result.status);

    switch (result.status) {
        case SendStatus::Ok:
            complete(pending);
            return;
        case SendStatus::Fatal:
            drop(pending, result.reason);
            return;
        case SendStatus::Retryable:
            if (pending->attempt >= options_.retry.max_attempts) {
                drop(pending, "retry budget exhausted (" + result.reason + ")");
                return;
            }
            schedule_retry(std::move(pending), result);
            return;
    }
}

void BatchPublisher::schedule_retry(PendingPtr pending, const SendResult& result) {
    const std::string& reason = result.reason;
    const uint64_t batch_id = pending->batch->id();
    const uint32_t attempt = pending->attempt;
    const auto backoff = options_.retry.backoff_for(attempt);

    {
        std::unique_lock<std::mutex> lock(dispatch_mutex_);
        if (abandon_retries_) {
            lock.unlock();
            drop(pending, "shutdown deadline exceeded (" + reason + ")");
            return;
        }
        retry_timers_[batch_id] = scheduler_.schedule_after(
            backoff, [this, pending] { on_retry_due(pending); });
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.retries++;
    }

    LOG(WARNING) << "Batch " << batch_id << " attempt " << attempt << "/"
                 << options_.retry.max_attempts << " failed (" << to_string(result.status)
                 << ": " << reason << "), retrying in "
                 << backoff.count() << "ms";
}

void BatchPublisher::on_retry_due(PendingPtr pending) {
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        retry_timers_.erase(pending->batch->id());
    }
    dispatch(std::move(pending));
}

void BatchPublisher::abandon_retries() {
    std::vector<std::pair<TimerScheduler::TimerId, PendingPtr>> waiting;
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        abandon_retries_ = true;
        for (const auto& [batch_id, timer_id] : retry_timers_) {
            auto it = in_flight_.find(batch_id);
            if (it != in_flight_.end()) {
                waiting.emplace_back(timer_id, it->second);
            }
        }
        retry_timers_.clear();
    }

    // A timer that already fired drops itself in attempt_send()
    for (auto& [timer_id, pending] : waiting) {
        if (scheduler_.cancel(timer_id)) {
            drop(pending, "shutdown deadline exceeded while waiting to retry");
        }
    }
}

// ============================================================================
// Resolution
// ============================================================================

void BatchPublisher::complete(const PendingPtr& pending) {
    const Batch& batch = *pending->batch;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.batches_acknowledged++;
        stats_.messages_delivered += batch.message_count();
    }

    VLOG(1) << "Batch " << batch.id() << " acknowledged after " << pending->attempt
            << " attempt(s)";

    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    in_flight_.erase(batch.id());
    if (in_flight_.empty()) {
        drained_cv_.notify_all();
    }
}

void BatchPublisher::drop(const PendingPtr& pending, const std::string& reason) {
    const Batch& batch = *pending->batch;

    DroppedBatch dropped;
    dropped.batch_id = batch.id();
    dropped.message_count = batch.message_count();
    dropped.attempts = pending->attempt;
    dropped.reason = reason;

    LOG(ERROR) << "Dropping batch " << dropped.batch_id << " (" << dropped.message_count
               << " messages) after " << dropped.attempts << " attempt(s): " << reason;

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.batches_dropped++;
        stats_.messages_dropped += dropped.message_count;
    }

    if (on_dropped_) {
        on_dropped_(dropped);
    }

    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    in_flight_.erase(dropped.batch_id);
    if (in_flight_.empty()) {
        drained_cv_.notify_all();
    }
}

}  // namespace pubbatch
