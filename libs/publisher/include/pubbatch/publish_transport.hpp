// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file publish_transport.hpp
/// @brief Abstract interface for sending batches to a pub/sub destination
///
/// PublishTransport is the only effectful operation crossing the process
/// boundary. Each instance is bound to one destination topic at
/// construction; BatchPublisher only hands it batches.
///
/// Outcome classification drives the publisher's retry state machine:
/// - Ok: batch acknowledged, discarded
/// - Retryable: transient failure, batch re-sent unchanged after backoff
/// - Fatal: permanent rejection, batch dropped and reported

#include <cstdint>
#include <string>
#include <utility>

namespace pubbatch {

class Batch;

/// Result of a single send attempt
enum class SendStatus : uint8_t {
    Ok = 0,
    Retryable = 1,
    Fatal = 2
};

const char* to_string(SendStatus status);

struct SendResult {
    SendStatus status = SendStatus::Ok;
    std::string reason;

    bool ok() const { return status == SendStatus::Ok; }

    static SendResult success() { return {}; }
    static SendResult retryable(std::string reason) {
        return {SendStatus::Retryable, std::move(reason)};
    }
    static SendResult fatal(std::string reason) {
        return {SendStatus::Fatal, std::move(reason)};
    }
};

/// Transport statistics
struct TransportStats {
    uint64_t batches_sent = 0;
    uint64_t batches_failed = 0;
    uint64_t messages_sent = 0;
    uint64_t bytes_sent = 0;
    int64_t last_send_timestamp_ns = 0;
};

/// Abstract interface for batch transports.
///
/// send() may be called concurrently from several worker threads and must
/// return within a bounded time.
class PublishTransport {
public:
    virtual ~PublishTransport() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Start the transport (connect, allocate resources)
    /// @return true on success
    virtual bool start() = 0;

    /// Stop the transport (disconnect, release resources)
    virtual void stop() = 0;

    // =========================================================================
    // Send
    // =========================================================================

    /// Send one batch to the bound destination
    /// @param batch Immutable batch; message order must be kept on the wire
    /// @param attempt 1-based attempt number for this batch
    virtual SendResult send(const Batch& batch, uint32_t attempt) = 0;

    // =========================================================================
    // Metadata
    // =========================================================================

    /// Check if transport is healthy and ready
    virtual bool healthy() const = 0;

    /// Get statistics
    virtual TransportStats stats() const = 0;

    /// Get transport name for logging
    virtual std::string name() const = 0;
};

}  // namespace pubbatch
