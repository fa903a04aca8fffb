// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file mqtt_publish_transport.hpp
/// @brief PublishTransport over MQTT (libmosquitto)
///
/// Each batch is encoded as a PublishRequest, optionally zstd-compressed, and
/// published to
/// the MQTT topic named after the full pub/sub topic
/// ("projects/{project}/topics/{topic}"). With QoS >= 1, send() waits for
/// the broker's PUBACK, bounded by ack_timeout.

#include "pubbatch/batch_compressor.hpp"
#include "pubbatch/publish_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

// Forward declarations (mosquitto types are in global namespace)
struct mosquitto;

namespace pubbatch {

/// Connection state of the MQTT client
enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Reconnecting = 3
};

/// Configuration for the MQTT publish transport
struct MqttPublishTransportConfig {
    std::string broker_host = "localhost";
    int broker_port = 1883;
    std::string client_id = "pubsub_forwarder";
    std::string username;
    std::string password;
    int keepalive_sec = 60;
    int qos = 1;

    /// Full topic name the transport is bound to
    std::string topic;

    /// Upper bound on waiting for a PUBACK (QoS >= 1)
    std::chrono::milliseconds ack_timeout{5000};

    CompressionOptions compression;
};

/// Classify a libmosquitto return code as a retryable or fatal send outcome
SendStatus classify_mosquitto_error(int rc);

/// MQTT publish transport implementation
class MqttPublishTransport : public PublishTransport {
public:
    explicit MqttPublishTransport(const MqttPublishTransportConfig& config);
    ~MqttPublishTransport() override;

    MqttPublishTransport(const MqttPublishTransport&) = delete;
    MqttPublishTransport& operator=(const MqttPublishTransport&) = delete;

    // Lifecycle
    bool start() override;
    void stop() override;

    // Send
    SendResult send(const Batch& batch, uint32_t attempt) override;

    // Status
    bool healthy() const override;
    ConnectionState connection_state() const { return connection_state_; }
    TransportStats stats() const override;
    std::string name() const override { return "mqtt"; }

    const std::string& topic() const { return config_.topic; }

    /// Compression counters; zero until start()
    CompressionStats compression_stats() const;

private:
    // Mosquitto callbacks
    static void on_connect(struct mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);
    static void on_publish(struct mosquitto* mosq, void* obj, int mid);

    SendResult wait_for_ack(std::unique_lock<std::mutex>& lock, int mid);
    void record_failure();

    MqttPublishTransportConfig config_;
    std::unique_ptr<BatchCompressor> compressor_;
    struct mosquitto* mosq_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<ConnectionState> connection_state_{ConnectionState::Disconnected};

    // PUBACK tracking
    std::mutex acks_mutex_;
    std::condition_variable acks_cv_;
    std::set<int> awaiting_;
    std::set<int> acked_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

}  // namespace pubbatch
