// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/mqtt_publish_transport.hpp"
#include "pubbatch/batch.hpp"
#include "pubbatch/wire_codec.hpp"

#include <glog/logging.h>
#include <mosquitto.h>

namespace pubbatch {

namespace {

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

SendStatus classify_mosquitto_error(int rc) {
    switch (rc) {
        case MOSQ_ERR_SUCCESS:
            return SendStatus::Ok;

        // Broker unreachable or client under memory pressure; worth another try
        case MOSQ_ERR_NOMEM:
        case MOSQ_ERR_NO_CONN:
        case MOSQ_ERR_CONN_LOST:
        case MOSQ_ERR_ERRNO:
            return SendStatus::Retryable;

        // The same request would be rejected again
        case MOSQ_ERR_INVAL:
        case MOSQ_ERR_PROTOCOL:
        case MOSQ_ERR_PAYLOAD_SIZE:
        case MOSQ_ERR_OVERSIZE_PACKET:
        case MOSQ_ERR_MALFORMED_UTF8:
        case MOSQ_ERR_QOS_NOT_SUPPORTED:
        case MOSQ_ERR_NOT_SUPPORTED:
        case MOSQ_ERR_AUTH:
        case MOSQ_ERR_ACL_DENIED:
            return SendStatus::Fatal;

        default:
            return SendStatus::Retryable;
    }
}

MqttPublishTransport::MqttPublishTransport(const MqttPublishTransportConfig& config)
    : config_(config) {
}

MqttPublishTransport::~MqttPublishTransport() {
    stop();
}

bool MqttPublishTransport::start() {
    if (running_) {
        return true;
    }

    if (config_.topic.empty()) {
        LOG(ERROR) << "MqttPublishTransport: no destination topic configured";
        return false;
    }

    compressor_ = std::make_unique<BatchCompressor>(config_.compression);
    if (!compressor_->init()) {
        LOG(ERROR) << "MqttPublishTransport: failed to set up "
                   << to_string(config_.compression.codec) << " compression";
        compressor_.reset();
        return false;
    }

    mosquitto_lib_init();

    mosq_ = mosquitto_new(config_.client_id.c_str(), true, this);
    if (!mosq_) {
        LOG(ERROR) << "Failed to create mosquitto client";
        mosquitto_lib_cleanup();
        return false;
    }

    connection_state_ = ConnectionState::Connecting;

    mosquitto_connect_callback_set(mosq_, on_connect);
    mosquitto_disconnect_callback_set(mosq_, on_disconnect);
    mosquitto_publish_callback_set(mosq_, on_publish);

    if (!config_.username.empty()) {
        mosquitto_username_pw_set(mosq_, config_.username.c_str(),
                                  config_.password.c_str());
    }

    int rc = mosquitto_connect_async(mosq_, config_.broker_host.c_str(),
                                     config_.broker_port, config_.keepalive_sec);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOG(ERROR) << "MQTT connect failed: " << rc << ", " << mosquitto_strerror(rc);
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
        mosquitto_lib_cleanup();
        connection_state_ = ConnectionState::Disconnected;
        return false;
    }

    mosquitto_loop_start(mosq_);
    running_ = true;

    LOG(INFO) << "MqttPublishTransport started, connecting to "
              << config_.broker_host << ":" << config_.broker_port
              << " (topic=" << config_.topic << ", qos=" << config_.qos
              << ", compression=" << to_string(config_.compression.codec)
              << " above " << config_.compression.min_batch_bytes << " bytes)";
    return true;
}

void MqttPublishTransport::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    if (mosq_) {
        mosquitto_disconnect(mosq_);
        mosquitto_loop_stop(mosq_, false);
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }
    mosquitto_lib_cleanup();

    connection_state_ = ConnectionState::Disconnected;
    acks_cv_.notify_all();

    CompressionStats c = compression_stats();
    LOG(INFO) << "MqttPublishTransport stopped. Compression: " << c.batches_compressed
              << " compressed, " << c.batches_below_threshold << " below threshold, "
              << c.batches_incompressible << " incompressible, ratio " << c.ratio();
}

SendResult MqttPublishTransport::send(const Batch& batch, uint32_t attempt) {
    if (!running_ || !mosq_ || connection_state_ != ConnectionState::Connected) {
        LOG_EVERY_N(WARNING, 100) << "MQTT not connected, batch " << batch.id()
                                  << " will be retried";
        record_failure();
        return SendResult::retryable("not connected to broker");
    }

    CompressedBatch payload = compressor_->compress(encode_batch(config_.topic, batch, attempt));

    // Held across publish so an early PUBACK cannot slip past awaiting_
    std::unique_lock<std::mutex> lock(acks_mutex_);

    int mid = 0;
    int rc = mosquitto_publish(mosq_, &mid,
                               config_.topic.c_str(),
                               static_cast<int>(payload.bytes.size()),
                               payload.bytes.data(),
                               config_.qos,
                               false);

    if (rc != MOSQ_ERR_SUCCESS) {
        lock.unlock();
        LOG_EVERY_N(WARNING, 10) << "MQTT publish failed: " << mosquitto_strerror(rc);
        record_failure();
        std::string reason = std::string("mosquitto: ") + mosquitto_strerror(rc);
        return classify_mosquitto_error(rc) == SendStatus::Fatal
            ? SendResult::fatal(reason)
            : SendResult::retryable(reason);
    }

    if (config_.qos > 0) {
        SendResult acked = wait_for_ack(lock, mid);
        if (!acked.ok()) {
            lock.unlock();
            record_failure();
            return acked;
        }
    }
    lock.unlock();

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.batches_sent++;
        stats_.messages_sent += batch.message_count();
        stats_.bytes_sent += payload.bytes.size();
        stats_.last_send_timestamp_ns = now_ns();
    }

    VLOG(2) << "Published batch " << batch.id() << " to " << config_.topic
            << " (" << batch.message_count() << " messages, " << payload.encoded_size
            << " -> " << payload.bytes.size() << " bytes, " << to_string(payload.codec) << ")";
    return SendResult::success();
}

SendResult MqttPublishTransport::wait_for_ack(std::unique_lock<std::mutex>& lock, int mid) {
    awaiting_.insert(mid);
    bool done = acks_cv_.wait_for(lock, config_.ack_timeout, [this, mid] {
        return acked_.count(mid) > 0 || connection_state_ != ConnectionState::Connected;
    });

    bool acked = acked_.erase(mid) > 0;
    awaiting_.erase(mid);

    if (acked) {
        return SendResult::success();
    }
    if (done) {
        return SendResult::retryable("connection lost before acknowledgement");
    }
    return SendResult::retryable("no acknowledgement within " +
                                 std::to_string(config_.ack_timeout.count()) + "ms");
}

void MqttPublishTransport::record_failure() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.batches_failed++;
}

bool MqttPublishTransport::healthy() const {
    return running_ && connection_state_ == ConnectionState::Connected;
}

TransportStats MqttPublishTransport::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

CompressionStats MqttPublishTransport::compression_stats() const {
    return compressor_ ? compressor_->stats() : CompressionStats{};
}

// =============================================================================
// Mosquitto Callbacks
// =============================================================================

void MqttPublishTransport::on_connect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttPublishTransport*>(obj);

    if (rc == 0) {
        self->connection_state_ = ConnectionState::Connected;
        LOG(INFO) << "MqttPublishTransport connected to broker";
    } else {
        self->connection_state_ = ConnectionState::Disconnected;
        LOG(WARNING) << "MQTT connection failed: " << mosquitto_connack_string(rc);
    }
}

void MqttPublishTransport::on_disconnect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttPublishTransport*>(obj);

    if (self->running_) {
        self->connection_state_ = ConnectionState::Reconnecting;
    } else {
        self->connection_state_ = ConnectionState::Disconnected;
    }

    if (rc != 0) {
        LOG(WARNING) << "MQTT unexpected disconnect: " << mosquitto_strerror(rc);
    }

    // Wake senders waiting on a PUBACK that will not come
    std::lock_guard<std::mutex> lock(self->acks_mutex_);
    self->acks_cv_.notify_all();
}

void MqttPublishTransport::on_publish(struct mosquitto*, void* obj, int mid) {
    auto* self = static_cast<MqttPublishTransport*>(obj);

    std::lock_guard<std::mutex> lock(self->acks_mutex_);
    if (self->awaiting_.count(mid) > 0) {
        self->acked_.insert(mid);
        self->acks_cv_.notify_all();
    }
}

}  // namespace pubbatch
