// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file mqtt_publish_transport_test.cpp
/// @brief MQTT transport behavior that needs no broker

#include "pubbatch/batch.hpp"
#include "pubbatch/mqtt_publish_transport.hpp"

#include <gtest/gtest.h>
#include <mosquitto.h>

namespace pubbatch::test {

// =============================================================================
// Error classification
// =============================================================================

TEST(ClassifyMosquittoErrorTest, Success) {
    EXPECT_EQ(classify_mosquitto_error(MOSQ_ERR_SUCCESS), SendStatus::Ok);
}

TEST(ClassifyMosquittoErrorTest, TransientErrorsAreRetryable) {
    for (int rc : {MOSQ_ERR_NO_CONN, MOSQ_ERR_CONN_LOST, MOSQ_ERR_NOMEM, MOSQ_ERR_ERRNO}) {
        EXPECT_EQ(classify_mosquitto_error(rc), SendStatus::Retryable)
            << mosquitto_strerror(rc);
    }
}

TEST(ClassifyMosquittoErrorTest, PermanentErrorsAreFatal) {
    for (int rc : {MOSQ_ERR_PAYLOAD_SIZE, MOSQ_ERR_OVERSIZE_PACKET, MOSQ_ERR_INVAL,
                   MOSQ_ERR_PROTOCOL, MOSQ_ERR_MALFORMED_UTF8, MOSQ_ERR_NOT_SUPPORTED}) {
        EXPECT_EQ(classify_mosquitto_error(rc), SendStatus::Fatal)
            << mosquitto_strerror(rc);
    }
}

TEST(ClassifyMosquittoErrorTest, UnknownCodeIsRetryable) {
    EXPECT_EQ(classify_mosquitto_error(9999), SendStatus::Retryable);
}

// =============================================================================
// Transport without a broker
// =============================================================================

class MqttPublishTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.broker_host = "localhost";
        config_.broker_port = 1883;
        config_.client_id = "pubbatch_test";
        config_.topic = "projects/p/topics/t";
    }

    MqttPublishTransportConfig config_;
};

TEST_F(MqttPublishTransportTest, NameAndTopic) {
    MqttPublishTransport transport(config_);
    EXPECT_EQ(transport.name(), "mqtt");
    EXPECT_EQ(transport.topic(), "projects/p/topics/t");
    EXPECT_EQ(transport.connection_state(), ConnectionState::Disconnected);
}

TEST_F(MqttPublishTransportTest, StartRequiresTopic) {
    config_.topic.clear();
    MqttPublishTransport transport(config_);
    EXPECT_FALSE(transport.start());
    EXPECT_FALSE(transport.healthy());
}

TEST_F(MqttPublishTransportTest, SendBeforeStartIsRetryable) {
    MqttPublishTransport transport(config_);

    Batch batch(1);
    batch.append(MessageBuilder::build("x", Attributes{}));

    SendResult result = transport.send(batch, 1);
    EXPECT_EQ(result.status, SendStatus::Retryable);
    EXPECT_FALSE(result.reason.empty());
    EXPECT_EQ(transport.stats().batches_failed, 1u);
    EXPECT_EQ(transport.stats().batches_sent, 0u);
}

TEST_F(MqttPublishTransportTest, CompressionStatsEmptyBeforeStart) {
    config_.compression.codec = Codec::Zstd;
    MqttPublishTransport transport(config_);

    CompressionStats stats = transport.compression_stats();
    EXPECT_EQ(stats.batches_compressed, 0u);
    EXPECT_EQ(stats.bytes_in, 0u);
}

TEST_F(MqttPublishTransportTest, StopWithoutStartIsSafe) {
    MqttPublishTransport transport(config_);
    transport.stop();
    transport.stop();
    EXPECT_FALSE(transport.healthy());
}

TEST(SendResultTest, Factories) {
    EXPECT_TRUE(SendResult::success().ok());
    EXPECT_EQ(SendResult::retryable("r").status, SendStatus::Retryable);
    EXPECT_EQ(SendResult::fatal("f").reason, "f");
    EXPECT_STREQ(to_string(SendStatus::Fatal), "fatal");
}

}  // namespace pubbatch::test
