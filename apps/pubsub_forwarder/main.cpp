// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief pubsub_forwarder - batches newline-delimited events from stdin
///        and publishes them to a pub/sub topic over MQTT
///
/// Architecture:
///   stdin lines -> JSON events -> BatchPublisher -> MqttPublishTransport -> MQTT broker
///
/// Usage:
///   pubsub_forwarder --config=config/pubsub_forwarder.yaml
///   tail -F events.log | pubsub_forwarder --project_id=p --topic=t --broker=10.0.0.2
///
/// Exit codes: 0 clean drain, 1 messages dropped or transport failure,
/// 2 configuration or attribute validation error.

#include "forwarder_config.hpp"
#include "stdin_events.hpp"

#include "pubbatch/batch_publisher.hpp"
#include "pubbatch/errors.hpp"
#include "pubbatch/mqtt_publish_transport.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>

// Command line flags
DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(broker, "", "MQTT broker host (overrides config)");
DEFINE_int32(port, 0, "MQTT broker port (overrides config, 0=keep)");
DEFINE_string(project_id, "", "Destination project id (overrides config)");
DEFINE_string(topic, "", "Destination topic (overrides config)");
DEFINE_int32(stats_interval, 30, "Statistics logging interval in seconds (0=disabled)");

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

pubbatch::forwarder::ForwarderConfig build_config() {
    pubbatch::forwarder::ForwarderConfig config;
    if (!FLAGS_config.empty()) {
        config = pubbatch::forwarder::load_config(FLAGS_config);
    }

    if (!FLAGS_broker.empty()) config.mqtt.broker_host = FLAGS_broker;
    if (FLAGS_port > 0) config.mqtt.broker_port = FLAGS_port;
    if (!FLAGS_project_id.empty()) config.destination.project_id = FLAGS_project_id;
    if (!FLAGS_topic.empty()) config.destination.topic = FLAGS_topic;

    config.validate();
    return config;
}

void log_config(const pubbatch::forwarder::ForwarderConfig& config) {
    const auto& t = config.publisher.thresholds;
    LOG(INFO) << "=== pubsub_forwarder Configuration ===";
    LOG(INFO) << "Topic: " << config.destination.full_topic();
    LOG(INFO) << "MQTT Broker: " << config.mqtt.broker_host << ":" << config.mqtt.broker_port;
    LOG(INFO) << "Batching: " << t.max_count << " messages, " << t.max_bytes << " bytes, "
              << t.max_delay.count() << "ms delay";
    LOG(INFO) << "Retry: " << config.publisher.retry.max_attempts << " attempts, backoff "
              << config.publisher.retry.initial_backoff.count() << "-"
              << config.publisher.retry.max_backoff.count() << "ms";
    LOG(INFO) << "Static attributes: " << config.publisher.static_attributes.dump();
    LOG(INFO) << "Input format: " << to_string(config.event_format);
}

void log_stats(const char* label, const pubbatch::BatchPublisher& publisher) {
    pubbatch::PublisherStats stats = publisher.stats();
    pubbatch::TransportStats sent = publisher.transport_stats();
    LOG(INFO) << label
              << " accepted=" << stats.messages_accepted
              << " delivered=" << stats.messages_delivered
              << " dropped=" << stats.messages_dropped
              << " batches=" << stats.batches_flushed
              << " acked=" << stats.batches_acknowledged
              << " retries=" << stats.retries
              << " wire_bytes=" << sent.bytes_sent
              << " transport=" << (publisher.transport_healthy() ? "up" : "down");
}

void publish_line(pubbatch::BatchPublisher& publisher, pubbatch::forwarder::EventFormat format,
                  const std::string& line) {
    VLOG(1) << "Event: " << line;
    if (!publisher.publish(pubbatch::forwarder::event_payload(line, format,
                                                              std::chrono::system_clock::now()))) {
        LOG_EVERY_N(WARNING, 100) << "Event rejected, publisher is not running";
    }
}

/// Splits stdin into lines and publishes each one; returns on EOF or shutdown
void forward_stdin(pubbatch::BatchPublisher& publisher, pubbatch::forwarder::EventFormat format) {
    pubbatch::forwarder::LineSplitter splitter;
    char buffer[4096];
    auto last_stats_time = std::chrono::steady_clock::now();

    while (!g_shutdown) {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int rc = poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            PLOG(ERROR) << "poll on stdin failed";
            return;
        }

        if (rc > 0) {
            ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                PLOG(ERROR) << "read on stdin failed";
                return;
            }
            if (n == 0) {
                std::string tail = splitter.finish();
                if (!tail.empty()) {
                    publish_line(publisher, format, tail);
                }
                LOG(INFO) << "End of input";
                return;
            }

            for (const auto& line : splitter.feed(buffer, static_cast<size_t>(n))) {
                publish_line(publisher, format, line);
            }
        }

        if (FLAGS_stats_interval > 0) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_stats_time).count();
            if (elapsed >= FLAGS_stats_interval) {
                log_stats("Publisher stats:", publisher);
                last_stats_time = now;
            }
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Initialize logging and flags
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("pubsub_forwarder - batches stdin events to a pub/sub topic over MQTT");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        pubbatch::forwarder::ForwarderConfig config = build_config();
        log_config(config);

        auto transport = std::make_unique<pubbatch::MqttPublishTransport>(config.transport_config());
        pubbatch::BatchPublisher publisher(std::move(transport), config.publisher);

        publisher.on_batch_dropped([](const pubbatch::DroppedBatch& dropped) {
            LOG(ERROR) << "Lost " << dropped.message_count << " message(s) from batch "
                       << dropped.batch_id << ": " << dropped.reason;
        });

        if (!publisher.start()) {
            LOG(ERROR) << "Failed to start publisher";
            return 1;
        }

        LOG(INFO) << "Forwarding stdin. Press Ctrl+C to stop.";
        forward_stdin(publisher, config.event_format);

        LOG(INFO) << "Shutting down publisher...";
        pubbatch::ShutdownResult result = publisher.shutdown();
        pubbatch::PublisherStats stats = publisher.stats();
        log_stats("Final stats:", publisher);

        if (result.timed_out) {
            LOG(WARNING) << "Shutdown drain exceeded its bound";
        }
        if (!result.ok()) {
            LOG(ERROR) << "Shutdown dropped " << result.dropped_messages << " message(s) in "
                       << result.dropped_batches << " batch(es)";
            return 1;
        }
        if (stats.messages_dropped > 0) {
            LOG(ERROR) << stats.messages_dropped << " message(s) were dropped while running";
            return 1;
        }
    } catch (const pubbatch::ValidationError& e) {
        LOG(ERROR) << "Invalid attributes: " << e.what();
        return 2;
    } catch (const pubbatch::ConfigError& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
        return 2;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        return 1;
    }

    LOG(INFO) << "pubsub_forwarder stopped";
    return 0;
}
