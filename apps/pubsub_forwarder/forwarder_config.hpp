// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file forwarder_config.hpp
/// @brief YAML configuration for the pubsub_forwarder application
///
/// Example:
/// @code
///   destination:
///     project_id: my-project
///     topic: edge-events
///     json_key_file: /etc/pubsub/key.json
///   batching:
///     request_byte_threshold: 1000000
///     delay_threshold_secs: 5
///     message_count_threshold: 100
///   attributes:
///     origin: edge
///   retry:
///     max_attempts: 5
///   mqtt:
///     broker: localhost
///     port: 1883
///   compression:
///     type: zstd
///     min_batch_bytes: 512
///   input:
///     format: json
/// @endcode

#include "pubbatch/batch_publisher.hpp"
#include "pubbatch/mqtt_publish_transport.hpp"
#include "stdin_events.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

namespace pubbatch {
namespace forwarder {

/// Where batches go
struct DestinationConfig {
    std::string project_id;
    std::string topic;

    /// JSON file holding broker credentials ({"username": ..., "password": ...})
    std::string json_key_file;

    /// "projects/{project_id}/topics/{topic}"
    std::string full_topic() const;
};

struct ForwarderConfig {
    DestinationConfig destination;
    PublisherOptions publisher;
    MqttPublishTransportConfig mqtt;
    EventFormat event_format = EventFormat::Json;

    /// Transport config bound to the destination topic, with key file
    /// credentials applied
    /// @throws ConfigError if the key file cannot be read
    MqttPublishTransportConfig transport_config() const;

    /// Longest accepted shutdown_grace and ack_timeout, and the longest
    /// total shutdown drain
    static constexpr std::chrono::milliseconds kMaxWait{60 * 60 * 1000};

    /// @throws ConfigError on missing destination, broken thresholds or
    ///         out-of-range durations and ports
    void validate() const;
};

/// Convert the `attributes` section to JSON, keeping each plain scalar's
/// YAML type (123 -> integer, true -> boolean, ~ -> null). Quoted scalars
/// stay strings.
/// @throws ValidationError on a non-string key
/// @throws ConfigError if the section is not a map
nlohmann::json attributes_from_yaml(const YAML::Node& node);

/// @throws ConfigError on malformed values
ForwarderConfig config_from_yaml(const YAML::Node& root);

/// @throws ConfigError if the file cannot be read or parsed
ForwarderConfig load_config(const std::string& path);

}  // namespace forwarder
}  // namespace pubbatch
