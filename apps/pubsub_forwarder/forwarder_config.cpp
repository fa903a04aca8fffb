// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "forwarder_config.hpp"

#include "pubbatch/errors.hpp"

#include <glog/logging.h>

#include <cmath>
#include <fstream>
#include <optional>
#include <string>

namespace pubbatch {
namespace forwarder {

namespace {

const char* const kStrTag = "tag:yaml.org,2002:str";

bool is_quoted(const YAML::Node& node) {
    return node.Tag() == "!" || node.Tag() == kStrTag;
}

bool is_null_scalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> bool_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    if (is_quoted(node)) {
        return s;
    }
    if (is_null_scalar(s)) {
        return nullptr;
    }
    if (auto b = bool_scalar(s)) {
        return *b;
    }

    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
    }
    double d;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return s;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : node) {
                out.push_back(yaml_to_json(item));
            }
            return out;
        }
        case YAML::NodeType::Map: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& kv : node) {
                out[kv.first.Scalar()] = yaml_to_json(kv.second);
            }
            return out;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

/// A plain key YAML would type as anything but a string
bool is_string_key(const YAML::Node& key) {
    if (!key.IsScalar()) {
        return false;
    }
    return scalar_to_json(key).is_string();
}

}  // namespace

std::string DestinationConfig::full_topic() const {
    return "projects/" + project_id + "/topics/" + topic;
}

MqttPublishTransportConfig ForwarderConfig::transport_config() const {
    MqttPublishTransportConfig config = mqtt;
    config.topic = destination.full_topic();

    if (destination.json_key_file.empty()) {
        return config;
    }

    std::ifstream file(destination.json_key_file);
    if (!file.is_open()) {
        throw ConfigError("Cannot open key file: " + destination.json_key_file);
    }

    try {
        nlohmann::json key = nlohmann::json::parse(file);
        if (key.contains("username")) {
            config.username = key["username"].get<std::string>();
        }
        if (key.contains("password")) {
            config.password = key["password"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid key file " + destination.json_key_file + ": " + e.what());
    }

    LOG(INFO) << "Loaded broker credentials from " << destination.json_key_file;
    return config;
}

void ForwarderConfig::validate() const {
    if (destination.project_id.empty()) {
        throw ConfigError("destination.project_id is required");
    }
    if (destination.topic.empty()) {
        throw ConfigError("destination.topic is required");
    }
    publisher.thresholds.validate();
    publisher.retry.validate();
    if (publisher.worker_threads < 1) {
        throw ConfigError("dispatch.worker_threads must be >= 1");
    }
    if (publisher.shutdown_grace.count() < 0 || publisher.shutdown_grace > kMaxWait) {
        throw ConfigError("dispatch.shutdown_grace_ms must be between 0 and " +
                          std::to_string(kMaxWait.count()));
    }
    if (publisher.retry.max_backoff > kMaxWait ||
        publisher.retry.total_backoff() + publisher.shutdown_grace > kMaxWait) {
        throw ConfigError("retry backoff plus shutdown grace must not exceed " +
                          std::to_string(kMaxWait.count()) + "ms");
    }
    if (mqtt.broker_port < 1 || mqtt.broker_port > 65535) {
        throw ConfigError("mqtt.port must be between 1 and 65535");
    }
    if (mqtt.qos < 0 || mqtt.qos > 2) {
        throw ConfigError("mqtt.qos must be 0, 1 or 2");
    }
    if (mqtt.ack_timeout.count() <= 0 || mqtt.ack_timeout > kMaxWait) {
        throw ConfigError("mqtt.ack_timeout_ms must be between 1 and " +
                          std::to_string(kMaxWait.count()));
    }
}

nlohmann::json attributes_from_yaml(const YAML::Node& node) {
    nlohmann::json out = nlohmann::json::object();
    if (!node || node.IsNull()) {
        return out;
    }
    if (!node.IsMap()) {
        throw ConfigError("attributes must be a map");
    }

    for (const auto& kv : node) {
        if (!is_string_key(kv.first)) {
            std::string key = kv.first.IsScalar() ? kv.first.Scalar() : "";
            throw ValidationError(key, "attribute key '" + key + "' must be a string");
        }
        out[kv.first.Scalar()] = yaml_to_json(kv.second);
    }
    return out;
}

ForwarderConfig config_from_yaml(const YAML::Node& root) {
    ForwarderConfig config;

    try {
        if (auto dest = root["destination"]) {
            if (dest["project_id"]) config.destination.project_id = dest["project_id"].as<std::string>();
            if (dest["topic"]) config.destination.topic = dest["topic"].as<std::string>();
            if (dest["json_key_file"]) config.destination.json_key_file = dest["json_key_file"].as<std::string>();
        }

        if (auto batch = root["batching"]) {
            Thresholds& t = config.publisher.thresholds;
            if (batch["request_byte_threshold"]) t.max_bytes = batch["request_byte_threshold"].as<size_t>();
            if (batch["message_count_threshold"]) t.max_count = batch["message_count_threshold"].as<size_t>();
            if (batch["delay_threshold_secs"]) {
                double secs = batch["delay_threshold_secs"].as<double>();
                double limit = Thresholds::kMaxDelayLimit.count() / 1000.0;
                if (!std::isfinite(secs) || secs > limit) {
                    throw ConfigError("batching.delay_threshold_secs must be at most " +
                                      std::to_string(static_cast<int64_t>(limit)));
                }
                t.max_delay = std::chrono::milliseconds(std::llround(secs * 1000.0));
            }
        }

        config.publisher.static_attributes = attributes_from_yaml(root["attributes"]);

        if (auto retry = root["retry"]) {
            RetryPolicy& r = config.publisher.retry;
            if (retry["max_attempts"]) r.max_attempts = retry["max_attempts"].as<uint32_t>();
            if (retry["initial_backoff_ms"]) {
                r.initial_backoff = std::chrono::milliseconds(retry["initial_backoff_ms"].as<int64_t>());
            }
            if (retry["max_backoff_ms"]) {
                r.max_backoff = std::chrono::milliseconds(retry["max_backoff_ms"].as<int64_t>());
            }
            if (retry["backoff_multiplier"]) r.backoff_multiplier = retry["backoff_multiplier"].as<double>();
        }

        if (auto dispatch = root["dispatch"]) {
            if (dispatch["worker_threads"]) {
                config.publisher.worker_threads = dispatch["worker_threads"].as<size_t>();
            }
            if (dispatch["shutdown_grace_ms"]) {
                config.publisher.shutdown_grace =
                    std::chrono::milliseconds(dispatch["shutdown_grace_ms"].as<int64_t>());
            }
        }

        if (auto mqtt = root["mqtt"]) {
            MqttPublishTransportConfig& m = config.mqtt;
            if (mqtt["broker"]) m.broker_host = mqtt["broker"].as<std::string>();
            if (mqtt["port"]) m.broker_port = mqtt["port"].as<int>();
            if (mqtt["client_id"]) m.client_id = mqtt["client_id"].as<std::string>();
            if (mqtt["username"]) m.username = mqtt["username"].as<std::string>();
            if (mqtt["password"]) m.password = mqtt["password"].as<std::string>();
            if (mqtt["keepalive"]) m.keepalive_sec = mqtt["keepalive"].as<int>();
            if (mqtt["qos"]) m.qos = mqtt["qos"].as<int>();
            if (mqtt["ack_timeout_ms"]) {
                m.ack_timeout = std::chrono::milliseconds(mqtt["ack_timeout_ms"].as<int64_t>());
            }
        }

        if (auto comp = root["compression"]) {
            CompressionOptions& c = config.mqtt.compression;
            if (comp["type"]) {
                std::string name = comp["type"].as<std::string>();
                auto codec = codec_from_string(name);
                if (!codec) {
                    throw ConfigError("Unknown compression type: " + name);
                }
                c.codec = *codec;
            }
            if (comp["level"]) c.level = comp["level"].as<int>();
            if (comp["min_batch_bytes"]) c.min_batch_bytes = comp["min_batch_bytes"].as<size_t>();
        }

        if (auto input = root["input"]) {
            if (input["format"]) {
                std::string name = input["format"].as<std::string>();
                auto format = event_format_from_string(name);
                if (!format) {
                    throw ConfigError("Unknown input format: " + name);
                }
                config.event_format = *format;
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

ForwarderConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config file " + path + ": " + e.what());
    }

    ForwarderConfig config = config_from_yaml(root);
    LOG(INFO) << "Loaded configuration from " << path;
    return config;
}

}  // namespace forwarder
}  // namespace pubbatch
