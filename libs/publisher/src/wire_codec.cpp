// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/wire_codec.hpp"
#include "pubbatch/batch.hpp"
#include "pubsub_batch.pb.h"

#include <chrono>

namespace pubbatch {

namespace {

void fill_message(const std::string& payload, const Attributes& attributes,
                  wire::PubsubMessage* out) {
    out->set_data(payload);
    auto* map = out->mutable_attributes();
    for (const auto& [key, value] : attributes) {
        (*map)[key] = value;
    }
}

}  // namespace

size_t encoded_message_size(const std::string& payload, const Attributes& attributes) {
    wire::PubsubMessage msg;
    fill_message(payload, attributes, &msg);
    return msg.ByteSizeLong();
}

std::vector<uint8_t> encode_batch(const std::string& topic, const Batch& batch,
                                  uint32_t attempt) {
    wire::PublishRequest request;
    request.set_topic(topic);
    request.set_batch_id(batch.id());
    request.set_attempt(attempt);
    request.set_sent_at_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    for (const auto& message : batch.messages()) {
        fill_message(message.payload(), message.attributes(), request.add_messages());
    }

    std::string serialized;
    request.SerializeToString(&serialized);
    return std::vector<uint8_t>(serialized.begin(), serialized.end());
}

}  // namespace pubbatch
