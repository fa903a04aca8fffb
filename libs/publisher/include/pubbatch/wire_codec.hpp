// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file wire_codec.hpp
/// @brief Protobuf encoding of messages and batches
///
/// Wire format (pubsub_batch.proto):
/// - PubsubMessage: data + attributes map
/// - PublishRequest: topic, messages in publish order, batch id, attempt

#include "pubbatch/message.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pubbatch {

class Batch;

/// Exact serialized size of a PubsubMessage with this payload and attributes
size_t encoded_message_size(const std::string& payload, const Attributes& attributes);

/// Serialize a batch into a PublishRequest
/// @param topic Full topic name ("projects/{project}/topics/{topic}")
/// @param batch Batch to encode; message order is preserved
/// @param attempt Delivery attempt (1-based), carried for receiver-side dedup
std::vector<uint8_t> encode_batch(const std::string& topic, const Batch& batch,
                                  uint32_t attempt = 1);

}  // namespace pubbatch
