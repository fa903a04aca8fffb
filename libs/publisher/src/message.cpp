// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/message.hpp"
#include "pubbatch/wire_codec.hpp"

#include <utility>

namespace pubbatch {

Message::Message(std::string payload, Attributes attributes)
    : payload_(std::move(payload))
    , attributes_(std::move(attributes))
    , byte_size_(encoded_message_size(payload_, attributes_)) {
}

Attributes MessageBuilder::to_attributes(const nlohmann::json& attributes) {
    Attributes result;
    if (attributes.is_null()) {
        return result;
    }

    if (!attributes.is_object()) {
        throw ValidationError("", std::string("attributes must be a key/value map, got ") +
                                      attributes.type_name());
    }

    // JSON object keys are always strings; only values need checking
    for (const auto& [key, value] : attributes.items()) {
        if (!value.is_string()) {
            throw ValidationError(key, "attribute '" + key + "' must be a string, got " +
                                           value.type_name());
        }
        result.emplace(key, value.get<std::string>());
    }
    return result;
}

Message MessageBuilder::build(std::string payload, const nlohmann::json& attributes) {
    return Message(std::move(payload), to_attributes(attributes));
}

Message MessageBuilder::build(std::string payload, Attributes attributes) {
    return Message(std::move(payload), std::move(attributes));
}

}  // namespace pubbatch
