// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file message.hpp
/// @brief Outbound message record and its validating builder
///
/// A Message is immutable once built. Its byte size is computed once, at
/// build time, as the exact serialized size of the wire record (payload plus
/// serialized attributes), so batch totals never need re-estimation.

#include "pubbatch/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace pubbatch {

/// Validated attribute map. Keys are unique.
using Attributes = std::map<std::string, std::string>;

/// Immutable outbound message
class Message {
public:
    const std::string& payload() const { return payload_; }
    const Attributes& attributes() const { return attributes_; }

    /// Exact serialized size in bytes (payload + attributes)
    size_t byte_size() const { return byte_size_; }

private:
    friend class MessageBuilder;

    Message(std::string payload, Attributes attributes);

    std::string payload_;
    Attributes attributes_;
    size_t byte_size_ = 0;
};

/// Builds messages from host-supplied data.
///
/// Example:
/// @code
///   auto msg = MessageBuilder::build(event.dump(), {{"origin", "edge"}});
///   MessageBuilder::build("", nlohmann::json{{"k", 123}});  // throws ValidationError("k")
/// @endcode
class MessageBuilder {
public:
    /// Build from loosely-typed attributes (JSON object, or null for none).
    /// @throws ValidationError if attributes is not an object or any value
    ///         is not a string; the error names the offending key
    static Message build(std::string payload, const nlohmann::json& attributes);

    /// Build from an already string-typed attribute map
    static Message build(std::string payload, Attributes attributes);

    /// Validate loosely-typed attributes and convert them to an Attributes map
    /// @throws ValidationError
    static Attributes to_attributes(const nlohmann::json& attributes);
};

}  // namespace pubbatch
