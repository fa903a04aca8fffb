// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Exceptions raised synchronously to the host
///
/// Transport failures are never thrown; they are retried and reported
/// through the publisher's dropped-batch callback instead.

#include <stdexcept>
#include <string>

namespace pubbatch {

/// Attribute map is not a string:string map.
///
/// Raised by MessageBuilder::build(), by BatchPublisher::publish() and by the
/// startup self-test in BatchPublisher::start().
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& key, const std::string& message)
        : std::runtime_error(message), key_(key) {}

    /// Offending attribute key (empty if the attribute container itself is invalid)
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/// Invalid or unreadable configuration (thresholds, retry policy, YAML file)
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace pubbatch
