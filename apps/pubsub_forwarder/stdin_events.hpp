// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file stdin_events.hpp
/// @brief Turns newline-delimited input into event payloads

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pubbatch {
namespace forwarder {

/// Payload shape for each input line
enum class EventFormat {
    Json,   ///< {"message": line, "@timestamp": ..., "@version": "1"}
    Raw     ///< the line itself
};

const char* to_string(EventFormat format);
std::optional<EventFormat> event_format_from_string(const std::string& name);

/// Splits a byte stream into lines.
///
/// Accepts LF and CRLF endings; blank lines are skipped.
class LineSplitter {
public:
    /// Append a chunk of input
    /// @return Lines completed by this chunk, without their line ending
    std::vector<std::string> feed(const char* data, size_t size);

    /// Trailing text with no final newline, at end of input (may be empty)
    std::string finish();

private:
    std::string pending_;
};

/// "2025-01-01T12:00:00.123Z"
std::string iso8601_utc(std::chrono::system_clock::time_point at);

/// Build the payload for one input line.
///
/// In Json format a line that already holds a JSON object is kept as the
/// event, gaining "@timestamp" and "@version" if absent; any other line
/// becomes the "message" field. Invalid UTF-8 is replaced, never rejected.
std::string event_payload(const std::string& line, EventFormat format,
                          std::chrono::system_clock::time_point at);

}  // namespace forwarder
}  // namespace pubbatch
