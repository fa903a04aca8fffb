// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "stdin_events.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <utility>

namespace pubbatch {
namespace forwarder {

const char* to_string(EventFormat format) {
    switch (format) {
        case EventFormat::Json: return "json";
        case EventFormat::Raw: return "raw";
    }
    return "unknown";
}

std::optional<EventFormat> event_format_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "json") return EventFormat::Json;
    if (lower == "raw") return EventFormat::Raw;
    return std::nullopt;
}

// ============================================================================
// LineSplitter
// ============================================================================

std::vector<std::string> LineSplitter::feed(const char* data, size_t size) {
    pending_.append(data, size);

    std::vector<std::string> lines;
    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        size_t end = newline;
        if (end > start && pending_[end - 1] == '\r') {
            --end;
        }
        if (end > start) {
            lines.emplace_back(pending_, start, end - start);
        }
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::string LineSplitter::finish() {
    std::string rest = std::move(pending_);
    pending_.clear();
    if (!rest.empty() && rest.back() == '\r') {
        rest.pop_back();
    }
    return rest;
}

// ============================================================================
// Events
// ============================================================================

std::string iso8601_utc(std::chrono::system_clock::time_point at) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch());
    std::time_t secs = static_cast<std::time_t>(ms.count() / 1000);
    int millis = static_cast<int>(ms.count() % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", millis);
    return buf;
}

std::string event_payload(const std::string& line, EventFormat format,
                          std::chrono::system_clock::time_point at) {
    if (format == EventFormat::Raw) {
        return line;
    }

    nlohmann::json event = nlohmann::json::parse(line, nullptr, false);
    if (!event.is_object()) {
        event = nlohmann::json::object();
        event["message"] = line;
    }
    if (!event.contains("@timestamp")) {
        event["@timestamp"] = iso8601_utc(at);
    }
    if (!event.contains("@version")) {
        event["@version"] = "1";
    }
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace forwarder
}  // namespace pubbatch
