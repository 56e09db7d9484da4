//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PersistenceSink.cpp
// Purpose: Session statistics helpers shared by persistence sinks
//==========================================================================================================

#include <chrono>

#include "ucw/PersistenceSink.h"

namespace ucw {

namespace {
JSONValue countsToJSON(const std::map<std::string, uint64_t>& counts) {
    JSONValue::Object obj;
    for (const auto& [key, count] : counts) {
        obj[key] = std::make_shared<JSONValue>(static_cast<int64_t>(count));
    }
    return JSONValue{obj};
}
} // namespace

JSONValue SessionStats::ToJSON() const {
    return MakeObject({
        {"session_id", JSONValue(sessionId)},
        {"platform", JSONValue(platform)},
        {"event_count", JSONValue(static_cast<int64_t>(eventCount))},
        {"turn_count", JSONValue(turnCount)},
        {"bytes_captured", JSONValue(static_cast<int64_t>(bytesCaptured))},
        {"topics", countsToJSON(topics)},
        {"gut_signals", countsToJSON(gutSignals)}
    });
}

void AccumulateSessionStats(SessionStats& stats, const CaptureEvent& event) {
    ++stats.eventCount;
    stats.bytesCaptured += event.contentLength;
    if (event.turn > stats.turnCount) {
        stats.turnCount = event.turn;
    }
    if (event.lightLayer.has_value()) {
        if (auto topic = GetString(event.lightLayer.value(), "topic")) {
            ++stats.topics[topic.value()];
        }
    }
    if (event.instinctLayer.has_value()) {
        if (auto gut = GetString(event.instinctLayer.value(), "gut_signal")) {
            ++stats.gutSignals[gut.value()];
        }
    }
}

std::string MakeSessionId() {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "mcp-" + std::to_string(secs);
}

} // namespace ucw
