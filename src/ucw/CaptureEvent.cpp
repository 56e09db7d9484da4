//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureEvent.cpp
// Purpose: Capture event wire names and serialization
//==========================================================================================================

#include <chrono>

#include "ucw/CaptureEvent.h"

namespace ucw {

int64_t NowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* DirectionName(Direction d) {
    return d == Direction::Inbound ? "in" : "out";
}

const char* StageName(Stage s) {
    return s == Stage::Received ? "received" : "sent";
}

Stage StageForDirection(Direction d) {
    return d == Direction::Inbound ? Stage::Received : Stage::Sent;
}

JSONValue CaptureEvent::ToJSON() const {
    JSONValue::Object obj;
    obj["event_id"] = std::make_shared<JSONValue>(eventId);
    obj["timestamp_ns"] = std::make_shared<JSONValue>(timestampNs);
    obj["direction"] = std::make_shared<JSONValue>(DirectionName(direction));
    obj["stage"] = std::make_shared<JSONValue>(StageName(stage));
    obj["method"] = std::make_shared<JSONValue>(method);
    obj["request_id"] = requestId.has_value() ? std::make_shared<JSONValue>(requestId.value()) : std::make_shared<JSONValue>(nullptr);
    obj["parent_protocol_id"] = parentEventId.has_value() ? std::make_shared<JSONValue>(parentEventId.value()) : std::make_shared<JSONValue>(nullptr);
    obj["turn"] = std::make_shared<JSONValue>(turn);
    obj["content_length"] = std::make_shared<JSONValue>(static_cast<int64_t>(contentLength));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    }
    if (dataLayer.has_value()) {
        obj["data_layer"] = std::make_shared<JSONValue>(dataLayer.value());
    }
    if (lightLayer.has_value()) {
        obj["light_layer"] = std::make_shared<JSONValue>(lightLayer.value());
    }
    if (instinctLayer.has_value()) {
        obj["instinct_layer"] = std::make_shared<JSONValue>(instinctLayer.value());
    }
    if (coherenceSignature.has_value()) {
        obj["coherence_signature"] = std::make_shared<JSONValue>(coherenceSignature.value());
    }
    return JSONValue{obj};
}

} // namespace ucw
