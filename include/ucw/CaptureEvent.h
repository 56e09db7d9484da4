//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureEvent.h
// Purpose: Record of one frame observed at the transport boundary
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ucw/JSONRPCTypes.h"

namespace ucw {

enum class Direction {
    Inbound,
    Outbound
};

enum class Stage {
    Received,
    Sent
};

// Wire names: "in"/"out" and "received"/"sent".
const char* DirectionName(Direction d);
const char* StageName(Stage s);
Stage StageForDirection(Direction d);

// Current wall-clock time in nanoseconds since the Unix epoch.
int64_t NowNs();

//==========================================================================================================
// CaptureEvent
// Purpose: One frame observed at one transport boundary.
// Fields:
//   eventId: 16 hex chars, unique within the process.
//   timestampNs: Wall-clock nanoseconds since the Unix epoch.
//   method: Originating method name; empty for responses.
//   requestId: Stringified correlation id (frame id, or the id supplied by the writer).
//   parentEventId: eventId of the inbound request this outbound frame answers.
//   turn: Assigned once at capture; 0 when the frame is not part of a turn.
//   contentLength: Raw byte length.
//   dataLayer/lightLayer/instinctLayer/coherenceSignature: Attached by an enrichment hook.
//==========================================================================================================
struct CaptureEvent {
    std::string eventId;
    int64_t timestampNs{0};
    Direction direction{Direction::Inbound};
    Stage stage{Stage::Received};
    std::string method;
    std::optional<std::string> requestId;
    std::optional<std::string> parentEventId;
    int64_t turn{0};
    std::size_t contentLength{0};
    std::string rawBytes;
    JSONValue frame;
    std::optional<std::string> error;

    std::optional<JSONValue> dataLayer;
    std::optional<JSONValue> lightLayer;
    std::optional<JSONValue> instinctLayer;
    std::optional<std::string> coherenceSignature;

    // Diagnostic/persistence form. Raw bytes and the decoded frame are not included.
    JSONValue ToJSON() const;
};

} // namespace ucw
