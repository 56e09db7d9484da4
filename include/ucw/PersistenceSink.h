//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PersistenceSink.h
// Purpose: Persistence sink interface and session statistics
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <string>

#include "ucw/CaptureEvent.h"

namespace ucw {

//==========================================================================================================
// SessionStats
// Purpose: Per-session counters kept by a sink.
//==========================================================================================================
struct SessionStats {
    std::string sessionId;
    std::string platform;
    uint64_t eventCount{0};
    int64_t turnCount{0};
    uint64_t bytesCaptured{0};
    std::map<std::string, uint64_t> topics;
    std::map<std::string, uint64_t> gutSignals;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// IPersistenceSink
// Purpose: Durable (best-effort) storage for capture events.
// Methods:
//   Store(event): Persist one event; the future completes (or carries the failure) when done.
//                 The CaptureEngine calls Store from a single ordered worker, one event at a time.
//   GetSessionStats(): Snapshot of the current session counters.
//   Close(): Finalize the session and release resources. Idempotent.
//==========================================================================================================
class IPersistenceSink {
public:
    virtual ~IPersistenceSink() = default;
    virtual std::future<void> Store(const CaptureEvent& event) = 0;
    virtual SessionStats GetSessionStats() const = 0;
    virtual std::future<void> Close() = 0;
};

// Counts event payloads into stats (bytes, turns, light_layer.topic, instinct_layer.gut_signal).
void AccumulateSessionStats(SessionStats& stats, const CaptureEvent& event);

// "mcp-<epoch seconds>"
std::string MakeSessionId();

} // namespace ucw
