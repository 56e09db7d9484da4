//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SqlitePersistenceSink.hpp
// Purpose: SQLite capture store: one row per event, one row per session
//==========================================================================================================
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ucw/PersistenceSink.h"

namespace ucw {

//==========================================================================================================
// StoredEvent
// Purpose: A cognitive_events row as read back from the database.
//==========================================================================================================
struct StoredEvent {
    std::string eventId;
    std::string sessionId;
    int64_t timestampNs{0};
    std::string direction;
    std::string method;
    std::optional<std::string> requestId;
    std::optional<std::string> parentEventId;
    int64_t turn{0};
    uint64_t contentLength{0};
    std::string rawBytes;
    std::optional<std::string> parsedJson;
    std::optional<std::string> error;
    std::string platform;
    std::optional<std::string> topic;
    std::optional<std::string> intent;
    std::optional<std::string> summary;
    std::optional<std::string> gutSignal;
    std::optional<double> coherence;
};

//==========================================================================================================
// TimelineQuery
// Purpose: Filters for SqlitePersistenceSink::QueryTimeline. Unset filters match everything.
//==========================================================================================================
struct TimelineQuery {
    std::optional<std::string> platform;
    std::optional<int64_t> sinceNs; // strictly after
    int64_t limit{20};
};

//==========================================================================================================
// CaptureSummary
// Purpose: All-time totals across every session in a capture database.
//==========================================================================================================
struct CaptureSummary {
    uint64_t sessionCount{0};
    uint64_t eventCount{0};
    uint64_t bytesCaptured{0};
    std::string lastSessionId;
    std::map<std::string, uint64_t> gutSignals;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// SqlitePersistenceSink
// Purpose: Stores every event with its raw bytes, decoded frame and enrichment layers in the
//          cognitive_events table, and keeps one sessions row per Open()/Close() pair.
// Notes:
//   - The database runs in WAL mode so other processes can read while a session writes.
//   - All access goes through one connection guarded by an internal mutex.
//   - Session statistics and all-time totals are SQL aggregates over the stored rows.
//==========================================================================================================
class SqlitePersistenceSink : public IPersistenceSink {
public:
    SqlitePersistenceSink(std::string dbPath, std::string platform);
    ~SqlitePersistenceSink() override;

    //==========================================================================================================
    // Open
    // Purpose: Open (creating if needed) the database, apply the schema and insert the session row.
    //          A session id already present in the database gets a "-<n>" suffix.
    // Throws:
    //   std::runtime_error when the database cannot be opened or written.
    //==========================================================================================================
    void Open();

    std::future<void> Store(const CaptureEvent& event) override;
    SessionStats GetSessionStats() const override;

    // Writes ended_ns, event_count, turn_count and topics into the session row, then closes the
    // connection. Later calls are no-ops.
    std::future<void> Close() override;

    // Throws std::runtime_error when the sink is not open.
    CaptureSummary GetAllTimeStats() const;

    // Newest `limit` matching events, returned oldest first.
    std::vector<StoredEvent> QueryTimeline(const TimelineQuery& query) const;

    std::optional<StoredEvent> FindEvent(const std::string& eventId) const;

    const std::string& GetDatabasePath() const;
    std::string GetSessionId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SummarizeCaptureDatabase
// Purpose: All-time totals read from a capture database without opening a session.
// Returns:
//   An empty summary when the file does not exist.
// Throws:
//   std::runtime_error when the file exists but cannot be read as a capture database.
//==========================================================================================================
CaptureSummary SummarizeCaptureDatabase(const std::string& dbPath);

} // namespace ucw
