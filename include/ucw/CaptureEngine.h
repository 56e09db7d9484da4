//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureEngine.h
// Purpose: Lifecycle recorder for every inbound and outbound frame
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ucw/CaptureEvent.h"
#include "ucw/EnrichmentHook.h"
#include "ucw/PersistenceSink.h"

namespace ucw {

//==========================================================================================================
// CaptureStats
// Purpose: Running counters. byCategory is keyed "<direction>_<stage>" (e.g. "in_received").
//==========================================================================================================
struct CaptureStats {
    uint64_t total{0};
    std::map<std::string, uint64_t> byCategory;
    uint64_t enrichmentFailures{0};
    uint64_t persistenceFailures{0};
    uint64_t observerFailures{0};
    uint64_t captureFailures{0};

    JSONValue ToJSON() const;
};

//==========================================================================================================
// CaptureEngine
// Purpose: Assigns identity and turn numbers to frames, correlates responses with their requests,
//          and fans each event out to the enrichment hook, the persistence sink and observers.
// Notes:
//   - Capture() never throws. Plugin failures are logged and counted.
//   - The lineage map and turn counter are owned here and mutated only by Capture().
//   - Persistence hand-off is asynchronous; events reach the sink in submission order.
//==========================================================================================================
class CaptureEngine {
public:
    using EventObserver = std::function<void(const CaptureEvent&)>;

    static constexpr std::size_t DefaultRecentEventsMax = 1000;

    explicit CaptureEngine(std::size_t recentEventsMax = DefaultRecentEventsMax);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    ////////////////////////////////////////// Plugins //////////////////////////////////////////
    void SetEnrichmentHook(std::shared_ptr<IEnrichmentHook> hook);
    void SetPersistenceSink(std::shared_ptr<IPersistenceSink> sink);
    std::shared_ptr<IPersistenceSink> GetPersistenceSink() const;
    void AddObserver(EventObserver observer);

    //==========================================================================================================
    // Capture
    // Purpose: Record one frame.
    // Args:
    //   rawBytes: Exact bytes as read/written (length becomes contentLength).
    //   frame: Decoded frame; an empty object when decoding failed.
    //   timestampNs: Observation time.
    //   direction: Inbound or Outbound; stage derives from it.
    //   correlationId: Used as requestId when the frame itself has no id (writer-supplied tag).
    //   error: Decode error text for malformed input.
    // Returns:
    //   Copy of the recorded event after enrichment.
    //==========================================================================================================
    CaptureEvent Capture(const std::string& rawBytes,
                         const JSONValue& frame,
                         int64_t timestampNs,
                         Direction direction,
                         const std::optional<std::string>& correlationId = std::nullopt,
                         const std::optional<std::string>& error = std::nullopt) noexcept;

    ////////////////////////////////////////// Queries //////////////////////////////////////////
    int64_t TurnCount() const;
    uint64_t EventCount() const;
    CaptureStats Stats() const;

    // Snapshot of the most recent events, oldest first.
    std::vector<CaptureEvent> RecentEvents(std::size_t limit = 20) const;

    //==========================================================================================================
    // Flush
    // Purpose: Block until every persistence hand-off queued so far has been processed by the sink.
    //==========================================================================================================
    void Flush();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ucw
