//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureTools.h
// Purpose: Built-in tools and resource exposing capture statistics to the client
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ucw/CaptureEngine.h"
#include "ucw/MethodRouter.h"
#include "ucw/SqlitePersistenceSink.hpp"

namespace ucw {

namespace CaptureToolNames {
    constexpr const char* CaptureStats = "ucw_capture_stats";
    constexpr const char* Timeline = "ucw_timeline";
    constexpr const char* SessionStats = "ucw_session_stats";
    constexpr const char* StatsResourceUri = "ucw://capture/stats";
}

constexpr int64_t TimelineDefaultLimit = 20;
constexpr int64_t TimelineMaxLimit = 200;

//==========================================================================================================
// RegisterCaptureTools
// Purpose: Register ucw_capture_stats, ucw_timeline, ucw_session_stats and the ucw://capture/stats
//          resource.
// Args:
//   router: Router to register with.
//   engine: Engine queried by the handlers; must outlive the router.
// Notes:
//   All-time totals and the filtered timeline come from the database once a SqlitePersistenceSink
//   is installed; until then the timeline reads the engine's live window.
//==========================================================================================================
void RegisterCaptureTools(MethodRouter& router, CaptureEngine& engine);

// Rendering helpers (also used by the command line).
std::string FormatCaptureStats(const CaptureEngine& engine);
std::string FormatTimeline(const std::vector<CaptureEvent>& events);
std::string FormatStoredTimeline(const std::vector<StoredEvent>& events);

} // namespace ucw
