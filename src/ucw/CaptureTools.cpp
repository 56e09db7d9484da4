//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureTools.cpp
// Purpose: Built-in capture tools implementation
//==========================================================================================================

#include <algorithm>
#include <format>
#include <future>
#include <limits>
#include <memory>
#include <sstream>

#include "logging/Logger.h"
#include "ucw/CaptureTools.h"
#include "ucw/SqlitePersistenceSink.hpp"

namespace ucw {

namespace {

JSONValue emptyObjectSchema() {
    return MakeObject({
        {"type", JSONValue("object")},
        {"properties", JSONValue{JSONValue::Object{}}}
    });
}

JSONValue timelineSchema() {
    return MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({
            {"limit", MakeObject({
                {"type", JSONValue("number")},
                {"description", JSONValue(std::format("Maximum events to return (default: {}, max: {})",
                                                      TimelineDefaultLimit, TimelineMaxLimit))},
                {"default", JSONValue(TimelineDefaultLimit)}
            })},
            {"platform", MakeObject({
                {"type", JSONValue("string")},
                {"description", JSONValue("Only events captured on this platform")}
            })},
            {"since_ns", MakeObject({
                {"type", JSONValue("number")},
                {"description", JSONValue("Only events after this Unix timestamp in nanoseconds")}
            })}
        })}
    });
}

std::shared_ptr<SqlitePersistenceSink> databaseSink(const CaptureEngine& engine) {
    return std::dynamic_pointer_cast<SqlitePersistenceSink>(engine.GetPersistenceSink());
}

void appendCounts(std::ostringstream& out, const std::string& title, const std::map<std::string, uint64_t>& counts) {
    if (counts.empty()) {
        return;
    }
    out << "### " << title << "\n";
    for (const auto& [key, count] : counts) {
        out << "- " << key << ": " << count << "\n";
    }
    out << "\n";
}

} // namespace

std::string FormatCaptureStats(const CaptureEngine& engine) {
    std::ostringstream out;
    const CaptureStats live = engine.Stats();
    out << "# UCW Capture Statistics\n\n";
    out << "## Live\n\n";
    out << "**Events Captured:** " << live.total << "\n";
    out << "**Turns:** " << engine.TurnCount() << "\n";
    for (const auto& [category, count] : live.byCategory) {
        out << "- " << category << ": " << count << "\n";
    }
    if (live.enrichmentFailures + live.persistenceFailures + live.observerFailures + live.captureFailures > 0) {
        out << std::format("- failures: enrichment={} persistence={} observer={} capture={}\n",
                           live.enrichmentFailures, live.persistenceFailures, live.observerFailures,
                           live.captureFailures);
    }
    out << "\n";

    auto sink = engine.GetPersistenceSink();
    if (!sink) {
        out << "Persistence not initialized yet; showing live counters only.\n";
        return out.str();
    }

    const SessionStats session = sink->GetSessionStats();
    out << "## Current Session\n\n";
    out << "**Session ID:** " << session.sessionId << "\n";
    out << "**Events Stored:** " << session.eventCount << "\n";
    out << "**Turns:** " << session.turnCount << "\n\n";
    appendCounts(out, "Topics", session.topics);
    appendCounts(out, "Gut Signals", session.gutSignals);

    if (auto db = databaseSink(engine)) {
        CaptureSummary all;
        try {
            all = db->GetAllTimeStats();
        } catch (const std::exception& e) {
            LOG_WARN("CaptureTools: all-time totals unavailable: {}", e.what());
            return out.str();
        }
        out << "## All-Time\n\n";
        out << "**Total Events:** " << all.eventCount << "\n";
        out << "**Total Sessions:** " << all.sessionCount << "\n";
        out << "**Bytes Captured:** " << all.bytesCaptured << "\n\n";
        appendCounts(out, "Gut Signal Distribution", all.gutSignals);
    }
    return out.str();
}

std::string FormatTimeline(const std::vector<CaptureEvent>& events) {
    if (events.empty()) {
        return "No events captured yet.";
    }
    std::ostringstream out;
    out << "# Capture Timeline (" << events.size() << " events)\n\n";
    for (const auto& ev : events) {
        const char* arrow = (ev.direction == Direction::Outbound) ? "->" : "<-";
        out << std::format("{} {} turn={} bytes={}", arrow, ev.method.empty() ? "response" : ev.method,
                           ev.turn, ev.contentLength);
        if (ev.error.has_value()) {
            out << " error=\"" << ev.error.value() << "\"";
        }
        out << "\n";
    }
    return out.str();
}

std::string FormatStoredTimeline(const std::vector<StoredEvent>& events) {
    if (events.empty()) {
        return "No events found matching criteria.";
    }
    std::ostringstream out;
    out << "# Cognitive Event Timeline (" << events.size() << " events)\n\n";
    for (const auto& ev : events) {
        const char* arrow = (ev.direction == DirectionName(Direction::Outbound)) ? "->" : "<-";
        out << std::format("{} {} ({}) turn={} bytes={}", arrow, ev.method.empty() ? "response" : ev.method,
                           ev.platform, ev.turn, ev.contentLength);
        if (ev.error.has_value()) {
            out << " error=\"" << ev.error.value() << "\"";
        }
        out << "\n";
        if (ev.topic || ev.intent || ev.gutSignal) {
            out << std::format("  Topic: {} | Intent: {} | Gut: {}", ev.topic.value_or("-"), ev.intent.value_or("-"),
                               ev.gutSignal.value_or("-"));
            if (ev.coherence.has_value()) {
                out << std::format(" [coherence={:.2f}]", ev.coherence.value());
            }
            out << "\n";
        }
        if (ev.summary.has_value()) {
            out << "  " << ev.summary.value().substr(0, 150) << "\n";
        }
    }
    return out.str();
}

void RegisterCaptureTools(MethodRouter& router, CaptureEngine& engine) {
    CaptureEngine* eng = &engine;

    Tool stats{CaptureToolNames::CaptureStats,
               "Get current UCW capture statistics: events, turns, per-direction counts, session and all-time totals",
               emptyObjectSchema()};
    router.RegisterTool(stats, [eng](const JSONValue&, std::stop_token) -> std::future<ToolResult> {
        return std::async(std::launch::async, [eng]() {
            return TextToolResult(FormatCaptureStats(*eng));
        });
    });

    Tool timeline{CaptureToolNames::Timeline,
                  "Get the most recent captured events, oldest first, optionally filtered by platform and time",
                  timelineSchema()};
    router.RegisterTool(timeline, [eng](const JSONValue& args, std::stop_token) -> std::future<ToolResult> {
        TimelineQuery query;
        query.limit = std::clamp<int64_t>(GetInt(args, "limit").value_or(TimelineDefaultLimit), 1, TimelineMaxLimit);
        query.platform = GetString(args, "platform");
        query.sinceNs = GetInt(args, "since_ns");
        return std::async(std::launch::async, [eng, query]() {
            if (auto db = databaseSink(*eng)) {
                try {
                    return TextToolResult(FormatStoredTimeline(db->QueryTimeline(query)));
                } catch (const std::exception& e) {
                    LOG_WARN("CaptureTools: timeline query failed: {}", e.what());
                    return TextToolResult(std::string("Timeline query failed: ") + e.what(), true);
                }
            }
            // Before the database is ready only the live window exists; it carries no platform.
            std::vector<CaptureEvent> events = eng->RecentEvents(std::numeric_limits<std::size_t>::max());
            if (query.sinceNs.has_value()) {
                std::erase_if(events, [since = query.sinceNs.value()](const CaptureEvent& ev) {
                    return ev.timestampNs <= since;
                });
            }
            if (events.size() > static_cast<std::size_t>(query.limit)) {
                events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(query.limit));
            }
            return TextToolResult(FormatTimeline(events));
        });
    });

    Tool session{CaptureToolNames::SessionStats,
                 "Get the persisted statistics of the current capture session as JSON",
                 emptyObjectSchema()};
    router.RegisterTool(session, [eng](const JSONValue&, std::stop_token) -> std::future<ToolResult> {
        return std::async(std::launch::async, [eng]() {
            auto sink = eng->GetPersistenceSink();
            if (!sink) {
                return TextToolResult("Persistence not initialized.", true);
            }
            return TextToolResult(SerializeJSONValue(sink->GetSessionStats().ToJSON()));
        });
    });

    Resource statsResource{CaptureToolNames::StatsResourceUri, "Capture statistics",
                           std::string("Live capture engine counters"), std::string("application/json")};
    router.RegisterResource(statsResource, [eng](const std::string& uri, std::stop_token) -> std::future<ReadResourceResult> {
        return std::async(std::launch::async, [eng, uri]() {
            JSONValue body = eng->Stats().ToJSON();
            SetMember(body, "turns", JSONValue(eng->TurnCount()));
            ReadResourceResult result;
            result.contents.push_back(TextResourceContent(uri, SerializeJSONValue(body), "application/json"));
            return result;
        });
    });

    LOG_DEBUG("CaptureTools: registered {} tools", router.ToolCount());
}

} // namespace ucw
