//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_capture_engine.cpp
// Purpose: GoogleTests for event identity, turn accounting, lineage and plugin isolation
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "logging/Logger.h"
#include "ucw/CaptureEngine.h"
#include "ucw/MemoryPersistenceSink.hpp"

using namespace ucw;

namespace {

CaptureEvent captureText(CaptureEngine& engine, const std::string& text, Direction dir,
                         const std::optional<std::string>& correlationId = std::nullopt) {
    return engine.Capture(text, ParseJSON(text), NowNs(), dir, correlationId);
}

class ThrowingEnricher : public IEnrichmentHook {
public:
    void Enrich(CaptureEvent&) override { throw std::runtime_error("enricher exploded"); }
};

class IntThrowingEnricher : public IEnrichmentHook {
public:
    void Enrich(CaptureEvent&) override { throw 42; }
};

class TaggingEnricher : public IEnrichmentHook {
public:
    void Enrich(CaptureEvent& event) override {
        event.lightLayer = MakeObject({{"topic", JSONValue("testing")}});
    }
};

class FailingSink : public IPersistenceSink {
public:
    std::future<void> Store(const CaptureEvent&) override {
        ++attempts;
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("disk full")));
        return p.get_future();
    }
    SessionStats GetSessionStats() const override { return SessionStats{}; }
    std::future<void> Close() override {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    std::atomic<int> attempts{0};
};

// Sink that is slow on the first event to expose any reordering.
class SlowFirstSink : public MemoryPersistenceSink {
public:
    std::future<void> Store(const CaptureEvent& event) override {
        if (first.exchange(false)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return MemoryPersistenceSink::Store(event);
    }
    std::atomic<bool> first{true};
};

} // namespace

TEST(CaptureEngine, RequestStartsTurnAndResponseInheritsIt) {
    CaptureEngine engine;
    CaptureEvent req = captureText(engine, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})", Direction::Inbound);
    CaptureEvent resp = captureText(engine, R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})", Direction::Outbound);

    EXPECT_EQ(req.turn, 1);
    EXPECT_EQ(req.stage, Stage::Received);
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_EQ(req.requestId.value_or(""), "1");
    EXPECT_FALSE(req.parentEventId.has_value());

    EXPECT_EQ(resp.turn, 1);
    EXPECT_EQ(resp.stage, Stage::Sent);
    ASSERT_TRUE(resp.parentEventId.has_value());
    EXPECT_EQ(resp.parentEventId.value(), req.eventId);
    EXPECT_EQ(engine.TurnCount(), 1);
    EXPECT_EQ(engine.EventCount(), 2u);
}

TEST(CaptureEngine, OutOfOrderResponsesCorrelateById) {
    CaptureEngine engine;
    CaptureEvent r10 = captureText(engine, R"({"jsonrpc":"2.0","id":10,"method":"ping"})", Direction::Inbound);
    CaptureEvent r11 = captureText(engine, R"({"jsonrpc":"2.0","id":11,"method":"ping"})", Direction::Inbound);
    CaptureEvent a11 = captureText(engine, R"({"jsonrpc":"2.0","id":11,"result":{}})", Direction::Outbound);
    CaptureEvent a10 = captureText(engine, R"({"jsonrpc":"2.0","id":10,"result":{}})", Direction::Outbound);

    EXPECT_EQ(r10.turn, 1);
    EXPECT_EQ(r11.turn, 2);
    EXPECT_EQ(a11.parentEventId.value_or(""), r11.eventId);
    EXPECT_EQ(a11.turn, 2);
    EXPECT_EQ(a10.parentEventId.value_or(""), r10.eventId);
    EXPECT_EQ(a10.turn, 1);
}

TEST(CaptureEngine, StringAndNumericIdsShareOneKeySpace) {
    CaptureEngine engine;
    CaptureEvent req = captureText(engine, R"({"jsonrpc":"2.0","id":"7","method":"ping"})", Direction::Inbound);
    CaptureEvent resp = captureText(engine, R"({"jsonrpc":"2.0","id":7,"result":{}})", Direction::Outbound);
    EXPECT_EQ(resp.parentEventId.value_or(""), req.eventId);
}

TEST(CaptureEngine, NotificationsDoNotAdvanceTurns) {
    CaptureEngine engine;
    CaptureEvent n = captureText(engine, R"({"jsonrpc":"2.0","method":"notifications/initialized"})", Direction::Inbound);
    EXPECT_EQ(n.turn, 0);
    EXPECT_FALSE(n.requestId.has_value());
    EXPECT_EQ(engine.TurnCount(), 0);
}

TEST(CaptureEngine, UnmatchedResponseStaysUncorrelated) {
    CaptureEngine engine;
    CaptureEvent resp = captureText(engine, R"({"jsonrpc":"2.0","id":99,"result":{}})", Direction::Outbound);
    EXPECT_FALSE(resp.parentEventId.has_value());
    EXPECT_EQ(resp.turn, 0);
}

TEST(CaptureEngine, WriterCorrelationIdIsUsedWhenFrameHasNone) {
    CaptureEngine engine;
    CaptureEvent req = captureText(engine, R"({"jsonrpc":"2.0","id":"abc","method":"ping"})", Direction::Inbound);
    CaptureEvent out = captureText(engine, R"({"jsonrpc":"2.0","method":"notifications/progress"})",
                                   Direction::Outbound, std::string("abc"));
    EXPECT_EQ(out.requestId.value_or(""), "abc");
    EXPECT_EQ(out.parentEventId.value_or(""), req.eventId);
}

TEST(CaptureEngine, TurnsAreStrictlyIncreasing) {
    CaptureEngine engine;
    int64_t last = 0;
    for (int i = 1; i <= 50; ++i) {
        std::string text = R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})";
        CaptureEvent ev = captureText(engine, text, Direction::Inbound);
        EXPECT_GT(ev.turn, last);
        last = ev.turn;
    }
    EXPECT_EQ(engine.TurnCount(), 50);
}

TEST(CaptureEngine, EventIdsAreUniqueHex) {
    CaptureEngine engine;
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        CaptureEvent ev = captureText(engine, R"({"jsonrpc":"2.0","method":"x"})", Direction::Inbound);
        ASSERT_EQ(ev.eventId.size(), 16u);
        EXPECT_EQ(ev.eventId.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(ev.eventId);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(CaptureEngine, MalformedInputIsRecordedWithError) {
    CaptureEngine engine;
    CaptureEvent ev = engine.Capture("{not json\n", JSONValue{JSONValue::Object{}}, NowNs(), Direction::Inbound,
                                     std::nullopt, std::string("JSON parse error: Expecting value"));
    EXPECT_EQ(ev.contentLength, 10u);
    EXPECT_EQ(ev.turn, 0);
    EXPECT_TRUE(ev.method.empty());
    ASSERT_TRUE(ev.error.has_value());
    EXPECT_EQ(engine.EventCount(), 1u);
}

TEST(CaptureEngine, StatsCountPerDirection) {
    CaptureEngine engine;
    captureText(engine, R"({"jsonrpc":"2.0","id":1,"method":"ping"})", Direction::Inbound);
    captureText(engine, R"({"jsonrpc":"2.0","id":1,"result":{}})", Direction::Outbound);
    captureText(engine, R"({"jsonrpc":"2.0","method":"notifications/initialized"})", Direction::Inbound);
    CaptureStats stats = engine.Stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.byCategory["in_received"], 2u);
    EXPECT_EQ(stats.byCategory["out_sent"], 1u);
    JSONValue json = stats.ToJSON();
    EXPECT_EQ(GetInt(json, "total").value_or(0), 3);
    EXPECT_EQ(GetInt(json, "in_received").value_or(0), 2);
}

TEST(CaptureEngine, RecentEventsWindowIsBounded) {
    CaptureEngine engine(5);
    for (int i = 0; i < 12; ++i) {
        captureText(engine, R"({"jsonrpc":"2.0","method":"tick"})", Direction::Inbound);
    }
    auto recent = engine.RecentEvents(100);
    ASSERT_EQ(recent.size(), 5u);
    EXPECT_EQ(engine.EventCount(), 12u);
    auto last2 = engine.RecentEvents(2);
    ASSERT_EQ(last2.size(), 2u);
    EXPECT_EQ(last2.back().eventId, recent.back().eventId);
    EXPECT_EQ(last2.front().eventId, recent[3].eventId);
}

TEST(CaptureEngine, EnrichmentFailureIsIsolated) {
    CaptureEngine engine;
    engine.SetEnrichmentHook(std::make_shared<ThrowingEnricher>());
    CaptureEvent ev;
    ASSERT_NO_THROW(ev = captureText(engine, R"({"jsonrpc":"2.0","id":1,"method":"ping"})", Direction::Inbound));
    EXPECT_EQ(ev.turn, 1);
    EXPECT_EQ(engine.Stats().enrichmentFailures, 1u);
    EXPECT_EQ(engine.EventCount(), 1u);
}

TEST(CaptureEngine, ObserverFailureIsIsolated) {
    CaptureEngine engine;
    int seen = 0;
    engine.AddObserver([](const CaptureEvent&) { throw std::runtime_error("observer exploded"); });
    engine.AddObserver([&seen](const CaptureEvent&) { ++seen; });
    ASSERT_NO_THROW(captureText(engine, R"({"jsonrpc":"2.0","method":"x"})", Direction::Inbound));
    EXPECT_EQ(seen, 1);
    EXPECT_EQ(engine.Stats().observerFailures, 1u);
}

TEST(CaptureEngine, NonStandardExceptionsNeverLeaveCapture) {
    static_assert(noexcept(std::declval<CaptureEngine&>().Capture(std::string(), JSONValue{}, 0, Direction::Inbound)));

    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    CaptureEngine engine;
    engine.SetEnrichmentHook(std::make_shared<IntThrowingEnricher>());
    engine.AddObserver([](const CaptureEvent&) { throw 7; });
    CaptureEvent ev;
    EXPECT_NO_THROW(ev = captureText(engine, R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})", Direction::Inbound));
    Logger::setLogLevel(saved);

    EXPECT_EQ(ev.turn, 1);
    EXPECT_EQ(ev.method, "tools/list");
    const CaptureStats stats = engine.Stats();
    EXPECT_EQ(stats.enrichmentFailures, 1u);
    EXPECT_EQ(stats.observerFailures, 1u);
    EXPECT_EQ(stats.captureFailures, 0u);
    EXPECT_EQ(stats.total, 1u);
    EXPECT_EQ(GetInt(stats.ToJSON(), "capture_failures").value_or(-1), 0);
}

TEST(CaptureEngine, PersistenceFailureIsCountedNotThrown) {
    CaptureEngine engine;
    auto sink = std::make_shared<FailingSink>();
    engine.SetPersistenceSink(sink);
    ASSERT_NO_THROW(captureText(engine, R"({"jsonrpc":"2.0","method":"x"})", Direction::Inbound));
    ASSERT_NO_THROW(captureText(engine, R"({"jsonrpc":"2.0","method":"y"})", Direction::Inbound));
    engine.Flush();
    EXPECT_EQ(sink->attempts.load(), 2);
    EXPECT_EQ(engine.Stats().persistenceFailures, 2u);
}

TEST(CaptureEngine, PersistencePreservesSubmissionOrder) {
    CaptureEngine engine;
    auto sink = std::make_shared<SlowFirstSink>();
    engine.SetPersistenceSink(sink);
    std::vector<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        ids.push_back(captureText(engine, R"({"jsonrpc":"2.0","method":"x"})", Direction::Inbound).eventId);
    }
    engine.Flush();
    auto stored = sink->GetEvents();
    ASSERT_EQ(stored.size(), ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(stored[i].eventId, ids[i]);
    }
}

TEST(CaptureEngine, SinkSeesEnrichedEvents) {
    CaptureEngine engine;
    engine.SetEnrichmentHook(std::make_shared<TaggingEnricher>());
    auto sink = std::make_shared<MemoryPersistenceSink>();
    engine.SetPersistenceSink(sink);
    captureText(engine, R"({"jsonrpc":"2.0","id":1,"method":"ping"})", Direction::Inbound);
    engine.Flush();
    SessionStats stats = sink->GetSessionStats();
    EXPECT_EQ(stats.eventCount, 1u);
    EXPECT_EQ(stats.topics["testing"], 1u);
    EXPECT_EQ(stats.turnCount, 1);
}

TEST(CaptureEngine, ConcurrentCapturesKeepCountsConsistent) {
    CaptureEngine engine;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&engine, t]() {
            for (int i = 0; i < 50; ++i) {
                std::string text = R"({"jsonrpc":"2.0","id":")" + std::to_string(t) + "-" + std::to_string(i) +
                                   R"(","method":"ping"})";
                captureText(engine, text, Direction::Inbound);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(engine.EventCount(), 200u);
    EXPECT_EQ(engine.TurnCount(), 200);
}
