//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CaptureEngine.cpp
// Purpose: CaptureEngine implementation (identity, turns, lineage, plugin fan-out)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <random>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "ucw/CaptureEngine.h"

namespace ucw {
namespace net = boost::asio;

JSONValue CaptureStats::ToJSON() const {
    JSONValue::Object obj;
    obj["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(total));
    for (const auto& [key, count] : byCategory) {
        obj[key] = std::make_shared<JSONValue>(static_cast<int64_t>(count));
    }
    obj["enrichment_failures"] = std::make_shared<JSONValue>(static_cast<int64_t>(enrichmentFailures));
    obj["persistence_failures"] = std::make_shared<JSONValue>(static_cast<int64_t>(persistenceFailures));
    obj["observer_failures"] = std::make_shared<JSONValue>(static_cast<int64_t>(observerFailures));
    obj["capture_failures"] = std::make_shared<JSONValue>(static_cast<int64_t>(captureFailures));
    return JSONValue{obj};
}

class CaptureEngine::Impl {
public:
    struct LineageEntry {
        std::string eventId;
        int64_t turn{0};
    };

    const std::size_t recentEventsMax;

    mutable std::mutex stateMutex; // protects everything below except the atomics
    std::unordered_map<std::string, LineageEntry> lineage;
    int64_t turnCounter{0};
    uint64_t eventCount{0};
    std::deque<CaptureEvent> recent;
    CaptureStats stats;

    std::shared_ptr<IEnrichmentHook> enrichmentHook;
    std::shared_ptr<IPersistenceSink> persistenceSink;
    std::vector<EventObserver> observers;

    std::atomic<uint64_t> persistenceFailures{0};
    std::atomic<uint64_t> captureFailures{0}; // failures inside Capture() itself, logging included
    std::atomic<uint64_t> idSequence{0};
    uint32_t idPrefix{0};

    // Single worker + strand: hand-offs execute one at a time in submission order.
    net::thread_pool persistPool{1};
    net::strand<net::thread_pool::executor_type> persistStrand{net::make_strand(persistPool.get_executor())};

    explicit Impl(std::size_t maxRecent) : recentEventsMax(maxRecent == 0 ? 1 : maxRecent) {
        std::random_device rd;
        idPrefix = static_cast<uint32_t>(rd()) & 0xFFFFFFu;
    }

    ~Impl() {
        persistPool.join();
    }

    std::string nextEventId() {
        const uint64_t seq = ++idSequence;
        return std::format("{:06x}{:010x}", idPrefix, seq & 0xFFFFFFFFFFull);
    }

    void storeOne(const std::shared_ptr<IPersistenceSink>& sink, const CaptureEvent& event) {
        try {
            sink->Store(event).get();
        } catch (const std::exception& e) {
            ++persistenceFailures;
            LOG_ERROR("CaptureEngine: persistence failed for event {} ({})", event.eventId, e.what());
        } catch (...) {
            ++persistenceFailures;
            LOG_ERROR("CaptureEngine: persistence failed for event {} (unknown exception)", event.eventId);
        }
    }
};

CaptureEngine::CaptureEngine(std::size_t recentEventsMax)
    : pImpl(std::make_unique<Impl>(recentEventsMax)) {}

CaptureEngine::~CaptureEngine() = default;

void CaptureEngine::SetEnrichmentHook(std::shared_ptr<IEnrichmentHook> hook) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->enrichmentHook = std::move(hook);
}

void CaptureEngine::SetPersistenceSink(std::shared_ptr<IPersistenceSink> sink) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->persistenceSink = std::move(sink);
}

std::shared_ptr<IPersistenceSink> CaptureEngine::GetPersistenceSink() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->persistenceSink;
}

void CaptureEngine::AddObserver(EventObserver observer) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->observers.push_back(std::move(observer));
}

CaptureEvent CaptureEngine::Capture(const std::string& rawBytes,
                                    const JSONValue& frame,
                                    int64_t timestampNs,
                                    Direction direction,
                                    const std::optional<std::string>& correlationId,
                                    const std::optional<std::string>& error) noexcept {
    CaptureEvent event;
    std::shared_ptr<IEnrichmentHook> hook;
    std::shared_ptr<IPersistenceSink> sink;
    std::vector<EventObserver> observers;

    try {
        event.eventId = pImpl->nextEventId();
        event.timestampNs = timestampNs;
        event.direction = direction;
        event.stage = StageForDirection(direction);
        event.method = GetString(frame, "method").value_or("");
        event.requestId = FrameCorrelationId(frame);
        if (!event.requestId.has_value()) {
            event.requestId = correlationId;
        }
        event.contentLength = rawBytes.size();
        event.rawBytes = rawBytes;
        event.frame = frame;
        event.error = error;

        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (direction == Direction::Inbound) {
            if (!event.method.empty() && event.requestId.has_value()) {
                event.turn = ++pImpl->turnCounter;
                pImpl->lineage[event.requestId.value()] = Impl::LineageEntry{event.eventId, event.turn};
            }
        } else if (event.requestId.has_value()) {
            auto it = pImpl->lineage.find(event.requestId.value());
            if (it != pImpl->lineage.end()) {
                event.parentEventId = it->second.eventId;
                event.turn = it->second.turn;
            }
        }
        hook = pImpl->enrichmentHook;
        sink = pImpl->persistenceSink;
        observers = pImpl->observers;
    } catch (const std::exception& e) {
        ++pImpl->captureFailures;
        LOG_ERROR("CaptureEngine: failed to build event ({})", e.what());
    } catch (...) {
        ++pImpl->captureFailures;
        LOG_ERROR("CaptureEngine: failed to build event (unknown exception)");
    }

    if (hook) {
        try {
            hook->Enrich(event);
        } catch (const std::exception& e) {
            LOG_WARN("CaptureEngine: enrichment failed for event {} ({})", event.eventId, e.what());
            std::lock_guard<std::mutex> lock(pImpl->stateMutex);
            ++pImpl->stats.enrichmentFailures;
        } catch (...) {
            LOG_WARN("CaptureEngine: enrichment failed for event {} (unknown exception)", event.eventId);
            std::lock_guard<std::mutex> lock(pImpl->stateMutex);
            ++pImpl->stats.enrichmentFailures;
        }
    }

    try {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->recent.push_back(event);
        while (pImpl->recent.size() > pImpl->recentEventsMax) {
            pImpl->recent.pop_front();
        }
        ++pImpl->eventCount;
        ++pImpl->stats.byCategory[std::format("{}_{}", DirectionName(event.direction), StageName(event.stage))];
        ++pImpl->stats.total;
    } catch (const std::exception& e) {
        ++pImpl->captureFailures;
        LOG_ERROR("CaptureEngine: failed to record event {} ({})", event.eventId, e.what());
    } catch (...) {
        ++pImpl->captureFailures;
        LOG_ERROR("CaptureEngine: failed to record event {} (unknown exception)", event.eventId);
    }

    if (sink) {
        try {
            net::post(pImpl->persistStrand, [impl = pImpl.get(), sink, ev = event]() {
                impl->storeOne(sink, ev);
            });
        } catch (const std::exception& e) {
            ++pImpl->persistenceFailures;
            LOG_ERROR("CaptureEngine: persistence hand-off failed for event {} ({})", event.eventId, e.what());
        } catch (...) {
            ++pImpl->persistenceFailures;
            LOG_ERROR("CaptureEngine: persistence hand-off failed for event {} (unknown exception)", event.eventId);
        }
    }

    for (const auto& observer : observers) {
        if (!observer) {
            continue;
        }
        try {
            observer(event);
        } catch (const std::exception& e) {
            LOG_WARN("CaptureEngine: observer failed for event {} ({})", event.eventId, e.what());
            std::lock_guard<std::mutex> lock(pImpl->stateMutex);
            ++pImpl->stats.observerFailures;
        } catch (...) {
            LOG_WARN("CaptureEngine: observer failed for event {} (unknown exception)", event.eventId);
            std::lock_guard<std::mutex> lock(pImpl->stateMutex);
            ++pImpl->stats.observerFailures;
        }
    }

    try {
        LOG_DEBUG("Captured {} {} event={} method={} turn={} bytes={}", DirectionName(event.direction),
                  StageName(event.stage), event.eventId, event.method, event.turn, event.contentLength);
    } catch (const std::exception&) {
        // The logger itself failed; the counter is the only report left.
        ++pImpl->captureFailures;
    }
    return event;
}

int64_t CaptureEngine::TurnCount() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->turnCounter;
}

uint64_t CaptureEngine::EventCount() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->eventCount;
}

CaptureStats CaptureEngine::Stats() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    CaptureStats s = pImpl->stats;
    s.persistenceFailures = pImpl->persistenceFailures.load();
    s.captureFailures = pImpl->captureFailures.load();
    return s;
}

std::vector<CaptureEvent> CaptureEngine::RecentEvents(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    const std::size_t n = std::min(limit, pImpl->recent.size());
    return std::vector<CaptureEvent>(pImpl->recent.end() - static_cast<std::ptrdiff_t>(n), pImpl->recent.end());
}

void CaptureEngine::Flush() {
    std::promise<void> drained;
    auto fut = drained.get_future();
    net::post(pImpl->persistStrand, [&drained]() { drained.set_value(); });
    fut.wait();
}

} // namespace ucw
