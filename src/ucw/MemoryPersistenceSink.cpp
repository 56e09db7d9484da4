//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryPersistenceSink.cpp
// Purpose: In-process capture store implementation
//==========================================================================================================

#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "ucw/MemoryPersistenceSink.hpp"

namespace ucw {

class MemoryPersistenceSink::Impl {
public:
    mutable std::mutex mutex;
    std::vector<CaptureEvent> events;
    SessionStats stats;
    bool closed{false};
    int closeCalls{0};
};

MemoryPersistenceSink::MemoryPersistenceSink(std::string platform)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->stats.sessionId = MakeSessionId();
    pImpl->stats.platform = std::move(platform);
}

MemoryPersistenceSink::~MemoryPersistenceSink() = default;

std::future<void> MemoryPersistenceSink::Store(const CaptureEvent& event) {
    std::promise<void> done;
    auto fut = done.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            done.set_exception(std::make_exception_ptr(std::runtime_error("MemoryPersistenceSink is closed")));
            return fut;
        }
        pImpl->events.push_back(event);
        AccumulateSessionStats(pImpl->stats, event);
    }
    done.set_value();
    return fut;
}

SessionStats MemoryPersistenceSink::GetSessionStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stats;
}

std::future<void> MemoryPersistenceSink::Close() {
    std::promise<void> done;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->closeCalls;
        if (!pImpl->closed) {
            pImpl->closed = true;
            LOG_DEBUG("MemoryPersistenceSink: closed session {} ({} events)", pImpl->stats.sessionId, pImpl->events.size());
        }
    }
    done.set_value();
    return done.get_future();
}

std::vector<CaptureEvent> MemoryPersistenceSink::GetEvents() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->events;
}

bool MemoryPersistenceSink::IsClosed() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->closed;
}

int MemoryPersistenceSink::CloseCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->closeCalls;
}

} // namespace ucw
