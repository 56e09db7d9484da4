//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryPersistenceSink.hpp
// Purpose: In-process capture store
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ucw/PersistenceSink.h"

namespace ucw {

//==========================================================================================================
// MemoryPersistenceSink
// Purpose: Keeps stored events in submission order. Used by tests and by UCW_STORAGE=memory.
//==========================================================================================================
class MemoryPersistenceSink : public IPersistenceSink {
public:
    explicit MemoryPersistenceSink(std::string platform = "memory");
    ~MemoryPersistenceSink() override;

    std::future<void> Store(const CaptureEvent& event) override;
    SessionStats GetSessionStats() const override;
    std::future<void> Close() override;

    std::vector<CaptureEvent> GetEvents() const;
    bool IsClosed() const;
    int CloseCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ucw
