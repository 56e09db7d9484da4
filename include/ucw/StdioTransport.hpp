//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited frame transport over a pair of file descriptors
//==========================================================================================================
#pragma once

#include "ucw/Transport.h"
#include <cstddef>
#include <memory>

namespace ucw {

//==========================================================================================================
// StdioTransport
// Purpose: Frame transport over stdin/stdout (or any readable/writable descriptor pair).
// Notes:
//   - One frame per line, UTF-8, terminated by '\n'. A trailing '\r' is ignored.
//   - Lines longer than the configured maximum are discarded and reported as NoFrame.
//   - Nothing except frames is ever written to the output descriptor.
//==========================================================================================================
class StdioTransport : public IFrameTransport {
public:
    static constexpr std::size_t DefaultMaxLineBytes = 65536;

    StdioTransport();
    StdioTransport(int inputFd, int outputFd);
    ~StdioTransport() override;

    ////////////////////////////////////////// IFrameTransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsActive() const override;
    ReadResult ReadFrame() override;
    bool WriteFrame(const JSONValue& frame, const std::optional<std::string>& correlationId = std::nullopt) override;
    void SetCaptureHook(CaptureHook hook) override;

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Input line limit (excluding the newline).
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ucw
