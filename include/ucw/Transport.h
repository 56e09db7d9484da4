//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Frame transport interface
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>

#include "ucw/CaptureEvent.h"
#include "ucw/JSONRPCTypes.h"

namespace ucw {

//==========================================================================================================
// ReadResult
// Purpose: Outcome of IFrameTransport::ReadFrame.
// Fields:
//   status: Frame (frame holds a decoded message), NoFrame (line was unusable and has been captured
//           with an error), EndOfStream (input closed or transport closed).
//   raw: The line as read, without its terminating newline.
//==========================================================================================================
struct ReadResult {
    enum class Status {
        Frame,
        NoFrame,
        EndOfStream
    };
    Status status{Status::EndOfStream};
    JSONValue frame;
    std::string raw;
};

//==========================================================================================================
// IFrameTransport
// Purpose: Line-framed byte transport. Every frame read or written is handed to the capture hook.
//==========================================================================================================
class IFrameTransport {
public:
    //==========================================================================================================
    // CaptureHook
    // Purpose: Receives every raw frame in both directions.
    // Args:
    //   raw: Exact bytes (outbound includes the trailing newline).
    //   frame: Decoded frame, or an empty object when decoding failed.
    //   timestampNs: Observation time.
    //   direction: Inbound for reads, Outbound for writes.
    //   correlationId: Writer-supplied id of the request being answered.
    //   error: Decode error text for malformed input.
    //==========================================================================================================
    using CaptureHook = std::function<void(const std::string& raw,
                                           const JSONValue& frame,
                                           int64_t timestampNs,
                                           Direction direction,
                                           const std::optional<std::string>& correlationId,
                                           const std::optional<std::string>& error)>;

    virtual ~IFrameTransport() = default;

    ///////////////////////////////////////// Connection lifecycle /////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Acquire the streams. Must be called once before ReadFrame.
    // Returns:
    //   Future that completes when ready, or carries errors::TransportError when streams are unusable.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Close
    // Purpose: Mark the transport inactive and wake a blocked ReadFrame. Idempotent.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsActive() const = 0;

    ///////////////////////////////////////// Frame I/O /////////////////////////////////////////
    //==========================================================================================================
    // ReadFrame
    // Purpose: Block until one line is available, the input ends, or Close() is called.
    //==========================================================================================================
    virtual ReadResult ReadFrame() = 0;

    //==========================================================================================================
    // WriteFrame
    // Purpose: Serialize, capture, write and flush one frame atomically with respect to other writes.
    // Args:
    //   frame: Frame to send.
    //   correlationId: Id of the request this frame answers (used for lineage).
    // Returns:
    //   true when written; false when the transport is closed (no-op).
    // Throws:
    //   errors::TransportError on I/O failure (fatal to the connection).
    //==========================================================================================================
    virtual bool WriteFrame(const JSONValue& frame, const std::optional<std::string>& correlationId = std::nullopt) = 0;

    virtual void SetCaptureHook(CaptureHook hook) = 0;
};

} // namespace ucw
