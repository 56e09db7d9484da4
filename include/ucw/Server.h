//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server orchestrator tying transport, capture, routing and lifecycle together
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>

#include "ucw/CaptureEngine.h"
#include "ucw/MethodRouter.h"
#include "ucw/Transport.h"

namespace ucw {

enum class ServerState {
    Starting,
    Serving,
    Stopping,
    Stopped
};

// Outcome of the background resource initializer.
enum class ResourceState {
    NotConfigured,
    Ready,
    Failed,
    Cancelled
};

const char* ServerStateName(ServerState state);
const char* ResourceStateName(ResourceState state);

//==========================================================================================================
// Server
// Purpose: Single-client server. Reads frames, validates and dispatches them, and writes responses,
//          with every frame in both directions recorded by the capture engine.
// Notes:
//   - Frames are handled one at a time in arrival order.
//   - The resource initializer runs in the background; only tools/call waits for it.
//   - Shutdown() is idempotent and reached from end of input, a signal, or the owner.
//==========================================================================================================
class Server {
public:
    // Runs on a background thread; should return promptly once the token is stopped.
    using ResourceInitializer = std::function<void(std::stop_token)>;

    explicit Server(std::unique_ptr<IFrameTransport> transport,
                    std::size_t recentEventsMax = CaptureEngine::DefaultRecentEventsMax);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ////////////////////////////////////////// Components //////////////////////////////////////////
    MethodRouter& Router();
    CaptureEngine& Capture();

    ////////////////////////////////////////// Configuration //////////////////////////////////////////
    //==========================================================================================================
    // SetResourceInitializer
    // Purpose: Work launched in the background once the transport is up (e.g. opening persistence).
    //          Must be set before Run().
    //==========================================================================================================
    void SetResourceInitializer(ResourceInitializer initializer);

    // Install SIGINT/SIGTERM handling when Run() starts. Off by default.
    void EnableSignalHandling(bool enable = true);

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //==========================================================================================================
    // Run
    // Purpose: Start the transport and serve frames until end of input or Shutdown().
    // Returns:
    //   Future completing after shutdown has finished; carries errors::TransportError when the
    //   transport could not be started.
    //==========================================================================================================
    std::future<void> Run();

    //==========================================================================================================
    // Shutdown
    // Purpose: Cancel background init, close the transport, flush capture and finalize persistence.
    //          Safe to call more than once and from any thread.
    //==========================================================================================================
    void Shutdown();

    ServerState GetState() const;

    //==========================================================================================================
    // AwaitResources
    // Purpose: Block until the background initializer has finished.
    // Returns:
    //   NotConfigured when no initializer is set or it has not been launched yet.
    //==========================================================================================================
    ResourceState AwaitResources();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ucw
