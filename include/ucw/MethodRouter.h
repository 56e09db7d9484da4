//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.h
// Purpose: Method registry and dispatch for validated JSON-RPC frames
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "ucw/JSONRPCTypes.h"
#include "ucw/Protocol.h"

namespace ucw {

// Synchronous request handler; the return value becomes the response "result".
using MethodHandler = std::function<JSONValue(const JSONValue& params)>;

// Async, cancellable handler forms. Handlers must return a future.
using ToolHandler = std::function<std::future<ToolResult>(const JSONValue& arguments, std::stop_token)>;
using ResourceHandler = std::function<std::future<ReadResourceResult>(const std::string& uri, std::stop_token)>;

//==========================================================================================================
// MethodRouter
// Purpose: Maps method names to handlers and produces the result payload for each request.
// Notes:
//   - Built-in methods: initialize, ping, tools/list, tools/call, resources/list, resources/read.
//   - Registration follows first-registrant-wins; later duplicates are logged and ignored.
//   - Protocol failures are raised as errors::ProtocolError; the caller turns them into error frames.
//==========================================================================================================
class MethodRouter {
public:
    MethodRouter(Implementation serverInfo = Implementation{SERVER_NAME, SERVER_VERSION},
                 std::string protocolVersion = PROTOCOL_VERSION);
    ~MethodRouter();

    MethodRouter(const MethodRouter&) = delete;
    MethodRouter& operator=(const MethodRouter&) = delete;

    ///////////////////////////////////////////// Registration /////////////////////////////////////////////
    //==========================================================================================================
    // Register
    // Purpose: Bind a handler to one or more method names.
    // Returns:
    //   Number of names actually bound (names already taken are skipped).
    //==========================================================================================================
    std::size_t Register(const std::vector<std::string>& names, MethodHandler handler);

    //==========================================================================================================
    // RegisterTool
    // Purpose: Add a tool to tools/list and route tools/call requests for its name.
    // Returns:
    //   false when a tool with the same name already exists.
    //==========================================================================================================
    bool RegisterTool(const Tool& tool, ToolHandler handler);

    // Add a resource to resources/list and route resources/read for its uri.
    bool RegisterResource(const Resource& resource, ResourceHandler handler);

    bool HasMethod(const std::string& method) const;
    std::size_t ToolCount() const;
    std::size_t ResourceCount() const;
    std::vector<Tool> ListTools() const;
    std::vector<Resource> ListResources() const;

    /////////////////////////////////////////////// Dispatch ///////////////////////////////////////////////
    //==========================================================================================================
    // Dispatch
    // Purpose: Execute one validated frame.
    // Args:
    //   kind: Classification from Validate().
    //   frame: The frame itself.
    //   stop: Cancellation token forwarded to tool/resource handlers.
    // Returns:
    //   The "result" payload for requests; std::nullopt for notifications and peer responses.
    // Throws:
    //   errors::ProtocolError (MethodNotFound / InvalidParams / InternalError) for requests that fail.
    //==========================================================================================================
    std::optional<JSONValue> Dispatch(MessageKind kind, const JSONValue& frame, std::stop_token stop = {});

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ucw
