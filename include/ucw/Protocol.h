//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, descriptor structures, frame validation and frame builders
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ucw/JSONRPCTypes.h"

namespace ucw {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "ucw";
constexpr const char* SERVER_VERSION = "0.1.0";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* InitializedLegacy = "initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

//==========================================================================================================
// Implementation
// Purpose: Name/version pair identifying a server or client.
//==========================================================================================================
struct Implementation {
    std::string name;
    std::string version;
};

struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
};

// Capability set advertised by the handshake.
ServerCapabilities DefaultServerCapabilities();

//==========================================================================================================
// Tool
// Purpose: Tool descriptor returned by tools/list.
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool arguments
};

//==========================================================================================================
// ToolResult
// Purpose: Content blocks produced by a tool handler. isError marks a tool-level failure.
//==========================================================================================================
struct ToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
};

//==========================================================================================================
// Resource
// Purpose: Resource descriptor returned by resources/list.
//==========================================================================================================
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;  // Array of resource content objects
};

//////////////////////////////////////////// Validation ////////////////////////////////////////////////
enum class MessageKind {
    Request,
    Notification,
    Response,
    Error
};

const char* MessageKindName(MessageKind kind);

//==========================================================================================================
// Validate
// Purpose: Classify a decoded frame.
// Args:
//   frame: Decoded frame.
// Returns:
//   Request (method + id), Notification (method, no id), Response (result + id) or Error (error + id).
// Throws:
//   errors::ProtocolError(InvalidRequest) when the frame is not an object, the version tag is not
//   "2.0", or none of the shapes above hold.
//==========================================================================================================
MessageKind Validate(const JSONValue& frame);

///////////////////////////////////////////// Builders /////////////////////////////////////////////////
// Builders do not validate their inputs.
JSONValue MakeRequest(const JSONValue& id, const std::string& method, const std::optional<JSONValue>& params = std::nullopt);
JSONValue MakeResponse(const JSONValue& id, const JSONValue& result);
JSONValue MakeError(const JSONValue& id, int code, const std::string& message,
                    const std::optional<JSONValue>& data = std::nullopt);
JSONValue MakeNotification(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

//==========================================================================================================
// InitializeResult
// Purpose: Handshake payload { protocolVersion, capabilities, serverInfo }.
//==========================================================================================================
JSONValue InitializeResult(const Implementation& serverInfo,
                           const std::string& protocolVersion = PROTOCOL_VERSION,
                           const ServerCapabilities& caps = DefaultServerCapabilities());

JSONValue SerializeTool(const Tool& tool);
JSONValue SerializeResource(const Resource& resource);
JSONValue ToolsListResult(const std::vector<Tool>& tools);
JSONValue ResourcesListResult(const std::vector<Resource>& resources);

// { content: [...], isError: true } with isError emitted only when set.
JSONValue ToolResultContent(const ToolResult& result);
JSONValue TextContent(const std::string& text);
ToolResult TextToolResult(const std::string& text, bool isError = false);

// { uri, mimeType, text } content object for resources/read.
JSONValue TextResourceContent(const std::string& uri, const std::string& text,
                              const std::string& mimeType = "text/plain");
JSONValue ResourceReadResult(const ReadResourceResult& result);

} // namespace ucw
