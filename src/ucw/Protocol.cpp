//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Frame validation and pure frame/payload builders
//==========================================================================================================

#include "ucw/Protocol.h"
#include "ucw/errors/Errors.h"

namespace ucw {

ServerCapabilities DefaultServerCapabilities() {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{};
    caps.resources = ResourcesCapability{};
    return caps;
}

const char* MessageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request: return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Response: return "response";
        case MessageKind::Error: return "error";
    }
    return "unknown";
}

MessageKind Validate(const JSONValue& frame) {
    if (!frame.isObject()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Message must be a JSON object");
    }
    auto version = GetString(frame, "jsonrpc");
    if (!version.has_value() || version.value() != JSONRPC_VERSION) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Expected jsonrpc=2.0");
    }
    // Presence checks: an explicit null id still counts as present.
    const auto& obj = std::get<JSONValue::Object>(frame.value);
    const bool hasId = obj.count("id") > 0;
    const bool hasMethod = obj.count("method") > 0;
    const bool hasResult = obj.count("result") > 0;
    const bool hasError = obj.count("error") > 0;

    if (hasMethod) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    if (hasResult && hasId) {
        return MessageKind::Response;
    }
    if (hasError && hasId) {
        return MessageKind::Error;
    }
    throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Cannot determine message type");
}

JSONValue MakeRequest(const JSONValue& id, const std::string& method, const std::optional<JSONValue>& params) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(JSONRPC_VERSION);
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{obj};
}

JSONValue MakeResponse(const JSONValue& id, const JSONValue& result) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(JSONRPC_VERSION);
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["result"] = std::make_shared<JSONValue>(result);
    return JSONValue{obj};
}

JSONValue MakeError(const JSONValue& id, int code, const std::string& message, const std::optional<JSONValue>& data) {
    errors::McpError e;
    e.code = code;
    e.message = message;
    e.data = data;
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(JSONRPC_VERSION);
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["error"] = std::make_shared<JSONValue>(errors::makeErrorValue(e));
    return JSONValue{obj};
}

JSONValue MakeNotification(const std::string& method, const std::optional<JSONValue>& params) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(JSONRPC_VERSION);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{obj};
}

JSONValue InitializeResult(const Implementation& serverInfo, const std::string& protocolVersion, const ServerCapabilities& caps) {
    JSONValue::Object capsObj;
    if (caps.tools.has_value()) {
        capsObj["tools"] = std::make_shared<JSONValue>(MakeObject({
            {"listChanged", JSONValue(caps.tools->listChanged)}
        }));
    }
    if (caps.resources.has_value()) {
        capsObj["resources"] = std::make_shared<JSONValue>(MakeObject({
            {"subscribe", JSONValue(caps.resources->subscribe)},
            {"listChanged", JSONValue(caps.resources->listChanged)}
        }));
    }
    return MakeObject({
        {"protocolVersion", JSONValue(protocolVersion)},
        {"capabilities", JSONValue(capsObj)},
        {"serverInfo", MakeObject({
            {"name", JSONValue(serverInfo.name)},
            {"version", JSONValue(serverInfo.version)}
        })}
    });
}

JSONValue SerializeTool(const Tool& tool) {
    JSONValue schema = tool.inputSchema;
    if (!schema.isObject()) {
        schema = MakeObject({{"type", JSONValue("object")}, {"properties", JSONValue(JSONValue::Object{})}});
    }
    return MakeObject({
        {"name", JSONValue(tool.name)},
        {"description", JSONValue(tool.description)},
        {"inputSchema", schema}
    });
}

JSONValue SerializeResource(const Resource& resource) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(resource.uri);
    obj["name"] = std::make_shared<JSONValue>(resource.name);
    if (resource.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(resource.description.value());
    }
    if (resource.mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(resource.mimeType.value());
    }
    return JSONValue{obj};
}

JSONValue ToolsListResult(const std::vector<Tool>& tools) {
    std::vector<JSONValue> items;
    items.reserve(tools.size());
    for (const auto& t : tools) {
        items.push_back(SerializeTool(t));
    }
    return MakeObject({{"tools", MakeArray(std::move(items))}});
}

JSONValue ResourcesListResult(const std::vector<Resource>& resources) {
    std::vector<JSONValue> items;
    items.reserve(resources.size());
    for (const auto& r : resources) {
        items.push_back(SerializeResource(r));
    }
    return MakeObject({{"resources", MakeArray(std::move(items))}});
}

JSONValue ToolResultContent(const ToolResult& result) {
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(MakeArray(result.content));
    if (result.isError) {
        obj["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{obj};
}

JSONValue TextContent(const std::string& text) {
    return MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}});
}

ToolResult TextToolResult(const std::string& text, bool isError) {
    ToolResult tr;
    tr.content.push_back(TextContent(text));
    tr.isError = isError;
    return tr;
}

JSONValue TextResourceContent(const std::string& uri, const std::string& text, const std::string& mimeType) {
    return MakeObject({
        {"uri", JSONValue(uri)},
        {"mimeType", JSONValue(mimeType)},
        {"text", JSONValue(text)}
    });
}

JSONValue ResourceReadResult(const ReadResourceResult& result) {
    return MakeObject({{"contents", MakeArray(result.contents)}});
}

} // namespace ucw
