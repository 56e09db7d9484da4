//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.cpp
// Purpose: Method registry and dispatch implementation
//==========================================================================================================

#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "ucw/MethodRouter.h"
#include "ucw/errors/Errors.h"

namespace ucw {

class MethodRouter::Impl {
public:
    Implementation serverInfo;
    std::string protocolVersion;

    mutable std::mutex registryMutex;
    std::unordered_map<std::string, MethodHandler> methods;

    // Registration order is preserved for the list methods.
    std::vector<Tool> tools;
    std::unordered_map<std::string, ToolHandler> toolHandlers;
    std::vector<Resource> resources;
    std::unordered_map<std::string, ResourceHandler> resourceHandlers;

    static bool isBuiltin(const std::string& name) {
        return name == Methods::Initialize || name == Methods::Ping || name == Methods::ListTools ||
               name == Methods::CallTool || name == Methods::ListResources || name == Methods::ReadResource;
    }

    MethodHandler findMethod(const std::string& name) const {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = methods.find(name);
        return (it != methods.end()) ? it->second : MethodHandler{};
    }

    ////////////////////////////////////////// Built-in methods //////////////////////////////////////////
    JSONValue handleInitialize(const JSONValue& params) {
        std::string clientName = "unknown";
        if (const JSONValue* clientInfo = FindMember(params, "clientInfo")) {
            clientName = GetString(*clientInfo, "name").value_or("unknown");
        }
        const std::string requested = GetString(params, "protocolVersion").value_or("");
        LOG_INFO("MethodRouter: initialize from client '{}' (requested protocol '{}')", clientName, requested);
        return InitializeResult(serverInfo, protocolVersion);
    }

    JSONValue handleToolsList() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        return ToolsListResult(tools);
    }

    JSONValue handleResourcesList() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        return ResourcesListResult(resources);
    }

    JSONValue handleToolsCall(const JSONValue& params, std::stop_token stop) {
        auto name = GetString(params, "name");
        if (!name.has_value() || name->empty()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing tool name");
        }
        ToolHandler handler;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            auto it = toolHandlers.find(name.value());
            if (it != toolHandlers.end()) handler = it->second;
        }
        if (!handler) {
            throw errors::ProtocolError(JSONRPCErrorCodes::MethodNotFound, "Unknown tool: " + name.value());
        }
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = FindMember(params, "arguments")) {
            if (a->isObject()) arguments = *a;
        }

        ToolResult result;
        try {
            result = handler(arguments, stop).get();
        } catch (const std::exception& e) {
            LOG_ERROR("MethodRouter: tool '{}' failed: {}", name.value(), e.what());
            result = TextToolResult(std::string("Tool error: ") + e.what(), true);
        } catch (...) {
            LOG_ERROR("MethodRouter: tool '{}' failed with an unknown exception", name.value());
            result = TextToolResult("Tool error: unknown exception", true);
        }
        return ToolResultContent(result);
    }

    JSONValue handleResourcesRead(const JSONValue& params, std::stop_token stop) {
        auto uri = GetString(params, "uri");
        if (!uri.has_value() || uri->empty()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing resource uri");
        }
        ResourceHandler handler;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            auto it = resourceHandlers.find(uri.value());
            if (it != resourceHandlers.end()) handler = it->second;
        }
        if (!handler) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Resource not found: " + uri.value());
        }
        try {
            return ResourceReadResult(handler(uri.value(), stop).get());
        } catch (const std::exception& e) {
            LOG_ERROR("MethodRouter: resource '{}' failed: {}", uri.value(), e.what());
            throw errors::ProtocolError(JSONRPCErrorCodes::InternalError, std::string("Resource error: ") + e.what());
        }
    }

    void handleNotification(const std::string& method) {
        if (method == Methods::Initialized || method == Methods::InitializedLegacy) {
            LOG_INFO("MethodRouter: client initialized");
        } else if (method == Methods::Cancelled) {
            LOG_INFO("MethodRouter: client cancelled a request");
        } else {
            LOG_DEBUG("MethodRouter: notification '{}' ignored", method);
        }
    }
};

MethodRouter::MethodRouter(Implementation serverInfo, std::string protocolVersion)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->serverInfo = std::move(serverInfo);
    pImpl->protocolVersion = std::move(protocolVersion);
}

MethodRouter::~MethodRouter() = default;

std::size_t MethodRouter::Register(const std::vector<std::string>& names, MethodHandler handler) {
    std::size_t bound = 0;
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    for (const auto& name : names) {
        if (Impl::isBuiltin(name) || pImpl->methods.count(name) != 0) {
            LOG_WARN("MethodRouter: method '{}' already registered; keeping the first handler", name);
            continue;
        }
        pImpl->methods.emplace(name, handler);
        ++bound;
    }
    return bound;
}

bool MethodRouter::RegisterTool(const Tool& tool, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    if (pImpl->toolHandlers.count(tool.name) != 0) {
        LOG_WARN("MethodRouter: tool '{}' already registered; keeping the first handler", tool.name);
        return false;
    }
    pImpl->tools.push_back(tool);
    pImpl->toolHandlers.emplace(tool.name, std::move(handler));
    LOG_DEBUG("MethodRouter: registered tool '{}'", tool.name);
    return true;
}

bool MethodRouter::RegisterResource(const Resource& resource, ResourceHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    if (pImpl->resourceHandlers.count(resource.uri) != 0) {
        LOG_WARN("MethodRouter: resource '{}' already registered; keeping the first handler", resource.uri);
        return false;
    }
    pImpl->resources.push_back(resource);
    pImpl->resourceHandlers.emplace(resource.uri, std::move(handler));
    LOG_DEBUG("MethodRouter: registered resource '{}'", resource.uri);
    return true;
}

bool MethodRouter::HasMethod(const std::string& method) const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return Impl::isBuiltin(method) || pImpl->methods.count(method) != 0;
}

std::size_t MethodRouter::ToolCount() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->tools.size();
}

std::size_t MethodRouter::ResourceCount() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->resources.size();
}

std::vector<Tool> MethodRouter::ListTools() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->tools;
}

std::vector<Resource> MethodRouter::ListResources() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->resources;
}

std::optional<JSONValue> MethodRouter::Dispatch(MessageKind kind, const JSONValue& frame, std::stop_token stop) {
    if (kind == MessageKind::Response || kind == MessageKind::Error) {
        LOG_DEBUG("MethodRouter: ignoring peer {} for id {}", MessageKindName(kind),
                  FrameCorrelationId(frame).value_or("null"));
        return std::nullopt;
    }

    const std::string method = GetString(frame, "method").value_or("");
    JSONValue params{JSONValue::Object{}};
    if (const JSONValue* p = FindMember(frame, "params")) {
        params = *p;
    }

    if (kind == MessageKind::Notification) {
        // Registered notification handlers run for side effects only.
        if (auto handler = pImpl->findMethod(method)) {
            try {
                (void)handler(params);
            } catch (const std::exception& e) {
                LOG_ERROR("MethodRouter: notification '{}' handler failed: {}", method, e.what());
            }
        } else {
            pImpl->handleNotification(method);
        }
        return std::nullopt;
    }

    if (auto handler = pImpl->findMethod(method)) {
        return handler(params);
    }
    if (method == Methods::Initialize) {
        return pImpl->handleInitialize(params);
    }
    if (method == Methods::Ping) {
        return JSONValue{JSONValue::Object{}};
    }
    if (method == Methods::ListTools) {
        return pImpl->handleToolsList();
    }
    if (method == Methods::CallTool) {
        return pImpl->handleToolsCall(params, stop);
    }
    if (method == Methods::ListResources) {
        return pImpl->handleResourcesList();
    }
    if (method == Methods::ReadResource) {
        return pImpl->handleResourcesRead(params, stop);
    }
    throw errors::ProtocolError(JSONRPCErrorCodes::MethodNotFound, "Unknown method: " + method);
}

} // namespace ucw
