//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors, exception types and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "ucw/JSONRPCTypes.h"

namespace ucw {
namespace errors {

// Categorization of the standard JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation carried by ProtocolError and written as a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInt(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(code.value());
    e.message = std::move(message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Create a JSONValue error object from a typed McpError. "data" is emitted only when present.
inline JSONValue makeErrorValue(const McpError& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(err.code));
    obj["message"] = std::make_shared<JSONValue>(err.message);
    if (err.data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(err.data.value());
    }
    return JSONValue{obj};
}

//==========================================================================================================
// ProtocolError
// Purpose: Exception for protocol-level failures (malformed request, unknown method, bad params).
//          The orchestrator turns it into a JSON-RPC error response when the frame carries an id.
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message) {
        err.code = code;
        err.message = message;
        err.data = std::move(data);
        err.category = errorCategoryFromCode(code);
    }

    int code() const noexcept { return err.code; }
    const McpError& error() const noexcept { return err; }

private:
    McpError err;
};

//==========================================================================================================
// TransportError
// Purpose: Fatal byte-stream failure. The connection cannot continue after one is raised.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace errors
} // namespace ucw
