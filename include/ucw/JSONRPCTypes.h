//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, JSON-RPC 2.0 error codes and frame accessors
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ucw {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: ordered map<string, shared_ptr<JSONValue>>; keys serialize in sorted order.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

bool operator==(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes. These are part of the wire contract.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// ParseJSON
// Purpose: Parse one complete JSON document.
// Args:
//   text: UTF-8 JSON text. Leading/trailing whitespace is allowed, any other trailing data is not.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error and its byte offset.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Compact JSON encoding (no insignificant whitespace).
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

//==========================================================================================================
// Object construction helpers
//==========================================================================================================
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members);
JSONValue MakeArray(std::vector<JSONValue> items);

// Sets obj[key] = v. A non-object obj is replaced by an empty object first.
void SetMember(JSONValue& obj, const std::string& key, JSONValue v);

//==========================================================================================================
// Member accessors
// Purpose: Read-only lookups tolerant of non-object inputs and wrong member types.
// Returns:
//   nullptr / std::nullopt when the member is absent or has a different type.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& obj, const std::string& key);
bool HasMember(const JSONValue& obj, const std::string& key);
std::optional<std::string> GetString(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetInt(const JSONValue& obj, const std::string& key);

//==========================================================================================================
// IdToString
// Purpose: Stringified correlation id. Strings map to themselves, integers to decimal text, and
//          other values to their compact JSON encoding.
//==========================================================================================================
std::string IdToString(const JSONValue& id);

//==========================================================================================================
// FrameCorrelationId
// Purpose: Stringified "id" of a frame, or std::nullopt when absent or null.
//==========================================================================================================
std::optional<std::string> FrameCorrelationId(const JSONValue& frame);

} // namespace ucw
