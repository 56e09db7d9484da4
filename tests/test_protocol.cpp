//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol.cpp
// Purpose: GoogleTests for frame validation and frame builders
//==========================================================================================================

#include <gtest/gtest.h>

#include "ucw/JSONRPCTypes.h"
#include "ucw/Protocol.h"
#include "ucw/errors/Errors.h"

using namespace ucw;

namespace {

int validationCode(const std::string& text) {
    try {
        (void)Validate(ParseJSON(text));
    } catch (const errors::ProtocolError& e) {
        return e.code();
    }
    return 0;
}

} // namespace

TEST(ProtocolValidate, ClassifiesShapes) {
    EXPECT_EQ(Validate(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")), MessageKind::Request);
    EXPECT_EQ(Validate(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")), MessageKind::Notification);
    EXPECT_EQ(Validate(ParseJSON(R"({"jsonrpc":"2.0","id":"a","result":{}})")), MessageKind::Response);
    EXPECT_EQ(Validate(ParseJSON(R"({"jsonrpc":"2.0","id":"a","error":{"code":-1,"message":"x"}})")), MessageKind::Error);
}

TEST(ProtocolValidate, NullIdStillMakesARequest) {
    EXPECT_EQ(Validate(ParseJSON(R"({"jsonrpc":"2.0","id":null,"method":"ping"})")), MessageKind::Request);
}

TEST(ProtocolValidate, RejectsBadFrames) {
    EXPECT_EQ(validationCode("[1,2]"), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(validationCode(R"({"id":1,"method":"ping"})"), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(validationCode(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(validationCode(R"({"jsonrpc":"2.0","id":1})"), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(validationCode(R"({"jsonrpc":"2.0","result":{}})"), JSONRPCErrorCodes::InvalidRequest);
}

TEST(ProtocolBuilders, ResponseEchoesId) {
    JSONValue resp = MakeResponse(JSONValue("req-9"), MakeObject({{"ok", JSONValue(true)}}));
    EXPECT_EQ(SerializeJSONValue(resp), R"({"id":"req-9","jsonrpc":"2.0","result":{"ok":true}})");
    EXPECT_EQ(Validate(resp), MessageKind::Response);
}

TEST(ProtocolBuilders, ErrorShape) {
    JSONValue err = MakeError(JSONValue(static_cast<int64_t>(2)), JSONRPCErrorCodes::MethodNotFound, "Unknown tool: nope");
    EXPECT_EQ(SerializeJSONValue(err),
              R"({"error":{"code":-32601,"message":"Unknown tool: nope"},"id":2,"jsonrpc":"2.0"})");
    EXPECT_EQ(Validate(err), MessageKind::Error);
}

TEST(ProtocolBuilders, NotificationHasNoId) {
    JSONValue n = MakeNotification("notifications/cancelled");
    EXPECT_FALSE(HasMember(n, "id"));
    EXPECT_EQ(Validate(n), MessageKind::Notification);
}

TEST(ProtocolBuilders, InitializeResultIdentity) {
    JSONValue r = InitializeResult(Implementation{SERVER_NAME, SERVER_VERSION});
    EXPECT_EQ(GetString(r, "protocolVersion").value_or(""), "2024-11-05");
    const JSONValue* info = FindMember(r, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetString(*info, "name").value_or(""), "ucw");
    EXPECT_EQ(GetString(*info, "version").value_or(""), "0.1.0");
    const JSONValue* caps = FindMember(r, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_EQ(SerializeJSONValue(*caps),
              R"({"resources":{"listChanged":false,"subscribe":false},"tools":{"listChanged":false}})");
}

TEST(ProtocolBuilders, ToolResultIsErrorOnlyWhenSet) {
    EXPECT_FALSE(HasMember(ToolResultContent(TextToolResult("fine")), "isError"));
    JSONValue bad = ToolResultContent(TextToolResult("nope", true));
    const JSONValue* flag = FindMember(bad, "isError");
    ASSERT_NE(flag, nullptr);
    EXPECT_EQ(*flag, JSONValue(true));
}

TEST(ProtocolBuilders, ToolDescriptorGetsDefaultSchema) {
    Tool t{"echo", "Echo", JSONValue{}};
    JSONValue v = SerializeTool(t);
    const JSONValue* schema = FindMember(v, "inputSchema");
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(GetString(*schema, "type").value_or(""), "object");
}
