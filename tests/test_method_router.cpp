//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_router.cpp
// Purpose: GoogleTests for method registration and dispatch of built-in and registered methods
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>
#include <string>

#include "ucw/MethodRouter.h"
#include "ucw/errors/Errors.h"

using namespace ucw;

namespace {

JSONValue request(int64_t id, const std::string& method, const std::optional<JSONValue>& params = std::nullopt) {
    return MakeRequest(JSONValue(id), method, params);
}

JSONValue callParams(const std::string& name, const std::optional<JSONValue>& arguments = std::nullopt) {
    JSONValue p = MakeObject({{"name", JSONValue(name)}});
    if (arguments.has_value()) {
        SetMember(p, "arguments", arguments.value());
    }
    return p;
}

std::string firstText(const JSONValue& toolResult) {
    const JSONValue* content = FindMember(toolResult, "content");
    if (!content || !content->isArray()) {
        return "";
    }
    const auto& arr = std::get<JSONValue::Array>(content->value);
    if (arr.empty() || !arr.front()) {
        return "";
    }
    return GetString(*arr.front(), "text").value_or("");
}

bool isErrorResult(const JSONValue& toolResult) {
    const JSONValue* flag = FindMember(toolResult, "isError");
    return flag && std::holds_alternative<bool>(flag->value) && std::get<bool>(flag->value);
}

int protocolErrorCode(MethodRouter& router, const JSONValue& frame) {
    try {
        (void)router.Dispatch(MessageKind::Request, frame);
    } catch (const errors::ProtocolError& e) {
        return e.code();
    }
    return 0;
}

ToolHandler echoTool() {
    return [](const JSONValue& args, std::stop_token) {
        std::promise<ToolResult> p;
        p.set_value(TextToolResult(SerializeJSONValue(args)));
        return p.get_future();
    };
}

} // namespace

TEST(MethodRouter, InitializeReportsIdentity) {
    MethodRouter router;
    JSONValue params = MakeObject({
        {"protocolVersion", JSONValue("2024-11-05")},
        {"clientInfo", MakeObject({{"name", JSONValue("test-client")}, {"version", JSONValue("1.0")}})}
    });
    auto result = router.Dispatch(MessageKind::Request, request(1, Methods::Initialize, params));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(GetString(*result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    const JSONValue* info = FindMember(*result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetString(*info, "name").value_or(""), "ucw");
    EXPECT_EQ(GetString(*info, "version").value_or(""), "0.1.0");
    EXPECT_TRUE(HasMember(*result, "capabilities"));
}

TEST(MethodRouter, PingReturnsEmptyObject) {
    MethodRouter router;
    auto result = router.Dispatch(MessageKind::Request, request(2, Methods::Ping));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(SerializeJSONValue(*result), "{}");
}

TEST(MethodRouter, ToolsListPreservesRegistrationOrder) {
    MethodRouter router;
    EXPECT_TRUE(router.RegisterTool(Tool{"zeta", "last letter", JSONValue{JSONValue::Object{}}}, echoTool()));
    EXPECT_TRUE(router.RegisterTool(Tool{"alpha", "first letter", JSONValue{JSONValue::Object{}}}, echoTool()));
    auto result = router.Dispatch(MessageKind::Request, request(3, Methods::ListTools));
    ASSERT_TRUE(result.has_value());
    const JSONValue* tools = FindMember(*result, "tools");
    ASSERT_NE(tools, nullptr);
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(GetString(*arr[0], "name").value_or(""), "zeta");
    EXPECT_EQ(GetString(*arr[1], "name").value_or(""), "alpha");
}

TEST(MethodRouter, DuplicateToolKeepsFirstHandler) {
    MethodRouter router;
    EXPECT_TRUE(router.RegisterTool(Tool{"echo", "", JSONValue{JSONValue::Object{}}}, echoTool()));
    EXPECT_FALSE(router.RegisterTool(Tool{"echo", "", JSONValue{JSONValue::Object{}}},
                                     [](const JSONValue&, std::stop_token) -> std::future<ToolResult> {
                                         throw std::runtime_error("second handler must not run");
                                     }));
    EXPECT_EQ(router.ToolCount(), 1u);
    auto result = router.Dispatch(MessageKind::Request, request(4, Methods::CallTool, callParams("echo")));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(isErrorResult(*result));
}

TEST(MethodRouter, CallToolDefaultsArgumentsToEmptyObject) {
    MethodRouter router;
    router.RegisterTool(Tool{"echo", "", JSONValue{JSONValue::Object{}}}, echoTool());
    auto result = router.Dispatch(MessageKind::Request, request(5, Methods::CallTool, callParams("echo")));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(firstText(*result), "{}");

    auto withArgs = router.Dispatch(MessageKind::Request,
                                    request(6, Methods::CallTool,
                                            callParams("echo", MakeObject({{"k", JSONValue("v")}}))));
    ASSERT_TRUE(withArgs.has_value());
    EXPECT_EQ(firstText(*withArgs), R"({"k":"v"})");
}

TEST(MethodRouter, UnknownToolIsMethodNotFound) {
    MethodRouter router;
    EXPECT_EQ(protocolErrorCode(router, request(7, Methods::CallTool, callParams("nope"))),
              JSONRPCErrorCodes::MethodNotFound);
}

TEST(MethodRouter, MissingToolNameIsInvalidParams) {
    MethodRouter router;
    EXPECT_EQ(protocolErrorCode(router, request(8, Methods::CallTool, JSONValue{JSONValue::Object{}})),
              JSONRPCErrorCodes::InvalidParams);
}

TEST(MethodRouter, ThrowingToolBecomesErrorResult) {
    MethodRouter router;
    router.RegisterTool(Tool{"boom", "", JSONValue{JSONValue::Object{}}},
                        [](const JSONValue&, std::stop_token) {
                            return std::async(std::launch::async, []() -> ToolResult {
                                throw std::runtime_error("kaboom");
                            });
                        });
    auto result = router.Dispatch(MessageKind::Request, request(9, Methods::CallTool, callParams("boom")));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(isErrorResult(*result));
    EXPECT_EQ(firstText(*result), "Tool error: kaboom");
}

TEST(MethodRouter, ToolReceivesStopToken) {
    MethodRouter router;
    router.RegisterTool(Tool{"stopped", "", JSONValue{JSONValue::Object{}}},
                        [](const JSONValue&, std::stop_token st) {
                            std::promise<ToolResult> p;
                            p.set_value(TextToolResult(st.stop_requested() ? "stopped" : "running"));
                            return p.get_future();
                        });
    std::stop_source source;
    source.request_stop();
    auto result = router.Dispatch(MessageKind::Request, request(10, Methods::CallTool, callParams("stopped")),
                                  source.get_token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(firstText(*result), "stopped");
}

TEST(MethodRouter, ResourcesListAndRead) {
    MethodRouter router;
    Resource res{"ucw://test", "Test", std::string("test resource"), std::string("text/plain")};
    EXPECT_TRUE(router.RegisterResource(res, [](const std::string& uri, std::stop_token) {
        std::promise<ReadResourceResult> p;
        ReadResourceResult r;
        r.contents.push_back(TextResourceContent(uri, "hello", "text/plain"));
        p.set_value(r);
        return p.get_future();
    }));

    auto list = router.Dispatch(MessageKind::Request, request(11, Methods::ListResources));
    ASSERT_TRUE(list.has_value());
    const auto& resources = std::get<JSONValue::Array>(FindMember(*list, "resources")->value);
    ASSERT_EQ(resources.size(), 1u);
    EXPECT_EQ(GetString(*resources[0], "uri").value_or(""), "ucw://test");

    auto read = router.Dispatch(MessageKind::Request,
                                request(12, Methods::ReadResource, MakeObject({{"uri", JSONValue("ucw://test")}})));
    ASSERT_TRUE(read.has_value());
    const auto& contents = std::get<JSONValue::Array>(FindMember(*read, "contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetString(*contents[0], "text").value_or(""), "hello");
}

TEST(MethodRouter, ResourceErrors) {
    MethodRouter router;
    router.RegisterResource(Resource{"ucw://bad", "Bad", std::nullopt, std::nullopt},
                            [](const std::string&, std::stop_token) {
                                return std::async(std::launch::async, []() -> ReadResourceResult {
                                    throw std::runtime_error("unreadable");
                                });
                            });
    EXPECT_EQ(protocolErrorCode(router, request(13, Methods::ReadResource, JSONValue{JSONValue::Object{}})),
              JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(protocolErrorCode(router, request(14, Methods::ReadResource,
                                                MakeObject({{"uri", JSONValue("ucw://missing")}}))),
              JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(protocolErrorCode(router, request(15, Methods::ReadResource,
                                                MakeObject({{"uri", JSONValue("ucw://bad")}}))),
              JSONRPCErrorCodes::InternalError);
}

TEST(MethodRouter, UnknownMethodIsMethodNotFound) {
    MethodRouter router;
    try {
        (void)router.Dispatch(MessageKind::Request, request(16, "does/not/exist"));
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::MethodNotFound);
        EXPECT_EQ(std::string(e.what()), "Unknown method: does/not/exist");
    }
}

TEST(MethodRouter, NotificationsProduceNoResult) {
    MethodRouter router;
    EXPECT_FALSE(router.Dispatch(MessageKind::Notification, MakeNotification(Methods::Initialized)).has_value());
    EXPECT_FALSE(router.Dispatch(MessageKind::Notification, MakeNotification("unheard/of")).has_value());
    EXPECT_FALSE(router.Dispatch(MessageKind::Response, MakeResponse(JSONValue(static_cast<int64_t>(1)),
                                                                      JSONValue{JSONValue::Object{}}))
                     .has_value());
}

TEST(MethodRouter, RegisteredNotificationHandlerRuns) {
    MethodRouter router;
    int calls = 0;
    EXPECT_EQ(router.Register({"custom/event"}, [&calls](const JSONValue&) {
        ++calls;
        return JSONValue{};
    }), 1u);
    EXPECT_FALSE(router.Dispatch(MessageKind::Notification, MakeNotification("custom/event")).has_value());
    EXPECT_EQ(calls, 1);
}

TEST(MethodRouter, FirstRegistrantWins) {
    MethodRouter router;
    EXPECT_EQ(router.Register({"custom/a", "custom/b"}, [](const JSONValue&) { return JSONValue("first"); }), 2u);
    EXPECT_EQ(router.Register({"custom/b", "custom/c"}, [](const JSONValue&) { return JSONValue("second"); }), 1u);
    // Built-in names cannot be overridden.
    EXPECT_EQ(router.Register({Methods::Ping}, [](const JSONValue&) { return JSONValue("override"); }), 0u);

    EXPECT_TRUE(router.HasMethod("custom/c"));
    EXPECT_TRUE(router.HasMethod(Methods::Ping));
    EXPECT_FALSE(router.HasMethod("custom/z"));

    auto b = router.Dispatch(MessageKind::Request, request(17, "custom/b"));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(SerializeJSONValue(*b), "\"first\"");
    auto c = router.Dispatch(MessageKind::Request, request(18, "custom/c"));
    EXPECT_EQ(SerializeJSONValue(*c), "\"second\"");
    auto ping = router.Dispatch(MessageKind::Request, request(19, Methods::Ping));
    EXPECT_EQ(SerializeJSONValue(*ping), "{}");
}
