//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server.cpp
// Purpose: End-to-end GoogleTests driving the Server over pipes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "support/PipePair.h"
#include "ucw/CaptureTools.h"
#include "ucw/MemoryPersistenceSink.hpp"
#include "ucw/Server.h"
#include "ucw/StdioTransport.hpp"
#include "ucw/errors/Errors.h"

using namespace ucw;
using namespace std::chrono_literals;
using ucw::testing::PipePair;

namespace {

std::unique_ptr<Server> makeServer(PipePair& pipes) {
    return std::make_unique<Server>(std::make_unique<StdioTransport>(pipes.transportIn, pipes.transportOut));
}

std::string requestLine(int64_t id, const std::string& method, const std::optional<JSONValue>& params = std::nullopt) {
    return SerializeJSONValue(MakeRequest(JSONValue(id), method, params)) + "\n";
}

JSONValue expectFrame(PipePair& pipes) {
    auto line = pipes.readLine();
    if (!line.has_value()) {
        ADD_FAILURE() << "no frame written by the server";
        return JSONValue{JSONValue::Object{}};
    }
    return ParseJSON(line.value());
}

int64_t errorCode(const JSONValue& frame) {
    const JSONValue* err = FindMember(frame, "error");
    return err ? GetInt(*err, "code").value_or(0) : 0;
}

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(Server, ServesRequestsUntilEndOfInput) {
    PipePair pipes;
    auto server = makeServer(pipes);
    RegisterCaptureTools(server->Router(), server->Capture());
    auto done = server->Run();

    pipes.send(requestLine(1, Methods::Initialize, MakeObject({
        {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
        {"clientInfo", MakeObject({{"name", JSONValue("tester")}})}
    })));
    JSONValue init = expectFrame(pipes);
    EXPECT_EQ(GetInt(init, "id").value_or(0), 1);
    const JSONValue* result = FindMember(init, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetString(*FindMember(*result, "serverInfo"), "name").value_or(""), "ucw");

    // Notifications and malformed lines get no reply; the next reply belongs to the ping.
    pipes.send(SerializeJSONValue(MakeNotification(Methods::Initialized)) + "\n");
    pipes.send("{oops\n");
    pipes.send(requestLine(2, Methods::Ping));
    JSONValue ping = expectFrame(pipes);
    EXPECT_EQ(GetInt(ping, "id").value_or(0), 2);
    EXPECT_TRUE(HasMember(ping, "result"));

    pipes.send(requestLine(3, Methods::CallTool, MakeObject({{"name", JSONValue(CaptureToolNames::CaptureStats)}})));
    JSONValue call = expectFrame(pipes);
    EXPECT_EQ(GetInt(call, "id").value_or(0), 3);
    EXPECT_TRUE(HasMember(call, "result"));

    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(server->GetState(), ServerState::Stopped);

    // initialize, initialized, malformed, ping, tools/call in; three replies out.
    EXPECT_EQ(server->Capture().EventCount(), 8u);
    EXPECT_EQ(server->Capture().TurnCount(), 3);
}

TEST(Server, ErrorsAreReportedOnlyForRequestsWithIds) {
    PipePair pipes;
    auto server = makeServer(pipes);
    auto done = server->Run();

    pipes.send(requestLine(10, "no/such/method"));
    JSONValue unknown = expectFrame(pipes);
    EXPECT_EQ(GetInt(unknown, "id").value_or(0), 10);
    EXPECT_EQ(errorCode(unknown), JSONRPCErrorCodes::MethodNotFound);

    pipes.send(requestLine(2, Methods::CallTool, MakeObject({{"name", JSONValue("X")},
                                                            {"arguments", JSONValue{JSONValue::Object{}}}})));
    JSONValue unknownTool = expectFrame(pipes);
    EXPECT_EQ(GetInt(unknownTool, "id").value_or(0), 2);
    EXPECT_EQ(errorCode(unknownTool), JSONRPCErrorCodes::MethodNotFound);

    pipes.send("{\"jsonrpc\":\"1.0\",\"id\":11,\"method\":\"ping\"}\n");
    JSONValue badVersion = expectFrame(pipes);
    EXPECT_EQ(GetInt(badVersion, "id").value_or(0), 11);
    EXPECT_EQ(errorCode(badVersion), JSONRPCErrorCodes::InvalidRequest);

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":12}\n");
    JSONValue noType = expectFrame(pipes);
    EXPECT_EQ(errorCode(noType), JSONRPCErrorCodes::InvalidRequest);

    // No id: unknown notification and invalid frame are dropped silently.
    pipes.send(SerializeJSONValue(MakeNotification(Methods::Cancelled)) + "\n");
    pipes.send(SerializeJSONValue(MakeNotification("no/such/notification")) + "\n");
    pipes.send("{\"jsonrpc\":\"1.0\",\"method\":\"ping\"}\n");
    pipes.send("[1,2,3]\n");
    pipes.send(requestLine(13, Methods::Ping));
    JSONValue ping = expectFrame(pipes);
    EXPECT_EQ(GetInt(ping, "id").value_or(0), 13);
    EXPECT_TRUE(HasMember(ping, "result"));

    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
}

TEST(Server, ResponsesAreCorrelatedWithRequests) {
    PipePair pipes;
    auto server = makeServer(pipes);
    auto done = server->Run();

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"method\":\"ping\"}\n");
    JSONValue reply = expectFrame(pipes);
    EXPECT_EQ(GetString(reply, "id").value_or(""), "abc");
    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);

    auto events = server->Capture().RecentEvents(10);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].direction, Direction::Inbound);
    EXPECT_EQ(events[1].direction, Direction::Outbound);
    EXPECT_EQ(events[1].requestId.value_or(""), "abc");
    EXPECT_EQ(events[1].parentEventId.value_or(""), events[0].eventId);
    EXPECT_EQ(events[1].turn, events[0].turn);
}

TEST(Server, OnlyToolCallsWaitForResources) {
    PipePair pipes;
    auto server = makeServer(pipes);
    RegisterCaptureTools(server->Router(), server->Capture());

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    auto sink = std::make_shared<MemoryPersistenceSink>("test");
    CaptureEngine* engine = &server->Capture();
    server->SetResourceInitializer([gate, sink, engine](std::stop_token st) {
        while (gate.wait_for(10ms) != std::future_status::ready) {
            if (st.stop_requested()) return;
        }
        engine->SetPersistenceSink(sink);
    });
    auto done = server->Run();

    pipes.send(requestLine(1, Methods::Ping));
    JSONValue ping = expectFrame(pipes);
    EXPECT_EQ(GetInt(ping, "id").value_or(0), 1);

    pipes.send(requestLine(2, Methods::CallTool, MakeObject({{"name", JSONValue(CaptureToolNames::SessionStats)}})));
    EXPECT_FALSE(pipes.readLine(200ms).has_value());

    release.set_value();
    JSONValue call = expectFrame(pipes);
    EXPECT_EQ(GetInt(call, "id").value_or(0), 2);
    EXPECT_FALSE(HasMember(*FindMember(call, "result"), "isError"));
    EXPECT_EQ(server->AwaitResources(), ResourceState::Ready);

    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
    EXPECT_TRUE(sink->IsClosed());
    EXPECT_EQ(sink->CloseCount(), 1);
}

TEST(Server, FailedInitializerLeavesServerUsable) {
    PipePair pipes;
    auto server = makeServer(pipes);
    RegisterCaptureTools(server->Router(), server->Capture());
    server->SetResourceInitializer([](std::stop_token) { throw std::runtime_error("disk on fire"); });
    auto done = server->Run();

    pipes.send(requestLine(1, Methods::CallTool, MakeObject({{"name", JSONValue(CaptureToolNames::CaptureStats)}})));
    JSONValue call = expectFrame(pipes);
    EXPECT_EQ(GetInt(call, "id").value_or(0), 1);
    EXPECT_TRUE(HasMember(call, "result"));
    EXPECT_EQ(server->AwaitResources(), ResourceState::Failed);

    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
}

TEST(Server, ShutdownCancelsInitializerAndIsIdempotent) {
    PipePair pipes;
    auto server = makeServer(pipes);
    std::atomic<bool> sawStop{false};
    server->SetResourceInitializer([&sawStop](std::stop_token st) {
        while (!st.stop_requested()) {
            std::this_thread::sleep_for(5ms);
        }
        sawStop = true;
    });
    EXPECT_EQ(server->AwaitResources(), ResourceState::NotConfigured);
    auto done = server->Run();
    ASSERT_TRUE(waitFor([&server]() { return server->GetState() == ServerState::Serving; }));

    server->Shutdown();
    server->Shutdown();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(done.get());
    EXPECT_TRUE(sawStop.load());
    EXPECT_EQ(server->AwaitResources(), ResourceState::Cancelled);
    EXPECT_EQ(server->GetState(), ServerState::Stopped);
}

TEST(Server, PersistenceIsClosedOnceAcrossShutdownPaths) {
    PipePair pipes;
    auto server = makeServer(pipes);
    auto sink = std::make_shared<MemoryPersistenceSink>("test");
    server->Capture().SetPersistenceSink(sink);
    auto done = server->Run();

    pipes.send(requestLine(1, Methods::Ping));
    (void)expectFrame(pipes);
    pipes.closeClientWrite();
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
    server->Shutdown();
    server.reset();

    EXPECT_EQ(sink->CloseCount(), 1);
    EXPECT_EQ(sink->GetEvents().size(), 2u);
}

TEST(Server, TerminationSignalTakesTheShutdownPath) {
    PipePair pipes;
    auto server = makeServer(pipes);
    auto sink = std::make_shared<MemoryPersistenceSink>("test");
    server->Capture().SetPersistenceSink(sink);
    server->EnableSignalHandling();
    auto done = server->Run();
    // Handlers are installed before the state reaches Serving.
    ASSERT_TRUE(waitFor([&server]() { return server->GetState() == ServerState::Serving; }));

    pipes.send(requestLine(1, Methods::Ping));
    (void)expectFrame(pipes);

    ASSERT_EQ(::raise(SIGTERM), 0);
    ASSERT_EQ(done.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(server->GetState(), ServerState::Stopped);
    EXPECT_EQ(sink->CloseCount(), 1);
    EXPECT_EQ(sink->GetEvents().size(), 2u);

    server->Shutdown();
    server.reset();
    EXPECT_EQ(sink->CloseCount(), 1);
}

TEST(Server, RunTwiceIsRejected) {
    PipePair pipes;
    auto server = makeServer(pipes);
    auto first = server->Run();
    auto second = server->Run();
    EXPECT_THROW(second.get(), std::logic_error);
    pipes.closeClientWrite();
    ASSERT_EQ(first.wait_for(3s), std::future_status::ready);
}

TEST(Server, TransportStartFailureStopsServer) {
    Server server(std::make_unique<StdioTransport>(-1, -1));
    auto done = server.Run();
    EXPECT_THROW(done.get(), errors::TransportError);
    EXPECT_EQ(server.GetState(), ServerState::Stopped);
}
