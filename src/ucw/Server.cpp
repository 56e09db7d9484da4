//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server orchestrator implementation
//==========================================================================================================

#include <atomic>
#include <csignal>
#include <mutex>
#include <thread>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include "logging/Logger.h"
#include "ucw/Protocol.h"
#include "ucw/Server.h"
#include "ucw/async/Task.h"
#include "ucw/errors/Errors.h"

namespace ucw {

namespace net = boost::asio;

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Starting: return "starting";
        case ServerState::Serving: return "serving";
        case ServerState::Stopping: return "stopping";
        case ServerState::Stopped: return "stopped";
    }
    return "unknown";
}

const char* ResourceStateName(ResourceState state) {
    switch (state) {
        case ResourceState::NotConfigured: return "not_configured";
        case ResourceState::Ready: return "ready";
        case ResourceState::Failed: return "failed";
        case ResourceState::Cancelled: return "cancelled";
    }
    return "unknown";
}

class Server::Impl {
public:
    std::unique_ptr<IFrameTransport> transport;
    std::shared_ptr<CaptureEngine> engine;
    MethodRouter router;
    std::atomic<ServerState> state{ServerState::Starting};

    // Cancellation for in-flight tool/resource handlers
    std::stop_source requestStop;

    // Background resource initialization
    std::mutex initMutex;
    ResourceInitializer initializer;
    std::jthread initThread;
    std::shared_future<ResourceState> initDone;

    // Signal handling
    bool signalsEnabled{false};
    net::io_context ioc;
    std::unique_ptr<net::signal_set> signals;
    std::thread ioThread;

    std::mutex shutdownMutex;
    std::thread serveThread;

    Impl(std::unique_ptr<IFrameTransport> t, std::size_t recentEventsMax)
        : transport(std::move(t)), engine(std::make_shared<CaptureEngine>(recentEventsMax)) {
        std::weak_ptr<CaptureEngine> weakEngine = engine;
        transport->SetCaptureHook([weakEngine](const std::string& raw, const JSONValue& frame, int64_t ts, Direction dir,
                                               const std::optional<std::string>& correlationId,
                                               const std::optional<std::string>& error) {
            if (auto e = weakEngine.lock()) {
                (void)e->Capture(raw, frame, ts, dir, correlationId, error);
            }
        });
    }

    ////////////////////////////////////////// Resources //////////////////////////////////////////
    void launchInitializer() {
        std::lock_guard<std::mutex> lock(initMutex);
        if (!initializer || initDone.valid()) {
            return;
        }
        auto promise = std::make_shared<std::promise<ResourceState>>();
        initDone = promise->get_future().share();
        initThread = std::jthread([fn = initializer, promise](std::stop_token st) {
            ResourceState outcome = ResourceState::Ready;
            try {
                fn(st);
                if (st.stop_requested()) {
                    outcome = ResourceState::Cancelled;
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Server: background resource initialization failed: {}", e.what());
                outcome = ResourceState::Failed;
            } catch (...) {
                LOG_ERROR("Server: background resource initialization failed with an unknown exception");
                outcome = ResourceState::Failed;
            }
            LOG_INFO("Server: resources {}", ResourceStateName(outcome));
            promise->set_value(outcome);
        });
    }

    ResourceState awaitResources() {
        std::shared_future<ResourceState> done;
        {
            std::lock_guard<std::mutex> lock(initMutex);
            done = initDone;
        }
        if (!done.valid()) {
            return ResourceState::NotConfigured;
        }
        return done.get();
    }

    ////////////////////////////////////////// Signals //////////////////////////////////////////
    net::awaitable<void> watchSignals() {
        try {
            int signo = co_await signals->async_wait(net::use_awaitable);
            LOG_INFO("Server: received signal {}; shutting down", signo);
            shutdown();
        } catch (const boost::system::system_error& e) {
            if (e.code() != net::error::operation_aborted) {
                LOG_WARN("Server: signal wait failed: {}", e.what());
            }
        }
    }

    void installSignals() {
        if (!signalsEnabled) {
            return;
        }
        signals = std::make_unique<net::signal_set>(ioc, SIGINT, SIGTERM);
        net::co_spawn(ioc, watchSignals(), net::detached);
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Server: signal loop error: {}", e.what());
            }
        });
    }

    // The signal_set belongs to the io thread, so cancellation runs there. The io thread is joined by
    // the destructor; the signal watcher may itself be waiting on shutdown.
    void stopSignals() {
        if (!signals) {
            return;
        }
        net::post(ioc, [this]() {
            boost::system::error_code ec;
            signals->cancel(ec);
            if (ec) {
                LOG_WARN("Server: signal cancel failed: {}", ec.message());
            }
            ioc.stop();
        });
    }

    ////////////////////////////////////////// Frame handling //////////////////////////////////////////
    void writeError(const JSONValue& id, const std::optional<std::string>& correlationId, int code,
                    const std::string& message, const std::optional<JSONValue>& data = std::nullopt) {
        transport->WriteFrame(MakeError(id, code, message, data), correlationId);
    }

    void handleFrame(const JSONValue& frame) {
        const JSONValue* idMember = FindMember(frame, "id");
        const JSONValue id = idMember ? *idMember : JSONValue{};
        const bool hasId = idMember != nullptr && !idMember->isNull();
        const std::optional<std::string> correlationId = FrameCorrelationId(frame);
        const std::string method = GetString(frame, "method").value_or("");

        try {
            MessageKind kind = Validate(frame);
            if (kind == MessageKind::Request && method == Methods::CallTool) {
                (void)awaitResources();
            }
            auto result = router.Dispatch(kind, frame, requestStop.get_token());
            if (!result.has_value()) {
                return;
            }
            transport->WriteFrame(MakeResponse(id, result.value()), correlationId);
        } catch (const errors::TransportError&) {
            throw;
        } catch (const errors::ProtocolError& e) {
            LOG_WARN("Server: protocol error: {} (code={})", e.what(), e.code());
            if (hasId) {
                writeError(id, correlationId, e.code(), e.what(), e.error().data);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Server: unhandled error for method '{}': {}", method, e.what());
            if (hasId) {
                writeError(id, correlationId, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
    }

    async::Task coRun() {
        LOG_INFO("Server: starting {} v{}", SERVER_NAME, SERVER_VERSION);
        try {
            co_await async::makeFutureAwaitable(transport->Start());
        } catch (const std::exception& e) {
            LOG_ERROR("Server: transport failed to start: {}", e.what());
            shutdown();
            throw;
        }

        {
            // Serialized with shutdown() so nothing is launched after teardown has begun.
            std::lock_guard<std::mutex> lock(shutdownMutex);
            if (state.load() == ServerState::Starting) {
                launchInitializer();
                installSignals();
                state.store(ServerState::Serving);
                LOG_INFO("Server: ready (tools={} resources={})", router.ToolCount(), router.ResourceCount());
            }
        }

        try {
            while (state.load() == ServerState::Serving) {
                ReadResult r = transport->ReadFrame();
                if (r.status == ReadResult::Status::EndOfStream) {
                    LOG_INFO("Server: end of input; shutting down");
                    break;
                }
                if (r.status == ReadResult::Status::NoFrame) {
                    continue;
                }
                handleFrame(r.frame);
            }
        } catch (const errors::TransportError& e) {
            LOG_ERROR("Server: transport failure: {}", e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Server: serve loop error: {}", e.what());
        }

        shutdown();
        co_return;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(shutdownMutex);
        ServerState current = state.load();
        if (current == ServerState::Stopping || current == ServerState::Stopped) {
            return;
        }
        state.store(ServerState::Stopping);
        LOG_INFO("Server: shutting down (captured {} events, {} turns)", engine->EventCount(), engine->TurnCount());

        requestStop.request_stop();
        if (initThread.joinable()) {
            initThread.request_stop();
            if (initThread.get_id() != std::this_thread::get_id()) {
                initThread.join();
            }
        }

        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Server: transport close failed: {}", e.what());
        }

        engine->Flush();
        if (auto sink = engine->GetPersistenceSink()) {
            try {
                sink->Close().get();
            } catch (const std::exception& e) {
                LOG_ERROR("Server: persistence close failed: {}", e.what());
            }
        }

        stopSignals();
        state.store(ServerState::Stopped);
        LOG_INFO("Server: stopped");
    }
};

Server::Server(std::unique_ptr<IFrameTransport> transport, std::size_t recentEventsMax)
    : pImpl(std::make_unique<Impl>(std::move(transport), recentEventsMax)) {}

Server::~Server() {
    pImpl->shutdown();
    if (pImpl->serveThread.joinable()) {
        pImpl->serveThread.join();
    }
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
}

MethodRouter& Server::Router() {
    return pImpl->router;
}

CaptureEngine& Server::Capture() {
    return *pImpl->engine;
}

void Server::SetResourceInitializer(ResourceInitializer initializer) {
    std::lock_guard<std::mutex> lock(pImpl->initMutex);
    pImpl->initializer = std::move(initializer);
}

void Server::EnableSignalHandling(bool enable) {
    pImpl->signalsEnabled = enable;
}

std::future<void> Server::Run() {
    std::promise<void> finished;
    auto fut = finished.get_future();
    if (pImpl->serveThread.joinable()) {
        finished.set_exception(std::make_exception_ptr(std::logic_error("Server::Run called more than once")));
        return fut;
    }
    pImpl->serveThread = std::thread([this, pr = std::move(finished)]() mutable {
        try {
            pImpl->coRun().toFuture().get();
            pr.set_value();
        } catch (...) {
            pr.set_exception(std::current_exception());
        }
    });
    return fut;
}

void Server::Shutdown() {
    pImpl->shutdown();
}

ServerState Server::GetState() const {
    return pImpl->state.load();
}

ResourceState Server::AwaitResources() {
    return pImpl->awaitResources();
}

} // namespace ucw
