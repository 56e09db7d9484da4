//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <cstring>

#include <array>
#include <atomic>
#include <format>
#include <mutex>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "ucw/StdioTransport.hpp"
#include "ucw/errors/Errors.h"

namespace ucw {

class StdioTransport::Impl {
public:
    int inputFd{STDIN_FILENO};
    int outputFd{STDOUT_FILENO};
    int wakeEventFd{-1};

    std::atomic<bool> active{false};
    std::atomic<bool> started{false};
    std::size_t maxLineBytes{DefaultMaxLineBytes};

    // Reader state (touched only by the reading thread)
    std::string readBuffer;
    bool discardingOversized{false};
    bool inputEof{false};

    std::mutex writeMutex;
    std::mutex hookMutex;
    IFrameTransport::CaptureHook captureHook;

    Impl(int in, int out) : inputFd(in), outputFd(out) {}

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void capture(const std::string& raw, const JSONValue& frame, Direction dir,
                 const std::optional<std::string>& correlationId, const std::optional<std::string>& error) {
        IFrameTransport::CaptureHook hook;
        {
            std::lock_guard<std::mutex> lock(hookMutex);
            hook = captureHook;
        }
        if (!hook) {
            return;
        }
        try {
            hook(raw, frame, NowNs(), dir, correlationId, error);
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: capture hook threw: {}", e.what());
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ReadResult oversized(std::string raw) {
        const std::string err = std::format("Frame exceeds maximum line length ({} bytes)", maxLineBytes);
        LOG_ERROR("StdioTransport: {}", err);
        capture(raw, JSONValue{JSONValue::Object{}}, Direction::Inbound, std::nullopt, err);
        ReadResult r;
        r.status = ReadResult::Status::NoFrame;
        r.raw = std::move(raw);
        return r;
    }

    // Decode one complete line (including its terminator, when present).
    ReadResult decodeLine(std::string rawLine) {
        std::string text = rawLine;
        if (!text.empty() && text.back() == '\n') text.pop_back();
        if (!text.empty() && text.back() == '\r') text.pop_back();
        if (text.size() > maxLineBytes) {
            return oversized(std::move(rawLine));
        }
        ReadResult r;
        r.raw = text;
        try {
            r.frame = ParseJSON(text);
        } catch (const std::exception& e) {
            const std::string err = std::string("JSON parse error: ") + e.what();
            LOG_ERROR("StdioTransport: {}", err);
            capture(rawLine, JSONValue{JSONValue::Object{}}, Direction::Inbound, std::nullopt, err);
            r.status = ReadResult::Status::NoFrame;
            r.frame = JSONValue{};
            return r;
        }
        capture(rawLine, r.frame, Direction::Inbound, std::nullopt, std::nullopt);
        r.status = ReadResult::Status::Frame;
        return r;
    }

    // Returns a result when the buffer yields one; std::nullopt when more input is needed.
    std::optional<ReadResult> takeBuffered() {
        while (true) {
            std::size_t nl = readBuffer.find('\n');
            if (nl == std::string::npos) {
                if (discardingOversized) {
                    readBuffer.clear();
                    return std::nullopt;
                }
                if (readBuffer.size() > maxLineBytes + 1) {
                    std::string raw = readBuffer.substr(0, maxLineBytes);
                    readBuffer.clear();
                    discardingOversized = true;
                    return oversized(std::move(raw));
                }
                return std::nullopt;
            }
            std::string line = readBuffer.substr(0, nl + 1);
            readBuffer.erase(0, nl + 1);
            if (discardingOversized) {
                // Tail of a line already reported as oversized
                discardingOversized = false;
                continue;
            }
            return decodeLine(std::move(line));
        }
    }

    // Wait for input or a wake-up. Returns false when the transport was closed.
    bool fillBuffer() {
        std::array<struct pollfd, 2> fds{};
        fds[0].fd = inputFd;
        fds[0].events = POLLIN;
        fds[1].fd = wakeEventFd;
        fds[1].events = POLLIN;
        const nfds_t count = (wakeEventFd >= 0) ? 2 : 1;
        int rc = ::poll(fds.data(), count, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                return active.load();
            }
            LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
            inputEof = true;
            return true;
        }
        if (count == 2 && (fds[1].revents & POLLIN)) {
            return false;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            std::array<char, 4096> chunk{};
            ssize_t n = ::read(inputFd, chunk.data(), chunk.size());
            if (n > 0) {
                readBuffer.append(chunk.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                inputEof = true;
            } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_ERROR("StdioTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                inputEof = true;
            }
        } else if (fds[0].revents & POLLNVAL) {
            LOG_ERROR("StdioTransport: input descriptor is not open");
            inputEof = true;
        }
        return active.load();
    }
};

StdioTransport::StdioTransport()
    : pImpl(std::make_unique<Impl>(STDIN_FILENO, STDOUT_FILENO)) {}

StdioTransport::StdioTransport(int inputFd, int outputFd)
    : pImpl(std::make_unique<Impl>(inputFd, outputFd)) {}

StdioTransport::~StdioTransport() {
    pImpl->active.store(false);
}

std::future<void> StdioTransport::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started.exchange(true)) {
        LOG_WARN("StdioTransport: Start called more than once");
        ready.set_value();
        return fut;
    }
    if (::fcntl(pImpl->inputFd, F_GETFD) == -1 || ::fcntl(pImpl->outputFd, F_GETFD) == -1) {
        ready.set_exception(std::make_exception_ptr(errors::TransportError(
            std::format("StdioTransport: invalid descriptors (in={} out={})", pImpl->inputFd, pImpl->outputFd))));
        return fut;
    }
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
    }
    pImpl->active.store(true);
    LOG_INFO("StdioTransport: started (in={} out={} max_line_bytes={})", pImpl->inputFd, pImpl->outputFd, pImpl->maxLineBytes);
    ready.set_value();
    return fut;
}

std::future<void> StdioTransport::Close() {
    std::promise<void> done;
    if (pImpl->active.exchange(false)) {
        pImpl->wake();
        LOG_INFO("StdioTransport: closed");
    }
    done.set_value();
    return done.get_future();
}

bool StdioTransport::IsActive() const {
    return pImpl->active.load();
}

ReadResult StdioTransport::ReadFrame() {
    while (pImpl->active.load()) {
        if (auto r = pImpl->takeBuffered()) {
            return std::move(r.value());
        }
        if (pImpl->inputEof) {
            if (!pImpl->readBuffer.empty() && !pImpl->discardingOversized) {
                // Final line without a terminating newline
                std::string line;
                line.swap(pImpl->readBuffer);
                return pImpl->decodeLine(std::move(line));
            }
            pImpl->readBuffer.clear();
            LOG_INFO("StdioTransport: end of input");
            break;
        }
        if (!pImpl->fillBuffer()) {
            break;
        }
    }
    return ReadResult{};
}

bool StdioTransport::WriteFrame(const JSONValue& frame, const std::optional<std::string>& correlationId) {
    if (!pImpl->active.load()) {
        LOG_DEBUG("StdioTransport: write after close ignored");
        return false;
    }
    std::string payload = SerializeJSONValue(frame);
    payload.push_back('\n');

    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    pImpl->capture(payload, frame, Direction::Outbound, correlationId, std::nullopt);

    std::size_t offset = 0;
    while (offset < payload.size()) {
        ssize_t n = ::write(pImpl->outputFd, payload.data() + offset, payload.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd{pImpl->outputFd, POLLOUT, 0};
            (void)::poll(&pfd, 1, -1);
            continue;
        }
        const int err = errno;
        pImpl->active.store(false);
        pImpl->wake();
        LOG_ERROR("StdioTransport: write failed after {} of {} bytes (errno={} msg={})", offset, payload.size(), err, ::strerror(err));
        throw errors::TransportError(std::format("write failed: {}", ::strerror(err)));
    }
    return true;
}

void StdioTransport::SetCaptureHook(CaptureHook hook) {
    std::lock_guard<std::mutex> lock(pImpl->hookMutex);
    pImpl->captureHook = std::move(hook);
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = (maxBytes == 0) ? DefaultMaxLineBytes : maxBytes;
}

} // namespace ucw
