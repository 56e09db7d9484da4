//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipePair.h
// Purpose: Test helper wiring a StdioTransport to two POSIX pipes
//==========================================================================================================

#pragma once

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace ucw {
namespace testing {

//==========================================================================================================
// PipePair
// Purpose: clientWrite -> transportIn and transportOut -> clientRead. The transport ends are handed to
//          the transport under test; the client ends stay with the test.
//==========================================================================================================
class PipePair {
public:
    PipePair() {
        int in[2];
        int out[2];
        if (::pipe(in) != 0 || ::pipe(out) != 0) {
            throw std::runtime_error("pipe() failed");
        }
        transportIn = in[0];
        clientWrite = in[1];
        clientRead = out[0];
        transportOut = out[1];
    }

    ~PipePair() {
        closeFd(transportIn);
        closeFd(clientWrite);
        closeFd(clientRead);
        closeFd(transportOut);
    }

    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    void send(const std::string& bytes) {
        std::size_t off = 0;
        while (off < bytes.size()) {
            ssize_t n = ::write(clientWrite, bytes.data() + off, bytes.size() - off);
            if (n <= 0) {
                throw std::runtime_error("write to pipe failed");
            }
            off += static_cast<std::size_t>(n);
        }
    }

    void closeClientWrite() { closeFd(clientWrite); }
    void closeClientRead() { closeFd(clientRead); }

    // Next complete line written by the transport (without '\n'), or nullopt on timeout/EOF.
    std::optional<std::string> readLine(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = pending.find('\n');
            if (nl != std::string::npos) {
                std::string line = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                return line;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            struct pollfd pfd{clientRead, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
                return std::nullopt;
            }
            char buf[4096];
            ssize_t n = ::read(clientRead, buf, sizeof(buf));
            if (n <= 0) {
                return std::nullopt;
            }
            pending.append(buf, static_cast<std::size_t>(n));
        }
    }

    int transportIn{-1};
    int transportOut{-1};
    int clientWrite{-1};
    int clientRead{-1};

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    std::string pending;
};

} // namespace testing
} // namespace ucw
