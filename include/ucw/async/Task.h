//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine plumbing for the server loop: an eager Task and a std::future awaiter
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace ucw {
namespace async {

//==========================================================================================================
// Task
// Purpose: Eagerly started coroutine returning nothing. Completion (or the escaping exception) is
//          observed through toFuture().
//==========================================================================================================
class Task {
public:
    struct promise_type {
        std::promise<void> done;
        Task get_return_object() noexcept { return Task{done.get_future()}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { done.set_exception(std::current_exception()); }
        void return_void() { done.set_value(); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// FutureAwaitable
// Purpose: co_await on a std::future<T>.
// Notes:
//   - A ready future resumes inline.
//   - A pending future is waited on by a detached helper thread, which resumes the coroutine on
//     that thread.
//   - An exception stored in the future is rethrown at the co_await.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace ucw
