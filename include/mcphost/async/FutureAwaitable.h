//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiters enabling co_await on std::future and on a plain delay inside host coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <utility>

namespace mcphost {
namespace async {

// Awaiter for std::future<T>. A detached waiter thread blocks on the future and resumes the coroutine;
// the value or stored exception surfaces from await_resume via get().

template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

// Helper factory

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

// Suspends the coroutine for a fixed delay (used for restart settling). Zero delays do not suspend.
class DelayAwaitable {
public:
    explicit DelayAwaitable(std::chrono::milliseconds d) : delay(d) {}

    bool await_ready() const noexcept { return delay.count() <= 0; }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([d = delay, h]() {
            std::this_thread::sleep_for(d);
            h.resume();
        }).detach();
    }

    void await_resume() const noexcept {}

private:
    std::chrono::milliseconds delay;
};

inline DelayAwaitable sleepFor(std::chrono::milliseconds delay) {
    return DelayAwaitable(delay);
}

} // namespace async
} // namespace mcphost
