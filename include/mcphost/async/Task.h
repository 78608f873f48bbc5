//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type bridging to std::future for C++20
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace mcphost {
namespace async {

namespace detail {

// Shared promise behaviour: run eagerly, self-destroy at the end, route exceptions to the future.
template <typename T>
struct FuturePromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T>
struct ValuePromise : FuturePromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

struct VoidPromise : FuturePromiseBase<void> {
    void return_void() { promise.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Coroutine return type used behind the host's future-returning APIs. The body starts running
//          inside the call; its value or exception lands in the future handed out by toFuture().
// Notes:
//   - The frame owns nothing the caller sees, so dropping the Task never cancels the work.
//   - Exceptions thrown before the first suspension also reach the future, never the caller.
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : std::conditional_t<std::is_void_v<T>, detail::VoidPromise, detail::ValuePromise<T>> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Single use: the future moves out.
    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

} // namespace async
} // namespace mcphost
