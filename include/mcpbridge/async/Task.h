//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type whose result is observed through std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace mcpbridge {
namespace async {

namespace detail {

// Shared promise plumbing: eager start, exception capture into the std::promise
template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

} // namespace detail

// Task<T>: coroutine return type. The body starts immediately; toFuture() hands out its result.
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::TaskPromiseBase<T> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    using value_type = void;

    struct promise_type : detail::TaskPromiseBase<void> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        void return_void() { this->promise.set_value(); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

} // namespace async
} // namespace mcpbridge
