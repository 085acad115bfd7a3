//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type whose outcome is delivered through a std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace mcprt {
namespace async {

template <typename T> class Task;

namespace detail {

// Shared promise plumbing: the coroutine starts immediately and never suspends at its final point,
// so the frame is destroyed as soon as the std::promise is satisfied.
template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    Task<T> get_return_object() noexcept;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T>
struct TaskPromise : TaskPromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

template <>
struct TaskPromise<void> : TaskPromiseBase<void> {
    void return_void() { this->promise.set_value(); }
};

} // namespace detail

// Task<T> - coroutine return type exposing its result as std::future<T>.
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    friend struct detail::TaskPromiseBase<T>;
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <typename T>
Task<T> detail::TaskPromiseBase<T>::get_return_object() noexcept {
    return Task<T>{ promise.get_future() };
}

} // namespace async
} // namespace mcprt
