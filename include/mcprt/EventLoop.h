//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventLoop.h
// Purpose: Single-threaded Boost.Asio io_context that owns every runtime timer and process watch
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

#include <boost/asio.hpp>

namespace mcprt {

namespace net = boost::asio;

//==========================================================================================================
// EventLoop
// Purpose: Runs one io_context on a dedicated thread kept alive by a work guard. Managers post work and
//          arm steady_timers here so timer callbacks never run concurrently with one another.
//==========================================================================================================
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    net::io_context& Context() { return ioc; }
    net::any_io_executor Executor() { return ioc.get_executor(); }

    // True when called from the loop thread.
    bool InLoopThread() const;

    // Queues fn to run on the loop thread.
    void Post(std::function<void()> fn);

    //==========================================================================================================
    // Arms a one-shot timer.
    // Args:
    //   delay: Time until fn runs.
    //   fn: Callback invoked on the loop thread when the timer expires (not when it is cancelled).
    // Returns:
    //   Shared timer handle; pass it to CancelTimer() to disarm.
    //==========================================================================================================
    std::shared_ptr<net::steady_timer> ScheduleTimer(std::chrono::milliseconds delay, std::function<void()> fn);

    // Disarms a timer from any thread. Null handles are ignored.
    void CancelTimer(const std::shared_ptr<net::steady_timer>& timer);

    // Blocks until every handler queued before the call has run. Returns immediately on the loop thread
    // or once the loop has stopped.
    void Sync();

    // Stops the loop and joins the thread. Idempotent.
    void Stop();

private:
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::thread::id ioThreadId;
};

} // namespace mcprt
