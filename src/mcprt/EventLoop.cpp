//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventLoop.cpp
// Purpose: io_context thread management and timer helpers
//==========================================================================================================

#include "mcprt/EventLoop.h"
#include "logging/Logger.h"

#include <future>

namespace mcprt {

EventLoop::EventLoop() {
    FUNC_SCOPE();
    workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(ioc.get_executor());
    std::promise<std::thread::id> started;
    auto startedFut = started.get_future();
    ioThread = std::thread([this, &started]() {
        started.set_value(std::this_thread::get_id());
        for (;;) {
            try {
                ioc.run();
                break;
            } catch (const std::exception& e) {
                // A handler escaped; keep the loop alive for the remaining timers.
                LOG_ERROR("EventLoop handler exception: {}", e.what());
            }
        }
    });
    ioThreadId = startedFut.get();
}

EventLoop::~EventLoop() {
    Stop();
}

bool EventLoop::InLoopThread() const {
    return std::this_thread::get_id() == ioThreadId;
}

void EventLoop::Post(std::function<void()> fn) {
    net::post(ioc, std::move(fn));
}

std::shared_ptr<net::steady_timer> EventLoop::ScheduleTimer(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto timer = std::make_shared<net::steady_timer>(ioc);
    timer->expires_after(delay);
    timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        fn();
    });
    return timer;
}

void EventLoop::CancelTimer(const std::shared_ptr<net::steady_timer>& timer) {
    if (!timer) return;
    // steady_timer is not thread-safe; cancel on its owning thread.
    if (InLoopThread()) {
        timer->cancel();
    } else {
        net::post(ioc, [timer]() { timer->cancel(); });
    }
}

void EventLoop::Sync() {
    if (InLoopThread() || ioc.stopped()) return;
    std::promise<void> done;
    auto fut = done.get_future();
    net::post(ioc, [&done]() { done.set_value(); });
    while (fut.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        if (ioc.stopped()) return;
    }
}

void EventLoop::Stop() {
    FUNC_SCOPE();
    if (workGuard) {
        workGuard->reset();
        workGuard.reset();
    }
    ioc.stop();
    if (ioThread.joinable()) {
        if (InLoopThread()) {
            ioThread.detach();
        } else {
            ioThread.join();
        }
    }
}

} // namespace mcprt
